#include <kerf/geometry.hpp>
#include <algorithm>
#include <cmath>

namespace kerf::geometry {

std::optional<PrimitiveType> primitive_from_string(const std::string& s) {
    if (s == "cube") return PrimitiveType::Cube;
    if (s == "cylinder") return PrimitiveType::Cylinder;
    if (s == "sphere") return PrimitiveType::Sphere;
    if (s == "cone") return PrimitiveType::Cone;
    return std::nullopt;
}

const char* primitive_name(PrimitiveType type) {
    switch (type) {
        case PrimitiveType::Cube: return "cube";
        case PrimitiveType::Cylinder: return "cylinder";
        case PrimitiveType::Sphere: return "sphere";
        case PrimitiveType::Cone: return "cone";
    }
    return "unknown";
}

Polygon circle(const Vec3& center, double radius, int segments) {
    Polygon pts;
    pts.reserve(static_cast<size_t>(segments));
    for (int i = 0; i < segments; ++i) {
        double angle = 2.0 * PI * i / segments;
        pts.push_back({center.x() + radius * std::cos(angle),
                       center.y() + radius * std::sin(angle),
                       center.z()});
    }
    return pts;
}

ScratchGroup extrude(Kernel& kernel, const Polygon& base, const Vec3& direction,
                     double distance) {
    ScratchGroup group(kernel);

    Polygon loop = base;
    if (polygon_normal(loop).dot(direction) < 0) {
        std::reverse(loop.begin(), loop.end());
    }

    auto face = kernel.add_face(group.id(), loop);
    if (!face) {
        throw KernelError("Degenerate base face");
    }
    kernel.pushpull(*face, distance);
    return group;
}

EntityId create_cube(Kernel& kernel, const Vec3& position, const Vec3& dimensions) {
    const Vec3& p = position;
    Polygon base = {
        {p.x(), p.y(), p.z()},
        {p.x() + dimensions.x(), p.y(), p.z()},
        {p.x() + dimensions.x(), p.y() + dimensions.y(), p.z()},
        {p.x(), p.y() + dimensions.y(), p.z()}
    };
    return extrude(kernel, base, {0, 0, 1}, dimensions.z()).release();
}

EntityId create_cylinder(Kernel& kernel, const Vec3& position, const Vec3& dimensions) {
    double r = dimensions.x() / 2.0;
    Polygon base = circle(position + Vec3{r, r, 0}, r, CIRCLE_SEGMENTS);
    return extrude(kernel, base, {0, 0, 1}, dimensions.z()).release();
}

EntityId create_sphere(Kernel& kernel, const Vec3& position, const Vec3& dimensions) {
    double r = dimensions.x() / 2.0;
    Vec3 center = position + Vec3{r, r, r};

    auto point = [&](int lat, int lon) -> Vec3 {
        double theta = PI * lat / SPHERE_SEGMENTS;
        double phi = 2.0 * PI * lon / SPHERE_SEGMENTS;
        return center + Vec3{r * std::sin(theta) * std::cos(phi),
                             r * std::sin(theta) * std::sin(phi),
                             r * std::cos(theta)};
    };

    ScratchGroup group(kernel);
    for (int lat = 0; lat < SPHERE_SEGMENTS; ++lat) {
        for (int lon = 0; lon < SPHERE_SEGMENTS; ++lon) {
            Polygon quad = {point(lat, lon), point(lat + 1, lon),
                            point(lat + 1, lon + 1), point(lat, lon + 1)};
            if (polygon_normal(quad).dot(polygon_centroid(quad) - center) < 0) {
                std::reverse(quad.begin(), quad.end());
            }
            // Pole cells collapse to triangles or nothing; the kernel rejects the latter
            kernel.add_face(group.id(), quad);
        }
    }
    return group.release();
}

EntityId create_cone(Kernel& kernel, const Vec3& position, const Vec3& dimensions) {
    double r = dimensions.x() / 2.0;
    Vec3 base_center = position + Vec3{r, r, 0};
    Vec3 apex = base_center + Vec3{0, 0, dimensions.z()};
    Polygon rim = circle(base_center, r, CIRCLE_SEGMENTS);

    ScratchGroup group(kernel);

    // Base faces down, out of the solid
    Polygon base(rim.rbegin(), rim.rend());
    if (!kernel.add_face(group.id(), base)) {
        throw KernelError("Degenerate cone base");
    }

    for (size_t i = 0; i < rim.size(); ++i) {
        Polygon side = {rim[i], rim[(i + 1) % rim.size()], apex};
        kernel.add_face(group.id(), side);
    }
    return group.release();
}

EntityId create_primitive(Kernel& kernel, PrimitiveType type,
                          const Vec3& position, const Vec3& dimensions) {
    switch (type) {
        case PrimitiveType::Cube: return create_cube(kernel, position, dimensions);
        case PrimitiveType::Cylinder: return create_cylinder(kernel, position, dimensions);
        case PrimitiveType::Sphere: return create_sphere(kernel, position, dimensions);
        case PrimitiveType::Cone: return create_cone(kernel, position, dimensions);
    }
    throw KernelError("Unknown primitive type");
}

// ═══════════════════════════════════════════════════════════════════
// Face directions
// ═══════════════════════════════════════════════════════════════════

FaceDirection classify(const Vec3& direction) {
    Vec3 d = direction.normalized();
    double ax = std::abs(d.x());
    double ay = std::abs(d.y());
    double az = std::abs(d.z());

    if (ax >= ay && ax >= az) {
        return d.x() >= 0 ? FaceDirection::East : FaceDirection::West;
    } else if (ay >= az) {
        return d.y() >= 0 ? FaceDirection::North : FaceDirection::South;
    } else {
        return d.z() >= 0 ? FaceDirection::Top : FaceDirection::Bottom;
    }
}

FaceDirection opposite(FaceDirection dir) {
    switch (dir) {
        case FaceDirection::East: return FaceDirection::West;
        case FaceDirection::West: return FaceDirection::East;
        case FaceDirection::North: return FaceDirection::South;
        case FaceDirection::South: return FaceDirection::North;
        case FaceDirection::Top: return FaceDirection::Bottom;
        case FaceDirection::Bottom: return FaceDirection::Top;
    }
    return dir;
}

const char* to_string(FaceDirection dir) {
    switch (dir) {
        case FaceDirection::East: return "east";
        case FaceDirection::West: return "west";
        case FaceDirection::North: return "north";
        case FaceDirection::South: return "south";
        case FaceDirection::Top: return "top";
        case FaceDirection::Bottom: return "bottom";
    }
    return "unknown";
}

FaceFrame face_frame(const Bounds& bounds, FaceDirection dir, const Vec3& offset) {
    const Vec3 c = bounds.center();
    FaceFrame f;
    double off_u = 0.0;
    double off_v = 0.0;

    switch (dir) {
        case FaceDirection::East:
        case FaceDirection::West:
            f.center = Vec3(dir == FaceDirection::East ? bounds.max.x() : bounds.min.x(), c.y(), c.z());
            f.normal = Vec3(dir == FaceDirection::East ? 1.0 : -1.0, 0, 0);
            f.u = Vec3::UnitY();
            f.v = Vec3::UnitZ();
            off_u = offset.y();
            off_v = offset.z();
            break;
        case FaceDirection::North:
        case FaceDirection::South:
            f.center = Vec3(c.x(), dir == FaceDirection::North ? bounds.max.y() : bounds.min.y(), c.z());
            f.normal = Vec3(0, dir == FaceDirection::North ? 1.0 : -1.0, 0);
            f.u = Vec3::UnitX();
            f.v = Vec3::UnitZ();
            off_u = offset.x();
            off_v = offset.z();
            break;
        case FaceDirection::Top:
        case FaceDirection::Bottom:
            f.center = Vec3(c.x(), c.y(), dir == FaceDirection::Top ? bounds.max.z() : bounds.min.z());
            f.normal = Vec3(0, 0, dir == FaceDirection::Top ? 1.0 : -1.0);
            f.u = Vec3::UnitX();
            f.v = Vec3::UnitY();
            off_u = offset.x();
            off_v = offset.y();
            break;
    }

    f.center += f.u * off_u + f.v * off_v;
    return f;
}

Polygon frame_rect(const FaceFrame& frame, double u0, double u1, double v0, double v1) {
    return {frame.at(u0, v0), frame.at(u1, v0), frame.at(u1, v1), frame.at(u0, v1)};
}

} // namespace kerf::geometry
