#pragma once
// Geometry: primitive builders, face directions and face frames
//
// Everything here builds through the Kernel interface. New groups are
// created with an identity transform, so their local coordinates are
// world coordinates. Builders hold the new group in a ScratchGroup until
// construction succeeds, so a failed build leaves nothing behind.

#include <kerf/kernel.hpp>
#include <kerf/types.hpp>
#include <optional>
#include <string>

namespace kerf::geometry {

constexpr int CIRCLE_SEGMENTS = 24;
constexpr int SPHERE_SEGMENTS = 16;

enum class PrimitiveType {
    Cube,
    Cylinder,
    Sphere,
    Cone
};

std::optional<PrimitiveType> primitive_from_string(const std::string& s);
const char* primitive_name(PrimitiveType type);

// Regular polygon in the XY plane, counter-clockwise seen from +z
Polygon circle(const Vec3& center, double radius, int segments);

// New group holding `base` extruded by `distance` along `direction`.
// The base is rewound as needed so the solid grows toward `direction`.
ScratchGroup extrude(Kernel& kernel, const Polygon& base, const Vec3& direction,
                     double distance);

// Primitives. `position` is the min corner of the primitive's bounds;
// `dimensions` are dx, dy, dz (round shapes use dx as the diameter).
EntityId create_cube(Kernel& kernel, const Vec3& position, const Vec3& dimensions);
EntityId create_cylinder(Kernel& kernel, const Vec3& position, const Vec3& dimensions);
EntityId create_sphere(Kernel& kernel, const Vec3& position, const Vec3& dimensions);
EntityId create_cone(Kernel& kernel, const Vec3& position, const Vec3& dimensions);

EntityId create_primitive(Kernel& kernel, PrimitiveType type,
                          const Vec3& position, const Vec3& dimensions);

// ═══════════════════════════════════════════════════════════════════
// Face directions
// ═══════════════════════════════════════════════════════════════════

// East = +x, West = -x, North = +y, South = -y, Top = +z, Bottom = -z
enum class FaceDirection {
    East,
    West,
    North,
    South,
    Top,
    Bottom
};

// Dominant axis of `direction`; ties prefer x, then y
FaceDirection classify(const Vec3& direction);
FaceDirection opposite(FaceDirection dir);
const char* to_string(FaceDirection dir);

// Oriented face of an entity's bounds.
// `normal` points out of the solid; `u` is the width axis, `v` the height axis.
struct FaceFrame {
    Vec3 center = Vec3::Zero();
    Vec3 normal = Vec3::Zero();
    Vec3 u = Vec3::Zero();
    Vec3 v = Vec3::Zero();

    Vec3 at(double along_u, double along_v, double along_normal = 0.0) const {
        return center + u * along_u + v * along_v + normal * along_normal;
    }
};

// Frame on the bounds face labelled `dir`, moved by the two in-plane
// components of `offset` (east/west: y,z; north/south: x,z; top/bottom: x,y)
FaceFrame face_frame(const Bounds& bounds, FaceDirection dir, const Vec3& offset);

// Rectangle [u0,u1] x [v0,v1] lying in the frame's face plane
Polygon frame_rect(const FaceFrame& frame, double u0, double u1, double v0, double v1);

} // namespace kerf::geometry
