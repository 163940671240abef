#include <kerf/edges.hpp>
#include <algorithm>
#include <cmath>
#include <functional>

namespace kerf::edges {

namespace {

constexpr double POINT_TOLERANCE = 1e-7;
constexpr double DIRECTION_TOLERANCE = 1e-6;

// Builds the cross-section that replaces a corner point: starts at the
// trimmed point on the first face, ends at the one on the second
using Profile = std::function<Polygon(const Vec3& corner, const Vec3& p1, const Vec3& p2)>;

struct EdgeFace {
    size_t face;
    size_t ia;
    size_t ib;
};

std::optional<size_t> find_vertex(const Polygon& poly, const Vec3& p) {
    for (size_t i = 0; i < poly.size(); ++i) {
        if (coincident(poly[i], p, POINT_TOLERANCE)) return i;
    }
    return std::nullopt;
}

std::vector<EdgeFace> faces_on_edge(const Mesh& mesh, const Edge& edge) {
    std::vector<EdgeFace> out;
    for (size_t f = 0; f < mesh.size(); ++f) {
        const auto& poly = mesh[f];
        auto ia = find_vertex(poly, edge.start);
        auto ib = find_vertex(poly, edge.end);
        if (!ia || !ib) continue;
        size_t n = poly.size();
        if ((*ia + 1) % n == *ib || (*ib + 1) % n == *ia) {
            out.push_back({f, *ia, *ib});
        }
    }
    return out;
}

// Neighbor of poly[i] other than poly[j]
const Vec3& other_neighbor(const Polygon& poly, size_t i, size_t j) {
    size_t n = poly.size();
    size_t prev = (i + n - 1) % n;
    size_t next = (i + 1) % n;
    return poly[prev == j ? next : prev];
}

bool same_direction(const Vec3& from, const Vec3& a, const Vec3& b) {
    return (a - from).normalized().dot((b - from).normalized()) > 1.0 - DIRECTION_TOLERANCE;
}

// Swap `corner` for the profile in a face that meets it
void splice_corner(Polygon& poly, const Vec3& corner, const Polygon& profile) {
    auto i = find_vertex(poly, corner);
    if (!i || profile.size() < 2) return;

    size_t n = poly.size();
    const Vec3& prev = poly[(*i + n - 1) % n];
    const Vec3& next = poly[(*i + 1) % n];

    Polygon insert;
    if (same_direction(corner, profile.front(), prev) &&
        same_direction(corner, profile.back(), next)) {
        insert = profile;
    } else if (same_direction(corner, profile.back(), prev) &&
               same_direction(corner, profile.front(), next)) {
        insert.assign(profile.rbegin(), profile.rend());
    } else {
        return;
    }

    Polygon out;
    out.reserve(n + insert.size());
    out.insert(out.end(), poly.begin(), poly.begin() + static_cast<long>(*i));
    out.insert(out.end(), insert.begin(), insert.end());
    out.insert(out.end(), poly.begin() + static_cast<long>(*i) + 1, poly.end());
    poly = std::move(out);
}

bool treat_edge(Mesh& mesh, const Edge& edge, double distance, const Profile& profile) {
    const Vec3& a = edge.start;
    const Vec3& b = edge.end;
    if ((b - a).norm() <= POINT_TOLERANCE) return false;

    auto on_edge = faces_on_edge(mesh, edge);
    if (on_edge.size() != 2) return false;

    const EdgeFace& f1 = on_edge[0];
    const EdgeFace& f2 = on_edge[1];
    const Polygon& p1 = mesh[f1.face];
    const Polygon& p2 = mesh[f2.face];

    const Vec3& a_far1 = other_neighbor(p1, f1.ia, f1.ib);
    const Vec3& b_far1 = other_neighbor(p1, f1.ib, f1.ia);
    const Vec3& a_far2 = other_neighbor(p2, f2.ia, f2.ib);
    const Vec3& b_far2 = other_neighbor(p2, f2.ib, f2.ia);

    for (const Vec3* far : {&a_far1, &a_far2}) {
        if ((*far - a).norm() <= distance + POINT_TOLERANCE) return false;
    }
    for (const Vec3* far : {&b_far1, &b_far2}) {
        if ((*far - b).norm() <= distance + POINT_TOLERANCE) return false;
    }

    Vec3 a1 = a + (a_far1 - a).normalized() * distance;
    Vec3 b1 = b + (b_far1 - b).normalized() * distance;
    Vec3 a2 = a + (a_far2 - a).normalized() * distance;
    Vec3 b2 = b + (b_far2 - b).normalized() * distance;

    if ((a1 - a).cross(a2 - a).norm() <= POINT_TOLERANCE * POINT_TOLERANCE) return false;

    Polygon profile_a = profile(a, a1, a2);
    Polygon profile_b = profile(b, b1, b2);
    if (profile_a.size() < 2 || profile_a.size() != profile_b.size()) return false;

    Vec3 outward = polygon_normal(p1).normalized() + polygon_normal(p2).normalized();

    // Trim the two faces that met at the edge
    mesh[f1.face][f1.ia] = a1;
    mesh[f1.face][f1.ib] = b1;
    mesh[f2.face][f2.ia] = a2;
    mesh[f2.face][f2.ib] = b2;

    // Close the corners in the remaining faces
    for (size_t f = 0; f < mesh.size(); ++f) {
        if (f == f1.face || f == f2.face) continue;
        splice_corner(mesh[f], a, profile_a);
        splice_corner(mesh[f], b, profile_b);
    }

    for (size_t k = 0; k + 1 < profile_a.size(); ++k) {
        Polygon strip = {profile_a[k], profile_a[k + 1], profile_b[k + 1], profile_b[k]};
        if (polygon_normal(strip).dot(outward) < 0) {
            std::reverse(strip.begin(), strip.end());
        }
        mesh.push_back(std::move(strip));
    }
    return true;
}

Outcome treat_all(Mesh& mesh, const std::vector<Edge>& selected, double distance,
                  const Profile& profile) {
    Outcome outcome;
    for (const auto& edge : selected) {
        if (treat_edge(mesh, edge, distance, profile)) {
            ++outcome.applied;
        } else {
            ++outcome.skipped;
        }
    }
    return outcome;
}

} // anonymous namespace

std::vector<Edge> select_edges(const std::vector<Edge>& all,
                               const std::optional<std::vector<int64_t>>& indices) {
    if (!indices) return all;

    std::vector<Edge> out;
    for (int64_t index : *indices) {
        if (index < 0 || static_cast<size_t>(index) >= all.size()) continue;
        out.push_back(all[static_cast<size_t>(index)]);
    }
    return out;
}

Outcome chamfer(Mesh& mesh, const std::vector<Edge>& selected, double distance) {
    Profile straight = [](const Vec3&, const Vec3& p1, const Vec3& p2) {
        return Polygon{p1, p2};
    };
    return treat_all(mesh, selected, distance, straight);
}

Outcome fillet(Mesh& mesh, const std::vector<Edge>& selected, double radius, int segments) {
    Profile arc = [segments](const Vec3& corner, const Vec3& p1, const Vec3& p2) {
        // Center of the corner arc, opposite the corner across the trimmed points
        Vec3 center = p1 + p2 - corner;
        Vec3 v1 = p1 - center;
        Vec3 v2 = p2 - center;
        double l1 = v1.norm();
        double l2 = v2.norm();

        Polygon pts;
        if (l1 <= EPSILON || l2 <= EPSILON) return pts;

        double cos_theta = std::clamp(v1.dot(v2) / (l1 * l2), -1.0, 1.0);
        double theta = std::acos(cos_theta);
        double sin_theta = std::sin(theta);
        Vec3 u1 = v1 / l1;
        Vec3 u2 = v2 / l2;

        pts.reserve(static_cast<size_t>(segments) + 1);
        for (int k = 0; k <= segments; ++k) {
            double t = static_cast<double>(k) / segments;
            if (sin_theta < 1e-9) {
                pts.push_back(p1 + (p2 - p1) * t);
                continue;
            }
            Vec3 dir = u1 * (std::sin((1.0 - t) * theta) / sin_theta) +
                       u2 * (std::sin(t * theta) / sin_theta);
            pts.push_back(center + dir * (l1 + (l2 - l1) * t));
        }
        return pts;
    };
    return treat_all(mesh, selected, radius, arc);
}

} // namespace kerf::edges
