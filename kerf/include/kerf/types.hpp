#pragma once
// Core types: ids, points, bounds, transforms
//
// All coordinates are doubles in model units. Vectors and transforms
// are Eigen types.

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace kerf {

// Opaque reference to a scene-graph entity. 0 is never issued.
using EntityId = int64_t;

constexpr double EPSILON = 1e-9;
constexpr double PI = 3.14159265358979323846;

inline double degrees_to_radians(double degrees) {
    return degrees * PI / 180.0;
}

// Points and directions. Eigen leaves fixed-size vectors uninitialized,
// so declare with Vec3::Zero() when no value is at hand.
using Vec3 = Eigen::Vector3d;

// Points closer than `tol` are the same point
inline bool coincident(const Vec3& a, const Vec3& b, double tol = 1e-7) {
    return (a - b).squaredNorm() <= tol * tol;
}

inline bool is_zero(const Vec3& v, double tol = EPSILON) {
    return v.squaredNorm() <= tol * tol;
}

// Unit vector, or zero vector if degenerate
inline Vec3 unit(const Vec3& v) {
    return is_zero(v) ? Vec3(Vec3::Zero()) : Vec3(v.normalized());
}

// Planar polygon as an ordered loop of points
using Polygon = std::vector<Vec3>;

// Newell normal of a polygon loop (not normalized)
inline Vec3 polygon_normal(const Polygon& poly) {
    Vec3 n = Vec3::Zero();
    for (size_t i = 0; i < poly.size(); ++i) {
        const Vec3& a = poly[i];
        const Vec3& b = poly[(i + 1) % poly.size()];
        n.x() += (a.y() - b.y()) * (a.z() + b.z());
        n.y() += (a.z() - b.z()) * (a.x() + b.x());
        n.z() += (a.x() - b.x()) * (a.y() + b.y());
    }
    return n;
}

inline Vec3 polygon_centroid(const Polygon& poly) {
    Vec3 c = Vec3::Zero();
    if (poly.empty()) return c;
    for (const auto& p : poly) c += p;
    return c / static_cast<double>(poly.size());
}

inline double polygon_area(const Polygon& poly) {
    return polygon_normal(poly).norm() * 0.5;
}

// Axis-aligned box in world coordinates
struct Bounds {
    Vec3 min = Vec3::Constant(std::numeric_limits<double>::max());
    Vec3 max = Vec3::Constant(std::numeric_limits<double>::lowest());

    Bounds() = default;
    Bounds(const Vec3& lo, const Vec3& hi) : min(lo), max(hi) {}

    bool empty() const { return (min.array() > max.array()).any(); }

    void add(const Vec3& p) {
        min = min.cwiseMin(p);
        max = max.cwiseMax(p);
    }

    void add(const Bounds& b) {
        if (b.empty()) return;
        add(b.min);
        add(b.max);
    }

    Vec3 center() const { return (min + max) * 0.5; }
    Vec3 size() const { return empty() ? Vec3(Vec3::Zero()) : Vec3(max - min); }

    double width() const { return size().x(); }
    double depth() const { return size().y(); }
    double height() const { return size().z(); }

    double volume() const { return size().prod(); }
};

// Affine transform acting on column vectors (p' = M * p)
class Transform {
public:
    using Affine = Eigen::Transform<double, 3, Eigen::Affine, Eigen::DontAlign>;

    Transform() : m_(Affine::Identity()) {}
    explicit Transform(const Affine& m) : m_(m) {}

    static Transform identity() { return Transform(); }

    static Transform translation(const Vec3& v) {
        Affine t = Affine::Identity();
        t.translate(v);
        return Transform(t);
    }

    // Rotation by angle (radians) about an axis through a point
    static Transform rotation(const Vec3& point, const Vec3& axis, double angle) {
        Affine r = Affine::Identity();
        r.translate(point);
        r.rotate(Eigen::AngleAxisd(angle, unit(axis)));
        r.translate(-point);
        return Transform(r);
    }

    // Non-uniform scale about a point
    static Transform scaling(const Vec3& point, const Vec3& factors) {
        Affine s = Affine::Identity();
        s.translate(point);
        s.scale(factors);
        s.translate(-point);
        return Transform(s);
    }

    // Host matrix layout: 16 values, column-major (translation at 12..14).
    // The bottom row is taken as given; only affine matrices are accepted.
    static std::optional<Transform> from_column_major(const std::vector<double>& values) {
        if (values.size() != 16) return std::nullopt;
        Eigen::Map<const Eigen::Matrix4d> full(values.data());
        if (!full.row(3).isApprox(Eigen::RowVector4d(0, 0, 0, 1))) return std::nullopt;
        Affine t;
        t.matrix() = full;
        return Transform(t);
    }

    Transform operator*(const Transform& o) const { return Transform(m_ * o.m_); }

    Vec3 apply(const Vec3& p) const { return m_ * p; }

    Polygon apply(const Polygon& poly) const {
        Polygon out;
        out.reserve(poly.size());
        for (const auto& p : poly) out.push_back(apply(p));
        return out;
    }

    double determinant3() const { return m_.linear().determinant(); }

    // Inverse of the affine part; nullopt if singular
    std::optional<Transform> inverse() const {
        if (std::abs(determinant3()) < EPSILON) return std::nullopt;
        return Transform(m_.inverse(Eigen::Affine));
    }

    // A mirroring transform flips polygon winding
    bool mirrors() const { return determinant3() < 0.0; }

    const Affine& affine() const { return m_; }

private:
    Affine m_;
};

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;

    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }

    // "#RRGGBB" (case-insensitive)
    static std::optional<Color> from_hex(const std::string& text) {
        if (text.size() != 7 || text[0] != '#') return std::nullopt;
        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };
        int v[6];
        for (size_t i = 0; i < 6; ++i) {
            v[i] = nibble(text[i + 1]);
            if (v[i] < 0) return std::nullopt;
        }
        return Color{static_cast<uint8_t>(v[0] * 16 + v[1]),
                     static_cast<uint8_t>(v[2] * 16 + v[3]),
                     static_cast<uint8_t>(v[4] * 16 + v[5])};
    }

    std::string to_hex() const {
        static const char* digits = "0123456789abcdef";
        std::string out = "#";
        for (uint8_t c : {r, g, b}) {
            out += digits[c >> 4];
            out += digits[c & 0xF];
        }
        return out;
    }
};

} // namespace kerf
