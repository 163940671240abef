#include <kerf/solid.hpp>
#include <kerf/kernel.hpp>
#include <manifold/manifold.h>
#include <manifold/polygon.h>
#include <array>
#include <cmath>
#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <utility>

namespace kerf::solid {

namespace {

using WeldKey = std::tuple<long long, long long, long long>;

WeldKey weld_key(const Vec3& p) {
    return {std::llround(p.x() / WELD_TOLERANCE),
            std::llround(p.y() / WELD_TOLERANCE),
            std::llround(p.z() / WELD_TOLERANCE)};
}

// Drops `axis`, the dominant axis of the face normal. The remaining pair
// is taken in cyclic order and mirrored for a negative normal, so the
// loop stays counter-clockwise in 2D.
manifold::vec2 flatten(const Vec3& p, int axis, bool mirrored) {
    double u = p[(axis + 1) % 3];
    double v = p[(axis + 2) % 3];
    return {mirrored ? -u : u, v};
}

class MeshBuilder {
public:
    MeshBuilder() { gl_.numProp = 3; }

    void add(const Polygon& poly, uint64_t face) {
        if (poly.size() < 3) return;

        Vec3 n = polygon_normal(poly);
        int axis = 0;
        n.cwiseAbs().maxCoeff(&axis);
        bool mirrored = n[axis] < 0;

        manifold::SimplePolygonIdx loop;
        for (const auto& p : poly) {
            int idx = vertex(p);
            if (!loop.empty() && loop.back().idx == idx) continue;
            loop.push_back({flatten(p, axis, mirrored), idx});
        }
        while (loop.size() > 1 && loop.front().idx == loop.back().idx) loop.pop_back();
        if (loop.size() < 3) return;

        for (const auto& tri : manifold::TriangulateIdx({loop})) {
            gl_.triVerts.push_back(static_cast<uint64_t>(tri[0]));
            gl_.triVerts.push_back(static_cast<uint64_t>(tri[1]));
            gl_.triVerts.push_back(static_cast<uint64_t>(tri[2]));
            gl_.faceID.push_back(face);
        }
    }

    manifold::Manifold build() const {
        manifold::Manifold m(gl_);
        if (m.Status() != manifold::Manifold::Error::NoError) {
            throw KernelError("Operand is not a closed solid");
        }
        return m;
    }

private:
    int vertex(const Vec3& p) {
        auto [it, inserted] = index_.try_emplace(weld_key(p), static_cast<int>(index_.size()));
        if (inserted) {
            gl_.vertProperties.push_back(p.x());
            gl_.vertProperties.push_back(p.y());
            gl_.vertProperties.push_back(p.z());
        }
        return it->second;
    }

    manifold::MeshGL64 gl_;
    std::map<WeldKey, int> index_;
};

manifold::Manifold to_manifold(const Mesh& mesh) {
    MeshBuilder builder;
    for (size_t f = 0; f < mesh.size(); ++f) {
        builder.add(mesh[f], static_cast<uint64_t>(f));
    }
    return builder.build();
}

using Triangle = std::array<uint64_t, 3>;

// Boundary loops of a set of triangles, or nothing when a boundary
// vertex is shared by two loops
std::optional<std::vector<std::vector<uint64_t>>> boundary_loops(const std::vector<Triangle>& tris) {
    std::set<std::pair<uint64_t, uint64_t>> edges;
    for (const auto& t : tris) {
        for (int i = 0; i < 3; ++i) edges.insert({t[i], t[(i + 1) % 3]});
    }

    std::map<uint64_t, uint64_t> next;
    for (const auto& [a, b] : edges) {
        if (edges.count({b, a})) continue;
        if (!next.emplace(a, b).second) return std::nullopt;
    }

    std::vector<std::vector<uint64_t>> loops;
    while (!next.empty()) {
        std::vector<uint64_t> loop;
        uint64_t at = next.begin()->first;
        while (true) {
            auto it = next.find(at);
            if (it == next.end()) break;
            loop.push_back(at);
            at = it->second;
            next.erase(it);
        }
        if (loop.size() < 3 || at != loop.front()) return std::nullopt;
        loops.push_back(std::move(loop));
    }
    return loops;
}

Mesh from_manifold(const manifold::Manifold& m) {
    manifold::MeshGL64 gl = m.GetMeshGL64();
    const size_t num_prop = gl.numProp;
    auto point = [&](uint64_t v) -> Vec3 {
        return Vec3(gl.vertProperties[v * num_prop],
                    gl.vertProperties[v * num_prop + 1],
                    gl.vertProperties[v * num_prop + 2]);
    };

    // Face ids are only unique within one source mesh
    const size_t num_tri = gl.triVerts.size() / 3;
    std::map<std::pair<uint32_t, uint64_t>, std::vector<Triangle>> faces;
    size_t run = 0;
    for (size_t t = 0; t < num_tri; ++t) {
        while (run + 1 < gl.runIndex.size() && gl.runIndex[run + 1] <= t * 3) ++run;
        uint32_t source = run < gl.runOriginalID.size() ? gl.runOriginalID[run] : 0;
        uint64_t face = t < gl.faceID.size() ? gl.faceID[t] : t;
        faces[{source, face}].push_back({gl.triVerts[t * 3], gl.triVerts[t * 3 + 1],
                                         gl.triVerts[t * 3 + 2]});
    }

    Mesh out;
    for (const auto& entry : faces) {
        const auto& tris = entry.second;
        Vec3 normal = Vec3::Zero();
        for (const auto& t : tris) normal += (point(t[1]) - point(t[0])).cross(point(t[2]) - point(t[0]));

        // Separate pieces of a face come back as polygons; a face with a
        // hole has an inner loop wound against the normal and stays triangles
        Mesh pieces;
        bool simple = false;
        if (auto loops = boundary_loops(tris)) {
            simple = true;
            for (const auto& loop : *loops) {
                Polygon poly;
                poly.reserve(loop.size());
                for (uint64_t v : loop) poly.push_back(point(v));
                if (polygon_normal(poly).dot(normal) <= 0) {
                    simple = false;
                    break;
                }
                pieces.push_back(std::move(poly));
            }
        }

        if (simple) {
            for (auto& poly : pieces) out.push_back(std::move(poly));
            continue;
        }
        for (const auto& t : tris) {
            out.push_back({point(t[0]), point(t[1]), point(t[2])});
        }
    }
    return out;
}

} // anonymous namespace

Mesh subtract(const Mesh& a, const Mesh& b) {
    return from_manifold(to_manifold(a) - to_manifold(b));
}

Mesh intersect(const Mesh& a, const Mesh& b) {
    return from_manifold(to_manifold(a) ^ to_manifold(b));
}

Mesh unite_all(const std::vector<Mesh>& shells) {
    std::vector<manifold::Manifold> solids;
    solids.reserve(shells.size());
    for (const auto& shell : shells) solids.push_back(to_manifold(shell));
    return from_manifold(manifold::Manifold::BatchBoolean(solids, manifold::OpType::Add));
}

double volume(const Mesh& mesh) {
    double total = 0.0;
    for (const auto& poly : mesh) {
        if (poly.size() < 3) continue;
        const Vec3& p0 = poly[0];
        for (size_t i = 1; i + 1 < poly.size(); ++i) {
            total += p0.dot(poly[i].cross(poly[i + 1]));
        }
    }
    return total / 6.0;
}

} // namespace kerf::solid
