#pragma once
// Edges: approximate chamfer and fillet on a closed polygon mesh
//
// Each selected edge is treated independently against the current mesh:
// the two faces that share it are trimmed back by the offset distance
// along their adjacent edges, a profile (one straight span for chamfer,
// an arc for fillet) bridges the trimmed faces, and the faces at the
// edge's end vertices take the profile in place of the corner point.
//
// The result is not guaranteed to be an exact bevel. Edges with fewer
// than two faces, edges whose corner no longer exists (an earlier edge
// already consumed it) and edges too short for the offset are skipped.

#include <kerf/kernel.hpp>
#include <kerf/types.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace kerf::edges {

using Mesh = std::vector<Polygon>;

constexpr double DEFAULT_CHAMFER_DISTANCE = 0.5;
constexpr double DEFAULT_FILLET_RADIUS = 0.5;
constexpr int DEFAULT_FILLET_SEGMENTS = 8;

struct Outcome {
    size_t applied = 0;
    size_t skipped = 0;
};

// Edges chosen by index into `all`; nullopt selects every edge.
// Out-of-range indices are ignored.
std::vector<Edge> select_edges(const std::vector<Edge>& all,
                               const std::optional<std::vector<int64_t>>& indices);

Outcome chamfer(Mesh& mesh, const std::vector<Edge>& selected, double distance);
Outcome fillet(Mesh& mesh, const std::vector<Edge>& selected, double radius, int segments);

} // namespace kerf::edges
