#pragma once
// Solid: booleans on closed polygon meshes, backed by manifold
//
// Meshes cross into manifold as welded triangle meshes. Each input
// polygon is tagged with a face id so the result comes back as the
// polygons it was cut from rather than loose triangles. An operand
// that is not a closed, consistently wound solid raises KernelError.

#include <kerf/types.hpp>
#include <vector>

namespace kerf::solid {

using Mesh = std::vector<Polygon>;

// Points within this distance are welded into one vertex
constexpr double WELD_TOLERANCE = 1e-6;

Mesh subtract(const Mesh& a, const Mesh& b);
Mesh intersect(const Mesh& a, const Mesh& b);

// Union of any number of shells
Mesh unite_all(const std::vector<Mesh>& shells);

// Enclosed volume by the divergence theorem (signed: negative if inverted).
// Works on open or overlapping meshes, which manifold would reject.
double volume(const Mesh& mesh);

} // namespace kerf::solid
