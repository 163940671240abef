#pragma once
// Export: model writers and view renderer for the in-memory scene
//
// write_model() handles skp (JSON scene snapshot), obj (+mtl), dae and
// ascii stl. render_image() rasterizes an isometric view with flat shading
// and writes png or jpg. Both throw KernelError on failure.

#include <kerf/kernel.hpp>
#include <kerf/scene.hpp>
#include <array>
#include <string>
#include <vector>

namespace kerf {

void write_model(const std::vector<SceneSolid>& solids, const std::string& path,
                 ExportFormat format);

void render_image(const std::vector<SceneSolid>& solids, const std::string& path,
                  ExportFormat format, int width, int height);

// Triangle fan of a convex polygon
std::vector<std::array<Vec3, 3>> triangulate(const Polygon& poly);

} // namespace kerf
