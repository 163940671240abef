#include <kerf/export.hpp>
#include <kerf/version.hpp>
#include <nlohmann/json.hpp>
#include <stb_image_write.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>

namespace kerf {

using json = nlohmann::json;

namespace {

constexpr int MAX_IMAGE_SIDE = 8192;
const Color DEFAULT_COLOR{200, 200, 200};
const Color BACKGROUND{255, 255, 255};

std::ofstream open_output(const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw KernelError("Cannot open " + path + " for writing");
    }
    return out;
}

void finish(std::ofstream& out, const std::string& path) {
    out.flush();
    if (!out) {
        throw KernelError("Write failed: " + path);
    }
}

std::string replace_extension(const std::string& path, const std::string& ext) {
    auto slash = path.find_last_of('/');
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return path + ext;
    }
    return path.substr(0, dot) + ext;
}

std::string base_name(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string material_key(const SceneSolid& solid) {
    return solid.material.empty() ? "default" : solid.material;
}

void write_snapshot(const std::vector<SceneSolid>& solids, const std::string& path) {
    json entities = json::array();
    for (const auto& solid : solids) {
        json faces = json::array();
        for (const auto& poly : solid.faces) {
            json loop = json::array();
            for (const auto& p : poly) loop.push_back({p.x(), p.y(), p.z()});
            faces.push_back(loop);
        }
        json entity = {
            {"id", solid.id},
            {"type", "group"},
            {"faces", faces}
        };
        if (!solid.material.empty()) entity["material"] = solid.material;
        if (solid.color) entity["color"] = solid.color->to_hex();
        entities.push_back(entity);
    }

    json doc = {
        {"format", "kerf-scene"},
        {"version", KERF_VERSION},
        {"entities", entities}
    };

    auto out = open_output(path);
    out << doc.dump(2) << "\n";
    finish(out, path);
}

void write_obj(const std::vector<SceneSolid>& solids, const std::string& path) {
    std::string mtl_path = replace_extension(path, ".mtl");

    {
        auto mtl = open_output(mtl_path);
        std::vector<std::string> written;
        for (const auto& solid : solids) {
            std::string key = material_key(solid);
            if (std::find(written.begin(), written.end(), key) != written.end()) continue;
            written.push_back(key);
            Color c = solid.color.value_or(DEFAULT_COLOR);
            mtl << "newmtl " << key << "\n"
                << "Kd " << c.r / 255.0 << " " << c.g / 255.0 << " " << c.b / 255.0 << "\n\n";
        }
        finish(mtl, mtl_path);
    }

    auto out = open_output(path);
    out << "# kerf " << KERF_VERSION << "\n";
    out << "mtllib " << base_name(mtl_path) << "\n";

    size_t vertex_base = 1;
    for (const auto& solid : solids) {
        out << "o group_" << solid.id << "\n";
        out << "usemtl " << material_key(solid) << "\n";
        for (const auto& poly : solid.faces) {
            for (const auto& p : poly) {
                out << "v " << p.x() << " " << p.y() << " " << p.z() << "\n";
            }
        }
        for (const auto& poly : solid.faces) {
            out << "f";
            for (size_t i = 0; i < poly.size(); ++i) out << " " << vertex_base + i;
            out << "\n";
            vertex_base += poly.size();
        }
    }
    finish(out, path);
}

void write_stl(const std::vector<SceneSolid>& solids, const std::string& path) {
    auto out = open_output(path);
    out << "solid kerf\n";
    for (const auto& solid : solids) {
        for (const auto& poly : solid.faces) {
            for (const auto& tri : triangulate(poly)) {
                Vec3 n = (tri[1] - tri[0]).cross(tri[2] - tri[0]).normalized();
                out << "  facet normal " << n.x() << " " << n.y() << " " << n.z() << "\n"
                    << "    outer loop\n";
                for (const auto& v : tri) {
                    out << "      vertex " << v.x() << " " << v.y() << " " << v.z() << "\n";
                }
                out << "    endloop\n  endfacet\n";
            }
        }
    }
    out << "endsolid kerf\n";
    finish(out, path);
}

void write_dae(const std::vector<SceneSolid>& solids, const std::string& path) {
    auto out = open_output(path);
    out << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        << "<COLLADA xmlns=\"http://www.collada.org/2005/11/COLLADASchema\" version=\"1.4.1\">\n"
        << "  <asset><contributor><authoring_tool>kerf " << KERF_VERSION
        << "</authoring_tool></contributor><up_axis>Z_UP</up_axis></asset>\n"
        << "  <library_geometries>\n";

    for (const auto& solid : solids) {
        std::vector<std::array<Vec3, 3>> tris;
        for (const auto& poly : solid.faces) {
            auto t = triangulate(poly);
            tris.insert(tris.end(), t.begin(), t.end());
        }
        std::string gid = "geom_" + std::to_string(solid.id);
        out << "    <geometry id=\"" << gid << "\"><mesh>\n"
            << "      <source id=\"" << gid << "_pos\"><float_array id=\"" << gid
            << "_arr\" count=\"" << tris.size() * 9 << "\">";
        for (const auto& tri : tris) {
            for (const auto& v : tri) out << v.x() << " " << v.y() << " " << v.z() << " ";
        }
        out << "</float_array>\n"
            << "        <technique_common><accessor source=\"#" << gid << "_arr\" count=\""
            << tris.size() * 3 << "\" stride=\"3\">"
            << "<param name=\"X\" type=\"float\"/><param name=\"Y\" type=\"float\"/>"
            << "<param name=\"Z\" type=\"float\"/></accessor></technique_common>\n"
            << "      </source>\n"
            << "      <vertices id=\"" << gid << "_vtx\"><input semantic=\"POSITION\" source=\"#"
            << gid << "_pos\"/></vertices>\n"
            << "      <triangles count=\"" << tris.size() << "\"><input semantic=\"VERTEX\" source=\"#"
            << gid << "_vtx\" offset=\"0\"/><p>";
        for (size_t i = 0; i < tris.size() * 3; ++i) out << i << " ";
        out << "</p></triangles>\n"
            << "    </mesh></geometry>\n";
    }

    out << "  </library_geometries>\n"
        << "  <library_visual_scenes><visual_scene id=\"scene\">\n";
    for (const auto& solid : solids) {
        out << "    <node id=\"group_" << solid.id << "\"><instance_geometry url=\"#geom_"
            << solid.id << "\"/></node>\n";
    }
    out << "  </visual_scene></library_visual_scenes>\n"
        << "  <scene><instance_visual_scene url=\"#scene\"/></scene>\n"
        << "</COLLADA>\n";
    finish(out, path);
}

} // anonymous namespace

std::vector<std::array<Vec3, 3>> triangulate(const Polygon& poly) {
    std::vector<std::array<Vec3, 3>> tris;
    for (size_t i = 1; i + 1 < poly.size(); ++i) {
        tris.push_back({poly[0], poly[i], poly[i + 1]});
    }
    return tris;
}

void write_model(const std::vector<SceneSolid>& solids, const std::string& path,
                 ExportFormat format) {
    switch (format) {
        case ExportFormat::Skp: write_snapshot(solids, path); return;
        case ExportFormat::Obj: write_obj(solids, path); return;
        case ExportFormat::Dae: write_dae(solids, path); return;
        case ExportFormat::Stl: write_stl(solids, path); return;
        case ExportFormat::Png:
        case ExportFormat::Jpg:
            break;
    }
    throw KernelError(std::string("Not a model format: ") + export_format_extension(format));
}

// ═══════════════════════════════════════════════════════════════════
// Renderer: isometric view from front-left-above, z-buffered
// ═══════════════════════════════════════════════════════════════════

void render_image(const std::vector<SceneSolid>& solids, const std::string& path,
                  ExportFormat format, int width, int height) {
    if (width <= 0 || height <= 0 || width > MAX_IMAGE_SIDE || height > MAX_IMAGE_SIDE) {
        throw KernelError("Image size out of range: " + std::to_string(width) + "x" +
                          std::to_string(height));
    }

    const Vec3 forward = Vec3{-1.0, 1.0, -1.0}.normalized();
    const Vec3 right = forward.cross(Vec3{0.0, 0.0, 1.0}).normalized();
    const Vec3 up = right.cross(forward);

    // Fit the projected scene into the image with a margin
    double min_u = std::numeric_limits<double>::max(), max_u = std::numeric_limits<double>::lowest();
    double min_v = min_u, max_v = max_u;
    for (const auto& solid : solids) {
        for (const auto& poly : solid.faces) {
            for (const auto& p : poly) {
                min_u = std::min(min_u, p.dot(right));
                max_u = std::max(max_u, p.dot(right));
                min_v = std::min(min_v, p.dot(up));
                max_v = std::max(max_v, p.dot(up));
            }
        }
    }

    const size_t pixel_count = static_cast<size_t>(width) * static_cast<size_t>(height);
    std::vector<unsigned char> pixels(pixel_count * 3);
    for (size_t i = 0; i < pixel_count; ++i) {
        pixels[i * 3 + 0] = BACKGROUND.r;
        pixels[i * 3 + 1] = BACKGROUND.g;
        pixels[i * 3 + 2] = BACKGROUND.b;
    }
    std::vector<double> depth(pixel_count, std::numeric_limits<double>::max());

    if (min_u <= max_u) {
        double span = std::max({max_u - min_u, max_v - min_v, EPSILON});
        double scale = 0.9 * std::min(width, height) / span;
        double cu = (min_u + max_u) * 0.5;
        double cv = (min_v + max_v) * 0.5;

        auto project = [&](const Vec3& p) {
            return Vec3{width * 0.5 + (p.dot(right) - cu) * scale,
                        height * 0.5 - (p.dot(up) - cv) * scale,
                        p.dot(forward)};
        };

        for (const auto& solid : solids) {
            Color base = solid.color.value_or(DEFAULT_COLOR);
            for (const auto& poly : solid.faces) {
                Vec3 n = polygon_normal(poly).normalized();
                double shade = 0.35 + 0.65 * std::abs(n.dot(forward));
                unsigned char r = static_cast<unsigned char>(std::min(255.0, base.r * shade));
                unsigned char g = static_cast<unsigned char>(std::min(255.0, base.g * shade));
                unsigned char b = static_cast<unsigned char>(std::min(255.0, base.b * shade));

                for (const auto& tri : triangulate(poly)) {
                    Vec3 a = project(tri[0]), bb = project(tri[1]), c = project(tri[2]);
                    double area = (bb.x() - a.x()) * (c.y() - a.y()) - (bb.y() - a.y()) * (c.x() - a.x());
                    if (std::abs(area) < EPSILON) continue;

                    int x0 = std::max(0, static_cast<int>(std::floor(std::min({a.x(), bb.x(), c.x()}))));
                    int x1 = std::min(width - 1, static_cast<int>(std::ceil(std::max({a.x(), bb.x(), c.x()}))));
                    int y0 = std::max(0, static_cast<int>(std::floor(std::min({a.y(), bb.y(), c.y()}))));
                    int y1 = std::min(height - 1, static_cast<int>(std::ceil(std::max({a.y(), bb.y(), c.y()}))));

                    for (int y = y0; y <= y1; ++y) {
                        for (int x = x0; x <= x1; ++x) {
                            double px = x + 0.5, py = y + 0.5;
                            double w0 = ((bb.x() - px) * (c.y() - py) - (bb.y() - py) * (c.x() - px)) / area;
                            double w1 = ((c.x() - px) * (a.y() - py) - (c.y() - py) * (a.x() - px)) / area;
                            double w2 = 1.0 - w0 - w1;
                            if (w0 < 0 || w1 < 0 || w2 < 0) continue;

                            double z = w0 * a.z() + w1 * bb.z() + w2 * c.z();
                            size_t idx = static_cast<size_t>(y) * static_cast<size_t>(width) +
                                         static_cast<size_t>(x);
                            if (z >= depth[idx]) continue;
                            depth[idx] = z;
                            pixels[idx * 3 + 0] = r;
                            pixels[idx * 3 + 1] = g;
                            pixels[idx * 3 + 2] = b;
                        }
                    }
                }
            }
        }
    }

    int ok = 0;
    if (format == ExportFormat::Png) {
        ok = stbi_write_png(path.c_str(), width, height, 3, pixels.data(), width * 3);
    } else if (format == ExportFormat::Jpg) {
        ok = stbi_write_jpg(path.c_str(), width, height, 3, pixels.data(), 90);
    } else {
        throw KernelError("Not an image format");
    }
    if (!ok) {
        throw KernelError("Failed to write image: " + path);
    }
}

} // namespace kerf
