#pragma once
// RPC Scene Tools: delete_component, transform_component, get_selection,
// export_scene, set_material

#include "common.hpp"
#include <chrono>
#include <sstream>

namespace kerf::rpc::tools::scene {

using json = nlohmann::json;

constexpr int DEFAULT_EXPORT_WIDTH = 1920;
constexpr int DEFAULT_EXPORT_HEIGHT = 1080;
constexpr int MAX_EXPORT_SIDE = 8192;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "delete_component",
        "Erase an entity from the scene.",
        {
            {"type", "object"},
            {"properties", {
                {"id", {{"type", {"integer", "string"}}}}
            }},
            {"required", {"id"}}
        }
    });

    tools.push_back({
        "transform_component",
        "Move, rotate and scale a group. Applied in order: matrix (16 values, "
        "column-major), position (translation), rotation (degrees about x, y, z "
        "through the bounds center), scale (about the bounds center).",
        {
            {"type", "object"},
            {"properties", {
                {"id", {{"type", {"integer", "string"}}}},
                {"matrix", {{"type", "array"}, {"items", {{"type", "number"}}}}},
                {"position", {{"type", "array"}, {"items", {{"type", "number"}}}}},
                {"rotation", {{"type", "array"}, {"items", {{"type", "number"}}}}},
                {"scale", {{"type", {"array", "number"}}}}
            }},
            {"required", {"id"}}
        }
    });

    tools.push_back({
        "get_selection",
        "List the currently selected entities.",
        {{"type", "object"}, {"properties", json::object()}}
    });

    tools.push_back({
        "export_scene",
        "Export the scene to a file. Model formats: skp, obj, dae, stl. "
        "Image formats render the current view: png, jpg.",
        {
            {"type", "object"},
            {"properties", {
                {"format", {{"type", "string"},
                            {"enum", {"skp", "obj", "dae", "stl", "png", "jpg"}},
                            {"default", "skp"}}},
                {"width", {{"type", "integer"}, {"default", DEFAULT_EXPORT_WIDTH}}},
                {"height", {{"type", "integer"}, {"default", DEFAULT_EXPORT_HEIGHT}}}
            }}
        }
    });

    tools.push_back({
        "set_material",
        "Assign a material by name, or a color as #RRGGBB.",
        {
            {"type", "object"},
            {"properties", {
                {"id", {{"type", {"integer", "string"}}}},
                {"material", {{"type", "string"}}}
            }},
            {"required", {"id", "material"}}
        }
    });
}

// Entity referenced by args["id"], or an error message
inline std::optional<EntityId> find_entity(const Kernel& kernel, const json& args, std::string& error) {
    if (auto err = validate_required(args, {"id"}); !err.empty()) {
        error = err;
        return std::nullopt;
    }
    auto id = parse_id(args["id"]);
    if (!id || !kernel.valid(*id)) {
        error = "Entity not found";
        return std::nullopt;
    }
    return id;
}

inline ToolResult delete_component(Kernel& kernel, const json& args) {
    std::string error;
    auto id = find_entity(kernel, args, error);
    if (!id) return ToolResult::error(error);

    kernel.erase(*id);
    return ToolResult::ok("Deleted " + std::to_string(*id));
}

inline ToolResult transform_component(Kernel& kernel, const json& args) {
    std::string error;
    auto id = find_entity(kernel, args, error);
    if (!id) return ToolResult::error(error);
    if (kernel.kind(*id) != EntityKind::Group) {
        return ToolResult::error("Entity is not a group or component");
    }

    // Validate everything before touching the entity
    std::optional<Transform> matrix;
    if (args.contains("matrix") && !args["matrix"].is_null()) {
        const json& m = args["matrix"];
        std::vector<double> values;
        if (m.is_array()) {
            for (const auto& v : m) {
                if (!v.is_number()) break;
                values.push_back(v.get<double>());
            }
        }
        matrix = Transform::from_column_major(values);
        if (!matrix || values.size() != m.size()) {
            return ToolResult::error("Parameter 'matrix' must be 16 numbers of an affine transform");
        }
    }

    std::optional<Vec3> translation;
    if (args.contains("position") && !args["position"].is_null()) {
        Vec3 v = Vec3::Zero();
        if (!read_vec3(args, "position", v, error)) return ToolResult::error(error);
        translation = v;
    }

    Vec3 rotation = Vec3::Zero();
    if (!read_vec3(args, "rotation", rotation, error)) return ToolResult::error(error);

    std::optional<Vec3> scale;
    if (args.contains("scale") && !args["scale"].is_null()) {
        if (args["scale"].is_number()) {
            double s = args["scale"].get<double>();
            scale = Vec3{s, s, s};
        } else {
            Vec3 v = Vec3::Zero();
            if (!read_vec3(args, "scale", v, error)) return ToolResult::error(error);
            scale = v;
        }
        if ((scale->array() == 0.0).any()) {
            return ToolResult::error("Scale factors must be non-zero");
        }
    }

    if (matrix) {
        kernel.transform(*id, *matrix);
    }
    if (translation) {
        kernel.transform(*id, Transform::translation(*translation));
    }
    if (!rotation.isZero(0.0)) {
        Vec3 pivot = kernel.bounds(*id).center();
        for (int i = 0; i < 3; ++i) {
            if (rotation[i] == 0.0) continue;
            kernel.transform(*id, Transform::rotation(pivot, Vec3::Unit(i), degrees_to_radians(rotation[i])));
        }
    }
    if (scale) {
        Vec3 pivot = kernel.bounds(*id).center();
        kernel.transform(*id, Transform::scaling(pivot, *scale));
    }

    return ToolResult::ok("Transformed " + std::to_string(*id), {
        {"id", *id},
        {"bounds", bounds_json(kernel.bounds(*id))}
    });
}

inline ToolResult get_selection(Kernel& kernel, const json& args) {
    (void)args;
    json selection = json::array();
    for (EntityId id : kernel.selection()) {
        selection.push_back({
            {"id", id},
            {"type", entity_kind_name(kernel.kind(id))}
        });
    }
    return ToolResult::ok(std::to_string(selection.size()) + " selected",
                          {{"selection", selection}});
}

inline ToolResult export_scene(Kernel& kernel, const json& args, const std::string& export_dir) {
    std::string format_name = args.value("format", std::string("skp"));
    auto format = export_format_from_string(format_name);
    if (!format) {
        return ToolResult::error("Unsupported export format: " + format_name);
    }

    std::string error;
    double width = DEFAULT_EXPORT_WIDTH;
    double height = DEFAULT_EXPORT_HEIGHT;
    if (!read_number(args, "width", width, error) || !read_number(args, "height", height, error)) {
        return ToolResult::error(error);
    }

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string ext = export_format_extension(*format);
    std::string path = export_dir + "/kerf_export_" + std::to_string(millis) + "." + ext;

    if (is_image_format(*format)) {
        if (!(width >= 1 && width <= MAX_EXPORT_SIDE) || !(height >= 1 && height <= MAX_EXPORT_SIDE)) {
            return ToolResult::error("Image width and height must be between 1 and " +
                                     std::to_string(MAX_EXPORT_SIDE));
        }
        kernel.render_view(path, *format, static_cast<int>(width), static_cast<int>(height));
    } else {
        kernel.save(path, *format);
    }

    return ToolResult::ok("Exported to " + path, {
        {"path", path},
        {"format", ext}
    });
}

inline ToolResult set_material(Kernel& kernel, const json& args) {
    std::string error;
    auto id = find_entity(kernel, args, error);
    if (!id) return ToolResult::error(error);

    if (auto err = validate_required(args, {"material"}); !err.empty()) {
        return ToolResult::error(err);
    }
    if (!args["material"].is_string() || args["material"].get<std::string>().empty()) {
        return ToolResult::error("Parameter 'material' must be a non-empty string");
    }

    std::string name = args["material"];
    kernel.set_material(*id, name, Color::from_hex(name));

    return ToolResult::ok("Material " + name + " on " + std::to_string(*id), {
        {"id", *id},
        {"material", name}
    });
}

} // namespace kerf::rpc::tools::scene
