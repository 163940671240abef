#pragma once
// RPC Primitive Tools: create_component
//
// Cube, cylinder, sphere and cone as new top-level groups.

#include "common.hpp"
#include "../../geometry.hpp"
#include <sstream>

namespace kerf::rpc::tools::primitives {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "create_component",
        "Create a primitive solid as a new group. Position is the min corner of "
        "its bounds; round shapes use the first dimension as the diameter.",
        {
            {"type", "object"},
            {"properties", {
                {"type", {{"type", "string"},
                          {"enum", {"cube", "cylinder", "sphere", "cone"}}}},
                {"position", {{"type", "array"}, {"items", {{"type", "number"}}},
                              {"default", {0, 0, 0}}}},
                {"dimensions", {{"type", "array"}, {"items", {{"type", "number"}}},
                                {"default", {1, 1, 1}}}}
            }},
            {"required", {"type"}}
        }
    });
}

inline ToolResult create_component(Kernel& kernel, const json& args) {
    if (auto err = validate_required(args, {"type"}); !err.empty()) {
        return ToolResult::error(err);
    }
    if (!args["type"].is_string()) {
        return ToolResult::error("Unknown component type: " + args["type"].dump());
    }

    std::string type_name = args["type"];
    auto type = geometry::primitive_from_string(type_name);
    if (!type) {
        return ToolResult::error("Unknown component type: " + type_name);
    }

    Vec3 position{0, 0, 0};
    Vec3 dimensions{1, 1, 1};
    std::string error;
    if (!read_vec3(args, "position", position, error) ||
        !read_vec3(args, "dimensions", dimensions, error)) {
        return ToolResult::error(error);
    }
    if (!(dimensions.x() > 0) || !(dimensions.y() > 0) || !(dimensions.z() > 0)) {
        return ToolResult::error("Dimensions must be positive");
    }

    EntityId id = geometry::create_primitive(kernel, *type, position, dimensions);

    std::ostringstream ss;
    ss << "Created " << geometry::primitive_name(*type) << " " << id;
    return ToolResult::ok(ss.str(), {{"id", id}});
}

} // namespace kerf::rpc::tools::primitives
