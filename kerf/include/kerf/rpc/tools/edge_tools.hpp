#pragma once
// RPC Edge Tools: chamfer_edges, fillet_edges
//
// Both work on a copy of the source in a fresh group; the copy is
// scratch until the treatment succeeds.

#include "common.hpp"
#include "../../edges.hpp"
#include <sstream>

namespace kerf::rpc::tools::edge_tools {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    json common_props = {
        {"entity_id", {{"type", {"integer", "string"}}}},
        {"edge_indices", {{"type", "array"}, {"items", {{"type", "integer"}}},
                          {"description", "Edges to treat, by index in first-appearance order. Default: all"}}},
        {"delete_original", {{"type", "boolean"}, {"default", false}}}
    };

    json chamfer_props = common_props;
    chamfer_props["distance"] = {{"type", "number"}, {"default", kerf::edges::DEFAULT_CHAMFER_DISTANCE}};
    tools.push_back({
        "chamfer_edges",
        "Approximate chamfer: cut selected edges back by a distance into a new group.",
        {{"type", "object"}, {"properties", chamfer_props}, {"required", {"entity_id"}}}
    });

    json fillet_props = common_props;
    fillet_props["radius"] = {{"type", "number"}, {"default", kerf::edges::DEFAULT_FILLET_RADIUS}};
    fillet_props["segments"] = {{"type", "integer"}, {"default", kerf::edges::DEFAULT_FILLET_SEGMENTS}};
    tools.push_back({
        "fillet_edges",
        "Approximate fillet: round selected edges with arc segments into a new group.",
        {{"type", "object"}, {"properties", fillet_props}, {"required", {"entity_id"}}}
    });
}

// edge_indices as a list of integers, nullopt when absent
inline bool read_indices(const json& args, std::optional<std::vector<int64_t>>& out, std::string& error) {
    if (!args.contains("edge_indices") || args["edge_indices"].is_null()) return true;

    const json& v = args["edge_indices"];
    if (!v.is_array()) {
        error = "Parameter 'edge_indices' must be an array of integers";
        return false;
    }
    std::vector<int64_t> indices;
    for (const auto& item : v) {
        if (!item.is_number_integer()) {
            error = "Parameter 'edge_indices' must be an array of integers";
            return false;
        }
        indices.push_back(item.get<int64_t>());
    }
    out = std::move(indices);
    return true;
}

enum class Treatment {
    Chamfer,
    Fillet
};

inline ToolResult treat_edges(Kernel& kernel, const json& args, Treatment treatment) {
    std::string error;
    auto source = find_group(kernel, args, "entity_id", "entity", error);
    if (!source) return ToolResult::error(error);

    std::optional<std::vector<int64_t>> indices;
    if (!read_indices(args, indices, error)) return ToolResult::error(error);

    double size = treatment == Treatment::Chamfer
        ? args.value("distance", kerf::edges::DEFAULT_CHAMFER_DISTANCE)
        : args.value("radius", kerf::edges::DEFAULT_FILLET_RADIUS);
    int segments = args.value("segments", kerf::edges::DEFAULT_FILLET_SEGMENTS);
    if (!(size > 0)) {
        return ToolResult::error(treatment == Treatment::Chamfer
            ? "Chamfer distance must be positive" : "Fillet radius must be positive");
    }
    if (treatment == Treatment::Fillet && segments < 1) {
        return ToolResult::error("Fillet segments must be at least 1");
    }

    ScratchGroup result(kernel);
    kernel.copy_geometry(*source, result.id());

    auto mesh = kernel.faces(result.id());
    auto selected = kerf::edges::select_edges(kernel.edges(result.id()), indices);
    auto outcome = treatment == Treatment::Chamfer
        ? kerf::edges::chamfer(mesh, selected, size)
        : kerf::edges::fillet(mesh, selected, size, segments);
    kernel.replace_faces(result.id(), mesh);

    EntityId id = result.release();

    if (args.value("delete_original", false) && kernel.valid(*source)) {
        kernel.erase(*source);
    }

    std::ostringstream ss;
    ss << (treatment == Treatment::Chamfer ? "Chamfered " : "Filleted ")
       << outcome.applied << " edge(s) of " << *source << " -> " << id;
    if (outcome.skipped > 0) ss << " (" << outcome.skipped << " skipped)";

    return ToolResult::ok(ss.str(), {
        {"id", id},
        {"edges_treated", outcome.applied},
        {"edges_skipped", outcome.skipped}
    });
}

inline ToolResult chamfer_edges(Kernel& kernel, const json& args) {
    return treat_edges(kernel, args, Treatment::Chamfer);
}

inline ToolResult fillet_edges(Kernel& kernel, const json& args) {
    return treat_edges(kernel, args, Treatment::Fillet);
}

} // namespace kerf::rpc::tools::edge_tools
