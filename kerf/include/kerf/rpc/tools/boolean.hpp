#pragma once
// RPC Boolean Tool: boolean_operation
//
// The originals are never touched by the operation itself: target and tool
// are duplicated, their geometry copied into scratch groups, and the result
// lands in a fresh group. Every intermediate group is scratch.

#include "common.hpp"
#include <sstream>

namespace kerf::rpc::tools::boolean {

using json = nlohmann::json;

enum class Operation {
    Union,
    Difference,
    Intersection
};

inline std::optional<Operation> operation_from_string(const std::string& s) {
    if (s == "union") return Operation::Union;
    if (s == "difference") return Operation::Difference;
    if (s == "intersection") return Operation::Intersection;
    return std::nullopt;
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "boolean_operation",
        "Combine two groups into a new group: union, difference (target minus tool) "
        "or intersection. Optionally erase the originals.",
        {
            {"type", "object"},
            {"properties", {
                {"operation", {{"type", "string"},
                               {"enum", {"union", "difference", "intersection"}}}},
                {"target_id", {{"type", {"integer", "string"}}}},
                {"tool_id", {{"type", {"integer", "string"}}}},
                {"delete_originals", {{"type", "boolean"}, {"default", false}}}
            }},
            {"required", {"operation", "target_id", "tool_id"}}
        }
    });
}

// Result group for `op`; scratch groups are gone when this returns
inline EntityId combine(Kernel& kernel, Operation op, EntityId target, EntityId tool) {
    ScratchGroup target_copy(kernel, kernel.copy(target));
    ScratchGroup tool_copy(kernel, kernel.copy(tool));
    kernel.set_transformation(target_copy.id(), kernel.transformation(target));
    kernel.set_transformation(tool_copy.id(), kernel.transformation(tool));

    ScratchGroup result(kernel);

    switch (op) {
        case Operation::Union:
            kernel.copy_geometry(target_copy.id(), result.id());
            kernel.copy_geometry(tool_copy.id(), result.id());
            kernel.outer_shell(result.id());
            break;
        case Operation::Difference: {
            kernel.copy_geometry(target_copy.id(), result.id());
            ScratchGroup cutter(kernel);
            kernel.copy_geometry(tool_copy.id(), cutter.id());
            kernel.subtract(result.id(), cutter.id());
            break;
        }
        case Operation::Intersection: {
            ScratchGroup a(kernel);
            ScratchGroup b(kernel);
            kernel.copy_geometry(target_copy.id(), a.id());
            kernel.copy_geometry(tool_copy.id(), b.id());
            kernel.intersect(a.id(), b.id(), result.id());
            break;
        }
    }
    return result.release();
}

inline ToolResult boolean_operation(Kernel& kernel, const json& args) {
    if (auto err = validate_required(args, {"operation"}); !err.empty()) {
        return ToolResult::error(err);
    }
    std::string op_name = args["operation"].is_string() ? args["operation"].get<std::string>()
                                                        : args["operation"].dump();
    auto op = operation_from_string(op_name);
    if (!op) {
        return ToolResult::error("Unknown boolean operation: " + op_name);
    }

    // Report every missing operand by role
    std::vector<std::string> missing;
    std::string target_error, tool_error;
    auto target = find_group(kernel, args, "target_id", "target", target_error);
    auto tool = find_group(kernel, args, "tool_id", "tool", tool_error);
    for (const auto& err : {target_error, tool_error}) {
        if (!err.empty() && err.rfind("Entity not found: ", 0) != 0) {
            return ToolResult::error(err);
        }
    }
    if (!target) missing.push_back("target");
    if (!tool) missing.push_back("tool");
    if (!missing.empty()) {
        std::string msg = "Entity not found: " + missing[0];
        for (size_t i = 1; i < missing.size(); ++i) msg += ", " + missing[i];
        return ToolResult::error(msg);
    }

    EntityId result = combine(kernel, *op, *target, *tool);

    bool delete_originals = args.value("delete_originals", false);
    if (delete_originals) {
        for (EntityId id : {*target, *tool}) {
            if (kernel.valid(id)) kernel.erase(id);
        }
    }

    std::ostringstream ss;
    ss << op_name << " of " << *target << " and " << *tool << " -> " << result;
    return ToolResult::ok(ss.str(), {{"id", result}});
}

} // namespace kerf::rpc::tools::boolean
