#pragma once
// RPC Types: tool catalog, schemas and results
//
// The catalog is closed: a tool name resolves to a Tool value when the
// request is translated, and the dispatcher switches over every value.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace kerf::rpc {

using json = nlohmann::json;

enum class Tool {
    CreateComponent,
    DeleteComponent,
    TransformComponent,
    GetSelection,
    ExportScene,
    SetMaterial,
    BooleanOperation,
    ChamferEdges,
    FilletEdges,
    CreateMortiseTenon,
    CreateDovetail,
    CreateFingerJoint
};

inline std::optional<Tool> tool_from_name(const std::string& name) {
    if (name == "create_component") return Tool::CreateComponent;
    if (name == "delete_component") return Tool::DeleteComponent;
    if (name == "transform_component") return Tool::TransformComponent;
    if (name == "get_selection") return Tool::GetSelection;
    if (name == "export_scene" || name == "export") return Tool::ExportScene;
    if (name == "set_material") return Tool::SetMaterial;
    if (name == "boolean_operation") return Tool::BooleanOperation;
    if (name == "chamfer_edges") return Tool::ChamferEdges;
    if (name == "fillet_edges") return Tool::FilletEdges;
    if (name == "create_mortise_tenon") return Tool::CreateMortiseTenon;
    if (name == "create_dovetail") return Tool::CreateDovetail;
    if (name == "create_finger_joint") return Tool::CreateFingerJoint;
    return std::nullopt;
}

inline const char* tool_name(Tool tool) {
    switch (tool) {
        case Tool::CreateComponent: return "create_component";
        case Tool::DeleteComponent: return "delete_component";
        case Tool::TransformComponent: return "transform_component";
        case Tool::GetSelection: return "get_selection";
        case Tool::ExportScene: return "export_scene";
        case Tool::SetMaterial: return "set_material";
        case Tool::BooleanOperation: return "boolean_operation";
        case Tool::ChamferEdges: return "chamfer_edges";
        case Tool::FilletEdges: return "fillet_edges";
        case Tool::CreateMortiseTenon: return "create_mortise_tenon";
        case Tool::CreateDovetail: return "create_dovetail";
        case Tool::CreateFingerJoint: return "create_finger_joint";
    }
    return "unknown";
}

// Tool schema definition for tools/list
struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

// Tool execution result
struct ToolResult {
    bool is_error = false;
    std::string content;      // Human-readable summary or error message
    json structured;          // Payload returned to the client

    static ToolResult ok(const std::string& text, const json& data = json::object()) {
        return {false, text, data};
    }

    static ToolResult error(const std::string& message) {
        return {true, message, json()};
    }
};

} // namespace kerf::rpc
