#pragma once
// RPC Handler: translator and dispatcher for all tools
//
// handle() takes one raw request line and always returns one response
// line. Legacy {command, parameters} requests are rewritten into
// tools/call first. Tool failures of every kind (returned errors and
// thrown ones) become -32603 envelopes here and nowhere else.

#include "protocol.hpp"
#include "types.hpp"
#include "tools/boolean.hpp"
#include "tools/edge_tools.hpp"
#include "tools/joinery.hpp"
#include "tools/primitives.hpp"
#include "tools/scene.hpp"
#include "../kernel.hpp"
#include "../log.hpp"
#include "../version.hpp"
#include <string>
#include <utility>
#include <vector>

namespace kerf::rpc {

using json = nlohmann::json;

struct HandlerContext {
    std::string export_dir = "/tmp";
};

// Canonical form of any accepted request shape
struct Invocation {
    json id;
    std::string jsonrpc;
    std::string method;
    json params;
};

// Rewrites the legacy shape; passes JSON-RPC requests through
inline Invocation translate(const json& envelope) {
    Invocation inv;
    inv.id = envelope.contains("id") ? envelope["id"] : json();
    inv.jsonrpc = envelope.contains("jsonrpc") && envelope["jsonrpc"].is_string()
        ? envelope["jsonrpc"].get<std::string>()
        : version::jsonrpc();

    if (envelope.contains("command")) {
        inv.method = "tools/call";
        inv.params = {
            {"name", envelope["command"]},
            {"arguments", envelope.value("parameters", json::object())}
        };
        return inv;
    }

    if (envelope.contains("method") && envelope["method"].is_string()) {
        inv.method = envelope["method"].get<std::string>();
    }
    inv.params = envelope.value("params", json::object());
    return inv;
}

class Handler {
public:
    explicit Handler(Kernel& kernel, HandlerContext context = {})
        : kernel_(kernel),
          context_(std::move(context)) {
        register_schemas();
    }

    // Process one request line, return one response line (no terminator)
    std::string handle(const std::string& line) {
        Decoded decoded = decode_line(line);
        if (!decoded.envelope) {
            log_debug("rpc", "parse error, id=%s", decoded.id.dump().c_str());
            return encode(make_error(decoded.id, error::PARSE_ERROR, decoded.error));
        }

        try {
            return encode(handle_request(*decoded.envelope));
        } catch (const std::exception& e) {
            // Translation itself failed (malformed envelope fields)
            const json& env = *decoded.envelope;
            json id = env.contains("id") ? env["id"] : json();
            return encode(make_error(id, error::INTERNAL_ERROR,
                                     std::string("Internal error: ") + e.what()));
        }
    }

    json handle_request(const json& envelope) {
        Invocation inv = translate(envelope);

        if (inv.method == "tools/call") {
            return handle_tools_call(inv);
        } else if (inv.method == "resources/list") {
            return handle_resources_list(inv);
        } else if (inv.method == "prompts/list") {
            return make_result(inv.id, {{"prompts", json::array()}}, inv.jsonrpc);
        } else if (inv.method == "initialize") {
            return handle_initialize(inv);
        } else if (inv.method == "tools/list") {
            return handle_tools_list(inv);
        }
        return make_error(inv.id, error::METHOD_NOT_FOUND,
                          "Method not found: " + inv.method, inv.jsonrpc);
    }

    // Get list of available tools (for tools/list)
    const std::vector<ToolSchema>& tools() const { return tools_; }

private:
    Kernel& kernel_;
    HandlerContext context_;
    std::vector<ToolSchema> tools_;

    void register_schemas() {
        tools::primitives::register_schemas(tools_);
        tools::scene::register_schemas(tools_);
        tools::boolean::register_schemas(tools_);
        tools::edge_tools::register_schemas(tools_);
        tools::joinery::register_schemas(tools_);
    }

    // ═══════════════════════════════════════════════════════════════════
    // Methods
    // ═══════════════════════════════════════════════════════════════════

    json handle_initialize(const Invocation& inv) {
        return make_result(inv.id, {
            {"protocolVersion", KERF_PROTOCOL_VERSION},
            {"serverInfo", {
                {"name", KERF_SERVER_NAME},
                {"version", KERF_VERSION}
            }},
            {"capabilities", {
                {"tools", {{"listChanged", false}}},
                {"resources", {{"listChanged", false}}},
                {"prompts", {{"listChanged", false}}}
            }}
        }, inv.jsonrpc);
    }

    json handle_tools_list(const Invocation& inv) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(inv.id, {{"tools", tools_array}}, inv.jsonrpc);
    }

    json handle_resources_list(const Invocation& inv) {
        json resources = json::array();
        for (EntityId id : kernel_.top_level()) {
            resources.push_back({
                {"id", id},
                {"type", entity_kind_name(kernel_.kind(id))}
            });
        }
        return make_result(inv.id, {{"resources", resources}}, inv.jsonrpc);
    }

    json handle_tools_call(const Invocation& inv) {
        if (!inv.params.is_object() || !inv.params.contains("name") ||
            !inv.params["name"].is_string()) {
            return make_error(inv.id, error::INTERNAL_ERROR, "Missing tool name", inv.jsonrpc);
        }

        std::string name = inv.params["name"];
        auto tool = tool_from_name(name);
        if (!tool) {
            return make_error(inv.id, error::INTERNAL_ERROR, "Unknown tool: " + name, inv.jsonrpc);
        }

        json arguments = inv.params.value("arguments", json::object());
        if (arguments.is_null()) arguments = json::object();
        if (!arguments.is_object()) {
            return make_error(inv.id, error::INTERNAL_ERROR,
                              "Tool arguments must be an object", inv.jsonrpc);
        }

        log_debug("rpc", "tools/call %s %s", name.c_str(), arguments.dump().c_str());

        ToolResult result;
        try {
            result = dispatch(*tool, arguments);
        } catch (const std::exception& e) {
            log_debug("rpc", "%s failed: %s", name.c_str(), e.what());
            return make_error(inv.id, error::INTERNAL_ERROR, e.what(), inv.jsonrpc);
        }

        if (result.is_error) {
            log_debug("rpc", "%s error: %s", name.c_str(), result.content.c_str());
            return make_error(inv.id, error::INTERNAL_ERROR, result.content, inv.jsonrpc);
        }

        log_debug("rpc", "%s ok: %s", name.c_str(), result.content.c_str());
        return make_result(inv.id, make_tool_response(result.structured), inv.jsonrpc);
    }

    ToolResult dispatch(Tool tool, const json& args) {
        switch (tool) {
            case Tool::CreateComponent:
                return tools::primitives::create_component(kernel_, args);
            case Tool::DeleteComponent:
                return tools::scene::delete_component(kernel_, args);
            case Tool::TransformComponent:
                return tools::scene::transform_component(kernel_, args);
            case Tool::GetSelection:
                return tools::scene::get_selection(kernel_, args);
            case Tool::ExportScene:
                return tools::scene::export_scene(kernel_, args, context_.export_dir);
            case Tool::SetMaterial:
                return tools::scene::set_material(kernel_, args);
            case Tool::BooleanOperation:
                return tools::boolean::boolean_operation(kernel_, args);
            case Tool::ChamferEdges:
                return tools::edge_tools::chamfer_edges(kernel_, args);
            case Tool::FilletEdges:
                return tools::edge_tools::fillet_edges(kernel_, args);
            case Tool::CreateMortiseTenon:
                return tools::joinery::create_mortise_tenon(kernel_, args);
            case Tool::CreateDovetail:
                return tools::joinery::create_dovetail(kernel_, args);
            case Tool::CreateFingerJoint:
                return tools::joinery::create_finger_joint(kernel_, args);
        }
        return ToolResult::error(std::string("Unhandled tool: ") + tool_name(tool));
    }
};

} // namespace kerf::rpc
