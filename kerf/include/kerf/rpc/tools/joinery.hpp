#pragma once
// RPC Joinery Tools: create_mortise_tenon, create_dovetail, create_finger_joint
//
// Each joint takes two boards, picks the faces from where the boards sit
// relative to each other, and mutates the boards in place. The results
// are the board ids, not new entities.

#include "common.hpp"
#include "../../joinery.hpp"
#include <sstream>
#include <utility>

namespace kerf::rpc::tools::joinery {

using json = nlohmann::json;

inline json joint_properties(const char* first, const char* second) {
    json number = {{"type", "number"}};
    json props = {
        {first, {{"type", {"integer", "string"}}}},
        {second, {{"type", {"integer", "string"}}}},
        {"width", {{"type", "number"}, {"default", kerf::joinery::DEFAULT_SIZE}}},
        {"height", {{"type", "number"}, {"default", kerf::joinery::DEFAULT_SIZE}}},
        {"depth", {{"type", "number"}, {"default", kerf::joinery::DEFAULT_SIZE}}},
        {"offset_x", number},
        {"offset_y", number},
        {"offset_z", number}
    };
    return props;
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "create_mortise_tenon",
        "Cut a rectangular mortise into one board and add the matching tenon to the "
        "other, on the faces where the boards meet.",
        {
            {"type", "object"},
            {"properties", joint_properties("mortise_id", "tenon_id")},
            {"required", {"mortise_id", "tenon_id"}}
        }
    });

    json dovetail_props = joint_properties("tail_id", "pin_id");
    dovetail_props["angle"] = {{"type", "number"}, {"default", kerf::joinery::DEFAULT_DOVETAIL_ANGLE}};
    dovetail_props["num_tails"] = {{"type", "integer"}, {"default", kerf::joinery::DEFAULT_TAILS}};
    tools.push_back({
        "create_dovetail",
        "Add flared dovetail tails to one board and the pin block to the other.",
        {
            {"type", "object"},
            {"properties", dovetail_props},
            {"required", {"tail_id", "pin_id"}}
        }
    });

    json finger_props = joint_properties("board1_id", "board2_id");
    finger_props["num_fingers"] = {{"type", "integer"}, {"default", kerf::joinery::DEFAULT_FINGERS}};
    tools.push_back({
        "create_finger_joint",
        "Add alternating fingers to one board and cut the complementary slots into the other.",
        {
            {"type", "object"},
            {"properties", finger_props},
            {"required", {"board1_id", "board2_id"}}
        }
    });
}

inline kerf::joinery::JointParams read_params(const json& args, const char* count_key, int default_count) {
    kerf::joinery::JointParams p;
    p.width = args.value("width", kerf::joinery::DEFAULT_SIZE);
    p.height = args.value("height", kerf::joinery::DEFAULT_SIZE);
    p.depth = args.value("depth", kerf::joinery::DEFAULT_SIZE);
    p.offset = Vec3(args.value("offset_x", 0.0), args.value("offset_y", 0.0), args.value("offset_z", 0.0));
    p.angle = args.value("angle", kerf::joinery::DEFAULT_DOVETAIL_ANGLE);
    if (count_key) p.count = args.value(count_key, static_cast<double>(default_count));
    return p;
}

// Both boards resolved, or an error naming the missing roles
inline std::optional<std::pair<EntityId, EntityId>> find_boards(
        const Kernel& kernel, const json& args,
        const char* first_key, const char* first_role,
        const char* second_key, const char* second_role, std::string& error) {
    std::string first_error, second_error;
    auto first = find_group(kernel, args, first_key, first_role, first_error);
    auto second = find_group(kernel, args, second_key, second_role, second_error);
    if (!first || !second) {
        error = !first_error.empty() ? first_error : second_error;
        if (!first && !second &&
            first_error.rfind("Entity not found", 0) == 0 &&
            second_error.rfind("Entity not found", 0) == 0) {
            error = std::string("Entity not found: ") + first_role + ", " + second_role;
        }
        return std::nullopt;
    }
    if (*first == *second) {
        error = "A joint needs two different boards";
        return std::nullopt;
    }
    return std::make_pair(*first, *second);
}

inline ToolResult create_mortise_tenon(Kernel& kernel, const json& args) {
    std::string error;
    auto boards = find_boards(kernel, args, "mortise_id", "mortise", "tenon_id", "tenon", error);
    if (!boards) return ToolResult::error(error);

    auto params = read_params(args, nullptr, 0);
    if (auto err = kerf::joinery::check(params, false); !err.empty()) {
        return ToolResult::error(err);
    }

    auto placement = kerf::joinery::mortise_tenon(kernel, boards->first, boards->second, params);

    std::ostringstream ss;
    ss << "Mortise on " << geometry::to_string(placement.first) << " face of " << boards->first
       << ", tenon on " << geometry::to_string(placement.second) << " face of " << boards->second;
    return ToolResult::ok(ss.str(), {
        {"mortise_id", boards->first},
        {"tenon_id", boards->second},
        {"mortise_face", geometry::to_string(placement.first)},
        {"tenon_face", geometry::to_string(placement.second)}
    });
}

inline ToolResult create_dovetail(Kernel& kernel, const json& args) {
    std::string error;
    auto boards = find_boards(kernel, args, "tail_id", "tail", "pin_id", "pin", error);
    if (!boards) return ToolResult::error(error);

    auto params = read_params(args, "num_tails", kerf::joinery::DEFAULT_TAILS);
    if (auto err = kerf::joinery::check(params, true); !err.empty()) {
        return ToolResult::error(err);
    }

    auto placement = kerf::joinery::dovetail(kernel, boards->first, boards->second, params);

    std::ostringstream ss;
    ss << params.segments() << " dovetail(s) between " << boards->first << " and " << boards->second
       << " on the " << geometry::to_string(placement.first) << " face";
    return ToolResult::ok(ss.str(), {
        {"tail_id", boards->first},
        {"pin_id", boards->second},
        {"face", geometry::to_string(placement.first)},
        {"tail_width", kerf::joinery::tail_width(params.width, params.segments())}
    });
}

inline ToolResult create_finger_joint(Kernel& kernel, const json& args) {
    std::string error;
    auto boards = find_boards(kernel, args, "board1_id", "board1", "board2_id", "board2", error);
    if (!boards) return ToolResult::error(error);

    auto params = read_params(args, "num_fingers", kerf::joinery::DEFAULT_FINGERS);
    if (auto err = kerf::joinery::check(params, true); !err.empty()) {
        return ToolResult::error(err);
    }

    auto placement = kerf::joinery::finger_joint(kernel, boards->first, boards->second, params);
    auto plan = kerf::joinery::plan_fingers(params.width, params.segments());

    std::ostringstream ss;
    ss << params.segments() << " finger(s) between " << boards->first << " and " << boards->second
       << " on the " << geometry::to_string(placement.first) << " face";
    return ToolResult::ok(ss.str(), {
        {"board1_id", boards->first},
        {"board2_id", boards->second},
        {"face", geometry::to_string(placement.first)},
        {"board1_cuts", plan.board1_cuts.size()},
        {"board2_slots", plan.board2_slots.size()}
    });
}

} // namespace kerf::rpc::tools::joinery
