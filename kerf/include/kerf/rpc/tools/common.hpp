#pragma once
// RPC Tool helpers: argument reading and entity lookup
//
// Helpers return a message instead of throwing for the validation
// failures a client can fix. Wrong JSON types in optional numeric
// arguments surface as json::type_error from args.value(), which the
// dispatcher reports like any other tool failure.

#include "../types.hpp"
#include "../../kernel.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace kerf::rpc::tools {

using json = nlohmann::json;

// Returns empty string if all required params present, otherwise error message
inline std::string validate_required(const json& params, std::initializer_list<const char*> required) {
    for (const char* key : required) {
        if (!params.contains(key) || params[key].is_null()) {
            return std::string("Missing required parameter: ") + key;
        }
    }
    return "";
}

// Entity id from a number or a numeric string; quote characters around
// the digits (as in "\"42\"" or "'42'") are stripped first
inline std::optional<EntityId> parse_id(const json& value) {
    if (value.is_number_integer()) {
        return value.get<EntityId>();
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::floor(d) != d) return std::nullopt;
        // 2^63 itself is out of range; the lower bound is exact
        if (d < static_cast<double>(std::numeric_limits<EntityId>::min()) ||
            d >= static_cast<double>(std::numeric_limits<EntityId>::max())) {
            return std::nullopt;
        }
        return static_cast<EntityId>(d);
    }
    if (!value.is_string()) return std::nullopt;

    std::string text = value.get<std::string>();
    auto strip = [](char c) {
        return c == '"' || c == '\'' || std::isspace(static_cast<unsigned char>(c));
    };
    while (!text.empty() && strip(text.front())) text.erase(text.begin());
    while (!text.empty() && strip(text.back())) text.pop_back();
    if (text.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long long id = std::strtoll(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) return std::nullopt;
    return static_cast<EntityId>(id);
}

// Reads [x, y, z] into `out` when present. Leaves `out` alone if absent.
inline bool read_vec3(const json& args, const char* key, Vec3& out, std::string& error) {
    if (!args.contains(key) || args[key].is_null()) return true;

    const json& v = args[key];
    if (!v.is_array() || v.size() != 3 ||
        !v[0].is_number() || !v[1].is_number() || !v[2].is_number()) {
        error = std::string("Parameter '") + key + "' must be an array of 3 numbers";
        return false;
    }
    out = Vec3(v[0].get<double>(), v[1].get<double>(), v[2].get<double>());
    return true;
}

// Reads a number into `out` when present, as a double so that values
// beyond int range reach the caller's range check intact
inline bool read_number(const json& args, const char* key, double& out, std::string& error) {
    if (!args.contains(key) || args[key].is_null()) return true;

    const json& v = args[key];
    if (!v.is_number()) {
        error = std::string("Parameter '") + key + "' must be a number";
        return false;
    }
    out = v.get<double>();
    return true;
}

// Resolves a group argument. On failure `error` names the role.
inline std::optional<EntityId> find_group(const Kernel& kernel, const json& args,
                                          const char* key, const char* role,
                                          std::string& error) {
    if (!args.contains(key) || args[key].is_null()) {
        error = std::string("Missing required parameter: ") + key;
        return std::nullopt;
    }
    auto id = parse_id(args[key]);
    if (!id || !kernel.valid(*id)) {
        error = std::string("Entity not found: ") + role;
        return std::nullopt;
    }
    if (kernel.kind(*id) != EntityKind::Group) {
        error = std::string("Entity is not a group or component: ") + role;
        return std::nullopt;
    }
    return id;
}

inline json vec3_json(const Vec3& v) {
    return json::array({v.x(), v.y(), v.z()});
}

inline json bounds_json(const Bounds& b) {
    return {
        {"min", vec3_json(b.min)},
        {"max", vec3_json(b.max)}
    };
}

} // namespace kerf::rpc::tools
