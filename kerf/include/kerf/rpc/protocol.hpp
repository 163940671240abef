#pragma once
// RPC Protocol: line codec, JSON-RPC envelopes and error codes
//
// One JSON object per line in both directions. Every error envelope
// carries data.success = false. When a line does not parse, the request
// id is recovered from the raw text where possible so the client can
// still correlate the response.

#include <kerf/version.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>

namespace kerf::rpc {

using json = nlohmann::json;

// Sanitize string to valid UTF-8, replacing invalid bytes with U+FFFD
inline std::string sanitize_utf8(const std::string& input) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";

    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        size_t len = c < 0x80 ? 1
                   : (c & 0xE0) == 0xC0 ? 2
                   : (c & 0xF0) == 0xE0 ? 3
                   : (c & 0xF8) == 0xF0 ? 4
                   : 0;

        bool ok = len > 0 && i + len <= input.size();
        for (size_t k = 1; ok && k < len; ++k) {
            ok = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
        }

        if (ok) {
            output.append(input, i, len);
            i += len;
        } else {
            output += REPLACEMENT;
            ++i;
        }
    }
    return output;
}

// JSON-RPC 2.0 error codes
namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INTERNAL_ERROR = -32603;
}

// Build a JSON-RPC success response
inline json make_result(const json& id, const json& result,
                        const std::string& jsonrpc = version::jsonrpc()) {
    return {
        {"jsonrpc", jsonrpc},
        {"id", id},
        {"result", result}
    };
}

// Build a JSON-RPC error response
inline json make_error(const json& id, int code, const std::string& message,
                       const std::string& jsonrpc = version::jsonrpc()) {
    return {
        {"jsonrpc", jsonrpc},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", sanitize_utf8(message)},
            {"data", {{"success", false}}}
        }}
    };
}

// Build a tool call result (content format plus flat success fields)
inline json make_tool_response(const json& structured) {
    json content = json::array();
    content.push_back({
        {"type", "text"},
        {"text", structured.dump(-1, ' ', false, json::error_handler_t::replace)}
    });

    json response = {
        {"content", content},
        {"isError", false},
        {"success", true}
    };

    if (structured.is_object() && structured.contains("id")) {
        response["resourceId"] = structured["id"];
    }
    if (!structured.is_null()) {
        response["structured"] = structured;
    }
    return response;
}

// Integer id from text that failed to parse as JSON; null if none found.
// Takes the first "id" key followed by a colon and an integer.
inline json recover_id(const std::string& raw) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };

    static const std::string KEY = "\"id\"";
    for (size_t at = raw.find(KEY); at != std::string::npos; at = raw.find(KEY, at + 1)) {
        size_t i = at + KEY.size();
        while (i < raw.size() && is_space(raw[i])) ++i;
        if (i >= raw.size() || raw[i] != ':') continue;
        ++i;
        while (i < raw.size() && is_space(raw[i])) ++i;

        size_t start = i;
        if (i < raw.size() && raw[i] == '-') ++i;
        size_t digits = i;
        while (i < raw.size() && is_digit(raw[i])) ++i;
        if (i == digits) continue;

        errno = 0;
        long long id = std::strtoll(raw.substr(start, i - start).c_str(), nullptr, 10);
        if (errno == ERANGE) return json();
        return json(id);
    }
    return json();
}

// Result of decoding one request line
struct Decoded {
    std::optional<json> envelope;  // Set when the line is a JSON object
    json id;                       // Recovered id when the envelope is missing
    std::string error;
};

inline Decoded decode_line(const std::string& line) {
    Decoded out;
    try {
        json value = json::parse(line);
        if (value.is_object()) {
            out.envelope = std::move(value);
            return out;
        }
        out.error = "Parse error: request is not a JSON object";
    } catch (const json::parse_error& e) {
        out.error = std::string("Parse error: ") + e.what();
    }
    out.id = recover_id(line);
    return out;
}

// Serialize a response, without the line terminator
inline std::string encode(const json& response) {
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace kerf::rpc
