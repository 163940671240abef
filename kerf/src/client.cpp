// kerf - thin command-line client for kerfd
//
// Usage:
//   kerf <tool> [--key value ...]
//   kerf --raw '<json line>'
//
// Values are parsed as JSON when they parse (numbers, arrays, booleans),
// otherwise passed as strings. One request, one connection.

#include <kerf/config.hpp>
#include <kerf/socket_client.hpp>
#include <kerf/version.hpp>
#include <nlohmann/json.hpp>
#include <cstring>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <tool> [--key value ...] [options]\n"
              << "       " << prog << " --raw '<json>'\n\n"
              << "Tools:\n"
              << "  create_component  delete_component  transform_component\n"
              << "  get_selection     export            set_material\n"
              << "  boolean_operation chamfer_edges     fillet_edges\n"
              << "  create_mortise_tenon create_dovetail create_finger_joint\n\n"
              << "Options:\n"
              << "  --host ADDR   Server address (default: 127.0.0.1)\n"
              << "  --port N      Server port (default: 9876)\n"
              << "  --json        Print the full response envelope\n"
              << "  --raw JSON    Send a request line as-is\n"
              << "  --help        Show this help message\n\n"
              << "Example:\n"
              << "  " << prog << " create_component --type cube --dimensions '[10,10,10]'\n";
}

json parse_value(const std::string& text) {
    json value = json::parse(text, nullptr, false);
    if (value.is_discarded()) return text;
    return value;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    kerf::ServerConfig config;
    std::string env_error;
    if (!config.apply_env(env_error)) {
        std::cerr << "[kerf] " << env_error << "\n";
        return 1;
    }

    std::string tool;
    std::string raw;
    bool print_json = false;
    json arguments = json::object();

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--version") == 0) {
            std::cout << "kerf " << KERF_VERSION << "\n";
            return 0;
        } else if (strcmp(argv[i], "--json") == 0) {
            print_json = true;
        } else if (strcmp(argv[i], "--raw") == 0 && i + 1 < argc) {
            raw = argv[++i];
        } else if (strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            config.host = argv[++i];
        } else if (strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            if (!kerf::ServerConfig::parse_port(argv[++i], config.port)) {
                std::cerr << "[kerf] Invalid port: " << argv[i] << "\n";
                return 1;
            }
        } else if (strncmp(argv[i], "--", 2) == 0 && i + 1 < argc) {
            std::string key = argv[i] + 2;
            arguments[key] = parse_value(argv[++i]);
        } else if (tool.empty() && argv[i][0] != '-') {
            tool = argv[i];
        } else {
            std::cerr << "[kerf] Unexpected argument: " << argv[i] << "\n\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (tool.empty() && raw.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::string line = raw;
    if (line.empty()) {
        json request = {
            {"jsonrpc", kerf::version::jsonrpc()},
            {"id", 1},
            {"method", "tools/call"},
            {"params", {{"name", tool}, {"arguments", arguments}}}
        };
        line = request.dump();
    }

    kerf::SocketClient client(config.host, config.port);
    auto response = client.request(line);
    if (!response) {
        std::cerr << "[kerf] Request failed: " << client.last_error() << "\n";
        return 1;
    }

    if (print_json) {
        std::cout << *response << "\n";
    }

    json envelope = json::parse(*response, nullptr, false);
    if (envelope.is_discarded()) {
        std::cerr << "[kerf] Malformed response\n";
        if (!print_json) std::cout << *response << "\n";
        return 1;
    }

    if (envelope.contains("error")) {
        const json& err = envelope["error"];
        std::cerr << "Error " << err.value("code", 0) << ": "
                  << err.value("message", std::string("unknown")) << "\n";
        return 1;
    }

    if (!print_json) {
        const json& result = envelope.value("result", json::object());
        if (result.contains("content") && result["content"].is_array()
            && !result["content"].empty()
            && result["content"][0].contains("text")) {
            std::cout << result["content"][0]["text"].get<std::string>() << "\n";
        } else {
            std::cout << result.dump(2) << "\n";
        }
    }
    return 0;
}
