#pragma once
// Server configuration
//
// Defaults, then KERF_* environment overrides, then command-line flags
// (applied by the daemon's argument parser).

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace kerf {

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 9876;
    int tick_interval_ms = 100;        // Poll cadence of the listener loop
    int receive_timeout_ms = 5000;     // Upper bound for reading one request line
    size_t max_line_size = 16 * 1024 * 1024;
    std::string export_dir;            // Empty = $TMPDIR or /tmp
    std::string log_file;              // Empty = stderr
    bool verbose = false;

    std::string resolved_export_dir() const {
        if (!export_dir.empty()) return export_dir;
        if (const char* tmp = std::getenv("TMPDIR")) {
            if (*tmp) return tmp;
        }
        return "/tmp";
    }

    // Apply KERF_HOST, KERF_PORT, KERF_EXPORT_DIR, KERF_VERBOSE
    // Returns false if a value is present but unusable
    bool apply_env(std::string& error) {
        if (const char* host_env = std::getenv("KERF_HOST")) {
            if (*host_env) host = host_env;
        }
        if (const char* port_env = std::getenv("KERF_PORT")) {
            if (!parse_port(port_env, port)) {
                error = std::string("Invalid KERF_PORT: ") + port_env;
                return false;
            }
        }
        if (const char* dir_env = std::getenv("KERF_EXPORT_DIR")) {
            if (*dir_env) export_dir = dir_env;
        }
        if (const char* verbose_env = std::getenv("KERF_VERBOSE")) {
            std::string v = verbose_env;
            verbose = (v == "1" || v == "true" || v == "yes");
        }
        return true;
    }

    static bool parse_port(const std::string& text, uint16_t& out) {
        if (text.empty()) return false;
        char* end = nullptr;
        long value = std::strtol(text.c_str(), &end, 10);
        if (*end != '\0' || value < 0 || value > 65535) return false;
        out = static_cast<uint16_t>(value);
        return true;
    }
};

} // namespace kerf
