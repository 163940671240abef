// kerfd: modeling command server
//
// Owns the scene and the listener. Each tick polls the socket once,
// answers at most one connection, and checks the stop flag.

#include <kerf/config.hpp>
#include <kerf/log.hpp>
#include <kerf/rpc/handler.hpp>
#include <kerf/scene.hpp>
#include <kerf/socket_server.hpp>
#include <kerf/version.hpp>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace kerf;

namespace {

std::atomic<bool> daemon_running{true};

void daemon_signal_handler(int sig) {
    (void)sig;
    daemon_running = false;
}

const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    std::cerr << "kerfd " << KERF_VERSION << " - modeling command server\n\n"
              << "Usage: " << prog_name(prog) << " [options]\n\n"
              << "Options:\n"
              << "  --host ADDR        Listen address (default: 127.0.0.1)\n"
              << "  --port N           Listen port (default: 9876)\n"
              << "  --tick-ms N        Poll interval in milliseconds (default: 100)\n"
              << "  --export-dir PATH  Directory for exported files (default: $TMPDIR or /tmp)\n"
              << "  --log PATH         Append stdout/stderr to a log file\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n"
              << "  -h, --help         Show this help\n\n"
              << "Environment: KERF_HOST, KERF_PORT, KERF_EXPORT_DIR, KERF_VERBOSE\n";
}

// Redirect stdout/stderr to an append-mode log file
bool redirect_output(const std::string& log_path) {
    int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (log_fd < 0) {
        std::cerr << "[kerfd] Cannot open log " << log_path << ": " << strerror(errno) << "\n";
        return false;
    }
    dup2(log_fd, STDOUT_FILENO);
    dup2(log_fd, STDERR_FILENO);
    close(log_fd);
    return true;
}

bool parse_int(const char* text, int& out) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (*text == '\0' || *end != '\0' || value < 0 || value > 60000) return false;
    out = static_cast<int>(value);
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    ServerConfig config;
    std::string env_error;
    if (!config.apply_env(env_error)) {
        std::cerr << "[kerfd] " << env_error << "\n";
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            config.host = argv[++i];
        } else if (strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            if (!ServerConfig::parse_port(argv[++i], config.port)) {
                std::cerr << "[kerfd] Invalid port: " << argv[i] << "\n";
                return 1;
            }
        } else if (strcmp(argv[i], "--tick-ms") == 0 && i + 1 < argc) {
            if (!parse_int(argv[++i], config.tick_interval_ms)) {
                std::cerr << "[kerfd] Invalid tick interval: " << argv[i] << "\n";
                return 1;
            }
        } else if (strcmp(argv[i], "--export-dir") == 0 && i + 1 < argc) {
            config.export_dir = argv[++i];
        } else if (strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "kerfd " << KERF_VERSION << "\n";
            return 0;
        } else {
            std::cerr << "[kerfd] Unknown option: " << argv[i] << "\n\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!config.log_file.empty() && !redirect_output(config.log_file)) {
        return 1;
    }
    set_verbose(config.verbose);

    Scene scene;
    SocketServer server(config);
    if (!server.start()) {
        std::cerr << "[kerfd] Failed to start server on " << config.host << ":" << config.port << "\n";
        return 1;
    }

    rpc::Handler handler(scene, rpc::HandlerContext{config.resolved_export_dir()});

    std::signal(SIGTERM, daemon_signal_handler);
    std::signal(SIGINT, daemon_signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    std::cerr << "[kerfd] Started (" << server.host() << ":" << server.port()
              << ", tick=" << config.tick_interval_ms << "ms, export="
              << config.resolved_export_dir() << ", pid=" << getpid()
              << (config.verbose ? ", verbose=on" : "") << ")\n";

    size_t total_requests = 0;

    while (daemon_running) {
        auto request = server.poll(config.tick_interval_ms);
        if (!request) continue;

        total_requests++;
        auto handle_start = std::chrono::steady_clock::now();
        std::string response = handler.handle(request->data);
        auto handle_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - handle_start).count();

        log_debug("rpc", "request #%zu len=%zu handled in %ldms (resp_len=%zu)",
                  total_requests, request->data.size(), static_cast<long>(handle_ms),
                  response.size());

        if (!server.respond(*request, response)) {
            std::cerr << "[kerfd] Response to request #" << total_requests << " not delivered\n";
        }
    }

    std::cerr << "[kerfd] Shutting down after " << total_requests << " request(s)\n";
    server.stop();
    return 0;
}
