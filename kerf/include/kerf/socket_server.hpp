#pragma once
// Socket Server: loopback TCP listener for line-delimited JSON-RPC
//
// One connection per poll: accept, read one line, let the caller
// produce the response, write it, close. The listening socket is
// non-blocking, so poll() never waits longer than its timeout when
// nobody connects.

#include <kerf/config.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kerf {

// One request line from an accepted connection.
// The connection stays open until respond() or discard().
struct ClientRequest {
    int client_fd = -1;
    std::string data;
};

class SocketServer {
public:
    static constexpr int BACKLOG = 16;

    explicit SocketServer(const ServerConfig& config);
    SocketServer(std::string host, uint16_t port);
    ~SocketServer();

    // Non-copyable, non-movable (owns file descriptor)
    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;
    SocketServer(SocketServer&&) = delete;
    SocketServer& operator=(SocketServer&&) = delete;

    // Lifecycle. start() is a no-op when already listening.
    bool start();
    void stop();
    bool running() const { return server_fd_ >= 0; }

    // Wait up to timeout_ms for a connection and read its request line.
    // Connections that close without data, time out mid-line or exceed the
    // line limit are closed here and yield nullopt.
    std::optional<ClientRequest> poll(int timeout_ms = 100);

    // Write response + "\n" and close the connection
    bool respond(ClientRequest& request, const std::string& response);

    // Close without responding
    void discard(ClientRequest& request);

    // Bound port (the actual one when configured with port 0)
    uint16_t port() const { return port_; }
    const std::string& host() const { return host_; }

private:
    std::string host_;
    uint16_t port_;
    int receive_timeout_ms_ = 5000;
    size_t max_line_size_ = 16 * 1024 * 1024;
    int server_fd_ = -1;

    bool create_socket();
    std::optional<std::string> read_line(int fd);
};

} // namespace kerf
