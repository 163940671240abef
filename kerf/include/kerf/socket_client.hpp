#pragma once
// Socket Client: one-shot TCP client for the kerf daemon
//
// The daemon answers one line per connection and then closes, so every
// request() opens its own connection.

#include <kerf/config.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kerf {

class SocketClient {
public:
    static constexpr int CONNECT_TIMEOUT_MS = 5000;
    static constexpr int RESPONSE_TIMEOUT_MS = 300000;  // long booleans block the daemon
    static constexpr size_t MAX_RESPONSE_SIZE = 16 * 1024 * 1024;

    SocketClient();
    SocketClient(std::string host, uint16_t port);
    ~SocketClient();

    // Non-copyable, non-movable (owns file descriptor)
    SocketClient(const SocketClient&) = delete;
    SocketClient& operator=(const SocketClient&) = delete;
    SocketClient(SocketClient&&) = delete;
    SocketClient& operator=(SocketClient&&) = delete;

    // Connect, send one line, wait for one line back, disconnect
    std::optional<std::string> request(const std::string& line);

    // Error message from last failed operation
    const std::string& last_error() const { return last_error_; }

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    std::string host_;
    uint16_t port_;
    int fd_ = -1;
    std::string last_error_;

    bool connect();
    void disconnect();
};

} // namespace kerf
