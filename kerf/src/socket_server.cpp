#include <kerf/socket_server.hpp>
#include <kerf/log.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

namespace kerf {

SocketServer::SocketServer(const ServerConfig& config)
    : host_(config.host),
      port_(config.port),
      receive_timeout_ms_(config.receive_timeout_ms),
      max_line_size_(config.max_line_size) {}

SocketServer::SocketServer(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::start() {
    if (server_fd_ >= 0) return true;  // Already running

    if (!create_socket()) {
        return false;
    }

    std::cerr << "[socket_server] Listening on " << host_ << ":" << port_ << "\n";
    return true;
}

void SocketServer::stop() {
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        std::cerr << "[socket_server] Stopped\n";
    }
}

bool SocketServer::create_socket() {
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        std::cerr << "[socket_server] socket() failed: " << strerror(errno) << "\n";
        return false;
    }

    // Allow an immediate rebind after stop()
    int reuse = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    // Set non-blocking
    int flags = fcntl(server_fd_, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(server_fd_, F_SETFL, flags | O_NONBLOCK);
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        std::cerr << "[socket_server] Invalid listen address: " << host_ << "\n";
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "[socket_server] bind() failed: " << strerror(errno) << "\n";
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, BACKLOG) < 0) {
        std::cerr << "[socket_server] listen() failed: " << strerror(errno) << "\n";
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Pick up the kernel-assigned port when bound to port 0
    socklen_t len = sizeof(addr);
    if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    return true;
}

std::optional<ClientRequest> SocketServer::poll(int timeout_ms) {
    if (server_fd_ < 0) return std::nullopt;

    pollfd pfd = {server_fd_, POLLIN, 0};
    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno != EINTR) {
            std::cerr << "[socket_server] poll() error: " << strerror(errno) << "\n";
        }
        return std::nullopt;
    }
    if (ret == 0 || !(pfd.revents & POLLIN)) return std::nullopt;  // Timeout

    int client_fd = accept(server_fd_, nullptr, nullptr);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::cerr << "[socket_server] accept() error: " << strerror(errno) << "\n";
        }
        return std::nullopt;
    }

    // Blocking reads bounded by the receive timeout
    int flags = fcntl(client_fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(client_fd, F_SETFL, flags & ~O_NONBLOCK);
    }
    struct timeval tv;
    tv.tv_sec = receive_timeout_ms_ / 1000;
    tv.tv_usec = (receive_timeout_ms_ % 1000) * 1000;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    log_debug("socket_server", "client connected (fd=%d)", client_fd);

    auto line = read_line(client_fd);
    if (!line) {
        close(client_fd);
        return std::nullopt;
    }
    return ClientRequest{client_fd, std::move(*line)};
}

std::optional<std::string> SocketServer::read_line(int fd) {
    std::string buffer;
    char buf[4096];

    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            buffer.append(buf, static_cast<size_t>(n));

            size_t pos = buffer.find('\n');
            if (pos != std::string::npos) {
                buffer.resize(pos);
                break;
            }
            if (buffer.size() > max_line_size_) {
                std::cerr << "[socket_server] Client message too large, closing\n";
                return std::nullopt;
            }
            continue;
        }
        if (n == 0) {
            // Peer closed: a final unterminated line still counts
            if (buffer.empty()) {
                log_debug("socket_server", "client closed without data (fd=%d)", fd);
                return std::nullopt;
            }
            break;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            std::cerr << "[socket_server] Receive timeout, closing\n";
        } else {
            std::cerr << "[socket_server] read() failed: " << strerror(errno) << "\n";
        }
        return std::nullopt;
    }

    if (!buffer.empty() && buffer.back() == '\r') buffer.pop_back();
    return buffer;
}

bool SocketServer::respond(ClientRequest& request, const std::string& response) {
    if (request.client_fd < 0) return false;

    std::string msg = response + "\n";
    size_t sent = 0;
    bool ok = true;
    while (sent < msg.size()) {
        ssize_t n = send(request.client_fd, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[socket_server] send() failed: " << strerror(errno) << "\n";
            ok = false;
            break;
        }
        sent += static_cast<size_t>(n);
    }

    discard(request);
    return ok;
}

void SocketServer::discard(ClientRequest& request) {
    if (request.client_fd >= 0) {
        close(request.client_fd);
        log_debug("socket_server", "client closed (fd=%d)", request.client_fd);
        request.client_fd = -1;
    }
}

} // namespace kerf
