#include <kerf/socket_client.hpp>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace kerf {

SocketClient::SocketClient()
    : host_(ServerConfig{}.host), port_(ServerConfig{}.port) {}

SocketClient::SocketClient(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {}

SocketClient::~SocketClient() {
    disconnect();
}

bool SocketClient::connect() {
    if (fd_ >= 0) return true;  // Already connected

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port_);
    int rc = getaddrinfo(host_.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        last_error_ = std::string("getaddrinfo() failed: ") + gai_strerror(rc);
        return false;
    }

    fd_ = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd_ < 0) {
        last_error_ = std::string("socket() failed: ") + strerror(errno);
        freeaddrinfo(res);
        return false;
    }

    // Non-blocking connect so the timeout applies
    int flags = fcntl(fd_, F_GETFL, 0);
    fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

    rc = ::connect(fd_, res->ai_addr, res->ai_addrlen);
    freeaddrinfo(res);

    if (rc < 0 && errno != EINPROGRESS) {
        last_error_ = std::string("connect() failed: ") + strerror(errno);
        disconnect();
        return false;
    }
    if (rc < 0) {
        pollfd pfd = {fd_, POLLOUT, 0};
        int ret = poll(&pfd, 1, CONNECT_TIMEOUT_MS);
        if (ret <= 0) {
            last_error_ = ret == 0 ? "Connect timeout"
                                   : std::string("poll() failed: ") + strerror(errno);
            disconnect();
            return false;
        }
        int err = 0;
        socklen_t len = sizeof(err);
        getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0) {
            last_error_ = std::string("connect() failed: ") + strerror(err);
            disconnect();
            return false;
        }
    }

    fcntl(fd_, F_SETFL, flags);
    return true;
}

void SocketClient::disconnect() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

std::optional<std::string> SocketClient::request(const std::string& line) {
    if (!connect()) {
        return std::nullopt;
    }

    // Send request (newline-delimited)
    std::string msg = line + "\n";
    size_t sent = 0;
    while (sent < msg.size()) {
        ssize_t n = send(fd_, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("send() failed: ") + strerror(errno);
            disconnect();
            return std::nullopt;
        }
        sent += static_cast<size_t>(n);
    }

    // Wait for response
    std::string response;
    pollfd pfd = {fd_, POLLIN, 0};

    while (true) {
        int ret = poll(&pfd, 1, RESPONSE_TIMEOUT_MS);

        if (ret < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("poll() failed: ") + strerror(errno);
            disconnect();
            return std::nullopt;
        }

        if (ret == 0) {
            last_error_ = "Response timeout";
            disconnect();
            return std::nullopt;
        }

        char buf[4096];
        ssize_t n = read(fd_, buf, sizeof(buf));

        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            disconnect();
            // The daemon closes right after writing; an unterminated tail is still the answer
            if (n == 0 && !response.empty()) return response;
            last_error_ = n == 0 ? "Connection closed" :
                          std::string("read() failed: ") + strerror(errno);
            return std::nullopt;
        }

        response.append(buf, static_cast<size_t>(n));
        if (response.size() > MAX_RESPONSE_SIZE) {
            last_error_ = "Response too large";
            disconnect();
            return std::nullopt;
        }

        // Check for complete message (newline)
        size_t pos = response.find('\n');
        if (pos != std::string::npos) {
            disconnect();
            return response.substr(0, pos);
        }
    }
}

} // namespace kerf
