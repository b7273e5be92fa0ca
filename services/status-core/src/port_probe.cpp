/**
 * @file port_probe.cpp
 * @brief Non-blocking TCP connect probe
 */

#include "fdr/status/port_probe.h"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>

namespace fdr::status {

namespace {

/// Closes the descriptor on scope exit
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

/**
 * @brief Attempt one connect within the deadline
 * @return true if the connection was established
 */
bool connectWithin(const sockaddr_in& addr, std::chrono::steady_clock::time_point deadline) {
    SocketGuard sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (sock.get() < 0) {
        spdlog::debug("[PortProbe] socket() failed: {}", std::strerror(errno));
        return false;
    }

    int flags = ::fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        spdlog::debug("[PortProbe] fcntl(O_NONBLOCK) failed: {}", std::strerror(errno));
        return false;
    }

    int rc = ::connect(sock.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (rc == 0) {
        return true;
    }
    if (errno != EINPROGRESS) {
        return false;
    }

    struct pollfd pfd;
    pfd.fd = sock.get();
    pfd.events = POLLOUT;
    pfd.revents = 0;

    while (true) {
        int waitMs = remainingMs(deadline);
        if (waitMs <= 0) {
            return false;
        }
        rc = ::poll(&pfd, 1, waitMs);
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        break;
    }

    if (rc <= 0) {
        return false;  // timeout or poll error
    }

    int soError = 0;
    socklen_t len = sizeof(soError);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
        return false;
    }
    return soError == 0;
}

} // namespace

sockaddr_in loopbackEndpoint(int port) {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(static_cast<uint16_t>(port));
    return addr;
}

bool probePort(int port, int timeoutMs) {
    if (port <= 0 || port > 65535) {
        spdlog::debug("[PortProbe] Invalid port {}, treating as available", port);
        return true;
    }
    if (timeoutMs <= 0) {
        timeoutMs = DEFAULT_PROBE_TIMEOUT_MS;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    bool connected = connectWithin(loopbackEndpoint(port), deadline);

    spdlog::trace("[PortProbe] localhost:{} {}", port, connected ? "in use" : "free");
    return !connected;
}

ProbeFn makeTcpProbe(int timeoutMs) {
    return [timeoutMs](int port) { return probePort(port, timeoutMs); };
}

} // namespace fdr::status
