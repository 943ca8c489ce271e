#include "NetUtils.h"
#include "Constants.h"
#include "Logger.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace PinDrop {

namespace {

pd::ErrorCode mapConnectErrno(int err) {
    switch (err) {
        case ECONNREFUSED: return pd::ErrorCode::ConnectionRefused;
        case ETIMEDOUT: return pd::ErrorCode::Timeout;
        default: return pd::ErrorCode::ConnectionFailed;
    }
}

bool stopRequested(const std::atomic<bool>* stop) {
    return stop && stop->load();
}

} // namespace

std::string NetUtils::detectLocalIp() {
    auto& logger = Logger::instance();

    pd::SocketGuard sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (sock) {
        struct sockaddr_in route;
        std::memset(&route, 0, sizeof(route));
        route.sin_family = AF_INET;
        route.sin_port = htons(80);
        inet_pton(AF_INET, pd::config::ROUTE_PROBE_ADDRESS, &route.sin_addr);

        // connect() on a datagram socket only selects a route
        if (::connect(sock.get(), (struct sockaddr*)&route, sizeof(route)) == 0) {
            struct sockaddr_in local;
            socklen_t len = sizeof(local);
            if (::getsockname(sock.get(), (struct sockaddr*)&local, &len) == 0) {
                char buf[INET_ADDRSTRLEN];
                if (inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf)) &&
                    local.sin_addr.s_addr != htonl(INADDR_ANY)) {
                    return std::string(buf);
                }
            }
        } else {
            logger.log(LogLevel::DEBUG, "No default route: " + std::string(strerror(errno)), "NetUtils");
        }
    }

    char hostname[256];
    if (::gethostname(hostname, sizeof(hostname)) == 0) {
        hostname[sizeof(hostname) - 1] = '\0';
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        struct addrinfo* res = nullptr;
        if (::getaddrinfo(hostname, nullptr, &hints, &res) == 0 && res) {
            char buf[INET_ADDRSTRLEN];
            auto* addr = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
            std::string ip = inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf)) ? buf : "";
            ::freeaddrinfo(res);
            if (!ip.empty()) {
                return ip;
            }
        }
    }

    logger.log(LogLevel::WARN, "Could not determine local IP, using loopback", "NetUtils");
    return "127.0.0.1";
}

std::string NetUtils::directedBroadcast(const std::string& ip) {
    struct in_addr addr;
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
        return pd::config::LIMITED_BROADCAST_ADDRESS;
    }
    uint32_t host = ntohl(addr.s_addr);
    addr.s_addr = htonl(host | 0x000000ffu);

    char buf[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf))) {
        return pd::config::LIMITED_BROADCAST_ADDRESS;
    }
    return std::string(buf);
}

bool NetUtils::isValidIpv4(const std::string& text) {
    struct in_addr addr;
    return inet_pton(AF_INET, text.c_str(), &addr) == 1;
}

NetUtils::WaitResult NetUtils::waitFor(int fd, short events, Clock::time_point deadline,
                                       const std::atomic<bool>* stop) {
    while (true) {
        if (stopRequested(stop)) {
            return WaitResult::Stopped;
        }
        auto now = Clock::now();
        if (now >= deadline) {
            return WaitResult::TimedOut;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int slice = static_cast<int>(std::min<long long>(remaining + 1, pd::config::POLL_SLICE_MS));

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;

        int rc = ::poll(&pfd, 1, slice);
        if (rc > 0) {
            if (pfd.revents & POLLNVAL) {
                return WaitResult::Error;
            }
            // POLLHUP/POLLERR are reported as ready; the following I/O call sees the error
            return WaitResult::Ready;
        }
        if (rc < 0 && errno != EINTR) {
            return WaitResult::Error;
        }
    }
}

pd::Result<pd::SocketGuard> NetUtils::connectWithTimeout(const std::string& address, int port,
                                                         std::chrono::milliseconds timeout,
                                                         const std::atomic<bool>* stop) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return pd::Err<pd::SocketGuard>(pd::ErrorCode::InvalidAddress, "Invalid address: " + address);
    }

    pd::SocketGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        return pd::Err<pd::SocketGuard>(pd::ErrorCode::ConnectionFailed,
                                        "Failed to create socket: " + std::string(strerror(errno)));
    }

    int flags = ::fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return pd::Err<pd::SocketGuard>(pd::ErrorCode::ConnectionFailed,
                                        "Failed to set non-blocking mode: " + std::string(strerror(errno)));
    }

    std::string target = address + ":" + std::to_string(port);
    if (::connect(sock.get(), (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            int err = errno;
            return pd::Err<pd::SocketGuard>(mapConnectErrno(err),
                                            "Failed to connect to " + target + ": " + strerror(err));
        }

        auto deadline = Clock::now() + timeout;
        switch (waitFor(sock.get(), POLLOUT, deadline, stop)) {
            case WaitResult::Ready:
                break;
            case WaitResult::TimedOut:
                return pd::Err<pd::SocketGuard>(pd::ErrorCode::Timeout,
                                                "Connection to " + target + " timed out after " +
                                                std::to_string(timeout.count()) + "ms");
            case WaitResult::Stopped:
                return pd::Err<pd::SocketGuard>(pd::ErrorCode::Cancelled, "Connect cancelled");
            case WaitResult::Error:
                return pd::Err<pd::SocketGuard>(pd::ErrorCode::ConnectionFailed,
                                                "Failed waiting for connection: " + std::string(strerror(errno)));
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
            soError = errno;
        }
        if (soError != 0) {
            return pd::Err<pd::SocketGuard>(mapConnectErrno(soError),
                                            "Failed to connect to " + target + ": " + strerror(soError));
        }
    }

    if (::fcntl(sock.get(), F_SETFL, flags) < 0) {
        return pd::Err<pd::SocketGuard>(pd::ErrorCode::ConnectionFailed,
                                        "Failed to restore blocking mode: " + std::string(strerror(errno)));
    }

    return pd::Result<pd::SocketGuard>(std::move(sock));
}

pd::Result<void> NetUtils::sendExact(int fd, const void* data, std::size_t len,
                                     Clock::time_point deadline, const std::atomic<bool>* stop) {
    const auto* p = static_cast<const uint8_t*>(data);
    std::size_t sent = 0;

    while (sent < len) {
        switch (waitFor(fd, POLLOUT, deadline, stop)) {
            case WaitResult::Ready:
                break;
            case WaitResult::TimedOut:
                return pd::Err(pd::ErrorCode::TransferTimeout, "Timed out while sending");
            case WaitResult::Stopped:
                return pd::Err(pd::ErrorCode::Cancelled);
            case WaitResult::Error:
                return pd::Err(pd::ErrorCode::ConnectionFailed, "poll failed: " + std::string(strerror(errno)));
        }

        ssize_t n = ::send(fd, p + sent, len - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            int err = errno;
            if (stopRequested(stop)) {
                return pd::Err(pd::ErrorCode::Cancelled);
            }
            return pd::Err(pd::ErrorCode::ConnectionFailed, "Send failed: " + std::string(strerror(err)));
        }
        sent += static_cast<std::size_t>(n);
    }
    return pd::Ok();
}

pd::Result<void> NetUtils::recvExact(int fd, void* data, std::size_t len,
                                     Clock::time_point deadline, const std::atomic<bool>* stop,
                                     std::size_t* received) {
    auto* p = static_cast<uint8_t*>(data);
    std::size_t got = 0;
    auto report = [&]() {
        if (received) *received = got;
    };

    while (got < len) {
        switch (waitFor(fd, POLLIN, deadline, stop)) {
            case WaitResult::Ready:
                break;
            case WaitResult::TimedOut:
                report();
                return pd::Err(pd::ErrorCode::TransferTimeout, "Timed out while receiving");
            case WaitResult::Stopped:
                report();
                return pd::Err(pd::ErrorCode::Cancelled);
            case WaitResult::Error:
                report();
                return pd::Err(pd::ErrorCode::ConnectionFailed, "poll failed: " + std::string(strerror(errno)));
        }

        ssize_t n = ::recv(fd, p + got, len - got, MSG_DONTWAIT);
        if (n == 0) {
            report();
            if (stopRequested(stop)) {
                return pd::Err(pd::ErrorCode::Cancelled);
            }
            return pd::Err(pd::ErrorCode::IncompleteTransfer,
                           "Connection closed after " + std::to_string(got) + " of " +
                           std::to_string(len) + " bytes");
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            int err = errno;
            report();
            if (stopRequested(stop)) {
                return pd::Err(pd::ErrorCode::Cancelled);
            }
            if (err == ECONNRESET) {
                return pd::Err(pd::ErrorCode::IncompleteTransfer,
                               "Connection reset after " + std::to_string(got) + " of " +
                               std::to_string(len) + " bytes");
            }
            return pd::Err(pd::ErrorCode::ConnectionFailed, "Receive failed: " + std::string(strerror(err)));
        }
        got += static_cast<std::size_t>(n);
    }
    report();
    return pd::Ok();
}

pd::Result<void> NetUtils::waitForPeerClose(int fd, Clock::time_point deadline,
                                            const std::atomic<bool>* stop) {
    char scratch[512];

    while (true) {
        switch (waitFor(fd, POLLIN, deadline, stop)) {
            case WaitResult::Ready:
                break;
            case WaitResult::TimedOut:
                return pd::Err(pd::ErrorCode::TransferTimeout, "Timed out waiting for receiver to finish");
            case WaitResult::Stopped:
                return pd::Err(pd::ErrorCode::Cancelled);
            case WaitResult::Error:
                return pd::Err(pd::ErrorCode::ConnectionFailed, "poll failed: " + std::string(strerror(errno)));
        }

        ssize_t n = ::recv(fd, scratch, sizeof(scratch), MSG_DONTWAIT);
        if (n == 0) {
            if (stopRequested(stop)) {
                return pd::Err(pd::ErrorCode::Cancelled);
            }
            return pd::Ok();
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            int err = errno;
            if (stopRequested(stop)) {
                return pd::Err(pd::ErrorCode::Cancelled);
            }
            if (err == ECONNRESET) {
                return pd::Err(pd::ErrorCode::ConnectionFailed, "Connection reset by peer");
            }
            return pd::Err(pd::ErrorCode::ConnectionFailed, "Receive failed: " + std::string(strerror(err)));
        }
    }
}

int NetUtils::boundPort(int fd) {
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, (struct sockaddr*)&addr, &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::string NetUtils::peerAddress(int fd) {
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (::getpeername(fd, (struct sockaddr*)&addr, &len) < 0) {
        return "unknown";
    }
    char buf[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf))) {
        return "unknown";
    }
    return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
}

} // namespace PinDrop
