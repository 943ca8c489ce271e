#pragma once

/**
 * @file SocketGuard.h
 * @brief Scoped ownership of the TCP and UDP sockets PinDrop opens
 *
 * A socket held here is closed on every exit path: success, early
 * connection loss or cancellation.
 */

#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace pd {

/**
 * @brief Move-only owner of one socket descriptor
 *
 * shutdownBoth() may be called from another thread to unblock a pending
 * recv/send/accept; the owning thread still closes the descriptor.
 */
class SocketGuard {
public:
    SocketGuard() noexcept = default;
    explicit SocketGuard(int fd) noexcept : fd_(fd) {}

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    ~SocketGuard() { reset(); }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    /// Closes the held socket, then holds fd
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    void shutdownBoth() const noexcept {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

private:
    int fd_{-1};
};

} // namespace pd
