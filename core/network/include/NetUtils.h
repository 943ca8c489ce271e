#pragma once

#include "Result.h"
#include "SocketGuard.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace PinDrop {

/**
 * @brief Socket helpers shared by the transfer and discovery components
 *
 * All blocking helpers wait in poll() slices of POLL_SLICE_MS and give up
 * when the deadline passes or the stop flag becomes true, so a controlling
 * thread can always interrupt them.
 */
class NetUtils {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Best guess at this host's LAN address
     *
     * Routes a UDP socket towards a public address (no packet is sent) and
     * reads the chosen source address. Falls back to the hostname lookup,
     * then to 127.0.0.1.
     */
    static std::string detectLocalIp();

    /// Directed /24 broadcast for an IPv4 address (10.0.0.7 -> 10.0.0.255)
    static std::string directedBroadcast(const std::string& ip);

    /// Dotted-quad IPv4 check
    static bool isValidIpv4(const std::string& text);

    /**
     * @brief Connect with a bounded wait
     *
     * Maps ECONNREFUSED to ConnectionRefused, an expired wait to Timeout
     * and anything else to ConnectionFailed. Returns Cancelled when the
     * stop flag is raised while waiting.
     */
    static pd::Result<pd::SocketGuard> connectWithTimeout(const std::string& address, int port,
                                                          std::chrono::milliseconds timeout,
                                                          const std::atomic<bool>* stop = nullptr);

    /**
     * @brief Send every byte of data before the deadline
     *
     * Errors: TransferTimeout, Cancelled, ConnectionFailed.
     */
    static pd::Result<void> sendExact(int fd, const void* data, std::size_t len,
                                      Clock::time_point deadline,
                                      const std::atomic<bool>* stop = nullptr);

    /**
     * @brief Receive exactly len bytes before the deadline
     *
     * Errors: IncompleteTransfer when the peer closes first, plus the
     * errors of sendExact(). The number of bytes read before the failure is
     * stored in *received when given.
     */
    static pd::Result<void> recvExact(int fd, void* data, std::size_t len,
                                      Clock::time_point deadline,
                                      const std::atomic<bool>* stop = nullptr,
                                      std::size_t* received = nullptr);

    /**
     * @brief Wait until the peer closes its side of the connection
     *
     * Used by the sender after its final byte. Any data the peer sends is
     * discarded. A reset is reported as ConnectionFailed.
     */
    static pd::Result<void> waitForPeerClose(int fd, Clock::time_point deadline,
                                             const std::atomic<bool>* stop = nullptr);

    /// Local port a socket is bound to, 0 on failure
    static int boundPort(int fd);

    /// Textual peer address of a connected socket
    static std::string peerAddress(int fd);

private:
    enum class WaitResult { Ready, TimedOut, Stopped, Error };

    static WaitResult waitFor(int fd, short events, Clock::time_point deadline,
                              const std::atomic<bool>* stop);
};

} // namespace PinDrop
