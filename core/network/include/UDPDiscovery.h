#pragma once

#include "EventBus.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "NodeState.h"
#include "PeerRegistry.h"
#include "Result.h"
#include "SocketGuard.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace PinDrop {

struct DiscoveryOptions {
    int port{12346};
    std::chrono::milliseconds interval{3000};
    std::string broadcastAddress;  // empty = directed /24 broadcast of the local IP
};

/**
 * @brief UDP presence announcements on the LAN
 *
 * Handles:
 * - Periodic broadcast of DISCOVERY:<ip>:<pin>:<instanceId>
 * - Listening for other instances' announcements
 * - Filtering our own announcements out
 *
 * Discovery is informational. Every valid datagram is recorded in the
 * PeerRegistry and published as PEER_DISCOVERED, without deduplication.
 * Errors are logged and never surface as transfer failures.
 */
class UDPDiscovery {
public:
    /**
     * @brief Constructor
     * @param eventBus Bus receiving PEER_DISCOVERED (may be null)
     * @param state Source of our IP, PIN and instance id
     * @param registry Registry updated for every accepted announcement
     * @param options Port, interval and broadcast address
     */
    UDPDiscovery(EventBus* eventBus, NodeState& state, PeerRegistry& registry,
                 DiscoveryOptions options = DiscoveryOptions{});

    ~UDPDiscovery();

    UDPDiscovery(const UDPDiscovery&) = delete;
    UDPDiscovery& operator=(const UDPDiscovery&) = delete;

    /// Start listener and broadcaster; a no-op for halves already running
    pd::Result<void> start();
    void stop();

    pd::Result<void> startListener();
    void stopListener();

    pd::Result<void> startBroadcaster();
    void stopBroadcaster();

    /// Send a single announcement now
    pd::Result<void> broadcastOnce();

    bool isListening() const { return listening_.load(); }
    bool isBroadcasting() const { return broadcasting_.load(); }

    /// Bound discovery port while listening, 0 otherwise
    int getListeningPort() const { return listeningPort_.load(); }

    /// Address announcements are sent to
    std::string broadcastAddress() const;

    /**
     * @brief Handle one received datagram
     * @return true when it was accepted as a peer announcement
     */
    bool handleDatagram(const std::string& message, const std::string& senderIp);

    bool isSelf(const PeerAnnouncement& announcement) const;

    static std::string formatAnnouncement(const std::string& ip, const std::string& pin,
                                          const std::string& instanceId);

    /// DISCOVERY:<ipv4>:<6-digit pin>[:<instanceId>]; nullopt when malformed
    static std::optional<PeerAnnouncement> parseAnnouncement(const std::string& message);

private:
    void listenLoop();
    void broadcastLoop();
    pd::Result<void> sendAnnouncement(const std::string& address, const std::string& message);

    EventBus* eventBus_;
    NodeState& nodeState_;
    PeerRegistry& registry_;
    DiscoveryOptions options_;

    Logger& logger_{Logger::instance()};
    MetricsCollector& metrics_{MetricsCollector::instance()};

    std::mutex listenerMutex_;
    pd::SocketGuard listenSocket_;
    std::atomic<bool> listening_{false};
    std::atomic<int> listeningPort_{0};
    std::thread listenThread_;

    std::mutex broadcasterMutex_;
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
    std::atomic<bool> broadcasting_{false};
    std::thread broadcastThread_;
};

} // namespace PinDrop
