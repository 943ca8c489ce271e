#pragma once

#include "EventBus.h"
#include "Logger.h"
#include "NodeConfig.h"
#include "NodeState.h"
#include "PeerRegistry.h"
#include "Result.h"
#include "TransferReceiver.h"
#include "TransferSender.h"
#include "TransferTypes.h"
#include "UDPDiscovery.h"
#include <string>
#include <vector>

namespace PinDrop {

/**
 * @brief One PinDrop instance: receiver, sender and discovery together
 *
 * Callers observe progress by subscribing to eventBus() for
 * TRANSFER_EVENT (TransferEvent) and PEER_DISCOVERED (PeerAnnouncement).
 * Every operation returns immediately; wait helpers exist for callers
 * without an event loop.
 */
class PinDropNode {
public:
    PinDropNode(NodeState& state, NodeConfig config);
    ~PinDropNode();

    PinDropNode(const PinDropNode&) = delete;
    PinDropNode& operator=(const PinDropNode&) = delete;

    EventBus& eventBus() { return eventBus_; }
    NodeState& state() { return state_; }
    const NodeConfig& config() const { return config_; }

    /**
     * @brief Start a one-shot receive session
     * @param destinationDirectory Empty uses save_directory
     * @param pin Empty verifies against the node's current PIN
     * @param port Negative uses transfer_port; 0 picks a free port
     */
    pd::Result<void> startListening(const std::string& destinationDirectory = "",
                                    const std::string& pin = "", int port = -1);
    void stopListening();
    pd::Result<TransferReport> waitForReceive();
    int listeningPort() const { return receiver_.getListeningPort(); }
    bool isListening() const { return receiver_.isListening(); }

    /// port <= 0 uses transfer_port
    pd::Result<void> send(const std::string& path, const std::string& address,
                          const std::string& pin, int port = 0);
    void cancelSend();
    pd::Result<TransferReport> waitForSend();
    bool isSending() const { return sender_.isBusy(); }

    pd::Result<std::string> generatePin();
    std::string currentPin() const { return state_.pin(); }

    std::vector<PeerInfo> getDiscoveredPeers() const { return registry_.all(); }

    /// Listener and, unless disabled in NodeState, the periodic broadcaster
    pd::Result<void> startDiscovery();
    pd::Result<void> startDiscoveryListener();
    void stopDiscovery();
    pd::Result<void> announceOnce();

    /// Stops everything; also run by the destructor
    void shutdown();

private:
    NodeState& state_;
    NodeConfig config_;
    Logger& logger_{Logger::instance()};

    EventBus eventBus_;
    PeerRegistry registry_;
    TransferReceiver receiver_;
    TransferSender sender_;
    UDPDiscovery discovery_;
};

} // namespace PinDrop
