#include "PinDropNode.h"
#include "PinCode.h"
#include <utility>

namespace PinDrop {

PinDropNode::PinDropNode(NodeState& state, NodeConfig config)
    : state_(state)
    , config_(std::move(config))
    , receiver_(&eventBus_, state_, config_.limits())
    , sender_(&eventBus_, config_.limits())
    , discovery_(&eventBus_, state_, registry_, config_.discoveryOptions())
{
    logger_.log(LogLevel::INFO, "Local IP: " + state_.localIp(), "PinDropNode");
    logger_.log(LogLevel::INFO, "Ready to send or receive files", "PinDropNode");
}

PinDropNode::~PinDropNode() {
    shutdown();
}

pd::Result<void> PinDropNode::startListening(const std::string& destinationDirectory,
                                             const std::string& pin, int port) {
    ListenSession session;
    session.port = port < 0 ? config_.transferPort : port;
    session.expectedPin = PinCode::normalize(pin);
    session.destinationDirectory = destinationDirectory.empty() ? config_.saveDirectory : destinationDirectory;
    return receiver_.startListening(session);
}

void PinDropNode::stopListening() {
    receiver_.stopListening();
}

pd::Result<TransferReport> PinDropNode::waitForReceive() {
    return receiver_.wait();
}

pd::Result<void> PinDropNode::send(const std::string& path, const std::string& address,
                                   const std::string& pin, int port) {
    TransferRequest request;
    request.sourcePath = path;
    request.destinationAddress = address;
    request.destinationPort = port > 0 ? port : config_.transferPort;
    request.pin = PinCode::normalize(pin);
    return sender_.send(request);
}

void PinDropNode::cancelSend() {
    sender_.cancel();
}

pd::Result<TransferReport> PinDropNode::waitForSend() {
    return sender_.wait();
}

pd::Result<std::string> PinDropNode::generatePin() {
    auto pin = state_.regeneratePin();
    if (pin) {
        logger_.log(LogLevel::INFO, "New PIN generated: " + *pin, "PinDropNode");
    }
    return pin;
}

pd::Result<void> PinDropNode::startDiscovery() {
    auto listener = discovery_.startListener();
    if (!listener) {
        return listener;
    }
    if (!state_.discoveryEnabled()) {
        return pd::Ok();
    }
    return discovery_.startBroadcaster();
}

pd::Result<void> PinDropNode::startDiscoveryListener() {
    return discovery_.startListener();
}

void PinDropNode::stopDiscovery() {
    discovery_.stop();
}

pd::Result<void> PinDropNode::announceOnce() {
    return discovery_.broadcastOnce();
}

void PinDropNode::shutdown() {
    discovery_.stop();
    sender_.cancel();
    receiver_.stopListening();
}

} // namespace PinDrop
