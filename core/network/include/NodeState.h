#pragma once

#include "Result.h"
#include <atomic>
#include <mutex>
#include <string>

namespace PinDrop {

/**
 * @brief State one PinDrop instance shares between its components
 *
 * Owned by the caller and passed by reference to the receiver, sender and
 * discovery. Only the PIN changes after construction; it is read under a
 * mutex so the broadcaster always announces the current value.
 */
class NodeState {
public:
    NodeState(std::string localIp, std::string pin, std::string instanceId);

    /// Detects the local IP and generates a fresh PIN and instance id
    static pd::Result<NodeState> create();

    const std::string& localIp() const { return localIp_; }
    const std::string& instanceId() const { return instanceId_; }

    std::string pin() const;
    pd::Result<void> setPin(const std::string& pin);

    /// Replaces the PIN with a new random one and returns it
    pd::Result<std::string> regeneratePin();

    bool discoveryEnabled() const { return discoveryEnabled_.load(); }
    void setDiscoveryEnabled(bool enabled) { discoveryEnabled_ = enabled; }

    NodeState(NodeState&& other) noexcept;
    NodeState& operator=(NodeState&&) = delete;
    NodeState(const NodeState&) = delete;
    NodeState& operator=(const NodeState&) = delete;

private:
    std::string localIp_;
    std::string instanceId_;

    mutable std::mutex pinMutex_;
    std::string pin_;

    std::atomic<bool> discoveryEnabled_{true};
};

} // namespace PinDrop
