#include "NodeState.h"
#include "NetUtils.h"
#include "PinCode.h"
#include <utility>

namespace PinDrop {

NodeState::NodeState(std::string localIp, std::string pin, std::string instanceId)
    : localIp_(std::move(localIp))
    , instanceId_(std::move(instanceId))
    , pin_(std::move(pin))
{
}

NodeState::NodeState(NodeState&& other) noexcept
    : localIp_(std::move(other.localIp_))
    , instanceId_(std::move(other.instanceId_))
    , pin_(other.pin())
    , discoveryEnabled_(other.discoveryEnabled_.load())
{
}

pd::Result<NodeState> NodeState::create() {
    auto pin = PinCode::generate();
    if (!pin) {
        return pd::Err<NodeState>(pin.error().code, pin.error().message);
    }
    auto instanceId = PinCode::randomHex(8);
    if (!instanceId) {
        return pd::Err<NodeState>(instanceId.error().code, instanceId.error().message);
    }
    return pd::Result<NodeState>(NodeState(NetUtils::detectLocalIp(), *pin, *instanceId));
}

std::string NodeState::pin() const {
    std::lock_guard<std::mutex> lock(pinMutex_);
    return pin_;
}

pd::Result<void> NodeState::setPin(const std::string& pin) {
    if (!PinCode::isValid(pin)) {
        return pd::Err(pd::ErrorCode::InvalidPin, "PIN must be exactly 6 digits");
    }
    std::lock_guard<std::mutex> lock(pinMutex_);
    pin_ = pin;
    return pd::Ok();
}

pd::Result<std::string> NodeState::regeneratePin() {
    auto pin = PinCode::generate();
    if (!pin) {
        return pin;
    }
    std::lock_guard<std::mutex> lock(pinMutex_);
    pin_ = *pin;
    return pin;
}

} // namespace PinDrop
