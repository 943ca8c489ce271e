#pragma once

#include "Logger.h"
#include "PeerRegistry.h"
#include "TransferTypes.h"
#include <json/json.h>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace PinDrop {

/**
 * @brief Renders node events for the terminal or as JSON lines
 *
 * In JSON mode every record is one compact object per line with a "type"
 * field: transfer, peer, log, peers, pin, error.
 */
class EventPrinter {
public:
    EventPrinter(std::ostream& out, bool json);

    bool json() const { return json_; }

    void onTransferEvent(const TransferEvent& event);
    void onPeerDiscovered(const PeerAnnouncement& announcement);
    void onLog(LogLevel level, const std::string& component, const std::string& message);

    void printPin(const std::string& pin, const std::string& localIp);
    void printPeers(const std::vector<PeerInfo>& peers);
    void printError(const pd::Error& error);

    static Json::Value toJson(const TransferEvent& event);
    static Json::Value toJson(const PeerAnnouncement& announcement);
    static Json::Value toJson(const PeerInfo& peer);

private:
    void writeJson(const Json::Value& value);

    std::ostream& out_;
    bool json_;
    std::mutex mutex_;
};

} // namespace PinDrop
