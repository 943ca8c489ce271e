#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace PinDrop {

/// One parsed discovery datagram
struct PeerAnnouncement {
    std::string ip;
    std::string pin;
    std::string instanceId;  // empty for announcements without one
    std::chrono::system_clock::time_point receivedAt;
};

struct PeerInfo {
    std::string ip;
    std::string pin;
    std::string instanceId;
    std::chrono::system_clock::time_point firstSeen;
    std::chrono::system_clock::time_point lastSeen;
    uint64_t announcementCount{0};
};

/**
 * @brief Peers heard on the discovery port, keyed by IP
 *
 * The latest announcement from an address wins. Entries are informational
 * only; nothing here authorizes a transfer.
 */
class PeerRegistry {
public:
    /// Records an announcement and returns the updated entry
    PeerInfo record(const PeerAnnouncement& announcement);

    void remove(const std::string& ip);
    void clear();

    bool has(const std::string& ip) const;
    std::optional<PeerInfo> get(const std::string& ip) const;

    /// All peers ordered by IP
    std::vector<PeerInfo> all() const;

    /// Drops peers not heard from within maxAge; returns removed IPs
    std::vector<std::string> expire(std::chrono::seconds maxAge);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, PeerInfo> peers_;
};

} // namespace PinDrop
