#include "PeerRegistry.h"

namespace PinDrop {

PeerInfo PeerRegistry::record(const PeerAnnouncement& announcement) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(announcement.ip);
    if (it == peers_.end()) {
        PeerInfo info;
        info.ip = announcement.ip;
        info.firstSeen = announcement.receivedAt;
        it = peers_.emplace(announcement.ip, info).first;
    }

    PeerInfo& info = it->second;
    info.pin = announcement.pin;
    info.instanceId = announcement.instanceId;
    info.lastSeen = announcement.receivedAt;
    info.announcementCount++;
    return info;
}

void PeerRegistry::remove(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.erase(ip);
}

void PeerRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.clear();
}

bool PeerRegistry::has(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.find(ip) != peers_.end();
}

std::optional<PeerInfo> PeerRegistry::get(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(ip);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PeerInfo> PeerRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PeerInfo> peers;
    peers.reserve(peers_.size());

    for (const auto& pair : peers_) {
        peers.push_back(pair.second);
    }

    return peers;
}

std::vector<std::string> PeerRegistry::expire(std::chrono::seconds maxAge) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cutoff = std::chrono::system_clock::now() - maxAge;

    std::vector<std::string> removed;
    for (auto it = peers_.begin(); it != peers_.end();) {
        if (it->second.lastSeen < cutoff) {
            removed.push_back(it->first);
            it = peers_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

} // namespace PinDrop
