#include "UDPDiscovery.h"
#include "Constants.h"
#include "LoggerMacros.h"
#include "NetUtils.h"
#include "PinCode.h"
#include "TransferTypes.h"
#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

namespace PinDrop {

UDPDiscovery::UDPDiscovery(EventBus* eventBus, NodeState& state, PeerRegistry& registry,
                           DiscoveryOptions options)
    : eventBus_(eventBus)
    , nodeState_(state)
    , registry_(registry)
    , options_(std::move(options))
{
}

UDPDiscovery::~UDPDiscovery() {
    stop();
}

pd::Result<void> UDPDiscovery::start() {
    auto listener = startListener();
    if (!listener) {
        return listener;
    }
    return startBroadcaster();
}

void UDPDiscovery::stop() {
    stopBroadcaster();
    stopListener();
}

std::string UDPDiscovery::broadcastAddress() const {
    if (!options_.broadcastAddress.empty()) {
        return options_.broadcastAddress;
    }
    return NetUtils::directedBroadcast(nodeState_.localIp());
}

pd::Result<void> UDPDiscovery::startListener() {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    if (listening_) {
        logger_.log(LogLevel::DEBUG, "UDP discovery already listening on port " + std::to_string(listeningPort_.load()), "UDPDiscovery");
        return pd::Ok();
    }
    if (listenThread_.joinable()) {
        listenThread_.join();
    }

    logger_.log(LogLevel::INFO, "Starting UDP discovery on port " + std::to_string(options_.port), "UDPDiscovery");

    pd::SocketGuard sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock) {
        return pd::Err(pd::ErrorCode::BindError, "Failed to create discovery socket: " + std::string(strerror(errno)));
    }

    int reuse = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        logger_.log(LogLevel::WARN, "Failed to set reuse addr option: " + std::string(strerror(errno)), "UDPDiscovery");
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(options_.port));
    addr.sin_addr.s_addr = INADDR_ANY;

    if (bind(sock.get(), (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        std::string message = "Failed to bind discovery socket to port " + std::to_string(options_.port) + ": " + strerror(errno);
        logger_.log(LogLevel::ERROR, message, "UDPDiscovery");
        return pd::Err(pd::ErrorCode::BindError, message);
    }

    listeningPort_ = NetUtils::boundPort(sock.get());
    listenSocket_ = std::move(sock);
    listening_ = true;
    listenThread_ = std::thread(&UDPDiscovery::listenLoop, this);

    logger_.log(LogLevel::INFO, "UDP discovery listening on port " + std::to_string(listeningPort_.load()), "UDPDiscovery");
    return pd::Ok();
}

void UDPDiscovery::stopListener() {
    std::unique_lock<std::mutex> lock(listenerMutex_);
    if (!listening_ && !listenThread_.joinable()) return;

    logger_.log(LogLevel::INFO, "Stopping UDP discovery listener", "UDPDiscovery");
    listening_ = false;
    listenSocket_.shutdownBoth();

    std::thread localThread;
    std::swap(localThread, listenThread_);
    lock.unlock();
    if (localThread.joinable()) {
        localThread.join();
    }

    lock.lock();
    listenSocket_.reset();
    listeningPort_ = 0;
}

pd::Result<void> UDPDiscovery::startBroadcaster() {
    std::lock_guard<std::mutex> lock(broadcasterMutex_);
    if (broadcasting_) {
        return pd::Ok();
    }
    if (broadcastThread_.joinable()) {
        broadcastThread_.join();
    }
    if (options_.interval.count() <= 0) {
        return pd::Err(pd::ErrorCode::InvalidArgument, "Discovery interval must be positive");
    }

    broadcasting_ = true;
    broadcastThread_ = std::thread(&UDPDiscovery::broadcastLoop, this);
    logger_.log(LogLevel::INFO, "Announcing presence to " + broadcastAddress() + ":" +
                std::to_string(options_.port) + " every " + std::to_string(options_.interval.count()) + "ms",
                "UDPDiscovery");
    return pd::Ok();
}

void UDPDiscovery::stopBroadcaster() {
    std::unique_lock<std::mutex> lock(broadcasterMutex_);
    if (!broadcasting_ && !broadcastThread_.joinable()) return;

    {
        std::lock_guard<std::mutex> sleepLock(sleepMutex_);
        broadcasting_ = false;
    }
    sleepCv_.notify_all();

    std::thread localThread;
    std::swap(localThread, broadcastThread_);
    lock.unlock();
    if (localThread.joinable()) {
        localThread.join();
    }
    logger_.log(LogLevel::INFO, "UDP discovery broadcaster stopped", "UDPDiscovery");
}

pd::Result<void> UDPDiscovery::broadcastOnce() {
    std::string message = formatAnnouncement(nodeState_.localIp(), nodeState_.pin(), nodeState_.instanceId());
    std::string target = broadcastAddress();

    auto result = sendAnnouncement(target, message);
    if (!result && options_.broadcastAddress.empty() && target != pd::config::LIMITED_BROADCAST_ADDRESS) {
        logger_.log(LogLevel::DEBUG, "Directed broadcast failed (" + result.error().message +
                    "), retrying on " + pd::config::LIMITED_BROADCAST_ADDRESS, "UDPDiscovery");
        result = sendAnnouncement(pd::config::LIMITED_BROADCAST_ADDRESS, message);
    }
    if (!result) {
        logger_.log(LogLevel::WARN, result.error().message, "UDPDiscovery");
    }
    return result;
}

pd::Result<void> UDPDiscovery::sendAnnouncement(const std::string& address, const std::string& message) {
    pd::SocketGuard sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock) {
        return pd::Err(pd::ErrorCode::ConnectionFailed, "Failed to create broadcast socket: " + std::string(strerror(errno)));
    }

    int broadcast = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
        logger_.log(LogLevel::WARN, "Failed to set broadcast option: " + std::string(strerror(errno)), "UDPDiscovery");
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(options_.port));
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return pd::Err(pd::ErrorCode::InvalidAddress, "Invalid broadcast address: " + address);
    }

    ssize_t sent = sendto(sock.get(), message.c_str(), message.length(), 0,
                          (struct sockaddr*)&addr, sizeof(addr));
    if (sent < 0) {
        return pd::Err(pd::ErrorCode::ConnectionFailed,
                       "Failed to broadcast presence to " + address + ": " + strerror(errno));
    }

    LOG_DEBUG_COMP_IF("Broadcast sent: " + message + " to " + address + ":" + std::to_string(options_.port), "UDPDiscovery");
    metrics_.incrementAnnouncementsSent();
    return pd::Ok();
}

void UDPDiscovery::broadcastLoop() {
    logger_.log(LogLevel::DEBUG, "UDP broadcast loop started", "UDPDiscovery");

    while (broadcasting_) {
        if (nodeState_.discoveryEnabled()) {
            // Failures are logged inside; the next tick retries
            (void)broadcastOnce();
        }

        std::unique_lock<std::mutex> lock(sleepMutex_);
        sleepCv_.wait_for(lock, options_.interval, [this] { return !broadcasting_.load(); });
    }

    logger_.log(LogLevel::DEBUG, "UDP broadcast loop ended", "UDPDiscovery");
}

void UDPDiscovery::listenLoop() {
    logger_.log(LogLevel::DEBUG, "UDP discovery loop started", "UDPDiscovery");

    const int fd = listenSocket_.get();
    std::vector<char> buffer(pd::config::MAX_DATAGRAM_SIZE + 1);

    while (listening_) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = ::poll(&pfd, 1, pd::config::DISCOVERY_RECV_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            logger_.log(LogLevel::WARN, "poll failed on discovery socket: " + std::string(strerror(errno)), "UDPDiscovery");
            listening_ = false;
            break;
        }
        if (rc == 0 || !listening_) {
            continue;
        }

        struct sockaddr_in senderAddr;
        socklen_t senderLen = sizeof(senderAddr);
        ssize_t len = recvfrom(fd, buffer.data(), buffer.size(), MSG_DONTWAIT,
                               (struct sockaddr*)&senderAddr, &senderLen);
        if (len < 0) {
            if (listening_ && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                logger_.log(LogLevel::WARN, "Error receiving broadcast: " + std::string(strerror(errno)), "UDPDiscovery");
            }
            continue;
        }

        char senderIpBuf[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &(senderAddr.sin_addr), senderIpBuf, INET_ADDRSTRLEN);
        std::string senderIp(senderIpBuf);

        if (static_cast<size_t>(len) > pd::config::MAX_DATAGRAM_SIZE) {
            LOG_DEBUG_COMP_IF("Dropping oversized datagram from " + senderIp, "UDPDiscovery");
            metrics_.incrementMalformedDatagrams();
            continue;
        }

        handleDatagram(std::string(buffer.data(), static_cast<size_t>(len)), senderIp);
    }

    logger_.log(LogLevel::DEBUG, "UDP discovery loop ended", "UDPDiscovery");
}

bool UDPDiscovery::handleDatagram(const std::string& message, const std::string& senderIp) {
    auto announcement = parseAnnouncement(message);
    if (!announcement) {
        LOG_DEBUG_COMP_IF("Ignoring malformed discovery message from " + senderIp, "UDPDiscovery");
        metrics_.incrementMalformedDatagrams();
        return false;
    }

    if (isSelf(*announcement)) {
        LOG_DEBUG_COMP_IF("Ignoring self-discovery message", "UDPDiscovery");
        return false;
    }

    metrics_.incrementAnnouncementsReceived();
    PeerInfo info = registry_.record(*announcement);
    if (info.announcementCount == 1) {
        metrics_.incrementPeersDiscovered();
    }

    logger_.log(LogLevel::INFO, "Discovered peer: " + announcement->ip + " (PIN: " + announcement->pin + ")", "UDPDiscovery");

    if (eventBus_) {
        eventBus_->publish(Events::PEER_DISCOVERED, *announcement);
    }
    return true;
}

bool UDPDiscovery::isSelf(const PeerAnnouncement& announcement) const {
    if (!announcement.instanceId.empty()) {
        return announcement.instanceId == nodeState_.instanceId();
    }
    return announcement.ip == nodeState_.localIp() && announcement.pin == nodeState_.pin();
}

std::string UDPDiscovery::formatAnnouncement(const std::string& ip, const std::string& pin,
                                             const std::string& instanceId) {
    std::string message = std::string(pd::config::DISCOVERY_PREFIX) + ip + ":" + pin;
    if (!instanceId.empty()) {
        message += ":" + instanceId;
    }
    return message;
}

std::optional<PeerAnnouncement> UDPDiscovery::parseAnnouncement(const std::string& message) {
    const std::string prefix = pd::config::DISCOVERY_PREFIX;
    if (message.size() > pd::config::MAX_DATAGRAM_SIZE || message.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::vector<std::string> fields;
    size_t start = prefix.size();
    while (true) {
        size_t colon = message.find(':', start);
        fields.push_back(message.substr(start, colon == std::string::npos ? std::string::npos : colon - start));
        if (colon == std::string::npos) break;
        start = colon + 1;
    }

    // Later fields are reserved; only ip, pin and instance id are read
    if (fields.size() < 2) {
        return std::nullopt;
    }
    if (!NetUtils::isValidIpv4(fields[0]) || !PinCode::isValid(fields[1])) {
        return std::nullopt;
    }

    PeerAnnouncement announcement;
    announcement.ip = fields[0];
    announcement.pin = fields[1];
    if (fields.size() >= 3) {
        announcement.instanceId = fields[2];
    }
    announcement.receivedAt = std::chrono::system_clock::now();
    return announcement;
}

} // namespace PinDrop
