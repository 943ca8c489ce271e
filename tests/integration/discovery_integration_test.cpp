/**
 * @file discovery_integration_test.cpp
 * @brief Integration tests for UDP peer announcements over loopback
 */

#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <atomic>
#include <mutex>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include "EventBus.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "NodeState.h"
#include "PeerRegistry.h"
#include "SocketGuard.h"
#include "TransferTypes.h"
#include "UDPDiscovery.h"

using namespace PinDrop;

class DiscoveryIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::WARN);
        eventBus_ = std::make_unique<EventBus>();
        listenerState_ = std::make_unique<NodeState>("127.0.0.1", "111111", "listener01");
        announcerState_ = std::make_unique<NodeState>("127.0.0.1", "222222", "announcer1");

        DiscoveryOptions options;
        options.port = 0;
        listener_ = std::make_unique<UDPDiscovery>(eventBus_.get(), *listenerState_, registry_, options);

        eventBus_->subscribe(Events::PEER_DISCOVERED, [this](const std::any& data) {
            std::lock_guard<std::mutex> lock(mutex_);
            announcements_.push_back(std::any_cast<const PeerAnnouncement&>(data));
        });

        auto started = listener_->startListener();
        ASSERT_TRUE(started.ok()) << started.error().message;
        port_ = listener_->getListeningPort();
        ASSERT_GT(port_, 0);
    }

    void TearDown() override {
        listener_->stop();
        listener_.reset();
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::unique_ptr<UDPDiscovery> makeAnnouncer(NodeState& state, std::chrono::milliseconds interval = std::chrono::milliseconds(3000)) {
        DiscoveryOptions options;
        options.port = port_;
        options.interval = interval;
        options.broadcastAddress = "127.0.0.1";
        return std::make_unique<UDPDiscovery>(nullptr, state, announcerRegistry_, options);
    }

    size_t announcementCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return announcements_.size();
    }

    bool waitForAnnouncements(size_t count) {
        for (int i = 0; i < 50; ++i) {
            if (announcementCount() >= count) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return false;
    }

    void sendRaw(const std::string& message) {
        pd::SocketGuard sock(::socket(AF_INET, SOCK_DGRAM, 0));
        ASSERT_TRUE(sock.valid());
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port_));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ssize_t sent = ::sendto(sock.get(), message.data(), message.size(), 0,
                                reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ASSERT_EQ(sent, static_cast<ssize_t>(message.size()));
    }

    std::unique_ptr<EventBus> eventBus_;
    std::unique_ptr<NodeState> listenerState_;
    std::unique_ptr<NodeState> announcerState_;
    PeerRegistry registry_;
    PeerRegistry announcerRegistry_;
    std::unique_ptr<UDPDiscovery> listener_;
    int port_{0};

    std::mutex mutex_;
    std::vector<PeerAnnouncement> announcements_;
};

TEST_F(DiscoveryIntegrationTest, EveryAnnouncementIsReported) {
    auto announcer = makeAnnouncer(*announcerState_);
    ASSERT_TRUE(announcer->broadcastOnce().ok());
    ASSERT_TRUE(announcer->broadcastOnce().ok());

    ASSERT_TRUE(waitForAnnouncements(2));
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(announcements_[0].ip, "127.0.0.1");
    EXPECT_EQ(announcements_[0].pin, "222222");
    EXPECT_EQ(announcements_[1].instanceId, "announcer1");

    auto peer = registry_.get("127.0.0.1");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->announcementCount, 2u);
}

TEST_F(DiscoveryIntegrationTest, RegeneratedPinReplacesOldOne) {
    auto announcer = makeAnnouncer(*announcerState_);
    ASSERT_TRUE(announcer->broadcastOnce().ok());
    ASSERT_TRUE(waitForAnnouncements(1));

    ASSERT_TRUE(announcerState_->setPin("333333").ok());
    ASSERT_TRUE(announcer->broadcastOnce().ok());
    ASSERT_TRUE(waitForAnnouncements(2));

    auto peer = registry_.get("127.0.0.1");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->pin, "333333");
}

TEST_F(DiscoveryIntegrationTest, OwnAnnouncementsAreFiltered) {
    auto echo = makeAnnouncer(*listenerState_);
    ASSERT_TRUE(echo->broadcastOnce().ok());

    // Follow with a foreign announcement so the wait has something to observe
    auto announcer = makeAnnouncer(*announcerState_);
    ASSERT_TRUE(announcer->broadcastOnce().ok());
    ASSERT_TRUE(waitForAnnouncements(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_EQ(announcements_.size(), 1u);
    EXPECT_EQ(announcements_[0].instanceId, "announcer1");
}

TEST_F(DiscoveryIntegrationTest, MalformedDatagramsAreIgnored) {
    auto before = MetricsCollector::instance().getDiscoveryMetrics().malformedDatagrams;

    sendRaw("HELLO");
    sendRaw("DISCOVERY:127.0.0.1:12");
    sendRaw("DISCOVERY:999.1.1.1:123456");
    sendRaw(std::string(1000, 'D'));
    sendRaw("DISCOVERY:127.0.0.2:444444");

    ASSERT_TRUE(waitForAnnouncements(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_EQ(announcements_.size(), 1u);
    EXPECT_EQ(announcements_[0].ip, "127.0.0.2");
    EXPECT_GE(MetricsCollector::instance().getDiscoveryMetrics().malformedDatagrams, before + 3);
    EXPECT_TRUE(listener_->isListening());
}

TEST_F(DiscoveryIntegrationTest, PeriodicBroadcasterRepeats) {
    auto announcer = makeAnnouncer(*announcerState_, std::chrono::milliseconds(200));
    ASSERT_TRUE(announcer->startBroadcaster().ok());
    EXPECT_TRUE(announcer->isBroadcasting());

    EXPECT_TRUE(waitForAnnouncements(3));
    announcer->stopBroadcaster();
    EXPECT_FALSE(announcer->isBroadcasting());
}

TEST_F(DiscoveryIntegrationTest, DisabledDiscoverySkipsBroadcasts) {
    announcerState_->setDiscoveryEnabled(false);
    auto announcer = makeAnnouncer(*announcerState_, std::chrono::milliseconds(100));
    ASSERT_TRUE(announcer->startBroadcaster().ok());

    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    EXPECT_EQ(announcementCount(), 0u);

    announcerState_->setDiscoveryEnabled(true);
    EXPECT_TRUE(waitForAnnouncements(1));
    announcer->stopBroadcaster();
}
