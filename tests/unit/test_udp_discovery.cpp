#include "UDPDiscovery.h"
#include "EventBus.h"
#include "TransferTypes.h"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace PinDrop;

void test_format_announcement() {
    std::cout << "Running test_format_announcement..." << std::endl;
    assert(UDPDiscovery::formatAnnouncement("192.168.1.5", "123456", "a1b2") ==
           "DISCOVERY:192.168.1.5:123456:a1b2");
    assert(UDPDiscovery::formatAnnouncement("192.168.1.5", "123456", "") ==
           "DISCOVERY:192.168.1.5:123456");
    std::cout << "test_format_announcement passed." << std::endl;
}

void test_parse_announcement() {
    std::cout << "Running test_parse_announcement..." << std::endl;
    auto plain = UDPDiscovery::parseAnnouncement("DISCOVERY:10.0.0.7:004512");
    assert(plain.has_value());
    assert(plain->ip == "10.0.0.7");
    assert(plain->pin == "004512");
    assert(plain->instanceId.empty());

    auto tagged = UDPDiscovery::parseAnnouncement("DISCOVERY:10.0.0.7:004512:deadbeef:future");
    assert(tagged.has_value());
    assert(tagged->instanceId == "deadbeef");
    std::cout << "test_parse_announcement passed." << std::endl;
}

void test_parse_rejects_malformed() {
    std::cout << "Running test_parse_rejects_malformed..." << std::endl;
    const std::vector<std::string> bad = {
        "",
        "HELLO",
        "DISCOVERY:",
        "DISCOVERY:10.0.0.7",
        "DISCOVERY:not-an-ip:123456",
        "DISCOVERY:10.0.0.300:123456",
        "DISCOVERY:10.0.0.7:12345",
        "DISCOVERY:10.0.0.7:abcdef",
        "discovery:10.0.0.7:123456",
        "DISCOVERY:10.0.0.7:123456:" + std::string(600, 'x'),
    };
    for (const auto& message : bad) {
        assert(!UDPDiscovery::parseAnnouncement(message).has_value());
    }
    std::cout << "test_parse_rejects_malformed passed." << std::endl;
}

void test_handle_datagram_records_peer() {
    std::cout << "Running test_handle_datagram_records_peer..." << std::endl;
    EventBus eventBus;
    NodeState state("192.168.1.10", "111111", "self0001");
    PeerRegistry registry;
    UDPDiscovery discovery(&eventBus, state, registry);

    std::vector<PeerAnnouncement> events;
    eventBus.subscribe(Events::PEER_DISCOVERED, [&events](const std::any& data) {
        events.push_back(std::any_cast<const PeerAnnouncement&>(data));
    });

    assert(discovery.handleDatagram("DISCOVERY:192.168.1.20:222222:peer0002", "192.168.1.20"));
    assert(discovery.handleDatagram("DISCOVERY:192.168.1.20:333333:peer0002", "192.168.1.20"));

    // Every datagram is reported, the registry keeps the latest PIN
    assert(events.size() == 2);
    assert(events[0].pin == "222222");
    assert(events[1].pin == "333333");
    auto peer = registry.get("192.168.1.20");
    assert(peer.has_value());
    assert(peer->pin == "333333");
    assert(peer->announcementCount == 2);

    assert(!discovery.handleDatagram("garbage", "192.168.1.30"));
    assert(events.size() == 2);
    assert(registry.size() == 1);
    std::cout << "test_handle_datagram_records_peer passed." << std::endl;
}

void test_self_announcements_ignored() {
    std::cout << "Running test_self_announcements_ignored..." << std::endl;
    EventBus eventBus;
    NodeState state("192.168.1.10", "111111", "self0001");
    PeerRegistry registry;
    UDPDiscovery discovery(&eventBus, state, registry);

    int events = 0;
    eventBus.subscribe(Events::PEER_DISCOVERED, [&events](const std::any&) { events++; });

    // Same instance id, even from another address
    assert(!discovery.handleDatagram("DISCOVERY:10.9.9.9:999999:self0001", "10.9.9.9"));
    // No instance id: own IP and PIN
    assert(!discovery.handleDatagram("DISCOVERY:192.168.1.10:111111", "192.168.1.10"));
    // A second instance on this host has its own id
    assert(discovery.handleDatagram("DISCOVERY:192.168.1.10:111111:other002", "192.168.1.10"));
    // Same IP, different PIN and no id
    assert(discovery.handleDatagram("DISCOVERY:192.168.1.10:222222", "192.168.1.10"));

    assert(events == 2);
    std::cout << "test_self_announcements_ignored passed." << std::endl;
}

void test_listener_lifecycle() {
    std::cout << "Running test_listener_lifecycle..." << std::endl;
    NodeState state("127.0.0.1", "111111", "self0001");
    PeerRegistry registry;
    DiscoveryOptions options;
    options.port = 0;
    UDPDiscovery discovery(nullptr, state, registry, options);

    auto started = discovery.startListener();
    if (started) {
        assert(discovery.isListening());
        assert(discovery.getListeningPort() > 0);
        discovery.stopListener();
        assert(!discovery.isListening());
        discovery.stopListener();
    } else {
        std::cout << "Failed to start UDP listener (expected in some environments): "
                  << started.error().message << std::endl;
    }
    std::cout << "test_listener_lifecycle passed." << std::endl;
}

int main() {
    try {
        test_format_announcement();
        test_parse_announcement();
        test_parse_rejects_malformed();
        test_handle_datagram_records_peer();
        test_self_announcements_ignored();
        test_listener_lifecycle();
        std::cout << "All UDPDiscovery tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
