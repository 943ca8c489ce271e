#include "PeerRegistry.h"
#include <iostream>
#include <cassert>
#include <thread>
#include <vector>

using namespace PinDrop;

namespace {

PeerAnnouncement announcement(const std::string& ip, const std::string& pin,
                              std::chrono::system_clock::time_point at = std::chrono::system_clock::now()) {
    PeerAnnouncement ann;
    ann.ip = ip;
    ann.pin = pin;
    ann.receivedAt = at;
    return ann;
}

} // namespace

void test_latest_pin_wins() {
    std::cout << "Running test_latest_pin_wins..." << std::endl;
    PeerRegistry registry;
    auto first = registry.record(announcement("10.0.0.2", "111111"));
    assert(first.announcementCount == 1);

    auto second = registry.record(announcement("10.0.0.2", "222222"));
    assert(second.announcementCount == 2);
    assert(second.pin == "222222");
    assert(second.firstSeen == first.firstSeen);

    assert(registry.size() == 1);
    assert(registry.get("10.0.0.2")->pin == "222222");
    assert(!registry.get("10.0.0.3").has_value());
    std::cout << "test_latest_pin_wins passed." << std::endl;
}

void test_all_sorted_and_remove() {
    std::cout << "Running test_all_sorted_and_remove..." << std::endl;
    PeerRegistry registry;
    registry.record(announcement("10.0.0.9", "111111"));
    registry.record(announcement("10.0.0.1", "222222"));
    registry.record(announcement("10.0.0.5", "333333"));

    auto peers = registry.all();
    assert(peers.size() == 3);
    assert(peers[0].ip == "10.0.0.1");
    assert(peers[2].ip == "10.0.0.9");

    registry.remove("10.0.0.5");
    assert(!registry.has("10.0.0.5"));
    assert(registry.size() == 2);

    registry.clear();
    assert(registry.size() == 0);
    std::cout << "test_all_sorted_and_remove passed." << std::endl;
}

void test_expire() {
    std::cout << "Running test_expire..." << std::endl;
    PeerRegistry registry;
    auto now = std::chrono::system_clock::now();
    registry.record(announcement("10.0.0.1", "111111", now - std::chrono::seconds(120)));
    registry.record(announcement("10.0.0.2", "222222", now));

    auto removed = registry.expire(std::chrono::seconds(60));
    assert(removed.size() == 1);
    assert(removed[0] == "10.0.0.1");
    assert(registry.has("10.0.0.2"));
    assert(!registry.has("10.0.0.1"));
    std::cout << "test_expire passed." << std::endl;
}

void test_concurrent_record() {
    std::cout << "Running test_concurrent_record..." << std::endl;
    PeerRegistry registry;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry]() {
            for (int i = 0; i < 250; ++i) {
                registry.record(announcement("10.0.0.1", "123456"));
            }
        });
    }
    for (auto& th : threads) th.join();

    assert(registry.get("10.0.0.1")->announcementCount == 1000);
    std::cout << "test_concurrent_record passed." << std::endl;
}

int main() {
    try {
        test_latest_pin_wins();
        test_all_sorted_and_remove();
        test_expire();
        test_concurrent_record();
        std::cout << "All PeerRegistry tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
