#include "EventBus.h"
#include "Logger.h"
#include <iostream>
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

using namespace PinDrop;

void test_publish_subscribe() {
    std::cout << "Running test_publish_subscribe..." << std::endl;
    EventBus bus;
    int received = 0;
    bus.subscribe("TRANSFER_EVENT", [&received](const std::any& data) {
        received = std::any_cast<int>(data);
    });

    bus.publish("TRANSFER_EVENT", 42);
    assert(received == 42);

    bus.publish("OTHER_EVENT", 7);
    assert(received == 42);
    std::cout << "test_publish_subscribe passed." << std::endl;
}

void test_priority_order() {
    std::cout << "Running test_priority_order..." << std::endl;
    EventBus bus;
    std::vector<std::string> order;
    bus.subscribe("E", [&order](const std::any&) { order.push_back("low"); }, 0);
    bus.subscribe("E", [&order](const std::any&) { order.push_back("high"); }, 10);

    bus.publish("E", 0);
    assert(order.size() == 2);
    assert(order[0] == "high");
    assert(order[1] == "low");
    std::cout << "test_priority_order passed." << std::endl;
}

void test_filter_and_unsubscribe() {
    std::cout << "Running test_filter_and_unsubscribe..." << std::endl;
    EventBus bus;
    int hits = 0;
    auto id = bus.subscribe("E", [&hits](const std::any&) { hits++; }, 0,
                            [](const std::any& data) { return std::any_cast<int>(data) > 5; });

    bus.publish("E", 1);
    bus.publish("E", 9);
    assert(hits == 1);
    assert(bus.subscriberCount("E") == 1);

    bus.unsubscribe(id);
    bus.publish("E", 9);
    assert(hits == 1);
    assert(bus.subscriberCount("E") == 0);
    std::cout << "test_filter_and_unsubscribe passed." << std::endl;
}

void test_throwing_subscriber_is_isolated() {
    std::cout << "Running test_throwing_subscriber_is_isolated..." << std::endl;
    Logger::instance().setConsoleOutput(false);
    EventBus bus;
    bool secondRan = false;
    bus.subscribe("E", [](const std::any&) { throw std::runtime_error("boom"); }, 5);
    bus.subscribe("E", [&secondRan](const std::any&) { secondRan = true; }, 0);

    bus.publish("E", 0);
    assert(secondRan);
    Logger::instance().setConsoleOutput(true);
    std::cout << "test_throwing_subscriber_is_isolated passed." << std::endl;
}

int main() {
    try {
        test_publish_subscribe();
        test_priority_order();
        test_filter_and_unsubscribe();
        test_throwing_subscriber_is_isolated();
        std::cout << "All EventBus tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
