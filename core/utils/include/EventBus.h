#pragma once
#include <string>
#include <functional>
#include <vector>
#include <unordered_map>
#include <any>
#include <utility>
#include <mutex>
#include <cstdint>

namespace PinDrop {

    using EventCallback = std::function<void(const std::any&)>;
    using EventFilter = std::function<bool(const std::any&)>;

    /**
     * @brief Synchronous publish/subscribe hub
     *
     * Callbacks run on the publishing thread (a transfer or discovery
     * worker), so they must not block for long. A callback that throws is
     * logged and skipped; the remaining subscribers still run.
     */
    class EventBus {
    public:
        using SubscriptionId = std::uint64_t;

        struct Subscription {
            SubscriptionId id;
            EventCallback callback;
            int priority;
            EventFilter filter;
        };

        /**
         * @brief Subscribe to an event.
         * @param eventName The name of the event.
         * @param callback The function to call when the event is published.
         * @param priority Higher priorities run first.
         * @return Id usable with unsubscribe().
         */
        SubscriptionId subscribe(const std::string& eventName,
                                 EventCallback callback,
                                 int priority = 0,
                                 EventFilter filter = nullptr);

        void unsubscribe(SubscriptionId id);

        /**
         * @brief Publish an event.
         * @param eventName The name of the event.
         * @param data The data associated with the event.
         */
        void publish(const std::string& eventName, const std::any& data);

        size_t subscriberCount(const std::string& eventName) const;

    private:
        std::unordered_map<std::string, std::vector<Subscription>> subscribers_;
        SubscriptionId nextId_{1};
        mutable std::mutex mutex_;
    };

}
