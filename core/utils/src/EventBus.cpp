#include "EventBus.h"
#include "Logger.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace PinDrop {

    EventBus::SubscriptionId EventBus::subscribe(const std::string& eventName,
                                                 EventCallback callback,
                                                 int priority,
                                                 EventFilter filter) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& subs = subscribers_[eventName];

        SubscriptionId id = nextId_++;
        Subscription subscription{id, std::move(callback), priority, std::move(filter)};
        auto insertPos = subs.begin();
        for (; insertPos != subs.end(); ++insertPos) {
            if (priority > insertPos->priority) {
                break;
            }
        }
        subs.insert(insertPos, std::move(subscription));
        return id;
    }

    void EventBus::unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : subscribers_) {
            auto& subs = entry.second;
            subs.erase(std::remove_if(subs.begin(), subs.end(),
                                      [id](const Subscription& s) { return s.id == id; }),
                       subs.end());
        }
    }

    void EventBus::publish(const std::string& eventName, const std::any& data) {
        std::vector<Subscription> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = subscribers_.find(eventName);
            if (it == subscribers_.end()) {
                return;
            }
            targets = it->second;
        }

        for (auto& sub : targets) {
            try {
                if (sub.filter && !sub.filter(data)) {
                    continue;
                }
                sub.callback(data);
            } catch (const std::exception& e) {
                Logger::instance().error("Subscriber for " + eventName + " threw: " + e.what(), "EventBus");
            }
        }
    }

    size_t EventBus::subscriberCount(const std::string& eventName) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(eventName);
        return it == subscribers_.end() ? 0 : it->second.size();
    }

}
