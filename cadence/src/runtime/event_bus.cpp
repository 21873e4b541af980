#include "cadence/runtime/event_bus.h"

#include <algorithm>

namespace cadence {

EventBus::EventBus()
    : logger_(LoggerFactory::get_logger("cadence.event_bus")) {
}

SubscriptionId EventBus::subscribe(const std::string& topic, EventHandler handler) {
    auto id = next_id_.fetch_add(1);

    std::lock_guard lock(mutex_);
    subscriptions_[topic].push_back(Subscription{id, std::make_shared<EventHandler>(std::move(handler))});
    topic_by_id_.emplace(id, topic);
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);

    auto topic_it = topic_by_id_.find(id);
    if (topic_it == topic_by_id_.end()) {
        return false;
    }

    auto subs_it = subscriptions_.find(topic_it->second);
    if (subs_it != subscriptions_.end()) {
        auto& subs = subs_it->second;
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [id](const Subscription& s) { return s.id == id; }),
                   subs.end());
        if (subs.empty()) {
            subscriptions_.erase(subs_it);
        }
    }

    topic_by_id_.erase(topic_it);
    return true;
}

void EventBus::publish(const std::string& topic, const std::any& payload) {
    std::vector<std::shared_ptr<EventHandler>> handlers;
    {
        std::lock_guard lock(mutex_);
        auto it = subscriptions_.find(topic);
        if (it == subscriptions_.end()) {
            return;
        }
        handlers.reserve(it->second.size());
        for (const auto& subscription : it->second) {
            handlers.push_back(subscription.handler);
        }
    }

    for (const auto& handler : handlers) {
        try {
            (*handler)(payload);
        } catch (const std::exception& e) {
            logger_->with_field("topic", topic)
                .error(std::string("Event handler threw: ") + e.what());
        }
    }
}

std::size_t EventBus::subscriber_count(const std::string& topic) const {
    std::lock_guard lock(mutex_);
    auto it = subscriptions_.find(topic);
    return it == subscriptions_.end() ? 0 : it->second.size();
}

} // namespace cadence
