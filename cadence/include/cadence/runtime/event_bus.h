#pragma once

#include "cadence/utils/logger.h"

#include <any>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadence {

using SubscriptionId = std::uint64_t;
using EventHandler = std::function<void(const std::any& payload)>;

/**
 * @brief Topics every daemon and scheduler listens on
 */
namespace topics {
inline constexpr const char* WAKE_DAEMONS = "wake_daemons";
inline constexpr const char* SHUTDOWN = "shutdown";
} // namespace topics

/**
 * @brief Publish/subscribe interface the workers and jobs depend on
 *
 * **Thread Safety**: All methods must be thread-safe. Handlers may be invoked
 * on any publishing thread and must not block.
 */
class IEventBus {
public:
    virtual ~IEventBus() = default;

    /**
     * @brief Register a handler for a topic
     * @return Identifier to pass to unsubscribe()
     */
    virtual SubscriptionId subscribe(const std::string& topic, EventHandler handler) = 0;

    /**
     * @brief Remove a handler
     * @return true if the subscription existed
     */
    virtual bool unsubscribe(SubscriptionId id) = 0;

    /**
     * @brief Deliver a payload to every current subscriber of a topic
     */
    virtual void publish(const std::string& topic, const std::any& payload = {}) = 0;

    [[nodiscard]] virtual std::size_t subscriber_count(const std::string& topic) const = 0;
};

/**
 * @brief In-process event bus with synchronous delivery
 *
 * publish() snapshots the subscriber list and invokes handlers outside the
 * lock, so handlers may subscribe, unsubscribe or publish themselves. A
 * handler that throws is logged and delivery continues with the rest.
 */
class EventBus : public IEventBus {
public:
    EventBus();

    SubscriptionId subscribe(const std::string& topic, EventHandler handler) override;
    bool unsubscribe(SubscriptionId id) override;
    void publish(const std::string& topic, const std::any& payload = {}) override;
    [[nodiscard]] std::size_t subscriber_count(const std::string& topic) const override;

private:
    struct Subscription {
        SubscriptionId id;
        std::shared_ptr<EventHandler> handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> subscriptions_;
    std::unordered_map<SubscriptionId, std::string> topic_by_id_;
    std::atomic<SubscriptionId> next_id_{1};
    std::shared_ptr<Logger> logger_;
};

} // namespace cadence
