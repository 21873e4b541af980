#pragma once

#include "cadence/runtime/daemon.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace cadence {

namespace detail {

/**
 * @brief Package a callable and its arguments as a nullary action
 */
template<typename F, typename... Args>
std::function<void()> bind_call(F&& f, Args&&... args) {
    return [f = std::forward<F>(f), tup = std::make_tuple(std::forward<Args>(args)...)]() mutable {
        std::apply(f, tup);
    };
}

} // namespace detail

/**
 * @brief Daemon draining an unbounded FIFO of actions, one at a time
 *
 * put() marks the worker busy immediately so pool selection does not hand a
 * second caller a worker that has queued but unstarted work. The busy flag is
 * cleared after every action whatever its outcome.
 */
class QueueWorker : public Daemon {
public:
    using Action = std::function<void()>;

    QueueWorker(IController& controller, ThreadRegistry& registry, std::string name,
                std::chrono::milliseconds idle_wait = std::chrono::seconds(10),
                std::chrono::milliseconds dequeue_timeout = std::chrono::seconds(1));
    ~QueueWorker() override;

    /**
     * @brief Queue an action and wake the worker
     */
    void put(Action action, std::string description = {});

    /**
     * @brief Queue a callable with bound arguments
     */
    template<typename F, typename... Args>
    void submit(F&& f, Args&&... args) {
        put(detail::bind_call(std::forward<F>(f), std::forward<Args>(args)...));
    }

    [[nodiscard]] bool is_currently_working() const noexcept {
        return currently_working_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::size_t pending() const;

    [[nodiscard]] std::string current_job_summary() const override;

protected:
    void run() override;

private:
    struct Item {
        Action action;
        std::string description;
    };

    [[nodiscard]] bool looks_empty() const;
    std::optional<Item> dequeue(std::chrono::milliseconds timeout);
    void execute(Item item);

    std::chrono::milliseconds idle_wait_;
    std::chrono::milliseconds dequeue_timeout_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Item> queue_;

    // starts busy so a fresh worker is not picked twice before it runs
    std::atomic<bool> currently_working_{true};

    mutable std::mutex current_mutex_;
    std::string current_description_;
};

} // namespace cadence
