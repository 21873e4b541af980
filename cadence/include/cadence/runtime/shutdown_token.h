#pragma once

#include "cadence/core/event.h"
#include "cadence/runtime/thread_registry.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>

namespace cadence {

/**
 * @brief Cancellation context handed to every long-running loop
 *
 * Carries the registry, the thread class and a wake event for one thread.
 * Loops poll is_shutting_down()/check() at their checkpoints and wait on the
 * token instead of sleeping, so wake() and request_shutdown() cut waits short.
 *
 * A shutdown requested before the owning thread has bound itself is
 * remembered and applied when it binds. Once the bound thread has exited the
 * token reports shutdown and no longer touches the registry, whose entry for
 * that id may by then belong to another thread.
 */
class ShutdownToken {
public:
    ShutdownToken(ThreadRegistry& registry, ThreadClass thread_class);

    ShutdownToken(const ShutdownToken&) = delete;
    ShutdownToken& operator=(const ShutdownToken&) = delete;

    /**
     * @brief Associate the token with the calling thread
     */
    void bind_current_thread();

    [[nodiscard]] std::optional<std::thread::id> thread_id() const;
    [[nodiscard]] ThreadClass thread_class() const noexcept { return thread_class_; }

    [[nodiscard]] bool is_shutting_down() const;

    /**
     * @brief Throw ShutdownSignal if the bound thread must stop
     */
    void check() const;

    /**
     * @brief Mark the bound thread shutting down and wake it
     */
    void request_shutdown();

    void wake();

    /**
     * @brief Wait for a wake, bounded by the timeout
     * @return true if woken (the wake is consumed)
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        if (wake_event_.wait_for(timeout)) {
            wake_event_.clear();
            return true;
        }
        return false;
    }

    /**
     * @brief Sleep that wake() cannot interrupt, for hard gates
     */
    template<typename Rep, typename Period>
    void sleep_for(const std::chrono::duration<Rep, Period>& duration) const {
        if (duration > duration.zero()) {
            std::this_thread::sleep_for(duration);
        }
    }

    [[nodiscard]] Event& wake_event() noexcept { return wake_event_; }
    [[nodiscard]] ThreadRegistry& registry() noexcept { return registry_; }

private:
    ThreadRegistry& registry_;
    ThreadClass thread_class_;
    Event wake_event_;

    mutable std::mutex mutex_;
    std::optional<std::thread::id> thread_id_;
    ThreadLiveness liveness_;
    std::atomic<bool> shutdown_requested_{false};
};

} // namespace cadence
