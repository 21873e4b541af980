#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace cadence {

/**
 * @brief Manual-reset event
 *
 * Once set, every waiter returns until clear() is called. Used for wake
 * signals, "new job arrived" notifications and completion signals.
 */
class Event {
public:
    Event() = default;
    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;

    void set();
    void clear();
    [[nodiscard]] bool is_set() const;

    /**
     * @brief Block until the event is set
     */
    void wait();

    /**
     * @brief Block until the event is set or the timeout expires
     * @return true if the event was set
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (timeout <= timeout.zero()) {
            return flag_;
        }
        return cv_.wait_for(lock, timeout, [this] { return flag_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool flag_ = false;
};

} // namespace cadence
