#include "cadence/core/event.h"

namespace cadence {

void Event::set() {
    {
        std::lock_guard lock(mutex_);
        flag_ = true;
    }
    cv_.notify_all();
}

void Event::clear() {
    std::lock_guard lock(mutex_);
    flag_ = false;
}

bool Event::is_set() const {
    std::lock_guard lock(mutex_);
    return flag_;
}

void Event::wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return flag_; });
}

} // namespace cadence
