#include "cadence/runtime/shutdown_token.h"
#include "cadence/core/exceptions.h"

namespace cadence {

ShutdownToken::ShutdownToken(ThreadRegistry& registry, ThreadClass thread_class)
    : registry_(registry)
    , thread_class_(thread_class) {
}

void ShutdownToken::bind_current_thread() {
    auto id = std::this_thread::get_id();
    auto liveness = registry_.attach_current_thread(thread_class_);

    {
        std::lock_guard lock(mutex_);
        thread_id_ = id;
        liveness_ = liveness;
    }

    if (shutdown_requested_.load(std::memory_order_acquire)) {
        registry_.mark_shutting_down(id, liveness);
    }
}

std::optional<std::thread::id> ShutdownToken::thread_id() const {
    std::lock_guard lock(mutex_);
    return thread_id_;
}

bool ShutdownToken::is_shutting_down() const {
    if (shutdown_requested_.load(std::memory_order_acquire)) {
        return true;
    }

    std::optional<std::thread::id> id;
    ThreadLiveness liveness;
    {
        std::lock_guard lock(mutex_);
        id = thread_id_;
        liveness = liveness_;
    }

    if (!id) {
        return registry_.is_shutting_down();
    }

    if (liveness.expired()) {
        // the bound thread has exited
        return true;
    }

    return registry_.is_shutting_down(*id);
}

void ShutdownToken::check() const {
    if (is_shutting_down()) {
        throw ShutdownSignal();
    }
}

void ShutdownToken::request_shutdown() {
    shutdown_requested_.store(true, std::memory_order_release);

    std::optional<std::thread::id> id;
    ThreadLiveness liveness;
    {
        std::lock_guard lock(mutex_);
        id = thread_id_;
        liveness = liveness_;
    }

    if (id) {
        registry_.mark_shutting_down(*id, liveness);
    }

    wake();
}

void ShutdownToken::wake() {
    wake_event_.set();
}

} // namespace cadence
