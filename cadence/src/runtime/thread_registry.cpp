#include "cadence/runtime/thread_registry.h"
#include "cadence/core/exceptions.h"
#include "cadence/runtime/controller.h"

#include <vector>

namespace cadence {

namespace {

/**
 * @brief Token owned by the calling thread; expires when the thread exits
 */
const std::shared_ptr<const int>& current_thread_token() {
    thread_local const std::shared_ptr<const int> token = std::make_shared<const int>(0);
    return token;
}

bool same_thread(const ThreadLiveness& a, const ThreadLiveness& b) {
    return !a.owner_before(b) && !b.owner_before(a);
}

} // anonymous namespace

std::string to_string(ThreadClass thread_class) {
    switch (thread_class) {
        case ThreadClass::DAEMON: return "daemon";
        case ThreadClass::OTHER: return "other";
        default: return "unknown";
    }
}

ThreadRegistry::ThreadRegistry(const IController& controller, RegistryConfig config)
    : controller_(controller)
    , config_(config)
    , logger_(LoggerFactory::get_logger("cadence.registry"))
    , next_sweep_(Clock::now() + config.sweep_interval) {
}

// ============================================================================
// Lifecycle
// ============================================================================

void ThreadRegistry::open() {
    {
        std::lock_guard lock(mutex_);
        next_sweep_ = Clock::now() + config_.sweep_interval;
    }
    open_.store(true, std::memory_order_release);
    logger_->debug("Thread registry opened");
}

void ThreadRegistry::close() {
    open_.store(false, std::memory_order_release);

    std::size_t marked = 0;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, entry] : threads_) {
            if (!entry.info.shutting_down) {
                entry.info.shutting_down = true;
                ++marked;
            }
        }
    }

    logger_->with_field("marked", marked).debug("Thread registry closed");
}

bool ThreadRegistry::is_open() const noexcept {
    return open_.load(std::memory_order_acquire);
}

// ============================================================================
// Per-thread State
// ============================================================================

ThreadRegistry::Entry& ThreadRegistry::lookup_locked(std::thread::id id) {
    auto& entry = threads_[id];

    if (entry.attached && !entry.is_live()) {
        // a previous thread with this id has exited
        entry = Entry{};
    }

    if (id == std::this_thread::get_id() && !entry.attached) {
        // state on an unclaimed entry belongs to no live thread
        entry = Entry{};
        entry.liveness = current_thread_token();
        entry.attached = true;
    }

    return entry;
}

ThreadInfo ThreadRegistry::get_info(std::thread::id id) {
    std::lock_guard lock(mutex_);
    sweep_if_due_locked();
    return lookup_locked(id).info;
}

ThreadLiveness ThreadRegistry::attach_current_thread(ThreadClass thread_class) {
    std::lock_guard lock(mutex_);
    sweep_if_due_locked();
    auto& entry = lookup_locked(std::this_thread::get_id());
    entry.info.thread_class = thread_class;
    return entry.liveness;
}

void ThreadRegistry::mark_shutting_down(std::thread::id id) {
    std::lock_guard lock(mutex_);

    if (id == std::this_thread::get_id()) {
        lookup_locked(id).info.shutting_down = true;
        return;
    }

    auto it = threads_.find(id);
    if (it == threads_.end() || !it->second.is_live()) {
        logger_->debug("Ignoring shutdown mark for a thread with no live entry");
        return;
    }
    it->second.info.shutting_down = true;
}

void ThreadRegistry::mark_shutting_down(std::thread::id id, const ThreadLiveness& liveness) {
    std::lock_guard lock(mutex_);

    auto it = threads_.find(id);
    if (it == threads_.end() || !it->second.is_live() || !same_thread(it->second.liveness, liveness)) {
        return;
    }
    it->second.info.shutting_down = true;
}

bool ThreadRegistry::is_shutting_down(std::thread::id id) {
    if (controller_.is_fast_exiting()) {
        return true;
    }

    if (!is_open()) {
        return true;
    }

    ThreadInfo info = get_info(id);

    bool application_flag = info.thread_class == ThreadClass::DAEMON
        ? controller_.is_view_shutting_down()
        : controller_.is_model_shutting_down();

    return application_flag || info.shutting_down;
}

void ThreadRegistry::check_current_thread() {
    if (is_shutting_down()) {
        throw ShutdownSignal();
    }
}

// ============================================================================
// Maintenance
// ============================================================================

std::size_t ThreadRegistry::sweep() {
    std::lock_guard lock(mutex_);
    return sweep_locked();
}

std::size_t ThreadRegistry::size() const {
    std::lock_guard lock(mutex_);
    return threads_.size();
}

void ThreadRegistry::sweep_if_due_locked() {
    auto now = Clock::now();
    if (now < next_sweep_) {
        return;
    }

    next_sweep_ = now + config_.sweep_interval;
    auto removed = sweep_locked();
    if (removed > 0) {
        logger_->with_field("removed", removed).debug("Swept dead thread entries");
    }
}

std::size_t ThreadRegistry::sweep_locked() {
    std::vector<std::thread::id> dead;
    for (const auto& [id, entry] : threads_) {
        if (!entry.is_live()) {
            dead.push_back(id);
        }
    }

    for (const auto& id : dead) {
        threads_.erase(id);
    }

    return dead.size();
}

} // namespace cadence
