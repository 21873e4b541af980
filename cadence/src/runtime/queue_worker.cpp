#include "cadence/runtime/queue_worker.h"
#include "cadence/core/exceptions.h"

namespace cadence {

namespace {

/**
 * @brief Clears a busy flag on scope exit
 */
class BusyReset {
public:
    explicit BusyReset(std::atomic<bool>& flag) : flag_(flag) {}
    ~BusyReset() { flag_.store(false, std::memory_order_release); }

    BusyReset(const BusyReset&) = delete;
    BusyReset& operator=(const BusyReset&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // anonymous namespace

QueueWorker::QueueWorker(IController& controller, ThreadRegistry& registry, std::string name,
                         std::chrono::milliseconds idle_wait,
                         std::chrono::milliseconds dequeue_timeout)
    : Daemon(controller, registry, std::move(name))
    , idle_wait_(idle_wait)
    , dequeue_timeout_(dequeue_timeout) {
}

QueueWorker::~QueueWorker() {
    stop();
}

void QueueWorker::put(Action action, std::string description) {
    currently_working_.store(true, std::memory_order_release);

    {
        std::lock_guard lock(queue_mutex_);
        queue_.push_back(Item{std::move(action), std::move(description)});
    }
    queue_cv_.notify_one();

    wake();
}

std::size_t QueueWorker::pending() const {
    std::lock_guard lock(queue_mutex_);
    return queue_.size();
}

std::string QueueWorker::current_job_summary() const {
    if (!is_currently_working()) {
        return "idle";
    }

    std::lock_guard lock(current_mutex_);
    return current_description_.empty() ? "working" : current_description_;
}

// ============================================================================
// Run Loop
// ============================================================================

void QueueWorker::run() {
    while (true) {
        // Emptiness check and wait are not atomic with producers; a late put
        // is picked up by the dequeue below.
        while (looks_empty()) {
            check();
            token().wait_for(idle_wait_);
        }

        check();

        auto item = dequeue(dequeue_timeout_);
        if (!item) {
            logger().with_field("worker", name()).debug("Dequeue found nothing, retrying");
            continue;
        }

        execute(std::move(*item));

        std::this_thread::sleep_for(std::chrono::microseconds(10));
    }
}

bool QueueWorker::looks_empty() const {
    std::lock_guard lock(queue_mutex_);
    return queue_.empty();
}

std::optional<QueueWorker::Item> QueueWorker::dequeue(std::chrono::milliseconds timeout) {
    std::unique_lock lock(queue_mutex_);
    if (!queue_cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }

    Item item = std::move(queue_.front());
    queue_.pop_front();
    return item;
}

void QueueWorker::execute(Item item) {
    BusyReset reset(currently_working_);

    {
        std::lock_guard lock(current_mutex_);
        current_description_ = item.description;
    }

    do_pre_call();

    try {
        item.action();
    } catch (const ShutdownSignal&) {
        throw;
    } catch (const std::exception& e) {
        logger().with_field("worker", name()).error("Exception in " + name() + ": " + e.what());
        controller().report_exception(name(), std::current_exception());
    } catch (...) {
        logger().with_field("worker", name()).error("Non-standard exception in " + name());
        controller().report_exception(name(), std::current_exception());
    }

    std::lock_guard lock(current_mutex_);
    current_description_.clear();
}

} // namespace cadence
