#include "cadence/runtime/worker_pool.h"
#include "cadence/core/exceptions.h"
#include "cadence/core/time_utils.h"

#include <algorithm>

namespace cadence {

WorkerPool::WorkerPool(IController& controller, ThreadRegistry& registry, WorkerConfig config)
    : controller_(controller)
    , registry_(registry)
    , config_(config)
    , logger_(LoggerFactory::get_logger("cadence.worker_pool")) {
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(QueueWorker::Action action, std::string description) {
    if (shut_down_.load(std::memory_order_acquire)) {
        throw SchedulerException("WorkerPool", "Pool has been shut down");
    }

    std::lock_guard lock(mutex_);
    select_worker_locked().put(std::move(action), std::move(description));
}

QueueWorker& WorkerPool::select_worker_locked() {
    for (auto& worker : workers_) {
        if (worker->is_alive() && !worker->is_currently_working()) {
            return *worker;
        }
    }

    if (workers_.size() < config_.max_pool_workers) {
        auto worker = std::make_unique<QueueWorker>(
            controller_, registry_, "CallToThread " + std::to_string(next_worker_id_++),
            config_.idle_wait, config_.dequeue_timeout);
        worker->set_report_mode(report_mode_);
        worker->start();

        logger_->with_field("workers", workers_.size() + 1).debug("Started pool worker " + worker->name());
        workers_.push_back(std::move(worker));
        return *workers_.back();
    }

    auto index = static_cast<std::size_t>(random_unit() * static_cast<double>(workers_.size()));
    index = std::min(index, workers_.size() - 1);
    return *workers_[index];
}

std::size_t WorkerPool::prune_dead() {
    std::vector<std::unique_ptr<QueueWorker>> dead;
    {
        std::lock_guard lock(mutex_);
        auto split = std::stable_partition(workers_.begin(), workers_.end(),
            [](const std::unique_ptr<QueueWorker>& worker) { return worker->is_alive(); });
        dead.assign(std::make_move_iterator(split), std::make_move_iterator(workers_.end()));
        workers_.erase(split, workers_.end());
    }

    auto removed = dead.size();
    if (removed > 0) {
        logger_->with_field("removed", removed).debug("Pruned dead pool workers");
    }

    // joined outside the lock
    dead.clear();
    return removed;
}

std::size_t WorkerPool::size() const {
    std::lock_guard lock(mutex_);
    return workers_.size();
}

std::size_t WorkerPool::busy_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(workers_.begin(), workers_.end(),
        [](const std::unique_ptr<QueueWorker>& worker) { return worker->is_currently_working(); }));
}

std::vector<std::pair<std::string, std::string>> WorkerPool::summaries() const {
    std::lock_guard lock(mutex_);
    std::vector<std::pair<std::string, std::string>> result;
    result.reserve(workers_.size());
    for (const auto& worker : workers_) {
        result.emplace_back(worker->name(), worker->current_job_summary());
    }
    return result;
}

void WorkerPool::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }

    std::vector<std::unique_ptr<QueueWorker>> workers;
    {
        std::lock_guard lock(mutex_);
        workers.swap(workers_);
    }

    for (auto& worker : workers) {
        worker->shutdown();
    }
    for (auto& worker : workers) {
        worker->join();
    }

    logger_->with_field("workers", workers.size()).debug("Worker pool shut down");
}

void WorkerPool::set_report_mode(bool enabled) {
    std::lock_guard lock(mutex_);
    report_mode_ = enabled;
    for (auto& worker : workers_) {
        worker->set_report_mode(enabled);
    }
}

} // namespace cadence
