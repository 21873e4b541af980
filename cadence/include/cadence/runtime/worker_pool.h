#pragma once

#include "cadence/runtime/queue_worker.h"
#include "cadence/runtime/runtime_config.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace cadence {

/**
 * @brief Growable pool of QueueWorkers behind IController::call_to_thread
 *
 * submit() hands the action to the first worker that is not working. If every
 * worker is busy a new one is started, up to `max_pool_workers`; past that a
 * random existing worker queues it.
 */
class WorkerPool {
public:
    WorkerPool(IController& controller, ThreadRegistry& registry, WorkerConfig config = {});
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Run an action on a pool thread
     * @throws SchedulerException after shutdown()
     */
    void submit(QueueWorker::Action action, std::string description = {});

    /**
     * @brief Drop workers whose thread has exited
     * @return Number of workers removed
     */
    std::size_t prune_dead();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t busy_count() const;

    /**
     * @brief (worker name, current job) per worker
     */
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> summaries() const;

    /**
     * @brief Stop every worker and wait for them
     */
    void shutdown();

    void set_report_mode(bool enabled);

private:
    QueueWorker& select_worker_locked();

    IController& controller_;
    ThreadRegistry& registry_;
    WorkerConfig config_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<QueueWorker>> workers_;
    std::size_t next_worker_id_ = 1;
    std::atomic<bool> shut_down_{false};
    bool report_mode_ = false;
};

} // namespace cadence
