#pragma once

#include "cadence/runtime/daemon.h"
#include "cadence/runtime/runtime_config.h"
#include "cadence/runtime/schedulable_job.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cadence {

struct SchedulerStats {
    std::uint64_t dispatched = 0;
    std::uint64_t ticks = 0;                    ///< Dispatch phases entered
    std::uint64_t max_dispatched_per_tick = 0;
    std::uint64_t admission_deferrals = 0;
    std::uint64_t cancelled_dropped = 0;
};

/**
 * @brief Dedicated thread that dispatches due jobs to the worker pool
 *
 * Pending jobs live in a binary min-heap keyed by a snapshot of each job's
 * due time. wake() and cancel() on a job only raise the lazy "resort needed"
 * and "cancel filter needed" flags; the loop applies them before its next
 * dispatch decision. A resort refreshes every snapshot and re-heapifies.
 *
 * Each dispatch phase starts at most `max_jobs_per_tick` jobs so a backlog
 * does not flood the pool in one burst. A job refused admission goes back
 * into the heap at its deferred due time.
 *
 * Runs as an OTHER-class thread: it stops at model shutdown, not view
 * shutdown.
 */
class JobScheduler : public Daemon {
public:
    JobScheduler(IController& controller, ThreadRegistry& registry, SchedulerConfig config = {},
                 std::string name = "Job Scheduler");
    ~JobScheduler() override;

    // ========================================================================
    // Job Management
    // ========================================================================

    /**
     * @brief Insert a job and wake the loop
     * @throws SchedulerException if job is null
     */
    void add_job(std::shared_ptr<SchedulableJob> job);

    /**
     * @brief Note that a pending job was cancelled
     */
    void job_cancelled() { cancel_filter_needed_.store(true, std::memory_order_release); }

    /**
     * @brief Note that pending due times changed
     */
    void work_times_have_changed();

    /**
     * @brief Drop jobs that report is_dead()
     */
    void clear_out_dead();

    // ========================================================================
    // Diagnostics
    // ========================================================================

    [[nodiscard]] std::size_t size() const;

    /**
     * @brief "N jobs"
     */
    [[nodiscard]] std::string current_job_summary() const override;

    /**
     * @brief "N jobs:" followed by one line per pending job
     */
    [[nodiscard]] std::string pretty_job_summary() const;

    [[nodiscard]] SchedulerStats stats() const;
    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }

    using Daemon::controller;
    using Daemon::registry;

protected:
    void run() override;

private:
    struct PendingEntry {
        TimePoint due;
        std::shared_ptr<SchedulableJob> job;
    };

    struct LaterDue {
        bool operator()(const PendingEntry& a, const PendingEntry& b) const { return a.due > b.due; }
    };

    [[nodiscard]] bool no_work_to_start() const;
    [[nodiscard]] Seconds loop_wait_time() const;
    void filter_cancelled();
    void resort();
    void start_due_jobs();
    void push_locked(std::shared_ptr<SchedulableJob> job);

    SchedulerConfig config_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex waiting_mutex_;
    std::vector<PendingEntry> waiting_;

    std::atomic<bool> cancel_filter_needed_{false};
    std::atomic<bool> sort_needed_{false};

    mutable std::mutex stats_mutex_;
    SchedulerStats stats_;
};

} // namespace cadence
