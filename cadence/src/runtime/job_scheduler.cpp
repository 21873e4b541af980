#include "cadence/runtime/job_scheduler.h"
#include "cadence/core/exceptions.h"

#include <algorithm>
#include <sstream>

namespace cadence {

JobScheduler::JobScheduler(IController& controller, ThreadRegistry& registry, SchedulerConfig config,
                           std::string name)
    : Daemon(controller, registry, std::move(name), ThreadClass::OTHER)
    , config_(config)
    , logger_(LoggerFactory::get_logger("cadence.scheduler")) {
}

JobScheduler::~JobScheduler() {
    stop();
}

// ============================================================================
// Job Management
// ============================================================================

void JobScheduler::add_job(std::shared_ptr<SchedulableJob> job) {
    if (!job) {
        throw SchedulerException(name(), "Cannot add a null job");
    }

    {
        std::lock_guard lock(waiting_mutex_);
        push_locked(std::move(job));
    }

    wake();
}

void JobScheduler::push_locked(std::shared_ptr<SchedulableJob> job) {
    auto due = job->next_work_time();
    waiting_.push_back(PendingEntry{due, std::move(job)});
    std::push_heap(waiting_.begin(), waiting_.end(), LaterDue{});
}

void JobScheduler::work_times_have_changed() {
    sort_needed_.store(true, std::memory_order_release);
}

void JobScheduler::clear_out_dead() {
    std::lock_guard lock(waiting_mutex_);
    auto removed = std::remove_if(waiting_.begin(), waiting_.end(),
        [](const PendingEntry& entry) { return entry.job->is_dead(); });
    waiting_.erase(removed, waiting_.end());
    std::make_heap(waiting_.begin(), waiting_.end(), LaterDue{});
}

void JobScheduler::filter_cancelled() {
    std::size_t dropped = 0;
    {
        std::lock_guard lock(waiting_mutex_);
        auto removed = std::remove_if(waiting_.begin(), waiting_.end(),
            [](const PendingEntry& entry) { return entry.job->is_cancelled(); });
        dropped = static_cast<std::size_t>(waiting_.end() - removed);
        waiting_.erase(removed, waiting_.end());
        std::make_heap(waiting_.begin(), waiting_.end(), LaterDue{});
    }

    if (dropped > 0) {
        std::lock_guard lock(stats_mutex_);
        stats_.cancelled_dropped += dropped;
    }
}

void JobScheduler::resort() {
    std::lock_guard lock(waiting_mutex_);
    for (auto& entry : waiting_) {
        entry.due = entry.job->next_work_time();
    }
    std::make_heap(waiting_.begin(), waiting_.end(), LaterDue{});
}

// ============================================================================
// Diagnostics
// ============================================================================

std::size_t JobScheduler::size() const {
    std::lock_guard lock(waiting_mutex_);
    return waiting_.size();
}

std::string JobScheduler::current_job_summary() const {
    return std::to_string(size()) + " jobs";
}

std::string JobScheduler::pretty_job_summary() const {
    std::vector<PendingEntry> snapshot;
    {
        std::lock_guard lock(waiting_mutex_);
        snapshot = waiting_;
    }

    std::sort(snapshot.begin(), snapshot.end(),
        [](const PendingEntry& a, const PendingEntry& b) { return *a.job < *b.job; });

    std::ostringstream oss;
    oss << snapshot.size() << " jobs:";
    for (const auto& entry : snapshot) {
        oss << "\n" << entry.job->to_string();
    }
    return oss.str();
}

SchedulerStats JobScheduler::stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

// ============================================================================
// Run Loop
// ============================================================================

void JobScheduler::run() {
    while (true) {
        try {
            while (no_work_to_start()) {
                check();

                if (cancel_filter_needed_.exchange(false)) {
                    filter_cancelled();
                }

                if (sort_needed_.exchange(false)) {
                    resort();
                    continue; // a resort may have brought a due job to the front
                }

                token().wait_for(loop_wait_time());
            }

            start_due_jobs();

        } catch (const ShutdownSignal&) {
            throw;
        } catch (const std::exception& e) {
            logger_->with_field("scheduler", name()).error("Scheduler loop error: " + std::string(e.what()));
            controller().report_exception(name(), std::current_exception());
        }

        std::this_thread::sleep_for(std::chrono::microseconds(10));
    }
}

bool JobScheduler::no_work_to_start() const {
    std::lock_guard lock(waiting_mutex_);
    return waiting_.empty() || !waiting_.front().job->is_due();
}

Seconds JobScheduler::loop_wait_time() const {
    Seconds max_wait = std::chrono::duration_cast<Seconds>(config_.max_loop_wait);

    std::lock_guard lock(waiting_mutex_);
    if (waiting_.empty()) {
        return std::chrono::duration_cast<Seconds>(config_.empty_wait);
    }

    Seconds until_due = waiting_.front().job->time_until_due();
    return std::clamp(until_due, Seconds::zero(), max_wait);
}

void JobScheduler::start_due_jobs() {
    std::size_t jobs_started = 0;
    std::uint64_t deferrals = 0;
    std::uint64_t dropped = 0;

    while (jobs_started < config_.max_jobs_per_tick) {
        std::shared_ptr<SchedulableJob> job;
        {
            std::lock_guard lock(waiting_mutex_);
            if (waiting_.empty() || !waiting_.front().job->is_due()) {
                break; // the rest are later in heap order
            }

            std::pop_heap(waiting_.begin(), waiting_.end(), LaterDue{});
            job = std::move(waiting_.back().job);
            waiting_.pop_back();
        }

        if (job->is_cancelled()) {
            ++dropped;
            continue;
        }

        if (job->check_admission()) {
            job->start_work();
            ++jobs_started;
        } else {
            // check_admission already pushed the due time back
            ++deferrals;
            std::lock_guard lock(waiting_mutex_);
            push_locked(std::move(job));
        }
    }

    std::lock_guard lock(stats_mutex_);
    ++stats_.ticks;
    stats_.dispatched += jobs_started;
    stats_.max_dispatched_per_tick = std::max<std::uint64_t>(stats_.max_dispatched_per_tick, jobs_started);
    stats_.admission_deferrals += deferrals;
    stats_.cancelled_dropped += dropped;
}

} // namespace cadence
