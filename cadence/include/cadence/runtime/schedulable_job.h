#pragma once

#include "cadence/core/event.h"
#include "cadence/core/time_utils.h"
#include "cadence/runtime/controller.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cadence {

class JobScheduler;

/**
 * @brief A unit of deferred work with a due time
 *
 * Jobs are created with std::make_shared and handed to a JobScheduler, which
 * owns the pending collection; creators keep their shared_ptr to wake or
 * cancel the job. Execution always happens on a worker pool thread through
 * IController::call_to_thread, never on the scheduler thread.
 *
 * Jobs order by due time. At most one execution of a given job instance runs
 * at a time, even if it is re-submitted while running.
 *
 * @example
 * ```cpp
 * auto job = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(5.0),
 *                                             [] { rebuild_index(); }, "rebuild index");
 * job->set_thread_slot_type("misc");
 * scheduler.add_job(job);
 * ```
 */
class SchedulableJob : public std::enable_shared_from_this<SchedulableJob> {
public:
    using WorkCallable = std::function<void()>;

    SchedulableJob(IController& controller, JobScheduler& scheduler, Seconds initial_delay,
                   WorkCallable work, std::string name = {});
    virtual ~SchedulableJob();

    SchedulableJob(const SchedulableJob&) = delete;
    SchedulableJob& operator=(const SchedulableJob&) = delete;

    // ========================================================================
    // Scheduling
    // ========================================================================

    /**
     * @brief Reschedule to `next_time` (now if absent); the scheduler resorts lazily
     */
    void wake(std::optional<TimePoint> next_time = std::nullopt);

    /**
     * @brief Cancel for good; the scheduler filters cancelled jobs lazily
     */
    virtual void cancel();

    /**
     * @brief Associate the job with a named admission slot
     */
    void set_thread_slot_type(std::string slot_type);
    [[nodiscard]] std::optional<std::string> thread_slot_type() const;

    void set_should_delay_on_wakeup(bool value) { delay_on_wakeup_.store(value); }
    [[nodiscard]] bool should_delay_on_wakeup() const { return delay_on_wakeup_.load(); }

    /**
     * @brief Wake this job whenever `topic` is published
     */
    void wake_on_topic(const std::string& topic);

    /**
     * @brief Try to take the job's admission slot
     *
     * On refusal the job is pushed back by the configured retry delay plus
     * jitter and false is returned. Jobs without a slot type are always
     * admitted.
     */
    bool check_admission();

    /**
     * @brief Submit the job to the worker pool unless cancelled
     */
    virtual void start_work();

    // ========================================================================
    // State
    // ========================================================================

    [[nodiscard]] TimePoint next_work_time() const { return next_work_time_.load(); }
    [[nodiscard]] Seconds time_until_due() const { return time_until(next_work_time()); }
    [[nodiscard]] bool is_due() const { return Clock::now() >= next_work_time(); }
    [[nodiscard]] bool is_cancelled() const { return cancelled_.load(); }
    [[nodiscard]] bool is_currently_working() const { return currently_working_.load(); }

    /**
     * @brief Whether the scheduler may discard the job outright
     */
    [[nodiscard]] virtual bool is_dead() const { return false; }

    // ========================================================================
    // Diagnostics
    // ========================================================================

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /**
     * @brief "<name>: next in <delta>", or "<name>: due"
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] virtual nlohmann::json to_json() const;

    bool operator<(const SchedulableJob& other) const {
        return next_work_time() < other.next_work_time();
    }

protected:
    /**
     * @brief Pool-thread entry point
     */
    virtual void work();

    /**
     * @brief Wait out a recent resume, then run the action under the job lock
     *
     * The admission slot and the working flag are released whatever happens.
     */
    void execute();

    [[nodiscard]] virtual const char* kind() const { return "job"; }

    void set_next_work_time(TimePoint when) { next_work_time_.store(when); }

    [[nodiscard]] IController& controller() noexcept { return controller_; }
    [[nodiscard]] JobScheduler& scheduler() noexcept { return scheduler_; }

    void release_slot_if_held();

private:

    IController& controller_;
    JobScheduler& scheduler_;
    WorkCallable work_;
    std::string name_;

    std::atomic<TimePoint> next_work_time_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> currently_working_{false};
    std::atomic<bool> delay_on_wakeup_{false};
    std::atomic<bool> slot_held_{false};

    mutable std::mutex state_mutex_;
    std::optional<std::string> slot_type_;
    std::vector<SubscriptionId> subscriptions_;

    std::mutex work_lock_;
};

// ============================================================================
// Variants
// ============================================================================

/**
 * @brief Job that runs once and signals completion
 *
 * The completion signal is set after the single execution whether the
 * action succeeded or threw, except when a ShutdownSignal interrupted it.
 */
class SingleJob : public SchedulableJob {
public:
    using SchedulableJob::SchedulableJob;

    [[nodiscard]] bool is_work_complete() const { return work_complete_.is_set(); }

    /**
     * @brief Block until the job has run
     * @return false on timeout
     */
    template<typename Rep, typename Period>
    bool wait_until_complete(const std::chrono::duration<Rep, Period>& timeout) {
        return work_complete_.wait_for(timeout);
    }

    [[nodiscard]] nlohmann::json to_json() const override;

protected:
    void work() override;
    [[nodiscard]] const char* kind() const override { return "single"; }

private:
    Event work_complete_;
};

/**
 * @brief Job that re-adds itself `period` after every run until cancelled
 */
class RepeatingJob : public SchedulableJob {
public:
    RepeatingJob(IController& controller, JobScheduler& scheduler, Seconds initial_delay,
                 Seconds period, WorkCallable work, std::string name = {});

    /**
     * @brief Cancel the job and stop it re-adding itself
     */
    void cancel() override;

    /**
     * @brief Submit the next run unless repetition has been stopped
     */
    void start_work() override;

    /**
     * @brief Push the next run to now + `delay`
     */
    void delay(Seconds delay);

    /**
     * @brief Set the period; periods over 10s get up to 1s of random jitter
     */
    void set_period(Seconds period);
    [[nodiscard]] Seconds period() const;

    [[nodiscard]] bool is_repeating_work_finished() const { return stop_repeating_.load(); }

    [[nodiscard]] nlohmann::json to_json() const override;

protected:
    void work() override;
    [[nodiscard]] const char* kind() const override { return "repeating"; }

private:
    void reschedule();

    std::atomic<bool> stop_repeating_{false};
    mutable std::mutex period_mutex_;
    Seconds period_{0.0};
};

} // namespace cadence
