#pragma once

#include "cadence/runtime/controller.h"
#include "cadence/runtime/daemon.h"
#include "cadence/runtime/event_bus.h"
#include "cadence/runtime/job_scheduler.h"
#include "cadence/runtime/periodic_worker.h"
#include "cadence/runtime/runtime_config.h"
#include "cadence/runtime/schedulable_job.h"
#include "cadence/runtime/thread_registry.h"
#include "cadence/runtime/worker_pool.h"
#include "cadence/utils/logger.h"
#include "cadence/utils/subprocess.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace cadence {

/**
 * @brief The stock application controller
 *
 * Owns the thread registry, the event bus, the worker pool, a fast and a
 * slow JobScheduler and any registered daemons, and implements the
 * IController services they depend on: named slot accounting, the "good time
 * to work" predicates, shutdown flags and suspend/resume detection.
 *
 * Jobs whose initial delay is at most `fast_scheduler_threshold` go to the
 * fast scheduler so a long backlog of slow jobs never delays them.
 *
 * Shutdown runs in two phases. shutdown_view() stops daemon-class threads
 * (daemons and pool workers). shutdown_model() stops everything else, joins
 * all threads and closes the registry.
 *
 * @example
 * ```cpp
 * Runtime runtime(RuntimeConfig::from_environment());
 * runtime.start();
 *
 * auto job = runtime.call_later(Seconds(5.0), [] { refresh_cache(); });
 * auto tick = runtime.call_repeating(Seconds(1.0), Seconds(60.0), [] { flush_stats(); });
 *
 * runtime.shutdown();
 * ```
 */
class Runtime : public IController {
public:
    explicit Runtime(RuntimeConfig config = RuntimeConfig::defaults());
    ~Runtime() override;

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Open the registry and start the schedulers, daemons and sleep check
     * @throws SchedulerException if already started or shut down
     */
    void start();

    /**
     * @brief Stop daemon-class threads
     */
    void shutdown_view();

    /**
     * @brief Stop every thread, join them and close the registry
     */
    void shutdown_model();

    void shutdown();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ========================================================================
    // Work Submission
    // ========================================================================

    /**
     * @brief Run an action on a pool thread
     * @throws SchedulerException if the runtime is not running
     */
    void call_to_thread(std::function<void()> action) override;

    template<typename F, typename Arg, typename... Args>
    void call_to_thread(F&& f, Arg&& arg, Args&&... args) {
        call_to_thread(detail::bind_call(std::forward<F>(f), std::forward<Arg>(arg), std::forward<Args>(args)...));
    }

    /**
     * @brief Run a callable once after `delay`
     */
    template<typename F, typename... Args>
    std::shared_ptr<SingleJob> call_later(Seconds delay, F&& f, Args&&... args) {
        auto& scheduler = scheduler_for(delay);
        auto job = std::make_shared<SingleJob>(*this, scheduler, delay,
            detail::bind_call(std::forward<F>(f), std::forward<Args>(args)...), "delayed call");
        scheduler.add_job(job);
        return job;
    }

    /**
     * @brief Run a callable after `initial_delay`, then every `period`
     */
    template<typename F, typename... Args>
    std::shared_ptr<RepeatingJob> call_repeating(Seconds initial_delay, Seconds period, F&& f, Args&&... args) {
        auto& scheduler = scheduler_for(initial_delay);
        auto job = std::make_shared<RepeatingJob>(*this, scheduler, initial_delay, period,
            detail::bind_call(std::forward<F>(f), std::forward<Args>(args)...), "repeating call");
        scheduler.add_job(job);
        return job;
    }

    /**
     * @brief The scheduler that jobs with this initial delay go to
     */
    [[nodiscard]] JobScheduler& scheduler_for(Seconds initial_delay);

    /**
     * @brief Take ownership of a daemon; started now if the runtime is running
     */
    Daemon& add_daemon(std::unique_ptr<Daemon> daemon);

    /**
     * @brief Periodic worker options carrying the configured poll interval
     */
    [[nodiscard]] PeriodicWorkerOptions worker_options() const;

    /**
     * @brief Run a command to completion, killing it if the model shuts down
     * @throws ShutdownSignal on model shutdown
     * @throws SubprocessException if the command cannot be run
     */
    ProcessResult run_subprocess(const std::vector<std::string>& argv);

    // ========================================================================
    // Admission Control
    // ========================================================================

    bool acquire_slot(const std::string& slot_type) override;
    void release_slot(const std::string& slot_type) override;

    void set_slot_limit(const std::string& slot_type, std::size_t max_holders);

    /**
     * @brief Current holders of a slot (0 for unknown slots)
     */
    [[nodiscard]] std::size_t slot_usage(const std::string& slot_type) const;

    bool good_time_for_background_work() override;
    bool good_time_for_foreground_work() override;

    // ========================================================================
    // Application State
    // ========================================================================

    [[nodiscard]] bool is_fast_exiting() const override { return fast_exit_.load(); }
    [[nodiscard]] bool is_view_shutting_down() const override { return view_shutdown_.load(); }
    [[nodiscard]] bool is_model_shutting_down() const override { return model_shutdown_.load(); }

    void set_fast_exit(bool value) { fast_exit_.store(value); }
    void set_idle(bool value) { idle_.store(value); }
    void set_system_busy(bool value) { system_busy_.store(value); }

    [[nodiscard]] bool is_idle() const { return idle_.load(); }
    [[nodiscard]] bool is_system_busy() const { return system_busy_.load(); }

    bool just_woke_from_sleep() override;

    /**
     * @brief Compare wall-clock time against the previous check
     *
     * A gap over `sleep_threshold` means the machine was suspended; "just
     * woke" then holds for `awake_grace`.
     */
    void sleep_check();
    void sleep_check(std::chrono::system_clock::time_point now);

    /**
     * @brief Treat the machine as freshly resumed
     */
    void note_resume();

    // ========================================================================
    // Reporting
    // ========================================================================

    void report_exception(const std::string& context, std::exception_ptr error) override;

    [[nodiscard]] std::uint64_t reported_error_count() const { return reported_errors_.load(); }

    IEventBus& event_bus() override { return event_bus_; }

    /**
     * @brief Flags, slots, pool, schedulers and daemons as JSON
     */
    [[nodiscard]] nlohmann::json diagnostic_report() const;

    // ========================================================================
    // Components
    // ========================================================================

    [[nodiscard]] const RuntimeConfig& config() const noexcept { return config_; }
    [[nodiscard]] ThreadRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] WorkerPool& worker_pool() noexcept { return worker_pool_; }
    [[nodiscard]] JobScheduler& fast_scheduler() noexcept { return *fast_scheduler_; }
    [[nodiscard]] JobScheduler& slow_scheduler() noexcept { return *slow_scheduler_; }

private:
    struct SlotState {
        std::size_t max_holders = 0;
        std::size_t holders = 0;
    };

    void apply_logging_config();

    RuntimeConfig config_;
    std::shared_ptr<Logger> logger_;

    EventBus event_bus_;
    ThreadRegistry registry_;
    WorkerPool worker_pool_;
    std::unique_ptr<JobScheduler> fast_scheduler_;
    std::unique_ptr<JobScheduler> slow_scheduler_;

    mutable std::mutex daemons_mutex_;
    std::vector<std::unique_ptr<Daemon>> daemons_;

    mutable std::mutex slots_mutex_;
    std::map<std::string, SlotState> slots_;

    std::atomic<bool> fast_exit_{false};
    std::atomic<bool> view_shutdown_{false};
    std::atomic<bool> model_shutdown_{false};
    std::atomic<bool> idle_{true};
    std::atomic<bool> system_busy_{false};

    std::mutex sleep_mutex_;
    std::chrono::system_clock::time_point last_sleep_check_;
    TimePoint woke_until_{};
    std::shared_ptr<RepeatingJob> sleep_check_job_;

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> reported_errors_{0};
};

} // namespace cadence
