#pragma once

#include "cadence/core/time_utils.h"
#include "cadence/runtime/daemon.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cadence {

/// Work invoked on every cycle; receives the application controller
using WorkAction = std::function<void(IController&)>;

/// Returns true when the worker may start its next call
using AdmissionPolicy = std::function<bool()>;

[[nodiscard]] AdmissionPolicy always_admit();

/**
 * @brief Admit only when the controller says heavy maintenance may run
 */
[[nodiscard]] AdmissionPolicy background_admission(IController& controller);

/**
 * @brief Admit only when the controller says user-visible heavy work may run
 */
[[nodiscard]] AdmissionPolicy foreground_admission(IController& controller);

struct PeriodicWorkerOptions {
    std::vector<std::string> topics;                    ///< Extra topics that wake the worker
    Seconds period{3600.0};
    Seconds initial_delay{3.0};
    Seconds pre_call_wait{0.0};
    std::chrono::milliseconds poll_interval{1000};      ///< Checkpoint granularity of every wait
    std::string job_description = "periodic work";
};

/**
 * @brief Daemon that runs a work action on a period, gated by an admission policy
 *
 * Cycle:
 * 1. initial delay (wakeable), once
 * 2. pre-call wait (not wakeable)
 * 3. wait until the admission policy passes, polling every poll_interval
 *    (a hard gate; wake() does not skip it)
 * 4. pre-call hook, then the work action
 * 5. period wait (wakeable), back to 2
 *
 * Shutdown is checked between every step and inside every wait. An exception
 * from the work action other than ShutdownSignal is logged and reported and
 * the worker carries on with its period wait.
 */
class PeriodicWorker : public Daemon {
public:
    PeriodicWorker(IController& controller, ThreadRegistry& registry, std::string name,
                   WorkAction action, PeriodicWorkerOptions options = {},
                   AdmissionPolicy admission = always_admit());
    ~PeriodicWorker() override;

    static std::unique_ptr<PeriodicWorker> background(IController& controller, ThreadRegistry& registry,
                                                      std::string name, WorkAction action,
                                                      PeriodicWorkerOptions options = {});

    static std::unique_ptr<PeriodicWorker> foreground(IController& controller, ThreadRegistry& registry,
                                                      std::string name, WorkAction action,
                                                      PeriodicWorkerOptions options = {});

    /**
     * @brief Cut the current wakeable wait short
     */
    void set() { wake(); }

    [[nodiscard]] std::string current_job_summary() const override { return options_.job_description; }
    [[nodiscard]] const PeriodicWorkerOptions& options() const noexcept { return options_; }

    [[nodiscard]] std::uint64_t completed_calls() const noexcept { return completed_calls_.load(); }
    [[nodiscard]] std::uint64_t failed_calls() const noexcept { return failed_calls_.load(); }

protected:
    void run() override;

private:
    /**
     * @brief Wait in poll-sized slices, checking shutdown after each
     * @param event_can_wake Whether a wake ends the wait early
     */
    void do_a_wait(Seconds wait, bool event_can_wake);

    void wait_until_can_start();
    void call_action();

    WorkAction action_;
    PeriodicWorkerOptions options_;
    AdmissionPolicy admission_;

    std::atomic<std::uint64_t> completed_calls_{0};
    std::atomic<std::uint64_t> failed_calls_{0};
};

} // namespace cadence
