#pragma once

#include "cadence/runtime/event_bus.h"

#include <exception>
#include <functional>
#include <string>

namespace cadence {

/**
 * @brief The application services the scheduling core depends on
 *
 * Workers, jobs and schedulers only talk to the application through this
 * interface: slot accounting, "good time to work" predicates, shutdown and
 * sleep state, the worker pool, error reporting and the event bus.
 * Runtime is the stock implementation.
 *
 * **Thread Safety**: All methods are called concurrently from scheduler,
 * daemon and pool threads and must be thread-safe.
 */
class IController {
public:
    virtual ~IController() = default;

    // ========================================================================
    // Worker Pool
    // ========================================================================

    /**
     * @brief Run an action asynchronously on a pool thread
     */
    virtual void call_to_thread(std::function<void()> action) = 0;

    // ========================================================================
    // Admission Control
    // ========================================================================

    /**
     * @brief Try to take one unit of a named slot
     * @return true if taken; unknown slot names are unlimited
     */
    virtual bool acquire_slot(const std::string& slot_type) = 0;

    virtual void release_slot(const std::string& slot_type) = 0;

    /**
     * @brief Whether heavy maintenance may start (idle, not busy, not just resumed)
     */
    virtual bool good_time_for_background_work() = 0;

    /**
     * @brief Whether user-visible heavy work may start (not busy, not just resumed)
     */
    virtual bool good_time_for_foreground_work() = 0;

    // ========================================================================
    // Application State
    // ========================================================================

    [[nodiscard]] virtual bool is_fast_exiting() const = 0;

    /// Governs daemon-class threads
    [[nodiscard]] virtual bool is_view_shutting_down() const = 0;

    /// Governs every other thread
    [[nodiscard]] virtual bool is_model_shutting_down() const = 0;

    /**
     * @brief Whether the machine resumed from suspend within the grace period
     */
    virtual bool just_woke_from_sleep() = 0;

    // ========================================================================
    // Reporting and Notification
    // ========================================================================

    /**
     * @brief Receive an unexpected, non-fatal exception from a work action
     * @param context Daemon or job name the exception escaped from
     */
    virtual void report_exception(const std::string& context, std::exception_ptr error) = 0;

    virtual IEventBus& event_bus() = 0;
};

/**
 * @brief Extract a printable message from an exception_ptr
 */
[[nodiscard]] std::string describe_exception(std::exception_ptr error);

} // namespace cadence
