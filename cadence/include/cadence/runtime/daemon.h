#pragma once

#include "cadence/runtime/controller.h"
#include "cadence/runtime/shutdown_token.h"
#include "cadence/runtime/thread_registry.h"
#include "cadence/utils/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cadence {

/**
 * @brief Long-lived cooperative thread with a wake signal
 *
 * On construction the daemon subscribes to the `wake_daemons` and `shutdown`
 * topics. wake() sets its wake event; shutdown() marks its thread shutting
 * down in the registry and wakes it so the flag is seen promptly.
 *
 * Subclasses implement run() as a checkpointed loop and call check() between
 * every blocking or long-running step. A ShutdownSignal escaping run() ends
 * the thread quietly; any other exception is logged and reported.
 *
 * Subclasses must call stop() in their own destructor so run() never
 * executes against a partially destroyed object.
 */
class Daemon {
public:
    Daemon(IController& controller, ThreadRegistry& registry, std::string name,
           ThreadClass thread_class = ThreadClass::DAEMON);
    virtual ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Launch the thread
     * @throws SchedulerException if already started
     */
    void start();

    void join();

    /**
     * @brief Request shutdown and wait for the thread to exit
     */
    void stop();

    void wake();
    void shutdown();

    [[nodiscard]] bool is_alive() const noexcept { return alive_.load(std::memory_order_acquire); }
    [[nodiscard]] bool is_started() const noexcept { return started_.load(std::memory_order_acquire); }

    // ========================================================================
    // Diagnostics
    // ========================================================================

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] virtual std::string current_job_summary() const { return "unknown job"; }

    /**
     * @brief Log each job before it starts
     */
    void set_report_mode(bool enabled) { report_mode_.store(enabled, std::memory_order_relaxed); }

protected:
    virtual void run() = 0;

    /**
     * @brief Pre-call hook invoked right before each unit of work
     */
    virtual void do_pre_call();

    /**
     * @brief Also wake on an event-bus topic
     */
    void subscribe_wake(const std::string& topic);

    void check() const { token_->check(); }
    [[nodiscard]] bool is_shutting_down() const { return token_->is_shutting_down(); }

    [[nodiscard]] ShutdownToken& token() noexcept { return *token_; }
    [[nodiscard]] IController& controller() noexcept { return controller_; }
    [[nodiscard]] ThreadRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] Logger& logger() noexcept { return *logger_; }

private:
    void thread_main();

    IController& controller_;
    ThreadRegistry& registry_;
    std::string name_;
    std::shared_ptr<ShutdownToken> token_;
    std::shared_ptr<Logger> logger_;

    std::thread thread_;
    std::mutex thread_mutex_;
    std::atomic<bool> started_{false};
    std::atomic<bool> alive_{false};
    std::atomic<bool> report_mode_{false};

    std::vector<SubscriptionId> subscriptions_;
};

} // namespace cadence
