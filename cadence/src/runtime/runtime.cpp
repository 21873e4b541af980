#include "cadence/runtime/runtime.h"
#include "cadence/core/exceptions.h"

namespace cadence {

Runtime::Runtime(RuntimeConfig config)
    : config_(std::move(config))
    , logger_(LoggerFactory::get_logger("cadence.runtime"))
    , registry_(*this, config_.registry)
    , worker_pool_(*this, registry_, config_.worker)
    , fast_scheduler_(std::make_unique<JobScheduler>(*this, registry_, config_.scheduler, "Fast Job Scheduler"))
    , slow_scheduler_(std::make_unique<JobScheduler>(*this, registry_, config_.scheduler, "Slow Job Scheduler"))
    , last_sleep_check_(std::chrono::system_clock::now()) {

    config_.validate_or_throw("Runtime");

    for (const auto& [name, max_holders] : config_.slots) {
        slots_[name].max_holders = max_holders;
    }

    worker_pool_.set_report_mode(config_.logging.daemon_report_mode);
}

Runtime::~Runtime() {
    if (started_.load()) {
        shutdown();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void Runtime::apply_logging_config() {
    LoggerFactory::set_global_level(config_.logging.level);
    if (config_.logging.json) {
        LoggerFactory::set_default_formatter(std::make_shared<JsonFormatter>());
    }
}

void Runtime::start() {
    if (started_.exchange(true)) {
        throw SchedulerException("Runtime", "Already started");
    }

    apply_logging_config();

    {
        std::lock_guard lock(sleep_mutex_);
        last_sleep_check_ = std::chrono::system_clock::now();
    }

    registry_.open();
    running_.store(true);

    fast_scheduler_->start();
    slow_scheduler_->start();

    {
        std::lock_guard lock(daemons_mutex_);
        for (auto& daemon : daemons_) {
            if (!daemon->is_started()) {
                daemon->start();
            }
        }
    }

    auto check_period = std::chrono::duration_cast<Seconds>(config_.sleep.check_period);
    sleep_check_job_ = call_repeating(check_period, check_period, [this] { sleep_check(); });

    logger_->with_field("slots", config_.slots.size()).info("Runtime started");
}

void Runtime::shutdown_view() {
    if (view_shutdown_.exchange(true)) {
        return;
    }

    logger_->info("Shutting down view");
    event_bus_.publish(topics::WAKE_DAEMONS);
}

void Runtime::shutdown_model() {
    if (model_shutdown_.exchange(true)) {
        return;
    }

    logger_->info("Shutting down model");

    if (sleep_check_job_) {
        sleep_check_job_->cancel();
    }

    event_bus_.publish(topics::SHUTDOWN);

    fast_scheduler_->stop();
    slow_scheduler_->stop();

    {
        std::lock_guard lock(daemons_mutex_);
        for (auto& daemon : daemons_) {
            daemon->shutdown();
        }
        for (auto& daemon : daemons_) {
            daemon->join();
        }
    }

    worker_pool_.shutdown();
    registry_.close();
    running_.store(false);

    logger_->with_field("reported_errors", reported_errors_.load()).info("Runtime shut down");
}

void Runtime::shutdown() {
    shutdown_view();
    shutdown_model();
}

// ============================================================================
// Work Submission
// ============================================================================

void Runtime::call_to_thread(std::function<void()> action) {
    if (!running_.load()) {
        throw SchedulerException("Runtime", "Not running");
    }

    worker_pool_.submit(std::move(action));
}

JobScheduler& Runtime::scheduler_for(Seconds initial_delay) {
    auto threshold = std::chrono::duration_cast<Seconds>(config_.scheduler.fast_scheduler_threshold);
    return initial_delay <= threshold ? *fast_scheduler_ : *slow_scheduler_;
}

Daemon& Runtime::add_daemon(std::unique_ptr<Daemon> daemon) {
    if (!daemon) {
        throw SchedulerException("Runtime", "Cannot add a null daemon");
    }

    daemon->set_report_mode(config_.logging.daemon_report_mode);

    std::lock_guard lock(daemons_mutex_);
    if (running_.load() && !daemon->is_started()) {
        daemon->start();
    }

    daemons_.push_back(std::move(daemon));
    return *daemons_.back();
}

PeriodicWorkerOptions Runtime::worker_options() const {
    PeriodicWorkerOptions options;
    options.poll_interval = config_.worker.daemon_poll_interval;
    return options;
}

ProcessResult Runtime::run_subprocess(const std::vector<std::string>& argv) {
    auto child = ChildProcess::spawn(argv);
    return communicate(child, *this, config_.subprocess.poll_timeout);
}

// ============================================================================
// Admission Control
// ============================================================================

bool Runtime::acquire_slot(const std::string& slot_type) {
    std::lock_guard lock(slots_mutex_);
    auto it = slots_.find(slot_type);
    if (it == slots_.end()) {
        return true;
    }

    auto& slot = it->second;
    if (slot.holders >= slot.max_holders) {
        return false;
    }

    ++slot.holders;
    return true;
}

void Runtime::release_slot(const std::string& slot_type) {
    std::lock_guard lock(slots_mutex_);
    auto it = slots_.find(slot_type);
    if (it != slots_.end() && it->second.holders > 0) {
        --it->second.holders;
    }
}

void Runtime::set_slot_limit(const std::string& slot_type, std::size_t max_holders) {
    std::lock_guard lock(slots_mutex_);
    slots_[slot_type].max_holders = max_holders;
}

std::size_t Runtime::slot_usage(const std::string& slot_type) const {
    std::lock_guard lock(slots_mutex_);
    auto it = slots_.find(slot_type);
    return it == slots_.end() ? 0 : it->second.holders;
}

bool Runtime::good_time_for_background_work() {
    return is_idle() && !(just_woke_from_sleep() || is_system_busy());
}

bool Runtime::good_time_for_foreground_work() {
    return !(just_woke_from_sleep() || is_system_busy());
}

// ============================================================================
// Sleep Detection
// ============================================================================

bool Runtime::just_woke_from_sleep() {
    std::lock_guard lock(sleep_mutex_);
    return Clock::now() < woke_until_;
}

void Runtime::sleep_check() {
    sleep_check(std::chrono::system_clock::now());
}

void Runtime::sleep_check(std::chrono::system_clock::time_point now) {
    bool resumed = false;
    {
        std::lock_guard lock(sleep_mutex_);
        if (now - last_sleep_check_ > config_.sleep.sleep_threshold) {
            woke_until_ = Clock::now() + config_.sleep.awake_grace;
            resumed = true;
        }
        last_sleep_check_ = now;
    }

    if (resumed) {
        logger_->info("Detected a resume from sleep");
    }
}

void Runtime::note_resume() {
    std::lock_guard lock(sleep_mutex_);
    woke_until_ = Clock::now() + config_.sleep.awake_grace;
}

// ============================================================================
// Reporting
// ============================================================================

void Runtime::report_exception(const std::string& context, std::exception_ptr error) {
    ++reported_errors_;
    logger_->with_field("context", context).error("Unhandled exception: " + describe_exception(error));
}

nlohmann::json Runtime::diagnostic_report() const {
    nlohmann::json report;

    report["running"] = is_running();
    report["fast_exit"] = is_fast_exiting();
    report["view_shutting_down"] = is_view_shutting_down();
    report["model_shutting_down"] = is_model_shutting_down();
    report["idle"] = is_idle();
    report["system_busy"] = is_system_busy();
    report["reported_errors"] = reported_error_count();
    report["registered_threads"] = registry_.size();

    {
        std::lock_guard lock(slots_mutex_);
        nlohmann::json slots = nlohmann::json::object();
        for (const auto& [name, slot] : slots_) {
            slots[name] = {{"max", slot.max_holders}, {"in_use", slot.holders}};
        }
        report["slots"] = slots;
    }

    nlohmann::json pool = nlohmann::json::array();
    for (const auto& [name, job] : worker_pool_.summaries()) {
        pool.push_back({{"name", name}, {"job", job}});
    }
    report["worker_pool"] = pool;

    nlohmann::json schedulers = nlohmann::json::array();
    for (const auto* scheduler : {fast_scheduler_.get(), slow_scheduler_.get()}) {
        auto stats = scheduler->stats();
        schedulers.push_back({
            {"name", scheduler->name()},
            {"pending", scheduler->size()},
            {"dispatched", stats.dispatched},
            {"admission_deferrals", stats.admission_deferrals},
            {"cancelled_dropped", stats.cancelled_dropped}
        });
    }
    report["schedulers"] = schedulers;

    nlohmann::json daemons = nlohmann::json::array();
    {
        std::lock_guard lock(daemons_mutex_);
        for (const auto& daemon : daemons_) {
            daemons.push_back({
                {"name", daemon->name()},
                {"alive", daemon->is_alive()},
                {"job", daemon->current_job_summary()}
            });
        }
    }
    report["daemons"] = daemons;

    return report;
}

} // namespace cadence
