#include "cadence/runtime/schedulable_job.h"
#include "cadence/core/exceptions.h"
#include "cadence/runtime/job_scheduler.h"
#include "cadence/utils/logger.h"

#include <thread>

namespace cadence {

namespace {

constexpr std::chrono::seconds WAKEUP_POLL_INTERVAL{1};
constexpr double PERIOD_JITTER_THRESHOLD_SECONDS = 10.0;

/**
 * @brief Runs a cleanup callable on scope exit
 */
template<typename F>
class ScopeExit {
public:
    explicit ScopeExit(F f) : f_(std::move(f)) {}
    ~ScopeExit() { f_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    F f_;
};

} // anonymous namespace

SchedulableJob::SchedulableJob(IController& controller, JobScheduler& scheduler, Seconds initial_delay,
                               WorkCallable work, std::string name)
    : controller_(controller)
    , scheduler_(scheduler)
    , work_(std::move(work))
    , name_(name.empty() ? std::string("unnamed job") : std::move(name))
    , next_work_time_(time_after(initial_delay)) {
}

SchedulableJob::~SchedulableJob() {
    std::vector<SubscriptionId> subscriptions;
    {
        std::lock_guard lock(state_mutex_);
        subscriptions.swap(subscriptions_);
    }

    for (auto id : subscriptions) {
        controller_.event_bus().unsubscribe(id);
    }
}

// ============================================================================
// Scheduling
// ============================================================================

void SchedulableJob::wake(std::optional<TimePoint> next_time) {
    set_next_work_time(next_time.value_or(Clock::now()));
    scheduler_.work_times_have_changed();
}

void SchedulableJob::cancel() {
    cancelled_.store(true);
    scheduler_.job_cancelled();
}

void SchedulableJob::set_thread_slot_type(std::string slot_type) {
    std::lock_guard lock(state_mutex_);
    slot_type_ = std::move(slot_type);
}

std::optional<std::string> SchedulableJob::thread_slot_type() const {
    std::lock_guard lock(state_mutex_);
    return slot_type_;
}

void SchedulableJob::wake_on_topic(const std::string& topic) {
    std::weak_ptr<SchedulableJob> weak_self = weak_from_this();
    auto id = controller_.event_bus().subscribe(topic, [weak_self](const std::any&) {
        if (auto self = weak_self.lock()) {
            self->wake();
        }
    });

    std::lock_guard lock(state_mutex_);
    subscriptions_.push_back(id);
}

bool SchedulableJob::check_admission() {
    auto slot_type = thread_slot_type();
    if (!slot_type) {
        return true;
    }

    if (controller_.acquire_slot(*slot_type)) {
        slot_held_.store(true);
        return true;
    }

    const auto& config = scheduler_.config();
    Seconds retry = std::chrono::duration_cast<Seconds>(config.slot_retry_delay)
        + std::chrono::duration_cast<Seconds>(config.slot_retry_jitter) * random_unit();
    set_next_work_time(time_after(retry));

    LoggerFactory::get_logger("cadence.job")
        ->with_field("slot", *slot_type)
        .debug(name_ + " refused a slot, retrying in " + pretty_time_delta(retry));
    return false;
}

void SchedulableJob::start_work() {
    if (is_cancelled()) {
        release_slot_if_held();
        return;
    }

    currently_working_.store(true);

    auto self = shared_from_this();
    try {
        controller_.call_to_thread([self] { self->work(); });
    } catch (...) {
        currently_working_.store(false);
        release_slot_if_held();
        throw;
    }
}

// ============================================================================
// Execution
// ============================================================================

void SchedulableJob::work() {
    execute();
}

void SchedulableJob::execute() {
    auto cleanup = [this] {
        release_slot_if_held();
        currently_working_.store(false);
    };
    ScopeExit<decltype(cleanup)> guard(cleanup);

    if (should_delay_on_wakeup()) {
        while (controller_.just_woke_from_sleep()) {
            if (scheduler_.registry().is_shutting_down()) {
                return;
            }
            std::this_thread::sleep_for(WAKEUP_POLL_INTERVAL);
        }
    }

    std::lock_guard lock(work_lock_);
    work_();
}

void SchedulableJob::release_slot_if_held() {
    if (!slot_held_.exchange(false)) {
        return;
    }

    if (auto slot_type = thread_slot_type()) {
        controller_.release_slot(*slot_type);
    }
}

// ============================================================================
// Diagnostics
// ============================================================================

std::string SchedulableJob::to_string() const {
    Seconds delta = time_until_due();
    if (delta <= Seconds::zero()) {
        return name_ + ": due";
    }
    return name_ + ": next in " + pretty_time_delta(delta);
}

nlohmann::json SchedulableJob::to_json() const {
    nlohmann::json record = {
        {"name", name_},
        {"kind", kind()},
        {"seconds_until_due", time_until_due().count()},
        {"cancelled", is_cancelled()},
        {"working", is_currently_working()}
    };

    if (auto slot_type = thread_slot_type()) {
        record["slot_type"] = *slot_type;
    } else {
        record["slot_type"] = nullptr;
    }

    return record;
}

// ============================================================================
// SingleJob
// ============================================================================

void SingleJob::work() {
    try {
        execute();
    } catch (const ShutdownSignal&) {
        throw;
    } catch (...) {
        work_complete_.set();
        throw;
    }

    work_complete_.set();
}

nlohmann::json SingleJob::to_json() const {
    auto record = SchedulableJob::to_json();
    record["complete"] = is_work_complete();
    return record;
}

// ============================================================================
// RepeatingJob
// ============================================================================

RepeatingJob::RepeatingJob(IController& controller, JobScheduler& scheduler, Seconds initial_delay,
                           Seconds period, WorkCallable work, std::string name)
    : SchedulableJob(controller, scheduler, initial_delay, std::move(work), std::move(name)) {
    set_period(period);
}

void RepeatingJob::cancel() {
    stop_repeating_.store(true);
    SchedulableJob::cancel();
}

void RepeatingJob::start_work() {
    if (stop_repeating_.load()) {
        release_slot_if_held();
        return;
    }

    SchedulableJob::start_work();
}

void RepeatingJob::delay(Seconds delay) {
    set_next_work_time(time_after(delay));
    scheduler().work_times_have_changed();
}

void RepeatingJob::set_period(Seconds period) {
    if (period.count() > PERIOD_JITTER_THRESHOLD_SECONDS) {
        // spread out jobs that share a period
        period += Seconds(random_unit());
    }

    std::lock_guard lock(period_mutex_);
    period_ = period;
}

Seconds RepeatingJob::period() const {
    std::lock_guard lock(period_mutex_);
    return period_;
}

void RepeatingJob::work() {
    try {
        execute();
    } catch (const ShutdownSignal&) {
        throw;
    } catch (...) {
        reschedule();
        throw;
    }

    reschedule();
}

void RepeatingJob::reschedule() {
    if (stop_repeating_.load()) {
        return;
    }

    set_next_work_time(time_after(period()));
    scheduler().add_job(shared_from_this());
}

nlohmann::json RepeatingJob::to_json() const {
    auto record = SchedulableJob::to_json();
    record["period_seconds"] = period().count();
    record["finished"] = is_repeating_work_finished();
    return record;
}

} // namespace cadence
