#include "cadence/runtime/periodic_worker.h"
#include "cadence/core/exceptions.h"

#include <algorithm>

namespace cadence {

AdmissionPolicy always_admit() {
    return [] { return true; };
}

AdmissionPolicy background_admission(IController& controller) {
    return [&controller] { return controller.good_time_for_background_work(); };
}

AdmissionPolicy foreground_admission(IController& controller) {
    return [&controller] { return controller.good_time_for_foreground_work(); };
}

PeriodicWorker::PeriodicWorker(IController& controller, ThreadRegistry& registry, std::string name,
                               WorkAction action, PeriodicWorkerOptions options,
                               AdmissionPolicy admission)
    : Daemon(controller, registry, std::move(name))
    , action_(std::move(action))
    , options_(std::move(options))
    , admission_(admission ? std::move(admission) : always_admit()) {

    for (const auto& topic : options_.topics) {
        subscribe_wake(topic);
    }
}

PeriodicWorker::~PeriodicWorker() {
    stop();
}

std::unique_ptr<PeriodicWorker> PeriodicWorker::background(IController& controller, ThreadRegistry& registry,
                                                           std::string name, WorkAction action,
                                                           PeriodicWorkerOptions options) {
    auto admission = background_admission(controller);
    return std::make_unique<PeriodicWorker>(controller, registry, std::move(name), std::move(action),
                                            std::move(options), std::move(admission));
}

std::unique_ptr<PeriodicWorker> PeriodicWorker::foreground(IController& controller, ThreadRegistry& registry,
                                                           std::string name, WorkAction action,
                                                           PeriodicWorkerOptions options) {
    auto admission = foreground_admission(controller);
    return std::make_unique<PeriodicWorker>(controller, registry, std::move(name), std::move(action),
                                            std::move(options), std::move(admission));
}

// ============================================================================
// Run Loop
// ============================================================================

void PeriodicWorker::run() {
    do_a_wait(options_.initial_delay, true);

    while (true) {
        check();
        do_a_wait(options_.pre_call_wait, false);
        check();
        wait_until_can_start();
        check();
        do_pre_call();
        call_action();
        do_a_wait(options_.period, true);
    }
}

void PeriodicWorker::do_a_wait(Seconds wait, bool event_can_wake) {
    Seconds poll = std::chrono::duration_cast<Seconds>(options_.poll_interval);
    auto deadline = time_after(wait);

    while (true) {
        check();

        Seconds remaining = time_until(deadline);
        if (remaining <= Seconds::zero()) {
            return;
        }

        Seconds slice = std::min(poll, remaining);
        if (event_can_wake) {
            if (token().wait_for(slice)) {
                check();
                return;
            }
        } else {
            token().sleep_for(slice);
        }
    }
}

void PeriodicWorker::wait_until_can_start() {
    while (!admission_()) {
        token().sleep_for(options_.poll_interval);
        check();
    }
}

void PeriodicWorker::call_action() {
    try {
        action_(controller());
        ++completed_calls_;
    } catch (const ShutdownSignal&) {
        throw;
    } catch (const std::exception& e) {
        ++failed_calls_;
        logger().with_field("daemon", name()).error("Exception in " + name() + ": " + e.what());
        controller().report_exception(name(), std::current_exception());
    } catch (...) {
        ++failed_calls_;
        logger().with_field("daemon", name()).error("Non-standard exception in " + name());
        controller().report_exception(name(), std::current_exception());
    }
}

} // namespace cadence
