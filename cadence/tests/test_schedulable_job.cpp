#include "cadence/core/exceptions.h"
#include "cadence/runtime/job_scheduler.h"
#include "cadence/runtime/runtime.h"
#include "cadence/runtime/schedulable_job.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

using namespace cadence;
using namespace cadence::test_support;
using namespace std::chrono_literals;

/**
 * Jobs here are driven by hand against a scheduler that is never started;
 * FakeController runs submitted work inline.
 */
class SchedulableJobTest : public ::testing::Test {
protected:
    SchedulableJobTest()
        : registry(controller)
        , scheduler(controller, registry, fast_scheduler_config()) {}

    void SetUp() override { registry.open(); }

    FakeController controller;
    ThreadRegistry registry;
    JobScheduler scheduler;
};

TEST_F(SchedulableJobTest, NamesAndDueTimes) {
    auto later = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(5.0), [] {}, "index");
    auto now = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(-1.0), [] {});

    EXPECT_EQ(now->name(), "unnamed job");
    EXPECT_TRUE(now->is_due());
    EXPECT_EQ(now->to_string(), "unnamed job: due");

    EXPECT_FALSE(later->is_due());
    EXPECT_EQ(later->to_string().rfind("index: next in ", 0), 0u);
    EXPECT_TRUE(*now < *later);
    EXPECT_FALSE(*later < *now);
}

TEST_F(SchedulableJobTest, WakeMakesJobDueOrMovesIt) {
    auto job = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(60.0), [] {});
    ASSERT_FALSE(job->is_due());

    job->wake();
    EXPECT_TRUE(job->is_due());

    job->wake(time_after(Seconds(30.0)));
    EXPECT_FALSE(job->is_due());
    EXPECT_GT(job->time_until_due(), Seconds(29.0));
}

TEST_F(SchedulableJobTest, JobWithoutSlotIsAlwaysAdmitted) {
    auto job = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(0.0), [] {});
    EXPECT_FALSE(job->thread_slot_type().has_value());
    EXPECT_TRUE(job->check_admission());
}

TEST_F(SchedulableJobTest, RefusedAdmissionPushesDueTimeBack) {
    controller.set_slot_limit("io", 0);
    auto job = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(-1.0), [] {});
    job->set_thread_slot_type("io");

    EXPECT_FALSE(job->check_admission());
    EXPECT_FALSE(job->is_due());

    // retry delay 50ms plus up to 10ms jitter
    EXPECT_GT(job->time_until_due(), Seconds(0.03));
    EXPECT_LE(job->time_until_due(), Seconds(0.061));
    EXPECT_EQ(controller.attempts("io"), 1u);
}

TEST_F(SchedulableJobTest, SlotIsReleasedAfterRun) {
    controller.set_slot_limit("io", 1);
    int runs = 0;
    auto job = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(0.0), [&runs] { ++runs; });
    job->set_thread_slot_type("io");

    ASSERT_TRUE(job->check_admission());
    job->start_work();

    EXPECT_EQ(runs, 1);
    EXPECT_EQ(controller.releases("io"), 1u);
    EXPECT_FALSE(job->is_currently_working());

    // the slot is free again
    EXPECT_TRUE(job->check_admission());
}

TEST_F(SchedulableJobTest, SlotIsReleasedWhenWorkThrows) {
    controller.set_slot_limit("io", 1);
    auto job = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(0.0),
                                                [] { throw std::runtime_error("io error"); });
    job->set_thread_slot_type("io");

    ASSERT_TRUE(job->check_admission());
    job->start_work();

    EXPECT_EQ(controller.releases("io"), 1u);
    EXPECT_EQ(controller.reported_count(), 1u);
    EXPECT_FALSE(job->is_currently_working());
}

TEST_F(SchedulableJobTest, CancelledJobDoesNotRun) {
    controller.set_slot_limit("io", 1);
    int runs = 0;
    auto job = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(0.0), [&runs] { ++runs; });
    job->set_thread_slot_type("io");

    ASSERT_TRUE(job->check_admission());
    job->cancel();
    job->start_work();

    EXPECT_TRUE(job->is_cancelled());
    EXPECT_EQ(runs, 0);
    EXPECT_EQ(controller.submitted.load(), 0);
    EXPECT_EQ(controller.releases("io"), 1u);
}

TEST_F(SchedulableJobTest, DelayOnWakeupSkipsWorkWhenShuttingDown) {
    ThreadRegistry closed(controller);
    JobScheduler idle_scheduler(controller, closed, fast_scheduler_config());

    int runs = 0;
    auto job = std::make_shared<SchedulableJob>(controller, idle_scheduler, Seconds(0.0),
                                                [&runs] { ++runs; });
    job->set_should_delay_on_wakeup(true);
    controller.woke_checks_remaining = 5;

    job->start_work();

    EXPECT_EQ(runs, 0);
    EXPECT_FALSE(job->is_currently_working());
}

TEST_F(SchedulableJobTest, DelayOnWakeupWaitsOutResume) {
    int runs = 0;
    auto job = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(0.0), [&runs] { ++runs; });
    job->set_should_delay_on_wakeup(true);
    controller.woke_checks_remaining = 1;

    auto start = std::chrono::steady_clock::now();
    job->start_work();

    EXPECT_EQ(runs, 1);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 900ms);
    EXPECT_EQ(controller.woke_checks_remaining.load(), 0);
}

TEST_F(SchedulableJobTest, WakeOnTopicMakesJobDue) {
    auto job = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(60.0), [] {});
    job->wake_on_topic("library_changed");
    EXPECT_EQ(controller.bus.subscriber_count("library_changed"), 1u);

    controller.bus.publish("library_changed");
    EXPECT_TRUE(job->is_due());

    job.reset();
    EXPECT_EQ(controller.bus.subscriber_count("library_changed"), 0u);
    EXPECT_NO_THROW(controller.bus.publish("library_changed"));
}

TEST_F(SchedulableJobTest, JsonDescribesJob) {
    auto job = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(10.0), [] {}, "vacuum");
    job->set_thread_slot_type("db");

    auto record = job->to_json();
    EXPECT_EQ(record["name"], "vacuum");
    EXPECT_EQ(record["kind"], "job");
    EXPECT_EQ(record["slot_type"], "db");
    EXPECT_FALSE(record["cancelled"].get<bool>());
    EXPECT_FALSE(record["working"].get<bool>());
    EXPECT_GT(record["seconds_until_due"].get<double>(), 9.0);
}

// ============================================================================
// SingleJob
// ============================================================================

TEST_F(SchedulableJobTest, SingleJobSignalsCompletion) {
    auto job = std::make_shared<SingleJob>(controller, scheduler, Seconds(0.0), [] {}, "once");
    EXPECT_FALSE(job->is_work_complete());
    EXPECT_FALSE(job->wait_until_complete(1ms));

    job->start_work();

    EXPECT_TRUE(job->is_work_complete());
    EXPECT_TRUE(job->wait_until_complete(0ms));
    EXPECT_TRUE(job->to_json()["complete"].get<bool>());
    EXPECT_EQ(job->to_json()["kind"], "single");
}

TEST_F(SchedulableJobTest, SingleJobCompletesEvenWhenWorkThrows) {
    auto job = std::make_shared<SingleJob>(controller, scheduler, Seconds(0.0),
                                           [] { throw std::runtime_error("boom"); });
    job->start_work();

    EXPECT_TRUE(job->is_work_complete());
    ASSERT_EQ(controller.reported_count(), 1u);
    EXPECT_NE(controller.reported[0].find("boom"), std::string::npos);
}

TEST_F(SchedulableJobTest, SingleJobInterruptedByShutdownIsNotComplete) {
    auto job = std::make_shared<SingleJob>(controller, scheduler, Seconds(0.0),
                                           [] { throw ShutdownSignal(); });
    job->start_work();

    EXPECT_FALSE(job->is_work_complete());
    EXPECT_EQ(controller.shutdown_signals.load(), 1);
    EXPECT_EQ(controller.reported_count(), 0u);
}

// ============================================================================
// RepeatingJob
// ============================================================================

TEST_F(SchedulableJobTest, RepeatingJobReaddsItselfAfterRun) {
    int runs = 0;
    auto job = std::make_shared<RepeatingJob>(controller, scheduler, Seconds(0.0), Seconds(5.0),
                                              [&runs] { ++runs; }, "poll feeds");
    EXPECT_EQ(job->period(), Seconds(5.0));

    job->start_work();

    EXPECT_EQ(runs, 1);
    EXPECT_EQ(scheduler.size(), 1u);
    EXPECT_GT(job->time_until_due(), Seconds(4.5));
    EXPECT_LE(job->time_until_due(), Seconds(5.0));
}

TEST_F(SchedulableJobTest, RepeatingJobReaddsItselfAfterThrow) {
    auto job = std::make_shared<RepeatingJob>(controller, scheduler, Seconds(0.0), Seconds(5.0),
                                              [] { throw std::runtime_error("feed down"); });
    job->start_work();

    EXPECT_EQ(scheduler.size(), 1u);
    EXPECT_EQ(controller.reported_count(), 1u);
    EXPECT_FALSE(job->is_repeating_work_finished());
}

TEST_F(SchedulableJobTest, CancelStopsRepeating) {
    int runs = 0;
    auto job = std::make_shared<RepeatingJob>(controller, scheduler, Seconds(0.0), Seconds(5.0),
                                              [&runs] { ++runs; });
    job->cancel();
    job->start_work();

    EXPECT_TRUE(job->is_cancelled());
    EXPECT_TRUE(job->is_repeating_work_finished());
    EXPECT_EQ(runs, 0);
    EXPECT_EQ(scheduler.size(), 0u);
}

TEST_F(SchedulableJobTest, FinishedRepeatingJobReleasesSlotWithoutSubmitting) {
    controller.set_slot_limit("io", 1);
    int runs = 0;
    auto job = std::make_shared<RepeatingJob>(controller, scheduler, Seconds(0.0), Seconds(5.0),
                                              [&runs] { ++runs; });
    job->set_thread_slot_type("io");

    ASSERT_TRUE(job->check_admission());
    job->cancel();
    job->start_work();

    EXPECT_EQ(runs, 0);
    EXPECT_EQ(controller.submitted.load(), 0);
    EXPECT_EQ(controller.releases("io"), 1u);
    EXPECT_FALSE(job->is_currently_working());

    // the slot is free for the next job
    auto next = std::make_shared<SchedulableJob>(controller, scheduler, Seconds(0.0), [] {});
    next->set_thread_slot_type("io");
    EXPECT_TRUE(next->check_admission());
}

TEST_F(SchedulableJobTest, CancelDuringRunPreventsReschedule) {
    std::shared_ptr<RepeatingJob> job;
    job = std::make_shared<RepeatingJob>(controller, scheduler, Seconds(0.0), Seconds(5.0),
                                         [&job] { job->cancel(); });
    job->start_work();

    EXPECT_TRUE(job->is_repeating_work_finished());
    EXPECT_EQ(scheduler.size(), 0u);
}

TEST_F(SchedulableJobTest, LongPeriodsGetJitter) {
    auto job = std::make_shared<RepeatingJob>(controller, scheduler, Seconds(0.0), Seconds(10.0), [] {});
    EXPECT_EQ(job->period(), Seconds(10.0));

    job->set_period(Seconds(20.0));
    EXPECT_GE(job->period(), Seconds(20.0));
    EXPECT_LT(job->period(), Seconds(21.0));
}

TEST_F(SchedulableJobTest, DelayPushesNextRun) {
    auto job = std::make_shared<RepeatingJob>(controller, scheduler, Seconds(0.0), Seconds(5.0), [] {});
    job->delay(Seconds(120.0));

    EXPECT_FALSE(job->is_due());
    EXPECT_GT(job->time_until_due(), Seconds(119.0));

    auto record = job->to_json();
    EXPECT_EQ(record["kind"], "repeating");
    EXPECT_DOUBLE_EQ(record["period_seconds"].get<double>(), 5.0);
    EXPECT_FALSE(record["finished"].get<bool>());
    EXPECT_TRUE(record["slot_type"].is_null());
}

// ============================================================================
// Pool Execution
// ============================================================================

TEST(SchedulableJobPoolTest, ResubmittedJobNeverRunsConcurrently) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<int> runs{0};

    auto config = RuntimeConfig::defaults();
    config.scheduler = fast_scheduler_config();
    config.worker.idle_wait = 20ms;
    config.worker.dequeue_timeout = 20ms;
    Runtime runtime(config);
    runtime.start();

    auto job = std::make_shared<SchedulableJob>(runtime, runtime.fast_scheduler(), Seconds(0.0), [&] {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(50ms);
        --running;
        ++runs;
    }, "reentrant");

    job->start_work();
    job->start_work();

    EXPECT_TRUE(wait_until([&] { return runs.load() == 2; }));
    EXPECT_EQ(peak.load(), 1);
    // the second submission went to a second pool thread
    EXPECT_EQ(runtime.worker_pool().size(), 2u);

    runtime.shutdown();
}
