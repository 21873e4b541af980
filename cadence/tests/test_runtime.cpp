#include "cadence/core/exceptions.h"
#include "cadence/runtime/runtime.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

using namespace cadence;
using namespace cadence::test_support;
using namespace std::chrono_literals;

namespace {

RuntimeConfig quick_config() {
    auto config = RuntimeConfig::defaults();
    config.scheduler = fast_scheduler_config();
    config.worker.idle_wait = 20ms;
    config.worker.dequeue_timeout = 20ms;
    config.worker.daemon_poll_interval = 10ms;
    config.slots["io"] = 1;
    return config;
}

} // anonymous namespace

class RuntimeTest : public ::testing::Test {
protected:
    Runtime runtime{quick_config()};
};

// ============================================================================
// Admission Control
// ============================================================================

TEST_F(RuntimeTest, SlotsLimitConcurrentHolders) {
    EXPECT_TRUE(runtime.acquire_slot("io"));
    EXPECT_FALSE(runtime.acquire_slot("io"));
    EXPECT_EQ(runtime.slot_usage("io"), 1u);

    runtime.release_slot("io");
    EXPECT_EQ(runtime.slot_usage("io"), 0u);
    EXPECT_TRUE(runtime.acquire_slot("io"));

    runtime.set_slot_limit("io", 2);
    EXPECT_TRUE(runtime.acquire_slot("io"));
    EXPECT_EQ(runtime.slot_usage("io"), 2u);
}

TEST_F(RuntimeTest, UnknownSlotsAreUnlimited) {
    for (int i = 0; i < 50; ++i) {
        EXPECT_TRUE(runtime.acquire_slot("unconfigured"));
    }
    EXPECT_EQ(runtime.slot_usage("unconfigured"), 0u);
    EXPECT_NO_THROW(runtime.release_slot("unconfigured"));
}

TEST_F(RuntimeTest, ReleaseNeverGoesNegative) {
    runtime.release_slot("io");
    EXPECT_EQ(runtime.slot_usage("io"), 0u);
    EXPECT_TRUE(runtime.acquire_slot("io"));
    EXPECT_FALSE(runtime.acquire_slot("io"));
}

TEST_F(RuntimeTest, GoodTimePredicates) {
    EXPECT_TRUE(runtime.good_time_for_background_work());
    EXPECT_TRUE(runtime.good_time_for_foreground_work());

    runtime.set_idle(false);
    EXPECT_FALSE(runtime.good_time_for_background_work());
    EXPECT_TRUE(runtime.good_time_for_foreground_work());

    runtime.set_idle(true);
    runtime.set_system_busy(true);
    EXPECT_FALSE(runtime.good_time_for_background_work());
    EXPECT_FALSE(runtime.good_time_for_foreground_work());

    runtime.set_system_busy(false);
    runtime.note_resume();
    EXPECT_TRUE(runtime.just_woke_from_sleep());
    EXPECT_FALSE(runtime.good_time_for_background_work());
    EXPECT_FALSE(runtime.good_time_for_foreground_work());
}

// ============================================================================
// Sleep Detection
// ============================================================================

TEST_F(RuntimeTest, SleepCheckDetectsWallClockGap) {
    auto now = std::chrono::system_clock::now();

    runtime.sleep_check(now + std::chrono::seconds(15));
    EXPECT_FALSE(runtime.just_woke_from_sleep());

    // ten minute threshold
    runtime.sleep_check(now + std::chrono::minutes(30));
    EXPECT_TRUE(runtime.just_woke_from_sleep());
}

TEST_F(RuntimeTest, ResumeGraceExpires) {
    auto config = quick_config();
    config.sleep.awake_grace = 50ms;
    Runtime short_grace(config);

    short_grace.note_resume();
    EXPECT_TRUE(short_grace.just_woke_from_sleep());
    EXPECT_TRUE(wait_until([&] { return !short_grace.just_woke_from_sleep(); }, 1s));
}

// ============================================================================
// Work Submission
// ============================================================================

TEST_F(RuntimeTest, CallToThreadRequiresRunningRuntime) {
    EXPECT_FALSE(runtime.is_running());
    EXPECT_THROW(runtime.call_to_thread([] {}), SchedulerException);
}

TEST_F(RuntimeTest, CallToThreadRunsOnPoolThread) {
    runtime.start();

    std::atomic<bool> ran{false};
    std::thread::id worker_id;
    std::mutex mutex;
    runtime.call_to_thread([&] {
        std::lock_guard lock(mutex);
        worker_id = std::this_thread::get_id();
        ran = true;
    });

    ASSERT_TRUE(wait_until([&] { return ran.load(); }));
    std::lock_guard lock(mutex);
    EXPECT_NE(worker_id, std::this_thread::get_id());
}

TEST_F(RuntimeTest, CallToThreadBindsArguments) {
    runtime.start();

    std::atomic<int> total{0};
    runtime.call_to_thread([&total](int a, int b) { total = a * b; }, 6, 7);
    EXPECT_TRUE(wait_until([&] { return total.load() == 42; }));
}

TEST_F(RuntimeTest, CallLaterRunsOnceAfterDelay) {
    runtime.start();

    std::atomic<int> runs{0};
    auto start = std::chrono::steady_clock::now();
    auto job = runtime.call_later(Seconds(0.05), [&runs] { ++runs; });

    ASSERT_TRUE(job->wait_until_complete(5s));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(job->name(), "delayed call");
    EXPECT_GE(runtime.fast_scheduler().stats().dispatched, 1u);
}

TEST_F(RuntimeTest, CallLaterBindsArguments) {
    runtime.start();

    std::atomic<int> seen{0};
    auto job = runtime.call_later(Seconds(0.0), [&seen](int value) { seen = value; }, 17);
    ASSERT_TRUE(job->wait_until_complete(5s));
    EXPECT_EQ(seen.load(), 17);
}

TEST_F(RuntimeTest, LongDelaysGoToSlowScheduler) {
    EXPECT_EQ(&runtime.scheduler_for(Seconds(0.0)), &runtime.fast_scheduler());
    EXPECT_EQ(&runtime.scheduler_for(Seconds(1.0)), &runtime.fast_scheduler());
    EXPECT_EQ(&runtime.scheduler_for(Seconds(1.5)), &runtime.slow_scheduler());

    auto job = runtime.call_later(Seconds(3600.0), [] {});
    EXPECT_EQ(runtime.slow_scheduler().size(), 1u);
    EXPECT_EQ(runtime.fast_scheduler().size(), 0u);
    job->cancel();
}

TEST_F(RuntimeTest, CallRepeatingRunsUntilCancelled) {
    runtime.start();

    std::atomic<int> runs{0};
    auto job = runtime.call_repeating(Seconds(0.0), Seconds(0.02), [&runs] { ++runs; });
    EXPECT_EQ(job->name(), "repeating call");

    ASSERT_TRUE(wait_until([&] { return runs.load() >= 3; }));
    job->cancel();
    EXPECT_TRUE(job->is_repeating_work_finished());

    EXPECT_TRUE(wait_until([&] { return !job->is_currently_working(); }));
    int settled = runs.load();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(runs.load(), settled);
}

TEST_F(RuntimeTest, SlotLimitedJobsRunOneAtATime) {
    runtime.start();

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> finished{0};
    auto work = [&] {
        int now = ++active;
        int expected = peak.load();
        while (now > expected && !peak.compare_exchange_weak(expected, now)) {
        }
        std::this_thread::sleep_for(20ms);
        --active;
        ++finished;
    };

    std::vector<std::shared_ptr<SchedulableJob>> jobs;
    for (int i = 0; i < 3; ++i) {
        auto job = std::make_shared<SchedulableJob>(runtime, runtime.fast_scheduler(), Seconds(0.0), work);
        job->set_thread_slot_type("io");
        runtime.fast_scheduler().add_job(job);
        jobs.push_back(job);
    }

    ASSERT_TRUE(wait_until([&] { return finished.load() == 3; }));
    EXPECT_EQ(peak.load(), 1);
    EXPECT_GE(runtime.fast_scheduler().stats().admission_deferrals, 1u);
    EXPECT_TRUE(wait_until([&] { return runtime.slot_usage("io") == 0; }));
}

TEST_F(RuntimeTest, WorkerOptionsCarryPollInterval) {
    auto options = runtime.worker_options();
    EXPECT_EQ(options.poll_interval, 10ms);
}

TEST_F(RuntimeTest, AddedDaemonStartsWithRuntime) {
    std::atomic<int> calls{0};
    auto options = runtime.worker_options();
    options.initial_delay = Seconds(0.0);
    options.period = Seconds(0.02);

    auto& daemon = runtime.add_daemon(std::make_unique<PeriodicWorker>(
        runtime, runtime.registry(), "Stats Flusher", [&calls](IController&) { ++calls; }, options));
    EXPECT_FALSE(daemon.is_started());

    runtime.start();
    EXPECT_TRUE(daemon.is_started());
    EXPECT_TRUE(wait_until([&] { return calls.load() >= 2; }));
}

TEST_F(RuntimeTest, BackgroundDaemonHonoursIdleFlag) {
    runtime.set_idle(false);
    runtime.start();

    std::atomic<int> calls{0};
    auto options = runtime.worker_options();
    options.initial_delay = Seconds(0.0);
    runtime.add_daemon(PeriodicWorker::background(runtime, runtime.registry(), "Vacuum",
                                                  [&calls](IController&) { ++calls; }, options));

    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(calls.load(), 0);

    runtime.set_idle(true);
    EXPECT_TRUE(wait_until([&] { return calls.load() >= 1; }));
}

// ============================================================================
// Shutdown and Reporting
// ============================================================================

TEST_F(RuntimeTest, ExceptionsFromPoolWorkAreReported) {
    runtime.start();
    runtime.call_to_thread([] { throw std::runtime_error("corrupt entry"); });

    EXPECT_TRUE(wait_until([&] { return runtime.reported_error_count() == 1; }));
}

TEST_F(RuntimeTest, ViewShutdownStopsDaemonsButNotSchedulers) {
    runtime.start();

    auto options = runtime.worker_options();
    auto& daemon = runtime.add_daemon(std::make_unique<PeriodicWorker>(
        runtime, runtime.registry(), "UI Refresh", [](IController&) {}, options));
    ASSERT_TRUE(wait_until([&] { return daemon.is_alive(); }));

    runtime.shutdown_view();
    EXPECT_TRUE(wait_until([&] { return !daemon.is_alive(); }, 2s));
    EXPECT_TRUE(runtime.fast_scheduler().is_alive());
    EXPECT_TRUE(runtime.is_running());
}

TEST_F(RuntimeTest, ShutdownStopsEverything) {
    runtime.start();
    EXPECT_TRUE(runtime.is_running());
    EXPECT_TRUE(runtime.registry().is_open());

    auto options = runtime.worker_options();
    auto& daemon = runtime.add_daemon(std::make_unique<PeriodicWorker>(
        runtime, runtime.registry(), "Indexer", [](IController&) {}, options));
    runtime.call_to_thread([] {});

    auto start = std::chrono::steady_clock::now();
    runtime.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);

    EXPECT_FALSE(runtime.is_running());
    EXPECT_TRUE(runtime.is_view_shutting_down());
    EXPECT_TRUE(runtime.is_model_shutting_down());
    EXPECT_FALSE(runtime.registry().is_open());
    EXPECT_FALSE(daemon.is_alive());
    EXPECT_FALSE(runtime.fast_scheduler().is_alive());
    EXPECT_FALSE(runtime.slow_scheduler().is_alive());
    EXPECT_EQ(runtime.worker_pool().size(), 0u);

    EXPECT_THROW(runtime.call_to_thread([] {}), SchedulerException);
    EXPECT_THROW(runtime.start(), SchedulerException);
    EXPECT_NO_THROW(runtime.shutdown());
}

TEST_F(RuntimeTest, DiagnosticReportDescribesState) {
    runtime.start();
    runtime.acquire_slot("io");
    auto job = runtime.call_later(Seconds(3600.0), [] {});

    auto report = runtime.diagnostic_report();
    EXPECT_TRUE(report["running"].get<bool>());
    EXPECT_FALSE(report["model_shutting_down"].get<bool>());
    EXPECT_TRUE(report["idle"].get<bool>());
    EXPECT_EQ(report["slots"]["io"]["max"], 1);
    EXPECT_EQ(report["slots"]["io"]["in_use"], 1);
    EXPECT_EQ(report["slots"]["misc"]["max"], 10);

    ASSERT_EQ(report["schedulers"].size(), 2u);
    EXPECT_EQ(report["schedulers"][0]["name"], "Fast Job Scheduler");
    EXPECT_EQ(report["schedulers"][1]["name"], "Slow Job Scheduler");
    // the sleep check job plus ours
    EXPECT_EQ(report["schedulers"][1]["pending"], 2);

    EXPECT_TRUE(report["worker_pool"].is_array());
    EXPECT_TRUE(report["daemons"].is_array());

    job->cancel();
    runtime.release_slot("io");
}

TEST_F(RuntimeTest, InvalidConfigIsRejected) {
    auto config = quick_config();
    config.scheduler.max_jobs_per_tick = 0;
    EXPECT_THROW(Runtime rejected(config), ConfigException);
}

TEST_F(RuntimeTest, RunSubprocessCollectsOutput) {
    auto result = runtime.run_subprocess({"sh", "-c", "echo cadence; exit 3"});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_data, "cadence\n");
}
