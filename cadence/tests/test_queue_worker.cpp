#include "cadence/core/exceptions.h"
#include "cadence/runtime/queue_worker.h"
#include "cadence/runtime/worker_pool.h"
#include "cadence/utils/logger.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace cadence;
using namespace cadence::test_support;
using namespace std::chrono_literals;

class QueueWorkerTest : public ::testing::Test {
protected:
    QueueWorkerTest() : registry(controller) {}

    void SetUp() override { registry.open(); }

    static WorkerConfig quick_worker_config(std::size_t max_workers = 200) {
        WorkerConfig config;
        config.idle_wait = 20ms;
        config.dequeue_timeout = 20ms;
        config.max_pool_workers = max_workers;
        return config;
    }

    FakeController controller;
    ThreadRegistry registry;
};

TEST_F(QueueWorkerTest, RunsActionsInSubmissionOrder) {
    QueueWorker worker(controller, registry, "Ordered", 20ms, 20ms);

    std::mutex mutex;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        worker.put([&, i] {
            std::lock_guard lock(mutex);
            order.push_back(i);
        });
    }
    worker.start();

    EXPECT_TRUE(wait_until([&] {
        std::lock_guard lock(mutex);
        return order.size() == 5;
    }));
    std::lock_guard lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(QueueWorkerTest, SubmitBindsArguments) {
    QueueWorker worker(controller, registry, "Binder", 20ms, 20ms);
    worker.start();

    std::atomic<int> total{0};
    worker.submit([&total](int a, int b) { total = a + b; }, 20, 22);

    EXPECT_TRUE(wait_until([&] { return total.load() == 42; }));
}

TEST_F(QueueWorkerTest, BusyFlagTracksQueuedAndRunningWork) {
    QueueWorker worker(controller, registry, "Busy", 20ms, 20ms);
    worker.start();

    std::atomic<bool> release{false};
    std::atomic<bool> running{false};
    worker.put([&] {
        running = true;
        while (!release) {
            std::this_thread::sleep_for(1ms);
        }
    }, "long copy");

    EXPECT_TRUE(worker.is_currently_working());
    ASSERT_TRUE(wait_until([&] { return running.load(); }));
    EXPECT_EQ(worker.current_job_summary(), "long copy");

    release = true;
    EXPECT_TRUE(wait_until([&] { return !worker.is_currently_working(); }));
    EXPECT_EQ(worker.current_job_summary(), "idle");
    EXPECT_EQ(worker.pending(), 0u);
}

TEST_F(QueueWorkerTest, ExceptionIsReportedAndWorkerContinues) {
    QueueWorker worker(controller, registry, "Survivor", 20ms, 20ms);
    worker.start();

    std::atomic<bool> second_ran{false};
    worker.put([] { throw std::runtime_error("bad file"); });
    worker.put([&second_ran] { second_ran = true; });

    EXPECT_TRUE(wait_until([&] { return second_ran.load(); }));
    EXPECT_TRUE(worker.is_alive());
    ASSERT_EQ(controller.reported_count(), 1u);
    EXPECT_NE(controller.reported[0].find("bad file"), std::string::npos);
    EXPECT_TRUE(wait_until([&] { return !worker.is_currently_working(); }));
}

TEST_F(QueueWorkerTest, ShutdownSignalFromActionEndsWorker) {
    QueueWorker worker(controller, registry, "Quitter", 20ms, 20ms);
    worker.start();

    worker.put([] { throw ShutdownSignal(); });

    EXPECT_TRUE(wait_until([&] { return !worker.is_alive(); }));
    EXPECT_EQ(controller.reported_count(), 0u);
    EXPECT_FALSE(worker.is_currently_working());
}

TEST_F(QueueWorkerTest, IdleWorkerStopsOnViewShutdown) {
    QueueWorker worker(controller, registry, "Idle", 20ms, 20ms);
    worker.start();
    ASSERT_TRUE(wait_until([&] { return worker.is_alive(); }));

    controller.view_shutdown = true;
    EXPECT_TRUE(wait_until([&] { return !worker.is_alive(); }, 2s));
}

// ============================================================================
// WorkerPool
// ============================================================================

TEST_F(QueueWorkerTest, PoolReusesIdleWorker) {
    WorkerPool pool(controller, registry, quick_worker_config());

    std::atomic<int> done{0};
    pool.submit([&done] { ++done; }, "first");
    ASSERT_TRUE(wait_until([&] { return done.load() == 1 && pool.busy_count() == 0; }));

    pool.submit([&done] { ++done; }, "second");
    EXPECT_TRUE(wait_until([&] { return done.load() == 2; }));
    EXPECT_EQ(pool.size(), 1u);
}

TEST_F(QueueWorkerTest, PoolGrowsWhileWorkersAreBusy) {
    WorkerPool pool(controller, registry, quick_worker_config());

    std::atomic<bool> release{false};
    std::atomic<int> started{0};
    auto blocking = [&] {
        ++started;
        while (!release) {
            std::this_thread::sleep_for(1ms);
        }
    };

    pool.submit(blocking);
    pool.submit(blocking);
    pool.submit(blocking);

    EXPECT_EQ(pool.size(), 3u);
    EXPECT_TRUE(wait_until([&] { return started.load() == 3; }));
    EXPECT_EQ(pool.busy_count(), 3u);

    release = true;
    EXPECT_TRUE(wait_until([&] { return pool.busy_count() == 0; }));
}

TEST_F(QueueWorkerTest, PoolStopsGrowingAtCap) {
    WorkerPool pool(controller, registry, quick_worker_config(2));

    std::atomic<bool> release{false};
    std::atomic<int> finished{0};
    auto blocking = [&] {
        while (!release) {
            std::this_thread::sleep_for(1ms);
        }
        ++finished;
    };

    for (int i = 0; i < 5; ++i) {
        pool.submit(blocking);
    }
    EXPECT_EQ(pool.size(), 2u);

    release = true;
    EXPECT_TRUE(wait_until([&] { return finished.load() == 5; }));
}

TEST_F(QueueWorkerTest, PoolSummariesNameWorkers) {
    WorkerPool pool(controller, registry, quick_worker_config());

    std::atomic<bool> release{false};
    std::atomic<bool> running{false};
    pool.submit([&] {
        running = true;
        while (!release) {
            std::this_thread::sleep_for(1ms);
        }
    }, "thumbnail regen");
    ASSERT_TRUE(wait_until([&] { return running.load(); }));

    auto summaries = pool.summaries();
    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].first, "CallToThread 1");
    EXPECT_EQ(summaries[0].second, "thumbnail regen");

    release = true;
}

TEST_F(QueueWorkerTest, PoolRejectsWorkAfterShutdown) {
    WorkerPool pool(controller, registry, quick_worker_config());
    pool.submit([] {});
    pool.shutdown();

    EXPECT_EQ(pool.size(), 0u);
    EXPECT_THROW(pool.submit([] {}), SchedulerException);
}

TEST_F(QueueWorkerTest, PoolPrunesWorkersThatExited) {
    WorkerPool pool(controller, registry, quick_worker_config());
    pool.submit([] { throw ShutdownSignal(); });

    ASSERT_TRUE(wait_until([&] { return pool.busy_count() == 0; }));
    EXPECT_TRUE(wait_until([&] { return pool.prune_dead() == 1; }));
    EXPECT_EQ(pool.size(), 0u);

    std::atomic<bool> ran{false};
    pool.submit([&ran] { ran = true; });
    EXPECT_TRUE(wait_until([&] { return ran.load(); }));
    EXPECT_EQ(pool.size(), 1u);
}

TEST_F(QueueWorkerTest, PoolReportModeLogsEachCall) {
    auto sink = std::make_shared<MemorySink>();
    LoggerFactory::get_logger("cadence.daemon")->add_sink(sink);

    WorkerPool pool(controller, registry, quick_worker_config());
    pool.set_report_mode(true);

    std::atomic<bool> ran{false};
    pool.submit([&ran] { ran = true; });

    EXPECT_TRUE(wait_until([&] { return ran.load(); }));
    EXPECT_TRUE(wait_until([&] { return sink->contains("CallToThread 1 doing a job."); }));

    pool.shutdown();
    LoggerFactory::get_logger("cadence.daemon")->clear_sinks();
}

TEST_F(QueueWorkerTest, ReportModeOffLogsNothingPerCall) {
    auto sink = std::make_shared<MemorySink>();
    LoggerFactory::get_logger("cadence.daemon")->add_sink(sink);

    QueueWorker worker(controller, registry, "Quiet", 20ms, 20ms);
    worker.start();

    std::atomic<bool> ran{false};
    worker.put([&ran] { ran = true; });
    EXPECT_TRUE(wait_until([&] { return ran.load(); }));

    worker.stop();
    EXPECT_FALSE(sink->contains("Quiet doing a job."));
    LoggerFactory::get_logger("cadence.daemon")->clear_sinks();
}
