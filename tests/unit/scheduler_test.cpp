#include <gtest/gtest.h>
#include "scheduler.hpp"
#include "utils/test_utils.hpp"
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

class SchedulerTest : public ::testing::Test {
protected:
    SchedulerTest()
        : registry(std::vector<ServiceEntry>{{"a", "http://a"}, {"b", "http://b"}}),
          executor(prober, 1000ms),
          cache(std::make_shared<ResultCache>(registry, executor, 5000ms)) {}

    ScriptedProber prober;
    ServiceRegistry registry;
    FanoutExecutor executor;
    std::shared_ptr<ResultCache> cache;
};

TEST_F(SchedulerTest, RefreshesEveryInterval) {
    Scheduler scheduler(cache, 40ms);
    scheduler.start();
    EXPECT_TRUE(scheduler.is_running());

    std::this_thread::sleep_for(300ms);
    scheduler.stop();

    EXPECT_FALSE(scheduler.is_running());
    EXPECT_GE(scheduler.cycles(), 2u);
    // Forced refreshes bypass the 5s freshness window
    EXPECT_EQ(cache->refresh_count(), scheduler.cycles());
}

TEST_F(SchedulerTest, SleepsBeforeFirstRefresh) {
    Scheduler scheduler(cache, 10s);
    scheduler.start();

    auto start = std::chrono::steady_clock::now();
    scheduler.stop();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 1s);
    EXPECT_EQ(cache->refresh_count(), 0u);
    EXPECT_EQ(prober.calls(), 0);
}

TEST_F(SchedulerTest, StopDuringRefreshLeavesCompleteBatch) {
    prober.set_default_delay(150ms);
    Scheduler scheduler(cache, 10ms);
    scheduler.start();

    // Let the first refresh get under way
    std::this_thread::sleep_for(60ms);
    EXPECT_TRUE(scheduler.stop(1s));

    auto runs = cache->refresh_count();
    ASSERT_GE(runs, 1u);

    // The cached batch is whole and no further runs start after stop
    auto batch = cache->get_results(false);
    ASSERT_EQ(batch->results.size(), 2u);
    EXPECT_EQ(batch->results[0].service_name, "a");
    EXPECT_EQ(batch->results[1].service_name, "b");

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(cache->refresh_count(), runs);
}

TEST_F(SchedulerTest, StopDoesNotWaitForSlowRefresh) {
    prober.set_default_delay(1500ms);
    Scheduler scheduler(cache, 10ms);
    scheduler.start();

    // The first refresh is now blocked inside the prober
    std::this_thread::sleep_for(100ms);
    ASSERT_EQ(cache->refresh_count(), 1u);

    auto start = std::chrono::steady_clock::now();
    bool joined = scheduler.stop(100ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(joined);
    EXPECT_LT(elapsed, 1000ms);
    EXPECT_FALSE(scheduler.is_running());

    // The detached refresh still installs a whole batch
    auto batch = cache->get_results(false);
    ASSERT_EQ(batch->results.size(), 2u);
    EXPECT_EQ(batch->results[0].service_name, "a");
    EXPECT_EQ(batch->results[1].service_name, "b");
    EXPECT_EQ(cache->refresh_count(), 1u);

    // Let the loop observe the stop before the fixture goes away
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (scheduler.cycles() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(scheduler.cycles(), 1u);
}

TEST_F(SchedulerTest, RunsAlongsideOnDemandCallers) {
    prober.set_default_delay(20ms);
    Scheduler scheduler(cache, 25ms);
    scheduler.start();

    for (int i = 0; i < 10; ++i) {
        auto batch = cache->get_results(i % 2 == 0);
        ASSERT_EQ(batch->results.size(), 2u);
        std::this_thread::sleep_for(10ms);
    }

    scheduler.stop();
    EXPECT_GE(cache->refresh_count(), 2u);
}

TEST_F(SchedulerTest, StartTwiceIsHarmless) {
    Scheduler scheduler(cache, 1s);
    scheduler.start();
    scheduler.start();
    scheduler.stop();
    scheduler.stop();
    EXPECT_FALSE(scheduler.is_running());
}
