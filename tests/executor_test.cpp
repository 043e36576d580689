// ============================================================================
// Executor Boundary Tests
// ============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "heir/heir.hpp"
#include "support/manual_executor.hpp"
#include "support/worker_pool.hpp"

using namespace heir;
using namespace std::chrono_literals;
using heir::testing::ManualExecutor;
using heir::testing::WorkerPool;

// ============================================================================
// Current Executor Tests
// ============================================================================

TEST(ExecutorTest, NoCurrentExecutorByDefault) {
    EXPECT_EQ(GetCurrentExecutor(), nullptr);
}

TEST(ExecutorTest, RootIsSelf) {
    ManualExecutor executor;
    EXPECT_EQ(executor.Root(), &executor);
}

TEST(ExecutorTest, ExecutorGuardSetsAndRestores) {
    EXPECT_EQ(GetCurrentExecutor(), nullptr);

    ManualExecutor exec1;
    {
        ExecutorGuard guard(&exec1);
        EXPECT_EQ(GetCurrentExecutor(), &exec1);

        ManualExecutor exec2;
        {
            ExecutorGuard guard2(&exec2);
            EXPECT_EQ(GetCurrentExecutor(), &exec2);
        }
        EXPECT_EQ(GetCurrentExecutor(), &exec1);
    }
    EXPECT_EQ(GetCurrentExecutor(), nullptr);
}

TEST(ExecutorTest, ExecutorGuardNullExecutor) {
    ManualExecutor exec;
    SetCurrentExecutor(&exec);

    {
        ExecutorGuard guard(nullptr);
        EXPECT_EQ(GetCurrentExecutor(), nullptr);
    }
    EXPECT_EQ(GetCurrentExecutor(), &exec);
    SetCurrentExecutor(nullptr);
}

TEST(ExecutorTest, CurrentExecutorIsPerThread) {
    ManualExecutor exec;
    ExecutorGuard guard(&exec);

    Executor* seen = &exec;
    std::thread other([&] { seen = GetCurrentExecutor(); });
    other.join();

    EXPECT_EQ(seen, nullptr);
}

// ============================================================================
// Awaitable Tests
// ============================================================================

TEST(ExecutorTest, YieldReturnsControl) {
    ManualExecutor executor;
    std::atomic<int> step{0};

    auto task = [&]() -> Task<void> {
        step = 1;
        co_await Yield();
        step = 2;
    };

    (void)Spawn(executor, task());
    EXPECT_TRUE(executor.RunOnce());
    EXPECT_EQ(step.load(), 1);
    EXPECT_EQ(executor.Pending(), 1u);

    EXPECT_TRUE(executor.RunOnce());
    EXPECT_EQ(step.load(), 2);
}

TEST(ExecutorTest, ZeroSleepDoesNotSuspend) {
    ManualExecutor executor;
    bool done = false;

    auto task = [&]() -> Task<void> {
        co_await AsyncSleep(0ms);
        done = true;
    };

    (void)Spawn(executor, task());
    EXPECT_TRUE(executor.RunOnce());
    EXPECT_TRUE(done);
}

TEST(ExecutorTest, AsyncSleepOnPool) {
    WorkerPool pool(2);

    auto task = []() -> Task<long> {
        auto start = std::chrono::steady_clock::now();
        co_await AsyncSleep(20ms);
        auto elapsed = std::chrono::steady_clock::now() - start;
        co_return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    };

    EXPECT_GE(SyncWait(pool, task()), 20);
}

TEST(ExecutorTest, PoolPostRunsCallback) {
    WorkerPool pool(2);
    std::atomic<bool> ran{false};
    std::atomic<bool> had_executor{false};

    pool.Post([&] {
        had_executor = GetCurrentExecutor() == &pool;
        ran = true;
    });

    for (int i = 0; i < 200 && !ran.load(); ++i) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(ran.load());
    EXPECT_TRUE(had_executor.load());
}

TEST(ExecutorTest, PoolStopIsIdempotent) {
    WorkerPool pool(2);
    pool.Stop();
    pool.Stop();
    EXPECT_EQ(pool.NumThreads(), 2u);
}
