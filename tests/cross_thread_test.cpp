// ============================================================================
// Cross-Thread Tests
// ============================================================================
//
// Polls of one task land on different threads; each poll must see the task's
// own values and leave nothing behind on the thread that ran it.
//
// ============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "heir/heir.hpp"
#include "support/manual_executor.hpp"
#include "support/worker_pool.hpp"

using namespace heir;
using heir::testing::ManualExecutor;
using heir::testing::WorkerPool;

namespace {

InheritableLocal<int> kN{"n"};
InheritableLocal<std::string> kLabel{"label"};

Task<std::vector<int>> ReadAcrossYields(int rounds) {
    std::vector<int> seen;
    for (int i = 0; i < rounds; ++i) {
        seen.push_back(kN.Get().ValueOr(-1));
        co_await Yield();
    }
    seen.push_back(kN.Get().ValueOr(-1));
    co_return seen;
}

Task<void> Record(int value, std::vector<int>* out) {
    *out = co_await kN.Scope(value, ReadAcrossYields(5));
}

}  // namespace

// ============================================================================
// Deterministic Hand-Off
// ============================================================================

TEST(CrossThreadTest, EachPollOnAFreshThread) {
    ManualExecutor executor;
    std::vector<int> first;
    std::vector<int> second;

    (void)Spawn(executor, Record(1, &first));
    (void)Spawn(executor, Record(2, &second));

    std::atomic<int> residue{0};
    while (executor.Pending() > 0) {
        std::thread worker([&] {
            executor.RunOnce();
            if (kN.IsSet()) {
                residue.fetch_add(1);
            }
        });
        worker.join();
    }

    EXPECT_EQ(residue.load(), 0);
    EXPECT_EQ(first, std::vector<int>(6, 1));
    EXPECT_EQ(second, std::vector<int>(6, 2));
}

TEST(CrossThreadTest, AlternatingTwoThreads) {
    ManualExecutor executor;
    std::vector<int> first;
    std::vector<int> second;

    (void)Spawn(executor, Record(1, &first));
    (void)Spawn(executor, Record(2, &second));

    // Two long-lived threads take turns; the main thread never runs a poll.
    std::atomic<int> turn{0};
    std::atomic<bool> done{false};
    std::atomic<int> residue{0};
    auto pump = [&](int me) {
        while (!done.load()) {
            if (turn.load() != me) {
                std::this_thread::yield();
                continue;
            }
            if (!executor.RunOnce()) {
                done.store(true);
            } else if (kN.IsSet()) {
                residue.fetch_add(1);
            }
            turn.store(1 - me);
        }
    };

    std::thread a(pump, 0);
    std::thread b(pump, 1);
    a.join();
    b.join();

    EXPECT_EQ(residue.load(), 0);
    EXPECT_EQ(first, std::vector<int>(6, 1));
    EXPECT_EQ(second, std::vector<int>(6, 2));
}

// ============================================================================
// Worker Pool
// ============================================================================

TEST(CrossThreadTest, InheritedChildOnAnotherWorker) {
    WorkerPool pool(4);

    auto child = []() -> Task<std::string> {
        co_await AsyncSleep(std::chrono::milliseconds(2));
        co_return kLabel.Get().ValueOr("") + ":" + std::to_string(kN.Get().ValueOr(0));
    };
    auto parent = [&]() -> Task<std::string> {
        auto joined = co_await Spawn(Inherit(child()));
        co_return joined.Value();
    };

    std::string seen = SyncWait(pool, kLabel.Scope("job", kN.Scope(8, parent())));
    EXPECT_EQ(seen, "job:8");
}

namespace {

Task<void> ChildCheck(int expected, std::atomic<int>* mismatches) {
    co_await Yield();
    if (kN.Get().ValueOr(-1) != expected) {
        mismatches->fetch_add(1);
    }
}

Task<void> StressBody(int expected, std::atomic<int>* mismatches) {
    for (int round = 0; round < 5; ++round) {
        co_await AsyncSleep(std::chrono::milliseconds(1));
        if (kN.Get().ValueOr(-1) != expected) {
            mismatches->fetch_add(1);
        }
        co_await Yield();
        if (kN.Get().ValueOr(-1) != expected) {
            mismatches->fetch_add(1);
        }
        auto joined = co_await Spawn(Inherit(ChildCheck(expected, mismatches)));
        if (joined.IsErr()) {
            mismatches->fetch_add(1);
        }
    }
}

Task<void> StressAll(int tasks, std::atomic<int>* mismatches) {
    std::vector<JoinHandle<void>> handles;
    for (int i = 0; i < tasks; ++i) {
        handles.push_back(Spawn(kN.Scope(i, StressBody(i, mismatches))));
    }
    for (auto& handle : handles) {
        auto joined = co_await handle;
        if (joined.IsErr()) {
            mismatches->fetch_add(1);
        }
    }
}

}  // namespace

TEST(CrossThreadTest, ManyScopedTasksOnPool) {
    WorkerPool pool(4);
    std::atomic<int> mismatches{0};

    SyncWait(pool, StressAll(32, &mismatches));

    EXPECT_EQ(mismatches.load(), 0);
}

TEST(CrossThreadTest, WorkersCleanAfterwards) {
    WorkerPool pool(2);
    std::atomic<int> mismatches{0};
    SyncWait(pool, StressAll(8, &mismatches));

    auto probe = []() -> Task<bool> {
        co_await Yield();
        co_return kN.IsSet();
    };
    for (int i = 0; i < 8; ++i) {
        EXPECT_FALSE(SyncWait(pool, probe()));
    }
}
