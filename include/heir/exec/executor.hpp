// ============================================================================
// heir/exec/executor.hpp - Scheduler Boundary
// ============================================================================
//
// heir does not ship a scheduler. Executor is the interface a host scheduler
// implements so tasks can be spawned onto it and so awaitables inside a task
// can ask to be resumed later. Every executor is free to resume work on any
// of its worker threads, and to pick a different thread each time.
//
// Awaitables find the executor that is running them through the per-thread
// "current executor". Schedulers set it (ExecutorGuard) around each resume;
// the context-splicing wrapper sets it to itself while it polls its task, which
// is how later resumptions of that task are routed back through it.
//
// USAGE:
// ------
//   class MyScheduler : public heir::Executor { ... };
//
//   void MyScheduler::WorkerLoop() {
//       heir::ExecutorGuard guard(this);
//       while (auto h = NextHandle()) h.resume();
//   }
//
// ============================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <functional>

namespace heir {

class Executor {
   public:
    virtual ~Executor() = default;

    // Resume `handle` as soon as possible, on any worker thread.
    virtual void Schedule(std::coroutine_handle<> handle) = 0;

    // Resume `handle` after `delay`.
    virtual void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) = 0;

    // Run `callback` on a worker thread.
    virtual void Post(std::function<void()> callback) = 0;

    // The executor that really owns worker threads. New tasks are always
    // started here, so they begin with no inherited context. Proxies return
    // their host's root, or nullptr when they have no host.
    [[nodiscard]] virtual Executor* Root() noexcept { return this; }
};

// nullptr when the calling thread is not running inside an executor
[[nodiscard]] Executor* GetCurrentExecutor() noexcept;

void SetCurrentExecutor(Executor* executor) noexcept;

// Sets the current executor for a lexical scope and restores the previous one.
class ExecutorGuard {
   public:
    explicit ExecutorGuard(Executor* executor) noexcept;
    ~ExecutorGuard();

    ExecutorGuard(const ExecutorGuard&) = delete;
    ExecutorGuard& operator=(const ExecutorGuard&) = delete;

   private:
    Executor* previous_;
};

}  // namespace heir
