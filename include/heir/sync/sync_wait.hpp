// ============================================================================
// heir/sync/sync_wait.hpp - Blocking Bridge From Synchronous Code
// ============================================================================
//
// SyncWait(task) runs a task inline on the calling thread and blocks until it
// finishes. SyncWait(executor, task) spawns it on the executor instead and
// blocks the calling thread until a worker finishes it.
//
// USAGE:
// ------
//   int main() {
//       WorkerPool pool;
//       int n = SyncWait(pool, kDepth.Scope(1, Compute()));
//   }
//
// WARNING:
// --------
// Never call SyncWait from inside a task; it blocks a worker thread. The
// inline form only suits tasks that never wait on an executor, because no
// executor is there to resume them.
//
// ============================================================================

#pragma once

#include "heir/core/check.hpp"
#include "heir/core/task.hpp"
#include "heir/exec/executor.hpp"

#include <condition_variable>
#include <coroutine>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <utility>

namespace heir {

namespace detail {

class SyncWaitEvent {
   public:
    void Signal() {
        std::lock_guard lock(mutex_);
        signaled_ = true;
        cv_.notify_one();
    }

    void Wait() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return signaled_; });
    }

   private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool signaled_ = false;
};

// ============================================================================
// SyncWaitTask - Signals Only Once Its Frame Is Suspended
// ============================================================================
// The task being waited on may finish on another thread (a worker that ran
// its last poll). The event is raised from the final suspend point so the
// blocked caller never destroys a frame that is still running.
class SyncWaitTask {
   public:
    struct promise_type {
        SyncWaitEvent* event = nullptr;

        SyncWaitTask get_return_object() noexcept {
            return SyncWaitTask{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        struct FinalAwaiter {
            bool await_ready() noexcept { return false; }
            void await_suspend(std::coroutine_handle<promise_type> h) noexcept { h.promise().event->Signal(); }
            void await_resume() noexcept {}
        };

        FinalAwaiter final_suspend() noexcept { return {}; }
        void return_void() noexcept {}
        void unhandled_exception() noexcept { std::abort(); }
    };

    using Handle = std::coroutine_handle<promise_type>;

    SyncWaitTask(SyncWaitTask&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}
    SyncWaitTask(const SyncWaitTask&) = delete;
    SyncWaitTask& operator=(const SyncWaitTask&) = delete;
    SyncWaitTask& operator=(SyncWaitTask&&) = delete;

    ~SyncWaitTask() {
        if (handle_) {
            handle_.destroy();
        }
    }

    // Starts the task with `start`, then blocks until it has finished.
    template <typename Start>
    void Run(Start&& start) {
        SyncWaitEvent event;
        handle_.promise().event = &event;
        std::forward<Start>(start)(std::coroutine_handle<>(handle_));
        event.Wait();
    }

   private:
    explicit SyncWaitTask(Handle handle) noexcept : handle_(handle) {}

    Handle handle_;
};

template <typename T>
SyncWaitTask SyncWaitRunner(Task<T> task, std::optional<T>* result) {
    result->emplace(co_await std::move(task));
}

inline SyncWaitTask SyncWaitRunner(Task<void> task) {
    co_await std::move(task);
}

inline Executor& SyncWaitRoot(Executor& executor) {
    Executor* root = executor.Root();
    HEIR_CHECK(root != nullptr, "SyncWait on an executor with no root");
    return *root;
}

}  // namespace detail

template <typename T>
T SyncWait(Task<T> task) {
    std::optional<T> result;
    detail::SyncWaitRunner(std::move(task), &result).Run([](std::coroutine_handle<> h) { h.resume(); });
    return std::move(*result);
}

inline void SyncWait(Task<void> task) {
    detail::SyncWaitRunner(std::move(task)).Run([](std::coroutine_handle<> h) { h.resume(); });
}

template <typename T>
T SyncWait(Executor& executor, Task<T> task) {
    Executor& root = detail::SyncWaitRoot(executor);
    std::optional<T> result;
    detail::SyncWaitRunner(std::move(task), &result).Run([&root](std::coroutine_handle<> h) { root.Schedule(h); });
    return std::move(*result);
}

inline void SyncWait(Executor& executor, Task<void> task) {
    Executor& root = detail::SyncWaitRoot(executor);
    detail::SyncWaitRunner(std::move(task)).Run([&root](std::coroutine_handle<> h) { root.Schedule(h); });
}

}  // namespace heir
