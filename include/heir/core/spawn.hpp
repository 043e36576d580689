// ============================================================================
// heir/core/spawn.hpp - Running a Task Detached From Its Caller
// ============================================================================
//
// Spawn() hands a task to an executor and returns a JoinHandle. The task runs
// on its own, whether or not anyone keeps the handle; co_await the handle to
// get its result.
//
// A spawned task always starts on the executor's root, with no inherited
// locals, even when Spawn() is called from inside a scope. To carry the
// caller's inheritable locals across, spawn Inherit(task) instead.
//
// USAGE:
// ------
//   JoinHandle<int> handle = Spawn(executor, Compute());
//   Result<int, Error> r = co_await handle;
//
//   // Fire and forget, on the current executor
//   Spawn(Inherit(Flush()));
//
// ============================================================================

#pragma once

#include <coroutine>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

#include "heir/core/check.hpp"
#include "heir/core/error.hpp"
#include "heir/core/result.hpp"
#include "heir/core/task.hpp"
#include "heir/exec/executor.hpp"

namespace heir {

// ============================================================================
// JoinState - Shared Between the Spawned Task and Its Handle
// ============================================================================
template <typename T>
struct JoinState {
    std::mutex mutex;
    std::optional<Result<T, Error>> outcome;
    std::coroutine_handle<> waiter;
    Executor* waiter_executor = nullptr;

    void Complete(Result<T, Error> result) {
        std::coroutine_handle<> to_wake;
        Executor* executor = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex);
            outcome.emplace(std::move(result));
            to_wake = std::exchange(waiter, nullptr);
            executor = waiter_executor;
        }
        if (!to_wake) {
            return;
        }
        // Resume the joiner through the executor it suspended on, so it gets
        // its own locals back rather than running under ours.
        if (executor) {
            executor->Schedule(to_wake);
        } else {
            to_wake.resume();
        }
    }
};

// ============================================================================
// JoinHandle
// ============================================================================
template <typename T>
class [[nodiscard("dropping a JoinHandle detaches the task")]] JoinHandle {
   public:
    explicit JoinHandle(std::shared_ptr<JoinState<T>> state) : state_(std::move(state)) {}

    [[nodiscard]] bool IsFinished() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->outcome.has_value();
    }

    class Awaiter {
       public:
        explicit Awaiter(std::shared_ptr<JoinState<T>> state) : state_(std::move(state)) {}

        Awaiter(const Awaiter&) = delete;
        Awaiter& operator=(const Awaiter&) = delete;

        // The awaiting frame is being destroyed while still suspended here
        // (its wrapper was dropped). Deregister so completion neither resumes
        // the dead frame nor touches the executor it was waiting on.
        ~Awaiter() {
            if (!registered_) {
                return;
            }
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->waiter == registered_) {
                state_->waiter = nullptr;
                state_->waiter_executor = nullptr;
            }
        }

        bool await_ready() {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->outcome.has_value();
        }

        bool await_suspend(std::coroutine_handle<> awaiting) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->outcome) {
                return false;
            }
            HEIR_CHECK(!state_->waiter, "JoinHandle co_awaited twice");
            state_->waiter = awaiting;
            state_->waiter_executor = GetCurrentExecutor();
            registered_ = awaiting;
            return true;
        }

        Result<T, Error> await_resume() {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return std::move(*state_->outcome);
        }

       private:
        std::shared_ptr<JoinState<T>> state_;
        std::coroutine_handle<> registered_;
    };

    Awaiter operator co_await() const { return Awaiter{state_}; }

   private:
    std::shared_ptr<JoinState<T>> state_;
};

namespace detail {

// ============================================================================
// SpawnedTask - Self-Destroying Root Coroutine
// ============================================================================
class SpawnedTask {
   public:
    struct promise_type {
        SpawnedTask get_return_object() noexcept {
            return SpawnedTask{std::coroutine_handle<promise_type>::from_promise(*this)};
        }
        std::suspend_always initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void return_void() noexcept {}
        void unhandled_exception() noexcept { std::abort(); }
    };

    using Handle = std::coroutine_handle<promise_type>;

    explicit SpawnedTask(Handle handle) noexcept : handle_(handle) {}

    SpawnedTask(SpawnedTask&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}
    SpawnedTask(const SpawnedTask&) = delete;
    SpawnedTask& operator=(const SpawnedTask&) = delete;
    SpawnedTask& operator=(SpawnedTask&&) = delete;

    // Only a never-started task is destroyed here; once released to an
    // executor the frame frees itself after completing.
    ~SpawnedTask() {
        if (handle_) {
            handle_.destroy();
        }
    }

    [[nodiscard]] std::coroutine_handle<> Release() noexcept { return std::exchange(handle_, nullptr); }

   private:
    Handle handle_;
};

template <typename T>
SpawnedTask RunSpawned(Task<T> task, std::shared_ptr<JoinState<T>> state) {
    if constexpr (std::is_void_v<T>) {
        co_await std::move(task);
        state->Complete(Ok());
    } else {
        state->Complete(Ok(co_await std::move(task)));
    }
}

}  // namespace detail

// ============================================================================
// Spawn
// ============================================================================

template <typename T>
JoinHandle<T> Spawn(Executor& executor, Task<T> task) {
    auto state = std::make_shared<JoinState<T>>();

    Executor* root = executor.Root();
    if (!root) {
        state->Complete(Err(make_error_code(Errc::NoExecutor)));
        return JoinHandle<T>(std::move(state));
    }

    detail::SpawnedTask spawned = detail::RunSpawned(std::move(task), state);
    root->Schedule(spawned.Release());
    return JoinHandle<T>(std::move(state));
}

// Spawns on the current executor; Errc::NoExecutor when there is none.
template <typename T>
JoinHandle<T> Spawn(Task<T> task) {
    Executor* executor = GetCurrentExecutor();
    if (!executor) {
        auto state = std::make_shared<JoinState<T>>();
        state->Complete(Err(make_error_code(Errc::NoExecutor)));
        return JoinHandle<T>(std::move(state));
    }
    return Spawn(*executor, std::move(task));
}

}  // namespace heir
