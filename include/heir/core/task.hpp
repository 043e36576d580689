// ============================================================================
// heir/core/task.hpp - Lazy Coroutine Task
// ============================================================================
//
// Task<T> is the unit of work that inheritable locals travel with. It is
// lazy: nothing runs until the task is co_awaited, spawned, or its handle is
// resumed. When it finishes it transfers control straight back to whoever
// awaited it (symmetric transfer); with no awaiter it simply suspends at its
// final point and returns to the resumer.
//
// A Task owns its coroutine frame and destroys it in the destructor.
//
// USAGE:
// ------
//   Task<int> Answer() { co_return 42; }
//
//   Task<int> Twice() {
//       int v = co_await Answer();   // Answer() starts here
//       co_return v * 2;
//   }
//
// ============================================================================

#pragma once

#include "heir/core/check.hpp"
#include "heir/core/coroutine_compat.hpp"

#include <coroutine>
#include <cstdlib>
#include <optional>
#include <utility>

namespace heir {

template <typename T>
class Task;

namespace detail {

// Continuation bookkeeping shared by the value and void promises.
class TaskPromiseBase {
   public:
    struct FinalAwaiter {
        bool await_ready() noexcept { return false; }

        template <typename Promise>
        SymmetricTransferResult await_suspend(std::coroutine_handle<Promise> finishing) noexcept {
            std::coroutine_handle<> next = static_cast<TaskPromiseBase&>(finishing.promise()).continuation_;
            return SymmetricTransfer(next ? next : std::noop_coroutine());
        }

        void await_resume() noexcept {}
    };

    std::suspend_always initial_suspend() noexcept { return {}; }

    FinalAwaiter final_suspend() noexcept { return {}; }

    void unhandled_exception() noexcept { std::abort(); }

    void SetContinuation(std::coroutine_handle<> cont) noexcept {
        HEIR_CHECK(!awaited_, "Task co_awaited twice");
        awaited_ = true;
        continuation_ = cont;
    }

   private:
    std::coroutine_handle<> continuation_;
    bool awaited_ = false;
};

}  // namespace detail

template <typename T>
class TaskPromise : public detail::TaskPromiseBase {
   public:
    Task<T> get_return_object() noexcept;

    template <typename U>
    void return_value(U&& value) {
        result_.emplace(std::forward<U>(value));
    }

    T TakeResult() { return std::move(*result_); }

   private:
    std::optional<T> result_;
};

template <>
class TaskPromise<void> : public detail::TaskPromiseBase {
   public:
    Task<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void TakeResult() noexcept {}
};

template <typename T>
class [[nodiscard("Task must be co_awaited or spawned")]] Task {
   public:
    using promise_type = TaskPromise<T>;
    using Handle = std::coroutine_handle<promise_type>;

    explicit Task(Handle handle) noexcept : handle_(handle) {}

    ~Task() {
        if (handle_) {
            handle_.destroy();
        }
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    struct Awaiter {
        Handle handle_;

        bool await_ready() noexcept { return false; }

        // Record who to come back to, then jump into the task.
        SymmetricTransferResult await_suspend(std::coroutine_handle<> awaiting) noexcept {
            handle_.promise().SetContinuation(awaiting);
            return SymmetricTransfer(handle_);
        }

        T await_resume() { return handle_.promise().TakeResult(); }
    };

    [[nodiscard]] Awaiter operator co_await() noexcept { return Awaiter{handle_}; }

    [[nodiscard]] Handle GetHandle() const noexcept { return handle_; }

   private:
    Handle handle_;
};

template <typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{Task<T>::Handle::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{Task<void>::Handle::from_promise(*this)};
}

}  // namespace heir
