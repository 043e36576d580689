// ============================================================================
// heir/local/splice.hpp - Running a Task Under a Snapshot
// ============================================================================
//
// Spliced(snapshot, task) returns a Task that runs `task` with `snapshot`
// installed on whichever thread is polling it, and with nothing installed in
// between polls. Both Inherit() and InheritableLocal::Scope() are built on it.
//
// WHAT A POLL IS:
// ---------------
// A coroutine chain is resumed from many places: the first co_await, then an
// executor resuming whatever leaf handle suspended last (after a Yield, a
// sleep, a join). To see every one of those resumptions, the Splice makes
// itself the thread's current executor while the inner task runs. Awaitables
// hand their handle to the current executor, so each later resumption arrives
// at Splice::Schedule/ScheduleAfter/Post, is forwarded to the real (host)
// executor, and runs as:
//
//   install snapshot  ->  resume once  ->  restore snapshot
//
// on the worker thread that picked it up. Nested splices stack naturally: the
// host of an inner splice is the outer splice, so a resumption installs the
// outer snapshot, then the inner one, then pops both in reverse order.
//
// STATES:
// -------
//   Unpolled  -> snapshot held, inner task not started
//   Polling   -> polled at least once
//   Complete  -> inner task finished and its result handed over
//
// Once the inner task finishes, the awaiting coroutine is resumed through the
// host executor (inline when there is none), after the snapshot is restored.
// The inner task's result passes through untouched.
//
// LIMITATION:
// -----------
// An awaitable that resumes a waiter inline from some other task's thread
// (instead of through the waiter's current executor) bypasses the splice;
// the waiter then runs under the resumer's values.
//
// ============================================================================

#pragma once

#include "heir/core/task.hpp"
#include "heir/exec/executor.hpp"
#include "heir/local/snapshot.hpp"

#include <atomic>
#include <coroutine>
#include <cstdlib>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace heir {
namespace detail {

// ============================================================================
// Splice - Context-Installing Executor Proxy
// ============================================================================
class Splice : public Executor, public std::enable_shared_from_this<Splice> {
   public:
    enum class State { kUnpolled, kPolling, kComplete };

    explicit Splice(Snapshot snapshot) noexcept : snapshot_(std::move(snapshot)) {}

    Splice(const Splice&) = delete;
    Splice& operator=(const Splice&) = delete;

    // First poll, from the awaiting coroutine's await_suspend. The current
    // executor becomes the host. Returns true when the inner task finished
    // during this call and `awaiting` should simply continue.
    bool Start(std::coroutine_handle<> driver, std::coroutine_handle<> awaiting);

    // The awaiting coroutine is gone; queued resumptions become no-ops.
    void Abandon() noexcept { abandoned_.store(true, std::memory_order_release); }

    // Set by the driver coroutine once it reaches its final suspend point.
    [[nodiscard]] std::atomic<bool>* FinishedFlag() noexcept { return &finished_; }

    [[nodiscard]] State GetState() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] size_t PollCount() const noexcept { return polls_.load(std::memory_order_relaxed); }
    [[nodiscard]] const Snapshot& GetSnapshot() const noexcept { return snapshot_; }

    void Schedule(std::coroutine_handle<> handle) override;
    void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) override;
    void Post(std::function<void()> callback) override;
    [[nodiscard]] Executor* Root() noexcept override { return host_ ? host_->Root() : nullptr; }

   private:
    friend class SpliceRelay;

    // One install/step/restore cycle. True if this cycle observed the inner
    // task finishing.
    bool PollOnce(const std::function<void()>& step);

    // PollOnce, and hand control back to the awaiting coroutine if done.
    void PollAndFinish(const std::function<void()>& step);

    // Without a host every step runs on the calling thread, queued so that a
    // poll never starts inside another poll of the same task.
    void Dispatch(std::function<void()> step);
    bool Drain();

    void Finish();

    Snapshot snapshot_;
    Executor* host_ = nullptr;
    std::coroutine_handle<> awaiting_;

    std::atomic<State> state_{State::kUnpolled};
    std::atomic<size_t> polls_{0};
    std::atomic<bool> finished_{false};
    std::atomic<bool> abandoned_{false};

    std::mutex inline_mutex_;
    std::deque<std::function<void()>> inline_steps_;
    bool draining_ = false;
};

// ============================================================================
// SpliceRelay - Delayed Poll Trampoline
// ============================================================================
// Host executors only delay coroutine handles. The relay is a one-shot
// coroutine whose resumption polls the spliced task; it destroys itself.
class SpliceRelay {
   public:
    struct promise_type {
        SpliceRelay get_return_object() noexcept {
            return SpliceRelay{std::coroutine_handle<promise_type>::from_promise(*this)};
        }
        std::suspend_always initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void return_void() noexcept {}
        void unhandled_exception() noexcept { std::abort(); }
    };

    static SpliceRelay Make(std::shared_ptr<Splice> splice, std::coroutine_handle<> handle);

    // Ownership passes to whoever resumes the returned handle.
    [[nodiscard]] std::coroutine_handle<> Release() noexcept { return std::exchange(handle_, nullptr); }

    SpliceRelay(SpliceRelay&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}
    SpliceRelay(const SpliceRelay&) = delete;
    SpliceRelay& operator=(const SpliceRelay&) = delete;
    SpliceRelay& operator=(SpliceRelay&&) = delete;

    ~SpliceRelay() {
        if (handle_) {
            handle_.destroy();
        }
    }

   private:
    explicit SpliceRelay(std::coroutine_handle<promise_type> handle) noexcept : handle_(handle) {}

    std::coroutine_handle<promise_type> handle_;
};

// ============================================================================
// SpliceDriver - Owns the Inner Task While It Runs
// ============================================================================
// The driver awaits the inner task and, at its final suspend point, raises
// the splice's finished flag. The flag is only raised once the frame is fully
// suspended, so whoever observes it may destroy the frame.
class SpliceDriver {
   public:
    struct promise_type {
        std::atomic<bool>* finished = nullptr;

        SpliceDriver get_return_object() noexcept {
            return SpliceDriver{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        struct FinalAwaiter {
            bool await_ready() noexcept { return false; }
            void await_suspend(std::coroutine_handle<promise_type> h) noexcept {
                h.promise().finished->store(true, std::memory_order_release);
            }
            void await_resume() noexcept {}
        };

        FinalAwaiter final_suspend() noexcept { return {}; }
        void return_void() noexcept {}
        void unhandled_exception() noexcept { std::abort(); }
    };

    using Handle = std::coroutine_handle<promise_type>;

    explicit SpliceDriver(Handle handle) noexcept : handle_(handle) {}

    SpliceDriver(SpliceDriver&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}
    SpliceDriver(const SpliceDriver&) = delete;
    SpliceDriver& operator=(const SpliceDriver&) = delete;
    SpliceDriver& operator=(SpliceDriver&&) = delete;

    ~SpliceDriver() {
        if (handle_) {
            handle_.destroy();
        }
    }

    [[nodiscard]] Handle GetHandle() const noexcept { return handle_; }

   private:
    Handle handle_;
};

template <typename T>
struct SpliceSlot {
    std::optional<T> value;
};

template <>
struct SpliceSlot<void> {};

template <typename T>
SpliceDriver DriveSpliced(Task<T> inner, SpliceSlot<T>* slot) {
    if constexpr (std::is_void_v<T>) {
        (void)slot;
        co_await std::move(inner);
    } else {
        slot->value.emplace(co_await std::move(inner));
    }
}

// ============================================================================
// SpliceAwaiter
// ============================================================================
template <typename T>
class SpliceAwaiter {
   public:
    SpliceAwaiter(Snapshot snapshot, Task<T> inner)
        : splice_(std::make_shared<Splice>(std::move(snapshot))), inner_(std::move(inner)) {}

    SpliceAwaiter(const SpliceAwaiter&) = delete;
    SpliceAwaiter& operator=(const SpliceAwaiter&) = delete;

    ~SpliceAwaiter() {
        if (splice_->GetState() != Splice::State::kComplete) {
            splice_->Abandon();
        }
    }

    bool await_ready() const noexcept { return false; }

    bool await_suspend(std::coroutine_handle<> awaiting) {
        // The awaiter lives in the awaiting frame, which another thread may
        // resume (and destroy) before Start() returns. Touch nothing after.
        driver_.emplace(DriveSpliced(std::move(*inner_), &slot_));
        driver_->GetHandle().promise().finished = splice_->FinishedFlag();
        std::shared_ptr<Splice> splice = splice_;
        return !splice->Start(driver_->GetHandle(), awaiting);
    }

    T await_resume() {
        if constexpr (!std::is_void_v<T>) {
            return std::move(*slot_.value);
        }
    }

   private:
    std::shared_ptr<Splice> splice_;
    std::optional<Task<T>> inner_;
    SpliceSlot<T> slot_;
    std::optional<SpliceDriver> driver_;
};

template <typename T>
Task<T> Spliced(Snapshot snapshot, Task<T> inner) {
    co_return co_await SpliceAwaiter<T>(std::move(snapshot), std::move(inner));
}

}  // namespace detail
}  // namespace heir
