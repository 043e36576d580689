// ============================================================================
// heir/local/splice.cpp - Splice Implementation
// ============================================================================

#include "heir/local/splice.hpp"

namespace heir::detail {

// ============================================================================
// Polling
// ============================================================================

bool Splice::Start(std::coroutine_handle<> driver, std::coroutine_handle<> awaiting) {
    host_ = GetCurrentExecutor();
    awaiting_ = awaiting;

    std::function<void()> first = [driver] { driver.resume(); };

    bool finished = false;
    if (host_) {
        finished = PollOnce(first);
    } else {
        {
            std::lock_guard<std::mutex> lock(inline_mutex_);
            draining_ = true;
        }
        finished = PollOnce(first);
        finished = Drain() || finished;
    }

    if (finished) {
        state_.store(State::kComplete, std::memory_order_release);
    }
    return finished;
}

bool Splice::PollOnce(const std::function<void()>& step) {
    if (abandoned_.load(std::memory_order_acquire)) {
        return false;
    }

    State expected = State::kUnpolled;
    state_.compare_exchange_strong(expected, State::kPolling, std::memory_order_acq_rel);
    polls_.fetch_add(1, std::memory_order_relaxed);

    {
        ExecutorGuard executor_guard(this);
        InstallGuard install_guard(snapshot_);
        step();
    }

    // Exactly one poll consumes the flag, even if two threads were inside a
    // poll of this task when it finished.
    return finished_.exchange(false, std::memory_order_acq_rel);
}

void Splice::PollAndFinish(const std::function<void()>& step) {
    if (PollOnce(step)) {
        Finish();
    }
}

void Splice::Finish() {
    state_.store(State::kComplete, std::memory_order_release);
    if (host_) {
        host_->Schedule(awaiting_);
    } else {
        awaiting_.resume();
    }
}

// ============================================================================
// Dispatch
// ============================================================================

void Splice::Dispatch(std::function<void()> step) {
    if (host_) {
        host_->Post([self = shared_from_this(), step = std::move(step)] { self->PollAndFinish(step); });
        return;
    }

    {
        std::lock_guard<std::mutex> lock(inline_mutex_);
        inline_steps_.push_back(std::move(step));
        if (draining_) {
            return;
        }
        draining_ = true;
    }
    if (Drain()) {
        Finish();
    }
}

bool Splice::Drain() {
    bool finished = false;
    for (;;) {
        std::function<void()> step;
        {
            std::lock_guard<std::mutex> lock(inline_mutex_);
            if (inline_steps_.empty()) {
                draining_ = false;
                return finished;
            }
            step = std::move(inline_steps_.front());
            inline_steps_.pop_front();
        }
        finished = PollOnce(step) || finished;
    }
}

// ============================================================================
// Executor Interface
// ============================================================================

void Splice::Schedule(std::coroutine_handle<> handle) {
    if (!handle) return;
    Dispatch([handle] { handle.resume(); });
}

void Splice::ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) {
    if (!handle) return;
    if (!host_) {
        // Nothing can keep time for us; resume right away like AsyncSleep does.
        Schedule(handle);
        return;
    }
    host_->ScheduleAfter(delay, SpliceRelay::Make(shared_from_this(), handle).Release());
}

void Splice::Post(std::function<void()> callback) {
    if (!callback) return;
    Dispatch(std::move(callback));
}

// ============================================================================
// SpliceRelay
// ============================================================================

SpliceRelay SpliceRelay::Make(std::shared_ptr<Splice> splice, std::coroutine_handle<> handle) {
    splice->PollAndFinish([handle] { handle.resume(); });
    co_return;
}

}  // namespace heir::detail
