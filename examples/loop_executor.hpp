// ============================================================================
// examples/loop_executor.hpp - Minimal Event Loop for the Examples
// ============================================================================
//
// heir ships no scheduler of its own. The examples run on this one-thread
// loop: Run() drains ready work and due timers until Stop() is called.
//
// ============================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <deque>
#include <functional>
#include <mutex>
#include <queue>
#include <vector>

#include "heir/exec/executor.hpp"

namespace examples {

class LoopExecutor : public heir::Executor {
   public:
    void Schedule(std::coroutine_handle<> handle) override {
        if (!handle) return;
        Post([handle] { handle.resume(); });
    }

    void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) override {
        if (!handle) return;
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.push({std::chrono::steady_clock::now() + delay, handle});
        cv_.notify_one();
    }

    void Post(std::function<void()> callback) override {
        if (!callback) return;
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(std::move(callback));
        cv_.notify_one();
    }

    void Stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        cv_.notify_one();
    }

    void Run() {
        heir::ExecutorGuard guard(this);
        std::unique_lock<std::mutex> lock(mutex_);
        stopped_ = false;
        while (!stopped_) {
            auto now = std::chrono::steady_clock::now();
            while (!timers_.empty() && timers_.top().when <= now) {
                std::coroutine_handle<> handle = timers_.top().handle;
                timers_.pop();
                ready_.push_back([handle] { handle.resume(); });
            }

            if (ready_.empty()) {
                if (timers_.empty()) {
                    cv_.wait(lock);
                } else {
                    cv_.wait_until(lock, timers_.top().when);
                }
                continue;
            }

            std::function<void()> item = std::move(ready_.front());
            ready_.pop_front();
            lock.unlock();
            item();
            lock.lock();
        }
    }

   private:
    struct Timer {
        std::chrono::steady_clock::time_point when;
        std::coroutine_handle<> handle;

        bool operator>(const Timer& other) const { return when > other.when; }
    };

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> ready_;
    std::priority_queue<Timer, std::vector<Timer>, std::greater<Timer>> timers_;
    bool stopped_ = false;
};

}  // namespace examples
