// ============================================================================
// heir/exec/timer.hpp - Async Sleep
// ============================================================================
//
// co_await AsyncSleep(10ms) asks the current executor to resume the task after
// the delay. Without a current executor it resumes immediately.
//
// USAGE:
// ------
//   Task<void> Backoff() {
//       co_await AsyncSleep(std::chrono::milliseconds(5));
//   }
//
// ============================================================================

#pragma once

#include <chrono>
#include <coroutine>

#include "heir/exec/executor.hpp"

namespace heir {

class AsyncSleep {
   public:
    template <typename Rep, typename Period>
    explicit AsyncSleep(std::chrono::duration<Rep, Period> duration)
        : duration_(std::chrono::duration_cast<std::chrono::milliseconds>(duration)) {}

    bool await_ready() const noexcept { return duration_.count() <= 0; }

    bool await_suspend(std::coroutine_handle<> handle) const {
        Executor* executor = GetCurrentExecutor();
        if (!executor) {
            return false;
        }
        executor->ScheduleAfter(duration_, handle);
        return true;
    }

    void await_resume() const noexcept {}

   private:
    std::chrono::milliseconds duration_;
};

}  // namespace heir
