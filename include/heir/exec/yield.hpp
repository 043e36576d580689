// ============================================================================
// heir/exec/yield.hpp - Cooperative Yield
// ============================================================================
//
// co_await Yield() suspends the task and re-queues it on the current
// executor, letting other tasks run. The next poll may happen on a different
// worker thread. With no current executor it does not suspend.
//
// ============================================================================

#pragma once

#include "heir/exec/executor.hpp"

#include <coroutine>

namespace heir {

class YieldAwaitable {
   public:
    bool await_ready() const noexcept { return false; }

    bool await_suspend(std::coroutine_handle<> handle) const {
        Executor* executor = GetCurrentExecutor();
        if (!executor) {
            return false;
        }
        executor->Schedule(handle);
        return true;
    }

    void await_resume() const noexcept {}
};

inline YieldAwaitable Yield() {
    return {};
}

}  // namespace heir
