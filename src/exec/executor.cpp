// ============================================================================
// heir/exec/executor.cpp - Current Executor Tracking
// ============================================================================
//
// The thread_local is only touched from these out-of-line functions. Code in a
// coroutine body may continue on another thread after a suspension, and a
// thread_local address computed before the suspension must not be reused.
//
// ============================================================================

#include "heir/exec/executor.hpp"

namespace heir {

static thread_local Executor* g_current_executor = nullptr;

Executor* GetCurrentExecutor() noexcept {
    return g_current_executor;
}

void SetCurrentExecutor(Executor* executor) noexcept {
    g_current_executor = executor;
}

ExecutorGuard::ExecutorGuard(Executor* executor) noexcept : previous_(g_current_executor) {
    g_current_executor = executor;
}

ExecutorGuard::~ExecutorGuard() {
    g_current_executor = previous_;
}

}  // namespace heir
