// ============================================================================
// heir/core/coroutine_compat.hpp - Symmetric Transfer Under GCC+ASan
// ============================================================================
//
// GCC with -fsanitize=address does not emit the tail call that symmetric
// transfer relies on (https://gcc.gnu.org/bugzilla/show_bug.cgi?id=100897),
// so each transfer grows the stack. Awaiters return SymmetricTransferResult
// and wrap their target in SymmetricTransfer(): a plain handle return on
// healthy toolchains, a direct resume() under GCC+ASan.
//
// ============================================================================

#pragma once

#include <coroutine>

namespace heir {

#if defined(__GNUG__) && !defined(__clang__) && defined(__SANITIZE_ADDRESS__)
#define HEIR_ASAN_SYMMETRIC_TRANSFER_BROKEN 1
#else
#define HEIR_ASAN_SYMMETRIC_TRANSFER_BROKEN 0
#endif

#if HEIR_ASAN_SYMMETRIC_TRANSFER_BROKEN

using SymmetricTransferResult = void;

inline void SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    target.resume();
}

#else

using SymmetricTransferResult = std::coroutine_handle<>;

inline std::coroutine_handle<> SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    return target;
}

#endif

}  // namespace heir
