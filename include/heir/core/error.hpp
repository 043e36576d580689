// ============================================================================
// heir/core/error.hpp - Error Codes
// ============================================================================
//
// Recoverable failures are std::error_code values in the "heir" category and
// travel through Result<T, Error>. Invariant violations do not get a code;
// they go through HEIR_CHECK.
//
// USAGE:
// ------
//   auto r = kRequestId.Get();
//   if (r.IsErr() && r.Error() == Errc::NotSet) { /* no request in scope */ }
//
// ============================================================================

#pragma once

#include <system_error>

namespace heir {

enum class Errc {
    // No scope for the variable is active in the calling task
    NotSet = 1,
    // Spawn() found no executor to run the task on
    NoExecutor,
};

const std::error_category& HeirCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

using Error = std::error_code;

}  // namespace heir

namespace std {
template <>
struct is_error_code_enum<heir::Errc> : true_type {};
}  // namespace std
