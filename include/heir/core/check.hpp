// ============================================================================
// heir/core/check.hpp - Always-On Invariant Checks
// ============================================================================
//
// HEIR_CHECK(cond, msg) is never compiled out. A failed check is a broken
// internal invariant (for example a restore that does not match its install),
// so it reports and aborts instead of returning an error.
//
// Output goes to stderr as:
//
//   HEIR_CHECK(cond) failed: msg
//     in function (file:line)
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace heir::detail {

// Writes the decimal digits of `value` ending at `buf_end`; returns the first digit.
inline char* FormatLine(unsigned int value, char* buf_end) {
    char* p = buf_end;
    do {
        *--p = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value != 0);
    return p;
}

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    char line_buf[12];
    char* line_end = line_buf + sizeof(line_buf);
    char* line_str = FormatLine(loc.line(), line_end);

    std::fputs("HEIR_CHECK(", stderr);
    std::fputs(cond_str, stderr);
    std::fputs(") failed: ", stderr);
    std::fputs(msg, stderr);
    std::fputs("\n  in ", stderr);
    std::fputs(loc.function_name(), stderr);
    std::fputs(" (", stderr);
    std::fputs(loc.file_name(), stderr);
    std::fputc(':', stderr);
    std::fwrite(line_str, 1, static_cast<size_t>(line_end - line_str), stderr);
    std::fputs(")\n", stderr);
    std::fflush(stderr);
    std::abort();
}

}  // namespace heir::detail

#define HEIR_CHECK(cond, msg)                                                       \
    do {                                                                            \
        if (!(cond)) [[unlikely]] {                                                 \
            ::heir::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                           \
    } while (0)
