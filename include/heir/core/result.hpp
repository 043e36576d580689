// ============================================================================
// heir/core/result.hpp - Explicit Success-or-Error Return Type
// ============================================================================
//
// Result<T, E> holds either a value or an error. Reading an inheritable local
// returns one, because "no value in scope" is an expected outcome and not a
// crash:
//
//   Result<int, Error> depth = kDepth.Get();
//   if (depth.IsErr()) {
//       // depth.Error() == Errc::NotSet
//   }
//
//   Task<Result<int, Error>> child = Inherit(ReadDepth());
//
// Result<void, E> carries only the error side; build its success with Ok().
//
// ============================================================================

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace heir {

template <typename T, typename E>
class Result;

template <typename T>
struct OkTag {
    T value;

    template <typename U>
    explicit OkTag(U&& v) : value(std::forward<U>(v)) {}
};

template <typename E>
struct ErrTag {
    E error;

    template <typename U>
    explicit ErrTag(U&& e) : error(std::forward<U>(e)) {}
};

template <typename T>
OkTag<std::decay_t<T>> Ok(T&& value) {
    return OkTag<std::decay_t<T>>(std::forward<T>(value));
}

template <typename E>
ErrTag<std::decay_t<E>> Err(E&& error) {
    return ErrTag<std::decay_t<E>>(std::forward<E>(error));
}

struct Unit {};

inline OkTag<Unit> Ok() {
    return OkTag<Unit>(Unit{});
}

template <typename T, typename E>
class Result {
   public:
    template <typename U>
    Result(OkTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template <typename U>
    Result(ErrTag<U>&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool IsOk() const noexcept { return data_.index() == 0; }
    bool IsErr() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsOk(); }

    // Undefined if IsErr()
    T& Value() & { return std::get<0>(data_); }
    const T& Value() const& { return std::get<0>(data_); }
    T&& Value() && { return std::get<0>(std::move(data_)); }

    // Undefined if IsOk()
    E& Error() & { return std::get<1>(data_); }
    const E& Error() const& { return std::get<1>(data_); }
    E&& Error() && { return std::get<1>(std::move(data_)); }

    T ValueOr(T fallback) const& {
        if (IsOk()) return std::get<0>(data_);
        return fallback;
    }

    T ValueOr(T fallback) && {
        if (IsOk()) return std::get<0>(std::move(data_));
        return fallback;
    }

   private:
    std::variant<T, E> data_;
};

template <typename E>
class Result<void, E> {
   public:
    Result(OkTag<Unit>&&) : error_(std::nullopt) {}

    template <typename U>
    Result(ErrTag<U>&& err) : error_(std::move(err.error)) {}

    bool IsOk() const noexcept { return !error_.has_value(); }
    bool IsErr() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return IsOk(); }

    E& Error() & { return *error_; }
    const E& Error() const& { return *error_; }

   private:
    std::optional<E> error_;
};

}  // namespace heir
