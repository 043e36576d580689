// ============================================================================
// heir/local/inheritable_local.hpp - Declaring Inheritable Task-Locals
// ============================================================================
//
// InheritableLocal<T> is a task-local variable that child tasks can inherit.
// Inside a task it behaves like any scoped task-local: Scope() makes a value
// visible for the duration of a body, With()/Get() read the innermost value.
// On top of that, a task wrapped with Inherit() sees every inheritable local
// that was in scope where it was wrapped, by shared reference.
//
// Declare them at namespace scope so they register before main():
//
//   inline heir::InheritableLocal<std::string> kRequestId{"request_id"};
//
// USAGE:
// ------
//   Task<void> Handle(Request req) {
//       co_await kRequestId.Scope(req.id, Process(req));
//   }
//
//   Task<void> Process(Request req) {
//       // Runs on the executor, still sees the request id
//       co_await Spawn(Inherit(AuditLog(req)));
//   }
//
//   Task<void> AuditLog(Request req) {
//       auto id = kRequestId.Get();   // Ok(req.id)
//       ...
//   }
//
// The value is allocated once per Scope()/SyncScope() call and shared from
// then on; T does not need to be copyable. Readers only get const access.
//
// ============================================================================

#pragma once

#include "heir/core/error.hpp"
#include "heir/core/result.hpp"
#include "heir/core/task.hpp"
#include "heir/local/cell.hpp"
#include "heir/local/registry.hpp"
#include "heir/local/snapshot.hpp"
#include "heir/local/splice.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace heir {

template <typename T>
class InheritableLocal {
   public:
    explicit InheritableLocal(const char* name = "inheritable_local")
        : descriptor_(DescribeCell<T>(Registry::Instance().AllocateId(), name)),
          inheritable_(Registry::Instance().Register(descriptor_)) {}

    // One object per declaration
    InheritableLocal(const InheritableLocal&) = delete;
    InheritableLocal& operator=(const InheritableLocal&) = delete;
    InheritableLocal(InheritableLocal&&) = delete;
    InheritableLocal& operator=(InheritableLocal&&) = delete;

    [[nodiscard]] VariableId Id() const noexcept { return descriptor_.id; }
    [[nodiscard]] const char* Name() const noexcept { return descriptor_.name; }

    // False when declared after the registry was sealed: the variable works
    // as a plain task-local but is never carried into wrapped tasks.
    [[nodiscard]] bool IsInheritable() const noexcept { return inheritable_; }

    [[nodiscard]] bool IsSet() const { return Cell<T>::IsActive(Id()); }

    // ========================================================================
    // Reading
    // ========================================================================

    // Calls `func` with the innermost value. Errc::NotSet if there is none.
    // A reference returned by `func` is copied into the result.
    template <typename F>
    auto With(F&& func) const -> Result<std::remove_cvref_t<std::invoke_result_t<F, const T&>>, Error> {
        using R = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
        const T* top = Cell<T>::Top(Id());
        if (!top) {
            return Err(make_error_code(Errc::NotSet));
        }
        if constexpr (std::is_void_v<R>) {
            std::invoke(std::forward<F>(func), *top);
            return Ok();
        } else {
            return Ok(std::invoke(std::forward<F>(func), *top));
        }
    }

    Result<T, Error> Get() const
        requires std::copy_constructible<T>
    {
        return With([](const T& value) { return value; });
    }

    // ========================================================================
    // Scoping
    // ========================================================================

    // Runs `body` with `value` visible on every poll, and only then.
    template <typename R>
    [[nodiscard]] Task<R> Scope(T value, Task<R> body) const {
        return detail::Spliced(Snapshot::Of(descriptor_, MakeHandle(std::move(value))), std::move(body));
    }

    // Synchronous form: `value` is visible on this thread while `body` runs.
    template <typename F>
    std::invoke_result_t<F> SyncScope(T value, F&& body) const {
        Snapshot scoped = Snapshot::Of(descriptor_, MakeHandle(std::move(value)));
        InstallGuard guard(scoped);
        return std::invoke(std::forward<F>(body));
    }

   private:
    static SharedHandle MakeHandle(T&& value) { return std::make_shared<const T>(std::move(value)); }

    Descriptor descriptor_;
    bool inheritable_;
};

}  // namespace heir
