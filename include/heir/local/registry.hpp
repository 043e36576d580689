// ============================================================================
// heir/local/registry.hpp - Process-Wide Registry of Inheritable Locals
// ============================================================================
//
// Every InheritableLocal<T> registers a Descriptor from its constructor. For
// namespace-scope declarations that happens during static initialization, so
// the registry is complete before main() runs.
//
// A Descriptor is the type-erased face of one declaration: four plain
// function pointers bound to Cell<T> for the declaration's value type. That
// is all SnapshotCurrent() and Install() need to handle variables of
// unrelated types in one loop.
//
// SEALING:
// --------
// The first call to Entries() seals the registry. After that the entry list
// never changes and is read without a lock. A declaration constructed after
// sealing (for example one living in a shared object loaded at runtime) still
// works as a task-local, but is never inherited: Register() returns false and
// InheritableLocal::IsInheritable() reports it. Nothing else signals this.
//
// ============================================================================

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace heir {

// Unique per declaration, dense, assigned in construction order.
using VariableId = std::size_t;

// Shared ownership of one scoped value, with the value type erased.
using SharedHandle = std::shared_ptr<const void>;

struct Descriptor {
    VariableId id = 0;
    const char* name = "";

    // Probe: does the calling thread have an active value?
    bool (*is_active)(VariableId) = nullptr;

    // Capture: a new reference to the active value (nullptr if none).
    SharedHandle (*capture)(VariableId) = nullptr;

    // Make `handle` the active value on the calling thread.
    void (*push)(VariableId, SharedHandle) = nullptr;

    // Undo the push of `expected`; it must be the active value.
    void (*pop)(VariableId, const void* expected) = nullptr;
};

class Registry {
   public:
    static Registry& Instance();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    [[nodiscard]] VariableId AllocateId() noexcept;

    // Returns false when the registry is already sealed.
    bool Register(const Descriptor& descriptor);

    // Seals on first call. The returned entries stay valid for the process.
    [[nodiscard]] std::span<const Descriptor> Entries();

    [[nodiscard]] bool IsSealed() const noexcept;

   private:
    Registry() = default;

    std::atomic<VariableId> next_id_{0};
    std::mutex mutex_;
    std::once_flag seal_once_;
    std::atomic<bool> sealed_{false};
    std::vector<Descriptor> entries_;
};

}  // namespace heir
