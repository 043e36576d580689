// ============================================================================
// heir/local/snapshot.hpp - Capturing and Installing Inherited Values
// ============================================================================
//
// A Snapshot is the set of inheritable locals active on the calling thread at
// one moment, each paired with a shared handle to its value. It is taken once
// when a task is wrapped with Inherit(), and installed around every poll of
// that task.
//
// Install() pushes every handle onto its cell on the calling thread and
// returns a token; Restore() pops them again in reverse order. A token can be
// restored exactly once, on the thread that installed it. Anything else means
// the LIFO discipline was broken and aborts through HEIR_CHECK.
//
// USAGE:
// ------
//   Snapshot snapshot = SnapshotCurrent();
//
//   // later, possibly on another thread
//   {
//       InstallGuard guard(snapshot);
//       task_handle.resume();
//   }   // restored here, whatever the task did
//
// ============================================================================

#pragma once

#include "heir/local/registry.hpp"

#include <cstddef>
#include <thread>
#include <vector>

namespace heir {

class Snapshot;
class InstallToken;

// Seals the registry on first use.
[[nodiscard]] Snapshot SnapshotCurrent();

// `snapshot` must outlive the returned token.
[[nodiscard]] InstallToken Install(const Snapshot& snapshot);

void Restore(InstallToken& token);

class Snapshot {
   public:
    struct Entry {
        const Descriptor* descriptor;
        SharedHandle handle;
    };

    Snapshot() = default;

    // Owned by exactly one wrapper
    Snapshot(const Snapshot&) = delete;
    Snapshot& operator=(const Snapshot&) = delete;
    Snapshot(Snapshot&&) noexcept = default;
    Snapshot& operator=(Snapshot&&) noexcept = default;

    // One-variable snapshot, used to run a body under a single scoped value.
    static Snapshot Of(const Descriptor& descriptor, SharedHandle handle);

    [[nodiscard]] size_t Size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] bool Contains(VariableId id) const noexcept;
    [[nodiscard]] const std::vector<Entry>& Entries() const noexcept { return entries_; }

   private:
    friend Snapshot SnapshotCurrent();

    std::vector<Entry> entries_;
};

class InstallToken {
   public:
    InstallToken(InstallToken&& other) noexcept;
    InstallToken& operator=(InstallToken&&) = delete;
    InstallToken(const InstallToken&) = delete;
    InstallToken& operator=(const InstallToken&) = delete;

    ~InstallToken();

    [[nodiscard]] bool IsInstalled() const noexcept { return installed_; }

   private:
    friend InstallToken Install(const Snapshot& snapshot);
    friend void Restore(InstallToken& token);

    InstallToken(const Snapshot* snapshot, std::thread::id thread) noexcept
        : snapshot_(snapshot), thread_(thread), installed_(true) {}

    const Snapshot* snapshot_;
    std::thread::id thread_;
    bool installed_;
};

// Install for the lifetime of the guard.
class InstallGuard {
   public:
    explicit InstallGuard(const Snapshot& snapshot) : token_(Install(snapshot)) {}
    ~InstallGuard() { Restore(token_); }

    InstallGuard(const InstallGuard&) = delete;
    InstallGuard& operator=(const InstallGuard&) = delete;

   private:
    InstallToken token_;
};

}  // namespace heir
