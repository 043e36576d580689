// ============================================================================
// heir/local/inherit.hpp - Carrying Inheritable Locals Into a Spawned Task
// ============================================================================
//
// Inherit(task) snapshots the inheritable locals in scope right now and
// returns a task that installs them around each of its polls. Pass it to
// Spawn() exactly where the plain task would go:
//
//   Task<void> Rebuild() {
//       co_await Spawn(Inherit(Reindex()));   // Reindex sees "acme"
//       co_await Spawn(Reindex());            // does not
//   }
//
//   co_await kTenant.Scope("acme", Rebuild());
//
// The snapshot is taken at the Inherit() call, not when the task is spawned
// or first polled. Values the parent scopes later are not seen by the child,
// and scopes the child enters stay in the child. Nothing is copied: parent
// and child share the same objects.
//
// ============================================================================

#pragma once

#include "heir/core/task.hpp"
#include "heir/local/snapshot.hpp"
#include "heir/local/splice.hpp"

#include <utility>

namespace heir {

template <typename T>
[[nodiscard]] Task<T> Inherit(Task<T> task) {
    return detail::Spliced(SnapshotCurrent(), std::move(task));
}

}  // namespace heir
