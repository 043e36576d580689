// ============================================================================
// heir/local/snapshot.cpp - Snapshot, Install and Restore
// ============================================================================

#include "heir/local/snapshot.hpp"

#include <utility>

#include "heir/core/check.hpp"

namespace heir {

// ============================================================================
// Snapshot
// ============================================================================

Snapshot Snapshot::Of(const Descriptor& descriptor, SharedHandle handle) {
    Snapshot snapshot;
    snapshot.entries_.push_back({&descriptor, std::move(handle)});
    return snapshot;
}

bool Snapshot::Contains(VariableId id) const noexcept {
    for (const Entry& entry : entries_) {
        if (entry.descriptor->id == id) {
            return true;
        }
    }
    return false;
}

Snapshot SnapshotCurrent() {
    Snapshot snapshot;
    for (const Descriptor& descriptor : Registry::Instance().Entries()) {
        if (descriptor.is_active(descriptor.id)) {
            snapshot.entries_.push_back({&descriptor, descriptor.capture(descriptor.id)});
        }
    }
    return snapshot;
}

// ============================================================================
// Install / Restore
// ============================================================================

InstallToken::InstallToken(InstallToken&& other) noexcept
    : snapshot_(other.snapshot_), thread_(other.thread_), installed_(std::exchange(other.installed_, false)) {}

InstallToken::~InstallToken() {
    HEIR_CHECK(!installed_, "install token dropped while its values are still installed");
}

InstallToken Install(const Snapshot& snapshot) {
    for (const Snapshot::Entry& entry : snapshot.Entries()) {
        entry.descriptor->push(entry.descriptor->id, entry.handle);
    }
    return InstallToken(&snapshot, std::this_thread::get_id());
}

void Restore(InstallToken& token) {
    HEIR_CHECK(token.installed_, "scope already exited: install token restored twice");
    HEIR_CHECK(token.thread_ == std::this_thread::get_id(),
               "scope already exited: restore on a different thread than its install");

    const auto& entries = token.snapshot_->Entries();
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        it->descriptor->pop(it->descriptor->id, it->handle.get());
    }
    token.installed_ = false;
}

}  // namespace heir
