// ============================================================================
// heir/local/registry.cpp - Registry Implementation
// ============================================================================

#include "heir/local/registry.hpp"

namespace heir {

Registry& Registry::Instance() {
    // Function-local static: constructed on first use, even when that use is
    // another translation unit's static initializer.
    static Registry instance;
    return instance;
}

VariableId Registry::AllocateId() noexcept {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
}

bool Registry::Register(const Descriptor& descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sealed_.load(std::memory_order_relaxed)) {
        return false;
    }
    entries_.push_back(descriptor);
    return true;
}

std::span<const Descriptor> Registry::Entries() {
    std::call_once(seal_once_, [this] {
        std::lock_guard<std::mutex> lock(mutex_);
        sealed_.store(true, std::memory_order_release);
    });
    return {entries_.data(), entries_.size()};
}

bool Registry::IsSealed() const noexcept {
    return sealed_.load(std::memory_order_acquire);
}

}  // namespace heir
