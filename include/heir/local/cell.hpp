// ============================================================================
// heir/local/cell.hpp - Per-Thread Value Stacks
// ============================================================================
//
// Cell<T> holds, for every declaration of value type T and for every thread,
// a stack of active values. The top of the stack is what reads see. Scopes
// and inheritance push on entry and pop on exit, strictly LIFO; a pop that
// does not match the top is a broken invariant and aborts.
//
// Values are held as std::shared_ptr<const T>. Pushing a captured handle on
// another thread shares the object; it is never copied.
//
// Each thread's table for T is sized to the largest VariableId it has seen
// and never shrinks, so block-scope or late declarations grow it for good.
//
// Cell<T> is an implementation detail behind InheritableLocal<T>. The
// Descriptor built by DescribeCell<T>() exposes it to the registry.
//
// ============================================================================

#pragma once

#include "heir/core/check.hpp"
#include "heir/local/registry.hpp"

#include <memory>
#include <vector>

namespace heir {

template <typename T>
class Cell {
   public:
    using Pointer = std::shared_ptr<const T>;

    // nullptr when nothing is active on this thread
    static const T* Top(VariableId id) {
        auto& stack = StackFor(id);
        return stack.empty() ? nullptr : stack.back().get();
    }

    static bool IsActive(VariableId id) { return !StackFor(id).empty(); }

    static SharedHandle Capture(VariableId id) {
        auto& stack = StackFor(id);
        if (stack.empty()) {
            return nullptr;
        }
        return stack.back();
    }

    static void Push(VariableId id, SharedHandle handle) {
        StackFor(id).push_back(std::static_pointer_cast<const T>(std::move(handle)));
    }

    static void Pop(VariableId id, const void* expected) {
        auto& stack = StackFor(id);
        HEIR_CHECK(!stack.empty(), "scope already exited: nothing left to restore");
        HEIR_CHECK(static_cast<const void*>(stack.back().get()) == expected,
                   "scope already exited: restore does not match the innermost install");
        stack.pop_back();
    }

    static size_t Depth(VariableId id) { return StackFor(id).size(); }

   private:
    // Kept out of line so a caller never holds a thread_local address across
    // a coroutine suspension.
    [[gnu::noinline]] static std::vector<Pointer>& StackFor(VariableId id) {
        static thread_local std::vector<std::vector<Pointer>> stacks;
        if (stacks.size() <= id) {
            stacks.resize(id + 1);
        }
        return stacks[id];
    }
};

template <typename T>
Descriptor DescribeCell(VariableId id, const char* name) {
    Descriptor d;
    d.id = id;
    d.name = name;
    d.is_active = &Cell<T>::IsActive;
    d.capture = &Cell<T>::Capture;
    d.push = &Cell<T>::Push;
    d.pop = &Cell<T>::Pop;
    return d;
}

}  // namespace heir
