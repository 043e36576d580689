// ============================================================================
// Example 02: Inheritance Down a Task Tree
// ============================================================================
//
// Values pass from parent to child only where the child is wrapped with
// Inherit(). A child can shadow a value with its own scope without the
// parent noticing, and one plain Spawn() cuts everything below it off.
//
// RUN:
//   cd build && ./example_nested_spawn
//
// ============================================================================

#include <iostream>
#include <string>

#include "heir/heir.hpp"
#include "loop_executor.hpp"

using namespace heir;

inline InheritableLocal<int> kDepth{"depth"};
inline InheritableLocal<std::string> kTenant{"tenant"};

void Report(const std::string& who) {
    std::cout << who << ": tenant=" << kTenant.Get().ValueOr("<unset>")
              << " depth=" << kDepth.With([](int d) { return std::to_string(d); }).ValueOr("<unset>")
              << std::endl;
}

Task<void> Leaf(std::string who) {
    co_await Yield();
    Report(who);
}

Task<void> Branch(std::string who, bool wrap_children) {
    Report(who);
    int depth = kDepth.Get().ValueOr(0);

    // The branch's children see one level deeper; the branch itself does not.
    co_await kDepth.Scope(depth + 1, [](std::string name, bool wrap) -> Task<void> {
        if (wrap) {
            (void)co_await Spawn(Inherit(Leaf(name + "/leaf")));
        } else {
            (void)co_await Spawn(Leaf(name + "/leaf"));
        }
    }(who, wrap_children));

    Report(who + " (after child scope)");
}

Task<void> Root(examples::LoopExecutor* loop) {
    co_await kTenant.Scope("acme", kDepth.Scope(0, [](examples::LoopExecutor* stop) -> Task<void> {
        Report("root");
        (void)co_await Spawn(Inherit(Branch("root/inherited", true)));
        (void)co_await Spawn(Branch("root/plain", true));
        stop->Stop();
    }(loop)));
}

int main() {
    std::cout << "=== heir Example 02: Nested Spawn ===" << std::endl;

    examples::LoopExecutor loop;
    (void)Spawn(loop, Root(&loop));
    loop.Run();

    return 0;
}
