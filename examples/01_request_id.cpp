// ============================================================================
// Example 01: Request IDs That Follow the Work
// ============================================================================
//
// A handler scopes a request id once. Everything it awaits sees the id, and
// so does every background job it spawns through Inherit(). A job spawned
// without Inherit() does not.
//
// RUN:
//   cd build && ./example_request_id
//
// ============================================================================

#include <chrono>
#include <iostream>
#include <string>

#include "heir/heir.hpp"
#include "loop_executor.hpp"

using namespace heir;
using namespace std::chrono_literals;

inline InheritableLocal<std::string> kRequestId{"request_id"};

void Log(const std::string& message) {
    std::string id = kRequestId.Get().ValueOr("-");
    std::cout << "[" << id << "] " << message << std::endl;
}

Task<void> AuditLog(std::string action) {
    co_await AsyncSleep(20ms);
    Log("audit: " + action);
}

Task<void> Metrics() {
    co_await AsyncSleep(10ms);
    Log("metrics flushed (spawned without Inherit, so no id)");
}

Task<int> LoadUser(int user) {
    Log("loading user " + std::to_string(user));
    co_await AsyncSleep(5ms);
    co_return user * 100;
}

Task<void> HandleRequest(int user) {
    int balance = co_await LoadUser(user);
    Log("balance is " + std::to_string(balance));

    auto audit = Spawn(Inherit(AuditLog("read balance")));
    (void)Spawn(Metrics());

    auto joined = co_await audit;
    if (joined.IsErr()) {
        Log("audit failed: " + joined.Error().message());
    }
    Log("done");
}

Task<void> Server(examples::LoopExecutor* loop) {
    auto first = Spawn(kRequestId.Scope("req-1", HandleRequest(1)));
    auto second = Spawn(kRequestId.Scope("req-2", HandleRequest(2)));
    (void)co_await first;
    (void)co_await second;

    // Let the unjoined metrics jobs finish before stopping.
    co_await AsyncSleep(20ms);
    loop->Stop();
}

int main() {
    std::cout << "=== heir Example 01: Request IDs ===" << std::endl;

    examples::LoopExecutor loop;
    auto server = Spawn(loop, Server(&loop));
    loop.Run();

    std::cout << "finished: " << std::boolalpha << server.IsFinished() << std::endl;
    return 0;
}
