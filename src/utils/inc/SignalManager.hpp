#pragma once
#include <functional>
#include <map>
#include <vector>
#include <mutex>
#include <optional>
#include <csignal>
#include <signal.h>

namespace SignalManager {

using SignalCallback = std::function<void(int)>;

// Callbacks run inside the signal handler and must stick to async-signal-safe calls
// (no logging, no allocation, no locks). The final callback runs last.
void register_signal(int signum, SignalCallback cb, bool is_final = false);
void setup();

// True while an InterruptGuard is active and SIGINT has been received since it was armed.
bool interrupt_pending();

// Records SIGINT instead of terminating the process for the lifetime of the guard.
// The previous disposition is restored on destruction. Children exec'd while the guard
// is active get the default SIGINT behaviour back.
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    bool triggered() const;

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    struct sigaction previous_{};
    bool installed_ = false;
};

}
