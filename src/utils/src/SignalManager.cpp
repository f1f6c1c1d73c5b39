#include "SignalManager.hpp"
#include "LogUtils.hpp"
#include <cerrno>
#include <cstring>

namespace SignalManager {

struct SignalCallbackList {
    std::vector<SignalCallback> normal_callbacks;
    std::optional<SignalCallback> final_callback;
};

static std::map<int, SignalCallbackList> callbacks;
static std::mutex cb_mutex;

static volatile std::sig_atomic_t interrupt_flag = 0;
static volatile std::sig_atomic_t guard_depth = 0;

// Runs in signal context. It never locks: writers block the signal while they touch the map.
void signal_handler(int signum) {
    auto it = callbacks.find(signum);
    if (it != callbacks.end()) {
        for (auto& cb : it->second.normal_callbacks) {
            cb(signum);
        }
        if (it->second.final_callback) {
            it->second.final_callback.value()(signum);
        }
    }
}

static void interrupt_handler(int) {
    interrupt_flag = 1;
}

void register_signal(int signum, SignalCallback cb, bool is_final) {
    std::lock_guard<std::mutex> lock(cb_mutex);

    sigset_t blocked, previous;
    sigemptyset(&blocked);
    sigaddset(&blocked, signum);
    pthread_sigmask(SIG_BLOCK, &blocked, &previous);

    if (is_final) {
        callbacks[signum].final_callback = std::move(cb);
    } else {
        callbacks[signum].normal_callbacks.push_back(std::move(cb));
    }

    pthread_sigmask(SIG_SETMASK, &previous, nullptr);
}

void setup() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    for (const auto& kv : callbacks) {
        std::signal(kv.first, signal_handler);
    }
}

bool interrupt_pending() {
    return guard_depth > 0 && interrupt_flag != 0;
}

InterruptGuard::InterruptGuard() {
    struct sigaction action {};
    action.sa_handler = interrupt_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    if (guard_depth == 0) {
        interrupt_flag = 0;
    }

    if (sigaction(SIGINT, &action, &previous_) != 0) {
        LogUtils::warn("Failed to install SIGINT handler: {}", std::strerror(errno));
        return;
    }
    installed_ = true;
    guard_depth = guard_depth + 1;
}

InterruptGuard::~InterruptGuard() {
    if (!installed_) return;
    guard_depth = guard_depth - 1;
    sigaction(SIGINT, &previous_, nullptr);
}

bool InterruptGuard::triggered() const {
    return interrupt_flag != 0;
}

}
