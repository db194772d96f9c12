#include "SignalManager.hpp"
#include "CancellationToken.hpp"
#include <signal.h>

namespace SignalManager {

struct SignalCallbackList {
    std::vector<SignalCallback> normal_callbacks;
    std::optional<SignalCallback> final_callback;
};

static std::map<int, SignalCallbackList> callbacks;
static std::mutex cb_mutex;

void signal_handler(int signum) {
    // A signal landing while this thread registers callbacks must not deadlock
    std::unique_lock<std::mutex> lock(cb_mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }

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

void register_signal(int signum, SignalCallback cb, bool is_final) {
    std::lock_guard<std::mutex> lock(cb_mutex);
    if (is_final) {
        callbacks[signum].final_callback = std::move(cb);
    } else {
        callbacks[signum].normal_callbacks.push_back(std::move(cb));
    }
}

void setup() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    for (const auto& kv : callbacks) {
        struct sigaction action {};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;
        sigaction(kv.first, &action, nullptr);
    }
}

void reset() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    for (const auto& kv : callbacks) {
        std::signal(kv.first, SIG_DFL);
    }
    callbacks.clear();
}

void bind_cancellation(CancellationToken& token) {
    CancellationToken* target = &token;
    register_signal(SIGINT, [target](int signum) { target->cancel(signum); });
    register_signal(SIGTERM, [target](int signum) { target->cancel(signum); });
    setup();
}

}
