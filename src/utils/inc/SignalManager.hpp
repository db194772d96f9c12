#pragma once
#include <functional>
#include <map>
#include <vector>
#include <mutex>
#include <optional>
#include <csignal>

class CancellationToken;

namespace SignalManager {

using SignalCallback = std::function<void(int)>;

// Callbacks run inside the signal handler, in registration order; the final
// callback (at most one per signal) runs last. Keep them async-signal-safe.
void register_signal(int signum, SignalCallback cb, bool is_final = false);

// Installs the handler for every signal that has callbacks
void setup();

// Drops all callbacks and restores default dispositions
void reset();

// SIGINT and SIGTERM cancel `token`, with the signal number as reason
void bind_cancellation(CancellationToken& token);

}
