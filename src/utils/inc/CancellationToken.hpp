#pragma once
#include <atomic>
#include <chrono>
#include <string>

// Cooperative cancellation flag shared by an invocation. cancel() only touches an
// atomic so it may be called from a signal handler; waiters poll.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel(int reason = 0) noexcept;
    bool is_cancelled() const noexcept;

    // Signal number (or caller defined code) passed to the first cancel()
    int reason() const noexcept;

    // Sleeps for at most `duration`, returning early (true) once cancelled
    bool wait_for(std::chrono::milliseconds duration) const;

    void reset() noexcept;

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<int> reason_{0};

    static constexpr std::chrono::milliseconds POLL_INTERVAL{20};
};
