#include "CancellationToken.hpp"
#include <algorithm>
#include <thread>

constexpr std::chrono::milliseconds CancellationToken::POLL_INTERVAL;

void CancellationToken::cancel(int reason) noexcept {
    int unset = 0;
    reason_.compare_exchange_strong(unset, reason);
    cancelled_.store(true);
}

bool CancellationToken::is_cancelled() const noexcept {
    return cancelled_.load();
}

int CancellationToken::reason() const noexcept {
    return reason_.load();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    const auto deadline = Clock::now() + duration;
    while (!is_cancelled()) {
        const auto now = Clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, POLL_INTERVAL));
    }
    return true;
}

void CancellationToken::reset() noexcept {
    reason_.store(0);
    cancelled_.store(false);
}
