#include "clock.hpp"
#include <algorithm>

namespace {
constexpr std::chrono::milliseconds kWakeSlice{100};
}

void CancellationToken::cancel() {
    cancelled_.store(true);
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!cancelled_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kWakeSlice);
        cv_.wait_for(lock, slice);
    }
    return false;
}

Clock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

bool SteadyClock::sleep_for(std::chrono::milliseconds duration, const CancellationToken& token) {
    return token.wait_for(duration);
}
