#include "backoff_policy.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

std::chrono::milliseconds BackoffPolicy::next_delay(int attempt, const RetryConfig& config) {
    const double max_ms = static_cast<double>(config.max_delay.count());
    const double floor_ms = std::min(static_cast<double>(config.initial_delay.count()), max_ms);

    if (attempt < 0) {
        attempt = 0;
    }

    double delay_ms = static_cast<double>(config.initial_delay.count()) *
                      std::pow(config.multiplier, attempt);
    delay_ms = std::min(delay_ms, max_ms);

    if (config.jitter_factor > 0.0) {
        delay_ms = util::random_jitter(delay_ms, config.jitter_factor);
    }

    delay_ms = std::clamp(delay_ms, floor_ms, max_ms);

    return std::chrono::milliseconds(static_cast<long long>(std::llround(delay_ms)));
}
