#pragma once
#include "types.hpp"
#include <chrono>

class BackoffPolicy {
public:
    // Delay before retry number attempt+1:
    // min(initial_delay * multiplier^attempt, max_delay), jittered when
    // config.jitter_factor > 0 and always kept within
    // [min(initial_delay, max_delay), max_delay].
    static std::chrono::milliseconds next_delay(int attempt, const RetryConfig& config);
};
