//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// loader/retry_policy.hpp
//
// Bounds for resubmitting a bulk batch after transient failures
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace duckes {

struct RetryPolicy {
    // Total attempts per batch, the first submission included
    uint32_t max_attempts = 5;
    // Wall-clock cap across all attempts of one batch
    std::chrono::milliseconds max_retry_time{10000};
    std::chrono::milliseconds initial_backoff{50};
    std::chrono::milliseconds max_backoff{1000};

    // Delay before attempt number `attempt` (2 = first retry):
    // initial_backoff doubled per retry, capped at max_backoff
    std::chrono::milliseconds BackoffBefore(uint32_t attempt) const {
        if (attempt <= 1) {
            return std::chrono::milliseconds(0);
        }
        auto delay = initial_backoff;
        for (uint32_t i = 2; i < attempt && delay < max_backoff; ++i) {
            delay *= 2;
        }
        return delay < max_backoff ? delay : max_backoff;
    }

    bool Validate(std::string& error) const {
        if (max_attempts == 0) {
            error = "max-request-retries must be at least 1";
            return false;
        }
        if (max_retry_time.count() < 0 || initial_backoff.count() < 0 || max_backoff.count() < 0) {
            error = "Retry durations must not be negative";
            return false;
        }
        if (initial_backoff > max_backoff) {
            error = "Initial backoff exceeds maximum backoff";
            return false;
        }
        return true;
    }
};

} // namespace duckes
