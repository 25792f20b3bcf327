#pragma once

#include "tutorgate/gateway/core.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>

namespace tutorgate {
namespace gateway {

/**
 * Retry Policy
 *
 * Implements:
 * - Immediate retries against a backend before giving up on it
 * - Exponential backoff between recovery probes once it is given up on
 */
class RetryPolicy {
public:
    struct Config {
        int64_t base_delay_ms = 1000;     // Base delay for exponential backoff
        int64_t max_delay_ms = 30000;     // Maximum delay between probes
        int32_t max_retries = 1;          // Immediate retries after the first failure
    };

    RetryPolicy(const Config& config = Config()) : config_(config) {}

    /**
     * Calculate delay for retry attempt using exponential backoff
     * Formula: delay = base * 2^attempt (capped at max_delay_ms)
     */
    int64_t calculate_backoff_delay(int32_t attempt) const {
        if (attempt < 0) {
            attempt = 0;
        }
        // Past 2^20 the cap always applies
        if (attempt > 20) {
            return config_.max_delay_ms;
        }
        int64_t delay = config_.base_delay_ms * (1LL << attempt);
        return std::min(delay, config_.max_delay_ms);
    }

    std::chrono::milliseconds backoff(int32_t attempt) const {
        return std::chrono::milliseconds(calculate_backoff_delay(attempt));
    }

    int32_t max_retries() const {
        return config_.max_retries;
    }

private:
    Config config_;
};

} // namespace gateway
} // namespace tutorgate
