#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include "core/errors/hive_errors.hpp"

namespace hive::scheduler {

// Shared by the scheduler's retry() and the coordinator's attempt loop.
struct RetryPolicy {
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_backoff{200};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_backoff{5000};

    // `attempt` is zero based: attempt 0 is the first execution.
    bool allows_attempt(const std::uint32_t attempt) const {
        return attempt < max_attempts;
    }

    // Quota, capacity, timeout and cancellation failures are never retried.
    bool is_retryable(const core::errors::HiveError& error) const {
        return error.kind == core::errors::ErrorKind::ExecutionFailed;
    }

    // Delay before attempt `attempt` (>= 1).
    std::chrono::milliseconds backoff_for(const std::uint32_t attempt) const {
        if (attempt == 0) {
            return std::chrono::milliseconds(0);
        }
        double delay = static_cast<double>(initial_backoff.count());
        for (std::uint32_t i = 1; i < attempt; ++i) {
            delay *= backoff_multiplier;
        }
        const auto capped = std::min<double>(delay, static_cast<double>(max_backoff.count()));
        return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
    }
};

}  // namespace hive::scheduler
