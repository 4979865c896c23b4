#pragma once

/// @file retry_policy.h
/// @brief Engine-side retry settings for activities scheduled from workflows.

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mcpagent::common {

/// How the engine retries a failed activity. Read from the
/// "temporal.retry_policy" settings section and forwarded unchanged in
/// workflows::ActivityOptions. The executor itself never retries.
struct RetryPolicy {
    /// "initial_interval_seconds": delay before the first retry.
    std::chrono::milliseconds initial_interval{std::chrono::seconds(1)};

    /// "backoff_coefficient": factor applied to the delay after every retry.
    /// Never below 1.0.
    double backoff_coefficient{2.0};

    /// "maximum_interval_seconds": upper bound on the delay. Unset lets the
    /// engine pick its own bound.
    std::optional<std::chrono::milliseconds> maximum_interval{};

    /// "maximum_attempts": attempts including the first one. 0 keeps
    /// retrying until the activity's schedule-to-close timeout expires.
    int maximum_attempts{0};

    /// "non_retryable_error_types": error type names that fail the activity
    /// on their first occurrence.
    std::vector<std::string> non_retryable_error_types{};
};

}  // namespace mcpagent::common
