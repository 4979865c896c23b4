#pragma once

/// @file settings_fields.h
/// @brief Checked conversions shared by the JSON and YAML settings readers.
/// Every function throws exceptions::ConfigException naming the offending
/// key.

#include <mcpagent/common/enums.h>
#include <mcpagent/common/logging.h>
#include <mcpagent/common/retry_policy.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace mcpagent::config::detail {

/// Longest timeout or interval accepted from settings (ten years).
inline constexpr int64_t kMaxDurationSeconds = 10LL * 365 * 24 * 3600;

/// Fractional seconds to milliseconds. Rejects NaN, negative values and
/// values above kMaxDurationSeconds.
std::chrono::milliseconds duration_from_seconds(double seconds,
                                                std::string_view key);

/// Whole seconds, with the same bounds as duration_from_seconds.
std::chrono::seconds whole_seconds(int64_t seconds, std::string_view key);

common::WorkflowIdReusePolicy reuse_policy_from_name(const std::string& name);

common::LogLevel log_level_from_name(const std::string& name);

/// Rejects a backoff coefficient below 1, negative attempts, and a maximum
/// interval shorter than the initial one.
void validate_retry_policy(const common::RetryPolicy& policy);

}  // namespace mcpagent::config::detail
