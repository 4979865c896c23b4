#include "mcpagent/config/settings_fields.h"

#include <mcpagent/exceptions/executor_exception.h>

#include <cmath>

namespace mcpagent::config::detail {

namespace {

[[noreturn]] void throw_out_of_range(std::string_view key) {
    throw exceptions::ConfigException(
        "'" + std::string(key) + "' must be between 0 and " +
        std::to_string(kMaxDurationSeconds) + " seconds");
}

}  // namespace

std::chrono::milliseconds duration_from_seconds(double seconds,
                                                std::string_view key) {
    if (!std::isfinite(seconds) || seconds < 0 ||
        seconds > static_cast<double>(kMaxDurationSeconds)) {
        throw_out_of_range(key);
    }
    return std::chrono::milliseconds(std::llround(seconds * 1000));
}

std::chrono::seconds whole_seconds(int64_t seconds, std::string_view key) {
    if (seconds < 0 || seconds > kMaxDurationSeconds) {
        throw_out_of_range(key);
    }
    return std::chrono::seconds(seconds);
}

common::WorkflowIdReusePolicy reuse_policy_from_name(const std::string& name) {
    auto policy = common::parse_workflow_id_reuse_policy(name);
    if (!policy) {
        throw exceptions::ConfigException("Unknown id_reuse_policy '" + name +
                                          "'");
    }
    return *policy;
}

common::LogLevel log_level_from_name(const std::string& name) {
    auto level = common::parse_log_level(name);
    if (!level) {
        throw exceptions::ConfigException("Unknown logger level '" + name +
                                          "'");
    }
    return *level;
}

void validate_retry_policy(const common::RetryPolicy& policy) {
    if (!std::isfinite(policy.backoff_coefficient) ||
        policy.backoff_coefficient < 1.0) {
        throw exceptions::ConfigException(
            "'backoff_coefficient' must be at least 1.0");
    }
    if (policy.maximum_attempts < 0) {
        throw exceptions::ConfigException(
            "'maximum_attempts' must not be negative");
    }
    if (policy.maximum_interval &&
        *policy.maximum_interval < policy.initial_interval) {
        throw exceptions::ConfigException(
            "'maximum_interval_seconds' must not be shorter than "
            "'initial_interval_seconds'");
    }
}

}  // namespace mcpagent::config::detail
