#pragma once

/// @file Activity options for scheduling activities from workflows.

#include <chrono>
#include <optional>
#include <string>

#include <mcpagent/common/retry_policy.h>

namespace mcpagent::workflows {

/// Options for scheduling an activity from a workflow.
/// At least one of schedule_to_close_timeout or start_to_close_timeout must
/// be set; the engine rejects the command otherwise.
struct ActivityOptions {
    /// Maximum time from scheduling to completion of the activity, retries
    /// included.
    std::optional<std::chrono::milliseconds> schedule_to_close_timeout{};

    /// Maximum time a single attempt may run once picked up by a worker.
    std::optional<std::chrono::milliseconds> start_to_close_timeout{};

    /// Retry policy for the activity.
    std::optional<common::RetryPolicy> retry_policy{};

    /// Task queue for the activity. If not set, the workflow's task queue is
    /// used.
    std::optional<std::string> task_queue{};

    /// Override the activity ID. If not set, the engine generates one.
    std::optional<std::string> activity_id{};
};

}  // namespace mcpagent::workflows
