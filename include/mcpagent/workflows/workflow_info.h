#pragma once

/// @file Information about the currently running workflow.

#include <cstdint>
#include <string>

namespace mcpagent::workflows {

/// Information about the running workflow, as reported by the engine.
struct WorkflowInfo {
    /// Workflow ID.
    std::string workflow_id{};

    /// Run ID.
    std::string run_id{};

    /// Workflow type name.
    std::string workflow_type{};

    /// Namespace the workflow runs in.
    std::string namespace_{};

    /// Task queue the workflow runs on.
    std::string task_queue{};

    /// Attempt number, starting at 1.
    int32_t attempt{1};
};

}  // namespace mcpagent::workflows
