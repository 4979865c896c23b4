#pragma once

/// @file workflow_options.h
/// @brief Options passed across the engine client boundary.

#include <mcpagent/common/enums.h>

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcpagent::engine {

/// Options for starting a workflow execution.
struct StartWorkflowOptions {
    /// Workflow ID (required).
    std::string id{};

    /// Task queue to run the workflow on (required).
    std::string task_queue{};

    /// Execution timeout for the entire workflow run.
    std::optional<std::chrono::milliseconds> execution_timeout{};

    /// Workflow ID reuse policy.
    common::WorkflowIdReusePolicy id_reuse_policy{
        common::WorkflowIdReusePolicy::kUnspecified};

    /// Metadata (headers) for the start RPC.
    std::unordered_map<std::string, std::string> rpc_metadata{};

    /// Request ID for idempotent start.
    std::optional<std::string> request_id{};
};

/// Options for terminating a workflow.
struct TerminateWorkflowOptions {
    /// Reason for termination.
    std::optional<std::string> reason{};
};

/// Options for canceling a workflow.
struct CancelWorkflowOptions {};

/// Options for signaling a workflow.
struct SignalWorkflowOptions {
    /// Request ID for idempotency.
    std::optional<std::string> request_id{};
};

}  // namespace mcpagent::engine
