#pragma once

/// @file workflow_client.h
/// @brief Interface over the workflow engine's client library.
///
/// The executor talks to the engine exclusively through these two classes.
/// A production build plugs the engine SDK's client in behind them; tests
/// substitute recording doubles.

#include <mcpagent/async_/task.h>
#include <mcpagent/config/settings.h>
#include <mcpagent/engine/workflow_options.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcpagent::engine {

/// Handle to a running or completed workflow execution.
/// Owned by whoever holds the shared_ptr; the executor keeps none.
class WorkflowHandle {
public:
    virtual ~WorkflowHandle() = default;

    /// Workflow ID.
    virtual const std::string& id() const noexcept = 0;

    /// Run ID, if the handle is pinned to one run.
    virtual const std::optional<std::string>& run_id() const noexcept = 0;

    /// Wait for the workflow to complete and return its result.
    virtual async_::Task<nlohmann::json> result() = 0;

    /// Terminate this workflow.
    virtual async_::Task<void> terminate(
        const TerminateWorkflowOptions& options = {}) = 0;

    /// Request cancellation of this workflow.
    virtual async_::Task<void> cancel(
        const CancelWorkflowOptions& options = {}) = 0;

    /// Send a signal to this workflow.
    virtual async_::Task<void> signal(
        const std::string& signal_name,
        const nlohmann::json& payload,
        const SignalWorkflowOptions& options = {}) = 0;
};

/// Client connected to a workflow engine. Thread-safe implementations are
/// expected; the executor shares one client across all callers.
class WorkflowClient {
public:
    virtual ~WorkflowClient() = default;

    /// Namespace this client uses.
    virtual const std::string& ns() const noexcept = 0;

    /// Start a workflow execution.
    /// @param workflow_type Registered workflow type name.
    /// @param input Single input payload; nullopt starts with no input.
    virtual async_::Task<std::shared_ptr<WorkflowHandle>> start_workflow(
        const std::string& workflow_type,
        std::optional<nlohmann::json> input,
        const StartWorkflowOptions& options) = 0;

    /// Get a handle to an existing workflow. Makes no remote call.
    virtual std::shared_ptr<WorkflowHandle> get_workflow_handle(
        const std::string& workflow_id,
        std::optional<std::string> run_id = std::nullopt) = 0;
};

/// Creates a connected client from the executor configuration.
using ClientConnector =
    std::function<async_::Task<std::shared_ptr<WorkflowClient>>(
        const config::TemporalExecutorConfig&)>;

}  // namespace mcpagent::engine
