#pragma once

/// @file Workflow ambient API: detects and reaches the workflow context the
/// engine runtime installs while workflow code runs.

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <mcpagent/async_/task.h>
#include <mcpagent/workflows/activity_options.h>
#include <mcpagent/workflows/workflow_info.h>

namespace mcpagent::workflows {

class WorkflowContext;

/// Static ambient API accessible from within workflow code.
/// Uses a thread_local WorkflowContext*; the engine runtime runs each
/// workflow activation on a single thread.
class Workflow {
public:
    /// Whether code is currently running inside a workflow.
    static bool in_workflow() noexcept;

    /// Get the workflow info. Throws if not in a workflow.
    static const WorkflowInfo& info();

    /// Schedule an activity and wait for its result. Throws if not in a
    /// workflow.
    static async_::Task<nlohmann::json> execute_activity(
        const std::string& activity_type,
        std::vector<nlohmann::json> args,
        const ActivityOptions& options);

    Workflow() = delete;
};

/// Per-execution hooks provided by the engine runtime.
class WorkflowContext {
public:
    virtual ~WorkflowContext() = default;

    virtual const WorkflowInfo& info() const = 0;

    /// Schedule an activity through the engine and complete with its result.
    virtual async_::Task<nlohmann::json> schedule_activity(
        const std::string& activity_type,
        std::vector<nlohmann::json> args,
        const ActivityOptions& options) = 0;

    /// Get the current workflow context. Returns nullptr if not in workflow.
    static WorkflowContext* current() noexcept { return current_; }

    /// Set the current context (called by the engine runtime).
    static void set_current(WorkflowContext* ctx) noexcept { current_ = ctx; }

private:
    static thread_local WorkflowContext* current_;
};

/// RAII scope for setting and restoring the workflow context.
class WorkflowContextScope {
public:
    explicit WorkflowContextScope(WorkflowContext* ctx) noexcept
        : previous_(WorkflowContext::current()) {
        WorkflowContext::set_current(ctx);
    }

    ~WorkflowContextScope() noexcept {
        WorkflowContext::set_current(previous_);
    }

    WorkflowContextScope(const WorkflowContextScope&) = delete;
    WorkflowContextScope& operator=(const WorkflowContextScope&) = delete;

private:
    WorkflowContext* previous_;
};

}  // namespace mcpagent::workflows
