#pragma once

/// @file Application context shared by executors.

#include <mcpagent/app/task_registry.h>
#include <mcpagent/app/workflow_registry.h>
#include <mcpagent/config/settings.h>

namespace mcpagent::app {

/// Settings plus the workflow and activity registries of one application.
/// Shared (std::shared_ptr) between the application and its executors.
struct Context {
    /// Application settings.
    config::Settings config{};

    /// Workflows the executor can start by name.
    WorkflowRegistry workflows{};

    /// Activities the executor can run or schedule by name.
    TaskRegistry task_registry{};
};

}  // namespace mcpagent::app
