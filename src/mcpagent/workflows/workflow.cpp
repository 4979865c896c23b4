#include "mcpagent/workflows/workflow.h"

#include <stdexcept>
#include <utility>

namespace mcpagent::workflows {

thread_local WorkflowContext* WorkflowContext::current_ = nullptr;

static WorkflowContext& require_context() {
    auto* ctx = WorkflowContext::current();
    if (!ctx) {
        throw std::runtime_error(
            "Not in a workflow context. Workflow static methods can only be "
            "called from within a workflow.");
    }
    return *ctx;
}

bool Workflow::in_workflow() noexcept {
    return WorkflowContext::current() != nullptr;
}

const WorkflowInfo& Workflow::info() {
    return require_context().info();
}

async_::Task<nlohmann::json> Workflow::execute_activity(
    const std::string& activity_type,
    std::vector<nlohmann::json> args,
    const ActivityOptions& options) {
    // Not a coroutine: the context is resolved at call time, on the
    // activation thread.
    auto& ctx = require_context();
    return ctx.schedule_activity(activity_type, std::move(args), options);
}

}  // namespace mcpagent::workflows
