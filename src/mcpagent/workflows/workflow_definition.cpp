#include "mcpagent/workflows/workflow_definition.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace mcpagent::workflows {

std::vector<nlohmann::json> WorkflowDefinition::unpack_input(
    const std::optional<nlohmann::json>& input) const {
    std::vector<nlohmann::json> args;
    if (parameter_count_ == 0) {
        return args;
    }
    if (!input) {
        throw std::invalid_argument("Workflow '" + name_ + "' expects " +
                                    std::to_string(parameter_count_) +
                                    " argument(s) but received no input");
    }
    if (parameter_count_ == 1) {
        args.push_back(*input);
        return args;
    }
    if (!input->is_array() || input->size() != parameter_count_) {
        throw std::invalid_argument(
            "Workflow '" + name_ + "' expects its " +
            std::to_string(parameter_count_) +
            " arguments packed as a JSON array of that size");
    }
    args.assign(input->begin(), input->end());
    return args;
}

async_::Task<nlohmann::json> WorkflowDefinition::execute(
    std::optional<nlohmann::json> input) const {
    auto args = unpack_input(input);
    auto instance = create_instance();
    if (!instance) {
        throw std::logic_error("Factory for workflow '" + name_ +
                               "' returned no instance");
    }
    return run_instance(run_func_, std::move(instance), std::move(args));
}

async_::Task<nlohmann::json> WorkflowDefinition::run_instance(
    RunFunc run, std::shared_ptr<void> instance,
    std::vector<nlohmann::json> args) {
    co_return co_await run(instance.get(), std::move(args));
}

}  // namespace mcpagent::workflows
