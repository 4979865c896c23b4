#include "mcpagent/app/workflow_registry.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace mcpagent::app {

void WorkflowRegistry::add(
    std::shared_ptr<workflows::WorkflowDefinition> definition) {
    if (!definition) {
        throw std::invalid_argument("Workflow definition must not be null");
    }
    if (definition->name().empty()) {
        throw std::invalid_argument("Workflow definition must have a name");
    }
    auto name = definition->name();
    workflows_[std::move(name)] = std::move(definition);
}

std::shared_ptr<workflows::WorkflowDefinition> WorkflowRegistry::get(
    const std::string& name) const {
    auto it = workflows_.find(name);
    if (it == workflows_.end()) {
        return nullptr;
    }
    return it->second;
}

bool WorkflowRegistry::contains(const std::string& name) const {
    return workflows_.contains(name);
}

std::vector<std::string> WorkflowRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(workflows_.size());
    for (const auto& [name, _] : workflows_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace mcpagent::app
