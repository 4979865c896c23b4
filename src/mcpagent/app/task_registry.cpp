#include "mcpagent/app/task_registry.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "mcpagent/exceptions/executor_exception.h"

namespace mcpagent::app {

void TaskRegistry::register_activity(
    std::shared_ptr<activities::ActivityDefinition> definition) {
    if (!definition) {
        throw std::invalid_argument("Activity definition must not be null");
    }
    auto name = definition->name();
    if (activities_.contains(name)) {
        throw std::invalid_argument("Activity '" + name +
                                    "' is already registered");
    }
    activities_.emplace(std::move(name), std::move(definition));
}

std::shared_ptr<activities::ActivityDefinition> TaskRegistry::get_activity(
    const std::string& name) const {
    auto definition = find_activity(name);
    if (!definition) {
        throw exceptions::ActivityNotFoundException(name);
    }
    return definition;
}

std::shared_ptr<activities::ActivityDefinition> TaskRegistry::find_activity(
    const std::string& name) const {
    auto it = activities_.find(name);
    return it == activities_.end() ? nullptr : it->second;
}

std::vector<std::string> TaskRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(activities_.size());
    for (const auto& [name, _] : activities_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace mcpagent::app
