#pragma once

/// @file Registry of activities the executor may run or schedule by name.

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <mcpagent/activities/activity.h>

namespace mcpagent::app {

/// Activity definitions known to the application.
class TaskRegistry {
public:
    /// Register an activity under its name.
    /// @throws std::invalid_argument on a null definition or duplicate name.
    void register_activity(
        std::shared_ptr<activities::ActivityDefinition> definition);

    /// Look up an activity.
    /// @throws exceptions::ActivityNotFoundException for unknown names.
    std::shared_ptr<activities::ActivityDefinition> get_activity(
        const std::string& name) const;

    /// Look up an activity. Returns nullptr for unknown names.
    std::shared_ptr<activities::ActivityDefinition> find_activity(
        const std::string& name) const;

    /// Registered names, sorted.
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string,
                       std::shared_ptr<activities::ActivityDefinition>>
        activities_;
};

}  // namespace mcpagent::app
