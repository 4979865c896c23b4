#pragma once

/// @file Registry of workflow definitions, keyed by workflow type name.

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <mcpagent/workflows/workflow_definition.h>

namespace mcpagent::app {

/// Workflow definitions known to the application.
class WorkflowRegistry {
public:
    /// Register a definition under its name, replacing any previous one.
    /// @throws std::invalid_argument on a null definition or empty name.
    void add(std::shared_ptr<workflows::WorkflowDefinition> definition);

    /// Look up a definition. Returns nullptr for unknown names.
    std::shared_ptr<workflows::WorkflowDefinition> get(
        const std::string& name) const;

    bool contains(const std::string& name) const;

    /// Registered names, sorted.
    std::vector<std::string> names() const;

    std::size_t size() const noexcept { return workflows_.size(); }

private:
    std::unordered_map<std::string,
                       std::shared_ptr<workflows::WorkflowDefinition>>
        workflows_;
};

}  // namespace mcpagent::app
