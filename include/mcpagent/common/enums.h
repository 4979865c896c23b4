#pragma once

/// @file enums.h
/// @brief Enumerations shared between configuration and the engine boundary.

#include <optional>
#include <string_view>

namespace mcpagent::common {

/// Policy for reusing workflow IDs.
enum class WorkflowIdReusePolicy : int {
    kUnspecified = 0,
    kAllowDuplicate = 1,
    kAllowDuplicateFailedOnly = 2,
    kRejectDuplicate = 3,
    kTerminateIfRunning = 4,
};

/// Parse a snake_case policy name such as "allow_duplicate".
/// Returns nullopt for unknown names.
std::optional<WorkflowIdReusePolicy> parse_workflow_id_reuse_policy(
    std::string_view name);

/// snake_case name of a policy.
std::string_view to_string(WorkflowIdReusePolicy policy) noexcept;

}  // namespace mcpagent::common
