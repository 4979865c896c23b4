#include <mcpagent/common/enums.h>

#include <array>
#include <utility>

namespace mcpagent::common {

namespace {

constexpr std::array<std::pair<std::string_view, WorkflowIdReusePolicy>, 5>
    kReusePolicyNames{{
        {"unspecified", WorkflowIdReusePolicy::kUnspecified},
        {"allow_duplicate", WorkflowIdReusePolicy::kAllowDuplicate},
        {"allow_duplicate_failed_only",
         WorkflowIdReusePolicy::kAllowDuplicateFailedOnly},
        {"reject_duplicate", WorkflowIdReusePolicy::kRejectDuplicate},
        {"terminate_if_running", WorkflowIdReusePolicy::kTerminateIfRunning},
    }};

}  // namespace

std::optional<WorkflowIdReusePolicy> parse_workflow_id_reuse_policy(
    std::string_view name) {
    for (const auto& [key, value] : kReusePolicyNames) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::string_view to_string(WorkflowIdReusePolicy policy) noexcept {
    for (const auto& [key, value] : kReusePolicyNames) {
        if (value == policy) {
            return key;
        }
    }
    return "unspecified";
}

}  // namespace mcpagent::common
