#pragma once

/// @file Workflow ID generation.

#include <string>
#include <string_view>

namespace mcpagent::executor {

/// Random (version 4) UUID in canonical 8-4-4-4-12 lowercase hex form.
std::string generate_uuid4();

/// Workflow ID of the form "<workflow_type>-<uuid4>".
std::string make_workflow_id(std::string_view workflow_type);

}  // namespace mcpagent::executor
