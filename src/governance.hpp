#pragma once
#include "result_normalizer.hpp"
#include "tool_definition.hpp"

#include <optional>

namespace toolhost {

// The pending-approval result for a gated action, or nullopt if the
// action may run.
std::optional<ActionResult> check_approval(const ToolAction& action);

// The action's override when it has one, else the tool default.
bool is_read_only(const ToolDefinition& def, const ToolAction& action);

} // namespace toolhost
