#include "governance.hpp"

namespace toolhost {

std::optional<ActionResult> check_approval(const ToolAction& action) {
    if (!action.governance || !action.governance->requires_approval) return std::nullopt;
    ActionResult gated;
    gated.requires_approval = true;
    gated.approval_min = action.governance->approval_min;
    return gated;
}

bool is_read_only(const ToolDefinition& def, const ToolAction& action) {
    if (action.governance && action.governance->read_only) return *action.governance->read_only;
    return def.governance && def.governance->read_only;
}

} // namespace toolhost
