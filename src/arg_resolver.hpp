#pragma once
#include "tool_definition.hpp"

#include <map>
#include <string>
#include <vector>

namespace toolhost {

using ArgMap = std::map<std::string, std::string>;

constexpr const char* kRedactedValue = "[REDACTED]";

// Throws MissingArgument / InvalidEnumValue. Values still containing a
// "{{" template are exempt from the enum check.
void validate_args(const ToolAction& action, const ArgMap& args);

// Copy of args with non-empty defaults filled in for absent names.
ArgMap apply_defaults(const ToolAction& action, const ArgMap& args);

// vars overlaid by args
ArgMap merge_template_data(const ArgMap& vars, const ArgMap& args);

// Replace every {{ .key }} with data[key]. Unknown keys stay literal.
std::string render_template(const std::string& text, const ArgMap& data);

std::vector<std::string> resolve_argv(const std::vector<std::string>& argv, const ArgMap& data);

// Args with every non-empty redact-flagged value masked.
ArgMap redact_args(const ToolAction& action, const ArgMap& args);

// Human-readable problems, no side effects
std::vector<std::string> check_args(const ToolAction& action, const ArgMap& args);

} // namespace toolhost
