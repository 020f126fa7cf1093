#include "errors.hpp"
#include "util.hpp"

namespace toolhost {

ToolError::ToolError(std::string message) : message_(std::move(message)) {
    render();
}

void ToolError::set_context(const std::string& alias, const std::string& action) {
    if (alias_.empty()) alias_ = alias;
    if (action_.empty()) action_ = action;
    render();
}

void ToolError::render() {
    if (alias_.empty()) {
        rendered_ = message_;
    } else if (action_.empty()) {
        rendered_ = "tool \"" + alias_ + "\": " + message_;
    } else {
        rendered_ = "tool \"" + alias_ + "\" action \"" + action_ + "\": " + message_;
    }
}

static std::string summarize_issues(const std::string& source,
                                    const std::vector<ValidationIssue>& issues) {
    std::vector<std::string> errors;
    for (const auto& issue : issues) {
        if (issue.warning) continue;
        errors.push_back(issue.path.empty() ? issue.message
                                            : issue.path + ": " + issue.message);
    }
    return "definition " + source + " is invalid: " + join(errors, "; ");
}

DefinitionError::DefinitionError(const std::string& source, std::vector<ValidationIssue> issues)
    : ToolError(summarize_issues(source, issues)), issues_(std::move(issues)) {}

MissingArgument::MissingArgument(const std::string& name)
    : ToolError("missing required arg \"" + name + "\""), name_(name) {}

InvalidEnumValue::InvalidEnumValue(const std::string& name, const std::string& value,
                                   std::vector<std::string> allowed)
    : ToolError("arg \"" + name + "\" value \"" + value + "\" not in allowed values [" +
                join(allowed, ", ") + "]"),
      name_(name), value_(value), allowed_(std::move(allowed)) {}

BinaryNotFound::BinaryNotFound(const std::string& binary)
    : ToolError("binary \"" + binary + "\" not found on PATH"), binary_(binary) {}

static std::string render_remote(const std::string& code_text, const std::string& message) {
    if (code_text.empty()) return "remote error: " + message;
    return "remote error [" + code_text + "]: " + message;
}

RemoteError::RemoteError(int code, std::string code_text, std::string remote_message)
    : ToolError(render_remote(code_text, remote_message)),
      code_(code), code_text_(std::move(code_text)), remote_message_(std::move(remote_message)) {}

} // namespace toolhost
