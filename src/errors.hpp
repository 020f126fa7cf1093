#pragma once
#include <exception>
#include <string>
#include <vector>

namespace toolhost {

struct ValidationIssue {
    std::string path;      // e.g. "actions.build.args.target.type"
    std::string message;
    bool warning = false;  // warnings never block registration
};

// Base of every failure raised while loading or invoking a tool.
// what() renders the message prefixed with whatever call context
// (alias, action) has been attached on the way up.
class ToolError : public std::exception {
public:
    explicit ToolError(std::string message);

    const char* what() const noexcept override { return rendered_.c_str(); }
    const std::string& message() const { return message_; }
    const std::string& alias() const { return alias_; }
    const std::string& action() const { return action_; }

    // Fills in alias/action if not already set. Inner layers win.
    void set_context(const std::string& alias, const std::string& action);

private:
    void render();

    std::string message_;
    std::string alias_;
    std::string action_;
    std::string rendered_;
};

class DefinitionError : public ToolError {
public:
    DefinitionError(const std::string& source, std::vector<ValidationIssue> issues);
    const std::vector<ValidationIssue>& issues() const { return issues_; }

private:
    std::vector<ValidationIssue> issues_;
};

class MissingArgument : public ToolError {
public:
    explicit MissingArgument(const std::string& name);
    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class InvalidEnumValue : public ToolError {
public:
    InvalidEnumValue(const std::string& name, const std::string& value,
                     std::vector<std::string> allowed);
    const std::string& name() const { return name_; }
    const std::string& value() const { return value_; }
    const std::vector<std::string>& allowed() const { return allowed_; }

private:
    std::string name_;
    std::string value_;
    std::vector<std::string> allowed_;
};

class BinaryNotFound : public ToolError {
public:
    explicit BinaryNotFound(const std::string& binary);
    const std::string& binary() const { return binary_; }

private:
    std::string binary_;
};

class StartupTimeout : public ToolError {
public:
    using ToolError::ToolError;
};

class ProcessExited : public ToolError {
public:
    using ToolError::ToolError;
};

class ProtocolError : public ToolError {
public:
    using ToolError::ToolError;
};

class CallCancelled : public ToolError {
public:
    using ToolError::ToolError;
};

// Error object returned by a worker. Numeric codes keep code_text
// as their decimal form; string codes leave code() at 0.
class RemoteError : public ToolError {
public:
    RemoteError(int code, std::string code_text, std::string remote_message);
    int code() const { return code_; }
    const std::string& code_text() const { return code_text_; }
    const std::string& remote_message() const { return remote_message_; }

private:
    int code_;
    std::string code_text_;
    std::string remote_message_;
};

} // namespace toolhost
