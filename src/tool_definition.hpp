#pragma once
#include "errors.hpp"
#include "redaction.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

enum class TransportMode { Stdio, JsonRpc, Mcp };

const char* transport_mode_name(TransportMode mode);

struct ArgSpec {
    std::string type = "string";  // string | int | bool | float
    bool required = false;
    std::optional<std::string> default_value;
    std::string description;
    std::vector<std::string> enum_values;
    bool redact = false;
};

struct CaptureSpec {
    std::string from;    // "", stdout, stderr, result, or a JSON path
    std::string format;  // "", text or json
};

struct ActionGovernance {
    std::optional<bool> read_only;  // unset inherits the tool default
    bool requires_approval = false;
    int approval_min = 0;
};

struct ToolAction {
    std::string description;
    std::string binary;  // overrides the tool binary
    std::vector<std::string> argv;
    std::string method;
    std::string mcp_tool;
    std::map<std::string, ArgSpec> args;
    std::map<std::string, CaptureSpec> capture;
    std::optional<ActionGovernance> governance;
};

struct StartupConfig {
    std::vector<std::string> argv;
    std::string ready_signal;
    std::string timeout;  // duration string, empty = transport default
    std::string shutdown_method;
};

struct ToolGovernance {
    bool read_only = false;
    std::vector<RedactionRule> redact;
};

struct ResolveInputsCapability {
    std::vector<std::string> prefixes;
    std::vector<std::string> context_fields;
};

struct ToolDefinition {
    std::string api_version = "tool/v0";
    std::string name;
    std::string version;
    std::string description;
    std::string binary;

    std::string mode;  // as written; "" means stdio
    std::string transport_binary;
    std::string connect;
    std::optional<StartupConfig> startup;

    std::optional<ToolGovernance> governance;
    std::optional<ResolveInputsCapability> resolve_inputs;
    std::map<std::string, ToolAction> actions;

    // Filled by finalize_definition()
    TransportMode transport = TransportMode::Stdio;
    std::vector<CompiledRedaction> redaction;
    std::optional<uint64_t> startup_timeout_ms;

    // Registration order within a catalog; a reload gets a higher number.
    uint64_t generation = 0;

    const ToolAction* find_action(const std::string& name) const;
    // action.binary > transport.binary > meta.binary
    const std::string& effective_binary(const ToolAction& action) const;
};

// Decode a definition document. Unknown fields and wrong value types are
// reported as error issues; the returned definition holds whatever could
// be decoded.
ToolDefinition parse_tool_definition(const nlohmann::json& doc, std::vector<ValidationIssue>& issues);

// Semantic checks on a decoded definition.
std::vector<ValidationIssue> validate_tool_definition(const ToolDefinition& def);

// Validate and resolve derived fields (transport enum, compiled redaction,
// startup timeout). Throws DefinitionError if any error-level issue exists.
ToolDefinition finalize_definition(ToolDefinition def, const std::string& source,
                                   std::vector<ValidationIssue> issues = {});

// parse + finalize
ToolDefinition load_tool_definition(const nlohmann::json& doc, const std::string& source);

// Read and load a definition file. Throws DefinitionError.
ToolDefinition load_tool_file(const std::string& path);

} // namespace toolhost
