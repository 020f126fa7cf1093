#include "tool_definition.hpp"
#include "json_path.hpp"
#include "util.hpp"

#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace toolhost {

using json = nlohmann::json;

const char* transport_mode_name(TransportMode mode) {
    switch (mode) {
        case TransportMode::Stdio: return "stdio";
        case TransportMode::JsonRpc: return "jsonrpc";
        case TransportMode::Mcp: return "mcp";
    }
    return "stdio";
}

const ToolAction* ToolDefinition::find_action(const std::string& action_name) const {
    auto it = actions.find(action_name);
    return it == actions.end() ? nullptr : &it->second;
}

const std::string& ToolDefinition::effective_binary(const ToolAction& action) const {
    if (!action.binary.empty()) return action.binary;
    if (!transport_binary.empty()) return transport_binary;
    return binary;
}

namespace {

std::string child_path(const std::string& base, const std::string& key) {
    return base.empty() ? key : base + "." + key;
}

std::optional<TransportMode> parse_mode(const std::string& mode) {
    if (mode.empty() || mode == "stdio") return TransportMode::Stdio;
    if (mode == "jsonrpc") return TransportMode::JsonRpc;
    if (mode == "mcp") return TransportMode::Mcp;
    return std::nullopt;
}

// Strict decoding helpers. Every problem becomes an error issue; decoding
// continues so one pass reports everything.
class Decoder {
public:
    explicit Decoder(std::vector<ValidationIssue>& issues) : issues_(issues) {}

    void error(const std::string& path, const std::string& message) {
        issues_.push_back({path, message, false});
    }

    bool check_object(const json& v, const std::string& path,
                      std::initializer_list<const char*> allowed) {
        if (!v.is_object()) {
            error(path, "must be an object");
            return false;
        }
        for (auto it = v.begin(); it != v.end(); ++it) {
            bool known = false;
            for (const char* k : allowed) {
                if (it.key() == k) {
                    known = true;
                    break;
                }
            }
            if (!known) error(child_path(path, it.key()), "unknown field");
        }
        return true;
    }

    // Present, non-null member that is a strictly-decoded object, else nullptr.
    const json* object(const json& parent, const char* key, const std::string& path,
                       std::initializer_list<const char*> allowed) {
        auto it = parent.find(key);
        if (it == parent.end() || it->is_null()) return nullptr;
        return check_object(*it, child_path(path, key), allowed) ? &*it : nullptr;
    }

    void string(const json& obj, const char* key, const std::string& path, std::string& out) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return;
        if (!it->is_string()) {
            error(child_path(path, key), "must be a string");
            return;
        }
        out = it->get<std::string>();
    }

    void boolean(const json& obj, const char* key, const std::string& path, bool& out) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return;
        if (!it->is_boolean()) {
            error(child_path(path, key), "must be a boolean");
            return;
        }
        out = it->get<bool>();
    }

    void integer(const json& obj, const char* key, const std::string& path, int& out) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return;
        if (!it->is_number_integer()) {
            error(child_path(path, key), "must be an integer");
            return;
        }
        out = it->get<int>();
    }

    // Array of scalars, rendered as text.
    void strings(const json& obj, const char* key, const std::string& path,
                 std::vector<std::string>& out) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return;
        std::string p = child_path(path, key);
        if (!it->is_array()) {
            error(p, "must be a list");
            return;
        }
        for (size_t i = 0; i < it->size(); ++i) {
            const json& v = (*it)[i];
            if (v.is_object() || v.is_array() || v.is_null()) {
                error(p + "[" + std::to_string(i) + "]", "must be a scalar");
                continue;
            }
            out.push_back(json_to_text(v));
        }
    }

private:
    std::vector<ValidationIssue>& issues_;
};

ArgSpec decode_arg(Decoder& d, const json& v, const std::string& path) {
    ArgSpec arg;
    arg.type.clear();
    if (!d.check_object(v, path, {"type", "required", "default", "description", "enum", "redact"})) {
        return arg;
    }
    d.string(v, "type", path, arg.type);
    d.boolean(v, "required", path, arg.required);
    d.string(v, "description", path, arg.description);
    d.boolean(v, "redact", path, arg.redact);
    d.strings(v, "enum", path, arg.enum_values);
    auto def = v.find("default");
    if (def != v.end() && !def->is_null()) {
        if (def->is_object() || def->is_array()) {
            d.error(child_path(path, "default"), "must be a scalar");
        } else {
            std::string text = json_to_text(*def);
            // An empty default means "no default"
            if (!text.empty()) arg.default_value = text;
        }
    }
    return arg;
}

ToolAction decode_action(Decoder& d, const json& v, const std::string& path) {
    ToolAction action;
    if (!d.check_object(v, path, {"description", "binary", "argv", "method", "mcp_tool", "args",
                                  "capture", "governance"})) {
        return action;
    }
    d.string(v, "description", path, action.description);
    d.string(v, "binary", path, action.binary);
    d.strings(v, "argv", path, action.argv);
    d.string(v, "method", path, action.method);
    d.string(v, "mcp_tool", path, action.mcp_tool);

    auto args = v.find("args");
    if (args != v.end() && !args->is_null()) {
        std::string args_path = child_path(path, "args");
        if (!args->is_object()) {
            d.error(args_path, "must be an object");
        } else {
            for (auto it = args->begin(); it != args->end(); ++it) {
                action.args[it.key()] = decode_arg(d, it.value(), child_path(args_path, it.key()));
            }
        }
    }

    auto capture = v.find("capture");
    if (capture != v.end() && !capture->is_null()) {
        std::string cap_path = child_path(path, "capture");
        if (!capture->is_object()) {
            d.error(cap_path, "must be an object");
        } else {
            for (auto it = capture->begin(); it != capture->end(); ++it) {
                std::string p = child_path(cap_path, it.key());
                CaptureSpec spec;
                if (d.check_object(it.value(), p, {"from", "format"})) {
                    d.string(it.value(), "from", p, spec.from);
                    d.string(it.value(), "format", p, spec.format);
                }
                action.capture[it.key()] = spec;
            }
        }
    }

    if (const json* gov = d.object(v, "governance", path,
                                   {"read_only", "requires_approval", "approval_min"})) {
        std::string p = child_path(path, "governance");
        ActionGovernance g;
        if (gov->contains("read_only")) {
            bool read_only = false;
            d.boolean(*gov, "read_only", p, read_only);
            g.read_only = read_only;
        }
        d.boolean(*gov, "requires_approval", p, g.requires_approval);
        d.integer(*gov, "approval_min", p, g.approval_min);
        action.governance = g;
    }
    return action;
}

} // namespace

ToolDefinition parse_tool_definition(const json& doc, std::vector<ValidationIssue>& issues) {
    ToolDefinition def;
    def.api_version.clear();
    Decoder d(issues);
    if (!d.check_object(doc, "", {"apiVersion", "meta", "transport", "governance", "capabilities",
                                  "actions"})) {
        return def;
    }

    d.string(doc, "apiVersion", "", def.api_version);

    if (const json* meta = d.object(doc, "meta", "", {"name", "version", "description", "binary"})) {
        d.string(*meta, "name", "meta", def.name);
        d.string(*meta, "version", "meta", def.version);
        d.string(*meta, "description", "meta", def.description);
        d.string(*meta, "binary", "meta", def.binary);
    }

    if (const json* transport = d.object(doc, "transport", "",
                                         {"mode", "binary", "connect", "startup"})) {
        d.string(*transport, "mode", "transport", def.mode);
        d.string(*transport, "binary", "transport", def.transport_binary);
        d.string(*transport, "connect", "transport", def.connect);
        if (const json* startup = d.object(*transport, "startup", "transport",
                                           {"argv", "ready_signal", "timeout", "shutdown_method"})) {
            StartupConfig sc;
            d.strings(*startup, "argv", "transport.startup", sc.argv);
            d.string(*startup, "ready_signal", "transport.startup", sc.ready_signal);
            d.string(*startup, "timeout", "transport.startup", sc.timeout);
            d.string(*startup, "shutdown_method", "transport.startup", sc.shutdown_method);
            def.startup = sc;
        }
    }

    if (const json* gov = d.object(doc, "governance", "", {"read_only", "redact"})) {
        ToolGovernance g;
        d.boolean(*gov, "read_only", "governance", g.read_only);
        auto redact = gov->find("redact");
        if (redact != gov->end() && !redact->is_null()) {
            if (!redact->is_array()) {
                d.error("governance.redact", "must be a list");
            } else {
                for (size_t i = 0; i < redact->size(); ++i) {
                    std::string p = "governance.redact[" + std::to_string(i) + "]";
                    RedactionRule rule;
                    if (d.check_object((*redact)[i], p, {"pattern", "replace"})) {
                        d.string((*redact)[i], "pattern", p, rule.pattern);
                        d.string((*redact)[i], "replace", p, rule.replace);
                    }
                    g.redact.push_back(rule);
                }
            }
        }
        def.governance = g;
    }

    if (const json* caps = d.object(doc, "capabilities", "", {"resolve_inputs"})) {
        if (const json* ri = d.object(*caps, "resolve_inputs", "capabilities",
                                      {"prefixes", "context_fields"})) {
            ResolveInputsCapability cap;
            d.strings(*ri, "prefixes", "capabilities.resolve_inputs", cap.prefixes);
            d.strings(*ri, "context_fields", "capabilities.resolve_inputs", cap.context_fields);
            def.resolve_inputs = cap;
        }
    }

    auto actions = doc.find("actions");
    if (actions != doc.end() && !actions->is_null()) {
        if (!actions->is_object()) {
            d.error("actions", "must be an object");
        } else {
            for (auto it = actions->begin(); it != actions->end(); ++it) {
                def.actions[it.key()] = decode_action(d, it.value(), "actions." + it.key());
            }
        }
    }
    return def;
}

std::vector<ValidationIssue> validate_tool_definition(const ToolDefinition& def) {
    std::vector<ValidationIssue> issues;
    auto error = [&](const std::string& path, const std::string& msg) {
        issues.push_back({path, msg, false});
    };
    auto warn = [&](const std::string& path, const std::string& msg) {
        issues.push_back({path, msg, true});
    };

    if (def.api_version != "tool/v0") {
        error("apiVersion", "unrecognized apiVersion \"" + def.api_version +
                                "\", expected \"tool/v0\"");
    }
    if (trim(def.name).empty()) error("meta.name", "tool definition requires meta.name");
    if (trim(def.binary).empty()) error("meta.binary", "tool definition requires meta.binary");
    if (def.actions.empty() && !def.resolve_inputs) {
        error("actions", "tool definition requires at least one action or capability");
    }
    if (def.resolve_inputs && def.resolve_inputs->prefixes.empty()) {
        error("capabilities.resolve_inputs.prefixes", "resolve_inputs requires at least one prefix");
    }

    auto mode = parse_mode(def.mode);
    if (!mode) {
        error("transport.mode", "invalid transport mode \"" + def.mode +
                                    "\": must be stdio, jsonrpc, or mcp");
    }
    if (!def.connect.empty() && mode != TransportMode::Mcp) {
        error("transport.connect", "transport.connect is only valid for mode: mcp");
    }
    if (def.startup && mode == TransportMode::Stdio) {
        warn("transport.startup",
             "transport.startup is not valid for mode: stdio (processes are spawned per call)");
    }
    if (def.startup && !def.startup->timeout.empty()) {
        try {
            parse_duration_ms(def.startup->timeout);
        } catch (const std::exception& e) {
            error("transport.startup.timeout", e.what());
        }
    }

    if (def.governance) {
        for (size_t i = 0; i < def.governance->redact.size(); ++i) {
            const auto& rule = def.governance->redact[i];
            try {
                compile_redaction_rules({rule});
            } catch (const std::invalid_argument& e) {
                error("governance.redact[" + std::to_string(i) + "].pattern", e.what());
            }
        }
    }

    for (const auto& [name, action] : def.actions) {
        std::string base = "actions." + name;
        if (mode == TransportMode::Stdio && action.argv.empty()) {
            error(base + ".argv", "action \"" + name + "\" requires 'argv' for stdio transport");
        } else if (mode == TransportMode::JsonRpc && action.method.empty()) {
            error(base + ".method", "action \"" + name + "\" requires 'method' for jsonrpc transport");
        } else if (mode == TransportMode::Mcp && action.mcp_tool.empty()) {
            error(base + ".mcp_tool", "action \"" + name + "\" requires 'mcp_tool' for mcp transport");
        }

        for (const auto& [arg_name, arg] : action.args) {
            std::string p = base + ".args." + arg_name;
            if (arg.type != "string" && arg.type != "int" && arg.type != "bool" && arg.type != "float") {
                error(p + ".type", "arg \"" + arg_name + "\" has invalid type \"" + arg.type +
                                       "\": must be string, int, bool, or float");
            }
            if (arg.required && arg.default_value) {
                warn(p + ".default", "arg \"" + arg_name +
                                         "\" is required and should not have a default value");
            }
            if (!arg.enum_values.empty() && arg.type != "string") {
                error(p + ".enum", "arg \"" + arg_name + "\" has enum but type is \"" + arg.type +
                                       "\" (enum requires type: string)");
            }
        }

        if (action.governance) {
            if (action.governance->approval_min < 0) {
                error(base + ".governance.approval_min", "approval_min must not be negative");
            } else if (action.governance->approval_min > 0 && !action.governance->requires_approval) {
                error(base + ".governance.approval_min",
                      "action \"" + name + "\" has approval_min but requires_approval is not set");
            }
        }

        for (const auto& [cap_name, cap] : action.capture) {
            if (!cap.format.empty() && cap.format != "text" && cap.format != "json") {
                error(base + ".capture." + cap_name + ".format",
                      "capture \"" + cap_name + "\" has invalid format \"" + cap.format +
                          "\": must be text or json");
            }
        }
    }
    return issues;
}

ToolDefinition finalize_definition(ToolDefinition def, const std::string& source,
                                   std::vector<ValidationIssue> issues) {
    auto semantic = validate_tool_definition(def);
    issues.insert(issues.end(), semantic.begin(), semantic.end());

    bool failed = false;
    for (const auto& issue : issues) {
        if (issue.warning) {
            std::cerr << "[catalog] warning: " << source << ": " << issue.path << ": "
                      << issue.message << std::endl;
        } else {
            failed = true;
        }
    }
    if (failed) throw DefinitionError(source, std::move(issues));

    def.transport = parse_mode(def.mode).value_or(TransportMode::Stdio);
    if (def.governance) def.redaction = compile_redaction_rules(def.governance->redact);
    if (def.startup && !def.startup->timeout.empty()) {
        def.startup_timeout_ms = parse_duration_ms(def.startup->timeout);
    }
    return def;
}

ToolDefinition load_tool_definition(const json& doc, const std::string& source) {
    std::vector<ValidationIssue> issues;
    ToolDefinition def = parse_tool_definition(doc, issues);
    return finalize_definition(std::move(def), source, std::move(issues));
}

ToolDefinition load_tool_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DefinitionError(path, {{"", "cannot open tool definition file", false}});
    }
    std::stringstream ss;
    ss << file.rdbuf();
    auto doc = json::parse(ss.str(), nullptr, false);
    if (doc.is_discarded()) {
        throw DefinitionError(path, {{"", "tool definition is not valid JSON", false}});
    }
    return load_tool_definition(doc, path);
}

} // namespace toolhost
