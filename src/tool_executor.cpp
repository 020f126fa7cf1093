#include "tool_executor.hpp"
#include "errors.hpp"
#include "governance.hpp"
#include "transports/jsonrpc_transport.hpp"
#include "transports/mcp_transport.hpp"
#include "transports/stdio_transport.hpp"

#include <chrono>
#include <stdexcept>

namespace toolhost {

namespace {

std::vector<CompiledRedaction> compile_global_rules(const Config& config) {
    try {
        return compile_redaction_rules(config.redact);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("config: ") + e.what());
    }
}

TransportTimeouts transport_timeouts(const Config& config) {
    TransportTimeouts t;
    t.jsonrpc_startup = std::chrono::milliseconds(config.timeouts.jsonrpc_startup_ms);
    t.mcp_startup = std::chrono::milliseconds(config.timeouts.mcp_startup_ms);
    t.startup_grace = std::chrono::milliseconds(config.timeouts.startup_grace_ms);
    return t;
}

size_t mode_index(TransportMode mode) {
    return static_cast<size_t>(mode);
}

} // namespace

ToolExecutor::ToolExecutor(const Config& config)
    : normalizer_(compile_global_rules(config)) {
    catalog_.set_base_dir(config.tool_dir);
    supervisor_.set_shutdown_grace(std::chrono::milliseconds(config.timeouts.shutdown_grace_ms));

    TransportTimeouts timeouts = transport_timeouts(config);
    transports_[mode_index(TransportMode::Stdio)] = std::make_unique<StdioTransport>();
    transports_[mode_index(TransportMode::JsonRpc)] =
        std::make_unique<JsonRpcTransport>(supervisor_, timeouts);
    transports_[mode_index(TransportMode::Mcp)] =
        std::make_unique<McpTransport>(supervisor_, timeouts);
}

ToolExecutor::~ToolExecutor() {
    shutdown_all();
}

void ToolExecutor::set_event_bus(EventBus* bus) {
    event_bus_ = bus;
    supervisor_.set_event_bus(bus);
}

void ToolExecutor::load_configured_tools(const Config& config) {
    for (const auto& [alias, path] : config.tools) {
        catalog_.load(alias, path);
    }
}

void ToolExecutor::load(const std::string& alias, const std::string& path) {
    catalog_.load(alias, path);
}

void ToolExecutor::register_builtin(const std::string& alias, ToolDefinition definition) {
    catalog_.register_builtin(alias, std::move(definition));
}

Transport& ToolExecutor::transport_for(TransportMode mode) {
    return *transports_[mode_index(mode)];
}

ActionResult ToolExecutor::execute(const std::string& alias, const std::string& action,
                                   const ArgMap& args, const ArgMap& vars,
                                   const CancelToken* cancel) {
    return run(alias, action, args, vars, cancel, true);
}

ActionResult ToolExecutor::execute_approved(const std::string& alias, const std::string& action,
                                            const ArgMap& args, const ArgMap& vars,
                                            const CancelToken* cancel) {
    return run(alias, action, args, vars, cancel, false);
}

ActionResult ToolExecutor::run(const std::string& alias, const std::string& action,
                               const ArgMap& args, const ArgMap& vars,
                               const CancelToken* cancel, bool gated) {
    auto started = Clock::now();
    ActionCompletedEvent completed;
    completed.alias = alias;
    completed.action = action;
    bool started_event = false;

    try {
        auto def = catalog_.get(alias);
        if (!def) throw ToolError("not loaded");
        const ToolAction* act = def->find_action(action);
        if (!act) throw ToolError("has no action \"" + action + "\"");

        validate_args(*act, args);
        ArgMap merged = apply_defaults(*act, args);

        if (gated) {
            if (auto pending = check_approval(*act)) {
                ApprovalRequiredEvent ev;
                ev.alias = alias;
                ev.action = action;
                ev.approval_min = pending->approval_min;
                publish_to(event_bus_, ev);
                return *pending;
            }
        }

        ArgMap redacted = redact_args(*act, merged);
        ActionStartedEvent ev;
        ev.alias = alias;
        ev.action = action;
        ev.transport = transport_mode_name(def->transport);
        ev.args = redacted;
        publish_to(event_bus_, ev);
        started_event = true;

        ActionCall call;
        call.alias = alias;
        call.action_name = action;
        call.definition = def;
        call.action = act;
        call.args = std::move(merged);
        call.vars = vars;
        call.cancel = cancel;

        RawOutput raw = transport_for(def->transport).invoke(call);
        ActionResult result = normalizer_.normalize(*def, *act, raw);
        result.redacted_args = std::move(redacted);
        result.duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

        completed.success = true;
        completed.exit_code = result.exit_code;
        completed.duration = result.duration;
        publish_to(event_bus_, completed);
        return result;
    } catch (ToolError& e) {
        e.set_context(alias, action);
        if (!started_event) throw;
        completed.success = false;
        completed.exit_code = -1;
        completed.duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        completed.error = e.what();
        publish_to(event_bus_, completed);
        throw;
    }
}

std::vector<std::string> ToolExecutor::validate_step(const std::string& alias,
                                                     const std::string& action,
                                                     const ArgMap& args) const {
    auto def = catalog_.get(alias);
    if (!def) return {"tool \"" + alias + "\" not loaded"};
    const ToolAction* act = def->find_action(action);
    if (!act) return {"tool \"" + alias + "\" has no action \"" + action + "\""};
    return check_args(*act, args);
}

bool ToolExecutor::is_read_only(const std::string& alias, const std::string& action) const {
    auto def = catalog_.get(alias);
    if (!def) {
        ToolError err("not loaded");
        err.set_context(alias, "");
        throw err;
    }
    const ToolAction* act = def->find_action(action);
    if (!act) {
        ToolError err("has no action \"" + action + "\"");
        err.set_context(alias, "");
        throw err;
    }
    return toolhost::is_read_only(*def, *act);
}

bool ToolExecutor::shutdown(const std::string& alias) {
    return supervisor_.shutdown(alias);
}

void ToolExecutor::shutdown_all() {
    supervisor_.shutdown_all();
}

} // namespace toolhost
