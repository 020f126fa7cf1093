#pragma once
#include "arg_resolver.hpp"
#include "cancel.hpp"
#include "persistent_process.hpp"
#include "tool_definition.hpp"

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace toolhost {

struct ActionCall {
    std::string alias;
    std::string action_name;
    std::shared_ptr<const ToolDefinition> definition;
    const ToolAction* action = nullptr;  // points into *definition
    ArgMap args;                         // validated, defaults applied
    ArgMap vars;
    const CancelToken* cancel = nullptr;
};

// What a worker produced, before redaction and capture extraction.
struct RawOutput {
    std::string stdout_text;  // stdio stdout, JSON-RPC result JSON, or MCP text
    std::string stderr_text;
    int exit_code = 0;
};

struct TransportTimeouts {
    std::chrono::milliseconds jsonrpc_startup{10000};
    std::chrono::milliseconds mcp_startup{15000};
    std::chrono::milliseconds startup_grace{50};
};

class Transport {
public:
    virtual ~Transport() = default;
    virtual RawOutput invoke(const ActionCall& call) = 0;
    virtual TransportMode mode() const = 0;
};

// Every arg value rendered against vars+args, as a JSON object of strings.
nlohmann::json render_params(const ActionCall& call);

// Launch parameters for the alias' persistent worker.
WorkerLaunch make_worker_launch(const ActionCall& call, std::chrono::milliseconds default_timeout);

} // namespace toolhost
