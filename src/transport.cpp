#include "transport.hpp"

namespace toolhost {

nlohmann::json render_params(const ActionCall& call) {
    ArgMap data = merge_template_data(call.vars, call.args);
    nlohmann::json params = nlohmann::json::object();
    for (const auto& [name, value] : call.args) {
        params[name] = render_template(value, data);
    }
    return params;
}

WorkerLaunch make_worker_launch(const ActionCall& call, std::chrono::milliseconds default_timeout) {
    const ToolDefinition& def = *call.definition;
    WorkerLaunch launch;
    launch.alias = call.alias;
    launch.binary = def.transport_binary.empty() ? def.binary : def.transport_binary;
    if (def.startup) launch.argv = def.startup->argv;
    launch.definition = call.definition;
    launch.startup_timeout = def.startup_timeout_ms
                                 ? std::chrono::milliseconds(*def.startup_timeout_ms)
                                 : default_timeout;
    return launch;
}

} // namespace toolhost
