#include "mcp_transport.hpp"
#include "../errors.hpp"
#include "../jsonrpc.hpp"
#include "../util.hpp"
#include "../version.hpp"

#include <iostream>

namespace toolhost {

using json = nlohmann::json;

namespace {

std::vector<std::string> text_blocks(const json& content) {
    std::vector<std::string> texts;
    if (!content.is_array()) return texts;
    for (const auto& block : content) {
        if (!block.is_object()) continue;
        auto type = block.find("type");
        auto text = block.find("text");
        if (type != block.end() && *type == "text" && text != block.end() && text->is_string()) {
            texts.push_back(text->get<std::string>());
        }
    }
    return texts;
}

} // namespace

McpProcess::McpProcess(WorkerLaunch launch) : PersistentProcess(std::move(launch)) {}

json McpProcess::request(const std::string& method, const json& params,
                         const CancelToken* cancel, const Deadline& deadline) {
    int64_t id = next_id();
    send(jsonrpc::make_request(id, method, params));

    while (true) {
        std::string line = trim(read_line(cancel, deadline, method));
        if (line.empty()) continue;

        json msg = json::parse(line, nullptr, false);
        if (msg.is_discarded()) {
            std::cerr << "[mcp] " << launch_.alias << ": ignoring non-JSON line from server"
                      << std::endl;
            continue;
        }
        switch (jsonrpc::classify(msg)) {
            case jsonrpc::MessageKind::Invalid:
            case jsonrpc::MessageKind::Notification:
                continue;
            case jsonrpc::MessageKind::Request:
                answer_server_request(msg);
                continue;
            case jsonrpc::MessageKind::Response:
                break;
        }

        const json& msg_id = msg["id"];
        auto error = msg.find("error");
        bool has_error = error != msg.end() && !error->is_null();
        switch (jsonrpc::match_id(msg_id, id)) {
            case jsonrpc::IdMatch::Stale:
                continue;
            case jsonrpc::IdMatch::Unrelated:
                if (msg_id.is_null() && has_error) throw jsonrpc::remote_error(*error);
                throw ProtocolError("response id " + msg_id.dump() + " does not match " + method +
                                    " request id " + std::to_string(id));
            case jsonrpc::IdMatch::Match:
                break;
        }
        if (has_error) throw jsonrpc::remote_error(*error);
        auto result = msg.find("result");
        return result == msg.end() ? json() : *result;
    }
}

void McpProcess::answer_server_request(const json& msg) {
    const std::string method = msg["method"].get<std::string>();
    if (method == "ping") {
        send(jsonrpc::make_result(msg["id"], json::object()));
    } else {
        send(jsonrpc::make_error(msg["id"], jsonrpc::kMethodNotFound,
                                 "method \"" + method + "\" not supported by client"));
    }
}

void McpProcess::handshake(const CancelToken* cancel, Clock::time_point deadline) {
    start_stderr_drain(std::make_unique<LineReader>(subprocess().stderr_fd()));

    json init = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", json::object()},
        {"clientInfo", {{"name", "toolhost"}, {"version", kVersion}}},
    };
    json result = request("initialize", init, cancel, deadline);
    if (result.is_object() && result.contains("serverInfo")) {
        std::lock_guard<std::mutex> lock(info_mutex_);
        server_info_ = result["serverInfo"];
    }

    send(jsonrpc::make_notification("notifications/initialized"));

    try {
        discover_tools(cancel, deadline);
    } catch (const CallCancelled&) {
        throw;
    } catch (const ProcessExited&) {
        throw;
    } catch (const ToolError& e) {
        std::cerr << "[" << log_tag() << "] warning: tools/list failed: " << e.what() << std::endl;
    }

    std::cerr << "[" << log_tag() << "] initialized, " << tools().size() << " tools discovered"
              << std::endl;
}

void McpProcess::discover_tools(const CancelToken* cancel, const Deadline& deadline) {
    std::vector<McpToolInfo> found;
    std::string cursor;
    for (int page = 0; page < kMaxToolPages; ++page) {
        json params = json::object();
        if (!cursor.empty()) params["cursor"] = cursor;
        json result = request("tools/list", params, cancel, deadline);
        if (!result.is_object()) break;

        auto list = result.find("tools");
        if (list != result.end() && list->is_array()) {
            for (const auto& t : *list) {
                if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) continue;
                McpToolInfo info;
                info.name = t["name"].get<std::string>();
                if (t.contains("description") && t["description"].is_string()) {
                    info.description = t["description"].get<std::string>();
                }
                if (t.contains("inputSchema")) info.input_schema = t["inputSchema"];
                found.push_back(std::move(info));
            }
        }

        auto next = result.find("nextCursor");
        if (next == result.end() || !next->is_string() || next->get<std::string>().empty()) break;
        cursor = next->get<std::string>();
    }
    std::lock_guard<std::mutex> lock(info_mutex_);
    tools_ = std::move(found);
}

std::string McpProcess::call_tool(const std::string& name, const json& arguments,
                                  const CancelToken* cancel) {
    std::lock_guard<std::mutex> lock(call_mutex_);
    if (!alive()) throw ProcessExited(launch_.binary + " is not running");

    json result = request("tools/call", {{"name", name}, {"arguments", arguments}}, cancel,
                          std::nullopt);
    if (!result.is_object()) return jsonrpc::encode(result);

    std::vector<std::string> texts;
    auto content = result.find("content");
    if (content != result.end()) texts = text_blocks(*content);
    auto is_error = result.find("isError");
    if (is_error != result.end() && is_error->is_boolean() && is_error->get<bool>()) {
        throw RemoteError(0, "", "MCP tool \"" + name + "\" failed: " + join(texts, "; "));
    }
    return join(texts, "\n");
}

std::vector<McpToolInfo> McpProcess::tools() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return tools_;
}

bool McpProcess::has_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    for (const auto& t : tools_) {
        if (t.name == name) return true;
    }
    return false;
}

json McpProcess::server_info() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return server_info_;
}

void McpProcess::shutdown(std::chrono::milliseconds grace) {
    if (state() != ProcessState::Dead && interrupt()) {
        if (wait_exit(grace)) return;
    }
    kill();
    wait_exit(grace);
}

// ── McpTransport ────────────────────────────────────────────────

McpTransport::McpTransport(ProcessSupervisor& supervisor, TransportTimeouts timeouts)
    : supervisor_(supervisor), timeouts_(timeouts) {}

std::shared_ptr<McpProcess> McpTransport::acquire(const ActionCall& call) {
    auto factory = [&]() -> std::shared_ptr<PersistentProcess> {
        return std::make_shared<McpProcess>(make_worker_launch(call, timeouts_.mcp_startup));
    };
    return std::static_pointer_cast<McpProcess>(
        supervisor_.acquire(call.alias, call.definition, factory, call.cancel));
}

RawOutput McpTransport::invoke(const ActionCall& call) {
    const ToolDefinition& def = *call.definition;
    if (!def.connect.empty()) {
        throw ProtocolError("mcp connect mode (\"" + def.connect +
                            "\") is not supported; declare the server binary to use spawn mode");
    }
    const std::string& tool = call.action->mcp_tool;
    if (tool.empty()) {
        throw ProtocolError("action has no mcp_tool for mcp transport");
    }

    auto proc = acquire(call);
    RawOutput out;
    try {
        out.stdout_text = proc->call_tool(tool, render_params(call), call.cancel);
    } catch (const ProcessExited&) {
        supervisor_.discard(call.alias, proc);
        throw;
    } catch (const CallCancelled&) {
        supervisor_.discard(call.alias, proc);
        throw;
    }
    return out;
}

} // namespace toolhost
