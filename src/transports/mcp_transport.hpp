#pragma once
#include "../persistent_process.hpp"
#include "../process_supervisor.hpp"
#include "../transport.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace toolhost {

struct McpToolInfo {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

// Long-lived MCP server over stdio. Ready after initialize, the
// initialized notification, and a best-effort tools/list.
class McpProcess : public PersistentProcess {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr int kMaxToolPages = 50;

    explicit McpProcess(WorkerLaunch launch);

    // tools/call. Text content blocks are joined with "\n"; isError
    // results become a RemoteError carrying the "; "-joined texts.
    std::string call_tool(const std::string& name, const nlohmann::json& arguments,
                          const CancelToken* cancel);

    std::vector<McpToolInfo> tools() const;
    bool has_tool(const std::string& name) const;
    nlohmann::json server_info() const;

    // SIGINT, then SIGKILL after grace
    void shutdown(std::chrono::milliseconds grace) override;
    const char* transport_name() const override { return "mcp"; }

protected:
    void handshake(const CancelToken* cancel, Clock::time_point deadline) override;
    std::string log_tag() const override { return "mcp:" + launch_.binary; }

private:
    // Caller holds call_mutex_.
    nlohmann::json request(const std::string& method, const nlohmann::json& params,
                           const CancelToken* cancel, const Deadline& deadline);
    void answer_server_request(const nlohmann::json& msg);
    void discover_tools(const CancelToken* cancel, const Deadline& deadline);

    mutable std::mutex info_mutex_;
    std::vector<McpToolInfo> tools_;
    nlohmann::json server_info_;
};

class McpTransport : public Transport {
public:
    McpTransport(ProcessSupervisor& supervisor, TransportTimeouts timeouts);

    RawOutput invoke(const ActionCall& call) override;
    TransportMode mode() const override { return TransportMode::Mcp; }

private:
    std::shared_ptr<McpProcess> acquire(const ActionCall& call);

    ProcessSupervisor& supervisor_;
    TransportTimeouts timeouts_;
};

} // namespace toolhost
