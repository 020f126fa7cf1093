#pragma once
#include "../persistent_process.hpp"
#include "../process_supervisor.hpp"
#include "../transport.hpp"

#include <nlohmann/json.hpp>

namespace toolhost {

// Long-lived JSON-RPC 2.0 worker. Ready once its stderr shows the
// configured ready signal, or after a short grace period when none is
// configured.
class JsonRpcProcess : public PersistentProcess {
public:
    JsonRpcProcess(WorkerLaunch launch, std::string ready_signal, std::string shutdown_method,
                   std::chrono::milliseconds startup_grace);

    // One full round trip under the call lock. Returns the "result"
    // member (null if absent). Throws RemoteError, ProtocolError,
    // ProcessExited or CallCancelled.
    nlohmann::json call(const std::string& method, const nlohmann::json& params,
                        const CancelToken* cancel);

    void shutdown(std::chrono::milliseconds grace) override;
    const char* transport_name() const override { return "jsonrpc"; }

protected:
    void handshake(const CancelToken* cancel, Clock::time_point deadline) override;
    std::string log_tag() const override { return launch_.binary; }

private:
    std::string ready_signal_;
    std::string shutdown_method_;
    std::chrono::milliseconds startup_grace_;
};

class JsonRpcTransport : public Transport {
public:
    JsonRpcTransport(ProcessSupervisor& supervisor, TransportTimeouts timeouts);

    RawOutput invoke(const ActionCall& call) override;
    TransportMode mode() const override { return TransportMode::JsonRpc; }

private:
    std::shared_ptr<JsonRpcProcess> acquire(const ActionCall& call);

    ProcessSupervisor& supervisor_;
    TransportTimeouts timeouts_;
};

} // namespace toolhost
