#include "jsonrpc_transport.hpp"
#include "../errors.hpp"
#include "../jsonrpc.hpp"
#include "../util.hpp"

#include <iostream>

namespace toolhost {

using json = nlohmann::json;

namespace {

std::string preview(const std::string& line) {
    constexpr size_t kMax = 200;
    return line.size() <= kMax ? line : line.substr(0, kMax) + "...";
}

} // namespace

JsonRpcProcess::JsonRpcProcess(WorkerLaunch launch, std::string ready_signal,
                               std::string shutdown_method, std::chrono::milliseconds startup_grace)
    : PersistentProcess(std::move(launch)),
      ready_signal_(std::move(ready_signal)),
      shutdown_method_(std::move(shutdown_method)),
      startup_grace_(startup_grace) {}

void JsonRpcProcess::handshake(const CancelToken* cancel, Clock::time_point deadline) {
    auto reader = std::make_unique<LineReader>(subprocess().stderr_fd());
    int done = subprocess().done_fd();

    if (ready_signal_.empty()) {
        start_stderr_drain(std::move(reader));
        // No signal to wait for: give the worker a moment and make sure it
        // did not die on the spot.
        switch (wait_readable(-1, done, cancel, Clock::now() + startup_grace_)) {
            case WaitStatus::Exited:
                throw ProcessExited(launch_.binary + " exited during startup");
            case WaitStatus::Cancelled:
                kill();
                throw CallCancelled("cancelled while starting " + launch_.binary);
            default:
                return;
        }
    }

    std::string line;
    while (true) {
        switch (reader->read_line(line, done, cancel, deadline)) {
            case WaitStatus::Ready:
                std::cerr << ("  [" + log_tag() + "] " + line + "\n");
                if (line.find(ready_signal_) == std::string::npos) continue;
                start_stderr_drain(std::move(reader));
                return;
            case WaitStatus::Exited:
                throw ProcessExited(launch_.binary + " exited before ready signal \"" +
                                    ready_signal_ + "\"");
            case WaitStatus::Cancelled:
                kill();
                throw CallCancelled("cancelled while waiting for " + launch_.binary +
                                    " ready signal");
            case WaitStatus::TimedOut:
                throw StartupTimeout(launch_.binary + " did not emit ready signal \"" +
                                     ready_signal_ + "\" within " +
                                     std::to_string(launch_.startup_timeout.count()) + "ms");
        }
    }
}

json JsonRpcProcess::call(const std::string& method, const json& params, const CancelToken* cancel) {
    std::lock_guard<std::mutex> lock(call_mutex_);
    if (!alive()) throw ProcessExited(launch_.binary + " is not running");

    int64_t id = next_id();
    send(jsonrpc::make_request(id, method, params));

    const std::string waiting_for = "response to " + method;
    while (true) {
        std::string line = trim(read_line(cancel, std::nullopt, waiting_for));
        if (line.empty()) continue;

        json msg = json::parse(line, nullptr, false);
        if (msg.is_discarded()) {
            throw ProtocolError("malformed JSON from " + launch_.binary + ": " + preview(line));
        }
        switch (jsonrpc::classify(msg)) {
            case jsonrpc::MessageKind::Invalid:
                throw ProtocolError("expected a JSON object from " + launch_.binary + ": " +
                                    preview(line));
            case jsonrpc::MessageKind::Notification:
            case jsonrpc::MessageKind::Request:
                continue;
            case jsonrpc::MessageKind::Response:
                break;
        }

        const json& msg_id = msg["id"];
        auto error = msg.find("error");
        bool has_error = error != msg.end() && !error->is_null();
        switch (jsonrpc::match_id(msg_id, id)) {
            case jsonrpc::IdMatch::Stale:
                std::cerr << "[jsonrpc] " << launch_.alias << ": skipping stale response id "
                          << msg_id.dump() << std::endl;
                continue;
            case jsonrpc::IdMatch::Unrelated:
                // A null id is the worker failing to parse our request
                if (msg_id.is_null() && has_error) throw jsonrpc::remote_error(*error);
                throw ProtocolError("response id " + msg_id.dump() + " does not match request id " +
                                    std::to_string(id));
            case jsonrpc::IdMatch::Match:
                break;
        }
        if (has_error) throw jsonrpc::remote_error(*error);
        auto result = msg.find("result");
        return result == msg.end() ? json() : *result;
    }
}

void JsonRpcProcess::shutdown(std::chrono::milliseconds grace) {
    if (state() != ProcessState::Dead && !shutdown_method_.empty()) {
        try {
            send(jsonrpc::make_notification(shutdown_method_));
            if (wait_exit(grace)) return;
        } catch (const ProcessExited&) {
            // stdin already closed: the worker is on its way out
        }
    }
    kill();
    wait_exit(grace);
}

// ── JsonRpcTransport ────────────────────────────────────────────

JsonRpcTransport::JsonRpcTransport(ProcessSupervisor& supervisor, TransportTimeouts timeouts)
    : supervisor_(supervisor), timeouts_(timeouts) {}

std::shared_ptr<JsonRpcProcess> JsonRpcTransport::acquire(const ActionCall& call) {
    const ToolDefinition& def = *call.definition;
    auto factory = [&]() -> std::shared_ptr<PersistentProcess> {
        std::string ready;
        std::string shutdown;
        if (def.startup) {
            ready = def.startup->ready_signal;
            shutdown = def.startup->shutdown_method;
        }
        return std::make_shared<JsonRpcProcess>(make_worker_launch(call, timeouts_.jsonrpc_startup),
                                                ready, shutdown, timeouts_.startup_grace);
    };
    // Entries built from this definition are always JsonRpcProcess
    return std::static_pointer_cast<JsonRpcProcess>(
        supervisor_.acquire(call.alias, call.definition, factory, call.cancel));
}

RawOutput JsonRpcTransport::invoke(const ActionCall& call) {
    const std::string& method = call.action->method;
    if (method.empty()) {
        throw ProtocolError("action has no method for jsonrpc transport");
    }

    auto proc = acquire(call);
    json params = render_params(call);
    auto fallback = jsonrpc::fallback_method(method);

    json result;
    try {
        try {
            result = proc->call(method, params, call.cancel);
        } catch (const RemoteError& e) {
            if (!fallback || !jsonrpc::is_unknown_method(e)) throw;
            std::cerr << "[jsonrpc] " << call.alias << ": method \"" << method
                      << "\" unknown, retrying as \"" << *fallback << "\"" << std::endl;
            result = proc->call(*fallback, params, call.cancel);
        }
    } catch (const ProcessExited&) {
        supervisor_.discard(call.alias, proc);
        throw;
    } catch (const CallCancelled&) {
        supervisor_.discard(call.alias, proc);
        throw;
    }

    RawOutput out;
    out.stdout_text = jsonrpc::encode(result);
    return out;
}

} // namespace toolhost
