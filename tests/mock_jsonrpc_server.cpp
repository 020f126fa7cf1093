// Line-delimited JSON-RPC worker used by the transport tests.
//
//   --no-ready            never print the ready line
//   --ready-delay-ms N    sleep before printing it
//   --exit-immediately    exit 3 before reading anything
//   --string-ids          echo request ids back as strings
//   --ready-text TEXT     ready line to print (default "listening")

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

bool g_string_ids = false;

json reply_id(const json& id) {
    if (g_string_ids && id.is_number_integer()) return std::to_string(id.get<int64_t>());
    return id;
}

void emit(const json& msg) {
    std::cout << msg.dump() << "\n";
    std::cout.flush();
}

void result(const json& id, const json& value) {
    emit({{"jsonrpc", "2.0"}, {"id", reply_id(id)}, {"result", value}});
}

void error(const json& id, const json& code, const std::string& message) {
    emit({{"jsonrpc", "2.0"},
          {"id", reply_id(id)},
          {"error", {{"code", code}, {"message", message}}}});
}

} // namespace

int main(int argc, char* argv[]) {
    bool ready = true;
    int ready_delay_ms = 0;
    std::string ready_text = "listening";

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--no-ready") == 0) {
            ready = false;
        } else if (std::strcmp(argv[i], "--ready-delay-ms") == 0 && i + 1 < argc) {
            ready_delay_ms = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--exit-immediately") == 0) {
            std::cerr << "mock-jsonrpc-server: bailing out" << std::endl;
            return 3;
        } else if (std::strcmp(argv[i], "--string-ids") == 0) {
            g_string_ids = true;
        } else if (std::strcmp(argv[i], "--ready-text") == 0 && i + 1 < argc) {
            ready_text = argv[++i];
        }
    }

    std::cerr << "mock-jsonrpc-server: starting (pid " << getpid() << ")" << std::endl;
    if (ready_delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ready_delay_ms));
    }
    if (ready) std::cerr << "mock-jsonrpc-server: " << ready_text << std::endl;

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        json msg = json::parse(line, nullptr, false);
        if (msg.is_discarded() || !msg.is_object()) {
            emit({{"jsonrpc", "2.0"},
                  {"id", nullptr},
                  {"error", {{"code", -32700}, {"message", "parse error"}}}});
            continue;
        }

        std::string method = msg.value("method", "");
        if (!msg.contains("id")) {
            if (method == "shutdown") {
                std::cerr << "mock-jsonrpc-server: shutting down" << std::endl;
                return 0;
            }
            continue;
        }

        const json id = msg["id"];
        json params = msg.contains("params") ? msg["params"] : json::object();

        if (method == "test/echo" || method == "echo") {
            result(id, params);
        } else if (method == "test/query") {
            result(id, {{"data", "query-result-data"}, {"count", 42}});
        } else if (method == "test/error") {
            error(id, -32000, "test error from mock server");
        } else if (method == "test/string_code_error") {
            error(id, "E_BUSY", "worker is busy");
        } else if (method == "test/notify") {
            emit({{"jsonrpc", "2.0"}, {"method", "progress"}, {"params", {{"pct", 50}}}});
            emit({{"jsonrpc", "2.0"}, {"method", "progress"}, {"params", {{"pct", 100}}}});
            result(id, {{"done", true}});
        } else if (method == "test/stale") {
            if (id.is_number_integer() && id.get<int64_t>() > 1) {
                result(id.get<int64_t>() - 1, {{"stale", true}});
            }
            result(id, {{"fresh", true}});
        } else if (method == "test/slow") {
            int ms = 200;
            if (params.contains("ms") && params["ms"].is_string()) {
                ms = std::atoi(params["ms"].get<std::string>().c_str());
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            result(id, params);
        } else if (method == "test/crash") {
            std::cerr << "mock-jsonrpc-server: crashing on request" << std::endl;
            std::_Exit(2);
        } else if (method == "test/usage") {
            result(id, {{"answer", "ok"},
                        {"_usage",
                         {{"prompt_tokens", 12},
                          {"completion_tokens", 30},
                          {"total_tokens", 42},
                          {"model", "mock-model"},
                          {"estimated_cost", 0.25}}}});
        } else if (method == "test/pid") {
            result(id, {{"pid", static_cast<int64_t>(getpid())}});
        } else {
            error(id, -32601, "method not found: " + method);
        }
    }
    return 0;
}
