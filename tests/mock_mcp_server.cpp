// Minimal MCP server over stdio used by the transport tests.
//
//   --fail-list        answer tools/list with an error
//   --ping             send a ping request before answering each tools/call
//   --no-init-reply    read initialize but never answer it
//   --init-error       answer initialize with an error
//   --pid-file PATH    write the server pid to PATH at startup

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using json = nlohmann::json;

namespace {

void emit(const json& msg) {
    std::cout << msg.dump() << "\n";
    std::cout.flush();
}

json text_content(const std::string& text) {
    return json::array({{{"type", "text"}, {"text", text}}});
}

json tool_entry(const std::string& name, const std::string& description) {
    return {{"name", name},
            {"description", description},
            {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}};
}

json call_tool(const std::string& name, const json& arguments, bool& known) {
    known = true;
    if (name == "echo") {
        std::string message = arguments.value("message", "");
        return {{"content", text_content(message)}, {"isError", false}};
    }
    if (name == "query") {
        return {{"content", text_content(R"({"data":"mcp-query-result","count":99})")},
                {"isError", false}};
    }
    if (name == "failing") {
        return {{"content", text_content("something went wrong")}, {"isError", true}};
    }
    if (name == "multi") {
        return {{"content",
                 json::array({{{"type", "text"}, {"text", "first"}},
                              {{"type", "image"}, {"data", "aGk="}},
                              {{"type", "text"}, {"text", "second"}}})},
                {"isError", false}};
    }
    if (name == "pid") {
        return {{"content", text_content(std::to_string(getpid()))}, {"isError", false}};
    }
    if (name == "bare_error") {
        return {{"isError", true}};
    }
    if (name == "bare_ok") {
        return json::object();
    }
    if (name == "crash") {
        std::cerr << "mock-mcp-server: crashing on request" << std::endl;
        std::_Exit(2);
    }
    known = false;
    return json();
}

} // namespace

int main(int argc, char* argv[]) {
    bool fail_list = false;
    bool ping = false;
    bool init_reply = true;
    bool init_error = false;
    std::string pid_file;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--fail-list") == 0) fail_list = true;
        else if (std::strcmp(argv[i], "--ping") == 0) ping = true;
        else if (std::strcmp(argv[i], "--no-init-reply") == 0) init_reply = false;
        else if (std::strcmp(argv[i], "--init-error") == 0) init_error = true;
        else if (std::strcmp(argv[i], "--pid-file") == 0 && i + 1 < argc) pid_file = argv[++i];
    }

    std::cerr << "mock-mcp-server: starting (pid " << getpid() << ")" << std::endl;
    if (!pid_file.empty()) {
        std::ofstream f(pid_file);
        f << getpid();
    }

    int ping_id = 1000;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        json msg = json::parse(line, nullptr, false);
        if (msg.is_discarded() || !msg.is_object()) continue;

        // Our own ping being answered
        if (!msg.contains("method")) {
            if (msg.contains("result")) std::cerr << "mock-mcp-server: pong" << std::endl;
            continue;
        }
        std::string method = msg["method"].get<std::string>();
        if (!msg.contains("id")) continue;  // notifications/initialized and friends
        const json id = msg["id"];

        if (method == "initialize") {
            if (!init_reply) continue;
            if (init_error) {
                emit({{"jsonrpc", "2.0"},
                      {"id", id},
                      {"error", {{"code", -32603}, {"message", "initialization refused"}}}});
                continue;
            }
            emit({{"jsonrpc", "2.0"},
                  {"id", id},
                  {"result",
                   {{"protocolVersion", "2024-11-05"},
                    {"capabilities", {{"tools", json::object()}}},
                    {"serverInfo", {{"name", "mock-mcp-server"}, {"version", "1.0.0"}}}}}});
        } else if (method == "tools/list") {
            if (fail_list) {
                emit({{"jsonrpc", "2.0"},
                      {"id", id},
                      {"error", {{"code", -32603}, {"message", "listing disabled"}}}});
                continue;
            }
            std::string cursor;
            if (msg.contains("params") && msg["params"].is_object()) {
                cursor = msg["params"].value("cursor", "");
            }
            json result;
            if (cursor.empty()) {
                result = {{"tools", json::array({tool_entry("echo", "Echo a message"),
                                                 tool_entry("query", "Return a JSON document")})},
                          {"nextCursor", "page2"}};
            } else {
                result = {{"tools", json::array({tool_entry("failing", "Always fails"),
                                                 tool_entry("multi", "Several content blocks"),
                                                 tool_entry("pid", "Report the server pid"),
                                                 tool_entry("crash", "Exit mid-call")})}};
            }
            emit({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
        } else if (method == "tools/call") {
            emit({{"jsonrpc", "2.0"},
                  {"method", "notifications/progress"},
                  {"params", {{"progress", 1}}}});
            if (ping) {
                emit({{"jsonrpc", "2.0"}, {"id", ping_id++}, {"method", "ping"}});
                emit({{"jsonrpc", "2.0"}, {"id", ping_id++}, {"method", "sampling/createMessage"}});
            }
            json params = msg.contains("params") ? msg["params"] : json::object();
            std::string name = params.value("name", "");
            json arguments = params.contains("arguments") ? params["arguments"] : json::object();
            bool known = false;
            json result = call_tool(name, arguments, known);
            if (!known) {
                emit({{"jsonrpc", "2.0"},
                      {"id", id},
                      {"error", {{"code", -32601}, {"message", "unknown tool: " + name}}}});
            } else {
                emit({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
            }
        } else if (method == "ping") {
            emit({{"jsonrpc", "2.0"}, {"id", id}, {"result", json::object()}});
        } else {
            emit({{"jsonrpc", "2.0"},
                  {"id", id},
                  {"error", {{"code", -32601}, {"message", "method not found"}}}});
        }
    }
    return 0;
}
