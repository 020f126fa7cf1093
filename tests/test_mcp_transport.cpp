#include <catch2/catch_test_macros.hpp>
#include "tool_executor.hpp"
#include "transports/mcp_transport.hpp"
#include "test_support.hpp"

#include <chrono>
#include <csignal>
#include <fstream>
#include <memory>
#include <thread>

using namespace toolhost;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

Config fast_config() {
    Config cfg;
    cfg.timeouts.shutdown_grace_ms = 500;
    return cfg;
}

struct McpFixture {
    ToolExecutor exec{fast_config()};

    explicit McpFixture(const json& doc = testing::mcp_tool_doc()) {
        exec.register_builtin("mcp", load_tool_definition(doc, "test"));
    }

    std::shared_ptr<McpProcess> worker() {
        return std::static_pointer_cast<McpProcess>(exec.supervisor().find("mcp"));
    }
};

pid_t read_pid(const std::string& path) {
    std::ifstream f(path);
    pid_t pid = -1;
    f >> pid;
    return pid;
}

// The reaper collects the child shortly after the kill; until then it is a zombie.
bool gone_within(pid_t pid, std::chrono::milliseconds limit) {
    auto deadline = Clock::now() + limit;
    while (Clock::now() < deadline) {
        if (::kill(pid, 0) != 0) return true;
        std::this_thread::sleep_for(20ms);
    }
    return ::kill(pid, 0) != 0;
}

json startup_doc(std::vector<std::string> argv, const std::string& timeout) {
    json doc = testing::mcp_tool_doc(argv);
    doc["transport"]["startup"]["timeout"] = timeout;
    return doc;
}

} // namespace

// ── Handshake and discovery ──────────────────────────────────────

TEST_CASE("McpTransport: echo round trip returns the exact text", "[mcp]") {
    McpFixture f;
    ActionResult r = f.exec.execute("mcp", "echo", {{"message", "hello-from-mcp"}});
    REQUIRE(r.stdout_text == "hello-from-mcp");
    REQUIRE(r.captures.at("text") == "hello-from-mcp");
}

TEST_CASE("McpTransport: discovers tools across pages", "[mcp]") {
    McpFixture f;
    f.exec.execute("mcp", "echo", {{"message", "x"}});
    auto worker = f.worker();
    REQUIRE(worker != nullptr);
    REQUIRE(worker->has_tool("echo"));
    REQUIRE(worker->has_tool("query"));
    REQUIRE(worker->has_tool("failing"));
    REQUIRE(worker->has_tool("multi"));
    REQUIRE_FALSE(worker->has_tool("does-not-exist"));

    auto tools = worker->tools();
    REQUIRE(tools.size() == 6);
    REQUIRE(tools[0].name == "echo");
    REQUIRE(tools[0].description == "Echo a message");
    REQUIRE(tools[0].input_schema["type"] == "object");
}

TEST_CASE("McpTransport: server info from initialize", "[mcp]") {
    McpFixture f;
    f.exec.execute("mcp", "echo", {{"message", "x"}});
    json info = f.worker()->server_info();
    REQUIRE(info["name"] == "mock-mcp-server");
    REQUIRE(std::string(f.worker()->transport_name()) == "mcp");
}

TEST_CASE("McpTransport: failed tools/list is not fatal", "[mcp]") {
    McpFixture f(testing::mcp_tool_doc({"--fail-list"}));
    ActionResult r = f.exec.execute("mcp", "echo", {{"message", "still works"}});
    REQUIRE(r.stdout_text == "still works");
    REQUIRE(f.worker()->tools().empty());
}

// ── Calls ────────────────────────────────────────────────────────

TEST_CASE("McpTransport: JSON text result feeds path captures", "[mcp]") {
    McpFixture f;
    ActionResult r = f.exec.execute("mcp", "query", {});
    REQUIRE(r.captures.at("data") == "mcp-query-result");
    REQUIRE(r.captures.at("count") == "99");
}

TEST_CASE("McpTransport: text blocks are newline-joined", "[mcp]") {
    McpFixture f;
    ActionResult r = f.exec.execute("mcp", "multi", {});
    REQUIRE(r.stdout_text == "first\nsecond");
}

TEST_CASE("McpTransport: isError becomes a RemoteError", "[mcp]") {
    McpFixture f;
    try {
        f.exec.execute("mcp", "failing", {});
        FAIL("expected RemoteError");
    } catch (const RemoteError& e) {
        REQUIRE(e.remote_message().find("something went wrong") != std::string::npos);
        REQUIRE(e.alias() == "mcp");
        REQUIRE(e.action() == "failing");
    }
    REQUIRE(f.worker()->state() == ProcessState::Ready);
}

TEST_CASE("McpTransport: isError without content is still an error", "[mcp]") {
    McpFixture f;
    try {
        f.exec.execute("mcp", "bare_error", {});
        FAIL("expected RemoteError");
    } catch (const RemoteError& e) {
        REQUIRE(e.remote_message().find("bare_error") != std::string::npos);
    }
    REQUIRE(f.worker()->state() == ProcessState::Ready);
}

TEST_CASE("McpTransport: result without content is empty text", "[mcp]") {
    McpFixture f;
    ActionResult r = f.exec.execute("mcp", "bare_ok", {});
    REQUIRE(r.stdout_text.empty());
}

TEST_CASE("McpTransport: unknown tool is a remote error", "[mcp]") {
    McpFixture f;
    try {
        f.exec.execute("mcp", "unknown", {});
        FAIL("expected RemoteError");
    } catch (const RemoteError& e) {
        REQUIRE(e.code() == -32601);
    }
}

TEST_CASE("McpTransport: server-initiated requests are answered", "[mcp]") {
    McpFixture f(testing::mcp_tool_doc({"--ping"}));
    REQUIRE(f.exec.execute("mcp", "echo", {{"message", "a"}}).stdout_text == "a");
    REQUIRE(f.exec.execute("mcp", "echo", {{"message", "b"}}).stdout_text == "b");
}

TEST_CASE("McpTransport: connect mode is rejected", "[mcp]") {
    json doc = testing::mcp_tool_doc();
    doc["transport"]["connect"] = "localhost:7000";
    McpFixture f(doc);
    REQUIRE_THROWS_AS(f.exec.execute("mcp", "echo", {{"message", "x"}}), ProtocolError);
    REQUIRE(f.exec.supervisor().size() == 0);
}

// ── Lifecycle ────────────────────────────────────────────────────

TEST_CASE("McpTransport: unanswered initialize times out and kills the server", "[mcp]") {
    testing::TempDir dir;
    std::string pid_file = dir.file("pid");
    McpFixture f(startup_doc({"--no-init-reply", "--pid-file", pid_file}, "300ms"));

    auto start = Clock::now();
    REQUIRE_THROWS_AS(f.exec.execute("mcp", "echo", {{"message", "x"}}), StartupTimeout);
    REQUIRE(Clock::now() - start < 3s);
    REQUIRE(f.exec.supervisor().size() == 0);

    pid_t pid = read_pid(pid_file);
    REQUIRE(pid > 0);
    REQUIRE(gone_within(pid, 2000ms));
}

TEST_CASE("McpTransport: initialize error fails the spawn", "[mcp]") {
    testing::TempDir dir;
    std::string pid_file = dir.file("pid");
    McpFixture f(startup_doc({"--init-error", "--pid-file", pid_file}, "5s"));

    try {
        f.exec.execute("mcp", "echo", {{"message", "x"}});
        FAIL("expected RemoteError");
    } catch (const RemoteError& e) {
        REQUIRE(e.remote_message().find("initialization refused") != std::string::npos);
    }
    REQUIRE(f.exec.supervisor().size() == 0);
    REQUIRE(gone_within(read_pid(pid_file), 2000ms));

    // No dead entry is cached: the next call spawns again and fails the same way
    REQUIRE_THROWS_AS(f.exec.execute("mcp", "echo", {{"message", "y"}}), RemoteError);
}

TEST_CASE("McpTransport: crash mid-call then respawn", "[mcp]") {
    McpFixture f;
    f.exec.execute("mcp", "echo", {{"message", "before"}});
    pid_t old_pid = f.worker()->pid();

    REQUIRE_THROWS_AS(f.exec.execute("mcp", "crash", {}), ProcessExited);
    REQUIRE(f.exec.execute("mcp", "echo", {{"message", "after"}}).stdout_text == "after");
    REQUIRE(f.worker()->pid() != old_pid);
}

TEST_CASE("McpTransport: shutdown interrupts the server", "[mcp]") {
    McpFixture f;
    f.exec.execute("mcp", "echo", {{"message", "x"}});
    auto worker = f.worker();

    auto start = Clock::now();
    REQUIRE(f.exec.shutdown("mcp"));
    REQUIRE(Clock::now() - start < 2s);
    REQUIRE(worker->state() == ProcessState::Dead);
}
