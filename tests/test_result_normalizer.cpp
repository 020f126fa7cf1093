#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "governance.hpp"
#include "result_normalizer.hpp"

using namespace toolhost;

namespace {

ToolDefinition make_def(TransportMode mode, std::vector<RedactionRule> rules = {}) {
    ToolDefinition def;
    def.name = "probe";
    def.binary = "probe";
    def.transport = mode;
    def.redaction = compile_redaction_rules(rules);
    return def;
}

ToolAction with_capture(const std::string& name, const std::string& from,
                        const std::string& format = "") {
    ToolAction action;
    action.capture[name] = CaptureSpec{from, format};
    return action;
}

RawOutput output(const std::string& out, const std::string& err = "", int code = 0) {
    RawOutput raw;
    raw.stdout_text = out;
    raw.stderr_text = err;
    raw.exit_code = code;
    return raw;
}

} // namespace

// ── Capture sources ──────────────────────────────────────────────

TEST_CASE("ResultNormalizer: stdout capture is trimmed", "[normalizer]") {
    ResultNormalizer n;
    auto r = n.normalize(make_def(TransportMode::Stdio), with_capture("out", "stdout"),
                         output("  value\n"));
    REQUIRE(r.captures.at("out") == "value");
    REQUIRE(r.stdout_text == "  value\n");
}

TEST_CASE("ResultNormalizer: empty from means stdout", "[normalizer]") {
    ResultNormalizer n;
    auto r = n.normalize(make_def(TransportMode::Stdio), with_capture("out", ""), output("x\n"));
    REQUIRE(r.captures.at("out") == "x");
}

TEST_CASE("ResultNormalizer: stderr capture", "[normalizer]") {
    ResultNormalizer n;
    auto r = n.normalize(make_def(TransportMode::Stdio), with_capture("err", "stderr"),
                         output("", "warning: low disk\n", 1));
    REQUIRE(r.captures.at("err") == "warning: low disk");
    REQUIRE(r.exit_code == 1);
}

TEST_CASE("ResultNormalizer: json path capture", "[normalizer]") {
    ResultNormalizer n;
    auto r = n.normalize(make_def(TransportMode::JsonRpc), with_capture("id", "items[1].id"),
                         output(R"({"items":[{"id":"a"},{"id":"b"}]})"));
    REQUIRE(r.captures.at("id") == "b");
}

TEST_CASE("ResultNormalizer: result on mcp is the whole text", "[normalizer]") {
    ResultNormalizer n;
    auto r = n.normalize(make_def(TransportMode::Mcp), with_capture("text", "result"),
                         output("echo: hi\n"));
    REQUIRE(r.captures.at("text") == "echo: hi");
}

TEST_CASE("ResultNormalizer: failed path leaves the capture absent", "[normalizer]") {
    ResultNormalizer n;
    ToolAction action = with_capture("missing", "nope.deeper");
    action.capture["ok"] = CaptureSpec{"stdout", ""};

    auto r = n.normalize(make_def(TransportMode::Stdio), action, output("not json"));
    REQUIRE(r.captures.count("missing") == 0);
    REQUIRE(r.captures.at("ok") == "not json");
}

// ── Format ───────────────────────────────────────────────────────

TEST_CASE("ResultNormalizer: json format compacts the value", "[normalizer]") {
    ResultNormalizer n;
    auto r = n.normalize(make_def(TransportMode::Stdio), with_capture("doc", "stdout", "json"),
                         output("{ \"a\" : [1, 2] }\n"));
    REQUIRE(r.captures.at("doc") == R"({"a":[1,2]})");
}

TEST_CASE("ResultNormalizer: json format on non-JSON drops the capture", "[normalizer]") {
    ResultNormalizer n;
    auto r = n.normalize(make_def(TransportMode::Stdio), with_capture("doc", "stdout", "json"),
                         output("plain words"));
    REQUIRE(r.captures.count("doc") == 0);
}

// ── Redaction ────────────────────────────────────────────────────

TEST_CASE("ResultNormalizer: global rules run before tool rules", "[normalizer]") {
    ResultNormalizer n(compile_redaction_rules({{"secret", "masked"}}));
    ToolDefinition def = make_def(TransportMode::Stdio, {{"masked", "[HIDDEN]"}});
    auto r = n.normalize(def, ToolAction{}, output("a secret", "secret too"));
    REQUIRE(r.stdout_text == "a [HIDDEN]");
    REQUIRE(r.stderr_text == "[HIDDEN] too");
}

TEST_CASE("ResultNormalizer: captures see redacted text", "[normalizer]") {
    ResultNormalizer n;
    ToolDefinition def = make_def(TransportMode::Stdio, {{"sk-[a-z0-9]+", "[KEY]"}});
    auto r = n.normalize(def, with_capture("out", "stdout"), output("key=sk-abc123"));
    REQUIRE(r.captures.at("out") == "key=[KEY]");
}

// ── Usage ────────────────────────────────────────────────────────

TEST_CASE("ResultNormalizer: _usage capture becomes a usage report", "[normalizer]") {
    ResultNormalizer n;
    auto r = n.normalize(make_def(TransportMode::Stdio), with_capture(kUsageCapture, "usage"),
                         output(R"({"usage":{"prompt_tokens":3,"completion_tokens":4,)"
                                R"("total_tokens":7,"model":"m1","estimated_cost":0.5}})"));
    REQUIRE(r.usage);
    REQUIRE(r.usage->prompt_tokens == 3);
    REQUIRE(r.usage->completion_tokens == 4);
    REQUIRE(r.usage->total_tokens == 7);
    REQUIRE(r.usage->model == "m1");
    REQUIRE_THAT(r.usage->estimated_cost, Catch::Matchers::WithinAbs(0.5, 1e-9));
    REQUIRE(r.captures.count(kUsageCapture) == 0);
}

TEST_CASE("ResultNormalizer: malformed _usage is dropped silently", "[normalizer]") {
    std::map<std::string, std::string> captures = {{kUsageCapture, "not json"}, {"x", "1"}};
    REQUIRE_FALSE(parse_usage_from_captures(captures));
    REQUIRE(captures.count(kUsageCapture) == 0);
    REQUIRE(captures.count("x") == 1);

    captures[kUsageCapture] = "";
    REQUIRE_FALSE(parse_usage_from_captures(captures));
}

TEST_CASE("ResultNormalizer: top-level _usage on RPC results", "[normalizer]") {
    ResultNormalizer n;
    std::string raw = R"({"answer":"ok","_usage":{"total_tokens":42}})";
    auto rpc = n.normalize(make_def(TransportMode::JsonRpc), ToolAction{}, output(raw));
    REQUIRE(rpc.usage);
    REQUIRE(rpc.usage->total_tokens == 42);

    auto stdio = n.normalize(make_def(TransportMode::Stdio), ToolAction{}, output(raw));
    REQUIRE_FALSE(stdio.usage);
}

// ── Governance ───────────────────────────────────────────────────

TEST_CASE("Governance: approval gate returns a pending result", "[governance]") {
    ToolAction action;
    REQUIRE_FALSE(check_approval(action));

    action.governance = ActionGovernance{};
    action.governance->requires_approval = true;
    action.governance->approval_min = 2;
    auto pending = check_approval(action);
    REQUIRE(pending);
    REQUIRE(pending->requires_approval);
    REQUIRE(pending->approval_min == 2);
    REQUIRE(pending->stdout_text.empty());
    REQUIRE(pending->captures.empty());
}

TEST_CASE("Governance: read-only override precedence", "[governance]") {
    ToolDefinition def;
    ToolAction action;
    REQUIRE_FALSE(is_read_only(def, action));

    def.governance = ToolGovernance{};
    def.governance->read_only = true;
    REQUIRE(is_read_only(def, action));

    action.governance = ActionGovernance{};
    REQUIRE(is_read_only(def, action));
    action.governance->read_only = false;
    REQUIRE_FALSE(is_read_only(def, action));
}
