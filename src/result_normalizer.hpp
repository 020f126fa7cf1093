#pragma once
#include "redaction.hpp"
#include "tool_definition.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

constexpr const char* kUsageCapture = "_usage";

struct UsageReport {
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    int64_t total_tokens = 0;
    std::string model;
    double estimated_cost = 0.0;
};

struct ActionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::map<std::string, std::string> captures;
    std::chrono::milliseconds duration{0};
    bool requires_approval = false;
    int approval_min = 0;
    std::map<std::string, std::string> redacted_args;
    std::optional<UsageReport> usage;
};

// Parses and removes the reserved "_usage" capture. Empty, non-JSON or
// non-object values yield nullopt (the key is still removed).
std::optional<UsageReport> parse_usage_from_captures(std::map<std::string, std::string>& captures);

// Top-level "_usage" object of a JSON object result.
std::optional<UsageReport> parse_usage_from_json(const std::string& raw);

// Applies redaction (global rules, then the tool's), extracts captures
// and assembles the result record.
class ResultNormalizer {
public:
    explicit ResultNormalizer(std::vector<CompiledRedaction> global_rules = {});

    ActionResult normalize(const ToolDefinition& def, const ToolAction& action,
                           const RawOutput& raw) const;

    std::string redact_text(const ToolDefinition& def, const std::string& text) const;

private:
    std::vector<CompiledRedaction> global_rules_;
};

} // namespace toolhost
