#include "result_normalizer.hpp"
#include "json_path.hpp"
#include "util.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

namespace toolhost {

using json = nlohmann::json;

namespace {

std::optional<UsageReport> usage_from_object(const json& obj) {
    if (!obj.is_object()) return std::nullopt;
    UsageReport usage;
    auto number = [&](const char* key, int64_t& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_number()) out = it->get<int64_t>();
    };
    number("prompt_tokens", usage.prompt_tokens);
    number("completion_tokens", usage.completion_tokens);
    number("total_tokens", usage.total_tokens);
    auto model = obj.find("model");
    if (model != obj.end() && model->is_string()) usage.model = model->get<std::string>();
    auto cost = obj.find("estimated_cost");
    if (cost != obj.end() && cost->is_number()) usage.estimated_cost = cost->get<double>();
    return usage;
}

} // namespace

std::optional<UsageReport> parse_usage_from_captures(std::map<std::string, std::string>& captures) {
    auto it = captures.find(kUsageCapture);
    if (it == captures.end()) return std::nullopt;
    std::string raw = it->second;
    captures.erase(it);
    if (trim(raw).empty()) return std::nullopt;
    json doc = json::parse(raw, nullptr, false);
    if (doc.is_discarded()) return std::nullopt;
    return usage_from_object(doc);
}

std::optional<UsageReport> parse_usage_from_json(const std::string& raw) {
    json doc = json::parse(raw, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
    auto it = doc.find(kUsageCapture);
    if (it == doc.end()) return std::nullopt;
    return usage_from_object(*it);
}

ResultNormalizer::ResultNormalizer(std::vector<CompiledRedaction> global_rules)
    : global_rules_(std::move(global_rules)) {}

std::string ResultNormalizer::redact_text(const ToolDefinition& def, const std::string& text) const {
    return redact(redact(text, global_rules_), def.redaction);
}

ActionResult ResultNormalizer::normalize(const ToolDefinition& def, const ToolAction& action,
                                         const RawOutput& raw) const {
    ActionResult result;
    result.stdout_text = redact_text(def, raw.stdout_text);
    result.stderr_text = redact_text(def, raw.stderr_text);
    result.exit_code = raw.exit_code;

    for (const auto& [name, spec] : action.capture) {
        std::string value;
        if (spec.from.empty() || spec.from == "stdout" ||
            (spec.from == "result" && def.transport == TransportMode::Mcp)) {
            value = trim(result.stdout_text);
        } else if (spec.from == "stderr") {
            value = trim(result.stderr_text);
        } else {
            try {
                value = extract_json_path(result.stdout_text, spec.from);
            } catch (const JsonPathError& e) {
                std::cerr << "[capture] " << def.name << ": capture \"" << name << "\" from \""
                          << spec.from << "\": " << e.what() << std::endl;
                continue;
            }
        }

        if (spec.format == "json") {
            json parsed = json::parse(value, nullptr, false);
            if (parsed.is_discarded()) {
                std::cerr << "[capture] " << def.name << ": capture \"" << name
                          << "\" is not valid JSON" << std::endl;
                continue;
            }
            value = parsed.dump(-1, ' ', false, json::error_handler_t::replace);
        }
        result.captures[name] = value;
    }

    result.usage = parse_usage_from_captures(result.captures);
    if (!result.usage && def.transport != TransportMode::Stdio) {
        result.usage = parse_usage_from_json(result.stdout_text);
    }
    return result;
}

} // namespace toolhost
