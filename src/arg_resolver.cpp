#include "arg_resolver.hpp"
#include "errors.hpp"

#include <re2/re2.h>

#include <algorithm>

namespace toolhost {

namespace {

const RE2& template_pattern() {
    static const RE2 re(R"(\{\{\s*\.([A-Za-z0-9_\-]+)\s*\}\})");
    return re;
}

bool allowed_value(const ArgSpec& spec, const std::string& value) {
    if (spec.enum_values.empty()) return true;
    if (value.find("{{") != std::string::npos) return true;
    return std::find(spec.enum_values.begin(), spec.enum_values.end(), value) !=
           spec.enum_values.end();
}

} // namespace

void validate_args(const ToolAction& action, const ArgMap& args) {
    for (const auto& [name, spec] : action.args) {
        auto it = args.find(name);
        if (spec.required && it == args.end()) {
            throw MissingArgument(name);
        }
        if (it != args.end() && !allowed_value(spec, it->second)) {
            throw InvalidEnumValue(name, it->second, spec.enum_values);
        }
    }
}

ArgMap apply_defaults(const ToolAction& action, const ArgMap& args) {
    ArgMap merged = args;
    for (const auto& [name, spec] : action.args) {
        if (spec.default_value && !spec.default_value->empty() && merged.count(name) == 0) {
            merged[name] = *spec.default_value;
        }
    }
    return merged;
}

ArgMap merge_template_data(const ArgMap& vars, const ArgMap& args) {
    ArgMap data = vars;
    for (const auto& [k, v] : args) data[k] = v;
    return data;
}

std::string render_template(const std::string& text, const ArgMap& data) {
    if (text.find("{{") == std::string::npos) return text;

    std::string out;
    re2::StringPiece input(text);
    re2::StringPiece m[2];
    size_t last = 0;
    while (last <= text.size() &&
           template_pattern().Match(input, last, text.size(), RE2::UNANCHORED, m, 2)) {
        size_t pos = static_cast<size_t>(m[0].data() - text.data());
        out.append(text, last, pos - last);
        auto found = data.find(std::string(m[1].data(), m[1].size()));
        out += found != data.end() ? found->second : std::string(m[0].data(), m[0].size());
        last = pos + m[0].size();
    }
    out.append(text, last, std::string::npos);
    return out;
}

std::vector<std::string> resolve_argv(const std::vector<std::string>& argv, const ArgMap& data) {
    std::vector<std::string> resolved;
    resolved.reserve(argv.size());
    for (const auto& a : argv) resolved.push_back(render_template(a, data));
    return resolved;
}

ArgMap redact_args(const ToolAction& action, const ArgMap& args) {
    ArgMap out = args;
    for (const auto& [name, spec] : action.args) {
        if (!spec.redact) continue;
        auto it = out.find(name);
        if (it != out.end() && !it->second.empty()) it->second = kRedactedValue;
    }
    return out;
}

std::vector<std::string> check_args(const ToolAction& action, const ArgMap& args) {
    std::vector<std::string> problems;
    for (const auto& [name, spec] : action.args) {
        auto it = args.find(name);
        if (spec.required && it == args.end()) {
            problems.push_back("missing required arg \"" + name + "\"");
        } else if (it != args.end() && !allowed_value(spec, it->second)) {
            problems.push_back(InvalidEnumValue(name, it->second, spec.enum_values).message());
        }
    }
    for (const auto& [name, value] : args) {
        if (action.args.count(name) == 0) {
            problems.push_back("unknown arg \"" + name + "\"");
        }
    }
    return problems;
}

} // namespace toolhost
