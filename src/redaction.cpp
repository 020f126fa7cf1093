#include "redaction.hpp"

#include <re2/re2.h>

#include <cctype>
#include <stdexcept>

namespace toolhost {

namespace {

RE2::Options quiet_options() {
    RE2::Options opts;
    opts.set_log_errors(false);
    return opts;
}

// "$1" and "${1}" become "\1", "$$" becomes "$", literal backslashes are escaped.
std::string to_rewrite(const std::string& replace) {
    std::string out;
    out.reserve(replace.size());
    for (size_t i = 0; i < replace.size(); ++i) {
        char c = replace[i];
        if (c == '\\') {
            out += "\\\\";
            continue;
        }
        if (c != '$' || i + 1 >= replace.size()) {
            out += c;
            continue;
        }
        char next = replace[i + 1];
        if (next == '$') {
            out += '$';
            ++i;
        } else if (std::isdigit(static_cast<unsigned char>(next))) {
            out += '\\';
            out += next;
            ++i;
        } else if (next == '{' && i + 3 < replace.size() &&
                   std::isdigit(static_cast<unsigned char>(replace[i + 2])) &&
                   replace[i + 3] == '}') {
            out += '\\';
            out += replace[i + 2];
            i += 3;
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace

std::vector<CompiledRedaction> compile_redaction_rules(const std::vector<RedactionRule>& rules) {
    std::vector<CompiledRedaction> compiled;
    compiled.reserve(rules.size());
    for (const auto& rule : rules) {
        auto re = std::make_shared<const RE2>(rule.pattern, quiet_options());
        if (!re->ok()) {
            throw std::invalid_argument("invalid redaction pattern \"" + rule.pattern +
                                        "\": " + re->error());
        }
        std::string rewrite = to_rewrite(rule.replace);
        std::string rewrite_error;
        if (!re->CheckRewriteString(rewrite, &rewrite_error)) {
            throw std::invalid_argument("invalid replacement for redaction pattern \"" +
                                        rule.pattern + "\": " + rewrite_error);
        }
        compiled.push_back({std::move(re), rule.replace, std::move(rewrite), rule.pattern});
    }
    return compiled;
}

std::string redact(const std::string& text, const std::vector<CompiledRedaction>& rules) {
    if (text.empty()) return text;
    std::string out = text;
    for (const auto& rule : rules) {
        RE2::GlobalReplace(&out, *rule.pattern, rule.rewrite);
    }
    return out;
}

} // namespace toolhost
