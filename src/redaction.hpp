#pragma once
#include <memory>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace toolhost {

struct RedactionRule {
    std::string pattern;
    std::string replace;
};

// RE2 syntax, so matching time is linear in the input and "(?i)" flags work.
struct CompiledRedaction {
    std::shared_ptr<const re2::RE2> pattern;
    std::string replace;  // as written, "$1" / "${1}" group references
    std::string rewrite;  // RE2 rewrite form of replace
    std::string source;   // original pattern text, for diagnostics
};

// Throws std::invalid_argument naming the first pattern that fails to compile
// or whose replacement refers to a group the pattern does not have.
std::vector<CompiledRedaction> compile_redaction_rules(const std::vector<RedactionRule>& rules);

// Apply rules in order. "$1"-style group references work in replacements.
std::string redact(const std::string& text, const std::vector<CompiledRedaction>& rules);

} // namespace toolhost
