#include <codeloop/sandbox/policy.hpp>

namespace codeloop {

static bool is_regex_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

// libstdc++ matches \s+ and \s* with one stack frame per character, so a
// long whitespace run would overflow the stack. Each run becomes a single
// character: '\n' if the run held a newline, ' ' otherwise. Word
// boundaries and line structure are unchanged.
static std::string collapse_whitespace(const std::string& code) {
    std::string out;
    out.reserve(code.size());
    size_t i = 0;
    while (i < code.size()) {
        if (!is_regex_space(code[i])) {
            out.push_back(code[i]);
            ++i;
            continue;
        }
        bool newline = false;
        while (i < code.size() && is_regex_space(code[i])) {
            if (code[i] == '\n') newline = true;
            ++i;
        }
        out.push_back(newline ? '\n' : ' ');
    }
    return out;
}

std::string PolicyCheck::message() const {
    return "Blocked by policy (matched pattern: " + pattern + ").";
}

const std::vector<std::string>& PolicyFilter::default_patterns() {
    static const std::vector<std::string> patterns = {
        R"(\bimport\s+os\b)",
        R"(\bimport\s+subprocess\b)",
        R"(\bimport\s+socket\b)",
        R"(\bimport\s+requests\b)",
        R"(\bimport\s+http\b)",
        R"(\bimport\s+urllib\b)",
        R"(\bimport\s+pathlib\b)",
        R"(\bopen\s*\()",
        R"(\beval\s*\()",
        R"(\bexec\s*\()",
        R"(\b__import__\s*\()",
    };
    return patterns;
}

PolicyFilter::PolicyFilter() : patterns_(default_patterns()) {
    compile();
}

PolicyFilter::PolicyFilter(const std::vector<std::string>& patterns) : patterns_(patterns) {
    compile();
}

void PolicyFilter::compile() {
    compiled_.clear();
    compiled_.reserve(patterns_.size());
    for (size_t i = 0; i < patterns_.size(); ++i) {
        compiled_.push_back(std::regex(patterns_[i], std::regex::ECMAScript | std::regex::optimize));
    }
}

PolicyCheck PolicyFilter::check(const std::string& code) const {
    PolicyCheck result;
    const std::string normalized = collapse_whitespace(code);
    for (size_t i = 0; i < compiled_.size(); ++i) {
        if (std::regex_search(normalized, compiled_[i])) {
            result.allowed = false;
            result.pattern = patterns_[i];
            return result;
        }
    }
    return result;
}

} // namespace codeloop
