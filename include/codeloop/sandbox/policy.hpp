/*
 * codeloop - Source policy filter
 *
 * Ordered regex denylist applied to generated programs before they run.
 * This is a lint, not containment: it is trivially bypassed by indirection
 * and must not be treated as a security boundary.
 */
#ifndef codeloop_SANDBOX_POLICY_HPP
#define codeloop_SANDBOX_POLICY_HPP

#include <string>
#include <vector>
#include <regex>

namespace codeloop {

struct PolicyCheck {
    bool allowed;
    std::string pattern;    // first matching pattern, verbatim; empty when allowed

    PolicyCheck() : allowed(true) {}

    // "Blocked by policy (matched pattern: <pattern>)."
    std::string message() const;
};

class PolicyFilter {
public:
    // Uses default_patterns()
    PolicyFilter();

    // Throws std::regex_error if a pattern does not compile.
    explicit PolicyFilter(const std::vector<std::string>& patterns);

    // Patterns are tried in order; the first hit wins. Matching runs on
    // the code with every whitespace run collapsed to one character, so
    // patterns must not depend on the amount of whitespace.
    PolicyCheck check(const std::string& code) const;

    const std::vector<std::string>& patterns() const { return patterns_; }

    // os, subprocess, socket, requests, http, urllib and pathlib imports,
    // then open(), eval(), exec() and __import__() calls.
    static const std::vector<std::string>& default_patterns();

private:
    void compile();

    std::vector<std::string> patterns_;
    std::vector<std::regex> compiled_;
};

} // namespace codeloop

#endif // codeloop_SANDBOX_POLICY_HPP
