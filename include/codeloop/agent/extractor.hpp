/*
 * codeloop - Code block extraction
 *
 * Pulls the candidate program out of free-form model output. Both
 * variants split on ``` fences and normalize the result the same way;
 * they differ in which fenced region they pick:
 *
 *   extract_labeled_block  first region whose info string names Python
 *                          (a complete fence pair is required), else the
 *                          first complete region. Used for plans.
 *   extract_first_block    first region after an opening fence, closed
 *                          or not, with no label check. Used for fixes.
 *
 * No usable fence yields an empty string.
 */
#ifndef codeloop_AGENT_EXTRACTOR_HPP
#define codeloop_AGENT_EXTRACTOR_HPP

#include <string>

namespace codeloop {

std::string extract_labeled_block(const std::string& text);

std::string extract_first_block(const std::string& text);

// Prose before the first fence, trimmed; the whole reply when unfenced.
std::string extract_narrative(const std::string& text);

// Trim, then drop a first line that is exactly "python", "py",
// "python3" or "py3" (any case) and trim again.
std::string strip_language_tag(const std::string& code);

// True if a single-line candidate would be wrapped by auto_instrument().
bool needs_instrumentation(const std::string& code);

// Wrap a lone expression so it prints: "2+2" -> "print(2+2)".
// Code that already calls print(), spans several non-blank lines, or
// whose only line starts a def/class/import is returned trimmed but
// otherwise unchanged. Idempotent.
std::string auto_instrument(const std::string& code);

} // namespace codeloop

#endif // codeloop_AGENT_EXTRACTOR_HPP
