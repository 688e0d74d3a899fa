#ifndef codeloop_CORE_UTILS_HPP
#define codeloop_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace codeloop {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Milliseconds from a monotonic clock, for measuring elapsed time
int64_t monotonic_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by string delimiter. Keeps empty parts, so
// split("a``b", "``") yields {"a", "b"} and split("", x) yields {""}.
std::vector<std::string> split(const std::string& s, const std::string& delimiter);

// Split on '\n', dropping a trailing '\r' from each line
std::vector<std::string> split_lines(const std::string& s);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Sanitize a string for safe JSON serialization.
// Replaces invalid UTF-8 sequences and control characters other than
// tab, newline and carriage return.
std::string sanitize_utf8(const std::string& s);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

} // namespace codeloop

#endif // codeloop_CORE_UTILS_HPP
