#include <codeloop/agent/extractor.hpp>
#include <codeloop/core/utils.hpp>
#include <vector>

namespace codeloop {

static const char* const FENCE = "```";

// A fenced region's first line is its info string ("python", "py3", ...)
static bool is_python_label(const std::string& segment) {
    size_t nl = segment.find('\n');
    std::string label = to_lower(trim(segment.substr(0, nl)));
    if (label.empty()) {
        return false;
    }
    return label.find("python") != std::string::npos || label == "py" || label == "py3";
}

std::string strip_language_tag(const std::string& code) {
    std::string trimmed = trim(code);
    std::vector<std::string> lines = split_lines(trimmed);
    if (lines.empty()) {
        return trimmed;
    }
    std::string first = to_lower(trim(lines[0]));
    if (first != "python" && first != "py" && first != "python3" && first != "py3") {
        return trimmed;
    }
    lines.erase(lines.begin());
    return trim(join(lines, "\n"));
}

// Body of a fenced region. A python info string is dropped whole, so
// "```python title=\"x\"" leaves no attribute line behind.
static std::string fence_body(const std::string& segment) {
    size_t nl = segment.find('\n');
    if (nl != std::string::npos && is_python_label(segment)) {
        return trim(segment.substr(nl + 1));
    }
    return strip_language_tag(segment);
}

std::string extract_labeled_block(const std::string& text) {
    std::vector<std::string> parts = split(text, FENCE);
    // Odd indices are fenced regions; index i is closed when i + 1 exists.
    for (size_t i = 1; i + 1 < parts.size(); i += 2) {
        if (is_python_label(parts[i])) {
            return fence_body(parts[i]);
        }
    }
    if (parts.size() >= 3) {
        return fence_body(parts[1]);
    }
    return "";
}

std::string extract_first_block(const std::string& text) {
    std::vector<std::string> parts = split(text, FENCE);
    if (parts.size() >= 2) {
        return fence_body(parts[1]);
    }
    return "";
}

std::string extract_narrative(const std::string& text) {
    size_t fence = text.find(FENCE);
    std::string prose = trim(fence == std::string::npos ? text : text.substr(0, fence));
    return prose.empty() ? trim(text) : prose;
}

bool needs_instrumentation(const std::string& code) {
    std::string trimmed = trim(code);
    if (trimmed.empty() || trimmed.find("print(") != std::string::npos) {
        return false;
    }

    std::vector<std::string> nonblank;
    for (const auto& line : split_lines(trimmed)) {
        if (!trim(line).empty()) {
            nonblank.push_back(line);
        }
    }
    if (nonblank.size() != 1) {
        return false;
    }

    const std::string& line = nonblank[0];
    static const char* const declarations[] = { "def ", "class ", "import ", "from ", "async def ", NULL };
    for (int i = 0; declarations[i] != NULL; ++i) {
        if (starts_with(line, declarations[i])) {
            return false;
        }
    }
    return true;
}

std::string auto_instrument(const std::string& code) {
    std::string trimmed = trim(code);
    if (!needs_instrumentation(trimmed)) {
        return trimmed;
    }
    return "print(" + trimmed + ")";
}

} // namespace codeloop
