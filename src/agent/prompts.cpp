#include <codeloop/agent/prompts.hpp>
#include <sstream>

namespace codeloop {

const char* system_prompt() {
    return
        "You are a coding agent that solves tasks by writing Python programs.\n"
        "\n"
        "Every task goes through the same loop:\n"
        "1) Plan briefly\n"
        "2) Write a Python program\n"
        "3) The program is executed in a restricted sandbox\n"
        "4) On errors you get the output back and fix the program, "
        "for at most 3 attempts in total.\n"
        "\n"
        "Rules:\n"
        "- Keep code self-contained and use only the standard library.\n"
        "- Do not use the network.\n"
        "- Do not read or write files.\n"
        "- Print final answers to stdout.\n";
}

// Keep the tail, where tracebacks end
static std::string clip_feedback(const std::string& text) {
    if (text.size() <= MAX_FEEDBACK_CHARS) {
        return text;
    }
    size_t start = text.size() - MAX_FEEDBACK_CHARS;
    while (start < text.size() && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
        ++start;
    }
    return "[... " + std::to_string(start) + " bytes omitted ...]\n" + text.substr(start);
}

std::string build_plan_prompt(const std::string& task) {
    std::ostringstream p;
    p << "Task:\n" << task << "\n\n"
      << "Generate Python code that EXECUTES and PRINTS the final answer.\n\n"
      << "STRICT REQUIREMENTS:\n"
      << "- The code MUST call print() on the final result.\n"
      << "- The code MUST run as-is, with no arguments or input.\n"
      << "- Do NOT define a function without calling it.\n"
      << "- Do NOT leave expressions unused.\n\n"
      << "Reply in EXACTLY this format:\n\n"
      << "Plan:\n"
      << "<brief plan>\n\n"
      << "```python\n"
      << "<executable Python code that prints the answer>\n"
      << "```\n";
    return p.str();
}

std::string build_fix_prompt(const std::string& task,
                             const std::string& previous_code,
                             const std::string& stdout_text,
                             const std::string& stderr_text) {
    std::ostringstream p;
    p << "Task:\n" << task << "\n\n"
      << "Your previous code:\n"
      << "```python\n" << previous_code << "\n```\n\n"
      << "Execution stdout:\n" << clip_feedback(stdout_text) << "\n\n"
      << "Execution stderr:\n" << clip_feedback(stderr_text) << "\n\n"
      << "Fix the code. Return ONLY a Python code block in triple backticks.\n";
    return p.str();
}

const std::vector<std::string>& sample_tasks() {
    static const std::vector<std::string> tasks = {
        "Write a Python function to compute Fibonacci(n) efficiently and print Fibonacci(35).",
        "Parse a CSV string into rows and compute the average of a numeric column.",
        "Implement a simple anomaly score for a time series using a rolling z-score.",
    };
    return tasks;
}

} // namespace codeloop
