#ifndef codeloop_AGENT_PROMPTS_HPP
#define codeloop_AGENT_PROMPTS_HPP

#include <string>
#include <vector>

namespace codeloop {

// Upper bound on captured output echoed back to the model
constexpr size_t MAX_FEEDBACK_CHARS = 16000;

const char* system_prompt();

std::string build_plan_prompt(const std::string& task);

std::string build_fix_prompt(const std::string& task,
                             const std::string& previous_code,
                             const std::string& stdout_text,
                             const std::string& stderr_text);

// Built-in tasks for --demo
const std::vector<std::string>& sample_tasks();

} // namespace codeloop

#endif // codeloop_AGENT_PROMPTS_HPP
