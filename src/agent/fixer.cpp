#include <codeloop/agent/fixer.hpp>
#include <codeloop/agent/extractor.hpp>
#include <codeloop/agent/prompts.hpp>
#include <codeloop/core/logger.hpp>

namespace codeloop {

Fixer::Fixer(AIProvider& ai, const CompletionOptions& opts)
    : ai_(ai)
    , opts_(opts)
{
    if (opts_.system_prompt.empty()) {
        opts_.system_prompt = system_prompt();
    }
}

AgentState Fixer::fix(const AgentState& state) const {
    std::string out_text = state.has_run ? state.last_run.stdout_output : std::string();
    std::string err_text = state.has_run ? state.last_run.stderr_output : std::string();

    LOG_DEBUG("[Fixer] Requesting fix for run %s (attempt %d)",
              state.run_id.c_str(), state.attempts + 1);

    CompletionResult reply = ai_.complete(
        build_fix_prompt(state.task, state.code, out_text, err_text), opts_);
    if (!reply.success) {
        throw ModelError("fixer request failed: " + reply.error);
    }

    AgentState next = state;
    next.code = extract_first_block(reply.content);
    next.attempts = state.attempts + 1;

    if (next.code.empty()) {
        LOG_WARN("[Fixer] No code block in model reply (%zu chars)", reply.content.size());
    }
    return next;
}

} // namespace codeloop
