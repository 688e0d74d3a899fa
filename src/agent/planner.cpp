#include <codeloop/agent/planner.hpp>
#include <codeloop/agent/extractor.hpp>
#include <codeloop/agent/prompts.hpp>
#include <codeloop/core/logger.hpp>

namespace codeloop {

Planner::Planner(AIProvider& ai, const CompletionOptions& opts)
    : ai_(ai)
    , opts_(opts)
{
    if (opts_.system_prompt.empty()) {
        opts_.system_prompt = system_prompt();
    }
}

AgentState Planner::plan(const AgentState& state) const {
    LOG_DEBUG("[Planner] Requesting plan for run %s", state.run_id.c_str());

    CompletionResult reply = ai_.complete(build_plan_prompt(state.task), opts_);
    if (!reply.success) {
        throw ModelError("planner request failed: " + reply.error);
    }

    AgentState next = state;
    next.plan = extract_narrative(reply.content);
    next.code = extract_labeled_block(reply.content);
    next.attempts = state.attempts + 1;

    if (next.code.empty()) {
        LOG_WARN("[Planner] No code block in model reply (%zu chars)", reply.content.size());
    }
    return next;
}

} // namespace codeloop
