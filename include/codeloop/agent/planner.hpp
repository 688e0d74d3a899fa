#ifndef codeloop_AGENT_PLANNER_HPP
#define codeloop_AGENT_PLANNER_HPP

#include <codeloop/agent/state.hpp>
#include <codeloop/ai/ai.hpp>

namespace codeloop {

// First model request of a run: plan text plus a candidate program.
class Planner {
public:
    // An empty opts.system_prompt is replaced by system_prompt().
    Planner(AIProvider& ai, const CompletionOptions& opts = CompletionOptions());

    // Returns the state with plan and code set and attempts + 1.
    // Throws ModelError if the completion fails.
    AgentState plan(const AgentState& state) const;

private:
    AIProvider& ai_;
    CompletionOptions opts_;
};

} // namespace codeloop

#endif // codeloop_AGENT_PLANNER_HPP
