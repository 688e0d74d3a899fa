#ifndef codeloop_AGENT_FIXER_HPP
#define codeloop_AGENT_FIXER_HPP

#include <codeloop/agent/state.hpp>
#include <codeloop/ai/ai.hpp>

namespace codeloop {

// Repair request: task, previous program and its captured output go
// back to the model, which answers with a replacement program.
class Fixer {
public:
    // An empty opts.system_prompt is replaced by system_prompt().
    Fixer(AIProvider& ai, const CompletionOptions& opts = CompletionOptions());

    // Returns the state with a new code and attempts + 1.
    // Throws ModelError if the completion fails.
    AgentState fix(const AgentState& state) const;

private:
    AIProvider& ai_;
    CompletionOptions opts_;
};

} // namespace codeloop

#endif // codeloop_AGENT_FIXER_HPP
