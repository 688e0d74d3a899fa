/*
 * codeloop - Orchestrator
 *
 * Bounded plan -> execute -> decide -> fix state machine:
 *
 *   PLANNING --> EXECUTING --> DECIDING --FIX--> FIXING --> EXECUTING
 *                                  |
 *                                  +--FINISH--> FINISHED
 *
 * At most MAX_ATTEMPTS candidate programs run per task. Program failures
 * (policy, timeout, runtime) feed the fixer; a failing model call
 * (ModelError) or executor breakdown (SandboxError) propagates out of
 * run(). Exhausting the budget is not an error: run() returns normally
 * and the caller inspects last_run.ok.
 *
 * One Orchestrator may serve several runs in sequence; concurrent runs
 * need one instance each (the provider and runner may be shared).
 */
#ifndef codeloop_AGENT_ORCHESTRATOR_HPP
#define codeloop_AGENT_ORCHESTRATOR_HPP

#include <codeloop/agent/state.hpp>
#include <codeloop/agent/planner.hpp>
#include <codeloop/agent/fixer.hpp>
#include <codeloop/sandbox/executor.hpp>
#include <codeloop/ai/ai.hpp>
#include <functional>
#include <string>

namespace codeloop {

enum class Phase {
    PLANNING,
    EXECUTING,
    DECIDING,
    FIXING,
    FINISHED
};

const char* phase_name(Phase phase);

struct OrchestratorConfig {
    int timeout_seconds;            // per execution
    CompletionOptions completion;   // model, temperature, system prompt

    OrchestratorConfig() : timeout_seconds(DEFAULT_TIMEOUT_SECONDS) {}
};

// Invoked on entry to every phase with the state at that point
typedef std::function<void(Phase phase, const AgentState& state)> PhaseCallback;

// Invoked with the exact program text handed to the runner
typedef std::function<void(const AgentState& state, const std::string& program)> ProgramCallback;

class Orchestrator {
public:
    Orchestrator(AIProvider& ai, CodeRunner& runner,
                 const OrchestratorConfig& config = OrchestratorConfig());

    void set_phase_callback(PhaseCallback cb) { on_phase_ = cb; }
    void set_program_callback(ProgramCallback cb) { on_program_ = cb; }

    // Drive one task to FINISHED and return the final state (done = true).
    AgentState run(const std::string& task);

private:
    AgentState execute(const AgentState& state);
    void enter(Phase phase, const AgentState& state);

    CodeRunner& runner_;
    OrchestratorConfig config_;
    Planner planner_;
    Fixer fixer_;
    PhaseCallback on_phase_;
    ProgramCallback on_program_;
};

} // namespace codeloop

#endif // codeloop_AGENT_ORCHESTRATOR_HPP
