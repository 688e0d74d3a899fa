#include <codeloop/agent/orchestrator.hpp>
#include <codeloop/agent/extractor.hpp>
#include <codeloop/core/logger.hpp>

namespace codeloop {

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::PLANNING: return "planning";
        case Phase::EXECUTING: return "executing";
        case Phase::DECIDING: return "deciding";
        case Phase::FIXING: return "fixing";
        case Phase::FINISHED: return "finished";
    }
    return "unknown";
}

Orchestrator::Orchestrator(AIProvider& ai, CodeRunner& runner, const OrchestratorConfig& config)
    : runner_(runner)
    , config_(config)
    , planner_(ai, config.completion)
    , fixer_(ai, config.completion)
{}

void Orchestrator::enter(Phase phase, const AgentState& state) {
    LOG_INFO("[Agent] %s: %s (attempts=%d)", state.run_id.c_str(), phase_name(phase), state.attempts);
    if (on_phase_) {
        on_phase_(phase, state);
    }
}

AgentState Orchestrator::execute(const AgentState& state) {
    if (needs_instrumentation(state.code)) {
        LOG_DEBUG("[Agent] Wrapping single expression in print()");
    }
    std::string program = auto_instrument(state.code);
    LOG_DEBUG("[Agent] Program for attempt %d:\n%s", state.attempts, program.c_str());
    if (on_program_) {
        on_program_(state, program);
    }

    AgentState next = state;
    next.last_run = runner_.execute(program, config_.timeout_seconds);
    next.has_run = true;

    LOG_INFO("[Agent] Attempt %d/%d: %s (exit %d)",
             next.attempts, MAX_ATTEMPTS,
             next.last_run.ok ? "succeeded" : "failed", next.last_run.exit_code);
    return next;
}

AgentState Orchestrator::run(const std::string& task) {
    AgentState state = AgentState::initial(task);
    LOG_INFO("[Agent] Run %s started: %.120s%s", state.run_id.c_str(), task.c_str(),
             task.size() > 120 ? "..." : "");

    Phase phase = Phase::PLANNING;
    enter(phase, state);

    while (phase != Phase::FINISHED) {
        switch (phase) {
            case Phase::PLANNING:
                state = planner_.plan(state);
                phase = Phase::EXECUTING;
                break;

            case Phase::EXECUTING:
                state = execute(state);
                phase = Phase::DECIDING;
                break;

            case Phase::DECIDING: {
                Transition next = decide(state);
                LOG_DEBUG("[Agent] Decision: %s", transition_name(next));
                switch (next) {
                    case Transition::FIX:
                        phase = Phase::FIXING;
                        break;
                    case Transition::FINISH:
                        phase = Phase::FINISHED;
                        break;
                }
                break;
            }

            case Phase::FIXING:
                state = fixer_.fix(state);
                phase = Phase::EXECUTING;
                break;

            case Phase::FINISHED:
                break;
        }

        if (phase == Phase::FINISHED) {
            state.done = true;
        }
        enter(phase, state);
    }

    LOG_INFO("[Agent] Run %s finished after %d attempt(s): %s",
             state.run_id.c_str(), state.attempts,
             state.has_run && state.last_run.ok ? "success" : "gave up");
    return state;
}

} // namespace codeloop
