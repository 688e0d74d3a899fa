/*
 * codeloop - Agent state and decision
 *
 * AgentState is owned by exactly one Orchestrator run. Each node takes
 * the previous state and returns the next one.
 */
#ifndef codeloop_AGENT_STATE_HPP
#define codeloop_AGENT_STATE_HPP

#include <codeloop/sandbox/executor.hpp>
#include <codeloop/core/json.hpp>
#include <string>
#include <cstdint>

namespace codeloop {

// Combined plan + fix attempts before the loop gives up
constexpr int MAX_ATTEMPTS = 3;

struct AgentState {
    std::string run_id;
    std::string task;
    std::string plan;           // empty until the planner has run
    std::string code;           // current candidate program
    ExecutionResult last_run;   // valid only when has_run
    bool has_run;
    int attempts;
    bool done;
    int64_t started_ms;         // Unix time the run began

    AgentState() : has_run(false), attempts(0), done(false), started_ms(0) {}

    // Fresh state with a new run id and start time, attempts = 0, done = false
    static AgentState initial(const std::string& task);
};

enum class Transition {
    FIX,
    FINISH
};

const char* transition_name(Transition t);

// Pure and total. No execution yet counts as a failure.
Transition decide(bool has_run, const ExecutionResult& last_run, int attempts);

inline Transition decide(const AgentState& state) {
    return decide(state.has_run, state.last_run, state.attempts);
}

// {"ok", "stdout", "stderr", "exit_code", "note"}
Json to_json(const ExecutionResult& result);

// {"run_id", "started_ms", "task", "plan", "code", "attempts", "done", "last_run"};
// last_run is null before the first execution.
Json to_json(const AgentState& state);

} // namespace codeloop

#endif // codeloop_AGENT_STATE_HPP
