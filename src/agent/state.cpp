#include <codeloop/agent/state.hpp>
#include <codeloop/core/utils.hpp>

namespace codeloop {

AgentState AgentState::initial(const std::string& task) {
    AgentState state;
    state.run_id = generate_uuid();
    state.started_ms = current_timestamp_ms();
    state.task = task;
    return state;
}

const char* transition_name(Transition t) {
    switch (t) {
        case Transition::FIX: return "fix";
        case Transition::FINISH: return "finish";
    }
    return "finish";
}

Transition decide(bool has_run, const ExecutionResult& last_run, int attempts) {
    if (has_run && last_run.ok) {
        return Transition::FINISH;
    }
    if (attempts >= MAX_ATTEMPTS) {
        return Transition::FINISH;
    }
    return Transition::FIX;
}

Json to_json(const ExecutionResult& result) {
    Json j = Json::object();
    j["ok"] = result.ok;
    j["stdout"] = sanitize_utf8(result.stdout_output);
    j["stderr"] = sanitize_utf8(result.stderr_output);
    j["exit_code"] = result.exit_code;
    j["note"] = result.note;
    j["elapsed_ms"] = result.elapsed_ms;
    return j;
}

Json to_json(const AgentState& state) {
    Json j = Json::object();
    j["run_id"] = state.run_id;
    j["started_ms"] = state.started_ms;
    j["task"] = sanitize_utf8(state.task);
    j["plan"] = sanitize_utf8(state.plan);
    j["code"] = sanitize_utf8(state.code);
    j["attempts"] = state.attempts;
    j["done"] = state.done;
    j["last_run"] = state.has_run ? to_json(state.last_run) : Json(nullptr);
    return j;
}

} // namespace codeloop
