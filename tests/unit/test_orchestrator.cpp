#include <gtest/gtest.h>
#include <codeloop/agent/orchestrator.hpp>
#include <codeloop/agent/prompts.hpp>
#include "scripted_provider.hpp"

#include <vector>

namespace codeloop {
namespace {

using fakes::ScriptedProvider;
using fakes::RecordingRunner;

std::string fenced(const std::string& code) {
    return "```python\n" + code + "\n```";
}

std::string plan_reply(const std::string& plan, const std::string& code) {
    return "Plan:\n" + plan + "\n\n" + fenced(code) + "\n";
}

// ============================================================================
// End to end with the real sandbox
// ============================================================================

class OrchestratorSandboxTest : public ::testing::Test {
protected:
    OrchestratorSandboxTest() : executor(SandboxConfig()) {}

    AgentState run(const std::string& task, int timeout = 5) {
        OrchestratorConfig config;
        config.timeout_seconds = timeout;
        Orchestrator orchestrator(provider, executor, config);
        orchestrator.set_phase_callback([this](Phase phase, const AgentState&) {
            phases.push_back(phase);
        });
        return orchestrator.run(task);
    }

    ScriptedProvider provider;
    SandboxExecutor executor;
    std::vector<Phase> phases;
};

TEST_F(OrchestratorSandboxTest, FirstAttemptSucceeds) {
    provider.reply(plan_reply("Add the numbers.", "print(2+2)"));

    AgentState state = run("compute 2+2");

    EXPECT_TRUE(state.done);
    EXPECT_EQ(state.attempts, 1);
    ASSERT_TRUE(state.has_run);
    EXPECT_TRUE(state.last_run.ok);
    EXPECT_EQ(state.last_run.stdout_output, "4\n");
    EXPECT_EQ(state.code, "print(2+2)");
    EXPECT_NE(state.plan.find("Add the numbers."), std::string::npos);
    EXPECT_EQ(provider.remaining(), 0u);

    std::vector<Phase> expected = {
        Phase::PLANNING, Phase::EXECUTING, Phase::DECIDING, Phase::FINISHED
    };
    EXPECT_EQ(phases, expected);
}

TEST_F(OrchestratorSandboxTest, BareExpressionIsPrinted) {
    provider.reply(plan_reply("Just evaluate it.", "2+2"));

    AgentState state = run("compute 2+2");

    EXPECT_TRUE(state.last_run.ok);
    EXPECT_EQ(state.last_run.stdout_output, "4\n");
    // The stored candidate is what the model wrote, not the wrapped program
    EXPECT_EQ(state.code, "2+2");
}

TEST_F(OrchestratorSandboxTest, SyntaxErrorIsFixedOnSecondAttempt) {
    provider.reply(plan_reply("Print the sum.", "print(2+"));
    provider.reply(fenced("print(2+2)"));

    AgentState state = run("compute 2+2");

    EXPECT_TRUE(state.done);
    EXPECT_EQ(state.attempts, 2);
    EXPECT_TRUE(state.last_run.ok);
    EXPECT_EQ(state.last_run.stdout_output, "4\n");

    ASSERT_EQ(provider.requests.size(), 2u);
    EXPECT_NE(provider.requests[1].find("SyntaxError"), std::string::npos);
    EXPECT_NE(provider.requests[1].find("print(2+"), std::string::npos);

    std::vector<Phase> expected = {
        Phase::PLANNING, Phase::EXECUTING, Phase::DECIDING,
        Phase::FIXING, Phase::EXECUTING, Phase::DECIDING, Phase::FINISHED
    };
    EXPECT_EQ(phases, expected);
}

TEST_F(OrchestratorSandboxTest, GivesUpAfterThreeFailures) {
    provider.reply(plan_reply("Fail.", "raise RuntimeError('one')"));
    provider.reply(fenced("raise RuntimeError('two')"));
    provider.reply(fenced("raise RuntimeError('three')"));

    AgentState state = run("impossible");

    EXPECT_TRUE(state.done);
    EXPECT_EQ(state.attempts, MAX_ATTEMPTS);
    EXPECT_FALSE(state.last_run.ok);
    EXPECT_NE(state.last_run.stderr_output.find("three"), std::string::npos);
    EXPECT_EQ(provider.requests.size(), 3u);
    EXPECT_EQ(provider.remaining(), 0u);
}

TEST_F(OrchestratorSandboxTest, PolicyViolationFeedsTheFixer) {
    provider.reply(plan_reply("List files.", "import os\nprint(os.listdir('.'))"));
    provider.reply(fenced("print('no files needed')"));

    AgentState state = run("list files");

    EXPECT_TRUE(state.last_run.ok);
    EXPECT_EQ(state.attempts, 2);
    ASSERT_EQ(provider.requests.size(), 2u);
    EXPECT_NE(provider.requests[1].find("Blocked by policy"), std::string::npos);
}

TEST_F(OrchestratorSandboxTest, TimeoutIsPassedToRunner) {
    provider.reply(plan_reply("Spin.", "while True:\n    pass"));
    provider.reply(fenced("print('stopped')"));

    AgentState state = run("spin", 1);

    EXPECT_TRUE(state.last_run.ok);
    ASSERT_EQ(provider.requests.size(), 2u);
    EXPECT_NE(provider.requests[1].find("Timed out after 1s."), std::string::npos);
}

// ============================================================================
// Loop mechanics with a recording runner
// ============================================================================

TEST(OrchestratorTest, AttemptsNeverExceedBudget) {
    ScriptedProvider provider;
    RecordingRunner runner;
    provider.reply(plan_reply("p", "print(1)"));
    for (int i = 0; i < 5; ++i) {
        provider.reply(fenced("print(1)"));
        runner.push(false, "", "boom", 1);
    }
    runner.push(false, "", "boom", 1);

    Orchestrator orchestrator(provider, runner);
    AgentState state = orchestrator.run("t");

    EXPECT_EQ(state.attempts, MAX_ATTEMPTS);
    EXPECT_EQ(runner.programs.size(), static_cast<size_t>(MAX_ATTEMPTS));
    EXPECT_EQ(provider.requests.size(), static_cast<size_t>(MAX_ATTEMPTS));
}

TEST(OrchestratorTest, RunnerSeesInstrumentedProgramAndTimeout) {
    ScriptedProvider provider;
    RecordingRunner runner;
    provider.reply(plan_reply("p", "6*7"));
    runner.push(true, "42\n", "", 0);

    OrchestratorConfig config;
    config.timeout_seconds = 9;
    Orchestrator orchestrator(provider, runner, config);
    std::string seen;
    orchestrator.set_program_callback([&seen](const AgentState&, const std::string& program) {
        seen = program;
    });
    AgentState state = orchestrator.run("t");

    ASSERT_EQ(runner.programs.size(), 1u);
    EXPECT_EQ(runner.programs[0], "print(6*7)");
    EXPECT_EQ(seen, "print(6*7)");
    EXPECT_EQ(runner.timeouts[0], 9);
    EXPECT_EQ(state.code, "6*7");
}

TEST(OrchestratorTest, MissingCodeBlockStillCountsAsAttempt) {
    ScriptedProvider provider;
    RecordingRunner runner;
    provider.reply("I cannot write code for this.");
    provider.reply(fenced("print('ok')"));
    runner.push(false, "", "nothing to run", 1);
    runner.push(true, "ok\n", "", 0);

    Orchestrator orchestrator(provider, runner);
    AgentState state = orchestrator.run("t");

    ASSERT_EQ(runner.programs.size(), 2u);
    EXPECT_EQ(runner.programs[0], "");
    EXPECT_EQ(runner.programs[1], "print('ok')");
    EXPECT_EQ(state.plan, "I cannot write code for this.");
    EXPECT_EQ(state.attempts, 2);
    EXPECT_TRUE(state.last_run.ok);
}

TEST(OrchestratorTest, FixPromptCarriesPreviousRun) {
    ScriptedProvider provider;
    RecordingRunner runner;
    provider.reply(plan_reply("p", "print(x)"));
    provider.reply(fenced("x = 1\nprint(x)"));
    runner.push(false, "partial out", "NameError: name 'x' is not defined", 1);
    runner.push(true, "1\n", "", 0);

    Orchestrator orchestrator(provider, runner);
    AgentState state = orchestrator.run("print x");

    ASSERT_EQ(provider.requests.size(), 2u);
    const std::string& fix_prompt = provider.requests[1];
    EXPECT_NE(fix_prompt.find("print x"), std::string::npos);
    EXPECT_NE(fix_prompt.find("print(x)"), std::string::npos);
    EXPECT_NE(fix_prompt.find("partial out"), std::string::npos);
    EXPECT_NE(fix_prompt.find("NameError"), std::string::npos);
    EXPECT_EQ(state.code, "x = 1\nprint(x)");
}

TEST(OrchestratorTest, PlannerFailurePropagates) {
    ScriptedProvider provider;
    RecordingRunner runner;
    provider.fail("HTTP request failed: connection refused");

    Orchestrator orchestrator(provider, runner);
    try {
        orchestrator.run("t");
        FAIL() << "expected ModelError";
    } catch (const ModelError& e) {
        EXPECT_NE(std::string(e.what()).find("connection refused"), std::string::npos);
    }
    EXPECT_TRUE(runner.programs.empty());
}

TEST(OrchestratorTest, FixerFailurePropagates) {
    ScriptedProvider provider;
    RecordingRunner runner;
    provider.reply(plan_reply("p", "print(1/0)"));
    provider.fail("API error (HTTP 503)");
    runner.push(false, "", "ZeroDivisionError", 1);

    Orchestrator orchestrator(provider, runner);
    EXPECT_THROW(orchestrator.run("t"), ModelError);
    EXPECT_EQ(runner.programs.size(), 1u);
}

TEST(OrchestratorTest, DoneOnlyWhenFinished) {
    ScriptedProvider provider;
    RecordingRunner runner;
    provider.reply(plan_reply("p", "print(1)"));
    runner.push(true, "1\n", "", 0);

    Orchestrator orchestrator(provider, runner);
    std::vector<bool> done_flags;
    orchestrator.set_phase_callback([&done_flags](Phase phase, const AgentState& state) {
        done_flags.push_back(state.done);
        EXPECT_EQ(state.done, phase == Phase::FINISHED) << phase_name(phase);
    });
    orchestrator.run("t");

    ASSERT_FALSE(done_flags.empty());
    EXPECT_TRUE(done_flags.back());
}

TEST(OrchestratorTest, InstanceIsReusable) {
    ScriptedProvider provider;
    RecordingRunner runner;
    provider.reply(plan_reply("p", "print(1)"));
    provider.reply(plan_reply("p", "print(2)"));
    runner.push(true, "1\n", "", 0);
    runner.push(true, "2\n", "", 0);

    Orchestrator orchestrator(provider, runner);
    AgentState first = orchestrator.run("one");
    AgentState second = orchestrator.run("two");

    EXPECT_EQ(first.attempts, 1);
    EXPECT_EQ(second.attempts, 1);
    EXPECT_NE(first.run_id, second.run_id);
    EXPECT_EQ(second.last_run.stdout_output, "2\n");
}

// ============================================================================
// Planner / Fixer nodes
// ============================================================================

TEST(PlannerTest, FillsPlanCodeAndAttempts) {
    ScriptedProvider provider;
    provider.reply("Plan:\nSum it.\n\n```\n4\n```\n```python\nprint(2+2)\n```\nDone.");

    Planner planner(provider);
    AgentState state = planner.plan(AgentState::initial("compute 2+2"));

    EXPECT_EQ(state.code, "print(2+2)");
    EXPECT_EQ(state.attempts, 1);
    EXPECT_NE(state.plan.find("Sum it."), std::string::npos);
    ASSERT_EQ(provider.requests.size(), 1u);
    EXPECT_EQ(provider.requests[0], build_plan_prompt("compute 2+2"));
}

TEST(PlannerTest, DefaultsSystemPrompt) {
    ScriptedProvider provider;
    provider.reply(fenced("print(1)"));
    provider.reply(fenced("print(1)"));

    Planner planner(provider);
    planner.plan(AgentState::initial("t"));

    CompletionOptions custom;
    custom.system_prompt = "Be terse.";
    Planner custom_planner(provider, custom);
    custom_planner.plan(AgentState::initial("t"));

    ASSERT_EQ(provider.system_prompts.size(), 2u);
    EXPECT_EQ(provider.system_prompts[0], system_prompt());
    EXPECT_EQ(provider.system_prompts[1], "Be terse.");
}

TEST(FixerTest, TakesFirstFenceAndCountsAttempt) {
    ScriptedProvider provider;
    provider.reply("```\nprint('fixed')\n```\n```python\nprint('second')\n```");

    AgentState state = AgentState::initial("t");
    state.code = "prnt('x')";
    state.attempts = 1;
    state.last_run.stderr_output = "NameError: name 'prnt' is not defined";
    state.has_run = true;

    Fixer fixer(provider);
    AgentState next = fixer.fix(state);

    EXPECT_EQ(next.code, "print('fixed')");
    EXPECT_EQ(next.attempts, 2);
    EXPECT_EQ(next.task, "t");
    EXPECT_EQ(next.run_id, state.run_id);
}

} // namespace
} // namespace codeloop
