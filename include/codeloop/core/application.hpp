/*
 * codeloop - Application
 *
 * Process lifecycle: argument parsing, .env and config loading, logging
 * setup, model provider and sandbox construction, task dispatch and
 * result reporting.
 */
#ifndef codeloop_CORE_APPLICATION_HPP
#define codeloop_CORE_APPLICATION_HPP

#include <codeloop/core/config.hpp>
#include <codeloop/agent/state.hpp>
#include <codeloop/plugins/openrouter/openrouter.hpp>
#include <codeloop/sandbox/executor.hpp>
#include <string>
#include <vector>
#include <mutex>

namespace codeloop {

struct AppInfo {
    static const char* const NAME;
    static const char* const VERSION;
};

// Process exit statuses
constexpr int EXIT_ALL_SUCCEEDED = 0;
constexpr int EXIT_TASK_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_COLLABORATOR = 3;

struct CliOptions {
    std::string config_file;
    bool config_explicit;
    std::vector<std::string> tasks;
    std::string model;
    int timeout_seconds;    // 0 = from config
    int jobs;
    bool demo;
    bool ping;
    bool json;
    bool show_code;
    bool verbose;

    CliOptions()
        : config_file("config.json")
        , config_explicit(false)
        , timeout_seconds(0)
        , jobs(1)
        , demo(false)
        , ping(false)
        , json(false)
        , show_code(false)
        , verbose(false)
    {}
};

// Outcome of one task as seen by the application
struct TaskOutcome {
    std::string task;
    AgentState state;
    bool completed;         // false when the run raised
    std::string error;

    TaskOutcome() : completed(false) {}
};

class Orchestrator;

// Run one task to completion. Model, sandbox and any other std::exception
// failures are caught, logged and returned in `error` with completed = false.
TaskOutcome run_task(Orchestrator& orchestrator, const std::string& task);

void print_usage(const char* prog);
void print_version();

// Parse argv into `opts`. Returns false when the process should stop
// right away (help, version, usage error) and sets `exit_code`.
bool parse_args(int argc, char* argv[], CliOptions& opts, int& exit_code);

class Application {
public:
    static Application& instance();

    // Returns false when the process should exit; see exit_code().
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    int exit_code() const { return exit_code_; }
    const Config& config() const { return config_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool load_configuration();
    void setup_logging();
    bool setup_provider();

    int run_ping();
    int run_tasks(const std::vector<std::string>& tasks);
    TaskOutcome run_one(const std::string& task);
    void report(const TaskOutcome& outcome, size_t index, size_t total);
    void print_program(const AgentState& state, const std::string& program);

    Config config_;
    CliOptions options_;
    OpenRouterAI ai_;
    SandboxExecutor* executor_;
    std::mutex output_mutex_;
    bool curl_ready_;
    int exit_code_;
};

} // namespace codeloop

#endif // codeloop_CORE_APPLICATION_HPP
