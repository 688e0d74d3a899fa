/*
 * codeloop - Application Implementation
 */
#include <codeloop/core/application.hpp>
#include <codeloop/core/logger.hpp>
#include <codeloop/core/utils.hpp>
#include <codeloop/core/thread_pool.hpp>
#include <codeloop/agent/orchestrator.hpp>
#include <codeloop/agent/prompts.hpp>

#include <algorithm>
#include <exception>
#include <iostream>
#include <sstream>
#include <cstring>
#include <cstdlib>
#include <unistd.h>
#include <curl/curl.h>

namespace codeloop {

const char* const AppInfo::NAME = "codeloop";
const char* const AppInfo::VERSION = "1.0.0";

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - plan, run and repair Python programs with an LLM\n\n"
              << "Usage: " << prog << " [options] <task text...>\n"
              << "       " << prog << " [options] --demo\n"
              << "       " << prog << " [options] --ping\n\n"
              << "Options:\n"
              << "  -h, --help         Show this help message\n"
              << "  -v, --version      Show version\n"
              << "  --config FILE      Config file (default: config.json if present)\n"
              << "  --model ID         Model identifier (overrides config)\n"
              << "  --timeout N        Execution timeout in seconds (default: 3)\n"
              << "  --jobs N           Run up to N tasks concurrently\n"
              << "  --demo             Run the built-in sample tasks\n"
              << "  --ping             Check that the model answers\n"
              << "  --json             Print each final state as a JSON line\n"
              << "  --show-code        Print every program before it runs\n"
              << "  --verbose          Debug logging\n\n"
              << "With no task arguments the task is read from stdin.\n\n"
              << "Example:\n"
              << "  " << prog << " \"Print the 20th prime number\"\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

static bool parse_positive(const char* text, int& out) {
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || v <= 0 || v > 86400) {
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

bool parse_args(int argc, char* argv[], CliOptions& opts, int& exit_code) {
    std::vector<std::string> words;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            exit_code = EXIT_ALL_SUCCEEDED;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            exit_code = EXIT_ALL_SUCCEEDED;
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            opts.config_file = argv[++i];
            opts.config_explicit = true;
            continue;
        }
        if (strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            opts.model = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            if (!parse_positive(argv[++i], opts.timeout_seconds)) {
                std::cerr << "Invalid --timeout value: " << argv[i] << "\n";
                exit_code = EXIT_USAGE;
                return false;
            }
            continue;
        }
        if (strcmp(argv[i], "--jobs") == 0 && i + 1 < argc) {
            if (!parse_positive(argv[++i], opts.jobs)) {
                std::cerr << "Invalid --jobs value: " << argv[i] << "\n";
                exit_code = EXIT_USAGE;
                return false;
            }
            continue;
        }
        if (strcmp(argv[i], "--demo") == 0) { opts.demo = true; continue; }
        if (strcmp(argv[i], "--ping") == 0) { opts.ping = true; continue; }
        if (strcmp(argv[i], "--json") == 0) { opts.json = true; continue; }
        if (strcmp(argv[i], "--show-code") == 0) { opts.show_code = true; continue; }
        if (strcmp(argv[i], "--verbose") == 0) { opts.verbose = true; continue; }
        if (strcmp(argv[i], "--") == 0) {
            for (++i; i < argc; ++i) words.push_back(argv[i]);
            break;
        }
        if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown or incomplete option: " << argv[i] << "\n\n";
            print_usage(argv[0]);
            exit_code = EXIT_USAGE;
            return false;
        }
        words.push_back(argv[i]);
    }

    // Unquoted words form a single task
    if (!words.empty()) {
        opts.tasks.push_back(join(words, " "));
    }
    if (opts.demo && !opts.tasks.empty()) {
        std::cerr << "--demo does not take a task\n";
        exit_code = EXIT_USAGE;
        return false;
    }
    return true;
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : executor_(nullptr)
    , curl_ready_(false)
    , exit_code_(EXIT_ALL_SUCCEEDED)
{}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv, options_, exit_code_)) {
        return false;
    }

    // Initialize libcurl globally (before threads start)
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        std::cerr << "Failed to initialize libcurl\n";
        exit_code_ = EXIT_COLLABORATOR;
        return false;
    }
    curl_ready_ = true;

    // .env is read before threads exist (setenv is not thread-safe)
    int env_count = load_env_file(".env", false);

    if (!load_configuration()) {
        exit_code_ = EXIT_USAGE;
        return false;
    }
    setup_logging();

    LOG_DEBUG("%s v%s starting", AppInfo::NAME, AppInfo::VERSION);
    if (env_count >= 0) {
        LOG_DEBUG("Read %d variable(s) from .env", env_count);
    }

    if (!options_.ping) {
        if (options_.demo) {
            options_.tasks = sample_tasks();
        } else if (options_.tasks.empty()) {
            if (isatty(STDIN_FILENO)) {
                print_usage(argv[0]);
                exit_code_ = EXIT_USAGE;
                return false;
            }
            std::stringstream buffer;
            buffer << std::cin.rdbuf();
            std::string task = trim(buffer.str());
            if (task.empty()) {
                std::cerr << "No task given\n";
                exit_code_ = EXIT_USAGE;
                return false;
            }
            options_.tasks.push_back(task);
        }
    }

    if (!setup_provider()) {
        exit_code_ = EXIT_USAGE;
        return false;
    }

    if (!options_.ping) {
        executor_ = new SandboxExecutor(SandboxConfig::from_config(config_));
    }
    return true;
}

bool Application::load_configuration() {
    if (options_.config_explicit) {
        if (!config_.load_file(options_.config_file)) {
            std::cerr << "Failed to load config from " << options_.config_file << "\n";
            return false;
        }
    } else if (access(options_.config_file.c_str(), R_OK) == 0) {
        if (!config_.load_file(options_.config_file)) {
            std::cerr << "Failed to load config from " << options_.config_file << "\n";
            return false;
        }
    }

    // Environment beats the config file, the command line beats both
    std::string key = get_env("OPENROUTER_API_KEY");
    if (!trim(key).empty()) {
        config_.set_string("openrouter.api_key", trim(key));
    }
    std::string model = get_env("OPENROUTER_MODEL");
    if (!trim(model).empty()) {
        config_.set_string("openrouter.model", trim(model));
    }
    if (!options_.model.empty()) {
        config_.set_string("openrouter.model", options_.model);
    }
    if (options_.timeout_seconds > 0) {
        config_.set_int("sandbox.timeout", options_.timeout_seconds);
    }
    return true;
}

void Application::setup_logging() {
    LogLevel level = parse_log_level(config_.get_string("log_level", "info"), LogLevel::INFO);
    if (options_.verbose) {
        level = LogLevel::DEBUG;
    }
    Logger::instance().set_level(level);
}

bool Application::setup_provider() {
    if (!ai_.init(config_)) {
        LOG_ERROR("No model credential: set OPENROUTER_API_KEY (environment or .env) "
                  "or openrouter.api_key in %s", options_.config_file.c_str());
        return false;
    }
    return true;
}

int Application::run() {
    if (options_.ping) {
        return run_ping();
    }
    return run_tasks(options_.tasks);
}

void Application::shutdown() {
    LOG_DEBUG("Shutting down");
    if (executor_) {
        delete executor_;
        executor_ = nullptr;
    }
    if (curl_ready_) {
        curl_global_cleanup();
        curl_ready_ = false;
    }
}

// ============================================================================
// Commands
// ============================================================================

int Application::run_ping() {
    LOG_INFO("Pinging %s with model %s", ai_.api_url().c_str(), ai_.default_model().c_str());
    CompletionResult result = ai_.complete("Reply with exactly: MODEL WORKING");
    if (!result.success) {
        std::cerr << "Model check failed: " << result.error << "\n";
        return EXIT_COLLABORATOR;
    }
    std::cout << trim(result.content) << "\n";
    return EXIT_ALL_SUCCEEDED;
}

TaskOutcome run_task(Orchestrator& orchestrator, const std::string& task) {
    TaskOutcome outcome;
    outcome.task = task;

    try {
        outcome.state = orchestrator.run(task);
        outcome.completed = true;
    } catch (const ModelError& e) {
        LOG_ERROR("[Agent] Model call failed: %s", e.what());
        outcome.error = e.what();
    } catch (const SandboxError& e) {
        LOG_ERROR("[Agent] Sandbox failure: %s", e.what());
        outcome.error = e.what();
    } catch (const std::exception& e) {
        LOG_ERROR("[Agent] Run aborted: %s", e.what());
        outcome.error = std::string("internal error: ") + e.what();
    }
    return outcome;
}

TaskOutcome Application::run_one(const std::string& task) {
    OrchestratorConfig oc;
    oc.timeout_seconds = static_cast<int>(config_.get_int("sandbox.timeout", DEFAULT_TIMEOUT_SECONDS));

    Orchestrator orchestrator(ai_, *executor_, oc);
    if (options_.show_code) {
        orchestrator.set_program_callback([this](const AgentState& state, const std::string& program) {
            print_program(state, program);
        });
    }
    return run_task(orchestrator, task);
}

int Application::run_tasks(const std::vector<std::string>& tasks) {
    std::vector<TaskOutcome> outcomes(tasks.size());

    if (options_.jobs <= 1 || tasks.size() <= 1) {
        for (size_t i = 0; i < tasks.size(); ++i) {
            outcomes[i] = run_one(tasks[i]);
            report(outcomes[i], i, tasks.size());
        }
    } else {
        size_t workers = std::min(tasks.size(), static_cast<size_t>(options_.jobs));
        LOG_INFO("Running %zu tasks on %zu workers", tasks.size(), workers);
        ThreadPool pool(workers);
        for (size_t i = 0; i < tasks.size(); ++i) {
            TaskOutcome* slot = &outcomes[i];
            const std::string* task = &tasks[i];
            // Filled in up front so a job that never completes still names its task
            slot->task = *task;
            slot->error = "task did not complete";
            if (!pool.enqueue([this, slot, task]() { *slot = run_one(*task); })) {
                slot->error = "task could not be scheduled";
            }
        }
        pool.wait_idle();
        pool.shutdown();
        for (size_t i = 0; i < outcomes.size(); ++i) {
            report(outcomes[i], i, outcomes.size());
        }
    }

    int code = EXIT_ALL_SUCCEEDED;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const TaskOutcome& o = outcomes[i];
        if (!o.completed) {
            code = EXIT_COLLABORATOR;
        } else if (!(o.state.has_run && o.state.last_run.ok) && code == EXIT_ALL_SUCCEEDED) {
            code = EXIT_TASK_FAILED;
        }
    }
    return code;
}

// ============================================================================
// Output
// ============================================================================

void Application::print_program(const AgentState& state, const std::string& program) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "=== GENERATED CODE (attempt " << state.attempts << ") ===\n"
              << program << "\n"
              << "======================\n";
    std::cout.flush();
}

void Application::report(const TaskOutcome& outcome, size_t index, size_t total) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (options_.json) {
        Json j;
        if (outcome.completed) {
            j = to_json(outcome.state);
        } else {
            j = Json::object();
            j["task"] = sanitize_utf8(outcome.task);
            j["error"] = sanitize_utf8(outcome.error);
        }
        std::cout << j.dump(-1, ' ', false, Json::error_handler_t::replace) << "\n";
        std::cout.flush();
        return;
    }

    std::cout << "=== TASK " << (index + 1) << "/" << total << " ===\n"
              << outcome.task << "\n\n";
    if (!outcome.completed) {
        std::cout << "Error: " << outcome.error << "\n\n";
        std::cout.flush();
        return;
    }

    const AgentState& s = outcome.state;
    bool ok = s.has_run && s.last_run.ok;
    std::cout << "Attempts: " << s.attempts << "/" << MAX_ATTEMPTS << "\n"
              << "Result:   " << (ok ? "success" : "failed");
    if (!ok && s.has_run) {
        std::cout << " (exit code " << s.last_run.exit_code << ")";
    }
    std::cout << "\n\n";
    if (!s.plan.empty()) {
        std::cout << "--- plan ---\n" << s.plan << "\n\n";
    }
    std::cout << "--- code ---\n" << s.code << "\n\n";
    if (s.has_run) {
        std::cout << "--- stdout ---\n" << s.last_run.stdout_output;
        if (!s.last_run.stdout_output.empty() &&
            s.last_run.stdout_output[s.last_run.stdout_output.size() - 1] != '\n') {
            std::cout << "\n";
        }
        if (!s.last_run.stderr_output.empty()) {
            std::cout << "--- stderr ---\n" << s.last_run.stderr_output << "\n";
        }
        std::cout << "\n(" << s.last_run.note << ")\n";
    }
    std::cout << "\n";
    std::cout.flush();
}

} // namespace codeloop
