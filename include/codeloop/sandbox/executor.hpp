/*
 * codeloop - Sandbox executor
 * 
 * Runs one generated Python program per call:
 *   1. policy filter (a hit returns immediately, nothing is spawned)
 *   2. fresh ephemeral directory <tmp>/agent_exec_XXXXXX holding main.py
 *   3. `<python> -I main.py` with cwd = that directory and an environment
 *      of exactly PYTHONUNBUFFERED=1 and PYTHONIOENCODING=utf-8
 *   4. hard wall-clock timeout; the whole process group is SIGKILLed
 *   5. the directory is removed before execute() returns, on every path
 * 
 * Best-effort isolation only. This is NOT a hardened sandbox.
 */
#ifndef codeloop_SANDBOX_EXECUTOR_HPP
#define codeloop_SANDBOX_EXECUTOR_HPP

#include <codeloop/sandbox/policy.hpp>
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>

namespace codeloop {

class Config;

constexpr int EXIT_POLICY_VIOLATION = -1;
constexpr int EXIT_TIMEOUT = -2;
constexpr int DEFAULT_TIMEOUT_SECONDS = 3;

extern const char* const EXECUTION_NOTE;

struct ExecutionResult {
    bool ok;                    // exit_code == 0
    std::string stdout_output;
    std::string stderr_output;
    int exit_code;              // real code, 128+signal, or a negative sentinel
    std::string note;           // EXECUTION_NOTE
    int64_t elapsed_ms;

    ExecutionResult() : ok(false), exit_code(0), elapsed_ms(0) {}
};

// Infrastructure failure inside the executor (temp dir, pipe, fork).
// Outcomes of the program itself are never reported this way.
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& what) : std::runtime_error(what) {}
};

// Seam between the orchestrator and process execution.
class CodeRunner {
public:
    virtual ~CodeRunner() {}
    virtual ExecutionResult execute(const std::string& code,
                                    int timeout_seconds = DEFAULT_TIMEOUT_SECONDS) = 0;
};

struct SandboxConfig {
    std::string interpreter;        // bare name (PATH lookup) or absolute path
    std::string temp_root;          // empty = $TMPDIR or /tmp
    size_t max_output_bytes;        // per stream
    bool landlock;
    long rlimit_as_mb;              // 0 = leave unlimited
    long rlimit_fsize_mb;
    long rlimit_nofile;

    SandboxConfig()
        : interpreter("python3")
        , max_output_bytes(1024 * 1024)
        , landlock(false)
        , rlimit_as_mb(1024)
        , rlimit_fsize_mb(10)
        , rlimit_nofile(64)
    {}

    // Reads the sandbox.* keys
    static SandboxConfig from_config(const Config& cfg);
};

// Resolve an interpreter name against PATH. Wrapper scripts (files
// starting with "#!", e.g. version-manager shims) are skipped in favour
// of a real binary, since they depend on the caller's environment.
// Names containing '/' are returned unchanged; an unresolvable name is
// returned unchanged so that exec reports the failure.
std::string resolve_interpreter(const std::string& name, const std::string& path_env);

class SandboxExecutor : public CodeRunner {
public:
    explicit SandboxExecutor(const SandboxConfig& config = SandboxConfig());

    // Thread-safe: every call owns its directory, pipes and child.
    // timeout_seconds <= 0 selects DEFAULT_TIMEOUT_SECONDS.
    // Throws SandboxError on infrastructure failure.
    ExecutionResult execute(const std::string& code,
                            int timeout_seconds = DEFAULT_TIMEOUT_SECONDS) override;

    const std::string& interpreter_path() const { return interpreter_path_; }
    const SandboxConfig& config() const { return config_; }
    const PolicyFilter& policy() const { return policy_; }

private:
    ExecutionResult run_process(const std::string& workdir, const std::string& script,
                                int timeout_seconds);

    SandboxConfig config_;
    PolicyFilter policy_;
    std::string interpreter_path_;
    std::vector<std::string> interpreter_ro_dirs_;  // extra Landlock read-only trees
    bool landlock_active_;
};

} // namespace codeloop

#endif // codeloop_SANDBOX_EXECUTOR_HPP
