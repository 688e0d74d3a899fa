/*
 * codeloop - Sandbox executor implementation
 *
 * fork/exec with separate stdout and stderr pipes, a poll loop bounded
 * by a monotonic deadline, and SIGKILL of the child's process group on
 * expiry. The child code between fork() and execve() sticks to
 * async-signal-safe calls because concurrent runs fork from a
 * multithreaded parent.
 */
#include <codeloop/sandbox/executor.hpp>
#include <codeloop/sandbox/landlock.hpp>
#include <codeloop/core/config.hpp>
#include <codeloop/core/logger.hpp>
#include <codeloop/core/utils.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <climits>
#include <fstream>
#include <filesystem>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/resource.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace codeloop {

const char* const EXECUTION_NOTE =
    "Execution policy: temporary working directory, time-limited, and blocks "
    "some risky imports/calls. This is NOT a hardened sandbox.";

namespace {

const char* const WORKDIR_PREFIX = "agent_exec_";
const char* const SCRIPT_NAME = "main.py";
const char* const TRUNCATED_MARKER = "\n[output truncated]";

// ============================================================================
// Ephemeral working directory
// ============================================================================

class ScopedWorkdir {
public:
    explicit ScopedWorkdir(const std::string& root) {
        std::string base = root;
        if (base.empty()) {
            const char* tmp = getenv("TMPDIR");
            base = (tmp && tmp[0] != '\0') ? tmp : "/tmp";
        }
        std::string templ = base + "/" + WORKDIR_PREFIX + "XXXXXX";
        std::vector<char> buf(templ.begin(), templ.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            throw SandboxError("cannot create working directory under " + base +
                               ": " + strerror(errno));
        }
        path_ = buf.data();
    }

    ~ScopedWorkdir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            LOG_WARN("[Sandbox] Failed to remove %s: %s", path_.c_str(), ec.message().c_str());
        }
    }

    const std::string& path() const { return path_; }

private:
    ScopedWorkdir(const ScopedWorkdir&);
    ScopedWorkdir& operator=(const ScopedWorkdir&);

    std::string path_;
};

// ============================================================================
// Output capture
// ============================================================================

struct StreamCapture {
    int fd;
    size_t limit;
    std::string data;
    bool truncated;

    StreamCapture(int f, size_t lim) : fd(f), limit(lim), truncated(false) {}

    // Read whatever is available without blocking. Closes fd on EOF.
    void drain() {
        char buf[4096];
        while (fd >= 0) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                size_t room = limit > data.size() ? limit - data.size() : 0;
                size_t take = static_cast<size_t>(n) < room ? static_cast<size_t>(n) : room;
                if (take > 0) {
                    data.append(buf, take);
                }
                if (take < static_cast<size_t>(n)) {
                    truncated = true;
                }
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            close(fd);   // EOF or hard error
            fd = -1;
        }
    }

    std::string finish() {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
        if (truncated) {
            data += TRUNCATED_MARKER;
        }
        return data;
    }
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void set_rlimit(int resource, rlim_t value) {
    struct rlimit rl;
    rl.rlim_cur = value;
    rl.rlim_max = value;
    (void)setrlimit(resource, &rl);
}

// Async-signal-safe diagnostic for the child before exec
void child_fail(const char* msg, int code) {
    ssize_t ignored = write(STDERR_FILENO, msg, strlen(msg));
    (void)ignored;
    _exit(code);
}

bool is_wrapper_script(const std::string& path) {
    std::ifstream f(path.c_str(), std::ios::binary);
    char magic[2] = {0, 0};
    f.read(magic, 2);
    return f.gcount() == 2 && magic[0] == '#' && magic[1] == '!';
}

bool is_executable_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

// <prefix> for <prefix>/bin/python3 when it lies outside the system tree
std::string interpreter_prefix(const std::string& interpreter) {
    char resolved[PATH_MAX];
    if (realpath(interpreter.c_str(), resolved) == nullptr) {
        return "";
    }
    std::string p(resolved);
    for (int i = 0; i < 2; ++i) {
        size_t slash = p.rfind('/');
        if (slash == std::string::npos || slash == 0) return "";
        p = p.substr(0, slash);
    }
    static const char* const system_roots[] = { "/usr", "/bin", "/lib", "/sbin", NULL };
    for (int i = 0; system_roots[i] != NULL; ++i) {
        if (p == system_roots[i] || starts_with(p, std::string(system_roots[i]) + "/")) {
            return "";
        }
    }
    return p;
}

} // anonymous namespace

// ============================================================================
// Configuration
// ============================================================================

SandboxConfig SandboxConfig::from_config(const Config& cfg) {
    SandboxConfig sc;
    sc.interpreter = cfg.get_string("sandbox.interpreter", sc.interpreter);
    sc.temp_root = cfg.get_string("sandbox.temp_root", sc.temp_root);
    int64_t max_out = cfg.get_int("sandbox.max_output_bytes", static_cast<int64_t>(sc.max_output_bytes));
    if (max_out > 0) {
        sc.max_output_bytes = static_cast<size_t>(max_out);
    }
    sc.landlock = cfg.get_bool("sandbox.landlock", sc.landlock);
    sc.rlimit_as_mb = static_cast<long>(cfg.get_int("sandbox.rlimit_as_mb", sc.rlimit_as_mb));
    sc.rlimit_fsize_mb = static_cast<long>(cfg.get_int("sandbox.rlimit_fsize_mb", sc.rlimit_fsize_mb));
    sc.rlimit_nofile = static_cast<long>(cfg.get_int("sandbox.rlimit_nofile", sc.rlimit_nofile));
    return sc;
}

std::string resolve_interpreter(const std::string& name, const std::string& path_env) {
    if (name.empty() || name.find('/') != std::string::npos) {
        return name;
    }
    std::string first_wrapper;
    for (const auto& entry : split(path_env, ":")) {
        std::string dir = entry.empty() ? "." : entry;
        std::string candidate = dir + "/" + name;
        if (!is_executable_file(candidate)) {
            continue;
        }
        if (!is_wrapper_script(candidate)) {
            return candidate;
        }
        if (first_wrapper.empty()) {
            first_wrapper = candidate;
        }
    }
    return first_wrapper.empty() ? name : first_wrapper;
}

// ============================================================================
// SandboxExecutor
// ============================================================================

SandboxExecutor::SandboxExecutor(const SandboxConfig& config)
    : config_(config)
    , policy_()
    , landlock_active_(false)
{
    interpreter_path_ = resolve_interpreter(config_.interpreter, get_env("PATH"));
    if (interpreter_path_.find('/') == std::string::npos) {
        LOG_WARN("[Sandbox] Interpreter '%s' not found in PATH", config_.interpreter.c_str());
    } else {
        LOG_DEBUG("[Sandbox] Interpreter: %s", interpreter_path_.c_str());
    }

    if (config_.landlock) {
        if (FsJail::is_supported()) {
            landlock_active_ = true;
            std::string prefix = interpreter_prefix(interpreter_path_);
            if (!prefix.empty()) {
                interpreter_ro_dirs_.push_back(prefix);
            }
            LOG_INFO("[Sandbox] Landlock confinement enabled for child processes");
        } else {
            LOG_WARN("[Sandbox] Landlock not supported by this kernel; running unconfined");
        }
    }
}

ExecutionResult SandboxExecutor::execute(const std::string& code, int timeout_seconds) {
    if (timeout_seconds <= 0) {
        timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
    }

    PolicyCheck check = policy_.check(code);
    if (!check.allowed) {
        LOG_WARN("[Sandbox] Blocked by policy: %s", check.pattern.c_str());
        ExecutionResult blocked;
        blocked.ok = false;
        blocked.exit_code = EXIT_POLICY_VIOLATION;
        blocked.stderr_output = check.message();
        blocked.note = EXECUTION_NOTE;
        return blocked;
    }

    ScopedWorkdir workdir(config_.temp_root);
    std::string script = workdir.path() + "/" + SCRIPT_NAME;
    {
        std::ofstream out(script.c_str(), std::ios::binary | std::ios::trunc);
        out << code;
        out.close();
        if (!out) {
            throw SandboxError("cannot write " + script);
        }
    }

    ExecutionResult result = run_process(workdir.path(), script, timeout_seconds);
    result.note = EXECUTION_NOTE;
    LOG_DEBUG("[Sandbox] exit=%d in %lldms (stdout %zu bytes, stderr %zu bytes)",
              result.exit_code, static_cast<long long>(result.elapsed_ms),
              result.stdout_output.size(), result.stderr_output.size());
    return result;
}

ExecutionResult SandboxExecutor::run_process(const std::string& workdir,
                                             const std::string& script,
                                             int timeout_seconds) {
    // Everything the child touches is prepared before fork()
    std::vector<std::string> args;
    args.push_back(interpreter_path_);
    args.push_back("-I");
    args.push_back(script);
    std::vector<char*> argv;
    for (size_t i = 0; i < args.size(); ++i) {
        argv.push_back(const_cast<char*>(args[i].c_str()));
    }
    argv.push_back(nullptr);

    static const char* const child_env[] = {
        "PYTHONUNBUFFERED=1",
        "PYTHONIOENCODING=utf-8",
        NULL
    };

    std::vector<const char*> ro_dirs;
    for (size_t i = 0; i < interpreter_ro_dirs_.size(); ++i) {
        ro_dirs.push_back(interpreter_ro_dirs_[i].c_str());
    }
    ro_dirs.push_back(nullptr);

    const char* cwd = workdir.c_str();
    const bool confine = landlock_active_;
    const rlim_t cpu_limit = static_cast<rlim_t>(timeout_seconds) + 1;
    const rlim_t as_limit = static_cast<rlim_t>(config_.rlimit_as_mb) * 1024ULL * 1024ULL;
    const rlim_t fsize_limit = static_cast<rlim_t>(config_.rlimit_fsize_mb) * 1024ULL * 1024ULL;
    const rlim_t nofile_limit = static_cast<rlim_t>(config_.rlimit_nofile);
    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    if (maxfd > 65536) maxfd = 65536;
    const pid_t parent_pid = getpid();

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw SandboxError(std::string("pipe failed: ") + strerror(errno));
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close(out_pipe[0]); close(out_pipe[1]);
        throw SandboxError(std::string("pipe failed: ") + strerror(saved));
    }
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);

    const int64_t start = monotonic_ms();
    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        if (devnull >= 0) close(devnull);
        throw SandboxError(std::string("fork failed: ") + strerror(saved));
    }

    if (pid == 0) {
        // child
        if (devnull >= 0) (void)dup2(devnull, STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // own process group so the timeout can kill the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        sigset_t all;
        sigemptyset(&all);
        (void)sigprocmask(SIG_SETMASK, &all, nullptr);

#ifdef __linux__
        (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (getppid() != parent_pid) {
            _exit(127);
        }
#endif
        if (chdir(cwd) != 0) {
            child_fail("sandbox: cannot enter working directory\n", 126);
        }

        set_rlimit(RLIMIT_CPU, cpu_limit);
        if (as_limit > 0) set_rlimit(RLIMIT_AS, as_limit);
        if (fsize_limit > 0) set_rlimit(RLIMIT_FSIZE, fsize_limit);
        if (nofile_limit > 0) set_rlimit(RLIMIT_NOFILE, nofile_limit);

        for (int fd = 3; fd < maxfd; ++fd) {
            (void)close(fd);
        }

        if (confine && FsJail::confine(cwd, ro_dirs.data()) != 0) {
            child_fail("sandbox: landlock confinement failed\n", 126);
        }

        execve(argv[0], argv.data(), const_cast<char* const*>(child_env));
        child_fail("sandbox: cannot execute interpreter\n", 127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    if (devnull >= 0) close(devnull);
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    StreamCapture out(out_pipe[0], config_.max_output_bytes);
    StreamCapture err(err_pipe[0], config_.max_output_bytes);

    const int64_t deadline = start + static_cast<int64_t>(timeout_seconds) * 1000;
    bool timed_out = false;
    bool reaped = false;
    int status = 0;

    while (true) {
        out.drain();
        err.drain();

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
            break;
        }
        if (w < 0 && errno != EINTR) {
            LOG_ERROR("[Sandbox] waitpid(%d) failed: %s", static_cast<int>(pid), strerror(errno));
            break;
        }

        int64_t now = monotonic_ms();
        if (now >= deadline) {
            timed_out = true;
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            reaped = true;
            break;
        }

        struct pollfd pfds[2];
        nfds_t nfds = 0;
        if (out.fd >= 0) { pfds[nfds].fd = out.fd; pfds[nfds].events = POLLIN; pfds[nfds].revents = 0; ++nfds; }
        if (err.fd >= 0) { pfds[nfds].fd = err.fd; pfds[nfds].events = POLLIN; pfds[nfds].revents = 0; ++nfds; }
        int64_t remaining = deadline - now;
        int slice = remaining < 50 ? static_cast<int>(remaining) : 50;
        (void)poll(nfds > 0 ? pfds : nullptr, nfds, slice > 0 ? slice : 1);
    }

    // Background grandchildren would keep the pipes open; nothing in the
    // group outlives the call.
    (void)kill(-pid, SIGKILL);
    out.drain();
    err.drain();

    ExecutionResult result;
    result.elapsed_ms = monotonic_ms() - start;
    result.stdout_output = out.finish();
    result.stderr_output = err.finish();

    if (timed_out) {
        LOG_WARN("[Sandbox] Timed out after %ds, killed process group %d",
                 timeout_seconds, static_cast<int>(pid));
        result.exit_code = EXIT_TIMEOUT;
        result.stderr_output += "\nTimed out after " + std::to_string(timeout_seconds) + "s.";
    } else if (!reaped) {
        result.exit_code = 128;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = 128;
    }
    result.ok = (result.exit_code == 0);
    return result;
}

} // namespace codeloop
