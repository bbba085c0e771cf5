// ============================================================================
// process.cpp — fork/exec subprocess runner with pipe capture
// ============================================================================
//
// Both pipes are drained with poll() while the child runs, so a chatty
// child can never block on a full pipe buffer.  The timeout covers the
// whole lifetime of the child, including the time after it closed its
// output streams.
//
// ============================================================================

#include "modebench/process.hpp"
#include "modebench/errors.hpp"

#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace modebench {

using Clock = std::chrono::steady_clock;

// ── Environment ─────────────────────────────────────────────────────────────

Environment current_environment() {
    Environment env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv = *entry;
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    return env;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

// ── Helpers ─────────────────────────────────────────────────────────────────

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

static void child_fail(const char* what) {
    // Only async-signal-safe calls are allowed between fork and exec.
    ssize_t n = ::write(STDERR_FILENO, "modebench: ", 11);
    n = ::write(STDERR_FILENO, what, std::strlen(what));
    n = ::write(STDERR_FILENO, "\n", 1);
    (void)n;
    ::_exit(127);
}

// ── run_command_unchecked ───────────────────────────────────────────────────

CommandResult run_command_unchecked(const std::vector<std::string>& argv,
                                    const std::string& cwd,
                                    const Environment& env,
                                    int timeout_s) {
    if (argv.empty()) {
        throw BenchmarkError("run_command: empty argument vector");
    }

    // Everything the child needs is built before fork().
    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& a : argv) c_args.push_back(const_cast<char*>(a.c_str()));
    c_args.push_back(nullptr);

    std::vector<std::string> env_strings;
    env_strings.reserve(env.size());
    for (const auto& [key, value] : env) env_strings.push_back(key + "=" + value);
    std::vector<char*> c_env;
    c_env.reserve(env_strings.size() + 1);
    for (auto& s : env_strings) c_env.push_back(s.data());
    c_env.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe(out_pipe) != 0) {
        throw BenchmarkError(std::string("failed to create stdout pipe: ") +
                             std::strerror(errno));
    }
    if (::pipe(err_pipe) != 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw BenchmarkError(std::string("failed to create stderr pipe: ") +
                             std::strerror(saved));
    }

    const auto start = Clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        throw BenchmarkError(std::string("fork failed for `") + join_command(argv) +
                             "`: " + std::strerror(saved));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            child_fail("chdir failed");
        }
        environ = c_env.data();
        ::execvp(c_args[0], c_args.data());
        child_fail("exec failed");
    }

    // Also set from the parent so the group exists before any kill().
    ::setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    CommandResult result;
    const bool bounded = timeout_s > 0;
    const auto deadline = start + std::chrono::seconds(bounded ? timeout_s : 0);

    // ── Drain both pipes until EOF or deadline ─────────────────────────
    int fds[2] = {out_pipe[0], err_pipe[0]};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    char buf[4096];
    while (fds[0] >= 0 || fds[1] >= 0) {
        int wait_ms = -1;
        if (bounded) {
            auto now = Clock::now();
            if (now >= deadline) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
                    .count()) + 1;
        }

        struct pollfd pfds[2];
        for (int i = 0; i < 2; ++i) {
            pfds[i].fd      = fds[i];
            pfds[i].events  = POLLIN;
            pfds[i].revents = 0;
        }
        int rc = ::poll(pfds, 2, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
            close_fd(fds[0]);
            close_fd(fds[1]);
            throw BenchmarkError(std::string("poll failed while running `") +
                                 join_command(argv) + "`: " + std::strerror(saved));
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0 || pfds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i], buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(fds[i]);
            }
        }
    }
    close_fd(fds[0]);
    close_fd(fds[1]);

    // ── Reap the child ──────────────────────────────────────────────────
    int status = 0;
    bool reaped = false;
    while (!result.timed_out) {
        pid_t ret = ::waitpid(pid, &status, bounded ? WNOHANG : 0);
        if (ret == pid) {
            reaped = true;
            break;
        }
        if (ret < 0 && errno != EINTR) break;
        if (bounded) {
            if (Clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            ::usleep(1000);
        }
    }
    if (result.timed_out) {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
    }
    if (!reaped) {
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    if (!result.timed_out && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }
    result.elapsed_s =
        std::chrono::duration<double>(Clock::now() - start).count();
    return result;
}

// ── run_command ─────────────────────────────────────────────────────────────

CommandResult run_command(const std::vector<std::string>& argv,
                          const std::string& cwd,
                          const Environment& env,
                          int timeout_s) {
    CommandResult result = run_command_unchecked(argv, cwd, env, timeout_s);
    if (!result.ok()) {
        throw CommandError(argv, cwd, result.exit_code, result.stdout_text,
                           result.stderr_text, result.timed_out, timeout_s);
    }
    return result;
}

}  // namespace modebench
