// ============================================================================
// modebench/process.hpp — Subprocess execution with capture and timeout
// ============================================================================
//
// Every external program (git, the variant binaries, cargo, the external
// scenario script) is launched through run_command().  The child gets an
// explicit argv, working directory and environment map; stdout and stderr
// are captured in full; a wall-clock timeout kills the child's whole
// process group.
//
// Children are placed in their own process group, so a terminal SIGINT is
// delivered to the harness only and never cuts a measurement short.
//
// ============================================================================

#ifndef MODEBENCH_PROCESS_HPP
#define MODEBENCH_PROCESS_HPP

#include <map>
#include <string>
#include <vector>

namespace modebench {

/// Per-command timeout used when a caller has no better bound.
inline constexpr int kDefaultCommandTimeoutS = 900;

/// Environment passed to a child process (name → value).
using Environment = std::map<std::string, std::string>;

// ── CommandResult ───────────────────────────────────────────────────────────

struct CommandResult {
    int         exit_code = -1;   // -1 when killed by a signal or timed out
    std::string stdout_text;
    std::string stderr_text;
    bool        timed_out = false;
    double      elapsed_s = 0.0;

    bool ok() const noexcept { return exit_code == 0 && !timed_out; }
};

/// Snapshot of the ambient process environment.
Environment current_environment();

/// Render an argv vector as a single space-separated line.
std::string join_command(const std::vector<std::string>& argv);

/// Run a command and return whatever happened.  Only failures to launch
/// (pipe/fork errors) throw; a non-zero exit is reported in the result.
CommandResult run_command_unchecked(const std::vector<std::string>& argv,
                                    const std::string& cwd,
                                    const Environment& env,
                                    int timeout_s);

/// Run a command; throws CommandError on non-zero exit or timeout.
CommandResult run_command(const std::vector<std::string>& argv,
                          const std::string& cwd,
                          const Environment& env,
                          int timeout_s);

}  // namespace modebench

#endif  // MODEBENCH_PROCESS_HPP
