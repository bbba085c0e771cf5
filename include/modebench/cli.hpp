// ============================================================================
// modebench/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver: resolve git → obtain binaries → collect samples → summarise →
// gate → write artifacts.
//
// ============================================================================

#ifndef MODEBENCH_CLI_HPP
#define MODEBENCH_CLI_HPP

#include <cstdint>
#include <string>

namespace modebench {

/// Exit status after SIGINT/SIGTERM.
inline constexpr int kInterruptedExitCode = 130;

enum class Family : std::uint8_t {
    Modes,   // in-process scenario matrix
    Nasty    // external rebase script
};

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    Family      family = Family::Modes;
    std::string work_root;              // empty: fresh temp dir
    std::string repo_root;              // empty: current directory
    std::string main_ref = "origin/main";

    int         iterations_basic   = 3;
    int         iterations_complex = 3;
    int         repetitions        = 1;  // nasty family

    std::string current_bin;            // empty: build from repo_root
    std::string main_bin;               // empty: worktree + build

    double      margin_pct      = 25.0;
    std::string margin_baseline = "current_wrapper";
    bool        enforce_margin  = false;

    bool        keep_artifacts = false;
    bool        recheck_hooks  = true;
    int         timeout_s      = 900;

    // Nasty family.
    std::string script;                 // empty: <repo_root>/scripts/...
    std::string repo_url = "https://github.com/python/cpython.git";
    int         feature_commits = 90;
    int         main_commits    = 35;
    int         side_commits    = 25;
    int         files           = 6;
    int         lines_per_file  = 1500;
    int         burst_every     = 15;

    bool        selftest = false;
    bool        help     = false;
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Command line that reproduces a run with the same parameters.
std::string rerun_command(const Options& opts);

/// Main driver.  Returns the process exit code:
/// 0 ok, 1 error, 2 enforced margin failure, 130 interrupted.
int run(const Options& opts);

}  // namespace modebench

#endif  // MODEBENCH_CLI_HPP
