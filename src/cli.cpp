// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "modebench/cli.hpp"
#include "modebench/build.hpp"
#include "modebench/errors.hpp"
#include "modebench/gate.hpp"
#include "modebench/interrupt.hpp"
#include "modebench/matrix.hpp"
#include "modebench/report.hpp"
#include "modebench/scenario.hpp"
#include "modebench/stats.hpp"
#include "modebench/test.hpp"
#include "modebench/utils.hpp"
#include "modebench/variant.hpp"

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace modebench {

namespace fs = std::filesystem;

// ── parse_args ──────────────────────────────────────────────────────────────

static int parse_int(const std::string& flag, const std::string& value) {
    std::size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(flag + " requires an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::runtime_error(flag + " requires an integer, got '" + value + "'");
    }
    return n;
}

static double parse_double(const std::string& flag, const std::string& value) {
    std::size_t used = 0;
    double d = 0.0;
    try {
        d = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(flag + " requires a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::runtime_error(flag + " requires a number, got '" + value + "'");
    }
    return d;
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error(arg + " requires an argument");
            }
            return argv[++i];
        };

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--family") {
            std::string f = value();
            if (f == "modes")      opts.family = Family::Modes;
            else if (f == "nasty") opts.family = Family::Nasty;
            else throw std::runtime_error("--family must be 'modes' or 'nasty'");
        } else if (arg == "--work-root") {
            opts.work_root = value();
        } else if (arg == "--repo-root") {
            opts.repo_root = value();
        } else if (arg == "--main-ref") {
            opts.main_ref = value();
        } else if (arg == "--iterations-basic") {
            opts.iterations_basic = parse_int(arg, value());
        } else if (arg == "--iterations-complex") {
            opts.iterations_complex = parse_int(arg, value());
        } else if (arg == "--repetitions") {
            opts.repetitions = parse_int(arg, value());
        } else if (arg == "--current-bin") {
            opts.current_bin = value();
        } else if (arg == "--main-bin") {
            opts.main_bin = value();
        } else if (arg == "--margin-pct") {
            opts.margin_pct = parse_double(arg, value());
        } else if (arg == "--margin-baseline") {
            opts.margin_baseline = value();
        } else if (arg == "--enforce-margin") {
            opts.enforce_margin = true;
        } else if (arg == "--keep-artifacts") {
            opts.keep_artifacts = true;
        } else if (arg == "--no-hook-recheck") {
            opts.recheck_hooks = false;
        } else if (arg == "--timeout") {
            opts.timeout_s = parse_int(arg, value());
        } else if (arg == "--script") {
            opts.script = value();
        } else if (arg == "--repo-url") {
            opts.repo_url = value();
        } else if (arg == "--feature-commits") {
            opts.feature_commits = parse_int(arg, value());
        } else if (arg == "--main-commits") {
            opts.main_commits = parse_int(arg, value());
        } else if (arg == "--side-commits") {
            opts.side_commits = parse_int(arg, value());
        } else if (arg == "--files") {
            opts.files = parse_int(arg, value());
        } else if (arg == "--lines-per-file") {
            opts.lines_per_file = parse_int(arg, value());
        } else if (arg == "--burst-every") {
            opts.burst_every = parse_int(arg, value());
        } else {
            throw std::runtime_error("unknown option: " + arg);
        }
    }

    if (opts.selftest || opts.help) return opts;

    if (opts.iterations_basic <= 0 || opts.iterations_complex <= 0) {
        throw std::runtime_error("Iterations must be positive integers.");
    }
    if (opts.repetitions <= 0) {
        throw std::runtime_error("--repetitions must be positive");
    }
    if (opts.margin_pct < 0.0) {
        throw std::runtime_error("--margin-pct must be non-negative");
    }
    if (opts.margin_baseline != "current_wrapper" && opts.margin_baseline != "main_wrapper") {
        throw std::runtime_error("--margin-baseline must be current_wrapper or main_wrapper");
    }
    if (opts.timeout_s <= 0) {
        throw std::runtime_error("--timeout must be positive");
    }
    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " [OPTIONS]\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Benchmark main(wrapper) against current wrapper/hooks/wrapper+hooks\n"
        << "across git workflows and gate the slowdown against a margin.\n"
        << "\n"
        << "Options:\n"
        << "  --family modes|nasty      Scenario family (default: modes)\n"
        << "  --work-root <dir>         Artifact working directory (default: temp dir)\n"
        << "  --repo-root <dir>         Source checkout to build from (default: cwd)\n"
        << "  --main-ref <ref>          Baseline ref (default: origin/main)\n"
        << "  --iterations-basic N      Repetitions per basic scenario (default: 3)\n"
        << "  --iterations-complex N    Repetitions per complex scenario (default: 3)\n"
        << "  --repetitions N           Repetitions per variant, nasty family (default: 1)\n"
        << "  --current-bin <path>      Use an existing current binary (skip build)\n"
        << "  --main-bin <path>         Use an existing main binary (skip worktree+build)\n"
        << "  --margin-pct X            Allowed slowdown percentage (default: 25)\n"
        << "  --margin-baseline KEY     current_wrapper | main_wrapper (default: current_wrapper)\n"
        << "  --enforce-margin          Exit 2 when any margin check fails\n"
        << "  --keep-artifacts          Keep template and run repositories\n"
        << "  --timeout S               Per-command timeout in seconds (default: 900)\n"
        << "  --no-hook-recheck         Skip hook verification before each repetition\n"
        << "  --script <path>           Nasty benchmark script\n"
        << "  --repo-url <url>          Seed repository for the nasty family\n"
        << "  --feature-commits N       Nasty workload (default: 90)\n"
        << "  --main-commits N          Nasty workload (default: 35)\n"
        << "  --side-commits N          Nasty workload (default: 25)\n"
        << "  --files N                 Nasty workload (default: 6)\n"
        << "  --lines-per-file N        Nasty workload (default: 1500)\n"
        << "  --burst-every N           Nasty workload (default: 15)\n"
        << "  --selftest                Run built-in tests\n"
        << "  --help, -h                Show this message\n"
        << "\n"
        << "Exit status: 0 ok, 1 error, 2 enforced margin failure, 130 interrupted.\n";
}

// ── rerun_command ───────────────────────────────────────────────────────────

// Shortest plain decimal form that parses back to the same double.
static std::string round_trip(double value) {
    for (int decimals = 0; decimals <= std::numeric_limits<double>::max_digits10;
         ++decimals) {
        std::string text = fixed(value, decimals);
        if (std::stod(text) == value) return text;
    }
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

// Single-quote an argument unless it is made of shell-safe characters only.
static std::string shell_quote(const std::string& arg) {
    const bool safe = !arg.empty() &&
        arg.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
                              "0123456789_-./:=@%+,") == std::string::npos;
    if (safe) return arg;
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else            out += c;
    }
    return out + "'";
}

std::string rerun_command(const Options& opts) {
    const Options defaults;
    std::ostringstream cmd;
    cmd << "modebench";

    auto path_flag = [&](const char* flag, const std::string& value) {
        if (!value.empty()) cmd << " " << flag << " " << shell_quote(value);
    };

    if (opts.family == Family::Nasty) {
        cmd << " --family nasty"
            << " --repetitions " << opts.repetitions
            << " --feature-commits " << opts.feature_commits
            << " --main-commits " << opts.main_commits
            << " --side-commits " << opts.side_commits
            << " --files " << opts.files
            << " --lines-per-file " << opts.lines_per_file
            << " --burst-every " << opts.burst_every;
        path_flag("--script", opts.script);
        if (opts.repo_url != defaults.repo_url) path_flag("--repo-url", opts.repo_url);
    } else {
        cmd << " --iterations-basic " << opts.iterations_basic
            << " --iterations-complex " << opts.iterations_complex;
    }
    cmd << " --margin-pct " << round_trip(opts.margin_pct)
        << " --margin-baseline " << opts.margin_baseline;
    if (opts.main_ref != defaults.main_ref) path_flag("--main-ref", opts.main_ref);
    path_flag("--repo-root", opts.repo_root);
    path_flag("--current-bin", opts.current_bin);
    path_flag("--main-bin", opts.main_bin);
    path_flag("--work-root", opts.work_root);
    if (opts.timeout_s != defaults.timeout_s) cmd << " --timeout " << opts.timeout_s;
    if (!opts.recheck_hooks) cmd << " --no-hook-recheck";
    if (opts.keep_artifacts) cmd << " --keep-artifacts";
    if (opts.enforce_margin) cmd << " --enforce-margin";
    return cmd.str();
}

// ── Helpers ─────────────────────────────────────────────────────────────────

static fs::path make_temp_work_root(const char* prefix) {
    std::string tmpl = (fs::temp_directory_path() / (std::string(prefix) + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) {
        throw BenchmarkError("cannot create temporary work root: " + tmpl);
    }
    return fs::path(buf.data());
}

static fs::path existing_binary(const std::string& path, const char* what) {
    fs::path p = fs::absolute(path);
    if (!fs::exists(p)) {
        throw SetupError(std::string(what) + " binary not found: " + p.string());
    }
    return p;
}

static std::string git_output_or_unknown(const fs::path& git, const fs::path& repo,
                                         const std::vector<std::string>& args) {
    try {
        return git_output(git, repo, args);
    } catch (const CommandError&) {
        std::cerr << "[bench] WARNING: git " << args.front() << " failed in "
                  << repo.string() << ", recording 'unknown'\n";
        return "unknown";
    }
}

// ── run ─────────────────────────────────────────────────────────────────────
// Orchestrates one benchmark run.  The baseline worktree lives in an
// optional<ScopedWorktree> inside the try block so it is removed on
// every exit path, including an interrupt.

int run(const Options& opts) {
    if (opts.selftest) {
        return run_selftests();
    }

    install_interrupt_handlers();

    try {
        const bool nasty = opts.family == Family::Nasty;
        const fs::path repo_root =
            opts.repo_root.empty() ? fs::current_path() : fs::absolute(opts.repo_root);

        fs::path work_root;
        if (opts.work_root.empty()) {
            work_root = make_temp_work_root(nasty ? "modebench-nasty-" : "modebench-modes-");
        } else {
            work_root = fs::absolute(opts.work_root);
            fs::create_directories(work_root);
        }
        std::cout << "[bench] Work root: " << work_root.string() << std::endl;

        const fs::path real_git   = resolve_real_git(repo_root);
        const fs::path build_dir  = work_root / "build";
        const fs::path targets    = build_dir / "targets";
        fs::create_directories(targets);

        // ── Binaries ────────────────────────────────────────────────────
        fs::path current_bin;
        if (!opts.current_bin.empty()) {
            current_bin = existing_binary(opts.current_bin, "Current");
        } else {
            std::cout << "[build] Building current branch binary..." << std::endl;
            current_bin = build_release_binary(repo_root, targets / "current");
        }

        std::optional<ScopedWorktree> worktree;
        fs::path    main_bin;
        std::string main_sha;
        if (!opts.main_bin.empty()) {
            main_bin = existing_binary(opts.main_bin, "Main");
            main_sha = "unknown (external binary)";
        } else {
            std::cout << "[build] Preparing main worktree at " << opts.main_ref << "..."
                      << std::endl;
            worktree.emplace(real_git, repo_root, opts.main_ref, build_dir / "main-worktree");
            std::cout << "[build] Building main branch binary..." << std::endl;
            main_bin = build_release_binary(worktree->dir(), targets / "main");
            main_sha = worktree->head_sha();
        }

        std::vector<Variant> variants = default_variants(main_bin, current_bin);
        std::vector<std::string> variant_keys;
        for (const auto& v : variants) variant_keys.push_back(v.key);

        // ── Metadata ────────────────────────────────────────────────────
        RunMetadata meta;
        meta.family             = nasty ? "nasty" : "modes";
        meta.repo_root          = repo_root.string();
        meta.main_ref           = opts.main_ref;
        meta.main_sha           = main_sha;
        meta.real_git           = real_git.string();
        meta.iterations_basic   = opts.iterations_basic;
        meta.iterations_complex = opts.iterations_complex;
        meta.repetitions        = opts.repetitions;
        meta.margin_pct         = opts.margin_pct;
        meta.margin_baseline    = opts.margin_baseline;
        meta.enforce_margin     = opts.enforce_margin;
        meta.command_line       = rerun_command(opts);

        // ── Collect ─────────────────────────────────────────────────────
        std::unique_ptr<SampleSource> source;
        if (nasty) {
            fs::path script = opts.script.empty()
                ? repo_root / "scripts" / "benchmarks" / "git" / "benchmark_nasty_rebases.sh"
                : fs::absolute(opts.script);
            if (!fs::exists(script)) {
                throw SetupError("Missing benchmark script: " + script.string());
            }

            std::cout << "[build] Cloning seed repo snapshot..." << std::endl;
            const fs::path seed_dir = work_root / "seed-repo";
            meta.repo_url       = opts.repo_url;
            meta.seed_repo_head = clone_seed_repo(real_git, opts.repo_url, seed_dir);
            meta.feature_commits = opts.feature_commits;
            meta.main_commits    = opts.main_commits;
            meta.side_commits    = opts.side_commits;
            meta.files           = opts.files;
            meta.lines_per_file  = opts.lines_per_file;
            meta.burst_every     = opts.burst_every;

            ExternalScriptOptions xo;
            xo.work_root       = work_root;
            xo.real_git        = real_git;
            xo.script          = script;
            xo.invoke_cwd      = repo_root;
            xo.seed_repo       = seed_dir.string();
            xo.repetitions     = opts.repetitions;
            xo.feature_commits = opts.feature_commits;
            xo.main_commits    = opts.main_commits;
            xo.side_commits    = opts.side_commits;
            xo.files           = opts.files;
            xo.lines_per_file  = opts.lines_per_file;
            xo.burst_every     = opts.burst_every;
            xo.keep_artifacts  = opts.keep_artifacts;
            xo.sandbox_timeout_s = opts.timeout_s;
            source = std::make_unique<ExternalScriptSource>(variants, xo);
        } else {
            MatrixOptions mo;
            mo.work_root          = work_root;
            mo.real_git           = real_git;
            mo.iterations_basic   = opts.iterations_basic;
            mo.iterations_complex = opts.iterations_complex;
            mo.timeout_s          = opts.timeout_s;
            mo.keep_artifacts     = opts.keep_artifacts;
            mo.recheck_hooks      = opts.recheck_hooks;
            source = std::make_unique<ScenarioMatrix>(scenario_library(), variants, mo);
        }

        std::vector<RunResult> results = source->collect();

        // ── Aggregate and gate ──────────────────────────────────────────
        Summary summary = summarize(results);
        std::vector<Slowdown> slowdowns = compute_slowdowns(summary, meta.slowdown_baseline);
        std::vector<AggregateRatio> aggregates =
            compute_aggregates(summary, meta.slowdown_baseline, variant_keys);

        GateOptions go;
        go.baseline   = opts.margin_baseline;
        go.margin_pct = opts.margin_pct;
        go.enforce    = opts.enforce_margin;
        GateResult gate = evaluate_gate(summary, go);

        meta.timestamp_utc = now_iso_utc();
        meta.branch     = git_output_or_unknown(real_git, repo_root,
                                                {"rev-parse", "--abbrev-ref", "HEAD"});
        meta.branch_sha = git_output_or_unknown(real_git, repo_root, {"rev-parse", "HEAD"});
        fill_host_info(meta);

        // ── Report ──────────────────────────────────────────────────────
        Report report{meta,
                      variants,
                      source->scenarios(),
                      std::move(results),
                      std::move(summary),
                      std::move(slowdowns),
                      std::move(aggregates),
                      std::move(gate)};

        ArtifactPaths paths =
            write_artifacts(report, work_root / "artifacts" / timestamp_string());
        print_completion(report, paths);
        return report.gate.exit_code();

    } catch (const InterruptedError& e) {
        std::cerr << "[bench] " << e.what() << "\n";
        return kInterruptedExitCode;
    }
}

}  // namespace modebench
