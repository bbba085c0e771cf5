// ============================================================================
// test.cpp — Self-test suite for the mode benchmark harness
// ============================================================================
//
// Contains tests covering:
//   - Deterministic seed content and scenario file layouts
//   - Variant modes and the default variant set
//   - Statistics (median, mean, stdev, geometric mean, summaries)
//   - Slowdowns, aggregates and the margin gate
//   - Process execution (capture, exit codes, timeouts, environment)
//   - Sandbox isolation and hook verification (fake git scripts)
//   - Scenario matrix and external-script sources
//   - Report rendering and command-line parsing
//
// Tests that need a process use throwaway directories under $TMPDIR and
// tiny shell scripts standing in for git and git-ai.
//
// ============================================================================

#include "modebench/test.hpp"
#include "modebench/cli.hpp"
#include "modebench/errors.hpp"
#include "modebench/gate.hpp"
#include "modebench/interrupt.hpp"
#include "modebench/matrix.hpp"
#include "modebench/process.hpp"
#include "modebench/report.hpp"
#include "modebench/sandbox.hpp"
#include "modebench/scenario.hpp"
#include "modebench/stats.hpp"
#include "modebench/utils.hpp"
#include "modebench/variant.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace modebench {

namespace fs = std::filesystem;

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

void TestContext::check_near(double actual, double expected, double tolerance,
                             const std::string& description) {
    ++total_;
    if (std::fabs(actual - expected) > tolerance) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers: scratch directories and fake executables
// ============================================================================

// Removes the directory when the test leaves scope.
class ScratchDir {
public:
    ScratchDir() {
        std::string tmpl = (fs::temp_directory_path() / "modebench-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!::mkdtemp(buf.data())) {
            throw std::runtime_error("mkdtemp failed for " + tmpl);
        }
        path_ = fs::path(buf.data());
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

static fs::path write_script(const fs::path& path, const std::string& body) {
    write_text_file(path, body);
    fs::permissions(path,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace);
    return path;
}

// Stand-in for git-ai: echoes how it was invoked, fails on "fail-now".
static fs::path write_fake_variant(const fs::path& dir) {
    return write_script(dir / "fake-git-ai",
                        "#!/bin/sh\n"
                        "if [ \"$1\" = \"fail-now\" ]; then\n"
                        "  echo \"asked to fail\" >&2\n"
                        "  exit 3\n"
                        "fi\n"
                        "echo \"variant:$(basename \"$0\"):$1\"\n"
                        "exit 0\n");
}

// Stand-in for the real git: answers the global hooksPath query only.
static fs::path write_fake_git(const fs::path& dir) {
    return write_script(dir / "fake-real-git",
                        "#!/bin/sh\n"
                        "if [ \"$1\" = \"config\" ] && [ \"$2\" = \"--global\" ] && "
                        "[ \"$3\" = \"--get\" ]; then\n"
                        "  sed -n 's/^[[:space:]]*hooksPath = //p' \"$GIT_CONFIG_GLOBAL\"\n"
                        "  exit 0\n"
                        "fi\n"
                        "exit 0\n");
}

static RunResult sample(const std::string& scenario, const std::string& variant,
                        int repetition, double duration_ms) {
    RunResult r;
    r.scenario    = scenario;
    r.complexity  = "basic";
    r.variant     = variant;
    r.repetition  = repetition;
    r.duration_ms = duration_ms;
    return r;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

template <typename Error, typename Fn>
static bool throws_as(Fn&& fn) {
    try {
        fn();
        return false;
    } catch (const Error&) {
        return true;
    }
}

static Options parse(std::vector<std::string> args) {
    args.insert(args.begin(), "modebench");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

static bool parse_fails(std::vector<std::string> args) {
    try {
        parse(std::move(args));
        return false;
    } catch (const std::exception&) {
        return true;
    }
}

// ============================================================================
// Seed content and scenarios
// ============================================================================

static void test_seed_content(TestContext& ctx) {
    std::string two = seed_file_content(1000, 2);
    ctx.check_eq(two,
                 "seed=00001000 line=0001 payload=e3977609\n"
                 "seed=00001000 line=0002 payload=81ceefba\n",
                 "seed 1000, two lines");

    std::vector<std::string> rows = split(seed_file_content(7003, 20), '\n');
    ctx.check(rows.size() == 21, "20 rows plus trailing empty field");
    ctx.check_eq(rows[19], "seed=00007003 line=0020 payload=2d2cbc31", "last row of seed 7003");

    ctx.check_eq(seed_file_content(42, 5), seed_file_content(42, 5), "pure function");
    ctx.check(seed_file_content(5, 0).empty(), "zero lines is empty");
}

static void test_scenario_file_names(TestContext& ctx) {
    ctx.check_eq(basic_file_name(0), "bench/basic/file_000.txt", "basic file 0");
    ctx.check_eq(basic_file_name(23), "bench/basic/file_023.txt", "basic file 23");

    StructuredGroups g = structured_file_names();
    ctx.check(g.main.size() == 8, "8 main files");
    ctx.check(g.feature.size() == 10, "10 feature files");
    ctx.check(g.side.size() == 6, "6 side files");
    ctx.check_eq(g.main.front(), "bench/main/main_00.txt", "first main file");
    ctx.check_eq(g.feature.back(), "bench/feature/feature_09.txt", "last feature file");
    ctx.check_eq(g.side[3], "bench/side/side_03.txt", "side file 3");
}

static void test_scenario_library_shape(TestContext& ctx) {
    std::vector<Scenario> lib = scenario_library();
    ctx.check(lib.size() == 8, "eight built-in scenarios");

    int basic = 0;
    for (const auto& s : lib) {
        if (s.complexity == Complexity::Basic) ++basic;
        ctx.check(static_cast<bool>(s.setup) && static_cast<bool>(s.measure),
                  s.key + " has setup and measure");
        ctx.check(!s.description.empty(), s.key + " has a description");
    }
    ctx.check(basic == 5, "five basic scenarios");
    ctx.check_eq(lib.front().key, "commit_human", "first scenario");
    ctx.check_eq(complexity_to_string(Complexity::Complex), "complex", "complexity name");
}

// ============================================================================
// Variants
// ============================================================================

static void test_variant_modes(TestContext& ctx) {
    ctx.check(parse_mode("wrapper") == Mode::Wrapper, "parse wrapper");
    ctx.check(parse_mode("hooks") == Mode::Hooks, "parse hooks");
    ctx.check(parse_mode("both") == Mode::Both, "parse both");
    ctx.check(throws_as<std::runtime_error>([] { parse_mode("daemon"); }),
              "unknown mode rejected");
    ctx.check_eq(mode_to_string(Mode::Both), "both", "mode name");

    ctx.check(installs_wrapper(Mode::Wrapper) && !installs_hooks(Mode::Wrapper),
              "wrapper installs only the wrapper");
    ctx.check(!installs_wrapper(Mode::Hooks) && installs_hooks(Mode::Hooks),
              "hooks installs only hooks");
    ctx.check(installs_wrapper(Mode::Both) && installs_hooks(Mode::Both),
              "both installs both");
}

static void test_default_variants(TestContext& ctx) {
    auto variants = default_variants("/opt/main/git-ai", "/opt/current/git-ai");
    ctx.check(variants.size() == 4, "four variants");
    ctx.check_eq(variants[0].key, "main_wrapper", "first is main_wrapper");
    ctx.check_eq(variants[0].binary.string(), "/opt/main/git-ai", "main binary");

    const Variant* both = find_variant(variants, "current_both");
    ctx.check(both != nullptr, "current_both present");
    if (both) {
        ctx.check(both->mode == Mode::Both, "current_both mode");
        ctx.check_eq(both->binary.string(), "/opt/current/git-ai", "current binary");
        ctx.check_eq(both->label, "current(wrapper+hooks)", "current_both label");
    }
    ctx.check(find_variant(variants, "main_hooks") == nullptr, "no main_hooks");
    ctx.check(kManagedHookNames.size() == 9, "nine managed hooks");
}

// ============================================================================
// Statistics
// ============================================================================

static void test_stats_basics(TestContext& ctx) {
    ctx.check_near(median({3, 1, 2}), 2.0, 1e-12, "odd median");
    ctx.check_near(median({1, 2, 3, 4}), 2.5, 1e-12, "even median");
    ctx.check_near(median({7}), 7.0, 1e-12, "single median");
    ctx.check(throws_as<AggregationError>([] { median({}); }), "empty median fails");

    ctx.check_near(mean({1, 2, 3, 4}), 2.5, 1e-12, "mean");
    ctx.check(throws_as<AggregationError>([] { mean({}); }), "empty mean fails");

    ctx.check_near(population_stdev({2, 4, 4, 4, 5, 5, 7, 9}), 2.0, 1e-12, "population stdev");
    ctx.check_near(population_stdev({5}), 0.0, 1e-12, "single sample stdev");

    ctx.check_near(geometric_mean({1, 1, 1}), 1.0, 1e-12, "gm of ones");
    ctx.check_near(geometric_mean({2, 8}), 4.0, 1e-9, "gm of 2 and 8");
    ctx.check_near(geometric_mean({}), 1.0, 1e-12, "empty gm is neutral");
}

static void test_summarize(TestContext& ctx) {
    std::vector<RunResult> results = {
        sample("zeta", "current_wrapper", 1, 30),
        sample("zeta", "current_hooks", 1, 40),
        sample("alpha", "current_wrapper", 1, 10),
        sample("zeta", "current_wrapper", 2, 10),
        sample("zeta", "current_wrapper", 3, 20),
    };
    Summary s = summarize(results);

    ctx.check(s.scenarios().size() == 2, "two scenarios");
    ctx.check_eq(s.scenarios()[0], "zeta", "first-seen scenario first");
    ctx.check_eq(s.variants()[1], "current_hooks", "first-seen variant order");

    const auto* e = s.find("zeta", "current_wrapper");
    ctx.check(e != nullptr, "zeta/current_wrapper present");
    if (e) {
        ctx.check(e->samples_ms.size() == 3, "three samples");
        ctx.check_near(e->samples_ms[0], 30, 1e-12, "samples keep repetition order");
        ctx.check_near(e->median_ms, 20, 1e-12, "median");
        ctx.check_near(e->min_ms, 10, 1e-12, "min");
        ctx.check_near(e->max_ms, 30, 1e-12, "max");
    }
    ctx.check(s.find("alpha", "current_hooks") == nullptr, "absent pair is null");
}

static void test_slowdowns_and_aggregates(TestContext& ctx) {
    std::vector<RunResult> results = {
        sample("a", "main_wrapper", 1, 100),
        sample("a", "current_wrapper", 1, 110),
        sample("a", "current_hooks", 1, 200),
        sample("b", "main_wrapper", 1, 50),
        sample("b", "current_wrapper", 1, 25),
        sample("b", "current_hooks", 1, 200),
        sample("zero", "main_wrapper", 1, 0),
        sample("zero", "current_wrapper", 1, 5),
        sample("nobase", "current_wrapper", 1, 5),
    };
    Summary s = summarize(results);

    auto slow = compute_slowdowns(s, "main_wrapper");
    ctx.check(slow.size() == 4, "zero and missing baselines produce no slowdown");
    for (const auto& d : slow) {
        ctx.check(d.scenario == "a" || d.scenario == "b", "only a and b: " + d.scenario);
        ctx.check(d.variant != "main_wrapper", "baseline not compared with itself");
    }
    ctx.check_near(slowdown_pct(110, 100), 10.0, 1e-9, "10% slower");
    ctx.check_near(slowdown_pct(25, 50), -50.0, 1e-9, "50% faster");

    auto aggs = compute_aggregates(s, "main_wrapper",
                                   {"main_wrapper", "current_wrapper", "current_hooks"});
    ctx.check(aggs.size() == 2, "baseline skipped in aggregates");
    ctx.check_eq(aggs[0].variant, "current_wrapper", "aggregate order follows input");
    ctx.check(aggs[0].scenario_count == 2, "two contributing scenarios");
    // sqrt(1.1 * 0.5)
    ctx.check_near(aggs[0].ratio, std::sqrt(1.1 * 0.5), 1e-9, "current_wrapper ratio");
    // sqrt(2 * 4)
    ctx.check_near(aggs[1].ratio, std::sqrt(8.0), 1e-9, "current_hooks ratio");
    ctx.check_near(aggs[1].slowdown_pct(), (std::sqrt(8.0) - 1.0) * 100.0, 1e-9,
                   "aggregate slowdown pct");

    auto none = compute_aggregates(s, "main_wrapper", {"missing_variant"});
    ctx.check(none.size() == 1 && none[0].scenario_count == 0, "no data -> zero scenarios");
    ctx.check_near(none[0].ratio, 1.0, 1e-12, "no data -> neutral ratio");
}

static void test_aggregates_unit_invariant(TestContext& ctx) {
    std::vector<RunResult> ms = {
        sample("a", "main_wrapper", 1, 120),    sample("a", "main_wrapper", 2, 80),
        sample("a", "current_hooks", 1, 150),   sample("a", "current_hooks", 2, 170),
        sample("b", "main_wrapper", 1, 40),     sample("b", "current_hooks", 1, 30),
        sample("c", "main_wrapper", 1, 7.5),    sample("c", "current_hooks", 1, 9.25),
    };
    std::vector<RunResult> seconds = ms;
    for (auto& r : seconds) r.duration_ms /= 1000.0;

    const std::vector<std::string> variants = {"main_wrapper", "current_hooks"};
    auto in_ms = compute_aggregates(summarize(ms), "main_wrapper", variants);
    auto in_s  = compute_aggregates(summarize(seconds), "main_wrapper", variants);

    ctx.check(in_ms.size() == 1 && in_s.size() == 1, "one aggregate each");
    ctx.check(in_ms[0].scenario_count == 3 && in_s[0].scenario_count == 3,
              "same contributing scenarios");
    ctx.check_near(in_s[0].ratio, in_ms[0].ratio, 1e-12, "ratio independent of unit");

    auto slow_ms = compute_slowdowns(summarize(ms), "main_wrapper");
    auto slow_s  = compute_slowdowns(summarize(seconds), "main_wrapper");
    ctx.check(slow_ms.size() == slow_s.size(), "same slowdown cells");
    for (std::size_t i = 0; i < slow_ms.size() && i < slow_s.size(); ++i) {
        ctx.check_near(slow_s[i].slowdown_pct, slow_ms[i].slowdown_pct, 1e-9,
                       "slowdown independent of unit: " + slow_ms[i].scenario);
    }
}

// ============================================================================
// Margin gate
// ============================================================================

static Summary gate_fixture() {
    return summarize({
        sample("s1", "current_wrapper", 1, 100),
        sample("s1", "current_hooks", 1, 124),
        sample("s1", "current_both", 1, 126),
        sample("s0", "current_wrapper", 1, 100),
        sample("s0", "current_hooks", 1, 125),
        sample("s0", "current_both", 1, 90),
        sample("s2", "current_hooks", 1, 999),
    });
}

static void test_gate_boundaries(TestContext& ctx) {
    GateOptions opts;
    GateResult g = evaluate_gate(gate_fixture(), opts);

    ctx.check(g.checks().size() == 4, "s2 has no baseline and is skipped");
    ctx.check_eq(g.checks()[0].scenario + "/" + g.checks()[0].variant, "s0/current_both",
                 "sorted by scenario then variant");
    ctx.check(g.checks()[1].passed, "125 vs 100 at 25% passes (inclusive)");
    ctx.check(g.checks()[3].passed, "124 vs 100 passes");
    ctx.check(!g.checks()[2].passed, "126 vs 100 fails");
    ctx.check_near(g.checks()[2].allowed_ms, 125.0, 1e-9, "allowed max");
    ctx.check(!g.passed(), "overall fails");
    ctx.check(g.failed_count() == 1 && g.passed_count() == 3, "counts");
    ctx.check(g.exit_code() == 0, "not enforced -> exit 0");

    opts.enforce = true;
    GateResult enforced = evaluate_gate(gate_fixture(), opts);
    ctx.check(enforced.exit_code() == kGateFailureExitCode, "enforced failure -> exit 2");

    opts.margin_pct = 30.0;
    ctx.check(evaluate_gate(gate_fixture(), opts).exit_code() == 0, "wider margin passes");
}

static void test_gate_baseline_and_errors(TestContext& ctx) {
    GateOptions opts;
    opts.checked = {"current_wrapper", "current_hooks"};
    GateResult g = evaluate_gate(gate_fixture(), opts);
    for (const auto& c : g.checks()) {
        ctx.check(c.variant != "current_wrapper", "baseline never checked against itself");
    }

    opts.margin_pct = -1.0;
    ctx.check(throws_as<std::runtime_error>([&] { evaluate_gate(gate_fixture(), opts); }),
              "negative margin rejected");

    GateOptions empty_opts;
    empty_opts.enforce = true;
    GateResult empty = evaluate_gate(Summary{}, empty_opts);
    ctx.check(empty.passed() && empty.exit_code() == 0, "no checks -> passing");
}

static void test_gate_end_to_end(TestContext& ctx) {
    Summary s = summarize({
        sample("commit_human", "current_wrapper", 1, 10),
        sample("commit_human", "current_wrapper", 2, 10),
        sample("commit_human", "current_hooks", 1, 11),
        sample("commit_human", "current_hooks", 2, 13),
    });
    const auto* hooks = s.find("commit_human", "current_hooks");
    ctx.check(hooks && std::fabs(hooks->median_ms - 12.0) < 1e-12, "median 12");

    GateOptions opts;
    opts.enforce = true;
    GateResult at25 = evaluate_gate(s, opts);
    ctx.check(at25.checks().size() == 1, "one check");
    ctx.check_near(at25.checks()[0].slowdown_pct, 20.0, 1e-9, "20% slowdown");
    ctx.check(at25.exit_code() == 0, "20% within 25% margin");

    opts.margin_pct = 15.0;
    GateResult at15 = evaluate_gate(s, opts);
    ctx.check(!at15.passed(), "20% exceeds 15% margin");
    ctx.check(at15.exit_code() == kGateFailureExitCode, "enforced exit code");
    ctx.check(kGateFailureExitCode == 2 && kInterruptedExitCode == 130,
              "exit statuses distinct from the generic error status 1");
}

// ============================================================================
// Sample-count invariant
// ============================================================================

static void test_verify_sample_counts(TestContext& ctx) {
    std::vector<ExpectedCell> expected = {{"s", "v", 2}};

    ctx.check(!throws_as<AggregationError>([&] {
                  verify_sample_counts({sample("s", "v", 1, 1), sample("s", "v", 2, 1)},
                                       expected);
              }),
              "exact counts accepted");
    ctx.check(throws_as<AggregationError>([&] {
                  verify_sample_counts({sample("s", "v", 1, 1)}, expected);
              }),
              "missing repetition rejected");
    ctx.check(throws_as<AggregationError>([&] {
                  verify_sample_counts({sample("s", "v", 1, 1), sample("s", "v", 1, 1)},
                                       expected);
              }),
              "duplicate repetition rejected");
    ctx.check(throws_as<AggregationError>([&] {
                  verify_sample_counts({sample("s", "v", 1, 1), sample("s", "v", 2, 1),
                                        sample("s", "other", 1, 1)},
                                       expected);
              }),
              "unexpected cell rejected");
}

// ============================================================================
// Process execution
// ============================================================================

static void test_process_capture(TestContext& ctx) {
    Environment env = current_environment();
    CommandResult r = run_command({"sh", "-c", "echo out; echo err >&2"}, ".", env, 10);
    ctx.check(r.ok(), "command succeeded");
    ctx.check_eq(r.stdout_text, "out\n", "stdout captured");
    ctx.check_eq(r.stderr_text, "err\n", "stderr captured");

    CommandResult bad = run_command_unchecked({"sh", "-c", "exit 7"}, ".", env, 10);
    ctx.check(bad.exit_code == 7 && !bad.ok(), "exit code reported");

    env["MODEBENCH_PROBE"] = "probe-value";
    CommandResult probe = run_command({"sh", "-c", "printf %s \"$MODEBENCH_PROBE\""}, ".",
                                      env, 10);
    ctx.check_eq(probe.stdout_text, "probe-value", "explicit environment passed");
    ctx.check(std::getenv("MODEBENCH_PROBE") == nullptr, "harness environment untouched");

    ScratchDir dir;
    CommandResult pwd = run_command({"pwd", "-P"}, dir.path().string(), env, 10);
    ctx.check_eq(trim(pwd.stdout_text), fs::canonical(dir.path()).string(), "cwd honoured");
}

static void test_process_errors(TestContext& ctx) {
    Environment env = current_environment();
    try {
        run_command({"sh", "-c", "echo partial; echo broken >&2; exit 4"}, ".", env, 10);
        ctx.check(false, "failing command should throw");
    } catch (const CommandError& e) {
        ctx.check(e.exit_code() == 4, "exit code kept");
        ctx.check_eq(e.stdout_text(), "partial\n", "stdout kept");
        ctx.check_eq(e.stderr_text(), "broken\n", "stderr kept");
        ctx.check(!e.timed_out(), "not a timeout");
        ctx.check(e.argv().size() == 3, "argv kept");
        ctx.check(contains(e.what(), "Command failed"), "message header");
        ctx.check(contains(e.what(), "exit: 4"), "message exit code");
    }

    try {
        run_command({"sh", "-c", "sleep 5"}, ".", env, 1);
        ctx.check(false, "slow command should time out");
    } catch (const CommandError& e) {
        ctx.check(e.timed_out(), "timeout flagged");
        ctx.check(contains(e.what(), "timed out after 1s"), "timeout message");
    }

    ctx.check(throws_as<CommandError>([&] {
                  run_command({"/nonexistent/modebench-binary"}, ".", env, 10);
              }),
              "missing executable is a command failure");

    ctx.check_eq(join_command({"git", "commit", "-m", "msg"}), "git commit -m msg",
                 "joined command line");
}

// ============================================================================
// Utilities
// ============================================================================

static void test_copy_tree_skip_locks(TestContext& ctx) {
    ScratchDir dir;
    const fs::path src = dir.path() / "src";
    write_text_file(src / "a.txt", "a\n");
    write_text_file(src / ".git" / "index", "idx\n");
    write_text_file(src / ".git" / "index.lock", "stale\n");
    write_text_file(src / ".git" / "refs" / "heads" / "main.lock", "stale\n");
    write_text_file(src / ".git" / "refs" / "heads" / "main", "sha\n");
    fs::create_symlink("a.txt", src / "link.txt");

    const fs::path dst = dir.path() / "dst";
    copy_tree_skip_locks(src, dst);

    ctx.check(fs::exists(dst / "a.txt"), "regular file copied");
    ctx.check(fs::exists(dst / ".git" / "index"), "nested file copied");
    ctx.check(fs::exists(dst / ".git" / "refs" / "heads" / "main"), "deep file copied");
    ctx.check(!fs::exists(dst / ".git" / "index.lock"), "lock file skipped");
    ctx.check(!fs::exists(dst / ".git" / "refs" / "heads" / "main.lock"), "nested lock skipped");
    ctx.check(fs::is_symlink(fs::symlink_status(dst / "link.txt")), "symlink preserved");

    ctx.check(throws_as<std::runtime_error>([&] {
                  copy_tree_skip_locks(dir.path() / "missing", dir.path() / "x");
              }),
              "missing source rejected");
}

static void test_text_helpers(TestContext& ctx) {
    ctx.check_eq(trim("  a b \t\n"), "a b", "trim");
    ctx.check(split("a\t\tb", '\t').size() == 3, "split keeps empty fields");
    ctx.check_eq(csv_field("plain"), "plain", "plain csv field");
    ctx.check_eq(csv_field("a,\"b\""), "\"a,\"\"b\"\"\"", "quoted csv field");
    ctx.check_eq(json_escape("a\"b\\c\n"), "a\\\"b\\\\c\\n", "json escape");
    ctx.check_eq(fixed(2.0 / 3.0, 3), "0.667", "fixed formatting");
}

// ============================================================================
// Sandbox
// ============================================================================

static void test_sandbox_wrapper_isolation(TestContext& ctx) {
    ScratchDir dir;
    fs::path variant_bin = write_fake_variant(dir.path());
    fs::path real_git    = write_fake_git(dir.path());

    const char* home_before = std::getenv("HOME");
    std::string ambient_home = home_before ? home_before : "";

    Sandbox sb({"fake_wrapper", "fake(wrapper)", variant_bin, Mode::Wrapper},
               dir.path() / "sb", real_git, 30);

    const char* home_after = std::getenv("HOME");
    ctx.check_eq(home_after ? home_after : "", ambient_home, "harness HOME unchanged");

    ctx.check_eq(sb.env().at("HOME"), sb.home_dir().string(), "child HOME redirected");
    ctx.check_eq(sb.env().at("GIT_CONFIG_GLOBAL"), (sb.home_dir() / ".gitconfig").string(),
                 "global config redirected");
    ctx.check(sb.env().at("PATH").starts_with(sb.bin_dir().string()),
              "sandbox bin first on PATH");
    ctx.check_eq(sb.git_binary().string(), (sb.bin_dir() / "git").string(),
                 "wrapper mode dispatches through bin/git");
    ctx.check(!fs::exists(sb.hooks_dir()), "no hooks in wrapper mode");

    CommandResult r = sb.run_git({"status"}, sb.root());
    ctx.check_eq(r.stdout_text, "variant:git:status\n", "git invocation reaches the variant");

    CommandResult direct = sb.run_variant_binary({"checkpoint"}, sb.root());
    ctx.check_eq(direct.stdout_text, "variant:fake-git-ai:checkpoint\n",
                 "variant binary invoked directly");

    ctx.check(throws_as<CommandError>([&] { sb.run_git({"fail-now"}, sb.root()); }),
              "failing git is fatal");
}

static bool path_within(const fs::path& path, const fs::path& root) {
    const std::string p = fs::weakly_canonical(path).string() + "/";
    const std::string r = fs::weakly_canonical(root).string() + "/";
    return p.starts_with(r);
}

static void test_sandbox_cross_variant_isolation(TestContext& ctx) {
    ScratchDir dir;
    fs::path variant_bin = write_fake_variant(dir.path());
    fs::path real_git    = write_fake_git(dir.path());

    Sandbox first({"fake_wrapper", "fake(wrapper)", variant_bin, Mode::Wrapper},
                  dir.path() / "work" / "first", real_git, 30);
    Sandbox second({"fake_hooks", "fake(hooks)", variant_bin, Mode::Hooks},
                   dir.path() / "work" / "second", real_git, 30);

    ctx.check(!path_within(first.root(), second.root()) &&
                  !path_within(second.root(), first.root()),
              "sandbox roots are disjoint");

    for (const Sandbox* sb : {&first, &second}) {
        ctx.check_eq(sb->env().at("HOME"), sb->home_dir().string(),
                     sb->variant().key + " HOME is its own");
        ctx.check(path_within(sb->env().at("GIT_CONFIG_GLOBAL"), sb->home_dir()),
                  sb->variant().key + " global config is its own");
        ctx.check(sb->env().at("PATH").starts_with(sb->bin_dir().string() + ":"),
                  sb->variant().key + " PATH starts at its own bin");
        ctx.check(path_within(sb->home_dir(), sb->root()) &&
                      path_within(sb->bin_dir(), sb->root()),
                  sb->variant().key + " dirs live under its root");
    }
    ctx.check(first.env().at("HOME") != second.env().at("HOME"), "distinct homes");

    write_text_file(first.home_dir() / "leak.txt", "first only\n");
    write_text_file(first.bin_dir() / "leak-tool", "first only\n");
    ctx.check(!fs::exists(second.home_dir() / "leak.txt"), "home writes stay private");
    ctx.check(!fs::exists(second.bin_dir() / "leak-tool"), "bin writes stay private");

    ctx.check(!fs::exists(first.home_dir() / ".gitconfig"), "wrapper home has no hooks config");
    ctx.check(!throws_as<SandboxError>([&] { second.verify_hooks(); }),
              "neighbour does not disturb hook wiring");
}

static void test_sandbox_hooks_verification(TestContext& ctx) {
    ScratchDir dir;
    fs::path variant_bin = write_fake_variant(dir.path());
    fs::path real_git    = write_fake_git(dir.path());

    Sandbox sb({"fake_hooks", "fake(hooks)", variant_bin, Mode::Hooks},
               dir.path() / "sb", real_git, 30);
    ctx.check_eq(sb.git_binary().string(), real_git.string(), "hooks mode uses real git");
    ctx.check(!fs::exists(sb.bin_dir() / "git"), "no wrapper in hooks mode");

    int installed = 0;
    for (const char* hook : kManagedHookNames) {
        if (fs::exists(sb.hooks_dir() / hook)) ++installed;
    }
    ctx.check(installed == 9, "all managed hooks installed");

    // Extra hook.
    write_text_file(sb.hooks_dir() / "pre-receive", "#!/bin/sh\n");
    ctx.check(throws_as<SandboxError>([&] { sb.verify_hooks(); }), "extra hook rejected");
    fs::remove(sb.hooks_dir() / "pre-receive");
    ctx.check(!throws_as<SandboxError>([&] { sb.verify_hooks(); }), "restored surface accepted");

    // Missing hook.
    fs::remove(sb.hooks_dir() / "post-commit");
    ctx.check(throws_as<SandboxError>([&] { sb.verify_hooks(); }), "missing hook rejected");
    create_link_or_copy(variant_bin, sb.hooks_dir() / "post-commit");

    // Hooks path pointing elsewhere.
    const fs::path config = sb.home_dir() / ".gitconfig";
    write_text_file(config, "[core]\n\thooksPath = " + dir.path().string() + "\n");
    ctx.check(throws_as<SandboxError>([&] { sb.verify_hooks(); }), "foreign hooks path rejected");

    // Hooks path unset.
    write_text_file(config, "[core]\n");
    ctx.check(throws_as<SandboxError>([&] { sb.verify_hooks(); }), "unset hooks path rejected");
}

// ============================================================================
// Scenario matrix
// ============================================================================

static std::vector<Scenario> fake_scenarios(std::shared_ptr<int> copies_seen) {
    auto setup = [](const Sandbox&, const fs::path& tmpl) {
        write_text_file(tmpl / "a.txt", "template\n");
        write_text_file(tmpl / "index.lock", "stale\n");
    };
    auto measure = [copies_seen](const Sandbox& sb, const fs::path& run, int) {
        if (fs::exists(run / "a.txt") && !fs::exists(run / "index.lock")) ++*copies_seen;
        sb.run_variant_binary({"measure"}, run);
    };
    return {
        {"fake_basic", "fake basic scenario", Complexity::Basic, setup, measure},
        {"fake_complex", "fake complex scenario", Complexity::Complex, setup, measure},
    };
}

static std::vector<Variant> fake_variants(const fs::path& bin) {
    return {
        {"fake_a", "fake(a)", bin, Mode::Wrapper},
        {"fake_b", "fake(b)", bin, Mode::Wrapper},
    };
}

static void test_matrix_collect(TestContext& ctx) {
    ScratchDir dir;
    fs::path variant_bin = write_fake_variant(dir.path());
    fs::path real_git    = write_fake_git(dir.path());

    auto seen = std::make_shared<int>(0);
    MatrixOptions opts;
    opts.work_root          = dir.path() / "work";
    opts.real_git           = real_git;
    opts.iterations_basic   = 2;
    opts.iterations_complex = 3;
    opts.timeout_s          = 30;

    ScenarioMatrix matrix(fake_scenarios(seen), fake_variants(variant_bin), opts);
    ctx.check(matrix.expected_cells().size() == 4, "2 scenarios x 2 variants");

    std::vector<RunResult> results = matrix.collect();
    ctx.check(results.size() == 10, "2*2 basic + 2*3 complex samples");
    ctx.check(*seen == 10, "each run saw a fresh lock-free copy of the template");

    int complex_reps = 0;
    for (const auto& r : results) {
        ctx.check(r.duration_ms >= 0.0, "non-negative duration");
        if (r.scenario == "fake_complex" && r.variant == "fake_b") ++complex_reps;
    }
    ctx.check(complex_reps == 3, "complex repetitions per variant");
    ctx.check_eq(results.front().complexity, "basic", "complexity recorded");
    ctx.check(results.back().repetition == 3, "1-based repetition index");

    ctx.check(!fs::exists(opts.work_root / "runs" / "fake_basic" / "fake_a" / "run_01"),
              "run directory removed");
    ctx.check(fs::exists(opts.work_root / "templates" / "fake_basic" / "fake_a" / "repo-template"),
              "template kept");

    std::vector<ScenarioInfo> info = matrix.scenarios();
    ctx.check(info.size() == 2 && info[1].complexity == "complex", "scenario info");
}

static void test_matrix_keep_artifacts(TestContext& ctx) {
    ScratchDir dir;
    fs::path variant_bin = write_fake_variant(dir.path());
    fs::path real_git    = write_fake_git(dir.path());

    MatrixOptions opts;
    opts.work_root          = dir.path() / "work";
    opts.real_git           = real_git;
    opts.iterations_basic   = 1;
    opts.iterations_complex = 1;
    opts.keep_artifacts     = true;

    auto scenarios = fake_scenarios(std::make_shared<int>(0));
    scenarios.resize(1);
    ScenarioMatrix matrix(scenarios, fake_variants(variant_bin), opts);
    matrix.collect();
    ctx.check(fs::exists(opts.work_root / "runs" / "fake_basic" / "fake_b" / "run_01" / "repo" /
                         "a.txt"),
              "run directory kept on request");

    MatrixOptions bad = opts;
    bad.iterations_basic = 0;
    ctx.check(throws_as<std::runtime_error>([&] {
                  ScenarioMatrix m(scenarios, fake_variants(variant_bin), bad);
              }),
              "zero iterations rejected");
}

static void test_matrix_failures(TestContext& ctx) {
    ScratchDir dir;
    fs::path variant_bin = write_fake_variant(dir.path());
    fs::path real_git    = write_fake_git(dir.path());

    MatrixOptions opts;
    opts.work_root          = dir.path() / "work";
    opts.real_git           = real_git;
    opts.iterations_basic   = 1;
    opts.iterations_complex = 1;

    auto ok_setup = [](const Sandbox&, const fs::path& tmpl) {
        fs::create_directories(tmpl);
    };
    auto failing_setup = [](const Sandbox& sb, const fs::path& tmpl) {
        fs::create_directories(tmpl);
        sb.run_variant_binary({"fail-now"}, tmpl);
    };
    auto failing_measure = [](const Sandbox& sb, const fs::path& run, int) {
        sb.run_variant_binary({"fail-now"}, run);
    };
    auto ok_measure = [](const Sandbox&, const fs::path&, int) {};

    ScenarioMatrix measure_fails(
        {{"bad_measure", "fails while timed", Complexity::Basic, ok_setup, failing_measure}},
        fake_variants(variant_bin), opts);
    try {
        measure_fails.collect();
        ctx.check(false, "measurement failure should throw");
    } catch (const MeasurementError& e) {
        ctx.check(contains(e.what(), "scenario=bad_measure"), "scenario named");
        ctx.check(contains(e.what(), "variant=fake_a"), "first variant named");
        ctx.check(contains(e.what(), "asked to fail"), "child stderr included");
    }

    ScenarioMatrix setup_fails(
        {{"bad_setup", "fails before timing", Complexity::Basic, failing_setup, ok_measure}},
        fake_variants(variant_bin), opts);
    ctx.check(throws_as<SetupError>([&] { setup_fails.collect(); }), "setup failure is fatal");

    ScenarioMatrix interrupted(
        {{"idle", "does nothing", Complexity::Basic, ok_setup, ok_measure}},
        fake_variants(variant_bin), opts);
    request_interrupt();
    bool stopped = throws_as<InterruptedError>([&] { interrupted.collect(); });
    clear_interrupt();
    ctx.check(stopped, "pending interrupt stops the matrix");
    ctx.check(!interrupt_requested(), "interrupt flag cleared");
}

// Runs the built-in scenarios against the system git through a pass-through
// wrapper.  Skipped when no git is installed.
static void test_scenario_library_real_git(TestContext& ctx) {
    const fs::path git = "/usr/bin/git";
    if (!fs::exists(git)) {
        std::cerr << "  SKIP: " << git.string() << " not found\n";
        return;
    }

    ScratchDir dir;
    fs::path passthrough = write_script(dir.path() / "passthrough-git-ai",
                                        "#!/bin/sh\n"
                                        "if [ \"$(basename \"$0\")\" != \"git\" ]; then\n"
                                        "  exit 0\n"
                                        "fi\n"
                                        "exec " + git.string() + " \"$@\"\n");

    MatrixOptions opts;
    opts.work_root          = dir.path() / "work";
    opts.real_git           = git;
    opts.iterations_basic   = 1;
    opts.iterations_complex = 1;
    opts.timeout_s          = 120;

    ScenarioMatrix matrix(scenario_library(),
                          {{"passthrough_wrapper", "passthrough(wrapper)", passthrough,
                            Mode::Wrapper}},
                          opts);
    std::vector<RunResult> results = matrix.collect();
    ctx.check(results.size() == 8, "one sample per built-in scenario");
}

// ============================================================================
// External script source
// ============================================================================

static void test_parse_results_tsv(TestContext& ctx) {
    ScratchDir dir;
    const fs::path tsv = dir.path() / "results.tsv";

    write_text_file(tsv,
                    "scenario\tstatus\tduration_s\tsaved_logs\thead_note\r\n"
                    "zz_last\tok\t2.5\t4\tnote one\r\n"
                    "aa_first\tconflict\t\t0\t\r\n"
                    "\tok\t1\t0\tignored\n"
                    "zz_last\tok\t3.25\t5\tnote two\n");
    std::vector<ScriptResultRow> rows = parse_results_tsv(tsv);
    ctx.check(rows.size() == 2, "blank scenarios skipped, duplicates merged");
    ctx.check_eq(rows[0].scenario, "aa_first", "rows sorted by scenario");
    ctx.check_near(rows[0].duration_s, 0.0, 1e-12, "empty duration is zero");
    ctx.check_eq(rows[0].status, "conflict", "status kept");
    ctx.check_near(rows[1].duration_s, 3.25, 1e-12, "last duplicate wins");
    ctx.check(rows[1].saved_logs == 5, "saved logs parsed");
    ctx.check_eq(rows[1].head_note, "note two", "head note kept");

    write_text_file(tsv, "duration_s\tscenario\nfast\tx\n");
    ctx.check(throws_as<MeasurementError>([&] { parse_results_tsv(tsv); }),
              "malformed duration rejected");

    write_text_file(tsv, "scenario\tstatus\tduration_s\n");
    ctx.check(throws_as<MeasurementError>([&] { parse_results_tsv(tsv); }),
              "header-only file rejected");

    for (const char* bad : {"nan", "inf", "-inf", "-3", "1e400"}) {
        write_text_file(tsv, std::string("scenario\tduration_s\nx\t") + bad + "\n");
        ctx.check(throws_as<MeasurementError>([&] { parse_results_tsv(tsv); }),
                  std::string("duration '") + bad + "' rejected");
    }
    for (const char* bad : {"1e30", "-1", "2.5", "99999999999"}) {
        write_text_file(tsv, std::string("scenario\tduration_s\tsaved_logs\nx\t1\t") + bad +
                                 "\n");
        ctx.check(throws_as<MeasurementError>([&] { parse_results_tsv(tsv); }),
                  std::string("saved_logs '") + bad + "' rejected");
    }

    ctx.check(throws_as<MeasurementError>([&] {
                  parse_results_tsv(dir.path() / "absent.tsv");
              }),
              "missing file rejected");
}

static fs::path write_fake_rebase_script(const fs::path& dir) {
    return write_script(dir / "fake_rebases.sh",
                        "#!/usr/bin/env bash\n"
                        "set -e\n"
                        "work=\"\"\n"
                        "while [ $# -gt 0 ]; do\n"
                        "  case \"$1\" in\n"
                        "    --work-root) work=\"$2\"; shift 2 ;;\n"
                        "    *) shift ;;\n"
                        "  esac\n"
                        "done\n"
                        "mkdir -p \"$work/repo\"\n"
                        "printf 'scenario\\tstatus\\tduration_s\\tsaved_logs\\thead_note\\n'"
                        " > \"$work/results.tsv\"\n"
                        "printf 'merges\\tok\\t0.25\\t0\\t\\n' >> \"$work/results.tsv\"\n"
                        "printf 'linear\\tok\\t1.5\\t3\\tabc\\n' >> \"$work/results.tsv\"\n");
}

static void test_external_script_source(TestContext& ctx) {
    ScratchDir dir;
    fs::path variant_bin = write_fake_variant(dir.path());
    fs::path real_git    = write_fake_git(dir.path());

    ExternalScriptOptions opts;
    opts.work_root   = dir.path() / "work";
    opts.real_git    = real_git;
    opts.script      = write_fake_rebase_script(dir.path());
    opts.invoke_cwd  = dir.path();
    opts.seed_repo   = (dir.path() / "seed").string();
    opts.repetitions = 2;
    opts.timeout_s   = 60;

    ExternalScriptSource source(fake_variants(variant_bin), opts);
    std::vector<RunResult> results = source.collect();

    ctx.check(results.size() == 8, "2 scenarios x 2 variants x 2 repetitions");
    std::vector<ScenarioInfo> info = source.scenarios();
    ctx.check(info.size() == 2 && info[0].key == "linear", "scenarios discovered in order");

    bool found = false;
    for (const auto& r : results) {
        if (r.scenario == "linear" && r.variant == "fake_b" && r.repetition == 2) {
            found = true;
            ctx.check_near(r.duration_ms, 1500.0, 1e-9, "seconds converted to ms");
            ctx.check(r.external && r.status == "ok", "script status kept");
            ctx.check(r.saved_logs == 3 && r.head_note == "abc", "script extras kept");
        }
    }
    ctx.check(found, "linear/fake_b/rep 2 present");

    ctx.check(!fs::exists(opts.work_root / "runs" / "fake_a" / "rep_01" / "benchmark" / "repo"),
              "benchmark repo removed");
    ctx.check(fs::exists(opts.work_root / "runs" / "fake_a" / "rep_01" / "benchmark" /
                         "results.tsv"),
              "results kept");

    Sandbox probe(fake_variants(variant_bin)[0], dir.path() / "probe", real_git);
    std::vector<std::string> argv = source.script_command(probe, dir.path() / "bench");
    ctx.check_eq(argv[0], "bash", "script run through bash");
    ctx.check_eq(argv[argv.size() - 3], (probe.bin_dir() / "git").string(),
                 "git-bin is the sandbox wrapper");
    ctx.check_eq(argv.back(), variant_bin.string(), "git-ai-bin is the variant binary");

    ExternalScriptOptions missing = opts;
    missing.script = dir.path() / "nope.sh";
    ExternalScriptSource no_script(fake_variants(variant_bin), missing);
    ctx.check(throws_as<SetupError>([&] { no_script.collect(); }), "missing script rejected");
}

static void test_external_sandbox_timeout(TestContext& ctx) {
    ScratchDir dir;
    fs::path variant_bin = write_fake_variant(dir.path());
    // Answers the hooksPath query, but only after five seconds.
    fs::path slow_git = write_script(dir.path() / "slow-real-git",
                                     "#!/bin/sh\n"
                                     "sleep 5\n"
                                     "sed -n 's/^[[:space:]]*hooksPath = //p' "
                                     "\"$GIT_CONFIG_GLOBAL\"\n");

    ExternalScriptOptions opts;
    opts.work_root         = dir.path() / "work";
    opts.real_git          = slow_git;
    opts.script            = write_fake_rebase_script(dir.path());
    opts.invoke_cwd        = dir.path();
    opts.seed_repo         = (dir.path() / "seed").string();
    opts.sandbox_timeout_s = 1;

    ExternalScriptSource source({{"fake_hooks", "fake(hooks)", variant_bin, Mode::Hooks}},
                                opts);
    try {
        source.collect();
        ctx.check(false, "slow hook verification should time out");
    } catch (const SandboxError& e) {
        ctx.check(contains(e.what(), "timed out after 1s"), "sandbox honours its timeout");
    }
}

// ============================================================================
// Reports
// ============================================================================

static Report report_fixture(bool enforce) {
    std::vector<Variant> variants = default_variants("/m/git-ai", "/c/git-ai");
    std::vector<RunResult> results = {
        sample("commit_human", "main_wrapper", 1, 10),
        sample("commit_human", "current_wrapper", 1, 10),
        sample("commit_human", "current_hooks", 1, 14),
        sample("commit_human", "current_both", 1, 11),
        sample("orphan", "current_wrapper", 1, 5),
        sample("orphan", "current_hooks", 1, 5),
    };
    Summary summary = summarize(results);

    RunMetadata meta;
    meta.timestamp_utc   = "2026-01-01T00:00:00Z";
    meta.margin_baseline = "current_wrapper";
    meta.enforce_margin  = enforce;
    meta.command_line    = "modebench --iterations-basic 1";

    GateOptions gate_opts;
    gate_opts.enforce = enforce;
    GateResult gate = evaluate_gate(summary, gate_opts);

    std::vector<std::string> keys;
    for (const auto& v : variants) keys.push_back(v.key);

    return Report{meta,
                  variants,
                  {{"commit_human", "basic", "Human-only commit"},
                   {"orphan", "basic", "no main baseline"}},
                  results,
                  summary,
                  compute_slowdowns(summary, "main_wrapper"),
                  compute_aggregates(summary, "main_wrapper", keys),
                  gate};
}

static void test_render_csv(TestContext& ctx) {
    Report report = report_fixture(false);
    std::vector<std::string> lines = split(render_raw_csv(report.results), '\n');
    ctx.check_eq(lines[0], "scenario,complexity,variant,repetition,duration_ms", "csv header");
    ctx.check_eq(lines[1], "commit_human,basic,main_wrapper,1,10.000", "csv row");
    ctx.check(lines.size() == report.results.size() + 2, "one row per sample");

    std::vector<RunResult> external = report.results;
    external[0].external  = true;
    external[0].status    = "ok";
    external[0].head_note = "a,b";
    std::string ext = render_raw_csv(external);
    ctx.check(contains(ext, "duration_ms,status,saved_logs,head_note\n"), "external header");
    ctx.check(contains(ext, ",ok,0,\"a,b\"\n"), "external fields quoted");
}

static void test_render_json(TestContext& ctx) {
    std::string json = render_summary_json(report_fixture(true));
    ctx.check(contains(json, "\"slowdowns_pct_vs_main_wrapper\""), "slowdown key");
    ctx.check(contains(json, "\"runs_ms\": [10.000]"), "raw runs listed");
    ctx.check(contains(json, "\"geometric_mean_ratio\""), "aggregates present");
    ctx.check(contains(json, "\"margin_checks\""), "margin checks present");
    ctx.check(contains(json, "\"passed\": false"), "failing check recorded");
    ctx.check(contains(json, "\"exit_code\": 2"), "enforced exit code recorded");
    ctx.check(contains(json, "\"command_line\": \"modebench --iterations-basic 1\""),
              "command line recorded");
}

static void test_render_markdown(TestContext& ctx) {
    std::string md = render_markdown(report_fixture(false));
    ctx.check(contains(md, "# git-ai Mode Benchmark Report"), "title");
    ctx.check(contains(md, "## Exact Timings (ms)"), "exact timings section");
    ctx.check(contains(md, "## Median Summary (ms) and Slowdown vs"), "median section");
    ctx.check(contains(md, "| orphan | n/a |"), "missing baseline cell is n/a");
    ctx.check(contains(md, "## Aggregate Comparison"), "aggregate section");
    ctx.check(contains(md, "- Enforcement: `off`"), "enforcement line");
    ctx.check(contains(md, "| FAIL |"), "failing check row");
    ctx.check(contains(md, "| PASS |"), "passing check row");
    ctx.check(contains(md, "- Overall: `2/3` checks passing"), "overall line");
    ctx.check(contains(md, "```bash\nmodebench --iterations-basic 1\n```"), "re-run block");

    Report nasty = report_fixture(false);
    nasty.metadata.family = "nasty";
    ctx.check(contains(render_markdown(nasty), "# git-ai Nasty Rebase Benchmark"),
              "nasty title");
}

// ============================================================================
// Command line
// ============================================================================

static void test_parse_args_defaults(TestContext& ctx) {
    Options o = parse({});
    ctx.check(o.family == Family::Modes, "default family");
    ctx.check(o.iterations_basic == 3 && o.iterations_complex == 3, "default iterations");
    ctx.check_near(o.margin_pct, 25.0, 1e-12, "default margin");
    ctx.check_eq(o.margin_baseline, "current_wrapper", "default margin baseline");
    ctx.check_eq(o.main_ref, "origin/main", "default main ref");
    ctx.check(!o.enforce_margin && o.recheck_hooks, "default flags");

    Options n = parse({"--family", "nasty", "--repetitions", "2", "--enforce-margin",
                       "--margin-pct", "12.5", "--margin-baseline", "main_wrapper",
                       "--feature-commits", "10", "--no-hook-recheck"});
    ctx.check(n.family == Family::Nasty, "nasty family");
    ctx.check(n.repetitions == 2 && n.feature_commits == 10, "nasty workload");
    ctx.check(n.enforce_margin && !n.recheck_hooks, "flags parsed");
    ctx.check_near(n.margin_pct, 12.5, 1e-12, "margin parsed");

    ctx.check(parse({"--selftest", "--iterations-basic", "0"}).selftest,
              "selftest skips validation");
}

static void test_parse_args_errors(TestContext& ctx) {
    ctx.check(parse_fails({"--iterations-basic", "0"}), "zero iterations");
    ctx.check(parse_fails({"--iterations-complex", "3x"}), "trailing junk");
    ctx.check(parse_fails({"--repetitions", "-1"}), "negative repetitions");
    ctx.check(parse_fails({"--margin-pct", "-5"}), "negative margin");
    ctx.check(parse_fails({"--margin-baseline", "current_hooks"}), "bad margin baseline");
    ctx.check(parse_fails({"--timeout", "0"}), "zero timeout");
    ctx.check(parse_fails({"--family", "weird"}), "bad family");
    ctx.check(parse_fails({"--main-ref"}), "missing value");
    ctx.check(parse_fails({"--frobnicate"}), "unknown flag");
}

static void test_rerun_command(TestContext& ctx) {
    Options o;
    ctx.check_eq(rerun_command(o),
                 "modebench --iterations-basic 3 --iterations-complex 3 "
                 "--margin-pct 25 --margin-baseline current_wrapper",
                 "default re-run line");

    o.main_ref       = "origin/release";
    o.enforce_margin = true;
    std::string line = rerun_command(o);
    ctx.check(contains(line, " --main-ref origin/release"), "non-default main ref");
    ctx.check(line.ends_with(" --enforce-margin"), "enforcement flag");

    Options n;
    n.family = Family::Nasty;
    n.script = "/x/rebases.sh";
    std::string nasty = rerun_command(n);
    ctx.check(contains(nasty, "--family nasty --repetitions 1"), "nasty re-run");
    ctx.check(contains(nasty, " --script /x/rebases.sh"), "script path kept");
    ctx.check(!contains(nasty, "--repo-url"), "default repo url omitted");

    Options spaced;
    spaced.current_bin = "/x/my bin/git-ai";
    ctx.check(contains(rerun_command(spaced), " --current-bin '/x/my bin/git-ai'"),
              "paths with spaces are quoted");
}

static void test_rerun_command_reproduces_options(TestContext& ctx) {
    Options first = parse({"--margin-pct", "12.25", "--timeout", "60", "--no-hook-recheck",
                           "--current-bin", "/x/cur", "--main-bin", "/x/main",
                           "--repo-root", "/x/repo", "--keep-artifacts",
                           "--iterations-complex", "5"});
    std::string line = rerun_command(first);
    ctx.check(contains(line, " --margin-pct 12.25 "), "margin printed exactly");
    ctx.check(contains(line, " --timeout 60"), "timeout kept");
    ctx.check(contains(line, " --no-hook-recheck"), "hook recheck flag kept");

    std::vector<std::string> args = split(line, ' ');
    args.erase(args.begin());
    Options again = parse(args);
    ctx.check(again.margin_pct == first.margin_pct, "margin survives the round trip");
    ctx.check(again.timeout_s == 60, "timeout survives the round trip");
    ctx.check(!again.recheck_hooks, "recheck flag survives the round trip");
    ctx.check(again.keep_artifacts, "keep-artifacts survives the round trip");
    ctx.check(again.iterations_complex == 5, "iterations survive the round trip");
    ctx.check_eq(again.current_bin, "/x/cur", "current binary survives the round trip");
    ctx.check_eq(again.main_bin, "/x/main", "main binary survives the round trip");
    ctx.check_eq(again.repo_root, "/x/repo", "repo root survives the round trip");
    ctx.check_eq(rerun_command(again), line, "re-run line is a fixed point");

    Options tenth;
    tenth.margin_pct = 0.1;
    ctx.check(contains(rerun_command(tenth), " --margin-pct 0.1 "), "shortest exact form");
    tenth.margin_pct = 100.0;
    ctx.check(contains(rerun_command(tenth), " --margin-pct 100 "), "whole numbers stay plain");
}

// ============================================================================
// Test Entry Point
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Seed content and scenarios
    runner.run("seed_content",                test_seed_content);
    runner.run("scenario_file_names",         test_scenario_file_names);
    runner.run("scenario_library_shape",      test_scenario_library_shape);

    // Variants
    runner.run("variant_modes",               test_variant_modes);
    runner.run("default_variants",            test_default_variants);

    // Statistics and gate
    runner.run("stats_basics",                test_stats_basics);
    runner.run("summarize",                   test_summarize);
    runner.run("slowdowns_and_aggregates",    test_slowdowns_and_aggregates);
    runner.run("aggregates_unit_invariant",   test_aggregates_unit_invariant);
    runner.run("gate_boundaries",             test_gate_boundaries);
    runner.run("gate_baseline_and_errors",    test_gate_baseline_and_errors);
    runner.run("gate_end_to_end",             test_gate_end_to_end);
    runner.run("verify_sample_counts",        test_verify_sample_counts);

    // Processes and utilities
    runner.run("process_capture",             test_process_capture);
    runner.run("process_errors",              test_process_errors);
    runner.run("copy_tree_skip_locks",        test_copy_tree_skip_locks);
    runner.run("text_helpers",                test_text_helpers);

    // Sandbox
    runner.run("sandbox_wrapper_isolation",   test_sandbox_wrapper_isolation);
    runner.run("sandbox_hooks_verification",  test_sandbox_hooks_verification);
    runner.run("sandbox_cross_variant",       test_sandbox_cross_variant_isolation);

    // Sample sources
    runner.run("matrix_collect",              test_matrix_collect);
    runner.run("matrix_keep_artifacts",       test_matrix_keep_artifacts);
    runner.run("matrix_failures",             test_matrix_failures);
    runner.run("scenario_library_real_git",   test_scenario_library_real_git);
    runner.run("parse_results_tsv",           test_parse_results_tsv);
    runner.run("external_script_source",      test_external_script_source);
    runner.run("external_sandbox_timeout",    test_external_sandbox_timeout);

    // Reports and command line
    runner.run("render_csv",                  test_render_csv);
    runner.run("render_json",                 test_render_json);
    runner.run("render_markdown",             test_render_markdown);
    runner.run("parse_args_defaults",         test_parse_args_defaults);
    runner.run("parse_args_errors",           test_parse_args_errors);
    runner.run("rerun_command",               test_rerun_command);
    runner.run("rerun_reproduces_options",    test_rerun_command_reproduces_options);

    return runner.summarise();
}

}  // namespace modebench
