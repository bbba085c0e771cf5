// ============================================================================
// matrix.cpp — Scenario matrix and external-script sample sources
// ============================================================================

#include "modebench/matrix.hpp"
#include "modebench/errors.hpp"
#include "modebench/interrupt.hpp"
#include "modebench/utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

namespace modebench {

static std::string numbered_dir(const char* prefix, int index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s_%02d", prefix, index);
    return buf;
}

// ── verify_sample_counts ────────────────────────────────────────────────────

void verify_sample_counts(const std::vector<RunResult>& results,
                          const std::vector<ExpectedCell>& expected) {
    using Cell = std::pair<std::string, std::string>;

    std::map<Cell, int> wanted;
    for (const auto& e : expected) wanted[{e.scenario, e.variant}] = e.repetitions;

    std::map<Cell, std::vector<int>> seen;
    for (const auto& r : results) {
        Cell cell{r.scenario, r.variant};
        if (wanted.find(cell) == wanted.end()) {
            throw AggregationError("Unexpected sample for scenario=" + r.scenario +
                                   " variant=" + r.variant);
        }
        seen[cell].push_back(r.repetition);
    }

    for (const auto& [cell, n] : wanted) {
        std::vector<int> reps = seen[cell];
        std::sort(reps.begin(), reps.end());
        bool exact = static_cast<int>(reps.size()) == n;
        for (std::size_t i = 0; exact && i < reps.size(); ++i) {
            exact = reps[i] == static_cast<int>(i) + 1;
        }
        if (!exact) {
            throw AggregationError("Sample count mismatch for scenario=" + cell.first +
                                   " variant=" + cell.second + ": expected " +
                                   std::to_string(n) + ", got " +
                                   std::to_string(reps.size()));
        }
    }
}

// ── ScenarioMatrix ──────────────────────────────────────────────────────────

ScenarioMatrix::ScenarioMatrix(std::vector<Scenario> scenarios,
                               std::vector<Variant> variants,
                               MatrixOptions options)
    : scenarios_(std::move(scenarios)),
      variants_(std::move(variants)),
      options_(std::move(options)) {
    if (options_.iterations_basic <= 0 || options_.iterations_complex <= 0) {
        throw std::runtime_error("Iterations must be positive integers.");
    }
}

int ScenarioMatrix::repetitions_for(const Scenario& scenario) const noexcept {
    return scenario.complexity == Complexity::Basic ? options_.iterations_basic
                                                    : options_.iterations_complex;
}

std::vector<ScenarioInfo> ScenarioMatrix::scenarios() const {
    std::vector<ScenarioInfo> out;
    for (const auto& s : scenarios_) {
        out.push_back({s.key, complexity_to_string(s.complexity), s.description});
    }
    return out;
}

std::vector<ExpectedCell> ScenarioMatrix::expected_cells() const {
    std::vector<ExpectedCell> out;
    for (const auto& s : scenarios_) {
        for (const auto& v : variants_) {
            out.push_back({s.key, v.key, repetitions_for(s)});
        }
    }
    return out;
}

std::vector<RunResult> ScenarioMatrix::collect() {
    fs::create_directories(options_.work_root / "templates");
    fs::create_directories(options_.work_root / "runs");

    std::vector<RunResult> results;
    for (const auto& scenario : scenarios_) {
        for (const auto& variant : variants_) {
            throw_if_interrupted("scenario=" + scenario.key + " variant=" + variant.key);
            run_cell(scenario, variant, results);
        }
    }

    verify_sample_counts(results, expected_cells());
    return results;
}

void ScenarioMatrix::run_cell(const Scenario& scenario, const Variant& variant,
                              std::vector<RunResult>& out) const {
    const fs::path cell_root = options_.work_root / "templates" / scenario.key / variant.key;
    remove_tree(cell_root);
    fs::create_directories(cell_root);

    Sandbox sandbox(variant, cell_root, options_.real_git, options_.timeout_s);
    const fs::path template_repo = sandbox.root() / "repo-template";

    std::cout << "[setup] scenario=" << scenario.key
              << " variant=" << variant.key << std::endl;
    try {
        scenario.setup(sandbox, template_repo);
    } catch (const CommandError& e) {
        throw SetupError("Scenario setup failed\n"
                         "scenario=" + scenario.key + "\n"
                         "variant=" + variant.key + "\n" + e.what());
    }

    const int iterations = repetitions_for(scenario);
    for (int rep = 1; rep <= iterations; ++rep) {
        throw_if_interrupted("scenario=" + scenario.key + " variant=" + variant.key +
                             " run=" + std::to_string(rep));

        const fs::path run_dir = options_.work_root / "runs" / scenario.key /
                                 variant.key / numbered_dir("run", rep);
        remove_tree(run_dir);
        fs::create_directories(run_dir);
        const fs::path run_repo = run_dir / "repo";
        copy_tree_skip_locks(template_repo, run_repo);

        if (options_.recheck_hooks && installs_hooks(variant.mode)) {
            sandbox.verify_hooks();
        }

        const auto t0 = std::chrono::steady_clock::now();
        try {
            scenario.measure(sandbox, run_repo, rep);
        } catch (const CommandError& e) {
            throw MeasurementError("Measured operation failed\n"
                                   "scenario=" + scenario.key + "\n"
                                   "variant=" + variant.key + "\n"
                                   "run=" + std::to_string(rep) + "\n" + e.what());
        }
        const auto t1 = std::chrono::steady_clock::now();
        const double duration_ms =
            std::chrono::duration<double, std::milli>(t1 - t0).count();

        RunResult r;
        r.scenario    = scenario.key;
        r.complexity  = complexity_to_string(scenario.complexity);
        r.variant     = variant.key;
        r.repetition  = rep;
        r.duration_ms = duration_ms;
        out.push_back(std::move(r));

        std::cout << "[run] scenario=" << scenario.key << " variant=" << variant.key
                  << " run=" << rep << "/" << iterations
                  << " duration_ms=" << fixed(duration_ms, 3) << std::endl;

        if (!options_.keep_artifacts) remove_tree(run_dir);
    }
}

// ── parse_results_tsv ───────────────────────────────────────────────────────

static double parse_seconds(const std::string& text, const fs::path& path,
                            const std::string& scenario) {
    if (text.empty()) return 0.0;
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    // nan, inf and negative durations are as unusable as garbage.
    if (used != text.size() || !std::isfinite(value) || value < 0.0) {
        throw MeasurementError("Malformed duration_s '" + text + "' for scenario " +
                               scenario + " in " + path.string());
    }
    return value;
}

static int parse_count(const std::string& text, const fs::path& path,
                       const std::string& scenario) {
    if (text.empty()) return 0;
    std::size_t used = 0;
    long long value = -1;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != text.size() || value < 0 || value > std::numeric_limits<int>::max()) {
        throw MeasurementError("Malformed saved_logs '" + text + "' for scenario " +
                               scenario + " in " + path.string());
    }
    return static_cast<int>(value);
}

std::vector<ScriptResultRow> parse_results_tsv(const fs::path& path) {
    if (!fs::exists(path)) {
        throw MeasurementError("Missing results TSV: " + path.string());
    }

    std::vector<std::string> lines = read_lines(path.string());
    if (lines.empty()) {
        throw MeasurementError("No scenario rows parsed from " + path.string());
    }

    auto strip_cr = [](std::string s) {
        if (!s.empty() && s.back() == '\r') s.pop_back();
        return s;
    };

    // Column positions from the header; absent columns read as empty.
    std::map<std::string, std::size_t> column;
    std::vector<std::string> header = split(strip_cr(lines[0]), '\t');
    for (std::size_t i = 0; i < header.size(); ++i) column[trim(header[i])] = i;

    auto field = [&](const std::vector<std::string>& cells, const char* name) {
        auto it = column.find(name);
        if (it == column.end() || it->second >= cells.size()) return std::string();
        return trim(cells[it->second]);
    };

    std::map<std::string, ScriptResultRow> rows;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        std::string line = strip_cr(lines[i]);
        if (line.empty()) continue;
        std::vector<std::string> cells = split(line, '\t');

        ScriptResultRow row;
        row.scenario = field(cells, "scenario");
        if (row.scenario.empty()) continue;
        row.status     = field(cells, "status");
        row.duration_s = parse_seconds(field(cells, "duration_s"), path, row.scenario);
        row.saved_logs = parse_count(field(cells, "saved_logs"), path, row.scenario);
        row.head_note  = field(cells, "head_note");
        rows[row.scenario] = std::move(row);
    }

    if (rows.empty()) {
        throw MeasurementError("No scenario rows parsed from " + path.string());
    }

    std::vector<ScriptResultRow> out;
    out.reserve(rows.size());
    for (auto& [key, row] : rows) out.push_back(std::move(row));
    return out;
}

// ── ExternalScriptSource ────────────────────────────────────────────────────

ExternalScriptSource::ExternalScriptSource(std::vector<Variant> variants,
                                           ExternalScriptOptions options)
    : variants_(std::move(variants)), options_(std::move(options)) {
    if (options_.repetitions <= 0) {
        throw std::runtime_error("--repetitions must be positive");
    }
}

std::vector<ScenarioInfo> ExternalScriptSource::scenarios() const {
    std::vector<ScenarioInfo> out;
    for (const auto& key : scenario_keys_) {
        out.push_back({key, "complex", "external script scenario"});
    }
    return out;
}

std::vector<std::string> ExternalScriptSource::script_command(
    const Sandbox& sandbox, const fs::path& benchmark_dir) const {
    return {
        "bash", options_.script.string(),
        "--repo-url", options_.seed_repo,
        "--work-root", benchmark_dir.string(),
        "--feature-commits", std::to_string(options_.feature_commits),
        "--main-commits", std::to_string(options_.main_commits),
        "--side-commits", std::to_string(options_.side_commits),
        "--files", std::to_string(options_.files),
        "--lines-per-file", std::to_string(options_.lines_per_file),
        "--burst-every", std::to_string(options_.burst_every),
        "--git-bin", sandbox.git_binary().string(),
        "--git-ai-bin", sandbox.variant().binary.string(),
    };
}

std::vector<RunResult> ExternalScriptSource::collect() {
    if (!fs::exists(options_.script)) {
        throw SetupError("Missing benchmark script: " + options_.script.string());
    }

    std::vector<RunResult> results;
    std::set<std::string>  first_keys;
    bool have_first = false;

    for (const auto& variant : variants_) {
        for (int rep = 1; rep <= options_.repetitions; ++rep) {
            throw_if_interrupted("variant=" + variant.key +
                                 " repetition=" + std::to_string(rep));

            const fs::path rep_root =
                options_.work_root / "runs" / variant.key / numbered_dir("rep", rep);
            remove_tree(rep_root);
            fs::create_directories(rep_root);

            Sandbox sandbox(variant, rep_root / "runtime", options_.real_git,
                            options_.sandbox_timeout_s);
            const fs::path benchmark_dir = rep_root / "benchmark";

            std::cout << "[variant-run] variant=" << variant.key
                      << " repetition=" << rep << "/" << options_.repetitions
                      << std::endl;
            try {
                run_command(script_command(sandbox, benchmark_dir),
                            options_.invoke_cwd.string(), sandbox.env(),
                            options_.timeout_s);
            } catch (const CommandError& e) {
                throw MeasurementError("External benchmark script failed\n"
                                       "variant=" + variant.key + "\n"
                                       "repetition=" + std::to_string(rep) + "\n" +
                                       e.what());
            }

            std::vector<ScriptResultRow> rows =
                parse_results_tsv(benchmark_dir / "results.tsv");

            std::set<std::string> keys;
            for (const auto& row : rows) keys.insert(row.scenario);
            if (!have_first) {
                first_keys = keys;
                have_first = true;
                for (const auto& row : rows) scenario_keys_.push_back(row.scenario);
            } else if (keys != first_keys) {
                throw AggregationError("Scenario set of variant=" + variant.key +
                                       " repetition=" + std::to_string(rep) +
                                       " differs from the first repetition");
            }

            for (const auto& row : rows) {
                RunResult r;
                r.scenario    = row.scenario;
                r.complexity  = "complex";
                r.variant     = variant.key;
                r.repetition  = rep;
                r.duration_ms = row.duration_s * 1000.0;
                r.external    = true;
                r.status      = row.status;
                r.saved_logs  = row.saved_logs;
                r.head_note   = row.head_note;
                results.push_back(std::move(r));

                std::cout << "[variant-result] variant=" << variant.key
                          << " rep=" << rep << " scenario=" << row.scenario
                          << " status=" << row.status
                          << " duration_s=" << fixed(row.duration_s, 3) << std::endl;
            }

            if (!options_.keep_artifacts) remove_tree(benchmark_dir / "repo");
        }
    }

    std::vector<ExpectedCell> expected;
    for (const auto& key : scenario_keys_) {
        for (const auto& v : variants_) expected.push_back({key, v.key, options_.repetitions});
    }
    verify_sample_counts(results, expected);
    return results;
}

}  // namespace modebench
