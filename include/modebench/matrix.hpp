// ============================================================================
// modebench/matrix.hpp — Sample sources (scenario matrix, external script)
// ============================================================================
//
// A SampleSource runs every (scenario, variant, repetition) cell it owns
// and returns one RunResult per cell.  Any failure aborts the whole
// collection; no partial result set ever reaches the statistics engine.
//
// Two implementations:
//
//   ScenarioMatrix        in-process scenarios from the scenario library,
//                         one template per (scenario, variant), a fresh
//                         copy per repetition, monotonic timing around
//                         measure() only
//   ExternalScriptSource  runs an external benchmark script once per
//                         (variant, repetition) and reads its results.tsv
//
// ============================================================================

#ifndef MODEBENCH_MATRIX_HPP
#define MODEBENCH_MATRIX_HPP

#include "modebench/run_result.hpp"
#include "modebench/sandbox.hpp"
#include "modebench/scenario.hpp"
#include "modebench/variant.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace modebench {

namespace fs = std::filesystem;

// ── SampleSource ────────────────────────────────────────────────────────────

class SampleSource {
public:
    virtual ~SampleSource() = default;

    /// Run every cell.  Throws on the first failure.
    virtual std::vector<RunResult> collect() = 0;

    /// Scenarios covered, in execution order.  For sources that discover
    /// their scenarios while running, valid only after collect().
    virtual std::vector<ScenarioInfo> scenarios() const = 0;
};

// ── Sample-count verification ───────────────────────────────────────────────

struct ExpectedCell {
    std::string scenario;
    std::string variant;
    int         repetitions = 0;
};

/// Every expected cell must appear exactly `repetitions` times with
/// repetition indices 1..N, and nothing else may appear.
/// Throws AggregationError.
void verify_sample_counts(const std::vector<RunResult>& results,
                          const std::vector<ExpectedCell>& expected);

// ── ScenarioMatrix ──────────────────────────────────────────────────────────

struct MatrixOptions {
    fs::path work_root;                 // templates/ and runs/ live here
    fs::path real_git;
    int      iterations_basic   = 3;
    int      iterations_complex = 3;
    int      timeout_s          = kDefaultCommandTimeoutS;
    bool     keep_artifacts     = false;
    bool     recheck_hooks      = true; // verify hook wiring per repetition
};

class ScenarioMatrix : public SampleSource {
public:
    ScenarioMatrix(std::vector<Scenario> scenarios, std::vector<Variant> variants,
                   MatrixOptions options);

    std::vector<RunResult> collect() override;
    std::vector<ScenarioInfo> scenarios() const override;

    int repetitions_for(const Scenario& scenario) const noexcept;

    /// The cross product this matrix is expected to produce.
    std::vector<ExpectedCell> expected_cells() const;

private:
    void run_cell(const Scenario& scenario, const Variant& variant,
                  std::vector<RunResult>& out) const;

    std::vector<Scenario> scenarios_;
    std::vector<Variant>  variants_;
    MatrixOptions         options_;
};

// ── ExternalScriptSource ────────────────────────────────────────────────────

inline constexpr int kExternalScriptTimeoutS = 14400;

struct ExternalScriptOptions {
    fs::path work_root;        // runs/<variant>/rep_NN live here
    fs::path real_git;
    fs::path script;
    fs::path invoke_cwd;       // working directory of the script
    std::string seed_repo;     // path or URL handed to --repo-url
    int repetitions       = 1;
    int feature_commits   = 90;
    int main_commits      = 35;
    int side_commits      = 25;
    int files             = 6;
    int lines_per_file    = 1500;
    int burst_every       = 15;
    int timeout_s         = kExternalScriptTimeoutS;   // whole script
    int sandbox_timeout_s = kDefaultCommandTimeoutS;   // sandbox git commands
    bool keep_artifacts   = false;
};

/// One row of the script's results.tsv.
struct ScriptResultRow {
    std::string scenario;
    std::string status;
    double      duration_s = 0.0;
    int         saved_logs = 0;
    std::string head_note;
};

/// Parse a tab-separated results file with a header row naming at least
/// `scenario` and `duration_s`.  Rows are returned sorted by scenario; a
/// repeated scenario keeps its last row.  Throws MeasurementError when the
/// file is missing, has no rows, or a duration is malformed.
std::vector<ScriptResultRow> parse_results_tsv(const fs::path& path);

class ExternalScriptSource : public SampleSource {
public:
    ExternalScriptSource(std::vector<Variant> variants, ExternalScriptOptions options);

    std::vector<RunResult> collect() override;
    std::vector<ScenarioInfo> scenarios() const override;

    /// The argv used for one (variant, repetition).
    std::vector<std::string> script_command(const Sandbox& sandbox,
                                            const fs::path& benchmark_dir) const;

private:
    std::vector<Variant>     variants_;
    ExternalScriptOptions    options_;
    std::vector<std::string> scenario_keys_;
};

}  // namespace modebench

#endif  // MODEBENCH_MATRIX_HPP
