// ============================================================================
// modebench/report.hpp — Artifact rendering (CSV, JSON, Markdown)
// ============================================================================
//
// The reporter formats what the statistics engine and the gate computed;
// it never recomputes a statistic.  All three artifacts are rendered from
// one Report value and written into <work>/artifacts/<YYYYmmdd-HHMMSS>/.
//
// ============================================================================

#ifndef MODEBENCH_REPORT_HPP
#define MODEBENCH_REPORT_HPP

#include "modebench/gate.hpp"
#include "modebench/run_result.hpp"
#include "modebench/stats.hpp"
#include "modebench/variant.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace modebench {

namespace fs = std::filesystem;

// ── RunMetadata ─────────────────────────────────────────────────────────────

struct RunMetadata {
    std::string timestamp_utc;
    std::string family = "modes";           // "modes" | "nasty"
    std::string repo_root;
    std::string branch;
    std::string branch_sha;
    std::string main_ref;
    std::string main_sha;
    std::string real_git;

    int         iterations_basic   = 0;
    int         iterations_complex = 0;
    int         repetitions        = 0;     // external family
    double      margin_pct         = 25.0;
    std::string margin_baseline;
    std::string slowdown_baseline = "main_wrapper";
    bool        enforce_margin = false;

    // External family workload.
    std::string repo_url;
    std::string seed_repo_head;
    int feature_commits = 0;
    int main_commits    = 0;
    int side_commits    = 0;
    int files           = 0;
    int lines_per_file  = 0;
    int burst_every     = 0;

    std::string host_uname;
    std::string cpu_model;
    std::string cpu_cores;

    std::string command_line;               // re-invocation line
};

/// Fill the host fields (uname, CPU model, core count), best effort.
void fill_host_info(RunMetadata& meta);

// ── Report ──────────────────────────────────────────────────────────────────

struct Report {
    RunMetadata                 metadata;
    std::vector<Variant>        variants;
    std::vector<ScenarioInfo>   scenarios;
    std::vector<RunResult>      results;
    Summary                     summary;
    std::vector<Slowdown>       slowdowns;
    std::vector<AggregateRatio> aggregates;
    GateResult                  gate;
};

/// raw_results.csv content.
std::string render_raw_csv(const std::vector<RunResult>& results);

/// summary.json content.
std::string render_summary_json(const Report& report);

/// report.md content.
std::string render_markdown(const Report& report);

struct ArtifactPaths {
    fs::path dir;
    fs::path csv;
    fs::path json;
    fs::path markdown;
};

/// Write the three artifacts into `dir` (created if missing).
ArtifactPaths write_artifacts(const Report& report, const fs::path& dir);

/// Print the closing summary and, when enforced, the failing checks.
void print_completion(const Report& report, const ArtifactPaths& paths);

}  // namespace modebench

#endif  // MODEBENCH_REPORT_HPP
