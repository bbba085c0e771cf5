// ============================================================================
// modebench/stats.hpp — Statistics engine
// ============================================================================
//
// Pure functions over the collected RunResults.  Nothing here rounds;
// rounding is a formatting concern of the reporter.
//
// Cross-scenario comparison uses the geometric mean of per-scenario
// ratios (variant median / baseline median), so one slow scenario cannot
// dominate the aggregate.
//
// ============================================================================

#ifndef MODEBENCH_STATS_HPP
#define MODEBENCH_STATS_HPP

#include "modebench/run_result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace modebench {

// ── Scalar statistics ───────────────────────────────────────────────────────

/// Median of the samples (average of the two middle values for an even
/// count).  Throws AggregationError on an empty input.
double median(std::vector<double> samples);

/// Arithmetic mean.  Throws AggregationError on an empty input.
double mean(const std::vector<double>& samples);

/// Population standard deviation; 0 for fewer than two samples.
double population_stdev(const std::vector<double>& samples);

/// exp(mean(log(v))); 1.0 for an empty list.  All values must be > 0.
double geometric_mean(const std::vector<double>& values);

// ── Summary ─────────────────────────────────────────────────────────────────

struct ScenarioVariantSummary {
    std::string         scenario;
    std::string         variant;
    std::vector<double> samples_ms;   // repetition order
    double              median_ms = 0.0;
    double              mean_ms   = 0.0;
    double              min_ms    = 0.0;
    double              max_ms    = 0.0;
    double              stdev_ms  = 0.0;
};

class Summary {
public:
    /// Insert or replace the entry for (entry.scenario, entry.variant).
    void add(ScenarioVariantSummary entry);

    /// nullptr when the pair has no samples.
    const ScenarioVariantSummary* find(const std::string& scenario,
                                       const std::string& variant) const noexcept;

    /// Scenario keys in first-seen order.
    const std::vector<std::string>& scenarios() const noexcept { return scenarios_; }

    /// Variant keys in first-seen order.
    const std::vector<std::string>& variants() const noexcept { return variants_; }

    const std::vector<ScenarioVariantSummary>& entries() const noexcept { return entries_; }

    bool empty() const noexcept { return entries_.empty(); }

private:
    std::vector<ScenarioVariantSummary> entries_;
    std::vector<std::string>            scenarios_;
    std::vector<std::string>            variants_;
};

/// Group results by (scenario, variant) and compute per-group statistics.
Summary summarize(const std::vector<RunResult>& results);

// ── Slowdowns ───────────────────────────────────────────────────────────────

struct Slowdown {
    std::string scenario;
    std::string variant;
    double      baseline_ms  = 0.0;
    double      median_ms    = 0.0;
    double      slowdown_pct = 0.0;   // (median - baseline) / baseline * 100
};

/// One entry per (scenario, non-baseline variant) whose scenario has a
/// strictly positive baseline median.
std::vector<Slowdown> compute_slowdowns(const Summary& summary,
                                        const std::string& baseline);

/// Percentage slowdown of `median` relative to `baseline` (> 0).
double slowdown_pct(double median, double baseline) noexcept;

// ── Aggregates ──────────────────────────────────────────────────────────────

struct AggregateRatio {
    std::string variant;
    double      ratio = 1.0;          // geometric mean of median/baseline
    std::size_t scenario_count = 0;   // scenarios that contributed

    double slowdown_pct() const noexcept { return (ratio - 1.0) * 100.0; }
};

/// Geometric-mean ratio of each variant in `variants` against `baseline`.
std::vector<AggregateRatio> compute_aggregates(const Summary& summary,
                                               const std::string& baseline,
                                               const std::vector<std::string>& variants);

}  // namespace modebench

#endif  // MODEBENCH_STATS_HPP
