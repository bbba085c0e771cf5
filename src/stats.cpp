// ============================================================================
// stats.cpp — Sample statistics, slowdowns and geometric-mean aggregates
// ============================================================================

#include "modebench/stats.hpp"
#include "modebench/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace modebench {

// ── Scalar statistics ───────────────────────────────────────────────────────

double median(std::vector<double> samples) {
    if (samples.empty()) {
        throw AggregationError("median of an empty sample set");
    }
    std::sort(samples.begin(), samples.end());
    std::size_t n   = samples.size();
    std::size_t mid = n / 2;
    if (n % 2 == 1) return samples[mid];
    return (samples[mid - 1] + samples[mid]) / 2.0;
}

double mean(const std::vector<double>& samples) {
    if (samples.empty()) {
        throw AggregationError("mean of an empty sample set");
    }
    double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    return sum / static_cast<double>(samples.size());
}

double population_stdev(const std::vector<double>& samples) {
    if (samples.size() < 2) return 0.0;
    double mu  = mean(samples);
    double acc = 0.0;
    for (double v : samples) acc += (v - mu) * (v - mu);
    return std::sqrt(acc / static_cast<double>(samples.size()));
}

double geometric_mean(const std::vector<double>& values) {
    if (values.empty()) return 1.0;
    double log_sum = 0.0;
    for (double v : values) log_sum += std::log(v);
    return std::exp(log_sum / static_cast<double>(values.size()));
}

// ── Summary ─────────────────────────────────────────────────────────────────

void Summary::add(ScenarioVariantSummary entry) {
    if (std::find(scenarios_.begin(), scenarios_.end(), entry.scenario) == scenarios_.end()) {
        scenarios_.push_back(entry.scenario);
    }
    if (std::find(variants_.begin(), variants_.end(), entry.variant) == variants_.end()) {
        variants_.push_back(entry.variant);
    }
    for (auto& existing : entries_) {
        if (existing.scenario == entry.scenario && existing.variant == entry.variant) {
            existing = std::move(entry);
            return;
        }
    }
    entries_.push_back(std::move(entry));
}

const ScenarioVariantSummary* Summary::find(const std::string& scenario,
                                            const std::string& variant) const noexcept {
    for (const auto& e : entries_) {
        if (e.scenario == scenario && e.variant == variant) return &e;
    }
    return nullptr;
}

Summary summarize(const std::vector<RunResult>& results) {
    // Group while keeping first-seen order of scenarios and variants.
    std::vector<std::pair<std::string, std::string>> order;
    std::vector<std::vector<double>>                 groups;
    for (const auto& r : results) {
        auto key = std::make_pair(r.scenario, r.variant);
        auto it  = std::find(order.begin(), order.end(), key);
        if (it == order.end()) {
            order.push_back(key);
            groups.push_back({r.duration_ms});
        } else {
            groups[static_cast<std::size_t>(it - order.begin())].push_back(r.duration_ms);
        }
    }

    Summary summary;
    for (std::size_t i = 0; i < order.size(); ++i) {
        const auto& samples = groups[i];
        ScenarioVariantSummary s;
        s.scenario   = order[i].first;
        s.variant    = order[i].second;
        s.samples_ms = samples;
        s.median_ms  = median(samples);
        s.mean_ms    = mean(samples);
        s.min_ms     = *std::min_element(samples.begin(), samples.end());
        s.max_ms     = *std::max_element(samples.begin(), samples.end());
        s.stdev_ms   = population_stdev(samples);
        summary.add(std::move(s));
    }
    return summary;
}

// ── Slowdowns ───────────────────────────────────────────────────────────────

double slowdown_pct(double median, double baseline) noexcept {
    return (median - baseline) / baseline * 100.0;
}

std::vector<Slowdown> compute_slowdowns(const Summary& summary,
                                        const std::string& baseline) {
    std::vector<Slowdown> out;
    for (const auto& scenario : summary.scenarios()) {
        const auto* base = summary.find(scenario, baseline);
        if (!base || base->median_ms <= 0.0) continue;

        for (const auto& variant : summary.variants()) {
            if (variant == baseline) continue;
            const auto* v = summary.find(scenario, variant);
            if (!v) continue;
            Slowdown s;
            s.scenario     = scenario;
            s.variant      = variant;
            s.baseline_ms  = base->median_ms;
            s.median_ms    = v->median_ms;
            s.slowdown_pct = slowdown_pct(v->median_ms, base->median_ms);
            out.push_back(std::move(s));
        }
    }
    return out;
}

// ── Aggregates ──────────────────────────────────────────────────────────────

std::vector<AggregateRatio> compute_aggregates(const Summary& summary,
                                               const std::string& baseline,
                                               const std::vector<std::string>& variants) {
    std::vector<AggregateRatio> out;
    for (const auto& variant : variants) {
        if (variant == baseline) continue;
        std::vector<double> ratios;
        for (const auto& scenario : summary.scenarios()) {
            const auto* base = summary.find(scenario, baseline);
            const auto* v    = summary.find(scenario, variant);
            if (!base || !v) continue;
            if (base->median_ms <= 0.0 || v->median_ms <= 0.0) continue;
            ratios.push_back(v->median_ms / base->median_ms);
        }
        AggregateRatio agg;
        agg.variant        = variant;
        agg.ratio          = geometric_mean(ratios);
        agg.scenario_count = ratios.size();
        out.push_back(std::move(agg));
    }
    return out;
}

}  // namespace modebench
