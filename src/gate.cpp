// ============================================================================
// gate.cpp — Margin checks against a baseline variant
// ============================================================================

#include "modebench/gate.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace modebench {

GateResult::GateResult(GateOptions options, std::vector<MarginCheckResult> checks)
    : options_(std::move(options)), checks_(std::move(checks)) {
    std::sort(checks_.begin(), checks_.end(),
              [](const MarginCheckResult& a, const MarginCheckResult& b) {
                  if (a.scenario != b.scenario) return a.scenario < b.scenario;
                  return a.variant < b.variant;
              });
}

bool GateResult::passed() const noexcept {
    return failed_count() == 0;
}

std::size_t GateResult::failed_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(checks_.begin(), checks_.end(),
                      [](const MarginCheckResult& c) { return !c.passed; }));
}

int GateResult::exit_code() const noexcept {
    return (options_.enforce && !passed()) ? kGateFailureExitCode : 0;
}

GateResult evaluate_gate(const Summary& summary, const GateOptions& options) {
    if (options.margin_pct < 0.0) {
        throw std::runtime_error("--margin-pct must be non-negative");
    }

    const double multiplier = 1.0 + options.margin_pct / 100.0;
    std::vector<MarginCheckResult> checks;

    for (const auto& scenario : summary.scenarios()) {
        const auto* base = summary.find(scenario, options.baseline);
        // A missing or zero baseline makes the slowdown undefined.
        if (!base || base->median_ms <= 0.0) continue;

        const double allowed = base->median_ms * multiplier;
        for (const auto& variant : options.checked) {
            if (variant == options.baseline) continue;
            const auto* v = summary.find(scenario, variant);
            if (!v) continue;

            MarginCheckResult c;
            c.scenario     = scenario;
            c.variant      = variant;
            c.baseline_ms  = base->median_ms;
            c.median_ms    = v->median_ms;
            c.allowed_ms   = allowed;
            c.slowdown_pct = slowdown_pct(v->median_ms, base->median_ms);
            c.passed       = v->median_ms <= allowed;
            checks.push_back(std::move(c));
        }
    }

    return GateResult(options, std::move(checks));
}

}  // namespace modebench
