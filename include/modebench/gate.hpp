// ============================================================================
// modebench/gate.hpp — Regression gate
// ============================================================================
//
// Each checked variant is compared, per scenario, against a baseline
// variant's median:
//
//   ceiling = baseline_median * (1 + margin_pct / 100)
//   pass    = variant_median <= ceiling
//
// A failing check is data, never an exception.  The gate only turns into
// a non-zero exit status when enforcement is requested.
//
// ============================================================================

#ifndef MODEBENCH_GATE_HPP
#define MODEBENCH_GATE_HPP

#include "modebench/stats.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace modebench {

/// Exit status of an enforced gate failure (1 is reserved for errors).
inline constexpr int kGateFailureExitCode = 2;

struct GateOptions {
    std::string              baseline   = "current_wrapper";
    double                   margin_pct = 25.0;
    std::vector<std::string> checked    = {"current_hooks", "current_both"};
    bool                     enforce    = false;
};

struct MarginCheckResult {
    std::string scenario;
    std::string variant;
    double      baseline_ms  = 0.0;
    double      median_ms    = 0.0;
    double      allowed_ms   = 0.0;
    double      slowdown_pct = 0.0;
    bool        passed       = false;
};

class GateResult {
public:
    GateResult(GateOptions options, std::vector<MarginCheckResult> checks);

    const GateOptions& options() const noexcept { return options_; }

    /// Sorted by (scenario, variant).
    const std::vector<MarginCheckResult>& checks() const noexcept { return checks_; }

    /// Conjunction of all checks (true when there are none).
    bool passed() const noexcept;

    std::size_t failed_count() const noexcept;
    std::size_t passed_count() const noexcept { return checks_.size() - failed_count(); }

    /// 0, or kGateFailureExitCode when enforced and any check failed.
    int exit_code() const noexcept;

private:
    GateOptions                    options_;
    std::vector<MarginCheckResult> checks_;
};

/// Throws std::runtime_error for a negative margin.
GateResult evaluate_gate(const Summary& summary, const GateOptions& options);

}  // namespace modebench

#endif  // MODEBENCH_GATE_HPP
