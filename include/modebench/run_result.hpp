// ============================================================================
// modebench/run_result.hpp — One measured sample
// ============================================================================

#ifndef MODEBENCH_RUN_RESULT_HPP
#define MODEBENCH_RUN_RESULT_HPP

#include <string>

namespace modebench {

// ── RunResult ───────────────────────────────────────────────────────────────
// Exactly one per (scenario, variant, repetition).

struct RunResult {
    std::string scenario;
    std::string complexity;      // "basic" | "complex"
    std::string variant;
    int         repetition = 0;  // 1-based
    double      duration_ms = 0.0;

    // Reported by the external script only.
    bool        external = false;
    std::string status;
    int         saved_logs = 0;
    std::string head_note;
};

// ── ScenarioInfo ────────────────────────────────────────────────────────────
// What the reporter lists under "Scenario Matrix".

struct ScenarioInfo {
    std::string key;
    std::string complexity;
    std::string description;
};

}  // namespace modebench

#endif  // MODEBENCH_RUN_RESULT_HPP
