// ============================================================================
// modebench/scenario.hpp — Scenario registry (benchmarked git workflows)
// ============================================================================
//
// A Scenario is a stateless descriptor: a one-time `setup` that builds a
// template repository, and a `measure` that performs exactly the operation
// being timed against a fresh copy of that template.
//
// Seed content is generated by pure functions so that every template is
// byte-for-byte reproducible across variants and runs.
//
// ============================================================================

#ifndef MODEBENCH_SCENARIO_HPP
#define MODEBENCH_SCENARIO_HPP

#include "modebench/sandbox.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace modebench {

namespace fs = std::filesystem;

// ── Complexity ──────────────────────────────────────────────────────────────
// Only used to pick the repetition count.

enum class Complexity : std::uint8_t {
    Basic,
    Complex
};

const char* complexity_to_string(Complexity c) noexcept;

// ── Scenario ────────────────────────────────────────────────────────────────

struct Scenario {
    using SetupFn   = std::function<void(const Sandbox&, const fs::path& template_dir)>;
    using MeasureFn = std::function<void(const Sandbox&, const fs::path& run_dir,
                                         int repetition)>;

    std::string key;
    std::string description;
    Complexity  complexity = Complexity::Basic;
    SetupFn     setup;
    MeasureFn   measure;
};

/// The built-in scenario matrix, in execution order.
std::vector<Scenario> scenario_library();

// ── Seed content (pure) ─────────────────────────────────────────────────────

/// Deterministic file body: `lines` rows of
///   seed=%08d line=%04d payload=%08x
std::string seed_file_content(int seed, int lines);

/// "bench/basic/file_NNN.txt"
std::string basic_file_name(int index);

struct StructuredGroups {
    std::vector<std::string> main;
    std::vector<std::string> feature;
    std::vector<std::string> side;
};

/// File names of the three-group layout used by the complex scenarios.
StructuredGroups structured_file_names();

// ── Seeding helpers (use the sandbox) ───────────────────────────────────────

void write_seed_file(const fs::path& path, int seed, int lines);

/// init + 24 seeded files + one commit.  Returns the relative file names.
std::vector<std::string> seed_basic_repo(const Sandbox& sb, const fs::path& repo,
                                         int file_count = 24);

/// init + main/feature/side file groups + one commit.
StructuredGroups seed_structured_repo(const Sandbox& sb, const fs::path& repo);

/// Append `marker` to each file, checkpoint them as AI edits, commit.
void create_ai_commit(const Sandbox& sb, const fs::path& repo,
                      const std::vector<std::string>& files,
                      const std::string& marker, const std::string& message);

/// Append `marker` to each file and commit without a checkpoint.
void create_plain_commit(const Sandbox& sb, const fs::path& repo,
                         const std::vector<std::string>& files,
                         const std::string& marker, const std::string& message);

}  // namespace modebench

#endif  // MODEBENCH_SCENARIO_HPP
