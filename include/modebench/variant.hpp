// ============================================================================
// modebench/variant.hpp — Variant registry
// ============================================================================
//
// A Variant is one execution configuration of the tool under comparison:
// a binary plus a dispatch Mode.
//
//   wrapper  the binary stands in for `git` on the sandbox PATH
//   hooks    real git runs; the binary is entered through managed hooks
//   both     wrapper and hooks at the same time
//
// ============================================================================

#ifndef MODEBENCH_VARIANT_HPP
#define MODEBENCH_VARIANT_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace modebench {

// ── Mode ────────────────────────────────────────────────────────────────────

enum class Mode : std::uint8_t {
    Wrapper,
    Hooks,
    Both
};

/// "wrapper" / "hooks" / "both".
const char* mode_to_string(Mode m) noexcept;

/// Inverse of mode_to_string.  Throws std::runtime_error on unknown input.
Mode parse_mode(std::string_view text);

/// True when the variant binary is installed as the sandbox `git`.
constexpr bool installs_wrapper(Mode m) noexcept {
    return m == Mode::Wrapper || m == Mode::Both;
}

/// True when the variant binary is installed as the managed hook set.
constexpr bool installs_hooks(Mode m) noexcept {
    return m == Mode::Hooks || m == Mode::Both;
}

// ── Managed hooks ───────────────────────────────────────────────────────────

inline constexpr std::array<const char*, 9> kManagedHookNames = {
    "pre-commit",
    "prepare-commit-msg",
    "post-commit",
    "pre-rebase",
    "post-checkout",
    "post-merge",
    "pre-push",
    "post-rewrite",
    "reference-transaction",
};

// ── Variant ─────────────────────────────────────────────────────────────────

struct Variant {
    std::string           key;     // stable short name, e.g. "current_hooks"
    std::string           label;   // human name, e.g. "current(hooks)"
    std::filesystem::path binary;
    Mode                  mode = Mode::Wrapper;
};

/// The standard comparison set:
///   main_wrapper, current_wrapper, current_hooks, current_both.
std::vector<Variant> default_variants(const std::filesystem::path& main_bin,
                                      const std::filesystem::path& current_bin);

/// Find a variant by key; nullptr when absent.
const Variant* find_variant(const std::vector<Variant>& variants,
                            std::string_view key) noexcept;

}  // namespace modebench

#endif  // MODEBENCH_VARIANT_HPP
