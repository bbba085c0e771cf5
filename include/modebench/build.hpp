// ============================================================================
// modebench/build.hpp — Build and version-control collaborators
// ============================================================================
//
// Thin adapters over external tools: locating the real system git,
// building a release binary with cargo, checking out the baseline ref in
// a temporary worktree, and cloning the seed repository of the external
// family.
//
// ============================================================================

#ifndef MODEBENCH_BUILD_HPP
#define MODEBENCH_BUILD_HPP

#include "modebench/process.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace modebench {

namespace fs = std::filesystem;

inline constexpr int kBuildTimeoutS    = 3600;
inline constexpr int kGitQueryTimeoutS = 120;

/// Search $PATH for an executable; empty path when not found.
fs::path find_on_path(const std::string& name);

/// Locate the real git executable.  Well-known install locations win over
/// $PATH; a PATH hit that looks like a git-ai wrapper (name contains
/// "git-ai", or it lives under <repo_root>/target) is rejected.
/// Throws SetupError.
fs::path resolve_real_git(const fs::path& repo_root);

/// `cargo build --release --bin git-ai` in `repo_dir` with
/// CARGO_TARGET_DIR=`target_dir`.  Returns <target_dir>/release/git-ai.
/// Throws CommandError or SetupError.
fs::path build_release_binary(const fs::path& repo_dir, const fs::path& target_dir);

/// Trimmed stdout of `git <args>` run in `repo_dir` with the ambient
/// environment.  Throws CommandError.
std::string git_output(const fs::path& git, const fs::path& repo_dir,
                       const std::vector<std::string>& args);

/// `git clone --depth 1 <url> <dir>`; returns the clone's HEAD sha.
std::string clone_seed_repo(const fs::path& git, const std::string& url,
                            const fs::path& dir);

// ── ScopedWorktree ──────────────────────────────────────────────────────────
// A detached worktree of `ref`, removed again (`git worktree remove
// --force`) when the object is destroyed.  A failed removal is logged,
// never thrown.

class ScopedWorktree {
public:
    ScopedWorktree(fs::path git, fs::path repo_root, const std::string& ref,
                   fs::path dir);
    ~ScopedWorktree();

    ScopedWorktree(const ScopedWorktree&) = delete;
    ScopedWorktree& operator=(const ScopedWorktree&) = delete;

    const fs::path& dir() const noexcept { return dir_; }

    /// HEAD sha of the checked-out worktree.
    std::string head_sha() const;

private:
    fs::path git_;
    fs::path repo_root_;
    fs::path dir_;
};

}  // namespace modebench

#endif  // MODEBENCH_BUILD_HPP
