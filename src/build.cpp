// ============================================================================
// build.cpp — cargo builds, real-git lookup, baseline worktree, seed clone
// ============================================================================

#include "modebench/build.hpp"
#include "modebench/errors.hpp"
#include "modebench/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <utility>

#include <unistd.h>

namespace modebench {

static bool is_executable(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

// ── find_on_path ────────────────────────────────────────────────────────────

fs::path find_on_path(const std::string& name) {
    const char* path = std::getenv("PATH");
    if (!path) return {};
    for (const auto& dir : split(path, ':')) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        if (is_executable(candidate)) return candidate;
    }
    return {};
}

// ── resolve_real_git ────────────────────────────────────────────────────────

fs::path resolve_real_git(const fs::path& repo_root) {
    static const char* const kPreferred[] = {
        "/usr/bin/git",
        "/opt/homebrew/bin/git",
        "/usr/local/bin/git",
        "/bin/git",
    };
    for (const char* candidate : kPreferred) {
        if (is_executable(candidate)) return fs::canonical(candidate);
    }

    fs::path fallback = find_on_path("git");
    if (fallback.empty()) {
        throw SetupError("Unable to resolve system git from PATH.");
    }
    fallback = fs::canonical(fallback);

    std::string name = fallback.filename().string();
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const std::string target_dir = (repo_root / "target").string();
    if (name.find("git-ai") != std::string::npos ||
        fallback.string().find(target_dir) != std::string::npos) {
        throw SetupError("Resolved `git` points to a git-ai wrapper, not the real git "
                         "binary. Install git or pass a clean PATH.");
    }
    return fallback;
}

// ── build_release_binary ────────────────────────────────────────────────────

fs::path build_release_binary(const fs::path& repo_dir, const fs::path& target_dir) {
    Environment env = current_environment();
    env["CARGO_TARGET_DIR"] = target_dir.string();

    std::cout << "[build] cargo build --release in " << repo_dir.string() << std::endl;
    run_command({"cargo", "build", "--release", "--bin", "git-ai"},
                repo_dir.string(), env, kBuildTimeoutS);

    fs::path binary = target_dir / "release" / "git-ai";
    if (!fs::exists(binary)) {
        throw SetupError("Expected binary not found: " + binary.string());
    }
    return binary;
}

// ── git_output ──────────────────────────────────────────────────────────────

std::string git_output(const fs::path& git, const fs::path& repo_dir,
                       const std::vector<std::string>& args) {
    std::vector<std::string> argv = {git.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    CommandResult r = run_command(argv, repo_dir.string(), current_environment(),
                                  kGitQueryTimeoutS);
    return trim(r.stdout_text);
}

// ── clone_seed_repo ─────────────────────────────────────────────────────────

std::string clone_seed_repo(const fs::path& git, const std::string& url,
                            const fs::path& dir) {
    remove_tree(dir);
    fs::create_directories(dir.parent_path());
    run_command({git.string(), "clone", "--depth", "1", url, dir.string()},
                dir.parent_path().string(), current_environment(), kBuildTimeoutS);
    return git_output(git, dir, {"rev-parse", "HEAD"});
}

// ── ScopedWorktree ──────────────────────────────────────────────────────────

ScopedWorktree::ScopedWorktree(fs::path git, fs::path repo_root, const std::string& ref,
                               fs::path dir)
    : git_(std::move(git)), repo_root_(std::move(repo_root)), dir_(std::move(dir)) {
    fs::create_directories(dir_.parent_path());
    remove_tree(dir_);

    const Environment env = current_environment();
    run_command({git_.string(), "fetch", "--quiet", "origin", "main"},
                repo_root_.string(), env, kDefaultCommandTimeoutS);
    run_command({git_.string(), "worktree", "add", "--detach", dir_.string(), ref},
                repo_root_.string(), env, kDefaultCommandTimeoutS);
}

ScopedWorktree::~ScopedWorktree() {
    try {
        run_command({git_.string(), "worktree", "remove", "--force", dir_.string()},
                    repo_root_.string(), current_environment(), kDefaultCommandTimeoutS);
    } catch (const std::exception& e) {
        std::cerr << "[build] WARNING: failed to remove baseline worktree "
                  << dir_.string() << ": " << e.what() << "\n";
    }
}

std::string ScopedWorktree::head_sha() const {
    return git_output(git_, dir_, {"rev-parse", "HEAD"});
}

}  // namespace modebench
