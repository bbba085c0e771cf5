// ============================================================================
// modebench/sandbox.hpp — Isolated execution environment for one variant
// ============================================================================
//
// Layout under the sandbox root:
//
//   home/                          private $HOME and global git config
//   home/.gitconfig                core.hooksPath (hook modes only)
//   home/.git-ai/git-hooks/<hook>  one entry per managed hook (hook modes)
//   bin/git                        the variant binary (wrapper modes)
//
// The child environment is derived from the ambient one with HOME,
// GIT_CONFIG_GLOBAL and PATH redirected into the sandbox.  The harness's own
// environment is never modified.
//
// Construction is complete only after verify_hooks() succeeded; a sandbox
// whose hook wiring is wrong is never handed out.
//
// ============================================================================

#ifndef MODEBENCH_SANDBOX_HPP
#define MODEBENCH_SANDBOX_HPP

#include "modebench/process.hpp"
#include "modebench/variant.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace modebench {

namespace fs = std::filesystem;

class Sandbox {
public:
    /// Build the sandbox under `root` (created if missing) and verify it.
    /// Throws SandboxError on bad hook wiring.
    Sandbox(Variant variant, fs::path root, fs::path real_git,
            int timeout_s = kDefaultCommandTimeoutS);

    const Variant& variant() const noexcept { return variant_; }
    const fs::path& root() const noexcept { return root_; }
    const fs::path& home_dir() const noexcept { return home_dir_; }
    const fs::path& bin_dir() const noexcept { return bin_dir_; }
    const fs::path& hooks_dir() const noexcept { return hooks_dir_; }
    const Environment& env() const noexcept { return env_; }
    int timeout_s() const noexcept { return timeout_s_; }

    /// The git executable `run_git` dispatches to: bin/git in wrapper
    /// modes, the real system git otherwise.
    fs::path git_binary() const;

    /// Run git through the mode's dispatch path.  Fatal on failure.
    CommandResult run_git(const std::vector<std::string>& args,
                          const fs::path& cwd) const;

    /// Run the variant binary directly.  Fatal on failure.
    CommandResult run_variant_binary(const std::vector<std::string>& args,
                                     const fs::path& cwd) const;

    /// Initialise an empty repository on branch `main` with a fixed identity.
    void init_repo(const fs::path& repo_dir) const;

    /// Record an AI checkpoint for `files` (no-op for an empty list).
    void checkpoint_mock_ai(const fs::path& repo_dir,
                            const std::vector<std::string>& files) const;

    /// Assert that git reports the private hooks directory as its hooks
    /// path and that the directory holds exactly the managed hook set.
    /// No-op for wrapper-only variants.  Throws SandboxError.
    void verify_hooks() const;

private:
    void install_wrapper();
    void install_hooks();

    Variant     variant_;
    fs::path    root_;
    fs::path    real_git_;
    int         timeout_s_;
    fs::path    home_dir_;
    fs::path    bin_dir_;
    fs::path    hooks_dir_;
    fs::path    git_wrapper_;
    Environment env_;
};

}  // namespace modebench

#endif  // MODEBENCH_SANDBOX_HPP
