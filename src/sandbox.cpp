// ============================================================================
// sandbox.cpp — Private home/bin/hooks construction and git dispatch
// ============================================================================

#include "modebench/sandbox.hpp"
#include "modebench/errors.hpp"
#include "modebench/utils.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <set>
#include <utility>

namespace modebench {

// ── Construction ────────────────────────────────────────────────────────────

Sandbox::Sandbox(Variant variant, fs::path root, fs::path real_git, int timeout_s)
    : variant_(std::move(variant)),
      root_(fs::absolute(root)),
      real_git_(std::move(real_git)),
      timeout_s_(timeout_s) {
    home_dir_    = root_ / "home";
    bin_dir_     = root_ / "bin";
    hooks_dir_   = home_dir_ / ".git-ai" / "git-hooks";
    git_wrapper_ = bin_dir_ / "git";

    fs::create_directories(home_dir_);
    fs::create_directories(bin_dir_);

    if (installs_wrapper(variant_.mode)) install_wrapper();
    if (installs_hooks(variant_.mode))   install_hooks();

    env_ = current_environment();
    env_["HOME"]                     = home_dir_.string();
    env_["GIT_CONFIG_GLOBAL"]        = (home_dir_ / ".gitconfig").string();
    env_["GIT_TERMINAL_PROMPT"]      = "0";
    env_["GIT_AI_DEBUG"]             = "0";
    env_["GIT_AI_DEBUG_PERFORMANCE"] = "0";
    auto path_it = env_.find("PATH");
    std::string ambient_path = path_it != env_.end() ? path_it->second : "";
    env_["PATH"] = bin_dir_.string() + (ambient_path.empty() ? "" : ":" + ambient_path);

    verify_hooks();
    std::cout << "[sandbox] variant=" << variant_.key
              << " mode=" << mode_to_string(variant_.mode)
              << " root=" << root_.string() << std::endl;
}

void Sandbox::install_wrapper() {
    create_link_or_copy(variant_.binary, git_wrapper_);
}

void Sandbox::install_hooks() {
    fs::create_directories(hooks_dir_);
    for (const char* hook : kManagedHookNames) {
        create_link_or_copy(variant_.binary, hooks_dir_ / hook);
    }
    write_text_file(home_dir_ / ".gitconfig",
                    "[core]\n\thooksPath = " + hooks_dir_.string() + "\n");
}

// ── Dispatch ────────────────────────────────────────────────────────────────

fs::path Sandbox::git_binary() const {
    return installs_wrapper(variant_.mode) ? git_wrapper_ : real_git_;
}

CommandResult Sandbox::run_git(const std::vector<std::string>& args,
                               const fs::path& cwd) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(git_binary().string());
    argv.insert(argv.end(), args.begin(), args.end());
    return run_command(argv, cwd.string(), env_, timeout_s_);
}

CommandResult Sandbox::run_variant_binary(const std::vector<std::string>& args,
                                          const fs::path& cwd) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(variant_.binary.string());
    argv.insert(argv.end(), args.begin(), args.end());
    return run_command(argv, cwd.string(), env_, timeout_s_);
}

// ── Repository helpers ──────────────────────────────────────────────────────

void Sandbox::init_repo(const fs::path& repo_dir) const {
    fs::create_directories(repo_dir);
    // Older git lacks `init -b`; fall back to init + checkout.
    CommandResult init = run_command_unchecked(
        {real_git_.string(), "init", "-q", "-b", "main"},
        repo_dir.string(), env_, timeout_s_);
    if (!init.ok()) {
        run_git({"init", "-q"}, repo_dir);
        run_git({"checkout", "-q", "-b", "main"}, repo_dir);
    }

    run_git({"config", "user.name", "Benchmark Bot"}, repo_dir);
    run_git({"config", "user.email", "benchmark@git-ai.local"}, repo_dir);
}

void Sandbox::checkpoint_mock_ai(const fs::path& repo_dir,
                                 const std::vector<std::string>& files) const {
    if (files.empty()) return;
    std::vector<std::string> args = {"checkpoint", "mock_ai"};
    args.insert(args.end(), files.begin(), files.end());
    run_variant_binary(args, repo_dir);
}

// ── verify_hooks ────────────────────────────────────────────────────────────

static std::string join_names(const std::vector<std::string>& names) {
    std::string out = "[";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out + "]";
}

void Sandbox::verify_hooks() const {
    if (!installs_hooks(variant_.mode)) return;

    const fs::path expected = fs::weakly_canonical(hooks_dir_);
    std::string reported;
    try {
        reported = trim(
            run_git({"config", "--global", "--get", "core.hooksPath"}, home_dir_)
                .stdout_text);
    } catch (const CommandError& e) {
        // `git config --get` exits 1 when the key is unset.
        throw SandboxError("Unable to read core.hooksPath for variant " +
                           variant_.key + "\n" + e.what());
    }
    if (reported.empty()) {
        throw SandboxError("Expected global core.hooksPath to be configured for variant " +
                           variant_.key + ", found empty");
    }

    fs::path actual(reported);
    if (actual.is_relative()) actual = home_dir_ / actual;
    actual = fs::weakly_canonical(actual);
    if (actual != expected) {
        throw SandboxError("Expected sandbox hooks path\n"
                           "variant=" + variant_.key + "\n"
                           "expected=" + expected.string() + "\n"
                           "actual=" + actual.string() + "\n");
    }

    if (!fs::is_directory(expected)) {
        throw SandboxError("Managed hooks dir missing: " + expected.string());
    }

    std::set<std::string> installed;
    for (const auto& entry : fs::directory_iterator(expected)) {
        std::string name = entry.path().filename().string();
        if (name.starts_with(".")) continue;
        installed.insert(name);
    }
    std::set<std::string> wanted(kManagedHookNames.begin(), kManagedHookNames.end());

    std::vector<std::string> missing;
    std::vector<std::string> extras;
    std::set_difference(wanted.begin(), wanted.end(), installed.begin(), installed.end(),
                        std::back_inserter(missing));
    std::set_difference(installed.begin(), installed.end(), wanted.begin(), wanted.end(),
                        std::back_inserter(extras));
    if (!missing.empty() || !extras.empty()) {
        throw SandboxError("Unexpected managed hook surface in sandbox hooks dir\n"
                           "missing=" + join_names(missing) + "\n"
                           "extras=" + join_names(extras) + "\n"
                           "path=" + expected.string() + "\n");
    }

    for (const auto& name : installed) {
        if (!fs::exists(expected / name)) {
            throw SandboxError("Managed hook does not resolve to a file: " +
                               (expected / name).string());
        }
    }
}

}  // namespace modebench
