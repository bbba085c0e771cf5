// ============================================================================
// scenario.cpp — Built-in scenario library
// ============================================================================
//
// Basic scenarios work on a flat 24-file repository; complex scenarios use
// the structured main/feature/side layout and build branch topologies.
// Every measure() mutates only the run directory it is handed.
//
// ============================================================================

#include "modebench/scenario.hpp"
#include "modebench/utils.hpp"

#include <cstdio>

namespace modebench {

const char* complexity_to_string(Complexity c) noexcept {
    switch (c) {
        case Complexity::Basic:   return "basic";
        case Complexity::Complex: return "complex";
    }
    return "unknown";
}

// ── Seed content ────────────────────────────────────────────────────────────

std::string seed_file_content(int seed, int lines) {
    std::string out;
    out.reserve(static_cast<std::size_t>(lines) * 44);
    char buf[64];
    for (int i = 1; i <= lines; ++i) {
        std::uint64_t payload = (static_cast<std::uint64_t>(seed) * 1315423911ULL +
                                 static_cast<std::uint64_t>(i) * 2654435761ULL) &
                                0xFFFFFFFFULL;
        std::snprintf(buf, sizeof(buf), "seed=%08d line=%04d payload=%08llx\n",
                      seed, i, static_cast<unsigned long long>(payload));
        out += buf;
    }
    return out;
}

std::string basic_file_name(int index) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "bench/basic/file_%03d.txt", index);
    return buf;
}

static std::vector<std::string> numbered(const char* pattern, int count) {
    std::vector<std::string> out;
    char buf[64];
    for (int i = 0; i < count; ++i) {
        std::snprintf(buf, sizeof(buf), pattern, i);
        out.emplace_back(buf);
    }
    return out;
}

StructuredGroups structured_file_names() {
    StructuredGroups g;
    g.main    = numbered("bench/main/main_%02d.txt", 8);
    g.feature = numbered("bench/feature/feature_%02d.txt", 10);
    g.side    = numbered("bench/side/side_%02d.txt", 6);
    return g;
}

// ── Seeding helpers ─────────────────────────────────────────────────────────

void write_seed_file(const fs::path& path, int seed, int lines) {
    write_text_file(path, seed_file_content(seed, lines));
}

std::vector<std::string> seed_basic_repo(const Sandbox& sb, const fs::path& repo,
                                         int file_count) {
    sb.init_repo(repo);
    std::vector<std::string> files;
    for (int i = 0; i < file_count; ++i) {
        std::string rel = basic_file_name(i);
        write_seed_file(repo / rel, 1000 + i, 70);
        files.push_back(rel);
    }
    sb.run_git({"add", "-A"}, repo);
    sb.run_git({"commit", "-q", "-m", "seed basic"}, repo);
    return files;
}

StructuredGroups seed_structured_repo(const Sandbox& sb, const fs::path& repo) {
    sb.init_repo(repo);
    StructuredGroups groups = structured_file_names();
    int seed = 2000;
    for (const auto* group : {&groups.main, &groups.feature, &groups.side}) {
        for (const auto& rel : *group) {
            write_seed_file(repo / rel, seed, 80);
            ++seed;
        }
    }
    sb.run_git({"add", "-A"}, repo);
    sb.run_git({"commit", "-q", "-m", "seed structured"}, repo);
    return groups;
}

void create_ai_commit(const Sandbox& sb, const fs::path& repo,
                      const std::vector<std::string>& files,
                      const std::string& marker, const std::string& message) {
    for (const auto& rel : files) append_line(repo / rel, marker);
    sb.checkpoint_mock_ai(repo, files);
    sb.run_git({"add", "-A"}, repo);
    sb.run_git({"commit", "-q", "-m", message}, repo);
}

void create_plain_commit(const Sandbox& sb, const fs::path& repo,
                         const std::vector<std::string>& files,
                         const std::string& marker, const std::string& message) {
    for (const auto& rel : files) append_line(repo / rel, marker);
    sb.run_git({"add", "-A"}, repo);
    sb.run_git({"commit", "-q", "-m", message}, repo);
}

static std::string n(int i) { return std::to_string(i); }

static std::vector<std::string> basic_range(int from, int to) {
    std::vector<std::string> out;
    for (int i = from; i < to; ++i) out.push_back(basic_file_name(i));
    return out;
}

// ── commit_human ────────────────────────────────────────────────────────────

static void setup_human_commit(const Sandbox& sb, const fs::path& repo) {
    seed_basic_repo(sb, repo);
}

static void measure_human_commit(const Sandbox& sb, const fs::path& repo, int run) {
    auto files = basic_range(0, 6);
    for (std::size_t idx = 0; idx < files.size(); ++idx) {
        append_line(repo / files[idx],
                    "human-change run=" + n(run) + " idx=" + std::to_string(idx));
    }
    sb.run_git({"add", "-A"}, repo);
    sb.run_git({"commit", "-q", "-m", "bench human run " + n(run)}, repo);
}

// ── checkpoint_commit_ai ────────────────────────────────────────────────────

static void setup_ai_checkpoint_commit(const Sandbox& sb, const fs::path& repo) {
    seed_basic_repo(sb, repo);
}

static void measure_ai_checkpoint_commit(const Sandbox& sb, const fs::path& repo, int run) {
    auto files = basic_range(0, 5);
    for (std::size_t idx = 0; idx < files.size(); ++idx) {
        append_line(repo / files[idx],
                    "ai-change run=" + n(run) + " idx=" + std::to_string(idx));
    }
    sb.checkpoint_mock_ai(repo, files);
    sb.run_git({"add", "-A"}, repo);
    sb.run_git({"commit", "-q", "-m", "bench ai commit run " + n(run)}, repo);
}

// ── reset_mixed_head6 ───────────────────────────────────────────────────────

static void setup_reset_mixed(const Sandbox& sb, const fs::path& repo) {
    auto files = seed_basic_repo(sb, repo);
    for (int i = 0; i < 12; ++i) {
        const auto& target = files[static_cast<std::size_t>(i) % files.size()];
        create_ai_commit(sb, repo, {target}, "history-ai-" + n(i),
                         "history ai commit " + n(i));
    }
}

static void measure_reset_mixed(const Sandbox& sb, const fs::path& repo, int run) {
    for (int i = 0; i < 5; ++i) {
        append_line(repo / basic_file_name(i), "pending-reset-" + n(run) + "-" + n(i));
    }
    sb.run_git({"reset", "--mixed", "HEAD~6"}, repo);
}

// ── stash_roundtrip ─────────────────────────────────────────────────────────

static void setup_stash_roundtrip(const Sandbox& sb, const fs::path& repo) {
    auto files = seed_basic_repo(sb, repo);
    create_ai_commit(sb, repo, {files[0], files[1], files[2]}, "seed-ai-stash",
                     "seed ai for stash");
}

static void measure_stash_roundtrip(const Sandbox& sb, const fs::path& repo, int run) {
    auto tracked = basic_range(4, 9);
    for (std::size_t idx = 0; idx < tracked.size(); ++idx) {
        append_line(repo / tracked[idx],
                    "stash-tracked-" + n(run) + "-" + std::to_string(idx));
    }
    sb.checkpoint_mock_ai(repo, {tracked[0], tracked[1], tracked[2]});

    write_seed_file(repo / "bench" / ("untracked_" + n(run) + ".txt"), 7000 + run, 20);

    sb.run_git({"stash", "push", "-u", "-m", "bench stash " + n(run)}, repo);
    sb.run_git({"stash", "pop"}, repo);
}

// ── cherry_pick_three ───────────────────────────────────────────────────────

static void setup_cherry_pick_three(const Sandbox& sb, const fs::path& repo) {
    auto files = seed_basic_repo(sb, repo);
    sb.run_git({"checkout", "-q", "-b", "feature"}, repo);
    for (int i = 0; i < 3; ++i) {
        create_ai_commit(sb, repo, {files[static_cast<std::size_t>(i)]},
                         "feature-cherry-" + n(i), "feature cherry commit " + n(i));
        sb.run_git({"tag", "bench-cherry-" + n(i), "HEAD"}, repo);
    }
    create_plain_commit(sb, repo, {files[10]}, "feature-extra", "feature extra commit");
    sb.run_git({"checkout", "-q", "main"}, repo);
    create_plain_commit(sb, repo, {files[20]}, "main-diverge", "main diverge commit");
}

static void measure_cherry_pick_three(const Sandbox& sb, const fs::path& repo, int) {
    std::vector<std::string> args = {"cherry-pick"};
    for (int i = 0; i < 3; ++i) {
        args.push_back(
            trim(sb.run_git({"rev-parse", "bench-cherry-" + n(i)}, repo).stdout_text));
    }
    sb.run_git(args, repo);
}

// ── rebase_linear ───────────────────────────────────────────────────────────

static void setup_rebase_linear(const Sandbox& sb, const fs::path& repo) {
    auto g = seed_structured_repo(sb, repo);
    for (std::size_t i = 0; i < 4; ++i) {
        create_plain_commit(sb, repo, {g.main[i % g.main.size()]},
                            "main-pre-feature-" + std::to_string(i),
                            "main pre feature " + std::to_string(i));
    }

    sb.run_git({"checkout", "-q", "-b", "feature", "main~3"}, repo);
    for (std::size_t i = 0; i < 8; ++i) {
        create_ai_commit(sb, repo, {g.feature[i % g.feature.size()]},
                         "feature-linear-" + std::to_string(i),
                         "feature linear " + std::to_string(i));
    }

    sb.run_git({"checkout", "-q", "main"}, repo);
    for (std::size_t i = 0; i < 6; ++i) {
        create_plain_commit(sb, repo, {g.main[(i + 4) % g.main.size()]},
                            "main-after-feature-" + std::to_string(i),
                            "main after feature " + std::to_string(i));
    }
    sb.run_git({"checkout", "-q", "feature"}, repo);
}

static void measure_rebase_linear(const Sandbox& sb, const fs::path& repo, int) {
    sb.run_git({"rebase", "main"}, repo);
}

// ── rebase_rebase_merges ────────────────────────────────────────────────────

static void setup_rebase_merges(const Sandbox& sb, const fs::path& repo) {
    auto g = seed_structured_repo(sb, repo);
    for (std::size_t i = 0; i < 5; ++i) {
        create_plain_commit(sb, repo, {g.main[i % g.main.size()]},
                            "main-start-" + std::to_string(i),
                            "main start " + std::to_string(i));
    }

    sb.run_git({"checkout", "-q", "-b", "feature", "main~2"}, repo);
    for (std::size_t i = 0; i < 6; ++i) {
        create_ai_commit(sb, repo, {g.feature[i % g.feature.size()]},
                         "feature-rm-" + std::to_string(i),
                         "feature rm " + std::to_string(i));
    }

    sb.run_git({"checkout", "-q", "-b", "side", "feature~3"}, repo);
    for (std::size_t i = 0; i < 4; ++i) {
        create_ai_commit(sb, repo, {g.side[i % g.side.size()]},
                         "side-rm-" + std::to_string(i),
                         "side rm " + std::to_string(i));
    }

    sb.run_git({"checkout", "-q", "feature"}, repo);
    sb.run_git({"merge", "--no-ff", "-q", "-m", "merge side", "side"}, repo);
    for (std::size_t i = 0; i < 2; ++i) {
        create_ai_commit(sb, repo, {g.feature[(i + 6) % g.feature.size()]},
                         "feature-post-merge-" + std::to_string(i),
                         "feature post merge " + std::to_string(i));
    }

    sb.run_git({"checkout", "-q", "main"}, repo);
    for (std::size_t i = 0; i < 4; ++i) {
        create_plain_commit(sb, repo, {g.main[(i + 5) % g.main.size()]},
                            "main-upstream-" + std::to_string(i),
                            "main upstream " + std::to_string(i));
    }
    sb.run_git({"checkout", "-q", "feature"}, repo);
}

static void measure_rebase_merges(const Sandbox& sb, const fs::path& repo, int) {
    sb.run_git({"rebase", "--rebase-merges", "main"}, repo);
}

// ── squash_merge_commit ─────────────────────────────────────────────────────

static void setup_squash_merge(const Sandbox& sb, const fs::path& repo) {
    auto g = seed_structured_repo(sb, repo);
    sb.run_git({"checkout", "-q", "-b", "feature"}, repo);
    for (std::size_t i = 0; i < 10; ++i) {
        create_ai_commit(sb, repo, {g.feature[i % g.feature.size()]},
                         "squash-feature-" + std::to_string(i),
                         "squash feature " + std::to_string(i));
    }

    sb.run_git({"checkout", "-q", "main"}, repo);
    for (std::size_t i = 0; i < 4; ++i) {
        create_plain_commit(sb, repo, {g.main[i % g.main.size()]},
                            "squash-main-" + std::to_string(i),
                            "squash main " + std::to_string(i));
    }
}

static void measure_squash_merge(const Sandbox& sb, const fs::path& repo, int run) {
    sb.run_git({"merge", "--squash", "feature"}, repo);
    sb.run_git({"commit", "-q", "-m", "squash merge run " + n(run)}, repo);
}

// ── scenario_library ────────────────────────────────────────────────────────

std::vector<Scenario> scenario_library() {
    return {
        {"commit_human", "Human-only add/commit on modified tracked files",
         Complexity::Basic, setup_human_commit, measure_human_commit},
        {"checkpoint_commit_ai", "AI checkpoint + commit flow",
         Complexity::Basic, setup_ai_checkpoint_commit, measure_ai_checkpoint_commit},
        {"reset_mixed_head6", "Reset mixed with pending worktree edits",
         Complexity::Basic, setup_reset_mixed, measure_reset_mixed},
        {"stash_roundtrip", "stash push -u + pop on AI-touched and untracked files",
         Complexity::Basic, setup_stash_roundtrip, measure_stash_roundtrip},
        {"cherry_pick_three", "Cherry-pick three AI commits onto diverged main",
         Complexity::Basic, setup_cherry_pick_three, measure_cherry_pick_three},
        {"rebase_linear", "Linear feature branch rebase onto updated main",
         Complexity::Complex, setup_rebase_linear, measure_rebase_linear},
        {"rebase_rebase_merges", "Rebase-merges on branch with merge commit",
         Complexity::Complex, setup_rebase_merges, measure_rebase_merges},
        {"squash_merge_commit", "merge --squash + commit from feature branch",
         Complexity::Complex, setup_squash_merge, measure_squash_merge},
    };
}

}  // namespace modebench
