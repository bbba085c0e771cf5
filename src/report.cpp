// ============================================================================
// report.cpp — raw_results.csv, summary.json and report.md
// ============================================================================

#include "modebench/report.hpp"
#include "modebench/utils.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace modebench {

// ── Host info ───────────────────────────────────────────────────────────────

void fill_host_info(RunMetadata& meta) {
    meta.host_uname = shell_capture("uname -a");
#ifdef __APPLE__
    meta.cpu_model = shell_capture("sysctl -n machdep.cpu.brand_string 2>/dev/null");
    meta.cpu_cores = shell_capture("sysctl -n hw.ncpu 2>/dev/null");
#else
    meta.cpu_model = shell_capture(
        "grep -m1 'model name' /proc/cpuinfo 2>/dev/null | cut -d: -f2 | xargs");
    meta.cpu_cores = shell_capture("nproc 2>/dev/null");
#endif
}

// ── Lookup helpers ──────────────────────────────────────────────────────────

static const Slowdown* find_slowdown(const std::vector<Slowdown>& slowdowns,
                                     const std::string& scenario,
                                     const std::string& variant) {
    for (const auto& s : slowdowns) {
        if (s.scenario == scenario && s.variant == variant) return &s;
    }
    return nullptr;
}

static std::string label_of(const std::vector<Variant>& variants, const std::string& key) {
    const Variant* v = find_variant(variants, key);
    return v ? v->label : key;
}

static std::string join_samples(const std::vector<double>& samples) {
    std::string out;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        if (i > 0) out += ", ";
        out += fixed(samples[i], 3);
    }
    return out;
}

// ── raw_results.csv ─────────────────────────────────────────────────────────

std::string render_raw_csv(const std::vector<RunResult>& results) {
    const bool external = std::any_of(results.begin(), results.end(),
                                      [](const RunResult& r) { return r.external; });
    std::ostringstream oss;
    oss << "scenario,complexity,variant,repetition,duration_ms";
    if (external) oss << ",status,saved_logs,head_note";
    oss << "\n";

    for (const auto& r : results) {
        oss << csv_field(r.scenario) << ","
            << csv_field(r.complexity) << ","
            << csv_field(r.variant) << ","
            << r.repetition << ","
            << fixed(r.duration_ms, 3);
        if (external) {
            oss << "," << csv_field(r.external ? r.status : "unknown")
                << "," << r.saved_logs
                << "," << csv_field(r.head_note);
        }
        oss << "\n";
    }
    return oss.str();
}

// ── summary.json ────────────────────────────────────────────────────────────

static std::string q(const std::string& s) {
    return "\"" + json_escape(s) + "\"";
}

static void write_metadata_json(std::ostringstream& oss, const Report& report) {
    const RunMetadata& m = report.metadata;
    oss << "  \"metadata\": {\n";
    oss << "    \"timestamp_utc\": " << q(m.timestamp_utc) << ",\n";
    oss << "    \"family\": " << q(m.family) << ",\n";
    oss << "    \"repo_root\": " << q(m.repo_root) << ",\n";
    oss << "    \"branch\": " << q(m.branch) << ",\n";
    oss << "    \"branch_sha\": " << q(m.branch_sha) << ",\n";
    oss << "    \"main_ref\": " << q(m.main_ref) << ",\n";
    oss << "    \"main_sha\": " << q(m.main_sha) << ",\n";
    oss << "    \"real_git\": " << q(m.real_git) << ",\n";
    if (m.family == "nasty") {
        oss << "    \"repo_url\": " << q(m.repo_url) << ",\n";
        oss << "    \"seed_repo_head\": " << q(m.seed_repo_head) << ",\n";
        oss << "    \"repetitions\": " << m.repetitions << ",\n";
        oss << "    \"feature_commits\": " << m.feature_commits << ",\n";
        oss << "    \"main_commits\": " << m.main_commits << ",\n";
        oss << "    \"side_commits\": " << m.side_commits << ",\n";
        oss << "    \"files\": " << m.files << ",\n";
        oss << "    \"lines_per_file\": " << m.lines_per_file << ",\n";
        oss << "    \"burst_every\": " << m.burst_every << ",\n";
    } else {
        oss << "    \"iterations_basic\": " << m.iterations_basic << ",\n";
        oss << "    \"iterations_complex\": " << m.iterations_complex << ",\n";
    }
    oss << "    \"margin_pct\": " << fixed(m.margin_pct, 3) << ",\n";
    oss << "    \"margin_baseline\": " << q(m.margin_baseline) << ",\n";
    oss << "    \"enforce_margin\": " << (m.enforce_margin ? "true" : "false") << ",\n";
    oss << "    \"variants\": {";
    {
        bool first = true;
        for (const auto& v : report.variants) {
            oss << (first ? "\n" : ",\n");
            oss << "      " << q(v.key) << ": " << q(v.binary.string());
            first = false;
        }
        oss << (first ? "},\n" : "\n    },\n");
    }
    oss << "    \"host\": {\n";
    oss << "      \"uname\": " << q(m.host_uname) << ",\n";
    oss << "      \"cpu_model\": " << q(m.cpu_model) << ",\n";
    oss << "      \"cpu_cores\": " << q(m.cpu_cores) << "\n";
    oss << "    },\n";
    oss << "    \"command_line\": " << q(m.command_line) << "\n";
    oss << "  },\n";
}

std::string render_summary_json(const Report& report) {
    const Summary& summary = report.summary;
    std::ostringstream oss;
    oss << "{\n";

    write_metadata_json(oss, report);

    // Summary
    oss << "  \"summary\": {";
    {
        bool first_s = true;
        for (const auto& scenario : summary.scenarios()) {
            oss << (first_s ? "\n" : ",\n");
            oss << "    " << q(scenario) << ": {";
            bool first_v = true;
            for (const auto& variant : summary.variants()) {
                const auto* e = summary.find(scenario, variant);
                if (!e) continue;
                oss << (first_v ? "\n" : ",\n");
                oss << "      " << q(variant) << ": {\n";
                oss << "        \"runs_ms\": [";
                for (std::size_t i = 0; i < e->samples_ms.size(); ++i) {
                    if (i > 0) oss << ", ";
                    oss << fixed(e->samples_ms[i], 3);
                }
                oss << "],\n";
                oss << "        \"median_ms\": " << fixed(e->median_ms, 3) << ",\n";
                oss << "        \"mean_ms\": " << fixed(e->mean_ms, 3) << ",\n";
                oss << "        \"min_ms\": " << fixed(e->min_ms, 3) << ",\n";
                oss << "        \"max_ms\": " << fixed(e->max_ms, 3) << ",\n";
                oss << "        \"stdev_ms\": " << fixed(e->stdev_ms, 3) << "\n";
                oss << "      }";
                first_v = false;
            }
            oss << (first_v ? "}" : "\n    }");
            first_s = false;
        }
        oss << (first_s ? "},\n" : "\n  },\n");
    }

    // Slowdowns, grouped by scenario
    oss << "  \"slowdowns_pct_vs_" << json_escape(report.metadata.slowdown_baseline)
        << "\": {";
    {
        bool first_s = true;
        for (const auto& scenario : summary.scenarios()) {
            bool any = false;
            for (const auto& s : report.slowdowns) {
                if (s.scenario != scenario) continue;
                if (!any) {
                    oss << (first_s ? "\n" : ",\n");
                    oss << "    " << q(scenario) << ": {";
                    first_s = false;
                } else {
                    oss << ",";
                }
                oss << "\n      " << q(s.variant) << ": " << fixed(s.slowdown_pct, 3);
                any = true;
            }
            if (any) oss << "\n    }";
        }
        oss << (first_s ? "},\n" : "\n  },\n");
    }

    // Aggregates
    oss << "  \"aggregates\": [";
    {
        bool first = true;
        for (const auto& a : report.aggregates) {
            oss << (first ? "\n" : ",\n");
            oss << "    {\"variant\": " << q(a.variant)
                << ", \"baseline\": " << q(report.metadata.slowdown_baseline)
                << ", \"geometric_mean_ratio\": " << fixed(a.ratio, 6)
                << ", \"geometric_mean_slowdown_pct\": " << fixed(a.slowdown_pct(), 3)
                << ", \"scenario_count\": " << a.scenario_count << "}";
            first = false;
        }
        oss << (first ? "],\n" : "\n  ],\n");
    }

    // Margin checks
    const GateResult& gate = report.gate;
    oss << "  \"margin_checks\": [";
    {
        bool first = true;
        for (const auto& c : gate.checks()) {
            oss << (first ? "\n" : ",\n");
            oss << "    {\n";
            oss << "      \"scenario\": " << q(c.scenario) << ",\n";
            oss << "      \"variant\": " << q(c.variant) << ",\n";
            oss << "      \"baseline_ms\": " << fixed(c.baseline_ms, 3) << ",\n";
            oss << "      \"median_ms\": " << fixed(c.median_ms, 3) << ",\n";
            oss << "      \"allowed_ms\": " << fixed(c.allowed_ms, 3) << ",\n";
            oss << "      \"slowdown_pct\": " << fixed(c.slowdown_pct, 3) << ",\n";
            oss << "      \"passed\": " << (c.passed ? "true" : "false") << "\n";
            oss << "    }";
            first = false;
        }
        oss << (first ? "],\n" : "\n  ],\n");
    }

    // Gate
    oss << "  \"gate\": {\n";
    oss << "    \"baseline\": " << q(gate.options().baseline) << ",\n";
    oss << "    \"margin_pct\": " << fixed(gate.options().margin_pct, 3) << ",\n";
    oss << "    \"checked\": [";
    for (std::size_t i = 0; i < gate.options().checked.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << q(gate.options().checked[i]);
    }
    oss << "],\n";
    oss << "    \"enforce\": " << (gate.options().enforce ? "true" : "false") << ",\n";
    oss << "    \"passed\": " << (gate.passed() ? "true" : "false") << ",\n";
    oss << "    \"passed_count\": " << gate.passed_count() << ",\n";
    oss << "    \"failed_count\": " << gate.failed_count() << ",\n";
    oss << "    \"exit_code\": " << gate.exit_code() << "\n";
    oss << "  }\n";

    oss << "}\n";
    return oss.str();
}

// ── report.md ───────────────────────────────────────────────────────────────

static void write_metadata_md(std::ostringstream& md, const RunMetadata& m) {
    md << "## Run Metadata\n\n";
    md << "- Timestamp (UTC): `" << m.timestamp_utc << "`\n";
    md << "- Repo: `" << m.repo_root << "`\n";
    md << "- Branch: `" << m.branch << "`\n";
    md << "- Branch SHA: `" << m.branch_sha << "`\n";
    md << "- Main Ref: `" << m.main_ref << "`\n";
    md << "- Main SHA: `" << m.main_sha << "`\n";
    md << "- Real git: `" << m.real_git << "`\n";
    if (m.family == "nasty") {
        md << "- Seed repo source URL: `" << m.repo_url << "`\n";
        md << "- Seed repo head SHA: `" << m.seed_repo_head << "`\n";
        md << "- Repetitions: `" << m.repetitions << "`\n";
        md << "- Workload: feature=" << m.feature_commits
           << ", main=" << m.main_commits
           << ", side=" << m.side_commits
           << ", files=" << m.files
           << ", lines/file=" << m.lines_per_file
           << ", burst_every=" << m.burst_every << "\n";
    } else {
        md << "- Iterations (basic): `" << m.iterations_basic << "`\n";
        md << "- Iterations (complex): `" << m.iterations_complex << "`\n";
    }
    md << "- Host: `" << m.host_uname << "`\n";
    md << "- CPU: `" << m.cpu_model << "` (" << m.cpu_cores << " cores)\n";
    md << "\n";
}

std::string render_markdown(const Report& report) {
    const RunMetadata& m       = report.metadata;
    const Summary&     summary = report.summary;
    const std::string& base    = m.slowdown_baseline;
    const std::string  base_label = label_of(report.variants, base);

    std::vector<std::string> others;
    for (const auto& v : report.variants) {
        if (v.key != base) others.push_back(v.key);
    }

    std::ostringstream md;
    if (m.family == "nasty") {
        md << "# git-ai Nasty Rebase Benchmark (Modes vs main)\n\n";
    } else {
        md << "# git-ai Mode Benchmark Report\n\n";
    }

    write_metadata_md(md, m);

    md << "## Variants\n\n";
    for (const auto& v : report.variants) {
        md << "- `" << v.key << "`: " << v.label << " (`" << v.binary.string() << "`)\n";
    }
    md << "\n";

    md << "## Scenario Matrix\n\n";
    for (const auto& s : report.scenarios) {
        md << "- `" << s.key << "` (" << s.complexity << "): " << s.description << "\n";
    }
    md << "\n";

    // ── Exact timings ───────────────────────────────────────────────────
    md << "## Exact Timings (ms)\n\n";
    md << "| Scenario |";
    for (const auto& v : report.variants) md << " " << v.label << " runs |";
    md << "\n|---|";
    for (std::size_t i = 0; i < report.variants.size(); ++i) md << "---:|";
    md << "\n";
    for (const auto& scenario : summary.scenarios()) {
        md << "| " << scenario << " |";
        for (const auto& v : report.variants) {
            const auto* e = summary.find(scenario, v.key);
            md << " " << (e ? join_samples(e->samples_ms) : "n/a") << " |";
        }
        md << "\n";
    }
    md << "\n";

    // ── Medians and slowdowns ───────────────────────────────────────────
    md << "## Median Summary (ms) and Slowdown vs " << base_label << "\n\n";
    md << "| Scenario |";
    for (const auto& v : report.variants) md << " " << v.label << " |";
    for (const auto& key : others) md << " " << key << " Δ% |";
    md << "\n|---|";
    for (std::size_t i = 0; i < report.variants.size() + others.size(); ++i) md << "---:|";
    md << "\n";
    for (const auto& scenario : summary.scenarios()) {
        md << "| " << scenario << " |";
        for (const auto& v : report.variants) {
            const auto* e = summary.find(scenario, v.key);
            md << " " << (e ? fixed(e->median_ms, 3) : "n/a") << " |";
        }
        for (const auto& key : others) {
            const auto* s = find_slowdown(report.slowdowns, scenario, key);
            md << " " << (s ? fixed(s->slowdown_pct, 3) + "%" : "n/a") << " |";
        }
        md << "\n";
    }
    md << "\n";

    // ── Aggregates ──────────────────────────────────────────────────────
    md << "## Aggregate Comparison\n\n";
    md << "| Variant | Geometric Mean Ratio vs " << base_label
       << " | Geometric Mean Slowdown | Scenarios |\n";
    md << "|---|---:|---:|---:|\n";
    for (const auto& a : report.aggregates) {
        md << "| " << a.variant << " | ";
        if (a.scenario_count == 0) {
            md << "n/a | n/a | 0 |\n";
        } else {
            md << fixed(a.ratio, 4) << "x | " << fixed(a.slowdown_pct(), 3) << "% | "
               << a.scenario_count << " |\n";
        }
    }
    md << "\n";

    // ── Margin check ────────────────────────────────────────────────────
    const GateResult& gate = report.gate;
    std::string margin_label = gate.options().baseline;
    std::replace(margin_label.begin(), margin_label.end(), '_', ' ');

    md << "## Margin Check\n\n";
    md << "- Required margin: ";
    for (std::size_t i = 0; i < gate.options().checked.size(); ++i) {
        if (i > 0) md << ", ";
        md << "`" << gate.options().checked[i] << "`";
    }
    md << " must be <= `" << fixed(gate.options().margin_pct, 1)
       << "%` slower than `" << margin_label << "`\n";
    md << "- Enforcement: `" << (gate.options().enforce ? "on" : "off") << "`\n\n";
    md << "| Scenario | Variant | Baseline (ms) | Variant Median (ms) | Allowed Max (ms) "
          "| Slowdown | Status |\n";
    md << "|---|---|---:|---:|---:|---:|---|\n";
    for (const auto& c : gate.checks()) {
        md << "| " << c.scenario << " | " << c.variant << " | "
           << fixed(c.baseline_ms, 3) << " | " << fixed(c.median_ms, 3) << " | "
           << fixed(c.allowed_ms, 3) << " | " << fixed(c.slowdown_pct, 3) << "% | "
           << (c.passed ? "PASS" : "FAIL") << " |\n";
    }
    md << "\n- Overall: `" << gate.passed_count() << "/" << gate.checks().size()
       << "` checks passing\n\n";

    // ── Re-run ──────────────────────────────────────────────────────────
    md << "## Re-run\n\n";
    md << "```bash\n" << m.command_line << "\n```\n";

    return md.str();
}

// ── write_artifacts ─────────────────────────────────────────────────────────

ArtifactPaths write_artifacts(const Report& report, const fs::path& dir) {
    ArtifactPaths paths;
    paths.dir      = dir;
    paths.csv      = dir / "raw_results.csv";
    paths.json     = dir / "summary.json";
    paths.markdown = dir / "report.md";

    fs::create_directories(dir);
    write_text_file(paths.csv, render_raw_csv(report.results));
    write_text_file(paths.json, render_summary_json(report));
    write_text_file(paths.markdown, render_markdown(report));
    std::cout << "[report] Wrote " << paths.dir.string() << "/" << std::endl;
    return paths;
}

// ── print_completion ────────────────────────────────────────────────────────

void print_completion(const Report& report, const ArtifactPaths& paths) {
    const GateResult& gate = report.gate;
    std::cout << "\nBenchmark complete\n"
              << "- Report: " << paths.markdown.string() << "\n"
              << "- JSON:   " << paths.json.string() << "\n"
              << "- CSV:    " << paths.csv.string() << "\n"
              << "- Margin checks: " << gate.passed_count() << "/"
              << gate.checks().size() << " passing\n";

    if (gate.exit_code() != 0) {
        std::cout << "\nMargin enforcement failed:\n";
        for (const auto& c : gate.checks()) {
            if (c.passed) continue;
            std::cout << "  - " << c.scenario << " / " << c.variant << ": "
                      << fixed(c.slowdown_pct, 3) << "% > "
                      << fixed(gate.options().margin_pct, 1) << "%\n";
        }
    }
    std::cout << std::flush;
}

}  // namespace modebench
