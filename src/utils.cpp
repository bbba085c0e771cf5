// ============================================================================
// utils.cpp — File I/O, filesystem and string utilities
// ============================================================================

#include "modebench/utils.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace modebench {

// ── read_lines ──────────────────────────────────────────────────────────────

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

// ── write_text_file ─────────────────────────────────────────────────────────

void write_text_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream f(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!f) {
        throw std::runtime_error("cannot write file: " + path.string());
    }
    f << content;
    if (!f) {
        throw std::runtime_error("write failed: " + path.string());
    }
}

// ── append_line ─────────────────────────────────────────────────────────────

void append_line(const fs::path& path, const std::string& line) {
    std::ofstream f(path, std::ios::out | std::ios::app | std::ios::binary);
    if (!f) {
        throw std::runtime_error("cannot append to file: " + path.string());
    }
    f << line << "\n";
}

// ── create_link_or_copy ─────────────────────────────────────────────────────

void create_link_or_copy(const fs::path& target, const fs::path& link_path) {
    std::error_code ec;
    if (fs::is_symlink(fs::symlink_status(link_path))) {
        fs::remove(link_path);
    } else if (fs::is_directory(link_path)) {
        fs::remove_all(link_path);
    } else if (fs::exists(link_path)) {
        fs::remove(link_path);
    }
    fs::create_directories(link_path.parent_path());

    fs::create_symlink(target, link_path, ec);
    if (ec) {
        fs::copy_file(target, link_path, fs::copy_options::overwrite_existing);
    }
}

// ── copy_tree_skip_locks ────────────────────────────────────────────────────

static bool is_lock_name(const std::string& name) {
    return name.ends_with(".lock");
}

void copy_tree_skip_locks(const fs::path& src, const fs::path& dst) {
    if (!fs::is_directory(src)) {
        throw std::runtime_error("copy source is not a directory: " + src.string());
    }
    fs::create_directories(dst);

    for (const auto& entry : fs::directory_iterator(src)) {
        const std::string name = entry.path().filename().string();
        if (is_lock_name(name)) continue;

        const fs::path target = dst / name;
        const auto status = entry.symlink_status();
        if (fs::is_symlink(status)) {
            fs::copy_symlink(entry.path(), target);
        } else if (fs::is_directory(status)) {
            copy_tree_skip_locks(entry.path(), target);
        } else if (fs::is_regular_file(status)) {
            fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing);
        }
        // Sockets, fifos and the like are not part of a repository state.
    }
}

// ── remove_tree ─────────────────────────────────────────────────────────────

void remove_tree(const fs::path& path) {
    if (fs::exists(fs::symlink_status(path))) {
        fs::remove_all(path);
    }
}

// ── trim ────────────────────────────────────────────────────────────────────

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ── split ───────────────────────────────────────────────────────────────────

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == delim) {
            out.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    out.push_back(cur);
    return out;
}

// ── csv_field ───────────────────────────────────────────────────────────────

std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else          out += c;
    }
    out += '"';
    return out;
}

// ── json_escape ─────────────────────────────────────────────────────────────

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// ── fixed ───────────────────────────────────────────────────────────────────

std::string fixed(double value, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

// ── Time ────────────────────────────────────────────────────────────────────

std::string timestamp_string() {
    std::time_t t  = std::time(nullptr);
    std::tm     tm = *std::localtime(&t);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d-%H%M%S");
    return oss.str();
}

std::string now_iso_utc() {
    std::time_t t  = std::time(nullptr);
    std::tm     tm = *std::gmtime(&t);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// ── shell_capture ───────────────────────────────────────────────────────────

std::string shell_capture(const char* cmd) {
    std::string result;
    FILE* pipe = popen(cmd, "r");
    if (!pipe) return "(not available)";
    char buf[256];
    while (fgets(buf, sizeof(buf), pipe)) {
        result += buf;
    }
    pclose(pipe);
    // Trim trailing newline(s).
    while (!result.empty() && (result.back() == '\n' || result.back() == '\r'))
        result.pop_back();
    return result.empty() ? "(not available)" : result;
}

}  // namespace modebench
