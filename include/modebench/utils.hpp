// ============================================================================
// modebench/utils.hpp — Utility functions
// ============================================================================

#ifndef MODEBENCH_UTILS_HPP
#define MODEBENCH_UTILS_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace modebench {

namespace fs = std::filesystem;

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a text file and return its content as a vector of lines.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> read_lines(const std::string& path);

/// Write (truncate) a text file, creating parent directories.
/// Throws std::runtime_error on failure.
void write_text_file(const fs::path& path, const std::string& content);

/// Append `line` plus a newline to an existing file.
void append_line(const fs::path& path, const std::string& line);

/// Point `link_path` at `target`: a symlink where possible, a full copy
/// otherwise.  Anything already at `link_path` is replaced.
void create_link_or_copy(const fs::path& target, const fs::path& link_path);

/// Recursively copy `src` to `dst`, skipping every entry whose name ends in
/// ".lock" (transient git lock files).  Symlinks are copied as symlinks.
void copy_tree_skip_locks(const fs::path& src, const fs::path& dst);

/// Remove a directory tree if it exists.
void remove_tree(const fs::path& path);

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// Split on a single delimiter character (empty fields preserved).
std::vector<std::string> split(const std::string& s, char delim);

/// Wrap a CSV field when it contains a comma, quote or newline.
std::string csv_field(const std::string& s);

/// Escape a string for inclusion inside JSON double quotes.
std::string json_escape(const std::string& s);

/// Format a double with a fixed number of decimals.
std::string fixed(double value, int decimals);

// ── Time ────────────────────────────────────────────────────────────────────

/// Local time as YYYYmmdd-HHMMSS (artifact directory names).
std::string timestamp_string();

/// Current UTC time as ISO-8601 (YYYY-mm-ddTHH:MM:SSZ).
std::string now_iso_utc();

// ── Host ────────────────────────────────────────────────────────────────────

/// Run a shell command and capture its stdout (best effort).
/// Returns "(not available)" when the command yields nothing.
std::string shell_capture(const char* cmd);

}  // namespace modebench

#endif  // MODEBENCH_UTILS_HPP
