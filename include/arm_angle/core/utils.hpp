#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace arm_angle::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_files(const fs::path& dir, const std::string& patterns);
std::string read_text(const fs::path& path);
// Writes to a sibling temp file, then renames over `path`.
void write_text_atomic(const fs::path& path, const std::string& text);
bool has_non_whitespace_content(const fs::path& path);

// Hash utilities
std::string sha256_file(const fs::path& path);

// Executable lookup: absolute/relative paths must exist, bare names go through PATH
bool executable_exists(const std::string& program);

// Math utilities
double mean_of(const VectorXd& v);
// Population standard deviation (divides by N)
double stddev_of(const VectorXd& v);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string replace_all(std::string s, const std::string& from, const std::string& to);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace arm_angle::core
