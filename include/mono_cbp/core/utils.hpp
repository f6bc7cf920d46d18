#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace mono_cbp::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_files(const fs::path& dir, const std::string& pattern = "*.fits");

/**
 * Create dir (and parents) if absent.
 * Returns true if the directory was created, false if it already existed.
 * Throws IOError if the path exists and is not a directory.
 */
bool ensure_directory(const fs::path& dir);

// String utilities
std::string to_lower(const std::string& s);

// Glob pattern matching (case-insensitive, '*' and '?')
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace mono_cbp::core
