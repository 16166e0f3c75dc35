#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>

namespace frame_diff::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();
int get_current_year();

// File utilities
void write_text(const fs::path& path, const std::string& text);
std::string sha256_file(const fs::path& path);

// Math utilities
double compute_mean(const Matrix2Dd& data);
double compute_population_stddev(const Matrix2Dd& data);
double round_to_decimals(double value, int decimals);

// String utilities
std::string to_lower(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);

} // namespace frame_diff::core
