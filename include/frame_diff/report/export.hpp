#pragma once

#include "frame_diff/core/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace frame_diff::report {

// Base name with a trailing FITS extension removed (case-insensitive).
std::string frame_label(const std::string& frame_id);

// Crop of the map around (x, y): rows [y-h, y+h) and cols [x-h, x+h),
// clamped to the map bounds.
Matrix2Dd extract_zoom_window(const DifferentialMap& map, int x, int y, int half_size = 15);

nlohmann::json candidate_to_json(const Candidate& c);
nlohmann::json comparison_to_json(const ComparisonResult& result);
nlohmann::json results_to_json(const std::vector<ComparisonResult>& results,
                               const RunContext& context);

std::string differential_filename(const ComparisonResult& result);
std::string zoom_filename(const ComparisonResult& result, const Candidate& candidate);

// Writes the differential map of every successful comparison as FITS.
// Failed comparisons are skipped. Returns the written paths.
std::vector<fs::path> write_differentials(const std::vector<ComparisonResult>& results,
                                          const fs::path& out_dir,
                                          const RunContext& context);

// Writes one FITS crop per promising candidate. Returns the written paths.
std::vector<fs::path> write_zoom_windows(const std::vector<ComparisonResult>& results,
                                         const fs::path& out_dir, int half_size);

} // namespace frame_diff::report
