#pragma once

#include "frame_diff/core/types.hpp"
#include <vector>

namespace frame_diff::detection {

struct ThresholdResult {
    double stddev;            // population stddev of the map
    double threshold;         // stddev * detection_multiplier
    double promising_cutoff;  // threshold * promising_multiplier
};

ThresholdResult compute_threshold(const DifferentialMap& map,
                                  double detection_multiplier = 5.0,
                                  double promising_multiplier = 3.0);

// Coordinates with map(y, x) > threshold, rows top to bottom and columns
// left to right within a row. Candidate ids depend on this order.
std::vector<PixelCoord> extract_points(const DifferentialMap& map, double threshold);

} // namespace frame_diff::detection
