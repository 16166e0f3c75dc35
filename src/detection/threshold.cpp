#include "frame_diff/detection/threshold.hpp"
#include "frame_diff/core/utils.hpp"

namespace frame_diff::detection {

ThresholdResult compute_threshold(const DifferentialMap& map,
                                  double detection_multiplier,
                                  double promising_multiplier) {
    ThresholdResult r;
    r.stddev = core::compute_population_stddev(map);
    r.threshold = r.stddev * detection_multiplier;
    r.promising_cutoff = r.threshold * promising_multiplier;
    return r;
}

std::vector<PixelCoord> extract_points(const DifferentialMap& map, double threshold) {
    std::vector<PixelCoord> points;
    for (int y = 0; y < map.rows(); ++y) {
        for (int x = 0; x < map.cols(); ++x) {
            if (map(y, x) > threshold) {
                points.push_back({x, y});
            }
        }
    }
    return points;
}

} // namespace frame_diff::detection
