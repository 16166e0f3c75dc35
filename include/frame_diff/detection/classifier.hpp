#pragma once

#include "frame_diff/core/types.hpp"
#include <string>
#include <vector>

namespace frame_diff::detection {

// "Diff-<pairing_index>-<ordinal>", ordinal 1-based
std::string make_candidate_id(int pairing_index, size_t ordinal);

// One Candidate per point, in point order. Magnitude is the map value rounded
// to `decimals`; promising iff the rounded magnitude exceeds the cutoff.
std::vector<Candidate> classify_candidates(const std::vector<PixelCoord>& points,
                                           const DifferentialMap& map,
                                           double promising_cutoff,
                                           int pairing_index,
                                           const std::string& signature,
                                           int decimals = 2);

// Promising candidates by descending magnitude; ties keep extraction order.
std::vector<Candidate> select_promising(const std::vector<Candidate>& candidates);

} // namespace frame_diff::detection
