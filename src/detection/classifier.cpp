#include "frame_diff/detection/classifier.hpp"
#include "frame_diff/core/utils.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace frame_diff::detection {

std::string make_candidate_id(int pairing_index, size_t ordinal) {
    return "Diff-" + std::to_string(pairing_index) + "-" + std::to_string(ordinal);
}

std::vector<Candidate> classify_candidates(const std::vector<PixelCoord>& points,
                                           const DifferentialMap& map,
                                           double promising_cutoff,
                                           int pairing_index,
                                           const std::string& signature,
                                           int decimals) {
    std::vector<Candidate> out;
    out.reserve(points.size());

    for (size_t j = 0; j < points.size(); ++j) {
        const PixelCoord& p = points[j];
        Candidate c;
        c.id = make_candidate_id(pairing_index, j + 1);
        c.x = p.x;
        c.y = p.y;
        c.magnitude = core::round_to_decimals(map(p.y, p.x), decimals);
        c.promising = c.magnitude > promising_cutoff;
        c.signature = signature;
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<Candidate> select_promising(const std::vector<Candidate>& candidates) {
    std::vector<Candidate> out;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(out),
                 [](const Candidate& c) { return c.promising; });
    std::stable_sort(out.begin(), out.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.magnitude > b.magnitude;
                     });
    return out;
}

} // namespace frame_diff::detection
