#pragma once

#include "frame_diff/config/configuration.hpp"
#include "frame_diff/core/events.hpp"
#include "frame_diff/core/types.hpp"
#include "frame_diff/io/frame_loader.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace frame_diff::pipeline {

// Runs suppression, differencing, thresholding and classification for one
// pairing. `reference_suppressed` is the already suppressed reference frame.
// Throws ShapeMismatchError if the frames differ in shape.
ComparisonResult compare_with_reference(const Matrix2Dd& reference_suppressed,
                                        const Frame& comparison,
                                        const config::DetectionConfig& detection,
                                        int pairing_index,
                                        const std::string& signature);

// Drives one reference frame against every later frame. Each pairing is
// isolated: its failure is recorded on its result and the run continues.
class PairwiseOrchestrator {
public:
    PairwiseOrchestrator(const io::FrameLoader& loader, const config::Config& cfg,
                         RunContext context, core::EventEmitter& emitter,
                         std::ostream& event_log);

    // One result per frame_ids[1..], in input order.
    // Throws UsageError for fewer than two ids and ReferenceLoadError when
    // frame_ids[0] cannot be loaded; no results are produced in either case.
    std::vector<ComparisonResult> run(const std::vector<std::string>& frame_ids);

    const RunContext& context() const { return context_; }

private:
    ComparisonResult process_pairing(const Matrix2Dd& reference_suppressed,
                                     const std::string& reference_id,
                                     const std::string& comparison_id,
                                     int pairing_index) const;

    int compute_worker_count(size_t task_count) const;

    const io::FrameLoader& loader_;
    config::Config cfg_;
    RunContext context_;
    core::EventEmitter& emitter_;
    std::ostream& event_log_;
};

} // namespace frame_diff::pipeline
