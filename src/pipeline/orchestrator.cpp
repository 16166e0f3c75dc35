#include "frame_diff/pipeline/orchestrator.hpp"

#include "frame_diff/core/errors.hpp"
#include "frame_diff/detection/classifier.hpp"
#include "frame_diff/detection/differencer.hpp"
#include "frame_diff/detection/threshold.hpp"
#include "frame_diff/image/background.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

namespace frame_diff::pipeline {

namespace {

std::string shape_string(const Matrix2Dd& m) {
    return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

std::string pairing_message(const std::string& comparison_id, const std::string& cause) {
    return "Error comparing with " + comparison_id + ": " + cause;
}

ComparisonResult failed_pairing(const std::string& reference_id, const std::string& comparison_id,
                                int pairing_index, PairingErrorKind kind,
                                const std::string& cause) {
    ComparisonResult failed;
    failed.reference_id = reference_id;
    failed.comparison_id = comparison_id;
    failed.pairing_index = pairing_index;
    failed.state = PairingState::FAILED;
    failed.error = PairingError{kind, pairing_message(comparison_id, cause)};
    return failed;
}

} // namespace

ComparisonResult compare_with_reference(const Matrix2Dd& reference_suppressed,
                                        const Frame& comparison,
                                        const config::DetectionConfig& detection,
                                        int pairing_index,
                                        const std::string& signature) {
    if (reference_suppressed.rows() != comparison.rows() ||
        reference_suppressed.cols() != comparison.cols()) {
        throw ShapeMismatchError("reference is " + shape_string(reference_suppressed) +
                                 ", comparison is " + shape_string(comparison));
    }
    if (!comparison.allFinite()) {
        throw ValidationError("comparison frame contains non-finite pixels");
    }

    ComparisonResult result;
    result.pairing_index = pairing_index;
    result.state = PairingState::LOADED;

    const Matrix2Dd comparison_suppressed = image::suppress_background(
        comparison, detection.suppression_sigma, detection.gaussian_truncate);
    result.state = PairingState::SUPPRESSED;

    DifferentialMap diff = detection::absolute_difference(reference_suppressed,
                                                          comparison_suppressed);
    result.state = PairingState::DIFFERENCED;

    const detection::ThresholdResult thr = detection::compute_threshold(
        diff, detection.detection_multiplier, detection.promising_multiplier);
    const std::vector<PixelCoord> points = detection::extract_points(diff, thr.threshold);
    result.map_stddev = thr.stddev;
    result.threshold = thr.threshold;
    result.promising_cutoff = thr.promising_cutoff;
    result.state = PairingState::THRESHOLDED;

    result.all_candidates = detection::classify_candidates(
        points, diff, thr.promising_cutoff, pairing_index, signature,
        detection.magnitude_decimals);
    result.promising_candidates = detection::select_promising(result.all_candidates);
    result.state = PairingState::CLASSIFIED;

    result.differential = std::move(diff);
    result.state = PairingState::DONE;
    return result;
}

PairwiseOrchestrator::PairwiseOrchestrator(const io::FrameLoader& loader,
                                           const config::Config& cfg,
                                           RunContext context,
                                           core::EventEmitter& emitter,
                                           std::ostream& event_log)
    : loader_(loader),
      cfg_(cfg),
      context_(std::move(context)),
      emitter_(emitter),
      event_log_(event_log) {}

int PairwiseOrchestrator::compute_worker_count(size_t task_count) const {
    int workers = cfg_.runtime.parallel_workers;
    if (workers < 1) {
        workers = 1;
    }
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(task_count));
    }
    return std::max(1, workers);
}

ComparisonResult PairwiseOrchestrator::process_pairing(const Matrix2Dd& reference_suppressed,
                                                       const std::string& reference_id,
                                                       const std::string& comparison_id,
                                                       int pairing_index) const {
    Frame comparison;
    try {
        comparison = loader_.load(comparison_id);
    } catch (const std::exception& e) {
        const PairingLoadError err(e.what());
        return failed_pairing(reference_id, comparison_id, pairing_index,
                              PairingErrorKind::PAIRING_LOAD, err.what());
    }

    try {
        ComparisonResult result = compare_with_reference(
            reference_suppressed, comparison, cfg_.detection, pairing_index,
            context_.signature);
        result.reference_id = reference_id;
        result.comparison_id = comparison_id;
        return result;
    } catch (const ShapeMismatchError& e) {
        return failed_pairing(reference_id, comparison_id, pairing_index,
                              PairingErrorKind::SHAPE_MISMATCH, e.what());
    } catch (const std::exception& e) {
        return failed_pairing(reference_id, comparison_id, pairing_index,
                              PairingErrorKind::PROCESSING, e.what());
    }
}

std::vector<ComparisonResult> PairwiseOrchestrator::run(const std::vector<std::string>& frame_ids) {
    if (frame_ids.size() < 2) {
        throw UsageError("at least two frames are required for a multi-temporal comparison, got " +
                         std::to_string(frame_ids.size()));
    }

    const std::string& reference_id = frame_ids[0];
    Frame reference;
    try {
        reference = loader_.load(reference_id);
    } catch (const std::exception& e) {
        throw ReferenceLoadError("cannot load reference " + reference_id + ": " + e.what());
    }
    if (!reference.allFinite()) {
        throw ReferenceLoadError("reference " + reference_id + " contains non-finite pixels");
    }

    // The reference is suppressed once and shared read-only by every pairing.
    const Matrix2Dd reference_suppressed = image::suppress_background(
        reference, cfg_.detection.suppression_sigma, cfg_.detection.gaussian_truncate);

    const size_t n_pairings = frame_ids.size() - 1;
    std::vector<ComparisonResult> results(n_pairings);

    const int n_workers = compute_worker_count(n_pairings);
    if (n_workers > 1) {
        std::cerr << "[DETECT] Using " << n_workers << " parallel workers for "
                  << n_pairings << " pairings" << std::endl;
    }

    std::atomic<size_t> next{0};
    std::mutex event_mutex;

    auto worker = [&]() {
        while (true) {
            const size_t slot = next.fetch_add(1);
            if (slot >= n_pairings) {
                break;
            }
            const int pairing_index = static_cast<int>(slot) + 1;
            const std::string& comparison_id = frame_ids[slot + 1];

            // Nothing thrown for one slot may reach the other slots.
            ComparisonResult result;
            try {
                {
                    std::lock_guard<std::mutex> lock(event_mutex);
                    emitter_.pairing_start(context_.run_id, pairing_index, reference_id,
                                           comparison_id, event_log_);
                }
                result = process_pairing(reference_suppressed, reference_id, comparison_id,
                                         pairing_index);
            } catch (const std::exception& e) {
                result = failed_pairing(reference_id, comparison_id, pairing_index,
                                        PairingErrorKind::PROCESSING, e.what());
            } catch (...) {
                result = failed_pairing(reference_id, comparison_id, pairing_index,
                                        PairingErrorKind::PROCESSING, "unknown error");
            }

            try {
                std::lock_guard<std::mutex> lock(event_mutex);
                if (result.ok()) {
                    emitter_.pairing_end(context_.run_id, result, event_log_);
                } else {
                    emitter_.pairing_failed(context_.run_id, result, event_log_);
                }
            } catch (const std::exception& e) {
                std::cerr << "[DETECT] event for comparison " << pairing_index
                          << " not written: " << e.what() << std::endl;
            }
            results[slot] = std::move(result);
        }
    };

    if (n_workers > 1) {
        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    return results;
}

} // namespace frame_diff::pipeline
