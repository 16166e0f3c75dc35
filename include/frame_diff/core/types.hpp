#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace frame_diff {

namespace fs = std::filesystem;

// Matrix types (NumPy equivalents)
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// One decoded exposure. Row-major (H, W), never mutated after load.
using Frame = Matrix2Dd;

// |suppressed(ref) - suppressed(cmp)|, same shape as the frames
using DifferentialMap = Matrix2Dd;

// Pixel coordinate into a DifferentialMap
struct PixelCoord {
    int x;   // column
    int y;   // row
};

// Detected point
struct Candidate {
    std::string id;        // "Diff-<pairing_index>-<ordinal>"
    int x;
    int y;
    double magnitude;      // map value, rounded
    bool promising;
    std::string signature; // run-scoped provenance tag
};

// Run-scoped values passed explicitly into the pipeline
struct RunContext {
    std::string run_id;
    std::string signature;
};

// Per-pairing state machine
enum class PairingState {
    PENDING = 0,
    LOADED = 1,
    SUPPRESSED = 2,
    DIFFERENCED = 3,
    THRESHOLDED = 4,
    CLASSIFIED = 5,
    DONE = 6,
    FAILED = 7
};

inline std::string pairing_state_to_string(PairingState state) {
    switch (state) {
        case PairingState::PENDING: return "PENDING";
        case PairingState::LOADED: return "LOADED";
        case PairingState::SUPPRESSED: return "SUPPRESSED";
        case PairingState::DIFFERENCED: return "DIFFERENCED";
        case PairingState::THRESHOLDED: return "THRESHOLDED";
        case PairingState::CLASSIFIED: return "CLASSIFIED";
        case PairingState::DONE: return "DONE";
        case PairingState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

// Failure kinds recorded on a ComparisonResult
enum class PairingErrorKind {
    PAIRING_LOAD,
    SHAPE_MISMATCH,
    PROCESSING
};

inline std::string pairing_error_kind_to_string(PairingErrorKind kind) {
    switch (kind) {
        case PairingErrorKind::PAIRING_LOAD: return "PAIRING_LOAD";
        case PairingErrorKind::SHAPE_MISMATCH: return "SHAPE_MISMATCH";
        case PairingErrorKind::PROCESSING: return "PROCESSING";
        default: return "UNKNOWN";
    }
}

struct PairingError {
    PairingErrorKind kind;
    std::string message;
};

// One reference-vs-comparison pairing.
// Exactly one of differential / error is set.
struct ComparisonResult {
    std::string reference_id;
    std::string comparison_id;
    int pairing_index = 0;          // 1-based input index of the comparison frame

    std::optional<DifferentialMap> differential;
    double map_stddev = 0.0;
    double threshold = 0.0;
    double promising_cutoff = 0.0;

    std::vector<Candidate> all_candidates;        // extraction order
    std::vector<Candidate> promising_candidates;  // descending magnitude

    PairingState state = PairingState::PENDING;
    std::optional<PairingError> error;

    bool ok() const { return !error.has_value(); }
};

} // namespace frame_diff
