#pragma once

#include "frame_diff/core/types.hpp"

namespace frame_diff::image {

// Radius of the truncated Gaussian kernel: int(truncate * sigma + 0.5).
int gaussian_kernel_radius(double sigma, double truncate);

// Isotropic Gaussian low-pass with mirrored borders (edge pixel repeated).
Matrix2Dd gaussian_smooth(const Matrix2Dd& frame, double sigma, double truncate = 4.0);

// frame - gaussian_smooth(frame): strips sky gradients and vignetting,
// keeps structure smaller than the filter scale.
Matrix2Dd suppress_background(const Matrix2Dd& frame, double sigma, double truncate = 4.0);

} // namespace frame_diff::image
