#pragma once

#include "frame_diff/core/types.hpp"

namespace frame_diff::detection {

// |a - b| element-wise. Throws ShapeMismatchError if shapes differ.
DifferentialMap absolute_difference(const Matrix2Dd& a, const Matrix2Dd& b);

} // namespace frame_diff::detection
