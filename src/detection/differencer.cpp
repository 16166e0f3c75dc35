#include "frame_diff/detection/differencer.hpp"
#include "frame_diff/core/errors.hpp"

#include <string>

namespace frame_diff::detection {

namespace {

std::string shape_string(const Matrix2Dd& m) {
    return "(" + std::to_string(m.rows()) + ", " + std::to_string(m.cols()) + ")";
}

} // namespace

DifferentialMap absolute_difference(const Matrix2Dd& a, const Matrix2Dd& b) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        throw ShapeMismatchError("operands could not be broadcast together with shapes " +
                                 shape_string(a) + " " + shape_string(b));
    }
    return (a - b).cwiseAbs();
}

} // namespace frame_diff::detection
