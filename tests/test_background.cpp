#include "frame_diff/image/background.hpp"
#include "frame_diff/core/types.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using frame_diff::Matrix2Dd;
namespace image = frame_diff::image;

TEST_CASE("gaussian_kernel_radius_matches_truncated_scale") {
    REQUIRE(image::gaussian_kernel_radius(15.0, 4.0) == 60);
    REQUIRE(image::gaussian_kernel_radius(1.0, 4.0) == 4);
    REQUIRE(image::gaussian_kernel_radius(1.2, 4.0) == 5);
}

TEST_CASE("suppress_background_preserves_shape") {
    Matrix2Dd frame = Matrix2Dd::Random(37, 53);
    auto out = image::suppress_background(frame, 15.0);
    REQUIRE(out.rows() == 37);
    REQUIRE(out.cols() == 53);
}

TEST_CASE("suppress_background_of_constant_frame_is_zero") {
    Matrix2Dd frame = Matrix2Dd::Constant(40, 40, 250.0);
    auto out = image::suppress_background(frame, 15.0);
    REQUIRE(out.cwiseAbs().maxCoeff() < 1e-9);
}

TEST_CASE("suppress_background_ignores_uniform_offset") {
    Matrix2Dd frame = Matrix2Dd::Random(64, 48) * 100.0;
    Matrix2Dd shifted = frame.array() + 5000.0;

    auto a = image::suppress_background(frame, 15.0);
    auto b = image::suppress_background(shifted, 15.0);

    REQUIRE((a - b).cwiseAbs().maxCoeff() < 1e-6);
}

TEST_CASE("suppress_background_removes_linear_ramp_away_from_borders") {
    const int n = 200;
    Matrix2Dd ramp(n, n);
    for (int y = 0; y < n; ++y) {
        for (int x = 0; x < n; ++x) {
            ramp(y, x) = 3.0 * x + 0.5 * y + 10.0;
        }
    }

    const double sigma = 5.0;
    const int r = image::gaussian_kernel_radius(sigma, 4.0);
    auto out = image::suppress_background(ramp, sigma);

    double worst = 0.0;
    for (int y = r; y < n - r; ++y) {
        for (int x = r; x < n - r; ++x) {
            worst = std::max(worst, std::fabs(out(y, x)));
        }
    }
    REQUIRE(worst < 1e-6);
}

TEST_CASE("suppress_background_keeps_point_source") {
    Matrix2Dd frame = Matrix2Dd::Zero(101, 101);
    frame(50, 50) = 1000.0;

    auto out = image::suppress_background(frame, 15.0);

    // The smoothed peak is roughly 1000 / (2 pi 15^2).
    REQUIRE(out(50, 50) > 990.0);
    REQUIRE(out(50, 50) < 1000.0);
    REQUIRE(out(50, 51) < 0.0);
}

TEST_CASE("suppress_background_twice_is_only_approximately_idempotent") {
    Matrix2Dd frame = Matrix2Dd::Zero(80, 80);
    frame.block(30, 30, 4, 4).setConstant(500.0);

    auto once = image::suppress_background(frame, 15.0);
    auto twice = image::suppress_background(once, 15.0);

    REQUIRE(twice.rows() == once.rows());
    REQUIRE(std::fabs(twice(31, 31) - once(31, 31)) < 0.01 * std::fabs(once(31, 31)));
    REQUIRE(twice(31, 31) != once(31, 31));
}

TEST_CASE("suppress_background_of_empty_frame_is_empty") {
    Matrix2Dd frame(0, 0);
    auto out = image::suppress_background(frame, 15.0);
    REQUIRE(out.size() == 0);
}
