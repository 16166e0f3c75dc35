#include "frame_diff/detection/threshold.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using frame_diff::Matrix2Dd;
namespace detection = frame_diff::detection;

TEST_CASE("threshold_of_all_zero_map_is_zero_and_extracts_nothing") {
    Matrix2Dd map = Matrix2Dd::Zero(20, 30);

    auto thr = detection::compute_threshold(map);
    REQUIRE(thr.stddev == 0.0);
    REQUIRE(thr.threshold == 0.0);
    REQUIRE(thr.promising_cutoff == 0.0);
    REQUIRE(detection::extract_points(map, thr.threshold).empty());
}

TEST_CASE("threshold_of_constant_nonzero_map_extracts_every_cell") {
    Matrix2Dd map = Matrix2Dd::Constant(3, 3, 3.0);

    auto thr = detection::compute_threshold(map);
    REQUIRE(thr.threshold == 0.0);
    REQUIRE(detection::extract_points(map, thr.threshold).size() == 9);
}

TEST_CASE("threshold_uses_population_stddev_and_multipliers") {
    Matrix2Dd map(2, 2);
    map << 0.0, 0.0,
           0.0, 10.0;

    // mean 2.5, population variance 18.75
    const double expected_std = std::sqrt(18.75);

    auto thr = detection::compute_threshold(map, 5.0, 3.0);
    REQUIRE(thr.stddev == Catch::Approx(expected_std).epsilon(1e-12));
    REQUIRE(thr.threshold == Catch::Approx(5.0 * expected_std).epsilon(1e-12));
    REQUIRE(thr.promising_cutoff == Catch::Approx(15.0 * expected_std).epsilon(1e-12));
    REQUIRE(detection::extract_points(map, thr.threshold).empty());

    auto loose = detection::compute_threshold(map, 1.0, 3.0);
    auto pts = detection::extract_points(map, loose.threshold);
    REQUIRE(pts.size() == 1);
    REQUIRE(pts[0].x == 1);
    REQUIRE(pts[0].y == 1);
}

TEST_CASE("extract_points_scans_rows_top_to_bottom_then_columns") {
    Matrix2Dd map = Matrix2Dd::Zero(3, 3);
    map(0, 2) = 1.0;
    map(1, 0) = 1.0;
    map(1, 1) = 1.0;
    map(2, 0) = 1.0;

    auto pts = detection::extract_points(map, 0.5);

    REQUIRE(pts.size() == 4);
    REQUIRE((pts[0].x == 2 && pts[0].y == 0));
    REQUIRE((pts[1].x == 0 && pts[1].y == 1));
    REQUIRE((pts[2].x == 1 && pts[2].y == 1));
    REQUIRE((pts[3].x == 0 && pts[3].y == 2));
}

TEST_CASE("extract_points_comparison_is_strict") {
    Matrix2Dd map = Matrix2Dd::Constant(2, 2, 4.0);
    REQUIRE(detection::extract_points(map, 4.0).empty());
    REQUIRE(detection::extract_points(map, 3.999).size() == 4);
}
