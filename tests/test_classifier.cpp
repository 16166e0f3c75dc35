#include "frame_diff/detection/classifier.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <vector>

using frame_diff::Candidate;
using frame_diff::Matrix2Dd;
using frame_diff::PixelCoord;
namespace detection = frame_diff::detection;

TEST_CASE("candidate_ids_encode_pairing_and_ordinal") {
    REQUIRE(detection::make_candidate_id(1, 1) == "Diff-1-1");
    REQUIRE(detection::make_candidate_id(3, 42) == "Diff-3-42");
}

TEST_CASE("classify_candidates_rounds_and_flags_in_point_order") {
    Matrix2Dd map = Matrix2Dd::Zero(2, 3);
    map(0, 1) = 12.3456;
    map(1, 0) = 0.125;
    map(1, 2) = 50.0;

    std::vector<PixelCoord> pts = {{1, 0}, {0, 1}, {2, 1}};
    auto cands = detection::classify_candidates(pts, map, 12.0, 2, "FD-2026");

    REQUIRE(cands.size() == 3);
    REQUIRE(cands[0].id == "Diff-2-1");
    REQUIRE(cands[1].id == "Diff-2-2");
    REQUIRE(cands[2].id == "Diff-2-3");

    REQUIRE(cands[0].x == 1);
    REQUIRE(cands[0].y == 0);
    REQUIRE(cands[0].magnitude == Catch::Approx(12.35));
    REQUIRE(cands[0].promising);

    // 12.5 rounds half to even
    REQUIRE(cands[1].magnitude == Catch::Approx(0.12));
    REQUIRE_FALSE(cands[1].promising);

    REQUIRE(cands[2].magnitude == Catch::Approx(50.0));
    REQUIRE(cands[2].promising);

    for (const auto& c : cands) {
        REQUIRE(c.signature == "FD-2026");
    }
}

TEST_CASE("promising_flag_compares_rounded_magnitude_strictly") {
    Matrix2Dd map = Matrix2Dd::Zero(1, 2);
    map(0, 0) = 9.999;   // rounds to 10.00
    map(0, 1) = 10.004;  // rounds to 10.00

    auto cands = detection::classify_candidates({{0, 0}, {1, 0}}, map, 10.0, 1, "");
    REQUIRE_FALSE(cands[0].promising);
    REQUIRE_FALSE(cands[1].promising);
}

TEST_CASE("select_promising_sorts_descending_and_keeps_tie_order") {
    std::vector<Candidate> all = {
        {"Diff-1-1", 0, 0, 5.0, true, ""},
        {"Diff-1-2", 1, 0, 1.0, false, ""},
        {"Diff-1-3", 2, 0, 9.0, true, ""},
        {"Diff-1-4", 3, 0, 5.0, true, ""},
        {"Diff-1-5", 4, 0, 7.5, true, ""},
    };

    auto promising = detection::select_promising(all);

    REQUIRE(promising.size() == 4);
    REQUIRE(promising[0].id == "Diff-1-3");
    REQUIRE(promising[1].id == "Diff-1-5");
    REQUIRE(promising[2].id == "Diff-1-1");
    REQUIRE(promising[3].id == "Diff-1-4");
}

TEST_CASE("select_promising_of_no_promising_candidates_is_empty") {
    std::vector<Candidate> all = {{"Diff-1-1", 0, 0, 5.0, false, ""}};
    REQUIRE(detection::select_promising(all).empty());
    REQUIRE(detection::select_promising({}).empty());
}
