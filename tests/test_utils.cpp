#include "frame_diff/core/utils.hpp"
#include "frame_diff/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <filesystem>

using frame_diff::Matrix2Dd;
namespace core = frame_diff::core;
namespace fs = std::filesystem;

TEST_CASE("population_stddev_uses_ddof_zero") {
    Matrix2Dd data(1, 4);
    data << 2.0, 4.0, 4.0, 6.0;

    REQUIRE(core::compute_mean(data) == Catch::Approx(4.0));
    REQUIRE(core::compute_population_stddev(data) == Catch::Approx(std::sqrt(2.0)));
    REQUIRE(core::compute_population_stddev(Matrix2Dd(0, 0)) == 0.0);
}

TEST_CASE("round_to_decimals_rounds_half_to_even") {
    REQUIRE(core::round_to_decimals(2.5, 0) == 2.0);
    REQUIRE(core::round_to_decimals(3.5, 0) == 4.0);
    REQUIRE(core::round_to_decimals(982.4712, 2) == Catch::Approx(982.47));
    REQUIRE(core::round_to_decimals(-1.236, 2) == Catch::Approx(-1.24));
}

TEST_CASE("timestamps_and_run_ids_have_expected_shape") {
    const std::string ts = core::get_iso_timestamp();
    REQUIRE(ts.size() == 24);
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');

    const std::string run_id = core::get_run_id();
    REQUIRE(run_id.size() == 24);
    REQUIRE(run_id[8] == '_');
    REQUIRE(core::get_current_year() >= 2024);
}

TEST_CASE("write_text_and_sha256") {
    const fs::path path = fs::temp_directory_path() / "frame_diff_test_utils.txt";
    core::write_text(path, "abc");

    REQUIRE(fs::file_size(path) == 3);
    REQUIRE(core::sha256_file(path) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    fs::remove(path);
    REQUIRE(core::sha256_file(path).empty());
    REQUIRE_THROWS_AS(core::write_text("/nonexistent/dir/out.txt", "x"), frame_diff::IOError);
}

TEST_CASE("string_helpers") {
    REQUIRE(core::to_lower("Frame_01.FITS") == "frame_01.fits");
    REQUIRE(core::ends_with("frame.fits", ".fits"));
    REQUIRE_FALSE(core::ends_with("fits", ".fits"));

    // Bytes outside ASCII pass through unchanged.
    REQUIRE(core::to_lower("Se\xc3\xb1" "al.FITS") == "se\xc3\xb1" "al.fits");
    REQUIRE(core::to_lower("\xff\x80" "A") == "\xff\x80" "a");
}
