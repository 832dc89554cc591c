#include "speckle_track/core/errors.hpp"
#include "speckle_track/io/fits_io.hpp"

#include <filesystem>
#include <string>
#include <tuple>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace io = speckle_track::io;
namespace fs = std::filesystem;
using speckle_track::FrameStack;
using speckle_track::Matrix2Dd;
using speckle_track::Matrix2Df;

namespace {

fs::path scratch_dir(const std::string& name) {
    const fs::path dir = fs::temp_directory_path() / ("speckle_track_test_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

} // namespace

TEST_CASE("fits_cube_keeps_plane_order_and_header") {
    const fs::path dir = scratch_dir("cube");
    FrameStack<float> planes;
    for (int n = 0; n < 3; ++n) {
        Matrix2Df p(3, 4);
        for (int r = 0; r < 3; ++r) {
            for (int c = 0; c < 4; ++c) {
                p(r, c) = static_cast<float>(100 * n + 10 * r + c);
            }
        }
        planes.push_back(p);
    }
    io::FitsHeader hdr;
    hdr.set("ORIGIN", std::string("speckle_track test"));
    hdr.set("NITER", 7);
    hdr.set("DSY", 0.5);

    const fs::path path = dir / "cube.fits";
    io::write_fits_cube(path, planes, hdr);

    REQUIRE(io::is_fits_image_path(path));
    REQUIRE(io::get_fits_dimensions(path) == std::make_tuple(4, 3, 3));

    const auto [frames, header] = io::read_fits_stack(path);
    REQUIRE(frames.size() == 3);
    REQUIRE(frames[2](1, 3) == 213.0f);
    REQUIRE(frames[0](2, 0) == 20.0f);
    REQUIRE(header.get_string("ORIGIN").value_or("") == "speckle_track test");
    REQUIRE(header.get_int("NITER").value_or(0) == 7);
    REQUIRE(header.get_double("DSY").value_or(0.0) == Catch::Approx(0.5));
    REQUIRE(header.get_double("NITER").value_or(0.0) == Catch::Approx(7.0));

    fs::remove_all(dir);
}

TEST_CASE("fits_stack_read_in_double_keeps_full_precision") {
    const fs::path dir = scratch_dir("precision");
    // Above 2^24 consecutive integers are no longer representable as float
    Matrix2Dd img(2, 2);
    img << 16777217.0, 16777219.0, 1.0 + 1.0e-9, -33554433.0;
    io::write_fits_double(dir / "frame.fits", img, io::FitsHeader{});

    const FrameStack<double> frames = io::read_fits_stack<double>(dir / "frame.fits").first;
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0](0, 0) == 16777217.0);
    REQUIRE(frames[0](0, 1) == 16777219.0);
    REQUIRE(frames[0](1, 0) == 1.0 + 1.0e-9);
    REQUIRE(frames[0](1, 1) == -33554433.0);

    const FrameStack<float> narrow = io::read_fits_stack(dir / "frame.fits").first;
    REQUIRE(static_cast<double>(narrow[0](0, 0)) != 16777217.0);
    fs::remove_all(dir);
}

TEST_CASE("fits_cube_rejects_empty_and_ragged_input") {
    const fs::path dir = scratch_dir("ragged");
    REQUIRE_THROWS_AS(io::write_fits_cube(dir / "empty.fits", {}, io::FitsHeader{}),
                      speckle_track::SpeckleTrackError);
    FrameStack<float> ragged{Matrix2Df::Zero(2, 2), Matrix2Df::Zero(3, 2)};
    REQUIRE_THROWS_AS(io::write_fits_cube(dir / "ragged.fits", ragged, io::FitsHeader{}),
                      speckle_track::SpeckleTrackError);
    fs::remove_all(dir);
}

TEST_CASE("fits_translations_are_padded_to_three_columns") {
    const fs::path dir = scratch_dir("translations");
    Matrix2Dd table(3, 2);
    table << 1.0e-6, 2.0e-6, 3.0e-6, 4.0e-6, 5.0e-6, 6.0e-6;
    io::write_fits_double(dir / "t.fits", table, io::FitsHeader{});

    const auto t = io::read_fits_translations(dir / "t.fits");
    REQUIRE(t.rows() == 3);
    REQUIRE(t(2, 0) == 5.0e-6);
    REQUIRE(t(1, 1) == 4.0e-6);
    REQUIRE(t(0, 2) == 0.0);

    io::write_fits_double(dir / "bad.fits", Matrix2Dd::Zero(3, 5), io::FitsHeader{});
    REQUIRE_THROWS_AS(io::read_fits_translations(dir / "bad.fits"),
                      speckle_track::ShapeMismatchError);
    fs::remove_all(dir);
}

TEST_CASE("fits_mask_marks_positive_pixels_valid") {
    const fs::path dir = scratch_dir("mask");
    Matrix2Df m(2, 2);
    m << 1.0f, 0.0f, -1.0f, 2.0f;
    io::write_fits_float(dir / "mask.fits", m, io::FitsHeader{});

    const auto mask = io::read_fits_mask(dir / "mask.fits");
    REQUIRE(mask(0, 0) == 1);
    REQUIRE(mask(0, 1) == 0);
    REQUIRE(mask(1, 0) == 0);
    REQUIRE(mask(1, 1) == 1);
    fs::remove_all(dir);
}

TEST_CASE("fits_paths_and_missing_files") {
    REQUIRE(io::is_fits_image_path("scan/frames.FITS"));
    REQUIRE(io::is_fits_image_path("mask.fit"));
    REQUIRE_FALSE(io::is_fits_image_path("frames.png"));
    REQUIRE_THROWS_AS(io::read_fits_stack("/nonexistent/frames.fits"), speckle_track::IOError);
}

TEST_CASE("fits_header_keys_are_upper_case_and_structural_cards_dropped") {
    io::FitsHeader hdr;
    hdr.set("defocx", 1.5e-4);
    hdr.set("SAVED", true);
    REQUIRE(hdr.get_double("DEFOCX").value_or(0.0) == Catch::Approx(1.5e-4));
    REQUIRE_FALSE(hdr.get_int("DEFOCX").has_value());
    REQUIRE_THROWS_AS(hdr.set("TOOLONGKEY", 1), speckle_track::FitsError);
    REQUIRE_THROWS_AS(hdr.set("", 1), speckle_track::FitsError);

    const fs::path dir = scratch_dir("header");
    io::write_fits_float(dir / "img.fits", Matrix2Df::Ones(2, 3), hdr);
    const auto [img, back] = io::read_fits_float(dir / "img.fits");
    REQUIRE(img.rows() == 2);
    REQUIRE(img.cols() == 3);
    REQUIRE(back.get_bool("saved").value_or(false));
    REQUIRE(back.get_double("DEFOCX").value_or(0.0) == Catch::Approx(1.5e-4));
    REQUIRE(back.cards.count("NAXIS1") == 0);
    REQUIRE(back.cards.count("BITPIX") == 0);
    fs::remove_all(dir);
}
