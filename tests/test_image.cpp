#include "speckle_track/core/errors.hpp"
#include "speckle_track/image/interpolation.hpp"
#include "speckle_track/image/mask.hpp"
#include "speckle_track/image/processing.hpp"
#include "speckle_track/image/whitefield.hpp"

#include <cmath>
#include <limits>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace image = speckle_track::image;
namespace config = speckle_track::config;
using speckle_track::FrameStack;
using speckle_track::MaskMatrix;
using speckle_track::Matrix2Dd;
using speckle_track::Matrix2Df;

namespace {

const double kNaN = std::numeric_limits<double>::quiet_NaN();

} // namespace

TEST_CASE("update_mask_no_bad_keeps_every_pixel") {
    FrameStack<double> frames{Matrix2Dd::Constant(3, 4, -5.0)};
    config::MaskConfig cfg;
    const MaskMatrix mask = image::update_mask(frames, cfg);
    REQUIRE(mask.rows() == 3);
    REQUIRE(mask.cols() == 4);
    REQUIRE(mask.cast<int>().sum() == 12);
}

TEST_CASE("update_mask_range_bad_requires_all_frames_in_range") {
    Matrix2Dd a = Matrix2Dd::Constant(2, 2, 10.0);
    Matrix2Dd b = Matrix2Dd::Constant(2, 2, 10.0);
    a(0, 0) = 100.0;  // upper bound is exclusive
    b(1, 1) = -1.0;
    config::MaskConfig cfg;
    cfg.method = "range-bad";
    cfg.vmin = 0.0;
    cfg.vmax = 100.0;

    const MaskMatrix mask = image::update_mask(FrameStack<double>{a, b}, cfg);
    REQUIRE(mask(0, 0) == 0);
    REQUIRE(mask(0, 1) == 1);
    REQUIRE(mask(1, 0) == 1);
    REQUIRE(mask(1, 1) == 0);
}

TEST_CASE("update_mask_perc_bad_flags_hot_pixel") {
    FrameStack<float> frames(3, Matrix2Df::Constant(5, 5, 10.0f));
    frames[1](2, 2) = 1000.0f;
    config::MaskConfig cfg;
    cfg.method = "perc-bad";
    cfg.pmin = 0.0;
    cfg.pmax = 99.0;

    const MaskMatrix mask = image::update_mask(frames, cfg);
    REQUIRE(mask(2, 2) == 0);
    REQUIRE(mask.cast<int>().sum() == 24);
}

TEST_CASE("update_mask_rejects_unknown_method_and_ragged_stack") {
    config::MaskConfig cfg;
    cfg.method = "bogus";
    FrameStack<double> frames{Matrix2Dd::Zero(2, 2)};
    REQUIRE_THROWS_AS(image::update_mask(frames, cfg), speckle_track::ValidationError);

    FrameStack<double> ragged{Matrix2Dd::Zero(2, 2), Matrix2Dd::Zero(3, 2)};
    REQUIRE_THROWS_AS(image::check_stack(ragged), speckle_track::ShapeMismatchError);
    REQUIRE_THROWS_AS(image::check_stack(FrameStack<double>{}), speckle_track::ShapeMismatchError);
}

TEST_CASE("resolve_mask_expands_empty_and_checks_shape") {
    const MaskMatrix all = image::resolve_mask(MaskMatrix(), 2, 3);
    REQUIRE(all.rows() == 2);
    REQUIRE(all.cast<int>().sum() == 6);
    REQUIRE_THROWS_AS(image::resolve_mask(MaskMatrix::Ones(3, 3), 2, 3),
                      speckle_track::ShapeMismatchError);
}

TEST_CASE("estimate_whitefield_median_and_mean") {
    FrameStack<double> frames;
    for (double v : {1.0, 5.0, 2.0, 100.0}) {
        frames.push_back(Matrix2Dd::Constant(2, 2, v));
    }
    MaskMatrix mask = MaskMatrix::Ones(2, 2);
    mask(1, 0) = 0;

    const Matrix2Dd med = image::estimate_whitefield(frames, mask, "median");
    REQUIRE(med(0, 0) == Catch::Approx(3.5));
    REQUIRE(med(1, 0) == 0.0);

    const Matrix2Dd mean = image::estimate_whitefield(frames, mask, "mean");
    REQUIRE(mean(0, 1) == Catch::Approx(27.0));
    REQUIRE(mean(1, 0) == 0.0);

    REQUIRE_THROWS_AS(image::estimate_whitefield(frames, mask, "mode"),
                      speckle_track::ValidationError);
}

TEST_CASE("estimate_whitefield_ignores_non_finite_samples") {
    FrameStack<double> frames{Matrix2Dd::Constant(1, 2, 4.0), Matrix2Dd::Constant(1, 2, kNaN),
                              Matrix2Dd::Constant(1, 2, 6.0)};
    frames[0](0, 1) = kNaN;
    frames[2](0, 1) = kNaN;
    const Matrix2Dd wf = image::estimate_whitefield(frames, MaskMatrix(), "median");
    REQUIRE(wf(0, 0) == Catch::Approx(5.0));
    REQUIRE(wf(0, 1) == 0.0);
}

TEST_CASE("estimate_whitefield_does_not_depend_on_frame_order") {
    FrameStack<double> frames;
    for (int n = 0; n < 7; ++n) {
        Matrix2Dd f(3, 3);
        for (int i = 0; i < 9; ++i) {
            f.data()[i] = std::sin(0.7 * n + 1.3 * i) * 10.0 + 0.1 * n;
        }
        frames.push_back(f);
    }
    FrameStack<double> shuffled{frames[3], frames[6], frames[0], frames[5],
                                frames[1], frames[4], frames[2]};

    for (const char* method : {"median", "mean"}) {
        const Matrix2Dd a = image::estimate_whitefield(frames, MaskMatrix(), method, 1);
        const Matrix2Dd b = image::estimate_whitefield(shuffled, MaskMatrix(), method, 3);
        REQUIRE(a == b);
    }
}

TEST_CASE("dynamic_whitefields_and_flatfield_correction") {
    FrameStack<double> frames(5, Matrix2Dd::Constant(2, 2, 100.0));
    const Matrix2Dd wf = Matrix2Dd::Constant(2, 2, 100.0);
    const auto dyn = image::estimate_dynamic_whitefields(frames, wf, 3);
    REQUIRE(dyn.size() == 5);
    REQUIRE(dyn[2](1, 1) == Catch::Approx(100.0));

    FrameStack<double> halves(5, Matrix2Dd::Constant(2, 2, 50.0));
    const auto corrected = image::apply_flatfield_correction(frames, wf, halves);
    REQUIRE(corrected[4](0, 1) == Catch::Approx(200.0));

    FrameStack<double> too_few(2, Matrix2Dd::Constant(2, 2, 50.0));
    REQUIRE_THROWS_AS(image::apply_flatfield_correction(frames, wf, too_few),
                      speckle_track::ShapeMismatchError);
}

TEST_CASE("eigen_flatfields_capture_a_rank_two_illumination_drift") {
    const Matrix2Dd w = Matrix2Dd::Constant(4, 5, 100.0);
    Matrix2Dd p1(4, 5);
    Matrix2Dd p2(4, 5);
    for (int r = 0; r < 4; ++r) {
        for (int c = 0; c < 5; ++c) {
            p1(r, c) = r - 1.5;
            p2(r, c) = (c % 2 == 0) ? 1.0 : -1.0;
        }
    }
    const std::vector<double> a{10.0, -20.0, 30.0, 5.0};
    const std::vector<double> b{3.0, -1.0, 2.0, 4.0};
    FrameStack<double> frames;
    for (size_t n = 0; n < a.size(); ++n) {
        frames.push_back(w + a[n] * p1 + b[n] * p2);
    }
    MaskMatrix mask = MaskMatrix::Ones(4, 5);
    mask(0, 0) = 0;

    const auto effs = image::eigen_flatfields(frames, w, mask, 2);
    REQUIRE(effs.flatfields.size() == 2);
    REQUIRE(effs.explained.size() == 2);
    REQUIRE(effs.explained[0] >= effs.explained[1]);
    REQUIRE(effs.explained[0] + effs.explained[1] == Catch::Approx(1.0).margin(1e-9));
    REQUIRE(effs.flatfields[0](0, 0) == 0.0);

    const auto dynamic = image::pca_whitefields(frames, w, mask, effs.flatfields);
    REQUIRE(dynamic.size() == 4);
    for (size_t n = 0; n < frames.size(); ++n) {
        REQUIRE(dynamic[n](0, 0) == 100.0);
        for (int r = 0; r < 4; ++r) {
            for (int c = 0; c < 5; ++c) {
                if (r == 0 && c == 0) continue;
                REQUIRE(dynamic[n](r, c) == Catch::Approx(frames[n](r, c)).margin(1e-9));
            }
        }
    }

    // The leading component alone carries the large drift only
    const auto leading = image::eigen_flatfields(frames, w, MaskMatrix(), 1);
    const auto partial = image::pca_whitefields(frames, w, MaskMatrix(), leading.flatfields);
    REQUIRE(leading.explained[0] > 0.9);
    REQUIRE(std::abs(partial[2](3, 0) - frames[2](3, 0)) < std::abs(frames[2](3, 0) - 100.0));

    REQUIRE_THROWS_AS(image::pca_whitefields(frames, w, mask, FrameStack<double>{}),
                      speckle_track::ValidationError);
    REQUIRE_THROWS_AS(image::eigen_flatfields(frames, Matrix2Dd::Constant(3, 5, 1.0), mask),
                      speckle_track::ShapeMismatchError);
}

TEST_CASE("masked_gaussian_blur_ignores_unknown_pixels") {
    Matrix2Dd values = Matrix2Dd::Constant(6, 6, -1.0);
    values(3, 3) = 50.0;
    MaskMatrix known = MaskMatrix::Ones(6, 6);
    known(3, 3) = 0;

    const Matrix2Dd out = image::masked_gaussian_blur(values, known, 1.5);
    REQUIRE(out(3, 3) == 50.0);
    for (int r = 0; r < 6; ++r) {
        for (int c = 0; c < 6; ++c) {
            if (r == 3 && c == 3) continue;
            REQUIRE(out(r, c) == Catch::Approx(-1.0).margin(1e-12));
        }
    }
}

TEST_CASE("good_frames_skips_empty_frames") {
    FrameStack<float> frames{Matrix2Df::Zero(2, 2), Matrix2Df::Ones(2, 2), Matrix2Df::Zero(2, 2)};
    const auto idx = image::good_frames(frames);
    REQUIRE(idx == std::vector<int>{1});

    const auto kept = image::select_frames(frames, idx);
    REQUIRE(kept.size() == 1);
    REQUIRE(kept[0](0, 0) == 1.0f);
    REQUIRE_THROWS_AS(image::select_frames(frames, {3}), speckle_track::ValidationError);
}

TEST_CASE("integrate_frames_sums_masked_pixels_along_axis") {
    Matrix2Dd f(2, 3);
    f << 1.0, 2.0, 3.0, 4.0, 5.0, 6.0;
    MaskMatrix mask = MaskMatrix::Ones(2, 3);
    mask(1, 2) = 0;

    const auto along_rows = image::integrate_frames(FrameStack<double>{f}, mask, 0);
    REQUIRE(along_rows[0].rows() == 1);
    REQUIRE(along_rows[0].cols() == 3);
    REQUIRE(along_rows[0](0, 0) == 5.0);
    REQUIRE(along_rows[0](0, 2) == 3.0);

    const auto along_cols = image::integrate_frames(FrameStack<double>{f}, mask, 1);
    REQUIRE(along_cols[0].rows() == 2);
    REQUIRE(along_cols[0].cols() == 1);
    REQUIRE(along_cols[0](1, 0) == 9.0);

    REQUIRE_THROWS_AS(image::integrate_frames(FrameStack<double>{f}, mask, 2),
                      speckle_track::ValidationError);
}

TEST_CASE("window_mean_is_defined_only_for_full_finite_windows") {
    Matrix2Dd img = Matrix2Dd::Constant(5, 5, 2.0);
    img(0, 0) = kNaN;
    const Matrix2Dd out = image::window_mean(img, 3);

    REQUIRE(std::isnan(out(0, 2)));
    REQUIRE(std::isnan(out(4, 4)));
    REQUIRE(std::isnan(out(1, 1)));
    REQUIRE(out(2, 2) == Catch::Approx(2.0));
    REQUIRE(out(1, 2) == Catch::Approx(2.0));
    REQUIRE(out(3, 3) == Catch::Approx(2.0));

    const Matrix2Dd small = image::window_mean(Matrix2Dd::Ones(2, 2), 3);
    REQUIRE(std::isnan(small(0, 0)));
}

TEST_CASE("fill_from_neighbours_fills_only_unknown_pixels") {
    Matrix2Dd values = Matrix2Dd::Constant(5, 5, 5.0);
    values(1, 1) = 7.0;
    values(2, 2) = kNaN;
    MaskMatrix known = MaskMatrix::Ones(5, 5);
    known(2, 2) = 0;

    const Matrix2Dd out = image::fill_from_neighbours(values, known, 1.0);
    REQUIRE(std::isfinite(out(2, 2)));
    REQUIRE(out(2, 2) > 5.0);
    REQUIRE(out(2, 2) < 7.0);
    REQUIRE(out(1, 1) == 7.0);
    REQUIRE(out(0, 0) == 5.0);
}

TEST_CASE("gaussian_blur_preserves_constants") {
    const Matrix2Df img = Matrix2Df::Constant(6, 7, 3.0f);
    const Matrix2Df out = image::gaussian_blur(img, 1.5);
    REQUIRE(out.rows() == 6);
    REQUIRE(out.cols() == 7);
    REQUIRE(out(0, 0) == Catch::Approx(3.0f));
    REQUIRE(out(5, 6) == Catch::Approx(3.0f));
    REQUIRE(image::gaussian_blur(img, 0.0) == img);
}

TEST_CASE("make_stencil_bilinear_and_nearest") {
    speckle_track::ReferenceGrid grid;
    grid.rows = 3;
    grid.cols = 3;
    image::Stencil st;

    SECTION("exact grid hit is a single cell") {
        REQUIRE(image::make_stencil(grid, 1.0, 1.0, true, st));
        REQUIRE(st.n == 1);
        REQUIRE(st.row[0] == 1);
        REQUIRE(st.col[0] == 1);
        REQUIRE(st.weight[0] == 1.0);
    }
    SECTION("half-way sample splits its weight") {
        REQUIRE(image::make_stencil(grid, 0.5, 1.0, true, st));
        REQUIRE(st.n == 2);
        REQUIRE(st.weight[0] + st.weight[1] == Catch::Approx(1.0));
        REQUIRE(st.weight[0] == Catch::Approx(0.5));
    }
    SECTION("zero-weight corners beyond the edge are ignored") {
        REQUIRE(image::make_stencil(grid, 1.5, 2.0, true, st));
        REQUIRE(st.n == 2);
        REQUIRE(st.col[0] == 2);
        REQUIRE(st.col[1] == 2);
    }
    SECTION("out-of-bounds samples are excluded") {
        REQUIRE_FALSE(image::make_stencil(grid, 2.5, 1.0, true, st));
        REQUIRE(st.n == 0);
        REQUIRE_FALSE(image::make_stencil(grid, -0.2, 1.0, true, st));
        REQUIRE_FALSE(image::make_stencil(grid, kNaN, 1.0, true, st));
    }
    SECTION("nearest cell") {
        REQUIRE(image::make_stencil(grid, 1.4, 1.6, false, st));
        REQUIRE(st.n == 1);
        REQUIRE(st.row[0] == 1);
        REQUIRE(st.col[0] == 2);
        REQUIRE_FALSE(image::make_stencil(grid, 2.6, 0.0, false, st));
    }
    SECTION("grid spacing and origin") {
        grid.origin_ss = -1.0;
        grid.ds_x = 0.5;
        REQUIRE(image::make_stencil(grid, 0.0, 0.5, true, st));
        REQUIRE(st.n == 1);
        REQUIRE(st.row[0] == 1);
        REQUIRE(st.col[0] == 1);
    }
}

TEST_CASE("sample_reference_rejects_no_data_cells") {
    speckle_track::ReferenceImage<double> ref;
    ref.grid.rows = 2;
    ref.grid.cols = 2;
    ref.image = Matrix2Dd::Constant(2, 2, 4.0);
    ref.image(1, 1) = kNaN;

    double v = 0.0;
    REQUIRE(image::sample_reference(ref, 0.0, 0.5, true, v));
    REQUIRE(v == Catch::Approx(4.0));
    REQUIRE_FALSE(image::sample_reference(ref, 0.5, 0.5, true, v));
    REQUIRE(image::sample_reference(ref, 0.5, 0.5, false, v) == false);
}
