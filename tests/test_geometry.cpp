#include "speckle_track/core/errors.hpp"
#include "speckle_track/geometry/geometry.hpp"
#include "speckle_track/geometry/transform.hpp"

#include <memory>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace geometry = speckle_track::geometry;
namespace config = speckle_track::config;
using speckle_track::Matrix2Dd;
using speckle_track::Translations;

TEST_CASE("pixel_translations_project_and_center_stage_motion") {
    config::GeometryConfig cfg;
    // |z / df| = 2e4, 2.75e-9 m along y -> 1 px along ss (basis points along -y)
    Translations t = Translations::Zero(2, 3);
    t(1, 1) = 2.75e-9;

    const auto px = geometry::pixel_translations<double>(t, cfg);
    REQUIRE(px.size() == 2);
    REQUIRE(px.di(0) == Catch::Approx(0.5));
    REQUIRE(px.di(1) == Catch::Approx(-0.5));
    REQUIRE(px.dj(0) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(px.dj(1) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(px.di.sum() == Catch::Approx(0.0).margin(1e-12));
}

TEST_CASE("pixel_translations_of_single_frame_are_zero") {
    config::GeometryConfig cfg;
    Translations t(1, 3);
    t << 1.0e-6, -3.0e-6, 0.0;
    const auto px = geometry::pixel_translations<float>(t, cfg);
    REQUIRE(px.size() == 1);
    REQUIRE(px.di(0) == Catch::Approx(0.0f).margin(1e-6));
    REQUIRE(px.dj(0) == Catch::Approx(0.0f).margin(1e-6));
}

TEST_CASE("pixel_translations_reject_degenerate_geometry") {
    Translations t = Translations::Zero(2, 3);

    SECTION("zero basis vector") {
        config::GeometryConfig cfg;
        cfg.basis_vectors[0] = {0.0, 0.0, 0.0};
        REQUIRE_THROWS_AS(geometry::pixel_translations<double>(t, cfg),
                          speckle_track::DegenerateGeometryError);
    }
    SECTION("zero defocus") {
        config::GeometryConfig cfg;
        cfg.defocus_x = 0.0;
        REQUIRE_THROWS_AS(geometry::pixel_translations<double>(t, cfg),
                          speckle_track::DegenerateGeometryError);
    }
    SECTION("zero pixel size") {
        config::GeometryConfig cfg;
        cfg.x_pixel_size = 0.0;
        REQUIRE_THROWS_AS(geometry::pixel_translations<double>(t, cfg),
                          speckle_track::DegenerateGeometryError);
    }
}

TEST_CASE("to_translations_pads_two_columns_and_rejects_others") {
    Eigen::MatrixXd two(2, 2);
    two << 1.0, 2.0, 3.0, 4.0;
    const Translations t = geometry::to_translations(two);
    REQUIRE(t.rows() == 2);
    REQUIRE(t(1, 0) == 3.0);
    REQUIRE(t(1, 1) == 4.0);
    REQUIRE(t(0, 2) == 0.0);
    REQUIRE(t(1, 2) == 0.0);

    Eigen::MatrixXd four = Eigen::MatrixXd::Zero(3, 4);
    REQUIRE_THROWS_AS(geometry::to_translations(four), speckle_track::ShapeMismatchError);
}

TEST_CASE("initialize_pixel_map_is_identity_for_positive_defocus") {
    config::GeometryConfig cfg;
    Translations t = Translations::Zero(3, 3);
    const auto init = geometry::initialize_pixel_map<double>(4, 5, cfg, t);
    REQUIRE(init.pixel_map.rows() == 4);
    REQUIRE(init.pixel_map.cols() == 5);
    for (int r = 0; r < 4; ++r) {
        for (int c = 0; c < 5; ++c) {
            REQUIRE(init.pixel_map.ss(r, c) == r);
            REQUIRE(init.pixel_map.fs(r, c) == c);
        }
    }
    REQUIRE(init.translations.size() == 3);
    REQUIRE(init.translation_residual.rows() == 3);
    REQUIRE(init.translation_residual.cols() == 2);
}

TEST_CASE("initialize_pixel_map_flips_axes_with_negative_defocus") {
    Translations t = Translations::Zero(1, 3);

    SECTION("negative fast-axis defocus reverses columns") {
        config::GeometryConfig cfg;
        cfg.defocus_x = -1.0e-4;
        cfg.defocus_y = 1.0e-4;
        const auto init = geometry::initialize_pixel_map<double>(3, 4, cfg, t);
        REQUIRE(init.pixel_map.fs(0, 0) == 3.0);
        REQUIRE(init.pixel_map.fs(0, 3) == 0.0);
        REQUIRE(init.pixel_map.ss(2, 0) == 2.0);
    }
    SECTION("negative slow-axis defocus reverses rows") {
        config::GeometryConfig cfg;
        cfg.defocus_y = -1.0e-4;
        const auto init = geometry::initialize_pixel_map<double>(3, 4, cfg, t);
        REQUIRE(init.pixel_map.ss(0, 0) == 2.0);
        REQUIRE(init.pixel_map.ss(2, 0) == 0.0);
        REQUIRE(init.pixel_map.fs(0, 1) == 1.0);
    }
}

TEST_CASE("initialize_pixel_map_adds_prior_and_checks_its_shape") {
    config::GeometryConfig cfg;
    Translations t = Translations::Zero(1, 3);

    speckle_track::PixelMap<double> prior;
    prior.ss = Matrix2Dd::Constant(2, 3, 0.25);
    prior.fs = Matrix2Dd::Constant(2, 3, -0.5);
    const auto init = geometry::initialize_pixel_map<double>(2, 3, cfg, t, nullptr, &prior);
    REQUIRE(init.pixel_map.ss(1, 2) == Catch::Approx(1.25));
    REQUIRE(init.pixel_map.fs(1, 2) == Catch::Approx(1.5));

    speckle_track::PixelMap<double> wrong;
    wrong.ss = Matrix2Dd::Zero(3, 3);
    wrong.fs = Matrix2Dd::Zero(3, 3);
    REQUIRE_THROWS_AS(geometry::initialize_pixel_map<double>(2, 3, cfg, t, nullptr, &wrong),
                      speckle_track::ShapeMismatchError);
}

TEST_CASE("initialize_pixel_map_follows_transform_reindexing") {
    config::GeometryConfig cfg;
    Translations t = Translations::Zero(1, 3);
    geometry::Crop crop({1, 3, 2, 5});
    const auto init = geometry::initialize_pixel_map<double>(4, 6, cfg, t, &crop);
    REQUIRE(init.pixel_map.rows() == 2);
    REQUIRE(init.pixel_map.cols() == 3);
    REQUIRE(init.pixel_map.ss(0, 0) == 1.0);
    REQUIRE(init.pixel_map.fs(0, 0) == 2.0);
    REQUIRE(init.pixel_map.fs(1, 2) == 4.0);
}

TEST_CASE("transforms_reindex_frames") {
    Matrix2Dd img(4, 4);
    for (int r = 0; r < 4; ++r) {
        for (int c = 0; c < 4; ++c) {
            img(r, c) = 10.0 * r + c;
        }
    }

    SECTION("crop") {
        geometry::Crop crop({1, 3, 0, 2});
        const Matrix2Dd out = crop.forward(img);
        REQUIRE(out.rows() == 2);
        REQUIRE(out.cols() == 2);
        REQUIRE(out(0, 0) == 10.0);
        REQUIRE(out(1, 1) == 21.0);
    }
    SECTION("crop bounds are clipped to the frame") {
        geometry::Crop crop({2, 100, 3, 100});
        const Matrix2Dd out = crop.forward(img);
        REQUIRE(out.rows() == 2);
        REQUIRE(out.cols() == 1);
        REQUIRE(out(1, 0) == 33.0);
    }
    SECTION("downscale") {
        geometry::Downscale down(2);
        const Matrix2Dd out = down.forward(img);
        REQUIRE(out.rows() == 2);
        REQUIRE(out(1, 1) == 22.0);
    }
    SECTION("mirror") {
        geometry::Mirror rows(0);
        geometry::Mirror cols(1);
        REQUIRE(rows.forward(img)(0, 1) == 31.0);
        REQUIRE(cols.forward(img)(0, 0) == 3.0);
    }
    SECTION("compose applies in order") {
        std::vector<std::shared_ptr<const geometry::Transform>> list{
            std::make_shared<geometry::Crop>(std::array<int, 4>{0, 2, 0, 4}),
            std::make_shared<geometry::Mirror>(1)};
        geometry::ComposeTransforms chain(list);
        const Matrix2Dd out = chain.forward(img);
        REQUIRE(out.rows() == 2);
        REQUIRE(out(1, 0) == 13.0);
        REQUIRE(chain.name() == "crop+mirror");
    }
    SECTION("frame stacks") {
        geometry::Mirror cols(1);
        speckle_track::FrameStack<double> frames{img, img};
        const auto out = cols.forward(frames);
        REQUIRE(out.size() == 2);
        REQUIRE(out[1](2, 3) == 20.0);
    }
}

TEST_CASE("make_transform_builds_chain_from_config") {
    REQUIRE(geometry::make_transform({}) == nullptr);

    config::TransformConfig mirror;
    mirror.type = "mirror";
    mirror.axis = 0;
    auto single = geometry::make_transform({mirror});
    REQUIRE(single != nullptr);
    REQUIRE(single->name() == "mirror");

    config::TransformConfig down;
    down.type = "downscale";
    down.scale = 2;
    auto chain = geometry::make_transform({mirror, down});
    REQUIRE(chain->name() == "mirror+downscale");

    config::TransformConfig bad;
    bad.type = "shear";
    REQUIRE_THROWS_AS(geometry::make_transform({bad}), speckle_track::ValidationError);
}

TEST_CASE("transform_constructors_reject_invalid_parameters") {
    REQUIRE_THROWS_AS(geometry::Crop({3, 1, 0, 2}), speckle_track::ValidationError);
    REQUIRE_THROWS_AS(geometry::Downscale(0), speckle_track::ValidationError);
    REQUIRE_THROWS_AS(geometry::Mirror(2), speckle_track::ValidationError);
}
