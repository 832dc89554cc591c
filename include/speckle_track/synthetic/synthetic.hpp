#pragma once

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/types.hpp"

#include <cstdint>
#include <vector>

namespace speckle_track::synthetic {

// Smooth random speckle pattern: 1 + sum of random plane-wave cosines,
// normalized to stay within [1 - contrast, 1 + contrast].
class SpeckleField {
public:
    SpeckleField(int n_waves, double min_period, double contrast, uint32_t seed);

    // Value at continuous reference coordinates (ss, fs) [px]
    double operator()(double ss, double fs) const;

private:
    struct Wave {
        double k_ss;
        double k_fs;
        double phase;
        double amplitude;
    };
    std::vector<Wave> waves_;
};

struct SyntheticOptions {
    int rows = 32;
    int cols = 32;
    int frames_per_axis = 4;        // raster scan is frames_per_axis^2 frames
    double step = 2.5;              // scan step [detector px]
    double distortion = 1.0;        // peak displacement of the true map [px]
    int n_waves = 24;
    double min_period = 4.0;        // shortest speckle period [px]
    double contrast = 0.5;
    double whitefield_level = 1000.0;
    bool whitefield_profile = false; // Gaussian beam profile instead of flat
    uint32_t seed = 42;
    config::GeometryConfig geometry;
};

template <typename T>
struct SyntheticDataset {
    FrameStack<T> frames;
    Matrix2D<T> whitefield;
    Translations translations;              // physical stage positions [m]
    config::GeometryConfig geometry;
    PixelMap<T> true_pixel_map;
    PixelTranslations<T> translations_px;   // as derived from the geometry
};

/**
 * Simulated scan of a speckle reference through a distorting optic.
 *
 * Frame n at pixel (i, j) records W(i, j) * I0(u(i, j) + d_n) where I0 is a
 * SpeckleField, u the true pixel map (identity plus a smooth distortion) and
 * d_n the pixel translations computed from the physical stage positions by
 * geometry::pixel_translations. The output is deterministic for a seed.
 */
template <typename T>
SyntheticDataset<T> make_speckle_dataset(const SyntheticOptions& opts);

} // namespace speckle_track::synthetic
