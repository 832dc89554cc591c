#include "speckle_track/synthetic/synthetic.hpp"
#include "speckle_track/core/errors.hpp"
#include "speckle_track/geometry/geometry.hpp"

#include <cmath>
#include <random>
#include <utility>

namespace speckle_track::synthetic {

namespace {

constexpr double kPi = 3.14159265358979323846;

} // namespace

SpeckleField::SpeckleField(int n_waves, double min_period, double contrast, uint32_t seed) {
    if (n_waves < 1 || !(min_period > 0.0)) {
        throw ValidationError("speckle field needs n_waves >= 1 and min_period > 0");
    }
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> angle(0.0, 2.0 * kPi);
    std::uniform_real_distribution<double> freq(0.25, 1.0);
    std::uniform_real_distribution<double> amp(0.5, 1.0);

    const double k_max = 2.0 * kPi / min_period;
    double amp_sum = 0.0;
    waves_.reserve(static_cast<size_t>(n_waves));
    for (int i = 0; i < n_waves; ++i) {
        const double theta = angle(rng);
        const double k = k_max * freq(rng);
        Wave w{k * std::cos(theta), k * std::sin(theta), angle(rng), amp(rng)};
        amp_sum += w.amplitude;
        waves_.push_back(w);
    }
    for (auto& w : waves_) {
        w.amplitude *= contrast / amp_sum;
    }
}

double SpeckleField::operator()(double ss, double fs) const {
    double v = 1.0;
    for (const auto& w : waves_) {
        v += w.amplitude * std::cos(w.k_ss * ss + w.k_fs * fs + w.phase);
    }
    return v;
}

template <typename T>
SyntheticDataset<T> make_speckle_dataset(const SyntheticOptions& opts) {
    if (opts.rows < 1 || opts.cols < 1 || opts.frames_per_axis < 1) {
        throw ValidationError("synthetic dataset needs rows, cols, frames_per_axis >= 1");
    }
    const auto& g = opts.geometry;

    SyntheticDataset<T> ds;
    ds.geometry = g;

    // Stage positions giving a raster of `step` detector pixels
    const double mag_x = std::abs(g.distance / g.defocus_x);
    const double mag_y = std::abs(g.distance / g.effective_defocus_y());
    const double step_x = opts.step * g.x_pixel_size / mag_x;
    const double step_y = opts.step * g.y_pixel_size / mag_y;
    const int k = opts.frames_per_axis;
    ds.translations = Translations::Zero(k * k, 3);
    for (int a = 0; a < k; ++a) {
        for (int b = 0; b < k; ++b) {
            const int n = a * k + b;
            ds.translations(n, 0) = b * step_x;
            ds.translations(n, 1) = a * step_y;
        }
    }
    ds.translations_px = geometry::pixel_translations<T>(ds.translations, g);

    // Smooth distortion, one period over the detector in each direction
    ds.true_pixel_map.ss.resize(opts.rows, opts.cols);
    ds.true_pixel_map.fs.resize(opts.rows, opts.cols);
    for (int i = 0; i < opts.rows; ++i) {
        const double py = 2.0 * kPi * (i + 0.5) / opts.rows;
        for (int j = 0; j < opts.cols; ++j) {
            const double px = 2.0 * kPi * (j + 0.5) / opts.cols;
            ds.true_pixel_map.ss(i, j) =
                static_cast<T>(i + opts.distortion * std::sin(py) * std::cos(0.5 * px));
            ds.true_pixel_map.fs(i, j) =
                static_cast<T>(j + opts.distortion * std::cos(0.5 * py) * std::sin(px));
        }
    }

    ds.whitefield.resize(opts.rows, opts.cols);
    const double cy = 0.5 * (opts.rows - 1);
    const double cx = 0.5 * (opts.cols - 1);
    const double sy = 0.6 * opts.rows;
    const double sx = 0.6 * opts.cols;
    for (int i = 0; i < opts.rows; ++i) {
        for (int j = 0; j < opts.cols; ++j) {
            double w = opts.whitefield_level;
            if (opts.whitefield_profile) {
                const double r2 = (i - cy) * (i - cy) / (sy * sy) + (j - cx) * (j - cx) / (sx * sx);
                w *= 0.5 + 0.5 * std::exp(-r2);
            }
            ds.whitefield(i, j) = static_cast<T>(w);
        }
    }

    const SpeckleField field(opts.n_waves, opts.min_period, opts.contrast, opts.seed);
    ds.frames.reserve(static_cast<size_t>(k * k));
    for (int n = 0; n < k * k; ++n) {
        const double di = static_cast<double>(ds.translations_px.di(n));
        const double dj = static_cast<double>(ds.translations_px.dj(n));
        Matrix2D<T> frame(opts.rows, opts.cols);
        for (int i = 0; i < opts.rows; ++i) {
            for (int j = 0; j < opts.cols; ++j) {
                const double x_ss = static_cast<double>(ds.true_pixel_map.ss(i, j)) + di;
                const double x_fs = static_cast<double>(ds.true_pixel_map.fs(i, j)) + dj;
                frame(i, j) = static_cast<T>(static_cast<double>(ds.whitefield(i, j)) *
                                             field(x_ss, x_fs));
            }
        }
        ds.frames.push_back(std::move(frame));
    }
    return ds;
}

template SyntheticDataset<float> make_speckle_dataset<float>(const SyntheticOptions&);
template SyntheticDataset<double> make_speckle_dataset<double>(const SyntheticOptions&);

} // namespace speckle_track::synthetic
