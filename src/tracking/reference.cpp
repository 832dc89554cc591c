#include "speckle_track/tracking/reference.hpp"
#include "speckle_track/core/errors.hpp"
#include "speckle_track/core/parallel.hpp"
#include "speckle_track/image/interpolation.hpp"
#include "speckle_track/image/mask.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace speckle_track::tracking {

template <typename T>
void check_inputs(const FrameStack<T>& frames, const MaskMatrix& mask,
                  const Matrix2D<T>& whitefield, const PixelMap<T>& pixel_map,
                  const PixelTranslations<T>& translations) {
    image::check_stack(frames);
    const auto rows = frames.front().rows();
    const auto cols = frames.front().cols();
    image::check_shape(mask, rows, cols, "mask");
    image::check_shape(whitefield, rows, cols, "whitefield", false);
    image::check_shape(pixel_map.ss, rows, cols, "pixel map (ss)", false);
    image::check_shape(pixel_map.fs, rows, cols, "pixel map (fs)", false);
    if (translations.di.size() != translations.dj.size() ||
        static_cast<size_t>(translations.size()) != frames.size()) {
        throw ShapeMismatchError("expected " + std::to_string(frames.size()) +
                                 " pixel translations, got " +
                                 std::to_string(translations.di.size()) + "/" +
                                 std::to_string(translations.dj.size()));
    }
}

template <typename T>
MaskMatrix valid_pixels(const MaskMatrix& mask, const Matrix2D<T>& whitefield,
                        const PixelMap<T>& pixel_map) {
    const MaskMatrix m = image::resolve_mask(mask, whitefield.rows(), whitefield.cols());
    MaskMatrix valid(whitefield.rows(), whitefield.cols());
    for (Eigen::Index i = 0; i < whitefield.size(); ++i) {
        const T w = whitefield.data()[i];
        valid.data()[i] = (m.data()[i] != 0 && std::isfinite(w) && w > T(0) &&
                           std::isfinite(pixel_map.ss.data()[i]) &&
                           std::isfinite(pixel_map.fs.data()[i]))
                              ? 1
                              : 0;
    }
    return valid;
}

template <typename T>
ReferenceGrid make_reference_grid(const PixelMap<T>& pixel_map,
                                  const PixelTranslations<T>& translations,
                                  const MaskMatrix& valid, double ds_y, double ds_x,
                                  int margin) {
    if (!(ds_y > 0.0) || !(ds_x > 0.0)) {
        throw ValidationError("reference sampling intervals must be > 0");
    }
    if (translations.size() == 0) {
        throw ValidationError("at least one frame translation is required");
    }

    double min_ss = std::numeric_limits<double>::max();
    double max_ss = std::numeric_limits<double>::lowest();
    double min_fs = min_ss;
    double max_fs = max_ss;
    bool any = false;
    for (Eigen::Index i = 0; i < pixel_map.ss.size(); ++i) {
        if (valid.size() != 0 && valid.data()[i] == 0) continue;
        const double ss = static_cast<double>(pixel_map.ss.data()[i]);
        const double fs = static_cast<double>(pixel_map.fs.data()[i]);
        if (!std::isfinite(ss) || !std::isfinite(fs)) continue;
        min_ss = std::min(min_ss, ss);
        max_ss = std::max(max_ss, ss);
        min_fs = std::min(min_fs, fs);
        max_fs = std::max(max_fs, fs);
        any = true;
    }
    if (!any) {
        throw ValidationError("no valid pixels to build the reference grid from");
    }

    const double di_min = static_cast<double>(translations.di.minCoeff());
    const double di_max = static_cast<double>(translations.di.maxCoeff());
    const double dj_min = static_cast<double>(translations.dj.minCoeff());
    const double dj_max = static_cast<double>(translations.dj.maxCoeff());
    const double pad = static_cast<double>(std::max(0, margin));

    ReferenceGrid grid;
    grid.ds_y = ds_y;
    grid.ds_x = ds_x;
    grid.origin_ss = std::floor(min_ss + di_min - pad);
    grid.origin_fs = std::floor(min_fs + dj_min - pad);
    grid.rows = static_cast<int>(std::ceil((max_ss + di_max + pad - grid.origin_ss) / ds_y)) + 1;
    grid.cols = static_cast<int>(std::ceil((max_fs + dj_max + pad - grid.origin_fs) / ds_x)) + 1;
    return grid;
}

template <typename T>
ReferenceImage<T> reconstruct_reference(const FrameStack<T>& frames, const MaskMatrix& mask,
                                        const Matrix2D<T>& whitefield,
                                        const PixelMap<T>& pixel_map,
                                        const PixelTranslations<T>& translations,
                                        const ReferenceGrid& grid,
                                        const config::TrackingConfig& cfg, int workers) {
    check_inputs(frames, mask, whitefield, pixel_map, translations);
    if (grid.rows < 1 || grid.cols < 1) {
        throw ValidationError("reference grid is empty");
    }

    const MaskMatrix valid = valid_pixels(mask, whitefield, pixel_map);
    const size_t n_frames = frames.size();
    const int n_parts = core::static_partition_count(n_frames, workers);

    struct Accumulator {
        Matrix2Dd sum;
        Matrix2Dd weight;
        Matrix2Dd count;
    };
    std::vector<Accumulator> parts(static_cast<size_t>(n_parts));
    for (auto& p : parts) {
        p.sum = Matrix2Dd::Zero(grid.rows, grid.cols);
        p.weight = Matrix2Dd::Zero(grid.rows, grid.cols);
        p.count = Matrix2Dd::Zero(grid.rows, grid.cols);
    }

    core::parallel_for_static(n_frames, workers, [&](int w, size_t begin, size_t end) {
        Accumulator& acc = parts[static_cast<size_t>(w)];
        image::Stencil st;
        for (size_t n = begin; n < end; ++n) {
            const Matrix2D<T>& frame = frames[n];
            const double di = static_cast<double>(translations.di[static_cast<Eigen::Index>(n)]);
            const double dj = static_cast<double>(translations.dj[static_cast<Eigen::Index>(n)]);
            for (Eigen::Index r = 0; r < frame.rows(); ++r) {
                for (Eigen::Index c = 0; c < frame.cols(); ++c) {
                    if (valid(r, c) == 0) continue;
                    const double value = static_cast<double>(frame(r, c)) /
                                         static_cast<double>(whitefield(r, c));
                    if (!std::isfinite(value)) continue;
                    const double x_ss = static_cast<double>(pixel_map.ss(r, c)) + di;
                    const double x_fs = static_cast<double>(pixel_map.fs(r, c)) + dj;
                    if (!image::make_stencil(grid, x_ss, x_fs, cfg.subpixel, st)) continue;
                    for (int k = 0; k < st.n; ++k) {
                        acc.sum(st.row[k], st.col[k]) += st.weight[k] * value;
                        acc.weight(st.row[k], st.col[k]) += st.weight[k];
                        acc.count(st.row[k], st.col[k]) += 1.0;
                    }
                }
            }
        }
    });

    Matrix2Dd sum = Matrix2Dd::Zero(grid.rows, grid.cols);
    Matrix2Dd weight = Matrix2Dd::Zero(grid.rows, grid.cols);
    Matrix2Dd count = Matrix2Dd::Zero(grid.rows, grid.cols);
    for (const auto& p : parts) {
        sum += p.sum;
        weight += p.weight;
        count += p.count;
    }

    ReferenceImage<T> ref;
    ref.grid = grid;
    ref.image.resize(grid.rows, grid.cols);
    for (Eigen::Index i = 0; i < sum.size(); ++i) {
        ref.image.data()[i] = weight.data()[i] > 0.0
                                  ? static_cast<T>(sum.data()[i] / weight.data()[i])
                                  : std::numeric_limits<T>::quiet_NaN();
    }
    ref.weights = weight.cast<T>();
    ref.counts = count.cast<T>();
    return ref;
}

template void check_inputs<float>(const FrameStack<float>&, const MaskMatrix&,
                                  const Matrix2D<float>&, const PixelMap<float>&,
                                  const PixelTranslations<float>&);
template void check_inputs<double>(const FrameStack<double>&, const MaskMatrix&,
                                   const Matrix2D<double>&, const PixelMap<double>&,
                                   const PixelTranslations<double>&);
template MaskMatrix valid_pixels<float>(const MaskMatrix&, const Matrix2D<float>&,
                                        const PixelMap<float>&);
template MaskMatrix valid_pixels<double>(const MaskMatrix&, const Matrix2D<double>&,
                                         const PixelMap<double>&);
template ReferenceGrid make_reference_grid<float>(const PixelMap<float>&,
                                                  const PixelTranslations<float>&,
                                                  const MaskMatrix&, double, double, int);
template ReferenceGrid make_reference_grid<double>(const PixelMap<double>&,
                                                   const PixelTranslations<double>&,
                                                   const MaskMatrix&, double, double, int);
template ReferenceImage<float> reconstruct_reference<float>(
    const FrameStack<float>&, const MaskMatrix&, const Matrix2D<float>&, const PixelMap<float>&,
    const PixelTranslations<float>&, const ReferenceGrid&, const config::TrackingConfig&, int);
template ReferenceImage<double> reconstruct_reference<double>(
    const FrameStack<double>&, const MaskMatrix&, const Matrix2D<double>&,
    const PixelMap<double>&, const PixelTranslations<double>&, const ReferenceGrid&,
    const config::TrackingConfig&, int);

} // namespace speckle_track::tracking
