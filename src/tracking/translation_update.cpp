#include "speckle_track/tracking/translation_update.hpp"
#include "speckle_track/core/parallel.hpp"
#include "speckle_track/image/interpolation.hpp"
#include "speckle_track/tracking/reference.hpp"

#include <algorithm>
#include <cmath>

namespace speckle_track::tracking {

template <typename T>
PixelCost frame_cost(const FrameStack<T>& frames, const MaskMatrix& valid,
                     const Matrix2D<T>& whitefield, const ReferenceImage<T>& reference,
                     const PixelMap<T>& pixel_map, const PixelTranslations<T>& translations,
                     size_t n, double off_ss, double off_fs, bool subpixel, int min_pixels) {
    const Matrix2D<T>& frame = frames[n];
    const double di = static_cast<double>(translations.di[static_cast<Eigen::Index>(n)]) + off_ss;
    const double dj = static_cast<double>(translations.dj[static_cast<Eigen::Index>(n)]) + off_fs;

    double sum = 0.0;
    int count = 0;
    for (Eigen::Index r = 0; r < frame.rows(); ++r) {
        for (Eigen::Index c = 0; c < frame.cols(); ++c) {
            if (valid(r, c) == 0) continue;
            const double observed = static_cast<double>(frame(r, c)) /
                                    static_cast<double>(whitefield(r, c));
            if (!std::isfinite(observed)) continue;
            double predicted = 0.0;
            if (!image::sample_reference(reference, static_cast<double>(pixel_map.ss(r, c)) + di,
                                         static_cast<double>(pixel_map.fs(r, c)) + dj, subpixel,
                                         predicted)) {
                continue;
            }
            const double res = observed - predicted;
            sum += res * res;
            ++count;
        }
    }

    PixelCost pc;
    pc.n_samples = count;
    if (count >= std::max(1, min_pixels)) {
        pc.cost = sum / static_cast<double>(count);
        pc.valid = true;
    }
    return pc;
}

template <typename T>
PixelTranslations<T> update_translations(const FrameStack<T>& frames, const MaskMatrix& mask,
                                         const Matrix2D<T>& whitefield,
                                         const ReferenceImage<T>& reference,
                                         const PixelMap<T>& pixel_map,
                                         const PixelTranslations<T>& translations,
                                         const config::TrackingConfig& cfg, int workers) {
    check_inputs(frames, mask, whitefield, pixel_map, translations);

    const MaskMatrix valid = valid_pixels(mask, whitefield, pixel_map);
    size_t n_valid = 0;
    for (Eigen::Index i = 0; i < valid.size(); ++i) {
        if (valid.data()[i] != 0) ++n_valid;
    }
    PixelTranslations<T> out = translations;
    if (n_valid == 0) return out;

    const int min_pixels = min_valid_count(n_valid, cfg.min_valid_fraction);
    const bool quadratic = cfg.quadratic_refinement && cfg.subpixel;
    int w_ss = cfg.translation_search_window;
    int w_fs = cfg.translation_search_window;
    if (cfg.integrate) {
        if (pixel_map.rows() == 1) w_ss = 0;
        if (pixel_map.cols() == 1) w_fs = 0;
    }

    core::parallel_for(frames.size(), workers, [&](size_t n) {
        const SearchResult res = window_search(w_ss, w_fs, quadratic, [&](double a, double b) {
            return frame_cost(frames, valid, whitefield, reference, pixel_map, translations, n,
                              a, b, cfg.subpixel, min_pixels);
        });
        if (!res.found) return;
        const Eigen::Index i = static_cast<Eigen::Index>(n);
        out.di[i] = static_cast<T>(static_cast<double>(translations.di[i]) + res.off_ss);
        out.dj[i] = static_cast<T>(static_cast<double>(translations.dj[i]) + res.off_fs);
    });
    return out;
}

template PixelCost frame_cost<float>(const FrameStack<float>&, const MaskMatrix&,
                                     const Matrix2D<float>&, const ReferenceImage<float>&,
                                     const PixelMap<float>&, const PixelTranslations<float>&,
                                     size_t, double, double, bool, int);
template PixelCost frame_cost<double>(const FrameStack<double>&, const MaskMatrix&,
                                      const Matrix2D<double>&, const ReferenceImage<double>&,
                                      const PixelMap<double>&, const PixelTranslations<double>&,
                                      size_t, double, double, bool, int);
template PixelTranslations<float> update_translations<float>(
    const FrameStack<float>&, const MaskMatrix&, const Matrix2D<float>&,
    const ReferenceImage<float>&, const PixelMap<float>&, const PixelTranslations<float>&,
    const config::TrackingConfig&, int);
template PixelTranslations<double> update_translations<double>(
    const FrameStack<double>&, const MaskMatrix&, const Matrix2D<double>&,
    const ReferenceImage<double>&, const PixelMap<double>&, const PixelTranslations<double>&,
    const config::TrackingConfig&, int);

} // namespace speckle_track::tracking
