#include "speckle_track/tracking/pixel_map_update.hpp"
#include "speckle_track/core/parallel.hpp"
#include "speckle_track/image/interpolation.hpp"
#include "speckle_track/image/processing.hpp"
#include "speckle_track/tracking/reference.hpp"

#include <algorithm>
#include <cmath>

namespace speckle_track::tracking {

template <typename T>
PixelCost pixel_cost(const FrameStack<T>& frames, const Matrix2D<T>& whitefield,
                     const ReferenceImage<T>& reference, const PixelMap<T>& pixel_map,
                     const PixelTranslations<T>& translations, int row, int col,
                     double off_ss, double off_fs, bool subpixel, int min_frames) {
    PixelCost pc;
    const double w = static_cast<double>(whitefield(row, col));
    if (!(w > 0.0) || !std::isfinite(w)) return pc;

    const double u_ss = static_cast<double>(pixel_map.ss(row, col)) + off_ss;
    const double u_fs = static_cast<double>(pixel_map.fs(row, col)) + off_fs;
    double sum = 0.0;
    int count = 0;
    for (size_t n = 0; n < frames.size(); ++n) {
        const double observed = static_cast<double>(frames[n](row, col)) / w;
        if (!std::isfinite(observed)) continue;
        double predicted = 0.0;
        if (!image::sample_reference(
                reference, u_ss + static_cast<double>(translations.di[static_cast<Eigen::Index>(n)]),
                u_fs + static_cast<double>(translations.dj[static_cast<Eigen::Index>(n)]), subpixel,
                predicted)) {
            continue;
        }
        const double res = observed - predicted;
        sum += res * res;
        ++count;
    }
    pc.n_samples = count;
    if (count >= std::max(1, min_frames)) {
        pc.cost = sum / static_cast<double>(count);
        pc.valid = true;
    }
    return pc;
}

template <typename T>
PixelMapUpdate<T> update_pixel_map(const FrameStack<T>& frames, const MaskMatrix& mask,
                                   const Matrix2D<T>& whitefield,
                                   const ReferenceImage<T>& reference,
                                   const PixelMap<T>& pixel_map,
                                   const PixelTranslations<T>& translations,
                                   const config::TrackingConfig& cfg, int workers) {
    check_inputs(frames, mask, whitefield, pixel_map, translations);

    const MaskMatrix valid = valid_pixels(mask, whitefield, pixel_map);
    const int rows = pixel_map.rows();
    const int cols = pixel_map.cols();
    const int min_frames = min_valid_count(frames.size(), cfg.min_valid_fraction);
    const bool quadratic = cfg.quadratic_refinement && cfg.subpixel;

    int w_ss = cfg.search_window;
    int w_fs = cfg.search_window;
    if (cfg.integrate) {
        if (rows == 1) w_ss = 0;
        if (cols == 1) w_fs = 0;
    }

    PixelMapUpdate<T> upd;
    upd.pixel_map = pixel_map;

    std::vector<int> searched(static_cast<size_t>(rows), 0);
    std::vector<int> updated(static_cast<size_t>(rows), 0);
    std::vector<int> kept(static_cast<size_t>(rows), 0);
    std::vector<double> shift(static_cast<size_t>(rows), 0.0);

    core::parallel_for(static_cast<size_t>(rows), workers, [&](size_t ri) {
        const int r = static_cast<int>(ri);
        for (int c = 0; c < cols; ++c) {
            if (valid(r, c) == 0) continue;
            ++searched[ri];
            const SearchResult res = window_search(w_ss, w_fs, quadratic, [&](double a, double b) {
                return pixel_cost(frames, whitefield, reference, pixel_map, translations, r, c,
                                  a, b, cfg.subpixel, min_frames);
            });
            if (!res.found) {
                ++kept[ri];
                continue;
            }
            if (res.off_ss != 0.0 || res.off_fs != 0.0) {
                upd.pixel_map.ss(r, c) = static_cast<T>(static_cast<double>(pixel_map.ss(r, c)) + res.off_ss);
                upd.pixel_map.fs(r, c) = static_cast<T>(static_cast<double>(pixel_map.fs(r, c)) + res.off_fs);
                ++updated[ri];
                shift[ri] += std::hypot(res.off_ss, res.off_fs);
            }
        }
    });

    double total_shift = 0.0;
    for (int r = 0; r < rows; ++r) {
        upd.n_searched += searched[static_cast<size_t>(r)];
        upd.n_updated += updated[static_cast<size_t>(r)];
        upd.n_kept += kept[static_cast<size_t>(r)];
        total_shift += shift[static_cast<size_t>(r)];
    }
    upd.mean_shift = upd.n_searched > 0 ? total_shift / upd.n_searched : 0.0;

    if (cfg.fill_bad_pix || cfg.smoothing.enabled) {
        Matrix2D<T> du_ss = upd.pixel_map.ss - pixel_map.ss;
        Matrix2D<T> du_fs = upd.pixel_map.fs - pixel_map.fs;
        for (Eigen::Index i = 0; i < du_ss.size(); ++i) {
            if (!std::isfinite(du_ss.data()[i])) du_ss.data()[i] = T(0);
            if (!std::isfinite(du_fs.data()[i])) du_fs.data()[i] = T(0);
        }
        if (cfg.fill_bad_pix) {
            du_ss = image::fill_from_neighbours(du_ss, valid, cfg.fill_sigma);
            du_fs = image::fill_from_neighbours(du_fs, valid, cfg.fill_sigma);
            if (cfg.smoothing.enabled) {
                du_ss = image::gaussian_blur(du_ss, cfg.smoothing.sigma);
                du_fs = image::gaussian_blur(du_fs, cfg.smoothing.sigma);
            }
        } else {
            // Masked-out pixels neither move nor pull their neighbours
            du_ss = image::masked_gaussian_blur(du_ss, valid, cfg.smoothing.sigma);
            du_fs = image::masked_gaussian_blur(du_fs, valid, cfg.smoothing.sigma);
            for (Eigen::Index i = 0; i < du_ss.size(); ++i) {
                if (valid.data()[i] == 0) {
                    du_ss.data()[i] = T(0);
                    du_fs.data()[i] = T(0);
                }
            }
        }
        upd.pixel_map.ss = pixel_map.ss + du_ss;
        upd.pixel_map.fs = pixel_map.fs + du_fs;
    }
    return upd;
}

template PixelCost pixel_cost<float>(const FrameStack<float>&, const Matrix2D<float>&,
                                     const ReferenceImage<float>&, const PixelMap<float>&,
                                     const PixelTranslations<float>&, int, int, double, double,
                                     bool, int);
template PixelCost pixel_cost<double>(const FrameStack<double>&, const Matrix2D<double>&,
                                      const ReferenceImage<double>&, const PixelMap<double>&,
                                      const PixelTranslations<double>&, int, int, double, double,
                                      bool, int);
template PixelMapUpdate<float> update_pixel_map<float>(
    const FrameStack<float>&, const MaskMatrix&, const Matrix2D<float>&,
    const ReferenceImage<float>&, const PixelMap<float>&, const PixelTranslations<float>&,
    const config::TrackingConfig&, int);
template PixelMapUpdate<double> update_pixel_map<double>(
    const FrameStack<double>&, const MaskMatrix&, const Matrix2D<double>&,
    const ReferenceImage<double>&, const PixelMap<double>&, const PixelTranslations<double>&,
    const config::TrackingConfig&, int);

} // namespace speckle_track::tracking
