#include "speckle_track/tracking/error.hpp"
#include "speckle_track/core/parallel.hpp"
#include "speckle_track/image/interpolation.hpp"
#include "speckle_track/tracking/reference.hpp"

#include <cmath>
#include <utility>

namespace speckle_track::tracking {

template <typename T>
ErrorReport evaluate_error(const FrameStack<T>& frames, const MaskMatrix& mask,
                           const Matrix2D<T>& whitefield, const ReferenceImage<T>& reference,
                           const PixelMap<T>& pixel_map,
                           const PixelTranslations<T>& translations,
                           const config::TrackingConfig& cfg, bool want_maps, int workers) {
    check_inputs(frames, mask, whitefield, pixel_map, translations);

    const MaskMatrix valid = valid_pixels(mask, whitefield, pixel_map);
    const size_t n_frames = frames.size();
    const auto rows = whitefield.rows();
    const auto cols = whitefield.cols();
    const int n_parts = core::static_partition_count(n_frames, workers);

    std::vector<double> per_frame(n_frames, 0.0);
    std::vector<size_t> samples(n_frames, 0);
    std::vector<Matrix2Dd> maps;
    if (want_maps) {
        maps.assign(static_cast<size_t>(n_parts), Matrix2Dd::Zero(rows, cols));
    }

    core::parallel_for_static(n_frames, workers, [&](int w, size_t begin, size_t end) {
        for (size_t n = begin; n < end; ++n) {
            const Matrix2D<T>& frame = frames[n];
            const double di = static_cast<double>(translations.di[static_cast<Eigen::Index>(n)]);
            const double dj = static_cast<double>(translations.dj[static_cast<Eigen::Index>(n)]);
            double sum = 0.0;
            size_t count = 0;
            for (Eigen::Index r = 0; r < rows; ++r) {
                for (Eigen::Index c = 0; c < cols; ++c) {
                    if (valid(r, c) == 0) continue;
                    const double observed = static_cast<double>(frame(r, c)) /
                                            static_cast<double>(whitefield(r, c));
                    if (!std::isfinite(observed)) continue;
                    double predicted = 0.0;
                    if (!image::sample_reference(reference,
                                                 static_cast<double>(pixel_map.ss(r, c)) + di,
                                                 static_cast<double>(pixel_map.fs(r, c)) + dj,
                                                 cfg.subpixel, predicted)) {
                        continue;
                    }
                    const double res = observed - predicted;
                    sum += res * res;
                    ++count;
                    if (want_maps) {
                        maps[static_cast<size_t>(w)](r, c) += res * res;
                    }
                }
            }
            per_frame[n] = sum;
            samples[n] = count;
        }
    });

    ErrorReport report;
    report.per_frame = std::move(per_frame);
    for (size_t n = 0; n < n_frames; ++n) {
        report.total += report.per_frame[n];
        report.n_samples += samples[n];
    }
    if (want_maps) {
        report.per_pixel = Matrix2Dd::Zero(rows, cols);
        for (const auto& m : maps) {
            report.per_pixel += m;
        }
    }
    return report;
}

template ErrorReport evaluate_error<float>(const FrameStack<float>&, const MaskMatrix&,
                                           const Matrix2D<float>&, const ReferenceImage<float>&,
                                           const PixelMap<float>&, const PixelTranslations<float>&,
                                           const config::TrackingConfig&, bool, int);
template ErrorReport evaluate_error<double>(const FrameStack<double>&, const MaskMatrix&,
                                            const Matrix2D<double>&, const ReferenceImage<double>&,
                                            const PixelMap<double>&, const PixelTranslations<double>&,
                                            const config::TrackingConfig&, bool, int);

} // namespace speckle_track::tracking
