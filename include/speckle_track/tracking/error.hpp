#pragma once

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/types.hpp"

#include <cstddef>
#include <vector>

namespace speckle_track::tracking {

struct ErrorReport {
    double total = 0.0;              // sum of squared residuals
    std::vector<double> per_frame;   // one sum per frame
    size_t n_samples = 0;            // residuals that entered the sum
    Matrix2Dd per_pixel;             // rows x cols, filled when requested
};

/**
 * Registration error between the frames and the reference they predict:
 * sum over valid pixels and frames of (I / W - I0(u + d_n))^2. Samples
 * whose interpolation leaves the grid or touches a no-data cell are skipped.
 */
template <typename T>
ErrorReport evaluate_error(const FrameStack<T>& frames, const MaskMatrix& mask,
                           const Matrix2D<T>& whitefield, const ReferenceImage<T>& reference,
                           const PixelMap<T>& pixel_map,
                           const PixelTranslations<T>& translations,
                           const config::TrackingConfig& cfg, bool want_maps = false,
                           int workers = 1);

} // namespace speckle_track::tracking
