#pragma once

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/types.hpp"
#include "speckle_track/tracking/search.hpp"

namespace speckle_track::tracking {

template <typename T>
struct PixelMapUpdate {
    PixelMap<T> pixel_map;
    int n_searched = 0;   // valid pixels that were searched
    int n_updated = 0;    // searched pixels that moved
    int n_kept = 0;       // searched pixels without any valid candidate
    double mean_shift = 0.0;  // mean |offset| over searched pixels [px]
};

/**
 * Mean squared residual of pixel (row, col) over frames when its mapped
 * coordinate is moved by (off_ss, off_fs). Valid if at least min_frames
 * frames give an in-bounds sample of the reference.
 */
template <typename T>
PixelCost pixel_cost(const FrameStack<T>& frames, const Matrix2D<T>& whitefield,
                     const ReferenceImage<T>& reference, const PixelMap<T>& pixel_map,
                     const PixelTranslations<T>& translations, int row, int col,
                     double off_ss, double off_fs, bool subpixel, int min_frames);

/**
 * Refine every valid pixel of the displacement map by a windowed search
 * against the reference (see window_search). The input map is not modified.
 *
 *  - cfg.search_window: half-width W of the integer search
 *  - cfg.integrate: skip axes of detector extent 1
 *  - cfg.quadratic_refinement: sub-integer parabola step
 *  - cfg.min_valid_fraction: frames needed for a candidate to count
 *  - cfg.fill_bad_pix: masked-out pixels take the Gaussian-weighted update
 *    of their refined neighbours; without it they keep their previous value
 *  - cfg.smoothing: Gaussian smoothing of the update field afterwards; over
 *    the filled field with fill_bad_pix, over the valid pixels only otherwise
 */
template <typename T>
PixelMapUpdate<T> update_pixel_map(const FrameStack<T>& frames, const MaskMatrix& mask,
                                   const Matrix2D<T>& whitefield,
                                   const ReferenceImage<T>& reference,
                                   const PixelMap<T>& pixel_map,
                                   const PixelTranslations<T>& translations,
                                   const config::TrackingConfig& cfg, int workers = 1);

} // namespace speckle_track::tracking
