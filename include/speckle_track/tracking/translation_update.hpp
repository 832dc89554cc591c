#pragma once

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/types.hpp"
#include "speckle_track/tracking/search.hpp"

namespace speckle_track::tracking {

// Mean squared residual of frame n over valid pixels with its translation
// moved by (off_ss, off_fs). Valid if at least min_pixels pixels sample the
// reference in bounds.
template <typename T>
PixelCost frame_cost(const FrameStack<T>& frames, const MaskMatrix& valid,
                     const Matrix2D<T>& whitefield, const ReferenceImage<T>& reference,
                     const PixelMap<T>& pixel_map, const PixelTranslations<T>& translations,
                     size_t n, double off_ss, double off_fs, bool subpixel, int min_pixels);

/**
 * Re-estimate each frame's pixel-space translation against the reference
 * with the displacement map held fixed. Offsets are searched over
 * [-cfg.translation_search_window, cfg.translation_search_window]^2 with the
 * same tie-break and quadratic step as the pixel map search. Frames without
 * a valid candidate keep their translation.
 */
template <typename T>
PixelTranslations<T> update_translations(const FrameStack<T>& frames, const MaskMatrix& mask,
                                         const Matrix2D<T>& whitefield,
                                         const ReferenceImage<T>& reference,
                                         const PixelMap<T>& pixel_map,
                                         const PixelTranslations<T>& translations,
                                         const config::TrackingConfig& cfg, int workers = 1);

} // namespace speckle_track::tracking
