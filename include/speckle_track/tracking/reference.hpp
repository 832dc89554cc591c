#pragma once

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/types.hpp"

namespace speckle_track::tracking {

// Throws ShapeMismatchError unless the mask (may be empty), whitefield and
// pixel map share the frame shape and there is one translation per frame.
template <typename T>
void check_inputs(const FrameStack<T>& frames, const MaskMatrix& mask,
                  const Matrix2D<T>& whitefield, const PixelMap<T>& pixel_map,
                  const PixelTranslations<T>& translations);

// Pixels that take part in registration: mask set, whitefield > 0 and a
// finite pixel map entry. An empty mask counts as all set.
template <typename T>
MaskMatrix valid_pixels(const MaskMatrix& mask, const Matrix2D<T>& whitefield,
                        const PixelMap<T>& pixel_map);

/**
 * Reference sampling grid covering every valid mapped coordinate u + d_n
 * over all frames, padded by `margin` detector pixels on each side.
 * Throws ValidationError if no pixel is valid.
 */
template <typename T>
ReferenceGrid make_reference_grid(const PixelMap<T>& pixel_map,
                                  const PixelTranslations<T>& translations,
                                  const MaskMatrix& valid, double ds_y, double ds_x,
                                  int margin);

/**
 * Back-project all whitefield-normalized frames onto the reference grid.
 *
 * Every valid detector pixel of frame n lands at u + d_n and deposits I / W
 * into its nearest cell (cfg.subpixel false) or its bilinear cells weighted
 * by the interpolation weights. Samples reaching outside the grid are
 * dropped. Cells without weight hold NaN. Frames are split into fixed
 * partitions whose private accumulators are merged in partition order, so
 * the output depends only on the inputs and the worker count.
 */
template <typename T>
ReferenceImage<T> reconstruct_reference(const FrameStack<T>& frames, const MaskMatrix& mask,
                                        const Matrix2D<T>& whitefield,
                                        const PixelMap<T>& pixel_map,
                                        const PixelTranslations<T>& translations,
                                        const ReferenceGrid& grid,
                                        const config::TrackingConfig& cfg, int workers = 1);

} // namespace speckle_track::tracking
