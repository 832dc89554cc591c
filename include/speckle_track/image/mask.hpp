#pragma once

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/types.hpp"

#include <string>

namespace speckle_track::image {

// Throws ShapeMismatchError unless the stack is non-empty and every frame
// has the shape of the first one.
template <typename T>
void check_stack(const FrameStack<T>& frames);

// Throws ShapeMismatchError unless m is rows x cols. An empty matrix passes
// when allow_empty is set.
template <typename M>
void check_shape(const M& m, Eigen::Index rows, Eigen::Index cols, const std::string& what,
                 bool allow_empty = true);

// Empty mask means "all pixels valid"
MaskMatrix resolve_mask(const MaskMatrix& mask, Eigen::Index rows, Eigen::Index cols);

/**
 * Bad pixel mask shared by all frames. A pixel is valid only if it passes
 * the test in every frame:
 *   no-bad    every pixel valid
 *   range-bad vmin <= I < vmax
 *   perc-bad  deviation from the 3x3 median lies within the [pmin, pmax]
 *             percentiles of all deviations in the stack
 */
template <typename T>
MaskMatrix update_mask(const FrameStack<T>& frames, const config::MaskConfig& cfg);

} // namespace speckle_track::image
