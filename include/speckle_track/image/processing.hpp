#pragma once

#include "speckle_track/core/types.hpp"

namespace speckle_track::image {

// Gaussian smoothing with reflected borders
template <typename T>
Matrix2D<T> gaussian_blur(const Matrix2D<T>& img, double sigma);

/**
 * Normalized Gaussian convolution: values where known != 0 are spread into
 * the unknown pixels, known pixels are returned unchanged. Unknown pixels
 * that receive no support keep their input value.
 */
template <typename T>
Matrix2D<T> fill_from_neighbours(const Matrix2D<T>& values, const MaskMatrix& known,
                                 double sigma);

// Normalized Gaussian convolution restricted to the known pixels: each known
// pixel becomes the weighted mean of its known neighbours, unknown pixels keep
// their input value and never contribute.
template <typename T>
Matrix2D<T> masked_gaussian_blur(const Matrix2D<T>& values, const MaskMatrix& known,
                                 double sigma);

// 3x3 median filter
Matrix2Df median_filter_3x3(const Matrix2Df& img);

// Mean over a size x size window, evaluated only where the window lies
// fully inside the image and holds finite values only; other pixels are NaN.
Matrix2Dd window_mean(const Matrix2Dd& img, int size);

} // namespace speckle_track::image
