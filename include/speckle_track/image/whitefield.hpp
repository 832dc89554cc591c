#pragma once

#include "speckle_track/core/types.hpp"

#include <string>
#include <vector>

namespace speckle_track::image {

/**
 * Per-pixel illumination profile: median (default) or mean over frames of
 * the valid samples of each pixel. Pixels that are masked out or have no
 * finite sample are set to 0, which downstream stages treat as "no
 * whitefield". The result does not depend on frame order.
 */
template <typename T>
Matrix2D<T> estimate_whitefield(const FrameStack<T>& frames, const MaskMatrix& mask,
                                const std::string& method = "median", int workers = 1);

// Per-frame whitefields: running median over `size` neighbouring frames,
// ignoring samples further than 3 sqrt(W) from the static whitefield W.
template <typename T>
FrameStack<T> estimate_dynamic_whitefields(const FrameStack<T>& frames,
                                           const Matrix2D<T>& whitefield, int size,
                                           int workers = 1);

template <typename T>
struct EigenFlatfields {
    FrameStack<T> flatfields;        // leading components first
    std::vector<double> explained;   // eigenvalue / sum of all eigenvalues
};

/**
 * Eigen flat-fields of the background-corrected stack C_n = I_n - W (zero at
 * masked-out or non-finite samples): the eigenvectors of the N x N Gram
 * matrix C_n . C_m mapped back onto the detector, sorted by decreasing
 * eigenvalue. n_components <= 0 keeps all N.
 */
template <typename T>
EigenFlatfields<T> eigen_flatfields(const FrameStack<T>& frames, const Matrix2D<T>& whitefield,
                                    const MaskMatrix& mask, int n_components = 0);

// Per-frame whitefields W + sum_k (C_n . E_k / E_k . E_k) E_k over the given
// eigen flat-fields E_k. Components of zero norm are skipped.
template <typename T>
FrameStack<T> pca_whitefields(const FrameStack<T>& frames, const Matrix2D<T>& whitefield,
                              const MaskMatrix& mask, const FrameStack<T>& flatfields);

// Scale frame n by W / W_n where W_n > 0
template <typename T>
FrameStack<T> apply_flatfield_correction(const FrameStack<T>& frames,
                                         const Matrix2D<T>& whitefield,
                                         const FrameStack<T>& dynamic_whitefields);

// Indices of frames with non-zero total intensity
template <typename T>
std::vector<int> good_frames(const FrameStack<T>& frames);

template <typename T>
FrameStack<T> select_frames(const FrameStack<T>& frames, const std::vector<int>& indices);

// Masked sum along axis 0 (result 1 x cols) or axis 1 (rows x 1)
template <typename T>
FrameStack<T> integrate_frames(const FrameStack<T>& frames, const MaskMatrix& mask, int axis);

} // namespace speckle_track::image
