#pragma once

#include "speckle_track/core/types.hpp"

#include <cmath>

namespace speckle_track::image {

// Reference cells touched by one continuous coordinate. Corners with zero
// weight are dropped, so an exact grid hit produces a single cell.
struct Stencil {
    int row[4];
    int col[4];
    double weight[4];
    int n = 0;
};

/**
 * Build the nearest-cell (subpixel = false) or bilinear stencil of the
 * detector coordinate (x_ss, x_fs) on the reference grid. Returns false if
 * the coordinate is non-finite or any contributing cell lies outside the
 * grid; such samples are excluded, never clamped.
 */
inline bool make_stencil(const ReferenceGrid& grid, double x_ss, double x_fs,
                         bool subpixel, Stencil& st) {
    st.n = 0;
    if (!std::isfinite(x_ss) || !std::isfinite(x_fs)) return false;

    const double cy = (x_ss - grid.origin_ss) / grid.ds_y;
    const double cx = (x_fs - grid.origin_fs) / grid.ds_x;
    if (std::abs(cy) > 1.0e9 || std::abs(cx) > 1.0e9) return false;

    if (!subpixel) {
        const long r = std::lround(cy);
        const long c = std::lround(cx);
        if (r < 0 || c < 0 || r >= grid.rows || c >= grid.cols) return false;
        st.row[0] = static_cast<int>(r);
        st.col[0] = static_cast<int>(c);
        st.weight[0] = 1.0;
        st.n = 1;
        return true;
    }

    const double fy = std::floor(cy);
    const double fx = std::floor(cx);
    const double wy = cy - fy;
    const double wx = cx - fx;
    const int r0 = static_cast<int>(fy);
    const int c0 = static_cast<int>(fx);

    const double w[4] = {(1.0 - wy) * (1.0 - wx), (1.0 - wy) * wx, wy * (1.0 - wx), wy * wx};
    const int dr[4] = {0, 0, 1, 1};
    const int dc[4] = {0, 1, 0, 1};
    for (int k = 0; k < 4; ++k) {
        if (w[k] <= 0.0) continue;
        const int r = r0 + dr[k];
        const int c = c0 + dc[k];
        if (r < 0 || c < 0 || r >= grid.rows || c >= grid.cols) {
            st.n = 0;
            return false;
        }
        st.row[st.n] = r;
        st.col[st.n] = c;
        st.weight[st.n] = w[k];
        ++st.n;
    }
    return st.n > 0;
}

/**
 * Sample the reference image at a detector coordinate. Returns false when the
 * stencil is out of bounds or touches a no-data (non-finite) cell.
 */
template <typename T>
bool sample_reference(const ReferenceImage<T>& ref, double x_ss, double x_fs,
                      bool subpixel, double& value) {
    Stencil st;
    if (!make_stencil(ref.grid, x_ss, x_fs, subpixel, st)) return false;
    double acc = 0.0;
    for (int k = 0; k < st.n; ++k) {
        const double v = static_cast<double>(ref.image(st.row[k], st.col[k]));
        if (!std::isfinite(v)) return false;
        acc += st.weight[k] * v;
    }
    value = acc;
    return true;
}

} // namespace speckle_track::image
