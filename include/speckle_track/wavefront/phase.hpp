#pragma once

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/types.hpp"

namespace speckle_track::wavefront {

// Displacement relative to the initial map (u - u0), mean removed per axis
template <typename T>
PixelMap<T> pixel_aberrations(const PixelMap<T>& pixel_map, const PixelMap<T>& base_map);

/**
 * Least-squares integration of a gradient field sampled on the pixel grid
 * (gy along rows, gx along columns, in units per pixel). The field is
 * mirror-extended to even symmetry and integrated in Fourier space
 * (Frankot-Chellappa). The result has zero mean.
 */
Matrix2Dd integrate_gradients(const Matrix2Dd& gy, const Matrix2Dd& gx);

struct PhaseResult {
    Matrix2Dd phase;          // [rad]
    double magnification_y = 0.0;
    double magnification_x = 0.0;
    double distance_y = 0.0;  // reference plane to detector [m]
    double distance_x = 0.0;
};

/**
 * Wavefront phase from pixel aberrations. Per axis the magnification is
 * M = |(z + df) / df| and the reference plane sits z (M - 1) / M before the
 * detector; the angular deviation of a pixel is pitch / dist / M * du, and
 * the phase is 2 pi / wavelength times its integral over the plane.
 */
template <typename T>
PhaseResult retrieve_phase(const PixelMap<T>& aberrations, const config::GeometryConfig& geometry);

} // namespace speckle_track::wavefront
