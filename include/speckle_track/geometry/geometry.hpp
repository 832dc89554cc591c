#pragma once

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/types.hpp"
#include "speckle_track/geometry/transform.hpp"

namespace speckle_track::geometry {

BasisVectors basis_from_config(const config::GeometryConfig& cfg);

// Accepts N x 2 (x, y) or N x 3 (x, y, z) physical translations; N x 2 is
// zero-padded along z.
Translations to_translations(const Eigen::MatrixXd& raw);

// Throws DegenerateGeometryError when a normalization denominator of the
// stage-to-pixel conversion is zero or non-finite.
void check_geometry(const BasisVectors& basis, double x_pixel_size, double y_pixel_size,
                    double distance, double defocus_x, double defocus_y);

/**
 * Convert physical stage translations into detector-pixel translations.
 *
 * For frame n and detector axis k the translation is projected onto the
 * basis vector b_k, expressed in pixels of pitch p_k and magnified by the
 * projection factor |z / df_k|:
 *
 *   d[n][k] = (t_n . b_k) / (|b_k| p_k) * |z / df_k|
 *
 * The slow axis (di) uses y_pixel_size and defocus_y, the fast axis (dj)
 * x_pixel_size and defocus_x. The result is zero-centered over frames.
 */
template <typename T>
PixelTranslations<T> pixel_translations(const BasisVectors& basis,
                                        const Translations& translations,
                                        double x_pixel_size, double y_pixel_size,
                                        double distance, double defocus_x,
                                        double defocus_y);

template <typename T>
PixelTranslations<T> pixel_translations(const Translations& translations,
                                        const config::GeometryConfig& cfg);

template <typename T>
struct PixelMapInit {
    PixelMap<T> pixel_map;
    PixelTranslations<T> translations;
    Matrix2D<T> translation_residual;  // N x 2, (di, dj) corrections
    double residual_rms = 0.0;
};

/**
 * Initial displacement map and pixel-space translations.
 *
 * The map is the identity detector grid (after the optional transform's
 * re-indexing), flipped along any axis whose defocus is negative, plus the
 * optional prior aberration map. rows/cols give the untransformed detector
 * shape; the map has the transformed shape.
 */
template <typename T>
PixelMapInit<T> initialize_pixel_map(int rows, int cols,
                                     const config::GeometryConfig& cfg,
                                     const Translations& translations,
                                     const Transform* transform = nullptr,
                                     const PixelMap<T>* prior = nullptr);

} // namespace speckle_track::geometry
