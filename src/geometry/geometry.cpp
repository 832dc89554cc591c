#include "speckle_track/geometry/geometry.hpp"
#include "speckle_track/core/errors.hpp"

#include <cmath>
#include <string>

namespace speckle_track::geometry {

namespace {

bool finite_nonzero(double v) {
    return std::isfinite(v) && v != 0.0;
}

} // namespace

BasisVectors basis_from_config(const config::GeometryConfig& cfg) {
    BasisVectors basis;
    for (int k = 0; k < 2; ++k) {
        for (int c = 0; c < 3; ++c) {
            basis(k, c) = cfg.basis_vectors[static_cast<size_t>(k)][static_cast<size_t>(c)];
        }
    }
    return basis;
}

Translations to_translations(const Eigen::MatrixXd& raw) {
    if (raw.cols() != 2 && raw.cols() != 3) {
        throw ShapeMismatchError("translations must be N x 2 or N x 3, got N x " +
                                 std::to_string(raw.cols()));
    }
    Translations out = Translations::Zero(raw.rows(), 3);
    out.leftCols(raw.cols()) = raw;
    return out;
}

void check_geometry(const BasisVectors& basis, double x_pixel_size, double y_pixel_size,
                    double distance, double defocus_x, double defocus_y) {
    for (int k = 0; k < 2; ++k) {
        const double norm = basis.row(k).norm();
        if (!finite_nonzero(norm)) {
            throw DegenerateGeometryError("basis vector " + std::to_string(k) +
                                          " has zero or non-finite norm");
        }
    }
    if (!finite_nonzero(x_pixel_size) || !finite_nonzero(y_pixel_size)) {
        throw DegenerateGeometryError("pixel sizes must be finite and non-zero");
    }
    if (!finite_nonzero(distance)) {
        throw DegenerateGeometryError("sample-to-detector distance must be finite and non-zero");
    }
    if (!finite_nonzero(defocus_x) || !finite_nonzero(defocus_y)) {
        throw DegenerateGeometryError("defocus distances must be finite and non-zero");
    }
}

template <typename T>
PixelTranslations<T> pixel_translations(const BasisVectors& basis,
                                        const Translations& translations,
                                        double x_pixel_size, double y_pixel_size,
                                        double distance, double defocus_x,
                                        double defocus_y) {
    check_geometry(basis, x_pixel_size, y_pixel_size, distance, defocus_x, defocus_y);
    const Eigen::Index n = translations.rows();
    if (n == 0) {
        throw ValidationError("translations must contain at least one frame");
    }
    if (!translations.allFinite()) {
        throw ValidationError("translations contain non-finite values");
    }

    const double pitch[2] = {y_pixel_size, x_pixel_size};
    const double defocus[2] = {defocus_y, defocus_x};

    Eigen::MatrixXd d(n, 2);
    for (int k = 0; k < 2; ++k) {
        const double scale = std::abs(distance / defocus[k]) /
                             (basis.row(k).norm() * pitch[k]);
        d.col(k) = (translations * basis.row(k).transpose()) * scale;
    }
    for (int k = 0; k < 2; ++k) {
        d.col(k).array() -= d.col(k).mean();
    }

    PixelTranslations<T> out;
    out.di = d.col(0).cast<T>();
    out.dj = d.col(1).cast<T>();
    return out;
}

template <typename T>
PixelTranslations<T> pixel_translations(const Translations& translations,
                                        const config::GeometryConfig& cfg) {
    return pixel_translations<T>(basis_from_config(cfg), translations, cfg.x_pixel_size,
                                 cfg.y_pixel_size, cfg.distance, cfg.defocus_x,
                                 cfg.effective_defocus_y());
}

template <typename T>
PixelMapInit<T> initialize_pixel_map(int rows, int cols,
                                     const config::GeometryConfig& cfg,
                                     const Translations& translations,
                                     const Transform* transform,
                                     const PixelMap<T>* prior) {
    if (rows < 1 || cols < 1) {
        throw ShapeMismatchError("detector shape must be at least 1x1");
    }

    auto idx = detector_indices(rows, cols);
    if (transform) {
        idx = transform->index_array(idx.first, idx.second);
    }

    PixelMapInit<T> init;
    init.pixel_map.ss = idx.first.cast<T>();
    init.pixel_map.fs = idx.second.cast<T>();

    if (cfg.effective_defocus_y() < 0.0) {
        init.pixel_map.ss = init.pixel_map.ss.colwise().reverse().eval();
        init.pixel_map.fs = init.pixel_map.fs.colwise().reverse().eval();
    }
    if (cfg.defocus_x < 0.0) {
        init.pixel_map.ss = init.pixel_map.ss.rowwise().reverse().eval();
        init.pixel_map.fs = init.pixel_map.fs.rowwise().reverse().eval();
    }

    if (prior) {
        if (prior->rows() != init.pixel_map.rows() || prior->cols() != init.pixel_map.cols()) {
            throw ShapeMismatchError("prior pixel map is " + std::to_string(prior->rows()) + "x" +
                                     std::to_string(prior->cols()) + ", detector grid is " +
                                     std::to_string(init.pixel_map.rows()) + "x" +
                                     std::to_string(init.pixel_map.cols()));
        }
        init.pixel_map.ss += prior->ss;
        init.pixel_map.fs += prior->fs;
    }

    init.translations = pixel_translations<T>(translations, cfg);
    init.translation_residual = Matrix2D<T>::Zero(init.translations.size(), 2);
    init.residual_rms = 0.0;
    return init;
}

template PixelTranslations<float> pixel_translations<float>(
    const BasisVectors&, const Translations&, double, double, double, double, double);
template PixelTranslations<double> pixel_translations<double>(
    const BasisVectors&, const Translations&, double, double, double, double, double);
template PixelTranslations<float> pixel_translations<float>(
    const Translations&, const config::GeometryConfig&);
template PixelTranslations<double> pixel_translations<double>(
    const Translations&, const config::GeometryConfig&);
template PixelMapInit<float> initialize_pixel_map<float>(
    int, int, const config::GeometryConfig&, const Translations&, const Transform*,
    const PixelMap<float>*);
template PixelMapInit<double> initialize_pixel_map<double>(
    int, int, const config::GeometryConfig&, const Translations&, const Transform*,
    const PixelMap<double>*);

} // namespace speckle_track::geometry
