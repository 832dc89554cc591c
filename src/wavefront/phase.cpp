#include "speckle_track/wavefront/phase.hpp"
#include "speckle_track/core/errors.hpp"

#include <cmath>
#include <string>

#include <opencv2/opencv.hpp>

namespace speckle_track::wavefront {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Signed angular frequency of bin m out of n
double angular_frequency(int m, int n) {
    const int f = (m <= n / 2) ? m : m - n;
    return 2.0 * kPi * static_cast<double>(f) / static_cast<double>(n);
}

} // namespace

template <typename T>
PixelMap<T> pixel_aberrations(const PixelMap<T>& pixel_map, const PixelMap<T>& base_map) {
    if (pixel_map.rows() != base_map.rows() || pixel_map.cols() != base_map.cols()) {
        throw ShapeMismatchError("pixel map and base map differ in shape");
    }
    PixelMap<T> out;
    out.ss = pixel_map.ss - base_map.ss;
    out.fs = pixel_map.fs - base_map.fs;
    if (out.ss.size() > 0) {
        out.ss.array() -= out.ss.mean();
        out.fs.array() -= out.fs.mean();
    }
    return out;
}

Matrix2Dd integrate_gradients(const Matrix2Dd& gy, const Matrix2Dd& gx) {
    if (gy.rows() != gx.rows() || gy.cols() != gx.cols()) {
        throw ShapeMismatchError("gradient components differ in shape");
    }
    const int rows = static_cast<int>(gy.rows());
    const int cols = static_cast<int>(gy.cols());
    if (rows == 0 || cols == 0) return Matrix2Dd();

    // Even extension of the phase: gy flips sign across the row mirror,
    // gx across the column mirror.
    const int er = 2 * rows;
    const int ec = 2 * cols;
    cv::Mat ext_gy(er, ec, CV_64F);
    cv::Mat ext_gx(er, ec, CV_64F);
    for (int r = 0; r < er; ++r) {
        const bool mr = r >= rows;
        const int sr = mr ? er - 1 - r : r;
        double* py = ext_gy.ptr<double>(r);
        double* px = ext_gx.ptr<double>(r);
        for (int c = 0; c < ec; ++c) {
            const bool mc = c >= cols;
            const int sc = mc ? ec - 1 - c : c;
            const double vy = std::isfinite(gy(sr, sc)) ? gy(sr, sc) : 0.0;
            const double vx = std::isfinite(gx(sr, sc)) ? gx(sr, sc) : 0.0;
            py[c] = mr ? -vy : vy;
            px[c] = mc ? -vx : vx;
        }
    }

    cv::Mat fy;
    cv::Mat fx;
    cv::dft(ext_gy, fy, cv::DFT_COMPLEX_OUTPUT);
    cv::dft(ext_gx, fx, cv::DFT_COMPLEX_OUTPUT);

    cv::Mat spectrum(er, ec, CV_64FC2);
    for (int u = 0; u < er; ++u) {
        const double ky = angular_frequency(u, er);
        for (int v = 0; v < ec; ++v) {
            const double kx = angular_frequency(v, ec);
            const double denom = kx * kx + ky * ky;
            cv::Vec2d& out = spectrum.at<cv::Vec2d>(u, v);
            if (denom == 0.0) {
                out = cv::Vec2d(0.0, 0.0);
                continue;
            }
            const cv::Vec2d& gyv = fy.at<cv::Vec2d>(u, v);
            const cv::Vec2d& gxv = fx.at<cv::Vec2d>(u, v);
            // (-i ky Gy - i kx Gx) / (kx^2 + ky^2)
            out[0] = (ky * gyv[1] + kx * gxv[1]) / denom;
            out[1] = -(ky * gyv[0] + kx * gxv[0]) / denom;
        }
    }

    cv::Mat inverse;
    cv::dft(spectrum, inverse, cv::DFT_INVERSE | cv::DFT_SCALE | cv::DFT_COMPLEX_OUTPUT);

    Matrix2Dd phase(rows, cols);
    for (int r = 0; r < rows; ++r) {
        const cv::Vec2d* src = inverse.ptr<cv::Vec2d>(r);
        for (int c = 0; c < cols; ++c) {
            phase(r, c) = src[c][0];
        }
    }
    phase.array() -= phase.mean();
    return phase;
}

template <typename T>
PhaseResult retrieve_phase(const PixelMap<T>& aberrations, const config::GeometryConfig& geometry) {
    const double z = geometry.distance;
    const double df_y = geometry.effective_defocus_y();
    const double df_x = geometry.defocus_x;
    if (!std::isfinite(z) || z == 0.0 || !std::isfinite(df_x) || df_x == 0.0 ||
        !std::isfinite(df_y) || df_y == 0.0) {
        throw DegenerateGeometryError("phase retrieval needs finite, non-zero distance and defocus");
    }
    if (!(geometry.wavelength > 0.0) || !std::isfinite(geometry.wavelength)) {
        throw DegenerateGeometryError("phase retrieval needs a positive wavelength");
    }

    PhaseResult res;
    res.magnification_y = std::abs((z + df_y) / df_y);
    res.magnification_x = std::abs((z + df_x) / df_x);
    res.distance_y = z * (res.magnification_y - 1.0) / res.magnification_y;
    res.distance_x = z * (res.magnification_x - 1.0) / res.magnification_x;
    if (!std::isfinite(res.distance_y) || res.distance_y == 0.0 ||
        !std::isfinite(res.distance_x) || res.distance_x == 0.0) {
        throw DegenerateGeometryError("reference plane coincides with the detector (M = 1)");
    }

    const double sy = geometry.y_pixel_size * geometry.y_pixel_size /
                      res.distance_y / res.magnification_y;
    const double sx = geometry.x_pixel_size * geometry.x_pixel_size /
                      res.distance_x / res.magnification_x;
    const Matrix2Dd gy = aberrations.ss.template cast<double>() * sy;
    const Matrix2Dd gx = aberrations.fs.template cast<double>() * sx;

    res.phase = integrate_gradients(gy, gx) * (2.0 * kPi / geometry.wavelength);
    return res;
}

template PixelMap<float> pixel_aberrations<float>(const PixelMap<float>&, const PixelMap<float>&);
template PixelMap<double> pixel_aberrations<double>(const PixelMap<double>&, const PixelMap<double>&);
template PhaseResult retrieve_phase<float>(const PixelMap<float>&, const config::GeometryConfig&);
template PhaseResult retrieve_phase<double>(const PixelMap<double>&, const config::GeometryConfig&);

} // namespace speckle_track::wavefront
