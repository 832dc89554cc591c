#include "speckle_track/image/processing.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <type_traits>

#include <opencv2/opencv.hpp>

namespace speckle_track::image {

namespace {

template <typename T>
int cv_depth() {
    return std::is_same<T, float>::value ? CV_32F : CV_64F;
}

template <typename T>
cv::Mat wrap(const Matrix2D<T>& m) {
    return cv::Mat(static_cast<int>(m.rows()), static_cast<int>(m.cols()), cv_depth<T>(),
                   const_cast<T*>(m.data()));
}

template <typename T>
Matrix2D<T> to_matrix(const cv::Mat& m) {
    Matrix2D<T> out(m.rows, m.cols);
    if (m.isContinuous()) {
        std::memcpy(out.data(), m.ptr<T>(), static_cast<size_t>(out.size()) * sizeof(T));
    } else {
        for (int r = 0; r < m.rows; ++r) {
            std::memcpy(out.data() + static_cast<size_t>(r) * m.cols, m.ptr<T>(r),
                        static_cast<size_t>(m.cols) * sizeof(T));
        }
    }
    return out;
}

} // namespace

template <typename T>
Matrix2D<T> gaussian_blur(const Matrix2D<T>& img, double sigma) {
    if (img.size() == 0 || sigma <= 0.0) return img;
    cv::Mat blurred;
    cv::GaussianBlur(wrap(img), blurred, cv::Size(0, 0), sigma, sigma, cv::BORDER_REFLECT_101);
    return to_matrix<T>(blurred);
}

template <typename T>
Matrix2D<T> masked_gaussian_blur(const Matrix2D<T>& values, const MaskMatrix& known,
                                 double sigma) {
    if (values.size() == 0 || sigma <= 0.0) return values;
    Matrix2D<T> weight(values.rows(), values.cols());
    Matrix2D<T> masked(values.rows(), values.cols());
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        const bool k = known.data()[i] != 0 && std::isfinite(values.data()[i]);
        weight.data()[i] = k ? T(1) : T(0);
        masked.data()[i] = k ? values.data()[i] : T(0);
    }

    const Matrix2D<T> num = gaussian_blur(masked, sigma);
    const Matrix2D<T> den = gaussian_blur(weight, sigma);

    Matrix2D<T> out = values;
    const T eps = std::numeric_limits<T>::epsilon();
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (weight.data()[i] != T(0) && den.data()[i] > eps) {
            out.data()[i] = num.data()[i] / den.data()[i];
        }
    }
    return out;
}

template <typename T>
Matrix2D<T> fill_from_neighbours(const Matrix2D<T>& values, const MaskMatrix& known,
                                 double sigma) {
    Matrix2D<T> weight(values.rows(), values.cols());
    Matrix2D<T> masked(values.rows(), values.cols());
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        const bool k = known.data()[i] != 0 && std::isfinite(values.data()[i]);
        weight.data()[i] = k ? T(1) : T(0);
        masked.data()[i] = k ? values.data()[i] : T(0);
    }

    const Matrix2D<T> num = gaussian_blur(masked, sigma);
    const Matrix2D<T> den = gaussian_blur(weight, sigma);

    Matrix2D<T> out = values;
    const T eps = std::numeric_limits<T>::epsilon();
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (weight.data()[i] == T(0) && den.data()[i] > eps) {
            out.data()[i] = num.data()[i] / den.data()[i];
        }
    }
    return out;
}

Matrix2Df median_filter_3x3(const Matrix2Df& img) {
    if (img.size() == 0) return img;
    cv::Mat filtered;
    cv::medianBlur(wrap(img), filtered, 3);
    return to_matrix<float>(filtered);
}

Matrix2Dd window_mean(const Matrix2Dd& img, int size) {
    Matrix2Dd out = Matrix2Dd::Constant(img.rows(), img.cols(),
                                        std::numeric_limits<double>::quiet_NaN());
    if (size < 1 || img.rows() < size || img.cols() < size) return out;

    // Non-finite samples are zeroed and tracked through a coverage map
    Matrix2Dd values(img.rows(), img.cols());
    Matrix2Dd coverage(img.rows(), img.cols());
    for (Eigen::Index i = 0; i < img.size(); ++i) {
        const bool ok = std::isfinite(img.data()[i]);
        values.data()[i] = ok ? img.data()[i] : 0.0;
        coverage.data()[i] = ok ? 1.0 : 0.0;
    }

    cv::Mat blurred;
    cv::Mat covered;
    cv::blur(wrap(values), blurred, cv::Size(size, size), cv::Point(-1, -1),
             cv::BORDER_REFLECT_101);
    cv::blur(wrap(coverage), covered, cv::Size(size, size), cv::Point(-1, -1),
             cv::BORDER_REFLECT_101);
    const int half = size / 2;
    for (int r = half; r + (size - 1 - half) < img.rows(); ++r) {
        const double* src = blurred.ptr<double>(r);
        const double* cov = covered.ptr<double>(r);
        for (int c = half; c + (size - 1 - half) < img.cols(); ++c) {
            if (cov[c] > 1.0 - 1.0e-9) {
                out(r, c) = src[c];
            }
        }
    }
    return out;
}

template Matrix2D<float> gaussian_blur<float>(const Matrix2D<float>&, double);
template Matrix2D<double> gaussian_blur<double>(const Matrix2D<double>&, double);
template Matrix2D<float> masked_gaussian_blur<float>(const Matrix2D<float>&, const MaskMatrix&, double);
template Matrix2D<double> masked_gaussian_blur<double>(const Matrix2D<double>&, const MaskMatrix&, double);
template Matrix2D<float> fill_from_neighbours<float>(const Matrix2D<float>&, const MaskMatrix&, double);
template Matrix2D<double> fill_from_neighbours<double>(const Matrix2D<double>&, const MaskMatrix&, double);

} // namespace speckle_track::image
