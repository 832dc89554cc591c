#include "speckle_track/image/whitefield.hpp"
#include "speckle_track/core/errors.hpp"
#include "speckle_track/core/parallel.hpp"
#include "speckle_track/core/utils.hpp"
#include "speckle_track/image/mask.hpp"

#include <Eigen/Eigenvalues>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

namespace speckle_track::image {

template <typename T>
Matrix2D<T> estimate_whitefield(const FrameStack<T>& frames, const MaskMatrix& mask,
                                const std::string& method, int workers) {
    check_stack(frames);
    const auto rows = frames.front().rows();
    const auto cols = frames.front().cols();
    const MaskMatrix m = resolve_mask(mask, rows, cols);

    const bool use_median = (method == "median");
    if (!use_median && method != "mean") {
        throw ValidationError("whitefield method must be 'median' or 'mean', got '" + method + "'");
    }

    Matrix2D<T> wf = Matrix2D<T>::Zero(rows, cols);
    core::parallel_for(static_cast<size_t>(rows), workers, [&](size_t ri) {
        const Eigen::Index r = static_cast<Eigen::Index>(ri);
        std::vector<double> samples;
        samples.reserve(frames.size());
        for (Eigen::Index c = 0; c < cols; ++c) {
            if (m(r, c) == 0) continue;
            samples.clear();
            for (const auto& f : frames) {
                const double v = static_cast<double>(f(r, c));
                if (std::isfinite(v)) samples.push_back(v);
            }
            if (samples.empty()) continue;
            double value = 0.0;
            if (use_median) {
                value = core::median_of(samples);
            } else {
                std::sort(samples.begin(), samples.end());
                for (double v : samples) value += v;
                value /= static_cast<double>(samples.size());
            }
            wf(r, c) = static_cast<T>(value);
        }
    });
    return wf;
}

template <typename T>
FrameStack<T> estimate_dynamic_whitefields(const FrameStack<T>& frames,
                                           const Matrix2D<T>& whitefield, int size,
                                           int workers) {
    check_stack(frames);
    const auto rows = frames.front().rows();
    const auto cols = frames.front().cols();
    check_shape(whitefield, rows, cols, "whitefield", false);
    if (size < 1) {
        throw ValidationError("dynamic whitefield window must be >= 1");
    }

    const int n = static_cast<int>(frames.size());
    const int half = size / 2;
    FrameStack<T> out(frames.size(), Matrix2D<T>(rows, cols));

    core::parallel_for(static_cast<size_t>(rows), workers, [&](size_t ri) {
        const Eigen::Index r = static_cast<Eigen::Index>(ri);
        std::vector<double> window;
        window.reserve(static_cast<size_t>(size));
        for (Eigen::Index c = 0; c < cols; ++c) {
            const double w = static_cast<double>(whitefield(r, c));
            const double tol = w > 0.0 ? 3.0 * std::sqrt(w) : 0.0;
            for (int k = 0; k < n; ++k) {
                window.clear();
                const int lo = std::max(0, k - half);
                const int hi = std::min(n - 1, k + half);
                for (int j = lo; j <= hi; ++j) {
                    const double v = static_cast<double>(frames[static_cast<size_t>(j)](r, c));
                    if (std::isfinite(v) && std::abs(v - w) < tol) window.push_back(v);
                }
                out[static_cast<size_t>(k)](r, c) =
                    window.empty() ? static_cast<T>(w) : static_cast<T>(core::median_of(window));
            }
        }
    });
    return out;
}

namespace {

// Background-corrected frames as the rows of an N x P matrix
template <typename T>
Eigen::MatrixXd corrected_stack(const FrameStack<T>& frames, const Matrix2D<T>& whitefield,
                                const MaskMatrix& mask) {
    check_stack(frames);
    const auto rows = frames.front().rows();
    const auto cols = frames.front().cols();
    check_shape(whitefield, rows, cols, "whitefield", false);
    check_shape(mask, rows, cols, "mask");

    Eigen::MatrixXd c(static_cast<Eigen::Index>(frames.size()), rows * cols);
    for (size_t n = 0; n < frames.size(); ++n) {
        const auto row = static_cast<Eigen::Index>(n);
        for (Eigen::Index i = 0; i < rows * cols; ++i) {
            const bool ok = mask.size() == 0 || mask.data()[i] != 0;
            const double v = static_cast<double>(frames[n].data()[i]) -
                             static_cast<double>(whitefield.data()[i]);
            c(row, i) = ok && std::isfinite(v) ? v : 0.0;
        }
    }
    return c;
}

template <typename T>
Matrix2D<T> as_image(const Eigen::VectorXd& v, Eigen::Index rows, Eigen::Index cols) {
    Matrix2D<T> out(rows, cols);
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        out.data()[i] = static_cast<T>(v[i]);
    }
    return out;
}

} // namespace

template <typename T>
EigenFlatfields<T> eigen_flatfields(const FrameStack<T>& frames, const Matrix2D<T>& whitefield,
                                    const MaskMatrix& mask, int n_components) {
    const Eigen::MatrixXd c = corrected_stack(frames, whitefield, mask);
    const Eigen::Index n = c.rows();
    const Eigen::MatrixXd gram = c * c.transpose();

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(gram);
    if (solver.info() != Eigen::Success) {
        throw SpeckleTrackError("eigen decomposition of the frame Gram matrix failed");
    }
    // Eigenvalues come in increasing order; round-off can make the smallest negative
    const Eigen::VectorXd lambda = solver.eigenvalues().cwiseMax(0.0);
    const double total = lambda.sum();
    const Eigen::Index keep =
        n_components > 0 ? std::min<Eigen::Index>(n_components, n) : n;

    EigenFlatfields<T> out;
    out.flatfields.reserve(static_cast<size_t>(keep));
    out.explained.reserve(static_cast<size_t>(keep));
    for (Eigen::Index k = 0; k < keep; ++k) {
        const Eigen::Index idx = n - 1 - k;
        const Eigen::VectorXd eff = c.transpose() * solver.eigenvectors().col(idx);
        out.flatfields.push_back(as_image<T>(eff, frames.front().rows(), frames.front().cols()));
        out.explained.push_back(total > 0.0 ? lambda[idx] / total : 0.0);
    }
    std::cerr << "[WHITEFIELD] " << keep << " eigen flat-fields explain "
              << 100.0 * std::accumulate(out.explained.begin(), out.explained.end(), 0.0)
              << "% of the variance" << std::endl;
    return out;
}

template <typename T>
FrameStack<T> pca_whitefields(const FrameStack<T>& frames, const Matrix2D<T>& whitefield,
                              const MaskMatrix& mask, const FrameStack<T>& flatfields) {
    const Eigen::MatrixXd c = corrected_stack(frames, whitefield, mask);
    const auto rows = frames.front().rows();
    const auto cols = frames.front().cols();
    if (flatfields.empty()) {
        throw ValidationError("no eigen flat-fields were provided");
    }

    Eigen::MatrixXd effs(static_cast<Eigen::Index>(flatfields.size()), rows * cols);
    for (size_t k = 0; k < flatfields.size(); ++k) {
        check_shape(flatfields[k], rows, cols, "eigen flat-field", false);
        for (Eigen::Index i = 0; i < rows * cols; ++i) {
            effs(static_cast<Eigen::Index>(k), i) = static_cast<double>(flatfields[k].data()[i]);
        }
    }
    const Eigen::VectorXd norms = effs.rowwise().squaredNorm();
    Eigen::MatrixXd weights = c * effs.transpose();
    for (Eigen::Index k = 0; k < weights.cols(); ++k) {
        if (norms[k] > 0.0) {
            weights.col(k) /= norms[k];
        } else {
            weights.col(k).setZero();
        }
    }
    const Eigen::MatrixXd fitted = weights * effs;

    FrameStack<T> out;
    out.reserve(frames.size());
    for (Eigen::Index n = 0; n < fitted.rows(); ++n) {
        Matrix2D<T> wf = whitefield;
        for (Eigen::Index i = 0; i < rows * cols; ++i) {
            wf.data()[i] += static_cast<T>(fitted(n, i));
        }
        out.push_back(std::move(wf));
    }
    return out;
}

template <typename T>
FrameStack<T> apply_flatfield_correction(const FrameStack<T>& frames,
                                         const Matrix2D<T>& whitefield,
                                         const FrameStack<T>& dynamic_whitefields) {
    check_stack(frames);
    if (dynamic_whitefields.size() != frames.size()) {
        throw ShapeMismatchError("expected " + std::to_string(frames.size()) +
                                 " dynamic whitefields, got " +
                                 std::to_string(dynamic_whitefields.size()));
    }
    const auto rows = frames.front().rows();
    const auto cols = frames.front().cols();
    check_shape(whitefield, rows, cols, "whitefield", false);

    FrameStack<T> out = frames;
    for (size_t n = 0; n < frames.size(); ++n) {
        check_shape(dynamic_whitefields[n], rows, cols, "dynamic whitefield", false);
        for (Eigen::Index i = 0; i < out[n].size(); ++i) {
            const T wn = dynamic_whitefields[n].data()[i];
            if (wn > T(0)) {
                out[n].data()[i] *= whitefield.data()[i] / wn;
            }
        }
    }
    return out;
}

template <typename T>
std::vector<int> good_frames(const FrameStack<T>& frames) {
    std::vector<int> idx;
    for (size_t n = 0; n < frames.size(); ++n) {
        if (frames[n].template cast<double>().sum() != 0.0) {
            idx.push_back(static_cast<int>(n));
        }
    }
    return idx;
}

template <typename T>
FrameStack<T> select_frames(const FrameStack<T>& frames, const std::vector<int>& indices) {
    FrameStack<T> out;
    out.reserve(indices.size());
    for (int i : indices) {
        if (i < 0 || static_cast<size_t>(i) >= frames.size()) {
            throw ValidationError("frame index " + std::to_string(i) + " out of range");
        }
        out.push_back(frames[static_cast<size_t>(i)]);
    }
    return out;
}

template <typename T>
FrameStack<T> integrate_frames(const FrameStack<T>& frames, const MaskMatrix& mask, int axis) {
    check_stack(frames);
    if (axis != 0 && axis != 1) {
        throw ValidationError("integration axis must be 0 or 1");
    }
    const auto rows = frames.front().rows();
    const auto cols = frames.front().cols();
    const Matrix2D<T> m = resolve_mask(mask, rows, cols).template cast<T>();

    FrameStack<T> out;
    out.reserve(frames.size());
    for (const auto& f : frames) {
        const Matrix2D<T> masked = f.cwiseProduct(m);
        if (axis == 0) {
            out.push_back(Matrix2D<T>(masked.colwise().sum()));
        } else {
            out.push_back(Matrix2D<T>(masked.rowwise().sum()));
        }
    }
    return out;
}

template Matrix2D<float> estimate_whitefield<float>(const FrameStack<float>&, const MaskMatrix&,
                                                    const std::string&, int);
template Matrix2D<double> estimate_whitefield<double>(const FrameStack<double>&, const MaskMatrix&,
                                                      const std::string&, int);
template FrameStack<float> estimate_dynamic_whitefields<float>(const FrameStack<float>&,
                                                               const Matrix2D<float>&, int, int);
template FrameStack<double> estimate_dynamic_whitefields<double>(const FrameStack<double>&,
                                                                 const Matrix2D<double>&, int, int);
template EigenFlatfields<float> eigen_flatfields<float>(const FrameStack<float>&,
                                                        const Matrix2D<float>&,
                                                        const MaskMatrix&, int);
template EigenFlatfields<double> eigen_flatfields<double>(const FrameStack<double>&,
                                                          const Matrix2D<double>&,
                                                          const MaskMatrix&, int);
template FrameStack<float> pca_whitefields<float>(const FrameStack<float>&, const Matrix2D<float>&,
                                                  const MaskMatrix&, const FrameStack<float>&);
template FrameStack<double> pca_whitefields<double>(const FrameStack<double>&,
                                                    const Matrix2D<double>&, const MaskMatrix&,
                                                    const FrameStack<double>&);
template FrameStack<float> apply_flatfield_correction<float>(const FrameStack<float>&,
                                                             const Matrix2D<float>&,
                                                             const FrameStack<float>&);
template FrameStack<double> apply_flatfield_correction<double>(const FrameStack<double>&,
                                                               const Matrix2D<double>&,
                                                               const FrameStack<double>&);
template std::vector<int> good_frames<float>(const FrameStack<float>&);
template std::vector<int> good_frames<double>(const FrameStack<double>&);
template FrameStack<float> select_frames<float>(const FrameStack<float>&, const std::vector<int>&);
template FrameStack<double> select_frames<double>(const FrameStack<double>&, const std::vector<int>&);
template FrameStack<float> integrate_frames<float>(const FrameStack<float>&, const MaskMatrix&, int);
template FrameStack<double> integrate_frames<double>(const FrameStack<double>&, const MaskMatrix&, int);

} // namespace speckle_track::image
