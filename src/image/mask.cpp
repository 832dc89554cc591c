#include "speckle_track/image/mask.hpp"
#include "speckle_track/core/errors.hpp"
#include "speckle_track/core/utils.hpp"
#include "speckle_track/image/processing.hpp"

#include <cmath>
#include <vector>

namespace speckle_track::image {

namespace {

std::string shape_str(Eigen::Index rows, Eigen::Index cols) {
    return std::to_string(rows) + "x" + std::to_string(cols);
}

} // namespace

template <typename T>
void check_stack(const FrameStack<T>& frames) {
    if (frames.empty()) {
        throw ShapeMismatchError("frame stack is empty");
    }
    const auto rows = frames.front().rows();
    const auto cols = frames.front().cols();
    if (rows == 0 || cols == 0) {
        throw ShapeMismatchError("frames have zero size");
    }
    for (size_t n = 1; n < frames.size(); ++n) {
        if (frames[n].rows() != rows || frames[n].cols() != cols) {
            throw ShapeMismatchError("frame " + std::to_string(n) + " is " +
                                     shape_str(frames[n].rows(), frames[n].cols()) +
                                     ", expected " + shape_str(rows, cols));
        }
    }
}

template <typename M>
void check_shape(const M& m, Eigen::Index rows, Eigen::Index cols, const std::string& what,
                 bool allow_empty) {
    if (allow_empty && m.size() == 0) return;
    if (m.rows() != rows || m.cols() != cols) {
        throw ShapeMismatchError(what + " is " + shape_str(m.rows(), m.cols()) +
                                 ", frames are " + shape_str(rows, cols));
    }
}

MaskMatrix resolve_mask(const MaskMatrix& mask, Eigen::Index rows, Eigen::Index cols) {
    if (mask.size() == 0) {
        return MaskMatrix::Ones(rows, cols);
    }
    check_shape(mask, rows, cols, "mask", false);
    return mask;
}

template <typename T>
MaskMatrix update_mask(const FrameStack<T>& frames, const config::MaskConfig& cfg) {
    check_stack(frames);
    const auto rows = frames.front().rows();
    const auto cols = frames.front().cols();
    MaskMatrix mask = MaskMatrix::Ones(rows, cols);

    if (cfg.method == "no-bad") {
        return mask;
    }

    if (cfg.method == "range-bad") {
        for (const auto& f : frames) {
            for (Eigen::Index i = 0; i < f.size(); ++i) {
                const double v = static_cast<double>(f.data()[i]);
                if (!(v >= cfg.vmin && v < cfg.vmax)) {
                    mask.data()[i] = 0;
                }
            }
        }
        return mask;
    }

    if (cfg.method == "perc-bad") {
        std::vector<Matrix2Dd> offsets;
        offsets.reserve(frames.size());
        std::vector<double> all;
        all.reserve(frames.size() * static_cast<size_t>(rows * cols));
        for (const auto& f : frames) {
            const Matrix2Df ff = f.template cast<float>();
            const Matrix2Df med = median_filter_3x3(ff);
            Matrix2Dd off = (ff - med).template cast<double>();
            for (Eigen::Index i = 0; i < off.size(); ++i) {
                all.push_back(off.data()[i]);
            }
            offsets.push_back(std::move(off));
        }
        const double lo = core::percentile_of(all, cfg.pmin);
        const double hi = core::percentile_of(all, cfg.pmax);
        for (const auto& off : offsets) {
            for (Eigen::Index i = 0; i < off.size(); ++i) {
                const double v = off.data()[i];
                if (!(v >= lo && v <= hi)) {
                    mask.data()[i] = 0;
                }
            }
        }
        return mask;
    }

    throw ValidationError("unknown mask method '" + cfg.method + "'");
}

template void check_stack<float>(const FrameStack<float>&);
template void check_stack<double>(const FrameStack<double>&);
template void check_shape<MaskMatrix>(const MaskMatrix&, Eigen::Index, Eigen::Index,
                                      const std::string&, bool);
template void check_shape<Matrix2Df>(const Matrix2Df&, Eigen::Index, Eigen::Index,
                                     const std::string&, bool);
template void check_shape<Matrix2Dd>(const Matrix2Dd&, Eigen::Index, Eigen::Index,
                                     const std::string&, bool);
template MaskMatrix update_mask<float>(const FrameStack<float>&, const config::MaskConfig&);
template MaskMatrix update_mask<double>(const FrameStack<double>&, const config::MaskConfig&);

} // namespace speckle_track::image
