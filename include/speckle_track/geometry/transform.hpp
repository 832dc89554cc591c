#pragma once

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/types.hpp"

#include <array>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace speckle_track::geometry {

using IndexArray = Matrix2D<int>;
using IndexPair = std::pair<IndexArray, IndexArray>;

// Detector index grids (ss, fs) of shape (rows, cols)
IndexPair detector_indices(int rows, int cols);

/**
 * Geometric frame transform expressed as a re-indexing of the detector grid.
 * index_array() maps the (ss, fs) index grids of the untransformed frame to
 * the grids of the transformed frame; forward() gathers an image through it.
 */
class Transform {
public:
    virtual ~Transform() = default;

    virtual IndexPair index_array(const IndexArray& ss, const IndexArray& fs) const = 0;
    virtual std::string name() const = 0;

    template <typename T>
    Matrix2D<T> forward(const Matrix2D<T>& image) const {
        auto idx = detector_indices(static_cast<int>(image.rows()), static_cast<int>(image.cols()));
        auto out_idx = index_array(idx.first, idx.second);
        Matrix2D<T> out(out_idx.first.rows(), out_idx.first.cols());
        for (int r = 0; r < out.rows(); ++r) {
            for (int c = 0; c < out.cols(); ++c) {
                out(r, c) = image(out_idx.first(r, c), out_idx.second(r, c));
            }
        }
        return out;
    }

    template <typename T>
    FrameStack<T> forward(const FrameStack<T>& frames) const {
        FrameStack<T> out;
        out.reserve(frames.size());
        for (const auto& f : frames) {
            out.push_back(forward(f));
        }
        return out;
    }
};

// Region of interest [y_min, y_max, x_min, x_max), max bounds exclusive
class Crop : public Transform {
public:
    explicit Crop(const std::array<int, 4>& roi);

    IndexPair index_array(const IndexArray& ss, const IndexArray& fs) const override;
    std::string name() const override { return "crop"; }

    const std::array<int, 4>& roi() const { return roi_; }

private:
    std::array<int, 4> roi_;
};

// Keep every scale-th pixel along both axes
class Downscale : public Transform {
public:
    explicit Downscale(int scale);

    IndexPair index_array(const IndexArray& ss, const IndexArray& fs) const override;
    std::string name() const override { return "downscale"; }

    int scale() const { return scale_; }

private:
    int scale_;
};

// Reverse the order of rows (axis 0) or columns (axis 1)
class Mirror : public Transform {
public:
    explicit Mirror(int axis);

    IndexPair index_array(const IndexArray& ss, const IndexArray& fs) const override;
    std::string name() const override { return "mirror"; }

    int axis() const { return axis_; }

private:
    int axis_;
};

// Applies its transforms in list order
class ComposeTransforms : public Transform {
public:
    explicit ComposeTransforms(std::vector<std::shared_ptr<const Transform>> transforms);

    IndexPair index_array(const IndexArray& ss, const IndexArray& fs) const override;
    std::string name() const override;

    size_t size() const { return transforms_.size(); }

private:
    std::vector<std::shared_ptr<const Transform>> transforms_;
};

// Build the transform chain described by frames.transforms; nullptr if empty
std::shared_ptr<const Transform> make_transform(const std::vector<config::TransformConfig>& cfgs);

} // namespace speckle_track::geometry
