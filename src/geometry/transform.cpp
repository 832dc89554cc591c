#include "speckle_track/geometry/transform.hpp"
#include "speckle_track/core/errors.hpp"

#include <algorithm>

namespace speckle_track::geometry {

IndexPair detector_indices(int rows, int cols) {
    IndexArray ss(rows, cols);
    IndexArray fs(rows, cols);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            ss(r, c) = r;
            fs(r, c) = c;
        }
    }
    return {std::move(ss), std::move(fs)};
}

static IndexPair take_block(const IndexArray& ss, const IndexArray& fs,
                            int r0, int r1, int c0, int c1) {
    r1 = std::min(r1, static_cast<int>(ss.rows()));
    c1 = std::min(c1, static_cast<int>(ss.cols()));
    if (r0 >= r1 || c0 >= c1) {
        throw ValidationError("transform region is empty for a " +
                              std::to_string(ss.rows()) + "x" + std::to_string(ss.cols()) + " frame");
    }
    return {IndexArray(ss.block(r0, c0, r1 - r0, c1 - c0)),
            IndexArray(fs.block(r0, c0, r1 - r0, c1 - c0))};
}

Crop::Crop(const std::array<int, 4>& roi) : roi_(roi) {
    if (roi_[0] < 0 || roi_[2] < 0 || roi_[1] <= roi_[0] || roi_[3] <= roi_[2]) {
        throw ValidationError("crop roi must satisfy 0 <= min < max on both axes");
    }
}

IndexPair Crop::index_array(const IndexArray& ss, const IndexArray& fs) const {
    // Integrated frames keep their singleton axis
    if (ss.rows() == 1) {
        return take_block(ss, fs, 0, 1, roi_[2], roi_[3]);
    }
    if (ss.cols() == 1) {
        return take_block(ss, fs, roi_[0], roi_[1], 0, 1);
    }
    return take_block(ss, fs, roi_[0], roi_[1], roi_[2], roi_[3]);
}

Downscale::Downscale(int scale) : scale_(scale) {
    if (scale_ < 1) {
        throw ValidationError("downscale factor must be >= 1");
    }
}

IndexPair Downscale::index_array(const IndexArray& ss, const IndexArray& fs) const {
    const int rows = static_cast<int>((ss.rows() + scale_ - 1) / scale_);
    const int cols = static_cast<int>((ss.cols() + scale_ - 1) / scale_);
    IndexArray out_ss(rows, cols);
    IndexArray out_fs(rows, cols);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            out_ss(r, c) = ss(r * scale_, c * scale_);
            out_fs(r, c) = fs(r * scale_, c * scale_);
        }
    }
    return {std::move(out_ss), std::move(out_fs)};
}

Mirror::Mirror(int axis) : axis_(axis) {
    if (axis_ != 0 && axis_ != 1) {
        throw ValidationError("mirror axis must be 0 or 1");
    }
}

IndexPair Mirror::index_array(const IndexArray& ss, const IndexArray& fs) const {
    if (axis_ == 0) {
        return {IndexArray(ss.colwise().reverse()), IndexArray(fs.colwise().reverse())};
    }
    return {IndexArray(ss.rowwise().reverse()), IndexArray(fs.rowwise().reverse())};
}

ComposeTransforms::ComposeTransforms(std::vector<std::shared_ptr<const Transform>> transforms)
    : transforms_(std::move(transforms)) {
    if (transforms_.size() < 2) {
        throw ValidationError("two or more transforms are needed to compose");
    }
    for (const auto& t : transforms_) {
        if (!t) {
            throw ValidationError("null transform in composition");
        }
    }
}

IndexPair ComposeTransforms::index_array(const IndexArray& ss, const IndexArray& fs) const {
    IndexPair cur{ss, fs};
    for (const auto& t : transforms_) {
        cur = t->index_array(cur.first, cur.second);
    }
    return cur;
}

std::string ComposeTransforms::name() const {
    std::string out;
    for (const auto& t : transforms_) {
        if (!out.empty()) out += "+";
        out += t->name();
    }
    return out;
}

std::shared_ptr<const Transform> make_transform(const std::vector<config::TransformConfig>& cfgs) {
    std::vector<std::shared_ptr<const Transform>> list;
    for (const auto& c : cfgs) {
        if (c.type == "crop") {
            list.push_back(std::make_shared<Crop>(c.roi));
        } else if (c.type == "downscale") {
            list.push_back(std::make_shared<Downscale>(c.scale));
        } else if (c.type == "mirror") {
            list.push_back(std::make_shared<Mirror>(c.axis));
        } else {
            throw ValidationError("unknown transform type '" + c.type + "'");
        }
    }
    if (list.empty()) return nullptr;
    if (list.size() == 1) return list.front();
    return std::make_shared<ComposeTransforms>(std::move(list));
}

} // namespace speckle_track::geometry
