#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace speckle_track {

namespace fs = std::filesystem;

// Matrix types (NumPy equivalents)
template <typename T>
using Matrix2D = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Df = Matrix2D<float>;
using Matrix2Dd = Matrix2D<double>;

template <typename T>
using VectorX = Eigen::Matrix<T, Eigen::Dynamic, 1>;
using VectorXf = Eigen::VectorXf;
using VectorXd = Eigen::VectorXd;
using VectorXi = Eigen::VectorXi;

// Non-zero entries mark usable detector pixels
using MaskMatrix = Matrix2D<uint8_t>;

// One 2-D intensity image per scan position
template <typename T>
using FrameStack = std::vector<Matrix2D<T>>;

// Detector plane orientation: row 0 = slow (ss) axis, row 1 = fast (fs) axis
using BasisVectors = Eigen::Matrix<double, 2, 3, Eigen::RowMajor>;

// Physical sample translations [m], one row per frame
using Translations = Eigen::Matrix<double, Eigen::Dynamic, 3, Eigen::RowMajor>;

// Per-pixel mapping from detector pixels to reference coordinates
template <typename T>
struct PixelMap {
    Matrix2D<T> ss;  // row coordinate in the reference frame
    Matrix2D<T> fs;  // column coordinate in the reference frame

    int rows() const { return static_cast<int>(ss.rows()); }
    int cols() const { return static_cast<int>(ss.cols()); }
};

// Per-frame translations in detector pixels
template <typename T>
struct PixelTranslations {
    VectorX<T> di;  // row component
    VectorX<T> dj;  // column component

    int size() const { return static_cast<int>(di.size()); }
};

// Sampling grid of the reference image expressed in detector coordinates.
// Cell (r, c) sits at (origin_ss + r * ds_y, origin_fs + c * ds_x).
struct ReferenceGrid {
    double origin_ss = 0.0;
    double origin_fs = 0.0;
    double ds_y = 1.0;
    double ds_x = 1.0;
    int rows = 0;
    int cols = 0;
};

// Reconstructed reference (object) image with its back-projection accumulators
template <typename T>
struct ReferenceImage {
    ReferenceGrid grid;
    Matrix2D<T> image;    // NaN where no sample landed
    Matrix2D<T> weights;  // accumulated interpolation weight
    Matrix2D<T> counts;   // number of contributing samples
};

// Pipeline phase enumeration
enum class Phase {
    LOAD_INPUT = 0,
    MASK = 1,
    WHITEFIELD = 2,
    PIXEL_MAP_INIT = 3,
    REFERENCE_INIT = 4,
    ITERATION = 5,
    DEFOCUS_SWEEP = 6,
    PHASE_RETRIEVAL = 7,
    WRITE_OUTPUT = 8,
    DONE = 9
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD_INPUT: return "LOAD_INPUT";
        case Phase::MASK: return "MASK";
        case Phase::WHITEFIELD: return "WHITEFIELD";
        case Phase::PIXEL_MAP_INIT: return "PIXEL_MAP_INIT";
        case Phase::REFERENCE_INIT: return "REFERENCE_INIT";
        case Phase::ITERATION: return "ITERATION";
        case Phase::DEFOCUS_SWEEP: return "DEFOCUS_SWEEP";
        case Phase::PHASE_RETRIEVAL: return "PHASE_RETRIEVAL";
        case Phase::WRITE_OUTPUT: return "WRITE_OUTPUT";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace speckle_track
