#pragma once

#include "speckle_track/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>

namespace speckle_track::io {

using FitsValue = std::variant<bool, int, double, std::string>;

// Non-structural header cards. Keywords are stored upper case and are at most
// eight characters; SIMPLE, BITPIX, NAXISn and EXTEND are never carried.
struct FitsHeader {
    std::map<std::string, FitsValue> cards;

    std::optional<std::string> get_string(const std::string& key) const;
    // Integer cards convert
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    // Throws FitsError for an empty or over-long keyword
    void set(const std::string& key, FitsValue value);
    void set(const std::string& key, const char* value) { set(key, std::string(value)); }
};

bool is_fits_image_path(const fs::path& path);

// (naxis1, naxis2, naxis3); naxis3 = 1 for 2-D images
std::tuple<int, int, int> get_fits_dimensions(const fs::path& path);

// First plane of the primary image
std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

// Primary image as a double matrix (rows = NAXIS2, cols = NAXIS1)
Matrix2Dd read_fits_double(const fs::path& path);

// 3-D cube -> one frame per NAXIS3 plane; a 2-D image gives a single frame
// Pixels are converted by cfitsio to float or double
template <typename T = float>
std::pair<FrameStack<T>, FitsHeader> read_fits_stack(const fs::path& path);

// Image > 0 -> valid
MaskMatrix read_fits_mask(const fs::path& path);

// N x 2 or N x 3 table stored as a 2-D image
Translations read_fits_translations(const fs::path& path);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);
void write_fits_double(const fs::path& path, const Matrix2Dd& data, const FitsHeader& header);
void write_fits_cube(const fs::path& path, const FrameStack<float>& planes, const FitsHeader& header);

} // namespace speckle_track::io
