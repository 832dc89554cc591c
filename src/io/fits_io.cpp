#include "speckle_track/io/fits_io.hpp"
#include "speckle_track/core/errors.hpp"
#include "speckle_track/core/utils.hpp"
#include "speckle_track/geometry/geometry.hpp"

#include <fitsio.h>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

namespace speckle_track::io {

namespace {

template <typename V>
std::optional<V> card_as(const std::map<std::string, FitsValue>& cards, const std::string& key) {
    auto it = cards.find(core::to_upper(key));
    if (it == cards.end()) return std::nullopt;
    if (const V* v = std::get_if<V>(&it->second)) return *v;
    return std::nullopt;
}

bool is_structural_key(const std::string& key) {
    return key == "SIMPLE" || key == "BITPIX" || key == "EXTEND" || key.rfind("NAXIS", 0) == 0;
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    return card_as<std::string>(cards, key);
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    if (auto d = card_as<double>(cards, key)) return d;
    if (auto i = card_as<int>(cards, key)) return static_cast<double>(*i);
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    return card_as<int>(cards, key);
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    return card_as<bool>(cards, key);
}

void FitsHeader::set(const std::string& key, FitsValue value) {
    if (key.empty() || key.size() > 8) {
        throw FitsError("FITS keyword must have 1 to 8 characters: '" + key + "'");
    }
    cards[core::to_upper(key)] = std::move(value);
}

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

namespace {

// Owns an open fitsfile; closes it on scope exit
class FitsHandle {
public:
    FitsHandle(const fs::path& path, bool create) : path_(path) {
        int status = 0;
        if (create) {
            std::string filepath = "!" + path.string();
            if (fits_create_file(&fptr_, filepath.c_str(), &status)) {
                throw FitsError("Cannot create FITS file: " + path.string());
            }
        } else if (fits_open_file(&fptr_, path.string().c_str(), READONLY, &status)) {
            throw FitsError("Cannot open FITS file: " + path.string());
        }
    }

    ~FitsHandle() {
        if (fptr_) {
            int status = 0;
            fits_close_file(fptr_, &status);
        }
    }

    FitsHandle(const FitsHandle&) = delete;
    FitsHandle& operator=(const FitsHandle&) = delete;

    fitsfile* get() const { return fptr_; }

    void check(int status, const std::string& what) const {
        if (status) {
            throw FitsError(what + ": " + path_.string());
        }
    }

    // Flushes and closes, reporting write errors
    void close() {
        int status = 0;
        fitsfile* f = fptr_;
        fptr_ = nullptr;
        if (fits_close_file(f, &status)) {
            throw FitsError("Cannot close FITS file: " + path_.string());
        }
    }

private:
    fs::path path_;
    fitsfile* fptr_ = nullptr;
};

struct ImageDims {
    int naxis = 0;
    long naxes[3] = {0, 0, 0};
};

ImageDims read_dims(const FitsHandle& f) {
    ImageDims d;
    int bitpix = 0;
    int status = 0;
    fits_get_img_param(f.get(), 3, &bitpix, &d.naxis, d.naxes, &status);
    f.check(status, "Cannot read FITS image parameters");
    if (d.naxis < 2) {
        throw FitsError("FITS image has less than 2 dimensions");
    }
    if (d.naxis == 2) d.naxes[2] = 1;
    return d;
}

// Cards cfitsio cannot classify, or whose value does not parse, are kept as text
FitsHeader read_header(const FitsHandle& f) {
    FitsHeader header;
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(f.get(), &nkeys, nullptr, &status);
    f.check(status, "Cannot read FITS header");

    for (int n = 1; n <= nkeys; ++n) {
        char name[FLEN_KEYWORD] = {0};
        char raw[FLEN_VALUE] = {0};
        char comment[FLEN_COMMENT] = {0};
        status = 0;
        fits_read_keyn(f.get(), n, name, raw, comment, &status);
        f.check(status, "Cannot read FITS header card " + std::to_string(n));

        const std::string key(name);
        if (key.empty() || key.size() > 8 || raw[0] == '\0' || is_structural_key(key)) {
            continue;
        }
        char dtype = 'C';
        status = 0;
        if (fits_get_keytype(raw, &dtype, &status)) {
            dtype = 'C';
        }

        std::string text(raw);
        if (dtype == 'L') {
            header.set(key, text == "T");
            continue;
        }
        if (dtype == 'I' || dtype == 'F') {
            char* end = nullptr;
            if (dtype == 'I') {
                const long v = std::strtol(text.c_str(), &end, 10);
                if (*end == '\0' && v >= std::numeric_limits<int>::min() &&
                    v <= std::numeric_limits<int>::max()) {
                    header.set(key, static_cast<int>(v));
                    continue;
                }
            } else {
                const double v = std::strtod(text.c_str(), &end);
                if (*end == '\0') {
                    header.set(key, v);
                    continue;
                }
            }
        }
        // Strip the quotes and trailing blanks of a string card
        if (dtype == 'C' && text.size() >= 2 && text.front() == '\'' && text.back() == '\'') {
            text = text.substr(1, text.size() - 2);
            const auto last = text.find_last_not_of(' ');
            text.erase(last == std::string::npos ? 0 : last + 1);
        }
        header.set(key, text);
    }
    return header;
}

void write_header(FitsHandle& f, const FitsHeader& header) {
    int status = 0;
    for (const auto& [key, card] : header.cards) {
        if (is_structural_key(key)) continue;
        std::visit(
            [&](const auto& v) {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, std::string>) {
                    fits_update_key(f.get(), TSTRING, key.c_str(), const_cast<char*>(v.c_str()),
                                    nullptr, &status);
                } else if constexpr (std::is_same_v<V, bool>) {
                    int logical = v ? 1 : 0;
                    fits_update_key(f.get(), TLOGICAL, key.c_str(), &logical, nullptr, &status);
                } else if constexpr (std::is_same_v<V, int>) {
                    int iv = v;
                    fits_update_key(f.get(), TINT, key.c_str(), &iv, nullptr, &status);
                } else {
                    double dv = v;
                    fits_update_key(f.get(), TDOUBLE, key.c_str(), &dv, nullptr, &status);
                }
            },
            card);
        f.check(status, "Cannot write FITS keyword " + key);
    }
}

} // namespace

std::tuple<int, int, int> get_fits_dimensions(const fs::path& path) {
    FitsHandle f(path, false);
    const ImageDims d = read_dims(f);
    return {static_cast<int>(d.naxes[0]), static_cast<int>(d.naxes[1]),
            static_cast<int>(d.naxes[2])};
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    FitsHandle f(path, false);
    const ImageDims d = read_dims(f);

    // Row-major Eigen storage matches FITS order (NAXIS1 fastest)
    Matrix2Df data(d.naxes[1], d.naxes[0]);
    long fpixel[3] = {1, 1, 1};
    int status = 0;
    fits_read_pix(f.get(), TFLOAT, fpixel, d.naxes[0] * d.naxes[1], nullptr, data.data(),
                  nullptr, &status);
    f.check(status, "Cannot read FITS pixel data");

    FitsHeader header = read_header(f);
    return {std::move(data), std::move(header)};
}

Matrix2Dd read_fits_double(const fs::path& path) {
    FitsHandle f(path, false);
    const ImageDims d = read_dims(f);

    Matrix2Dd data(d.naxes[1], d.naxes[0]);
    long fpixel[3] = {1, 1, 1};
    int status = 0;
    fits_read_pix(f.get(), TDOUBLE, fpixel, d.naxes[0] * d.naxes[1], nullptr, data.data(),
                  nullptr, &status);
    f.check(status, "Cannot read FITS pixel data");
    return data;
}

template <typename T>
std::pair<FrameStack<T>, FitsHeader> read_fits_stack(const fs::path& path) {
    FitsHandle f(path, false);
    const ImageDims d = read_dims(f);
    const int datatype = std::is_same<T, float>::value ? TFLOAT : TDOUBLE;

    const long plane = d.naxes[0] * d.naxes[1];
    FrameStack<T> frames;
    frames.reserve(static_cast<size_t>(d.naxes[2]));
    for (long k = 0; k < d.naxes[2]; ++k) {
        Matrix2D<T> img(d.naxes[1], d.naxes[0]);
        long fpixel[3] = {1, 1, k + 1};
        int status = 0;
        fits_read_pix(f.get(), datatype, fpixel, plane, nullptr, img.data(), nullptr, &status);
        f.check(status, "Cannot read FITS plane " + std::to_string(k));
        frames.push_back(std::move(img));
    }

    FitsHeader header = read_header(f);
    return {std::move(frames), std::move(header)};
}

template std::pair<FrameStack<float>, FitsHeader> read_fits_stack<float>(const fs::path&);
template std::pair<FrameStack<double>, FitsHeader> read_fits_stack<double>(const fs::path&);

MaskMatrix read_fits_mask(const fs::path& path) {
    const Matrix2Df img = read_fits_float(path).first;
    MaskMatrix mask(img.rows(), img.cols());
    for (Eigen::Index i = 0; i < img.size(); ++i) {
        mask.data()[i] = img.data()[i] > 0.0f ? 1 : 0;
    }
    return mask;
}

Translations read_fits_translations(const fs::path& path) {
    return geometry::to_translations(read_fits_double(path));
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    FitsHandle f(path, true);
    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    int status = 0;
    fits_create_img(f.get(), FLOAT_IMG, 2, naxes, &status);
    f.check(status, "Cannot create FITS image");
    write_header(f, header);

    long fpixel[2] = {1, 1};
    fits_write_pix(f.get(), TFLOAT, fpixel, static_cast<LONGLONG>(data.size()),
                   const_cast<float*>(data.data()), &status);
    f.check(status, "Cannot write FITS pixel data");
    f.close();
}

void write_fits_double(const fs::path& path, const Matrix2Dd& data, const FitsHeader& header) {
    FitsHandle f(path, true);
    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    int status = 0;
    fits_create_img(f.get(), DOUBLE_IMG, 2, naxes, &status);
    f.check(status, "Cannot create FITS image");
    write_header(f, header);

    long fpixel[2] = {1, 1};
    fits_write_pix(f.get(), TDOUBLE, fpixel, static_cast<LONGLONG>(data.size()),
                   const_cast<double*>(data.data()), &status);
    f.check(status, "Cannot write FITS pixel data");
    f.close();
}

void write_fits_cube(const fs::path& path, const FrameStack<float>& planes, const FitsHeader& header) {
    if (planes.empty()) {
        throw FitsError("Cannot write empty cube: " + path.string());
    }
    const long rows = static_cast<long>(planes.front().rows());
    const long cols = static_cast<long>(planes.front().cols());
    for (const auto& p : planes) {
        if (p.rows() != rows || p.cols() != cols) {
            throw ShapeMismatchError("cube planes differ in shape: " + path.string());
        }
    }

    FitsHandle f(path, true);
    long naxes[3] = {cols, rows, static_cast<long>(planes.size())};
    int status = 0;
    fits_create_img(f.get(), FLOAT_IMG, 3, naxes, &status);
    f.check(status, "Cannot create FITS cube");
    write_header(f, header);

    for (size_t k = 0; k < planes.size(); ++k) {
        long fpixel[3] = {1, 1, static_cast<long>(k) + 1};
        fits_write_pix(f.get(), TFLOAT, fpixel, static_cast<LONGLONG>(rows * cols),
                       const_cast<float*>(planes[k].data()), &status);
        f.check(status, "Cannot write FITS plane " + std::to_string(k));
    }
    f.close();
}

} // namespace speckle_track::io
