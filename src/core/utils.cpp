#include "speckle_track/core/utils.hpp"
#include "speckle_track/core/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>

#include <openssl/evp.h>

namespace speckle_track::core {

namespace {

template <typename T>
T median_inplace(std::vector<T>& v) {
    if (v.empty()) return T(0);
    const size_t mid = v.size() / 2;
    auto m = v.begin() + static_cast<std::ptrdiff_t>(mid);
    std::nth_element(v.begin(), m, v.end());
    if (v.size() % 2 == 1) return *m;
    return T(0.5) * (*std::max_element(v.begin(), m) + *m);
}

std::string format_utc(std::chrono::system_clock::time_point t, const char* fmt) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm_buf;
    gmtime_r(&tt, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, fmt);
    return oss.str();
}

using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestCtx new_sha256() {
    DigestCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw SpeckleTrackError("SHA-256 digest initialisation failed");
    }
    return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, md.data(), &len) != 1) {
        throw SpeckleTrackError("SHA-256 digest failed");
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(md[i]);
    }
    return oss.str();
}

} // namespace

std::string get_iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << format_utc(now, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms << 'Z';
    return oss.str();
}

// st_<UTC time>_<8 hex digits>, sortable by start time
std::string get_run_id() {
    std::random_device rd;
    std::uniform_int_distribution<uint32_t> dis;
    std::ostringstream oss;
    oss << "st_" << format_utc(std::chrono::system_clock::now(), "%Y%m%dT%H%M%S") << '_'
        << std::hex << std::setfill('0') << std::setw(8) << dis(rd);
    return oss.str();
}

// Goes through a sibling temporary so a crash never leaves a half-written file
void write_text(const fs::path& path, const std::string& text) {
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            throw IOError("Cannot create file: " + tmp.string());
        }
        file << text;
        if (!file.flush()) {
            throw IOError("Cannot write file: " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        throw IOError("Cannot move " + tmp.string() + " to " + path.string() + ": " + ec.message());
    }
}

void copy_config(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw IOError("Cannot copy config " + src.string() + ": " + ec.message());
    }
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    DigestCtx ctx = new_sha256();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw SpeckleTrackError("SHA-256 digest failed");
    }
    return finish_hex(ctx.get());
}

std::string sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }
    DigestCtx ctx = new_sha256();
    std::vector<char> chunk(1 << 16);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<size_t>(got)) != 1) {
            throw SpeckleTrackError("SHA-256 digest failed");
        }
    }
    if (file.bad()) {
        throw IOError("Cannot read file: " + path.string());
    }
    return finish_hex(ctx.get());
}

float median_of(std::vector<float>& v) {
    return median_inplace(v);
}

double median_of(std::vector<double>& v) {
    return median_inplace(v);
}

// Linear interpolation between closest ranks (NumPy's default)
double percentile_of(std::vector<double> values, double percentile) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());

    const double p = std::min(std::max(percentile, 0.0), 100.0);
    const double idx = p / 100.0 * static_cast<double>(values.size() - 1);
    const size_t lower = static_cast<size_t>(idx);
    const size_t upper = std::min(lower + 1, values.size() - 1);
    const double frac = idx - static_cast<double>(lower);

    return values[lower] * (1.0 - frac) + values[upper] * frac;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace speckle_track::core
