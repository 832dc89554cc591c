#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace speckle_track::core {

namespace fs = std::filesystem;

std::string get_iso_timestamp();
std::string get_run_id();

// Output files
void write_text(const fs::path& path, const std::string& text);
void copy_config(const fs::path& src, const fs::path& dst);

// Hex SHA-256 digests, used for the run manifest
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// NaN-free inputs only; median_of reorders v
float median_of(std::vector<float>& v);
double median_of(std::vector<double>& v);
double percentile_of(std::vector<double> values, double percentile);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

} // namespace speckle_track::core
