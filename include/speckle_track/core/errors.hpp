#pragma once

#include <stdexcept>
#include <string>

namespace speckle_track {

class SpeckleTrackError : public std::runtime_error {
public:
    explicit SpeckleTrackError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public SpeckleTrackError {
public:
    explicit ConfigError(const std::string& message)
        : SpeckleTrackError("Config error: " + message) {}
};

class ValidationError : public SpeckleTrackError {
public:
    explicit ValidationError(const std::string& message)
        : SpeckleTrackError("Validation error: " + message) {}
};

// Frame stack, mask, whitefield or pixel map dimensions disagree
class ShapeMismatchError : public SpeckleTrackError {
public:
    explicit ShapeMismatchError(const std::string& message)
        : SpeckleTrackError("Shape mismatch: " + message) {}
};

// Basis vectors, pitches or distances give a zero/NaN normalization
class DegenerateGeometryError : public SpeckleTrackError {
public:
    explicit DegenerateGeometryError(const std::string& message)
        : SpeckleTrackError("Degenerate geometry: " + message) {}
};

class IOError : public SpeckleTrackError {
public:
    explicit IOError(const std::string& message)
        : SpeckleTrackError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

} // namespace speckle_track
