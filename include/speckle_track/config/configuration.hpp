#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace speckle_track::config {

namespace fs = std::filesystem;

struct GeometryConfig {
    // Detector basis vectors [m]: row 0 = slow (ss) axis, row 1 = fast (fs) axis
    std::array<std::array<double, 3>, 2> basis_vectors{
        {{0.0, -55.0e-6, 0.0}, {-55.0e-6, 0.0, 0.0}}};
    double x_pixel_size = 55.0e-6; // [m]
    double y_pixel_size = 55.0e-6; // [m]
    double distance = 2.0;         // sample-to-detector [m]
    double defocus_x = 1.0e-4;     // [m]
    double defocus_y = 0.0;        // [m], 0 = same as defocus_x
    double wavelength = 7.29e-11;  // [m]

    double effective_defocus_y() const {
        return defocus_y != 0.0 ? defocus_y : defocus_x;
    }
};

struct MaskConfig {
    std::string method = "no-bad"; // no-bad | range-bad | perc-bad
    double vmin = 0.0;
    double vmax = 65535.0;
    double pmin = 0.0;
    double pmax = 99.99;
};

struct WhitefieldConfig {
    std::string method = "median"; // median | mean
    bool dynamic = false;          // per-frame whitefields
    std::string dynamic_method = "median"; // median | pca
    int dynamic_size = 11;         // frames in the running median window
    int pca_components = 4;        // eigen flat-fields used by the pca method
    bool ff_correction = false;    // rescale frames by W / W_n
};

struct TransformConfig {
    std::string type;                    // crop | downscale | mirror
    std::array<int, 4> roi{0, 0, 0, 0};  // crop: y_min, y_max, x_min, x_max
    int scale = 1;                       // downscale
    int axis = 0;                        // mirror
};

struct FramesConfig {
    bool skip_empty = true;
    // Detector axis summed over when tracking.integrate is set
    int integrate_axis = 0;
    std::vector<TransformConfig> transforms;
};

struct SmoothingConfig {
    bool enabled = false;
    float sigma = 1.0f; // Gaussian sigma of the regularization pass [px]
};

struct TrackingConfig {
    int n_iter = 5;
    // Half-width W of the per-pixel search window, offsets in [-W, W]
    int search_window = 3;
    // Half-width of the per-frame translation search
    int translation_search_window = 2;
    // Re-estimate per-frame translations after each reference update
    bool update_translations = false;
    // Bilinear splatting/sampling of the reference; nearest cell otherwise
    bool subpixel = true;
    // Fill masked-out pixels from neighbouring refined updates
    bool fill_bad_pix = false;
    // Data integrated along one detector axis: only search axes longer than 1 px
    bool integrate = false;
    // Sub-integer offsets from a parabola through the best cost and its neighbours
    bool quadratic_refinement = true;
    // Fraction of frames that must sample a candidate offset for it to count
    float min_valid_fraction = 0.5f;
    // Reference sampling interval in detector pixels (<= 1 super-resolves)
    double ds_y = 1.0;
    double ds_x = 1.0;
    // Border added around the initial reference extent [px], -1 = automatic
    int reference_margin = -1;
    // Gaussian sigma used when filling bad pixels [px]
    float fill_sigma = 1.5f;
    SmoothingConfig smoothing;

    int effective_reference_margin() const {
        if (reference_margin >= 0) return reference_margin;
        return search_window * n_iter + (update_translations ? translation_search_window : 0) + 1;
    }
};

struct RuntimeConfig {
    int parallel_workers = 4;
    std::string precision = "double"; // float | double
};

struct OutputConfig {
    bool write_whitefield = true;
    bool write_reference = true;
    bool write_pixel_map = true;
    bool write_phase = true;
    bool write_errors = true;
};

struct DefocusSweepConfig {
    bool enabled = false;
    std::vector<double> defoci_x;
    std::vector<double> defoci_y; // empty = same as defoci_x
    int size = 51;                // R-characteristic window [px]
};

struct Config {
    GeometryConfig geometry;
    MaskConfig mask;
    WhitefieldConfig whitefield;
    FramesConfig frames;
    TrackingConfig tracking;
    RuntimeConfig runtime;
    OutputConfig output;
    DefocusSweepConfig defocus_sweep;

    static Config load(const fs::path &path);
    static Config from_yaml(const YAML::Node &node);

    void save(const fs::path &path) const;
    YAML::Node to_yaml() const;

    void validate() const;
};

std::string get_schema_json();

} // namespace speckle_track::config
