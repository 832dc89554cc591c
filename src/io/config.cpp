#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/errors.hpp"

#include <cmath>
#include <fstream>

namespace speckle_track::config {

static bool is_odd(int v) {
    return (v % 2) != 0;
}

static bool is_positive(double v) {
    return std::isfinite(v) && v > 0.0;
}

static void read_double_list(const YAML::Node& n, std::vector<double>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& it : n) {
            out.push_back(it.as<double>());
        }
    }
}

static void read_basis_vectors(const YAML::Node& n,
                               std::array<std::array<double, 3>, 2>& out) {
    if (!n) return;
    if (!n.IsSequence() || n.size() != 2) {
        throw ConfigError("geometry.basis_vectors must be a list of two 3-vectors");
    }
    for (size_t k = 0; k < 2; ++k) {
        const auto row = n[k];
        if (!row.IsSequence() || row.size() != 3) {
            throw ConfigError("geometry.basis_vectors must be a list of two 3-vectors");
        }
        for (size_t c = 0; c < 3; ++c) {
            out[k][c] = row[c].as<double>();
        }
    }
}

static TransformConfig read_transform(const YAML::Node& n) {
    TransformConfig t;
    if (n["type"]) t.type = n["type"].as<std::string>();
    if (n["roi"]) {
        const auto roi = n["roi"];
        if (!roi.IsSequence() || roi.size() != 4) {
            throw ConfigError("frames.transforms[].roi must be [y_min, y_max, x_min, x_max]");
        }
        for (size_t i = 0; i < 4; ++i) {
            t.roi[i] = roi[i].as<int>();
        }
    }
    if (n["scale"]) t.scale = n["scale"].as<int>();
    if (n["axis"]) t.axis = n["axis"].as<int>();
    return t;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node = YAML::LoadFile(path.string());
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["geometry"]) {
        auto g = node["geometry"];
        read_basis_vectors(g["basis_vectors"], cfg.geometry.basis_vectors);
        if (g["x_pixel_size"]) cfg.geometry.x_pixel_size = g["x_pixel_size"].as<double>();
        if (g["y_pixel_size"]) cfg.geometry.y_pixel_size = g["y_pixel_size"].as<double>();
        if (g["distance"]) cfg.geometry.distance = g["distance"].as<double>();
        if (g["defocus_x"]) cfg.geometry.defocus_x = g["defocus_x"].as<double>();
        if (g["defocus_y"]) cfg.geometry.defocus_y = g["defocus_y"].as<double>();
        if (g["wavelength"]) cfg.geometry.wavelength = g["wavelength"].as<double>();
    }

    if (node["mask"]) {
        auto m = node["mask"];
        if (m["method"]) cfg.mask.method = m["method"].as<std::string>();
        if (m["vmin"]) cfg.mask.vmin = m["vmin"].as<double>();
        if (m["vmax"]) cfg.mask.vmax = m["vmax"].as<double>();
        if (m["pmin"]) cfg.mask.pmin = m["pmin"].as<double>();
        if (m["pmax"]) cfg.mask.pmax = m["pmax"].as<double>();
    }

    if (node["whitefield"]) {
        auto w = node["whitefield"];
        if (w["method"]) cfg.whitefield.method = w["method"].as<std::string>();
        if (w["dynamic"]) cfg.whitefield.dynamic = w["dynamic"].as<bool>();
        if (w["dynamic_method"]) cfg.whitefield.dynamic_method = w["dynamic_method"].as<std::string>();
        if (w["dynamic_size"]) cfg.whitefield.dynamic_size = w["dynamic_size"].as<int>();
        if (w["pca_components"]) cfg.whitefield.pca_components = w["pca_components"].as<int>();
        if (w["ff_correction"]) cfg.whitefield.ff_correction = w["ff_correction"].as<bool>();
    }

    if (node["frames"]) {
        auto f = node["frames"];
        if (f["skip_empty"]) cfg.frames.skip_empty = f["skip_empty"].as<bool>();
        if (f["integrate_axis"]) cfg.frames.integrate_axis = f["integrate_axis"].as<int>();
        if (f["transforms"] && f["transforms"].IsSequence()) {
            cfg.frames.transforms.clear();
            for (const auto& it : f["transforms"]) {
                cfg.frames.transforms.push_back(read_transform(it));
            }
        }
    }

    if (node["tracking"]) {
        auto t = node["tracking"];
        if (t["n_iter"]) cfg.tracking.n_iter = t["n_iter"].as<int>();
        if (t["search_window"]) cfg.tracking.search_window = t["search_window"].as<int>();
        if (t["translation_search_window"]) cfg.tracking.translation_search_window = t["translation_search_window"].as<int>();
        if (t["update_translations"]) cfg.tracking.update_translations = t["update_translations"].as<bool>();
        if (t["subpixel"]) cfg.tracking.subpixel = t["subpixel"].as<bool>();
        if (t["fill_bad_pix"]) cfg.tracking.fill_bad_pix = t["fill_bad_pix"].as<bool>();
        if (t["integrate"]) cfg.tracking.integrate = t["integrate"].as<bool>();
        if (t["quadratic_refinement"]) cfg.tracking.quadratic_refinement = t["quadratic_refinement"].as<bool>();
        if (t["min_valid_fraction"]) cfg.tracking.min_valid_fraction = t["min_valid_fraction"].as<float>();
        if (t["ds_y"]) cfg.tracking.ds_y = t["ds_y"].as<double>();
        if (t["ds_x"]) cfg.tracking.ds_x = t["ds_x"].as<double>();
        if (t["reference_margin"]) cfg.tracking.reference_margin = t["reference_margin"].as<int>();
        if (t["fill_sigma"]) cfg.tracking.fill_sigma = t["fill_sigma"].as<float>();
        if (t["smoothing"]) {
            auto s = t["smoothing"];
            if (s["enabled"]) cfg.tracking.smoothing.enabled = s["enabled"].as<bool>();
            if (s["sigma"]) cfg.tracking.smoothing.sigma = s["sigma"].as<float>();
        }
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
        if (r["precision"]) cfg.runtime.precision = r["precision"].as<std::string>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["write_whitefield"]) cfg.output.write_whitefield = o["write_whitefield"].as<bool>();
        if (o["write_reference"]) cfg.output.write_reference = o["write_reference"].as<bool>();
        if (o["write_pixel_map"]) cfg.output.write_pixel_map = o["write_pixel_map"].as<bool>();
        if (o["write_phase"]) cfg.output.write_phase = o["write_phase"].as<bool>();
        if (o["write_errors"]) cfg.output.write_errors = o["write_errors"].as<bool>();
    }

    if (node["defocus_sweep"]) {
        auto d = node["defocus_sweep"];
        if (d["enabled"]) cfg.defocus_sweep.enabled = d["enabled"].as<bool>();
        read_double_list(d["defoci_x"], cfg.defocus_sweep.defoci_x);
        read_double_list(d["defoci_y"], cfg.defocus_sweep.defoci_y);
        if (d["size"]) cfg.defocus_sweep.size = d["size"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    for (const auto& b : geometry.basis_vectors) {
        YAML::Node row;
        for (double v : b) row.push_back(v);
        node["geometry"]["basis_vectors"].push_back(row);
    }
    node["geometry"]["x_pixel_size"] = geometry.x_pixel_size;
    node["geometry"]["y_pixel_size"] = geometry.y_pixel_size;
    node["geometry"]["distance"] = geometry.distance;
    node["geometry"]["defocus_x"] = geometry.defocus_x;
    node["geometry"]["defocus_y"] = geometry.defocus_y;
    node["geometry"]["wavelength"] = geometry.wavelength;

    node["mask"]["method"] = mask.method;
    node["mask"]["vmin"] = mask.vmin;
    node["mask"]["vmax"] = mask.vmax;
    node["mask"]["pmin"] = mask.pmin;
    node["mask"]["pmax"] = mask.pmax;

    node["whitefield"]["method"] = whitefield.method;
    node["whitefield"]["dynamic"] = whitefield.dynamic;
    node["whitefield"]["dynamic_method"] = whitefield.dynamic_method;
    node["whitefield"]["dynamic_size"] = whitefield.dynamic_size;
    node["whitefield"]["pca_components"] = whitefield.pca_components;
    node["whitefield"]["ff_correction"] = whitefield.ff_correction;

    node["frames"]["skip_empty"] = frames.skip_empty;
    node["frames"]["integrate_axis"] = frames.integrate_axis;
    node["frames"]["transforms"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& t : frames.transforms) {
        YAML::Node tn;
        tn["type"] = t.type;
        if (t.type == "crop") {
            for (int v : t.roi) tn["roi"].push_back(v);
        } else if (t.type == "downscale") {
            tn["scale"] = t.scale;
        } else if (t.type == "mirror") {
            tn["axis"] = t.axis;
        }
        node["frames"]["transforms"].push_back(tn);
    }

    node["tracking"]["n_iter"] = tracking.n_iter;
    node["tracking"]["search_window"] = tracking.search_window;
    node["tracking"]["translation_search_window"] = tracking.translation_search_window;
    node["tracking"]["update_translations"] = tracking.update_translations;
    node["tracking"]["subpixel"] = tracking.subpixel;
    node["tracking"]["fill_bad_pix"] = tracking.fill_bad_pix;
    node["tracking"]["integrate"] = tracking.integrate;
    node["tracking"]["quadratic_refinement"] = tracking.quadratic_refinement;
    node["tracking"]["min_valid_fraction"] = tracking.min_valid_fraction;
    node["tracking"]["ds_y"] = tracking.ds_y;
    node["tracking"]["ds_x"] = tracking.ds_x;
    node["tracking"]["reference_margin"] = tracking.reference_margin;
    node["tracking"]["fill_sigma"] = tracking.fill_sigma;
    node["tracking"]["smoothing"]["enabled"] = tracking.smoothing.enabled;
    node["tracking"]["smoothing"]["sigma"] = tracking.smoothing.sigma;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;
    node["runtime"]["precision"] = runtime.precision;

    node["output"]["write_whitefield"] = output.write_whitefield;
    node["output"]["write_reference"] = output.write_reference;
    node["output"]["write_pixel_map"] = output.write_pixel_map;
    node["output"]["write_phase"] = output.write_phase;
    node["output"]["write_errors"] = output.write_errors;

    node["defocus_sweep"]["enabled"] = defocus_sweep.enabled;
    node["defocus_sweep"]["defoci_x"] = YAML::Node(YAML::NodeType::Sequence);
    for (double v : defocus_sweep.defoci_x) node["defocus_sweep"]["defoci_x"].push_back(v);
    node["defocus_sweep"]["defoci_y"] = YAML::Node(YAML::NodeType::Sequence);
    for (double v : defocus_sweep.defoci_y) node["defocus_sweep"]["defoci_y"].push_back(v);
    node["defocus_sweep"]["size"] = defocus_sweep.size;

    return node;
}

void Config::validate() const {
    if (!is_positive(geometry.x_pixel_size) || !is_positive(geometry.y_pixel_size)) {
        throw ValidationError("geometry.x_pixel_size and geometry.y_pixel_size must be > 0");
    }
    if (!is_positive(geometry.distance)) {
        throw ValidationError("geometry.distance must be > 0");
    }
    if (!std::isfinite(geometry.defocus_x) || geometry.defocus_x == 0.0) {
        throw ValidationError("geometry.defocus_x must be finite and non-zero");
    }
    if (!std::isfinite(geometry.defocus_y)) {
        throw ValidationError("geometry.defocus_y must be finite");
    }
    if (!is_positive(geometry.wavelength)) {
        throw ValidationError("geometry.wavelength must be > 0");
    }

    if (mask.method != "no-bad" && mask.method != "range-bad" && mask.method != "perc-bad") {
        throw ValidationError("mask.method must be 'no-bad', 'range-bad' or 'perc-bad'");
    }
    if (mask.vmin >= mask.vmax) {
        throw ValidationError("mask.vmin must be < mask.vmax");
    }
    if (mask.pmin < 0.0 || mask.pmax > 100.0 || mask.pmin >= mask.pmax) {
        throw ValidationError("mask.pmin/pmax must satisfy 0 <= pmin < pmax <= 100");
    }

    if (whitefield.method != "median" && whitefield.method != "mean") {
        throw ValidationError("whitefield.method must be 'median' or 'mean'");
    }
    if (whitefield.dynamic_size < 1 || !is_odd(whitefield.dynamic_size)) {
        throw ValidationError("whitefield.dynamic_size must be odd and >= 1");
    }
    if (whitefield.dynamic_method != "median" && whitefield.dynamic_method != "pca") {
        throw ValidationError("whitefield.dynamic_method must be 'median' or 'pca'");
    }
    if (whitefield.pca_components < 1) {
        throw ValidationError("whitefield.pca_components must be >= 1");
    }

    if (frames.integrate_axis != 0 && frames.integrate_axis != 1) {
        throw ValidationError("frames.integrate_axis must be 0 or 1");
    }
    for (const auto& t : frames.transforms) {
        if (t.type == "crop") {
            if (t.roi[0] < 0 || t.roi[2] < 0 || t.roi[1] <= t.roi[0] || t.roi[3] <= t.roi[2]) {
                throw ValidationError("frames.transforms[].roi must satisfy 0 <= min < max on both axes");
            }
        } else if (t.type == "downscale") {
            if (t.scale < 1) {
                throw ValidationError("frames.transforms[].scale must be >= 1");
            }
        } else if (t.type == "mirror") {
            if (t.axis != 0 && t.axis != 1) {
                throw ValidationError("frames.transforms[].axis must be 0 or 1");
            }
        } else {
            throw ValidationError("frames.transforms[].type must be 'crop', 'downscale' or 'mirror'");
        }
    }

    if (tracking.n_iter < 1 || tracking.n_iter > 1000) {
        throw ValidationError("tracking.n_iter must be in [1,1000]");
    }
    if (tracking.search_window < 0 || tracking.search_window > 64) {
        throw ValidationError("tracking.search_window must be in [0,64]");
    }
    if (tracking.translation_search_window < 0 || tracking.translation_search_window > 64) {
        throw ValidationError("tracking.translation_search_window must be in [0,64]");
    }
    if (tracking.quadratic_refinement && !tracking.subpixel) {
        throw ValidationError("tracking.quadratic_refinement requires tracking.subpixel");
    }
    if (!(tracking.min_valid_fraction > 0.0f) || tracking.min_valid_fraction > 1.0f) {
        throw ValidationError("tracking.min_valid_fraction must be in (0,1]");
    }
    if (!is_positive(tracking.ds_y) || !is_positive(tracking.ds_x)) {
        throw ValidationError("tracking.ds_y and tracking.ds_x must be > 0");
    }
    if (tracking.reference_margin < -1) {
        throw ValidationError("tracking.reference_margin must be >= 0 or -1 (automatic)");
    }
    if (!(tracking.fill_sigma > 0.0f)) {
        throw ValidationError("tracking.fill_sigma must be > 0");
    }
    if (tracking.smoothing.enabled && !(tracking.smoothing.sigma > 0.0f)) {
        throw ValidationError("tracking.smoothing.sigma must be > 0");
    }

    if (runtime.parallel_workers < 1 || runtime.parallel_workers > 256) {
        throw ValidationError("runtime.parallel_workers must be in [1,256]");
    }
    if (runtime.precision != "float" && runtime.precision != "double") {
        throw ValidationError("runtime.precision must be 'float' or 'double'");
    }

    if (defocus_sweep.enabled) {
        if (defocus_sweep.defoci_x.empty()) {
            throw ValidationError("defocus_sweep.defoci_x must not be empty");
        }
        if (!defocus_sweep.defoci_y.empty() &&
            defocus_sweep.defoci_y.size() != defocus_sweep.defoci_x.size()) {
            throw ValidationError("defocus_sweep.defoci_y must be empty or match defoci_x in length");
        }
        for (double v : defocus_sweep.defoci_x) {
            if (!std::isfinite(v) || v == 0.0) {
                throw ValidationError("defocus_sweep.defoci_x entries must be finite and non-zero");
            }
        }
        for (double v : defocus_sweep.defoci_y) {
            if (!std::isfinite(v) || v == 0.0) {
                throw ValidationError("defocus_sweep.defoci_y entries must be finite and non-zero");
            }
        }
        if (defocus_sweep.size < 3) {
            throw ValidationError("defocus_sweep.size must be >= 3");
        }
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "geometry": {
      "type": "object",
      "properties": {
        "basis_vectors": {
          "type": "array", "minItems": 2, "maxItems": 2,
          "items": {"type": "array", "minItems": 3, "maxItems": 3, "items": {"type": "number"}}
        },
        "x_pixel_size": {"type": "number", "exclusiveMinimum": 0},
        "y_pixel_size": {"type": "number", "exclusiveMinimum": 0},
        "distance": {"type": "number", "exclusiveMinimum": 0},
        "defocus_x": {"type": "number"},
        "defocus_y": {"type": "number"},
        "wavelength": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "mask": {
      "type": "object",
      "properties": {
        "method": {"type": "string", "enum": ["no-bad", "range-bad", "perc-bad"]},
        "vmin": {"type": "number"},
        "vmax": {"type": "number"},
        "pmin": {"type": "number", "minimum": 0, "maximum": 100},
        "pmax": {"type": "number", "minimum": 0, "maximum": 100}
      }
    },
    "whitefield": {
      "type": "object",
      "properties": {
        "method": {"type": "string", "enum": ["median", "mean"]},
        "dynamic": {"type": "boolean"},
        "dynamic_method": {"type": "string", "enum": ["median", "pca"]},
        "dynamic_size": {"type": "integer", "minimum": 1},
        "pca_components": {"type": "integer", "minimum": 1},
        "ff_correction": {"type": "boolean"}
      }
    },
    "frames": {
      "type": "object",
      "properties": {
        "skip_empty": {"type": "boolean"},
        "integrate_axis": {"type": "integer", "enum": [0, 1]},
        "transforms": {
          "type": "array",
          "items": {
            "type": "object",
            "properties": {
              "type": {"type": "string", "enum": ["crop", "downscale", "mirror"]},
              "roi": {"type": "array", "minItems": 4, "maxItems": 4, "items": {"type": "integer", "minimum": 0}},
              "scale": {"type": "integer", "minimum": 1},
              "axis": {"type": "integer", "enum": [0, 1]}
            },
            "required": ["type"]
          }
        }
      }
    },
    "tracking": {
      "type": "object",
      "properties": {
        "n_iter": {"type": "integer", "minimum": 1, "maximum": 1000},
        "search_window": {"type": "integer", "minimum": 0, "maximum": 64},
        "translation_search_window": {"type": "integer", "minimum": 0, "maximum": 64},
        "update_translations": {"type": "boolean"},
        "subpixel": {"type": "boolean"},
        "fill_bad_pix": {"type": "boolean"},
        "integrate": {"type": "boolean"},
        "quadratic_refinement": {"type": "boolean"},
        "min_valid_fraction": {"type": "number", "exclusiveMinimum": 0, "maximum": 1},
        "ds_y": {"type": "number", "exclusiveMinimum": 0},
        "ds_x": {"type": "number", "exclusiveMinimum": 0},
        "reference_margin": {"type": "integer", "minimum": -1},
        "fill_sigma": {"type": "number", "exclusiveMinimum": 0},
        "smoothing": {
          "type": "object",
          "properties": {
            "enabled": {"type": "boolean"},
            "sigma": {"type": "number", "exclusiveMinimum": 0}
          }
        }
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 256},
        "precision": {"type": "string", "enum": ["float", "double"]}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "write_whitefield": {"type": "boolean"},
        "write_reference": {"type": "boolean"},
        "write_pixel_map": {"type": "boolean"},
        "write_phase": {"type": "boolean"},
        "write_errors": {"type": "boolean"}
      }
    },
    "defocus_sweep": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "defoci_x": {"type": "array", "items": {"type": "number"}},
        "defoci_y": {"type": "array", "items": {"type": "number"}},
        "size": {"type": "integer", "minimum": 3}
      }
    }
  }
})";
}

} // namespace speckle_track::config
