#include "runner_pipeline.hpp"

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/errors.hpp"
#include "speckle_track/core/events.hpp"
#include "speckle_track/io/fits_io.hpp"
#include "speckle_track/synthetic/synthetic.hpp"

#include <filesystem>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

namespace fs = std::filesystem;

namespace {

namespace config = speckle_track::config;
namespace core = speckle_track::core;
namespace io = speckle_track::io;
namespace runner = speckle_track::runner;
namespace synthetic = speckle_track::synthetic;

int validate_command(const std::string &config_path) {
  core::json out;
  out["config_path"] = config_path;
  try {
    auto cfg = config::Config::load(config_path);
    cfg.validate();
    out["valid"] = true;
  } catch (const speckle_track::SpeckleTrackError &e) {
    out["valid"] = false;
    out["error"] = e.what();
  } catch (const YAML::Exception &e) {
    out["valid"] = false;
    out["error"] = std::string("YAML error: ") + e.what();
  }
  std::cout << out.dump(2) << std::endl;
  return out["valid"].get<bool>() ? 0 : 1;
}

int schema_command() {
  std::cout << config::get_schema_json() << std::endl;
  return 0;
}

int synth_command(const std::string &out_dir, int frames_per_axis, int size,
                  double distortion, unsigned seed) {
  synthetic::SyntheticOptions opts;
  opts.rows = size;
  opts.cols = size;
  opts.frames_per_axis = frames_per_axis;
  opts.distortion = distortion;
  opts.seed = seed;
  opts.whitefield_profile = true;

  const auto ds = synthetic::make_speckle_dataset<float>(opts);

  const fs::path dir(out_dir);
  fs::create_directories(dir);

  io::FitsHeader hdr;
  hdr.set("ORIGIN", std::string("speckle_track synth"));
  hdr.set("SEED", static_cast<int>(seed));
  io::write_fits_cube(dir / "data.fits", ds.frames, hdr);
  io::write_fits_double(dir / "translations.fits", ds.translations, hdr);
  io::write_fits_float(dir / "whitefield.fits", ds.whitefield, hdr);
  io::write_fits_cube(dir / "true_pixel_map.fits",
                      {ds.true_pixel_map.ss, ds.true_pixel_map.fs}, hdr);

  config::Config cfg;
  cfg.geometry = ds.geometry;
  cfg.tracking.search_window = 2;
  cfg.runtime.precision = "double";
  cfg.save(dir / "config.yaml");

  std::cerr << "[SYNTH] " << ds.frames.size() << " frames of " << size << "x" << size
            << " written to " << dir.string() << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"speckle_track runner"};
  app.require_subcommand(1);

  runner::RunOptions run_opts;
  auto run_cmd = app.add_subcommand("run", "Track a speckle scan");
  run_cmd->add_option("--config", run_opts.config_path, "Path to config.yaml")->required();
  run_cmd->add_option("--data", run_opts.data_path, "Frame cube (FITS)")->required();
  run_cmd->add_option("--translations", run_opts.translations_path,
                      "Stage translations, N x 2 or N x 3 (FITS)")
      ->required();
  run_cmd->add_option("--mask", run_opts.mask_path, "Bad pixel mask (FITS, >0 = valid)");
  run_cmd->add_option("--whitefield", run_opts.whitefield_path, "Whitefield (FITS)");
  run_cmd->add_option("--out-dir", run_opts.out_dir, "Output directory")->required();
  run_cmd->add_option("--n-iter", run_opts.n_iter_override,
                      "Override tracking.n_iter (0 = use config)");

  std::string validate_path;
  auto validate_cmd = app.add_subcommand("validate", "Validate a config file");
  validate_cmd->add_option("--config", validate_path, "Path to config.yaml")->required();

  auto schema_cmd = app.add_subcommand("schema", "Print the config JSON schema");

  std::string synth_dir;
  int synth_frames = 5;
  int synth_size = 64;
  double synth_distortion = 1.0;
  unsigned synth_seed = 42;
  auto synth_cmd = app.add_subcommand("synth", "Write a synthetic speckle dataset");
  synth_cmd->add_option("--out-dir", synth_dir, "Output directory")->required();
  synth_cmd->add_option("--frames-per-axis", synth_frames, "Raster positions per axis")
      ->check(CLI::Range(1, 64));
  synth_cmd->add_option("--size", synth_size, "Detector size [px]")->check(CLI::Range(4, 4096));
  synth_cmd->add_option("--distortion", synth_distortion, "Peak distortion [px]");
  synth_cmd->add_option("--seed", synth_seed, "Random seed");

  CLI11_PARSE(app, argc, argv);

  try {
    if (run_cmd->parsed()) {
      return runner::run_pipeline_command(run_opts);
    }
    if (validate_cmd->parsed()) {
      return validate_command(validate_path);
    }
    if (schema_cmd->parsed()) {
      return schema_command();
    }
    if (synth_cmd->parsed()) {
      return synth_command(synth_dir, synth_frames, synth_size, synth_distortion, synth_seed);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  std::cerr << app.help() << std::endl;
  return 1;
}
