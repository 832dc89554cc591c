#include "runner_pipeline.hpp"
#include "runner_shared.hpp"

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/errors.hpp"
#include "speckle_track/core/events.hpp"
#include "speckle_track/core/threading.hpp"
#include "speckle_track/core/types.hpp"
#include "speckle_track/core/utils.hpp"
#include "speckle_track/geometry/transform.hpp"
#include "speckle_track/image/mask.hpp"
#include "speckle_track/image/whitefield.hpp"
#include "speckle_track/io/fits_io.hpp"
#include "speckle_track/tracking/defocus_sweep.hpp"
#include "speckle_track/tracking/speckle_tracker.hpp"
#include "speckle_track/wavefront/phase.hpp"

#include <cmath>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace speckle_track::runner {

namespace fs = std::filesystem;

namespace {

template <typename T>
Matrix2Df to_float(const Matrix2D<T> &m) {
  return m.template cast<float>();
}

Translations select_rows(const Translations &t, const std::vector<int> &idx) {
  Translations out(static_cast<Eigen::Index>(idx.size()), 3);
  for (size_t i = 0; i < idx.size(); ++i) {
    out.row(static_cast<Eigen::Index>(i)) = t.row(idx[i]);
  }
  return out;
}

struct RunContext {
  std::string run_id;
  fs::path out_dir;
  config::Config cfg;
  core::EventEmitter emitter;
  std::ostream *log = nullptr;
  core::json outputs = core::json::array();
};

template <typename T>
int run_typed(RunContext &ctx, const RunOptions &opts) {
  const auto &cfg = ctx.cfg;
  auto &emitter = ctx.emitter;
  auto &log = *ctx.log;
  const std::string &run_id = ctx.run_id;
  const int workers = cfg.runtime.parallel_workers;

  // LOAD_INPUT
  emitter.phase_start(run_id, Phase::LOAD_INPUT, log);
  FrameStack<T> frames = io::read_fits_stack<T>(opts.data_path).first;
  Translations translations = io::read_fits_translations(opts.translations_path);
  if (static_cast<size_t>(translations.rows()) != frames.size()) {
    throw ShapeMismatchError("data has " + std::to_string(frames.size()) +
                             " frames but translations has " +
                             std::to_string(translations.rows()) + " rows");
  }
  const size_t n_loaded = frames.size();

  if (cfg.frames.skip_empty) {
    const std::vector<int> good = image::good_frames(frames);
    if (good.empty()) {
      throw ValidationError("all frames are empty");
    }
    if (good.size() != frames.size()) {
      emitter.warning(run_id,
                      "skipping " + std::to_string(frames.size() - good.size()) +
                          " empty frames",
                      log);
      frames = image::select_frames(frames, good);
      translations = select_rows(translations, good);
    }
  }

  MaskMatrix user_mask;
  if (!opts.mask_path.empty()) {
    user_mask = io::read_fits_mask(opts.mask_path);
  }
  Matrix2D<T> whitefield;
  if (!opts.whitefield_path.empty()) {
    whitefield = io::read_fits_double(opts.whitefield_path).template cast<T>();
  }
  emitter.phase_end(run_id, Phase::LOAD_INPUT, "ok",
                    {{"frames_loaded", n_loaded},
                     {"frames_used", frames.size()},
                     {"rows", frames.front().rows()},
                     {"cols", frames.front().cols()},
                     {"precision", cfg.runtime.precision}},
                    log);

  // MASK
  emitter.phase_start(run_id, Phase::MASK, log);
  image::check_shape(user_mask, frames.front().rows(), frames.front().cols(), "mask");
  MaskMatrix mask = image::update_mask(frames, cfg.mask);
  if (user_mask.size() != 0) {
    mask = mask.cwiseMin(user_mask.unaryExpr([](uint8_t v) -> uint8_t { return v ? 1 : 0; }));
  }
  const long n_valid = static_cast<long>((mask.array() != 0).count());
  emitter.phase_end(run_id, Phase::MASK, "ok",
                    {{"method", cfg.mask.method},
                     {"valid_pixels", n_valid},
                     {"total_pixels", static_cast<long>(mask.size())}},
                    log);

  // WHITEFIELD
  emitter.phase_start(run_id, Phase::WHITEFIELD, log);
  if (whitefield.size() == 0) {
    whitefield = image::estimate_whitefield(frames, mask, cfg.whitefield.method, workers);
  }
  image::check_shape(whitefield, frames.front().rows(), frames.front().cols(), "whitefield",
                     false);
  FrameStack<T> dynamic;
  if (cfg.whitefield.dynamic || cfg.whitefield.ff_correction) {
    if (cfg.whitefield.dynamic_method == "pca") {
      const auto effs = image::eigen_flatfields(frames, whitefield, mask,
                                                cfg.whitefield.pca_components);
      dynamic = image::pca_whitefields(frames, whitefield, mask, effs.flatfields);
    } else {
      dynamic = image::estimate_dynamic_whitefields(frames, whitefield,
                                                    cfg.whitefield.dynamic_size, workers);
    }
  }
  if (cfg.whitefield.ff_correction) {
    frames = image::apply_flatfield_correction(frames, whitefield, dynamic);
  }
  if (cfg.whitefield.dynamic && cfg.output.write_whitefield) {
    FrameStack<float> planes;
    planes.reserve(dynamic.size());
    for (const auto &d : dynamic)
      planes.push_back(to_float(d));
    io::write_fits_cube(ctx.out_dir / "dynamic_whitefields.fits", planes, io::FitsHeader{});
    ctx.outputs.push_back(output_entry(ctx.out_dir, "dynamic_whitefields.fits"));
  }
  dynamic.clear();

  if (cfg.tracking.integrate) {
    frames = image::integrate_frames(frames, mask, cfg.frames.integrate_axis);
    // The integrated stack has its own whitefield and no mask
    mask.resize(0, 0);
    whitefield.resize(0, 0);
    std::cerr << "[WHITEFIELD] frames integrated along axis " << cfg.frames.integrate_axis
              << std::endl;
  }
  emitter.phase_end(run_id, Phase::WHITEFIELD, "ok",
                    {{"method", cfg.whitefield.method},
                     {"dynamic", cfg.whitefield.dynamic},
                     {"dynamic_method", cfg.whitefield.dynamic_method},
                     {"ff_correction", cfg.whitefield.ff_correction},
                     {"integrated", cfg.tracking.integrate}},
                    log);

  tracking::TrackingInput<T> input;
  input.frames = std::move(frames);
  input.mask = std::move(mask);
  input.whitefield = std::move(whitefield);
  input.translations = translations;
  input.geometry = cfg.geometry;
  input.transform = geometry::make_transform(cfg.frames.transforms);
  input.whitefield_method = cfg.whitefield.method;

  // DEFOCUS_SWEEP
  if (cfg.defocus_sweep.enabled) {
    emitter.phase_start(run_id, Phase::DEFOCUS_SWEEP, log);
    const auto sweep = tracking::defocus_sweep(input, cfg.tracking, cfg.defocus_sweep.defoci_x,
                                               cfg.defocus_sweep.defoci_y,
                                               cfg.defocus_sweep.size, workers);
    core::json sweep_json = {{"defoci_x", sweep.defoci_x},
                             {"defoci_y", sweep.defoci_y},
                             {"r_values", core::json::array()},
                             {"best_index", sweep.best_index}};
    for (double r : sweep.r_values) {
      // JSON has no NaN
      sweep_json["r_values"].push_back(std::isfinite(r) ? core::json(r) : core::json(nullptr));
    }
    core::write_text(ctx.out_dir / "defocus_sweep.json", sweep_json.dump(2));
    ctx.outputs.push_back(output_entry(ctx.out_dir, "defocus_sweep.json"));

    if (sweep.best_index >= 0) {
      const size_t b = static_cast<size_t>(sweep.best_index);
      input.geometry.defocus_x = sweep.defoci_x[b];
      input.geometry.defocus_y = sweep.defoci_y[b];
      emitter.phase_end(run_id, Phase::DEFOCUS_SWEEP, "ok",
                        {{"best_defocus_x", sweep.defoci_x[b]},
                         {"best_defocus_y", sweep.defoci_y[b]},
                         {"best_r", sweep.r_values[b]}},
                        log);
    } else {
      emitter.warning(run_id, "defocus sweep found no finite R value, keeping configured defocus",
                      log);
      emitter.phase_end(run_id, Phase::DEFOCUS_SWEEP, "skipped",
                        {{"reason", "no_finite_r"}}, log);
    }
  }

  // PIXEL_MAP_INIT + REFERENCE_INIT
  const config::GeometryConfig used_geometry = input.geometry;
  emitter.phase_start(run_id, Phase::PIXEL_MAP_INIT, log);
  tracking::SpeckleTracker<T> tracker(std::move(input), cfg.tracking, workers);
  emitter.phase_end(run_id, Phase::PIXEL_MAP_INIT, "ok",
                    {{"rows", tracker.frames().front().rows()},
                     {"cols", tracker.frames().front().cols()},
                     {"frames", tracker.frames().size()}},
                    log);

  emitter.phase_start(run_id, Phase::REFERENCE_INIT, log);
  tracker.initialize();
  const auto &grid = tracker.reference().grid;
  emitter.phase_end(run_id, Phase::REFERENCE_INIT, "ok",
                    {{"reference_rows", grid.rows},
                     {"reference_cols", grid.cols},
                     {"origin_ss", grid.origin_ss},
                     {"origin_fs", grid.origin_fs}},
                    log);

  // ITERATION
  emitter.phase_start(run_id, Phase::ITERATION, log);
  const auto state = tracker.run(&stop_flag(), [&](const tracking::IterationReport &rep) {
    emitter.phase_progress(run_id, Phase::ITERATION, rep.iteration, rep.n_iter,
                           "iteration",
                           {{"error", rep.error},
                            {"n_samples", rep.n_samples},
                            {"n_updated", rep.n_updated},
                            {"mean_shift", rep.mean_shift}},
                           log);
  });
  const std::string state_name = tracking::tracker_state_to_string(state);
  emitter.phase_end(run_id, Phase::ITERATION,
                    state == tracking::TrackerState::Done ? "ok" : state_name,
                    {{"iterations", tracker.errors().size()},
                     {"final_error", tracker.errors().empty() ? 0.0 : tracker.errors().back()}},
                    log);

  const auto result = tracker.result();

  // PHASE_RETRIEVAL
  Matrix2Dd phase;
  if (cfg.output.write_phase) {
    emitter.phase_start(run_id, Phase::PHASE_RETRIEVAL, log);
    try {
      const auto aberrations =
          wavefront::pixel_aberrations(result.pixel_map, result.initial_pixel_map);
      const auto ph = wavefront::retrieve_phase(aberrations, used_geometry);
      phase = ph.phase;
      emitter.phase_end(run_id, Phase::PHASE_RETRIEVAL, "ok",
                        {{"magnification_x", ph.magnification_x},
                         {"magnification_y", ph.magnification_y},
                         {"phase_min", phase.minCoeff()},
                         {"phase_max", phase.maxCoeff()}},
                        log);
    } catch (const DegenerateGeometryError &e) {
      emitter.warning(run_id, e.what(), log);
      emitter.phase_end(run_id, Phase::PHASE_RETRIEVAL, "skipped",
                        {{"reason", "degenerate_geometry"}}, log);
    }
  }

  // WRITE_OUTPUT
  emitter.phase_start(run_id, Phase::WRITE_OUTPUT, log);
  io::FitsHeader hdr;
  hdr.set("RUNID", run_id);
  hdr.set("NITER", static_cast<int>(result.errors.size()));
  hdr.set("DEFOCX", used_geometry.defocus_x);
  hdr.set("DEFOCY", used_geometry.effective_defocus_y());

  if (cfg.output.write_whitefield) {
    io::write_fits_float(ctx.out_dir / "whitefield.fits", to_float(result.whitefield), hdr);
    ctx.outputs.push_back(output_entry(ctx.out_dir, "whitefield.fits"));
  }
  if (cfg.output.write_reference) {
    io::FitsHeader ref_hdr = hdr;
    ref_hdr.set("ORIGSS", result.reference.grid.origin_ss);
    ref_hdr.set("ORIGFS", result.reference.grid.origin_fs);
    ref_hdr.set("DSY", result.reference.grid.ds_y);
    ref_hdr.set("DSX", result.reference.grid.ds_x);
    io::write_fits_cube(ctx.out_dir / "reference.fits",
                        {to_float(result.reference.image), to_float(result.reference.weights),
                         to_float(result.reference.counts)},
                        ref_hdr);
    ctx.outputs.push_back(output_entry(ctx.out_dir, "reference.fits"));
  }
  if (cfg.output.write_pixel_map) {
    io::write_fits_cube(ctx.out_dir / "pixel_map.fits",
                        {to_float(result.pixel_map.ss), to_float(result.pixel_map.fs)}, hdr);
    ctx.outputs.push_back(output_entry(ctx.out_dir, "pixel_map.fits"));

    Matrix2Dd t(result.translations.size(), 2);
    t.col(0) = result.translations.di.template cast<double>();
    t.col(1) = result.translations.dj.template cast<double>();
    io::write_fits_double(ctx.out_dir / "translations_px.fits", t, hdr);
    ctx.outputs.push_back(output_entry(ctx.out_dir, "translations_px.fits"));
  }
  if (cfg.output.write_phase && phase.size() != 0) {
    io::write_fits_double(ctx.out_dir / "phase.fits", phase, hdr);
    ctx.outputs.push_back(output_entry(ctx.out_dir, "phase.fits"));
  }
  if (cfg.output.write_errors) {
    core::json errors_json = {{"errors", result.errors},
                              {"n_iter", cfg.tracking.n_iter},
                              {"state", state_name},
                              {"translation_residual_rms", result.residual_rms}};
    core::write_text(ctx.out_dir / "errors.json", errors_json.dump(2));
    ctx.outputs.push_back(output_entry(ctx.out_dir, "errors.json"));
  }
  emitter.phase_end(run_id, Phase::WRITE_OUTPUT, "ok", {{"outputs", ctx.outputs.size()}}, log);

  return state == tracking::TrackerState::Cancelled ? 2 : 0;
}

} // namespace

int run_pipeline_command(const RunOptions &opts) {
  const fs::path cfg_path(opts.config_path);
  if (!fs::exists(cfg_path)) {
    std::cerr << "Error: Config file not found: " << opts.config_path << std::endl;
    return 1;
  }
  for (const auto &p : {opts.data_path, opts.translations_path}) {
    if (!fs::exists(p)) {
      std::cerr << "Error: Input file not found: " << p << std::endl;
      return 1;
    }
  }

  RunContext ctx;
  try {
    ctx.cfg = config::Config::load(cfg_path);
    if (opts.n_iter_override > 0) {
      ctx.cfg.tracking.n_iter = opts.n_iter_override;
    }
    ctx.cfg.validate();
  } catch (const SpeckleTrackError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  ctx.run_id = core::get_run_id();
  ctx.out_dir = fs::path(opts.out_dir);
  fs::create_directories(ctx.out_dir);
  core::copy_config(cfg_path, ctx.out_dir / "config.yaml");

  std::ofstream event_log_file(ctx.out_dir / "events.jsonl");
  if (!event_log_file) {
    std::cerr << "Error: Cannot create " << (ctx.out_dir / "events.jsonl").string() << std::endl;
    return 1;
  }
  EventTee tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);
  ctx.log = &log_file;

  core::ThreadingScope threads(ctx.cfg.runtime.parallel_workers);
  install_stop_handler();

  ctx.emitter.run_start(ctx.run_id,
                        {{"config_path", opts.config_path},
                         {"data_path", opts.data_path},
                         {"translations_path", opts.translations_path},
                         {"out_dir", ctx.out_dir.string()},
                         {"n_iter", ctx.cfg.tracking.n_iter},
                         {"workers", threads.workers()}},
                        log_file);

  int rc = 1;
  try {
    if (ctx.cfg.runtime.precision == "float") {
      rc = run_typed<float>(ctx, opts);
    } else {
      rc = run_typed<double>(ctx, opts);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    ctx.emitter.error(ctx.run_id, e.what(), log_file);
    ctx.emitter.run_end(ctx.run_id, false, "error", log_file);
    return 1;
  }

  core::json manifest = {{"run_id", ctx.run_id},
                         {"timestamp", core::get_iso_timestamp()},
                         {"config_sha256", core::sha256_file(ctx.out_dir / "config.yaml")},
                         {"precision", ctx.cfg.runtime.precision},
                         {"outputs", ctx.outputs}};
  core::write_text(ctx.out_dir / "manifest.json", manifest.dump(2));

  ctx.emitter.phase_start(ctx.run_id, Phase::DONE, log_file);
  ctx.emitter.phase_end(ctx.run_id, Phase::DONE, rc == 0 ? "ok" : "cancelled",
                        core::json::object(), log_file);
  ctx.emitter.run_end(ctx.run_id, rc == 0, rc == 0 ? "ok" : "cancelled", log_file);
  return rc;
}

} // namespace speckle_track::runner
