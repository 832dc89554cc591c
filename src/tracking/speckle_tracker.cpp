#include "speckle_track/tracking/speckle_tracker.hpp"
#include "speckle_track/core/errors.hpp"
#include "speckle_track/geometry/geometry.hpp"
#include "speckle_track/image/mask.hpp"
#include "speckle_track/image/whitefield.hpp"
#include "speckle_track/tracking/pixel_map_update.hpp"
#include "speckle_track/tracking/reference.hpp"
#include "speckle_track/tracking/translation_update.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <utility>

namespace speckle_track::tracking {

std::string tracker_state_to_string(TrackerState state) {
    switch (state) {
        case TrackerState::Init: return "init";
        case TrackerState::Iterating: return "iterating";
        case TrackerState::Done: return "done";
        case TrackerState::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

template <typename T>
SpeckleTracker<T>::SpeckleTracker(TrackingInput<T> input, const config::TrackingConfig& cfg,
                                  int workers)
    : frames_(std::move(input.frames)),
      mask_(std::move(input.mask)),
      whitefield_(std::move(input.whitefield)),
      physical_translations_(std::move(input.translations)),
      geometry_(input.geometry),
      transform_(std::move(input.transform)),
      prior_(std::move(input.prior)),
      whitefield_method_(input.whitefield_method),
      cfg_(cfg),
      workers_(std::max(1, workers)) {
    image::check_stack(frames_);
    detector_rows_ = static_cast<int>(frames_.front().rows());
    detector_cols_ = static_cast<int>(frames_.front().cols());
    image::check_shape(mask_, detector_rows_, detector_cols_, "mask");
    image::check_shape(whitefield_, detector_rows_, detector_cols_, "whitefield");
    if (static_cast<size_t>(physical_translations_.rows()) != frames_.size()) {
        throw ShapeMismatchError("expected " + std::to_string(frames_.size()) +
                                 " translations, got " +
                                 std::to_string(physical_translations_.rows()));
    }

    geometry::check_geometry(geometry::basis_from_config(geometry_), geometry_.x_pixel_size,
                             geometry_.y_pixel_size, geometry_.distance, geometry_.defocus_x,
                             geometry_.effective_defocus_y());

    config::Config full;
    full.geometry = geometry_;
    full.tracking = cfg_;
    full.whitefield.method = whitefield_method_;
    full.validate();

    if (transform_) {
        frames_ = transform_->forward(frames_);
        if (mask_.size() != 0) mask_ = transform_->forward(mask_);
        if (whitefield_.size() != 0) whitefield_ = transform_->forward(whitefield_);
    }
    const auto rows = frames_.front().rows();
    const auto cols = frames_.front().cols();
    mask_ = image::resolve_mask(mask_, rows, cols);
    if (prior_.ss.size() != 0 || prior_.fs.size() != 0) {
        image::check_shape(prior_.ss, rows, cols, "prior pixel map (ss)", false);
        image::check_shape(prior_.fs, rows, cols, "prior pixel map (fs)", false);
    }
}

template <typename T>
void SpeckleTracker<T>::initialize() {
    if (initialized_) return;

    if (whitefield_.size() == 0) {
        whitefield_ = image::estimate_whitefield(frames_, mask_, whitefield_method_, workers_);
        std::cerr << "[WHITEFIELD] estimated (" << whitefield_method_ << ") from "
                  << frames_.size() << " frames" << std::endl;
    }

    const PixelMap<T>* prior = prior_.ss.size() != 0 ? &prior_ : nullptr;
    auto init = geometry::initialize_pixel_map<T>(detector_rows_, detector_cols_, geometry_,
                                                  physical_translations_, transform_.get(),
                                                  prior);
    image::check_shape(init.pixel_map.ss, frames_.front().rows(), frames_.front().cols(),
                       "pixel map", false);
    pixel_map_ = init.pixel_map;
    initial_pixel_map_ = init.pixel_map;
    translations_ = init.translations;
    initial_translations_ = init.translations;

    const MaskMatrix valid = valid_pixels(mask_, whitefield_, pixel_map_);
    grid_ = make_reference_grid(pixel_map_, translations_, valid, cfg_.ds_y, cfg_.ds_x,
                                cfg_.effective_reference_margin());
    rebuild_reference();

    std::cerr << "[TRACK] reference grid " << grid_.rows << "x" << grid_.cols
              << " origin=(" << grid_.origin_ss << ", " << grid_.origin_fs << ")" << std::endl;

    initialized_ = true;
    state_ = TrackerState::Iterating;
}

template <typename T>
void SpeckleTracker<T>::rebuild_reference() {
    reference_ = reconstruct_reference(frames_, mask_, whitefield_, pixel_map_, translations_,
                                       grid_, cfg_, workers_);
}

template <typename T>
double SpeckleTracker<T>::iterate() {
    if (state_ == TrackerState::Done || state_ == TrackerState::Cancelled) {
        throw ValidationError("tracker is " + tracker_state_to_string(state_) +
                              ", no further iterations allowed");
    }
    initialize();

    const ErrorReport err = evaluate_error(frames_, mask_, whitefield_, reference_, pixel_map_,
                                           translations_, cfg_, false, workers_);
    errors_.push_back(err.total);

    auto upd = update_pixel_map(frames_, mask_, whitefield_, reference_, pixel_map_,
                                translations_, cfg_, workers_);
    pixel_map_ = std::move(upd.pixel_map);
    rebuild_reference();

    if (cfg_.update_translations) {
        translations_ = update_translations(frames_, mask_, whitefield_, reference_, pixel_map_,
                                            translations_, cfg_, workers_);
        rebuild_reference();
    }

    last_report_.iteration = static_cast<int>(errors_.size());
    last_report_.n_iter = cfg_.n_iter;
    last_report_.error = err.total;
    last_report_.n_samples = err.n_samples;
    last_report_.n_updated = upd.n_updated;
    last_report_.mean_shift = upd.mean_shift;

    std::cerr << "[TRACK] iteration " << last_report_.iteration << "/" << cfg_.n_iter
              << " error=" << std::setprecision(6) << err.total
              << " samples=" << err.n_samples << " updated=" << upd.n_updated
              << " kept=" << upd.n_kept << " mean_shift=" << upd.mean_shift << std::endl;
    return err.total;
}

template <typename T>
TrackerState SpeckleTracker<T>::run(const std::atomic<bool>* stop_flag,
                                    const IterationCallback& on_iteration) {
    initialize();
    while (static_cast<int>(errors_.size()) < cfg_.n_iter) {
        if (stop_flag && stop_flag->load()) {
            state_ = TrackerState::Cancelled;
            std::cerr << "[TRACK] cancelled after " << errors_.size() << " iterations"
                      << std::endl;
            return state_;
        }
        iterate();
        if (on_iteration) {
            on_iteration(last_report_);
        }
    }
    state_ = TrackerState::Done;
    return state_;
}

template <typename T>
TrackingResult<T> SpeckleTracker<T>::result() const {
    TrackingResult<T> res;
    res.pixel_map = pixel_map_;
    res.initial_pixel_map = initial_pixel_map_;
    res.reference = reference_;
    res.translations = translations_;
    res.whitefield = whitefield_;
    res.mask = mask_;
    res.errors = errors_;
    res.state = state_;

    const int n = translations_.size();
    res.translation_residual = Matrix2D<T>::Zero(n, 2);
    double sq = 0.0;
    for (int i = 0; i < n; ++i) {
        res.translation_residual(i, 0) = translations_.di[i] - initial_translations_.di[i];
        res.translation_residual(i, 1) = translations_.dj[i] - initial_translations_.dj[i];
        sq += static_cast<double>(res.translation_residual(i, 0) * res.translation_residual(i, 0) +
                                  res.translation_residual(i, 1) * res.translation_residual(i, 1));
    }
    res.residual_rms = n > 0 ? std::sqrt(sq / n) : 0.0;
    return res;
}

template class SpeckleTracker<float>;
template class SpeckleTracker<double>;

} // namespace speckle_track::tracking
