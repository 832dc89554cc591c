#pragma once

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/core/types.hpp"
#include "speckle_track/geometry/transform.hpp"
#include "speckle_track/tracking/error.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace speckle_track::tracking {

template <typename T>
struct TrackingInput {
    FrameStack<T> frames;           // raw detector frames
    MaskMatrix mask;                // empty = all pixels valid
    Matrix2D<T> whitefield;         // empty = estimated from the frames
    Translations translations;      // physical stage translations [m], N x 3
    config::GeometryConfig geometry;
    // Applied to frames, mask and whitefield; the pixel map follows it
    std::shared_ptr<const geometry::Transform> transform;
    // Prior aberrations added to the initial map, on the transformed grid
    PixelMap<T> prior;
    std::string whitefield_method = "median";
};

enum class TrackerState { Init, Iterating, Done, Cancelled };

std::string tracker_state_to_string(TrackerState state);

struct IterationReport {
    int iteration = 0;      // 1-based
    int n_iter = 0;
    double error = 0.0;     // error at the start of the iteration
    size_t n_samples = 0;
    int n_updated = 0;
    double mean_shift = 0.0;
};

using IterationCallback = std::function<void(const IterationReport&)>;

template <typename T>
struct TrackingResult {
    PixelMap<T> pixel_map;
    PixelMap<T> initial_pixel_map;
    ReferenceImage<T> reference;
    PixelTranslations<T> translations;
    Matrix2D<T> translation_residual;  // N x 2, current minus initial translations
    double residual_rms = 0.0;
    Matrix2D<T> whitefield;
    MaskMatrix mask;
    std::vector<double> errors;
    TrackerState state = TrackerState::Init;
};

/**
 * Alternating minimization of the displacement map and the reference image.
 *
 * initialize() seeds the whitefield (when none was supplied), the pixel map,
 * the reference grid and the first reference. Each iterate() then evaluates
 * the error of the current state, refines the pixel map, rebuilds the
 * reference and, if enabled, refines the frame translations and rebuilds the
 * reference again. run() performs exactly cfg.n_iter iterations; it never
 * stops early on convergence.
 */
template <typename T>
class SpeckleTracker {
public:
    SpeckleTracker(TrackingInput<T> input, const config::TrackingConfig& cfg, int workers = 1);

    void initialize();
    double iterate();

    // Stop requests are honoured between iterations only
    TrackerState run(const std::atomic<bool>* stop_flag = nullptr,
                     const IterationCallback& on_iteration = nullptr);

    TrackingResult<T> result() const;

    TrackerState state() const { return state_; }
    const std::vector<double>& errors() const { return errors_; }
    const ReferenceImage<T>& reference() const { return reference_; }
    const PixelMap<T>& pixel_map() const { return pixel_map_; }
    const PixelTranslations<T>& translations() const { return translations_; }
    const Matrix2D<T>& whitefield() const { return whitefield_; }
    const MaskMatrix& mask() const { return mask_; }
    const FrameStack<T>& frames() const { return frames_; }
    const config::TrackingConfig& config() const { return cfg_; }

private:
    void rebuild_reference();

    FrameStack<T> frames_;
    MaskMatrix mask_;
    Matrix2D<T> whitefield_;
    Translations physical_translations_;
    config::GeometryConfig geometry_;
    std::shared_ptr<const geometry::Transform> transform_;
    PixelMap<T> prior_;
    std::string whitefield_method_;
    int detector_rows_ = 0;
    int detector_cols_ = 0;

    config::TrackingConfig cfg_;
    int workers_ = 1;

    TrackerState state_ = TrackerState::Init;
    bool initialized_ = false;
    PixelMap<T> pixel_map_;
    PixelMap<T> initial_pixel_map_;
    PixelTranslations<T> translations_;
    PixelTranslations<T> initial_translations_;
    ReferenceGrid grid_;
    ReferenceImage<T> reference_;
    std::vector<double> errors_;
    IterationReport last_report_;
};

} // namespace speckle_track::tracking
