#pragma once

#include "speckle_track/config/configuration.hpp"
#include "speckle_track/tracking/speckle_tracker.hpp"

#include <vector>

namespace speckle_track::tracking {

struct DefocusSweepResult {
    std::vector<double> defoci_x;
    std::vector<double> defoci_y;
    std::vector<double> r_values;   // mean R-characteristic per defocus
    int best_index = -1;            // largest finite R
};

// Mean over size x size windows fully covered by data of (<I^2> - <I>^2) / <I>^2.
// NaN if no window qualifies.
double r_characteristic(const Matrix2Dd& img, int size);

/**
 * Rebuild the reference with the initial pixel map for each candidate
 * defocus and score its sharpness with the R-characteristic. A sharper
 * reference means the stage-to-pixel scaling is closer to the truth.
 * An empty defoci_y reuses defoci_x.
 */
template <typename T>
DefocusSweepResult defocus_sweep(const TrackingInput<T>& input,
                                 const config::TrackingConfig& cfg,
                                 const std::vector<double>& defoci_x,
                                 const std::vector<double>& defoci_y, int size,
                                 int workers = 1);

} // namespace speckle_track::tracking
