#include "speckle_track/tracking/defocus_sweep.hpp"
#include "speckle_track/core/errors.hpp"
#include "speckle_track/image/processing.hpp"
#include "speckle_track/image/whitefield.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <utility>

namespace speckle_track::tracking {

double r_characteristic(const Matrix2Dd& img, int size) {
    const Matrix2Dd mean = image::window_mean(img, size);
    const Matrix2Dd mean_sq = image::window_mean(img.cwiseProduct(img), size);

    double acc = 0.0;
    size_t count = 0;
    for (Eigen::Index i = 0; i < mean.size(); ++i) {
        const double m = mean.data()[i];
        const double m2 = mean_sq.data()[i];
        if (!std::isfinite(m) || !std::isfinite(m2) || m == 0.0) continue;
        acc += (m2 - m * m) / (m * m);
        ++count;
    }
    return count > 0 ? acc / static_cast<double>(count)
                     : std::numeric_limits<double>::quiet_NaN();
}

template <typename T>
DefocusSweepResult defocus_sweep(const TrackingInput<T>& input,
                                 const config::TrackingConfig& cfg,
                                 const std::vector<double>& defoci_x,
                                 const std::vector<double>& defoci_y, int size,
                                 int workers) {
    if (defoci_x.empty()) {
        throw ValidationError("defocus sweep needs at least one defocus");
    }
    if (!defoci_y.empty() && defoci_y.size() != defoci_x.size()) {
        throw ValidationError("defoci_y must be empty or match defoci_x in length");
    }
    if (size < 1) {
        throw ValidationError("R-characteristic window must be >= 1");
    }

    DefocusSweepResult out;
    out.defoci_x = defoci_x;
    out.defoci_y = defoci_y.empty() ? defoci_x : defoci_y;

    TrackingInput<T> base = input;
    if (base.whitefield.size() == 0 && !base.transform) {
        base.whitefield = image::estimate_whitefield(base.frames, base.mask,
                                                     base.whitefield_method, workers);
    }

    for (size_t k = 0; k < out.defoci_x.size(); ++k) {
        TrackingInput<T> in = base;
        in.geometry.defocus_x = out.defoci_x[k];
        in.geometry.defocus_y = out.defoci_y[k];

        SpeckleTracker<T> tracker(std::move(in), cfg, workers);
        tracker.initialize();
        const Matrix2Dd ref = tracker.reference().image.template cast<double>();
        const double r = r_characteristic(ref, size);
        out.r_values.push_back(r);

        if (std::isfinite(r) &&
            (out.best_index < 0 || r > out.r_values[static_cast<size_t>(out.best_index)])) {
            out.best_index = static_cast<int>(k);
        }
        std::cerr << "[SWEEP] defocus_x=" << out.defoci_x[k] << " defocus_y=" << out.defoci_y[k]
                  << " R=" << r << std::endl;
    }
    return out;
}

template DefocusSweepResult defocus_sweep<float>(const TrackingInput<float>&,
                                                 const config::TrackingConfig&,
                                                 const std::vector<double>&,
                                                 const std::vector<double>&, int, int);
template DefocusSweepResult defocus_sweep<double>(const TrackingInput<double>&,
                                                  const config::TrackingConfig&,
                                                  const std::vector<double>&,
                                                  const std::vector<double>&, int, int);

} // namespace speckle_track::tracking
