#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace speckle_track::tracking {

struct PixelCost {
    double cost = 0.0;
    int n_samples = 0;
    bool valid = false;
};

struct SearchResult {
    double off_ss = 0.0;
    double off_fs = 0.0;
    double cost = 0.0;
    bool found = false;
};

// Number of contributing samples a candidate needs out of `total`
inline int min_valid_count(size_t total, float fraction) {
    const double need = std::ceil(static_cast<double>(fraction) * static_cast<double>(total));
    return std::max(1, static_cast<int>(need));
}

/**
 * Exhaustive search over the integer offsets [-w_ss, w_ss] x [-w_fs, w_fs].
 *
 * The lowest valid cost wins; equal costs go to the smaller |o|^2 and then
 * to the earlier candidate in row-major scan order, so the zero offset is
 * kept whenever nothing is strictly better. With `quadratic` set, a parabola
 * through the best cost and its two neighbours on each axis proposes a
 * sub-integer offset, accepted only if its cost is strictly lower.
 */
template <typename CostFn>
SearchResult window_search(int w_ss, int w_fs, bool quadratic, CostFn&& cost_at) {
    const int n_ss = 2 * w_ss + 1;
    const int n_fs = 2 * w_fs + 1;
    std::vector<double> costs(static_cast<size_t>(n_ss * n_fs),
                              std::numeric_limits<double>::quiet_NaN());
    auto at = [&](int a, int b) -> double& {
        return costs[static_cast<size_t>((a + w_ss) * n_fs + (b + w_fs))];
    };

    SearchResult best;
    int best_a = 0;
    int best_b = 0;
    int best_mag = 0;
    for (int a = -w_ss; a <= w_ss; ++a) {
        for (int b = -w_fs; b <= w_fs; ++b) {
            const PixelCost pc = cost_at(static_cast<double>(a), static_cast<double>(b));
            if (!pc.valid || !std::isfinite(pc.cost)) continue;
            at(a, b) = pc.cost;
            const int mag = a * a + b * b;
            if (!best.found || pc.cost < best.cost || (pc.cost == best.cost && mag < best_mag)) {
                best.found = true;
                best.cost = pc.cost;
                best_a = a;
                best_b = b;
                best_mag = mag;
            }
        }
    }
    if (!best.found) return best;

    best.off_ss = static_cast<double>(best_a);
    best.off_fs = static_cast<double>(best_b);
    if (!quadratic) return best;

    auto vertex = [](double lo, double mid, double hi) {
        if (!std::isfinite(lo) || !std::isfinite(hi)) return 0.0;
        const double denom = lo - 2.0 * mid + hi;
        if (!(denom > 0.0)) return 0.0;
        return std::clamp(0.5 * (lo - hi) / denom, -0.5, 0.5);
    };

    double d_ss = 0.0;
    double d_fs = 0.0;
    if (w_ss > 0 && std::abs(best_a) < w_ss) {
        d_ss = vertex(at(best_a - 1, best_b), best.cost, at(best_a + 1, best_b));
    }
    if (w_fs > 0 && std::abs(best_b) < w_fs) {
        d_fs = vertex(at(best_a, best_b - 1), best.cost, at(best_a, best_b + 1));
    }
    if (d_ss == 0.0 && d_fs == 0.0) return best;

    const PixelCost refined = cost_at(best.off_ss + d_ss, best.off_fs + d_fs);
    if (refined.valid && std::isfinite(refined.cost) && refined.cost < best.cost) {
        best.off_ss += d_ss;
        best.off_fs += d_fs;
        best.cost = refined.cost;
    }
    return best;
}

} // namespace speckle_track::tracking
