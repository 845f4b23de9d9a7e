// ============================================================================
// Fragment 1.5 — Core: Online Stats (Welford Mean/Var + Min/Max, Hardened)
// File: cpp/engine/core/online_stats.hpp
// ============================================================================
//
// Purpose:
// - Single-pass statistics for score streams (Monte Carlo draws, score
//   distributions, per-criterion dispersion).
// - Deterministic behavior; non-finite samples are dropped.
//
// ============================================================================

#pragma once
#include "engine/core/numeric.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace mcda::stats {

struct OnlineStats final {
    std::uint64_t n = 0;
    double mean = 0.0;
    double M2 = 0.0; // sum of squares of differences from the current mean
    double min_v = std::numeric_limits<double>::infinity();
    double max_v = -std::numeric_limits<double>::infinity();

    void reset() noexcept {
        n = 0;
        mean = 0.0;
        M2 = 0.0;
        min_v = std::numeric_limits<double>::infinity();
        max_v = -std::numeric_limits<double>::infinity();
    }

    void push(double x) noexcept {
        if (!is_finite(x)) return;

        ++n;

        if (x < min_v) min_v = x;
        if (x > max_v) max_v = x;

        // Welford update
        const double delta = x - mean;
        mean += delta / static_cast<double>(n);
        const double delta2 = x - mean;
        M2 += delta * delta2;

        if (!is_finite(mean)) { mean = 0.0; M2 = 0.0; } // hard recovery
        if (!is_finite(M2) || M2 < 0.0) M2 = 0.0;
    }

    std::uint64_t count() const noexcept { return n; }

    double variance_population() const noexcept {
        if (n == 0) return 0.0;
        const double v = M2 / static_cast<double>(n);
        return (is_finite(v) && v >= 0.0) ? v : 0.0;
    }

    double variance_sample() const noexcept {
        if (n < 2) return 0.0;
        const double v = M2 / static_cast<double>(n - 1);
        return (is_finite(v) && v >= 0.0) ? v : 0.0;
    }

    double stddev_population() const noexcept {
        return safe_sqrt(variance_population(), 0.0);
    }

    double stddev_sample() const noexcept {
        return safe_sqrt(variance_sample(), 0.0);
    }

    double min() const noexcept {
        if (n == 0) return 0.0;
        return is_finite(min_v) ? min_v : 0.0;
    }

    double max() const noexcept {
        if (n == 0) return 0.0;
        return is_finite(max_v) ? max_v : 0.0;
    }
};

// Linear-interpolated quantile (q in [0,1]) of an unsorted sample.
// Empty input returns 0.
inline double quantile(std::vector<double> xs, double q) {
    xs.erase(std::remove_if(xs.begin(), xs.end(), [](double v) { return !is_finite(v); }), xs.end());
    if (xs.empty()) return 0.0;
    std::sort(xs.begin(), xs.end());
    const double qq = clamp01(is_finite(q) ? q : 0.0);
    const double pos = qq * static_cast<double>(xs.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(pos);
    const std::size_t hi = std::min(lo + 1, xs.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return xs[lo] + frac * (xs[hi] - xs[lo]);
}

} // namespace mcda::stats
