// ============================================================================
// Fragment 1.6 — Core: Deterministic RNG (Implementation)
// File: cpp/engine/core/rng.cpp
// ============================================================================

#include "engine/core/rng.hpp"
#include "engine/core/numeric.hpp"

#include <algorithm>
#include <cmath>

namespace mcda {

namespace {
constexpr double kPi = 3.141592653589793238462643383279502884;
} // namespace

// Box-Muller for standard normal
double Rng64::next_normal() noexcept {
    const double u1 = std::max(1e-12, next_u01());
    const double u2 = next_u01();
    const double r = std::sqrt(-2.0 * std::log(u1));
    const double theta = 2.0 * kPi * u2;
    return r * std::cos(theta);
}

double Rng64::next_normal(double mu, double sigma, double lo, double hi) noexcept {
    const double x = mu + sigma * next_normal();
    if (!is_finite(x)) return lo;
    return clamp(x, lo, hi);
}

} // namespace mcda
