/*
===============================================================================
Fragment 1.3 — Core: Hardened Math Utilities
File: cpp/engine/core/numeric.hpp
===============================================================================
*/

#pragma once

#include <cmath>
#include <type_traits>

namespace mcda {

inline bool is_finite(double x) noexcept {
  return std::isfinite(x) != 0;
}

template <typename T>
inline constexpr T clamp(T v, T lo, T hi) noexcept {
  static_assert(std::is_arithmetic<T>::value, "clamp requires arithmetic type");
  return (v < lo) ? lo : ((v > hi) ? hi : v);
}

inline double clamp01(double x) noexcept { return clamp(x, 0.0, 1.0); }

// Safe division (never NaN/Inf)
inline double safe_div(double num, double den, double fallback = 0.0) noexcept {
  if (!is_finite(num) || !is_finite(den)) return fallback;
  if (den == 0.0) return fallback;
  const double q = num / den;
  return is_finite(q) ? q : fallback;
}

// sqrt of a sum of squares can go a hair negative through cancellation.
inline double safe_sqrt(double x, double eps = 0.0) noexcept {
  const double y = (x < eps) ? eps : x;
  return std::sqrt(y);
}

// Relative/absolute closeness, used by selftests and tolerance checks.
inline bool near(double a, double b, double rel = 1e-9, double abs = 1e-12) noexcept {
  const double da = std::fabs(a - b);
  if (da <= abs) return true;
  const double sa = std::fabs(a);
  const double sb = std::fabs(b);
  double sc = sa > sb ? sa : sb;
  if (sc < abs) sc = abs;
  return da / sc <= rel;
}

} // namespace mcda
