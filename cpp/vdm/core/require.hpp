#pragma once
/*
===============================================================================
Fragment 1.3 - Core: Hardened Math Utilities
File: cpp/vdm/core/require.hpp
===============================================================================
*/

#include "vdm/core/errors.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace vdm {

inline constexpr double kPi = 3.141592653589793238462643383279502884;

inline bool is_finite(double x) noexcept {
  return std::isfinite(x) != 0;
}

template <typename T>
inline constexpr T clamp(T v, T lo, T hi) noexcept {
  static_assert(std::is_arithmetic<T>::value, "clamp requires arithmetic type");
  return (v < lo) ? lo : ((v > hi) ? hi : v);
}

// Safe division (never NaN/Inf)
inline double safe_div(double num, double den, double fallback = 0.0) noexcept {
  if (!is_finite(num) || !is_finite(den)) return fallback;
  if (den == 0.0) return fallback;
  const double q = num / den;
  return is_finite(q) ? q : fallback;
}

inline double safe_sqrt(double x, double fallback = 0.0) noexcept {
  if (!is_finite(x) || x < 0.0) return fallback;
  return std::sqrt(x);
}

// Logistic sigmoid, overflow-safe for large |x|.
inline double sigmoid(double x) noexcept {
  if (x >= 0.0) {
    const double e = std::exp(-x);
    return 1.0 / (1.0 + e);
  }
  const double e = std::exp(x);
  return e / (1.0 + e);
}

// Relative/absolute closeness.
inline bool near(double a, double b, double rel = 1e-9, double abs = 1e-12) noexcept {
  const double da = std::fabs(a - b);
  if (da <= abs) return true;
  const double sc = std::fmax(std::fabs(a), std::fabs(b));
  return da / sc <= rel;
}

inline void require_finite(double x, const char* msg) {
  VDM_REQUIRE(is_finite(x), NumericalError, msg ? msg : "Non-finite value");
}

inline void require_positive(double x, const char* msg) {
  VDM_REQUIRE(is_finite(x) && x > 0.0, ValidationError, msg ? msg : "Non-positive value");
}

}  // namespace vdm
