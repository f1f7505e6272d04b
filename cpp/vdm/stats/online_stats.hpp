// ============================================================================
// Fragment 6.1 - Stats: Online Error Statistics
// File: cpp/vdm/stats/online_stats.hpp
// ============================================================================
//
// Purpose:
// - Single-pass statistics over streaming prediction errors:
//     count, mean, variance (Welford), min/max, mean square, max |x|
// - Non-finite samples are counted separately and otherwise ignored.
//
// ============================================================================

#pragma once

#include "vdm/core/require.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace vdm::stats {

struct OnlineStats final {
  std::uint64_t n = 0;
  std::uint64_t rejected = 0;
  double mean = 0.0;
  double M2 = 0.0;
  double sum_sq = 0.0;
  double min_v = std::numeric_limits<double>::infinity();
  double max_v = -std::numeric_limits<double>::infinity();

  void reset() noexcept { *this = OnlineStats{}; }

  void push(double x) noexcept {
    if (!is_finite(x)) {
      ++rejected;
      return;
    }
    ++n;
    sum_sq += x * x;
    if (x < min_v) min_v = x;
    if (x > max_v) max_v = x;

    const double delta = x - mean;
    mean += delta / static_cast<double>(n);
    M2 += delta * (x - mean);
    if (!is_finite(M2) || M2 < 0.0) M2 = 0.0;
  }

  // Merge another accumulator (parallel reduction).
  void merge(const OnlineStats& o) noexcept {
    if (o.n == 0) {
      rejected += o.rejected;
      return;
    }
    if (n == 0) {
      const std::uint64_t r = rejected;
      *this = o;
      rejected += r;
      return;
    }
    const double na = static_cast<double>(n);
    const double nb = static_cast<double>(o.n);
    const double delta = o.mean - mean;
    const double nt = na + nb;
    mean += delta * nb / nt;
    M2 += o.M2 + delta * delta * na * nb / nt;
    n += o.n;
    rejected += o.rejected;
    sum_sq += o.sum_sq;
    if (o.min_v < min_v) min_v = o.min_v;
    if (o.max_v > max_v) max_v = o.max_v;
  }

  std::uint64_t count() const noexcept { return n; }

  double variance_population() const noexcept {
    if (n == 0) return 0.0;
    return M2 / static_cast<double>(n);
  }

  double rms() const noexcept {
    if (n == 0) return 0.0;
    return safe_sqrt(sum_sq / static_cast<double>(n), 0.0);
  }

  double max_abs() const noexcept {
    if (n == 0) return 0.0;
    return std::fmax(std::fabs(min_v), std::fabs(max_v));
  }

  double min() const noexcept { return n == 0 ? 0.0 : min_v; }
  double max() const noexcept { return n == 0 ? 0.0 : max_v; }
};

}  // namespace vdm::stats
