#pragma once
// ============================================================================
// Fragment 1.5 - Core: Deterministic RNG
// File: cpp/vdm/core/rng.hpp
// ============================================================================
//
// xorshift64* plus Box-Muller. std::normal_distribution is not specified
// bit-for-bit across standard libraries, so seeded augmentation draws go
// through this generator instead: the same seed reproduces the same episode
// on every toolchain.
//
// ============================================================================

#include "vdm/core/require.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace vdm {

class Rng64 final {
public:
  explicit Rng64(std::uint64_t seed) : s_(seed ? seed : 0x9e3779b97f4a7c15ull) {}

  std::uint64_t next_u64() noexcept {
    std::uint64_t x = s_;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    s_ = x;
    return x * 2685821657736338717ull;
  }

  // Uniform in (0,1)
  double next_u01() noexcept {
    const std::uint64_t u = next_u64();
    const std::uint64_t m = (u >> 11) | 1ull; // ensure nonzero
    return static_cast<double>(m) * (1.0 / 9007199254740992.0); // 2^53
  }

  double uniform(double a, double b) noexcept {
    return a + (b - a) * next_u01();
  }

  // Uniform integer in [lo, hi] (inclusive).
  std::size_t uniform_index(std::size_t lo, std::size_t hi) noexcept {
    if (hi <= lo) return lo;
    const std::uint64_t span = static_cast<std::uint64_t>(hi - lo) + 1ull;
    return lo + static_cast<std::size_t>(next_u64() % span);
  }

  // Box-Muller standard normal
  double std_normal() noexcept {
    const double u1 = std::max(1e-12, next_u01());
    const double u2 = next_u01();
    const double r = std::sqrt(-2.0 * std::log(u1));
    const double theta = 2.0 * kPi * u2;
    return r * std::cos(theta);
  }

private:
  std::uint64_t s_;
};

}  // namespace vdm
