#pragma once
/*
================================================================================
Fragment 1.4 - Core: Deterministic Hashing Utilities
FILE: cpp/vdm/core/hashing.hpp

Purpose:
  - Stable 64-bit fingerprints for augmented-episode identity, so the same
    (operator, parents, seed, parameters) always yields the same episode id
    across processes and platforms.

Design constraints:
  - No dependence on std::hash (not stable across processes/platforms).
  - Doubles hashed via bit pattern after canonicalization
    (-0.0 -> +0.0, every NaN -> one quiet-NaN payload).

Notes:
  - This is NOT cryptographic.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace vdm {

struct Hash64 {
  uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

// FNV-1a 64. Stable baseline hash.
class Fnv1a64 {
 public:
  static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr uint64_t kPrime       = 1099511628211ull;

  Fnv1a64() : h_(kOffsetBasis) {}

  Hash64 digest() const { return Hash64{h_}; }

  void update_bytes(const void* data, size_t n);

  // Little-endian encoding so digests agree across platforms.
  void update_u64(uint64_t v);
  void update_f64(double x);

  // Length-delimited to avoid ambiguity between adjacent strings.
  void update_string(std::string_view s);

 private:
  uint64_t h_;
};

// SplitMix64 finalizer. Used to derive independent per-job seeds.
uint64_t mix_seed(uint64_t base, uint64_t index) noexcept;

// Lowercase, zero-padded 16-char hex.
std::string hash_to_hex(Hash64 h);

}  // namespace vdm
