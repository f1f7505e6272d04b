#include "vdm/core/hashing.hpp"

#include <array>
#include <bit>
#include <cmath>

namespace vdm {

namespace {

constexpr uint64_t kCanonicalQuietNaNBits = 0x7ff8000000000000ull;

double canonicalize(double v) {
  if (std::isnan(v)) return std::bit_cast<double>(kCanonicalQuietNaNBits);
  if (v == 0.0) return 0.0;
  return v;
}

}  // namespace

void Fnv1a64::update_bytes(const void* data, size_t n) {
  const auto* p = static_cast<const uint8_t*>(data);
  if (p == nullptr || n == 0) return;

  for (size_t i = 0; i < n; ++i) {
    h_ ^= static_cast<uint64_t>(p[i]);
    h_ *= kPrime;
  }
}

void Fnv1a64::update_u64(uint64_t v) {
  std::array<uint8_t, 8> b{};
  for (size_t i = 0; i < b.size(); ++i) {
    b[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFFu);
  }
  update_bytes(b.data(), b.size());
}

void Fnv1a64::update_f64(double x) {
  update_u64(std::bit_cast<uint64_t>(canonicalize(x)));
}

void Fnv1a64::update_string(std::string_view s) {
  update_u64(static_cast<uint64_t>(s.size()));
  if (!s.empty()) update_bytes(s.data(), s.size());
}

uint64_t mix_seed(uint64_t base, uint64_t index) noexcept {
  uint64_t z = base + 0x9e3779b97f4a7c15ull * (index + 1);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
  return z ^ (z >> 31);
}

std::string hash_to_hex(Hash64 h) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out(16, '0');
  uint64_t v = h.value;
  for (int i = 15; i >= 0; --i) {
    out[static_cast<size_t>(i)] = kDigits[v & 0xFu];
    v >>= 4;
  }
  return out;
}

}  // namespace vdm
