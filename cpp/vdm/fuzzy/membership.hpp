// ============================================================================
// Fragment 2.1 - Fuzzy: Membership Functions + Encoder
// File: cpp/vdm/fuzzy/membership.hpp
// ============================================================================
//
// Purpose:
// - Turn one scalar operating variable (speed, gear, brake pressure...) into
//   an ordered vector of soft activations in [0,1], one per membership
//   function, in declared order.
//
// Contract:
// - encode() is total for finite x: x is clamped into the set's domain
//   before evaluation (boundary extrapolation by clamping).
// - Normalized sets rescale activations to sum to 1. If every raw activation
//   is 0 the encoding is undefined and DegenerateEncodingError is thrown.
// - Pure: depends only on the set's current parameters.
//
// ============================================================================

#pragma once

#include "vdm/core/require.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vdm::fuzzy {

enum class MembershipFamily : std::uint8_t {
  Triangular = 0,   // params: a <= b <= c
  Trapezoidal = 1,  // params: a <= b <= c <= d
  Gaussian = 2,     // params: mean, sigma > 0
  Sigmoid = 3       // params: center, slope != 0 (negative slope = falling edge)
};

const char* to_string(MembershipFamily f) noexcept;
bool parse_membership_family(const std::string& s, MembershipFamily* out) noexcept;

struct MembershipFunction final {
  std::string name;
  MembershipFamily family = MembershipFamily::Triangular;
  std::vector<double> params;

  // Activation in [0,1]. Caller guarantees validate() passed.
  double evaluate(double x) const noexcept;

  void validate() const;

  static MembershipFunction triangular(std::string name, double a, double b, double c);
  static MembershipFunction trapezoidal(std::string name, double a, double b, double c, double d);
  static MembershipFunction gaussian(std::string name, double mean, double sigma);
  static MembershipFunction sigmoid(std::string name, double center, double slope);
};

struct FuzzySet final {
  std::string name;
  double domain_lo = 0.0;
  double domain_hi = 1.0;
  bool normalized = false;
  std::vector<MembershipFunction> functions;

  void validate() const;

  // Index of a function by name, or npos.
  std::size_t index_of(const std::string& fn_name) const noexcept;

  static constexpr std::size_t npos = static_cast<std::size_t>(-1);
};

class MembershipEncoder final {
public:
  explicit MembershipEncoder(double partition_tol = 1e-9);

  // Ordered activations, one per function of `set`.
  std::vector<double> encode(double x, const FuzzySet& set) const;

  // Same, writing into `out` (resized). Used in per-step hot loops.
  void encode_into(double x, const FuzzySet& set, std::vector<double>& out) const;

  double partition_tol() const noexcept { return partition_tol_; }

private:
  double partition_tol_;
};

}  // namespace vdm::fuzzy
