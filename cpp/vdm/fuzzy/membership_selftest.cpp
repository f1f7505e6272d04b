/*
  Fragment 2.2 - Membership Encoder Selftest

  Framework-free checks of the fuzzy encoder:
    1) Normalized sets sum to 1 across the domain (partition of unity).
    2) Overlapping triangles split a midpoint 0.5 / 0.5.
    3) Inputs outside the domain are clamped, never extrapolated.
    4) A normalized set with no support at x raises DegenerateEncodingError.
    5) Invalid shapes are rejected at validation.
    6) Every family evaluates to its hand-computed shape.

  Non-zero return code indicates failure.
*/

#include "vdm/core/errors.hpp"
#include "vdm/core/selftest.hpp"
#include "vdm/fuzzy/membership.hpp"

#include <cmath>
#include <numeric>
#include <vector>

using namespace vdm;
using namespace vdm::fuzzy;
using namespace vdm::selftest;

namespace {

FuzzySet two_triangles() {
  FuzzySet s;
  s.name = "speed";
  s.domain_lo = 0.0;
  s.domain_hi = 10.0;
  s.normalized = true;
  s.functions = {MembershipFunction::triangular("low", -4.0, 2.0, 8.0),
                 MembershipFunction::triangular("high", 2.0, 8.0, 14.0)};
  return s;
}

double sum(const std::vector<double>& v) {
  return std::accumulate(v.begin(), v.end(), 0.0);
}

void test_partition_of_unity() {
  const MembershipEncoder enc;
  FuzzySet s = two_triangles();
  s.functions.push_back(MembershipFunction::gaussian("mid", 5.0, 2.0));
  s.validate();

  bool ok = true;
  for (int i = 0; i <= 100; ++i) {
    const std::vector<double> a = enc.encode(0.1 * i, s);
    if (std::fabs(sum(a) - 1.0) > 1e-9) ok = false;
    for (double v : a) {
      if (v < 0.0 || v > 1.0) ok = false;
    }
  }
  expect_true(ok, "normalized activations sum to 1 and stay in [0,1]");
}

void test_midpoint_split() {
  const MembershipEncoder enc;
  const std::vector<double> a = enc.encode(5.0, two_triangles());
  expect_true(a.size() == 2, "one activation per function");
  expect_near(a[0], 0.5, 1e-12, "encode(5): low = 0.5");
  expect_near(a[1], 0.5, 1e-12, "encode(5): high = 0.5");

  const std::vector<double> b = enc.encode(2.0, two_triangles());
  expect_near(b[0], 1.0, 1e-12, "encode(2): low peak");
  expect_near(b[1], 0.0, 1e-12, "encode(2): high is 0");
}

void test_clamping() {
  const MembershipEncoder enc;
  const std::vector<double> lo = enc.encode(-50.0, two_triangles());
  const std::vector<double> at0 = enc.encode(0.0, two_triangles());
  expect_near(lo[0], at0[0], 1e-15, "below domain clamps to domain_lo");

  const std::vector<double> hi = enc.encode(1e6, two_triangles());
  const std::vector<double> at10 = enc.encode(10.0, two_triangles());
  expect_near(hi[1], at10[1], 1e-15, "above domain clamps to domain_hi");
}

void test_degenerate() {
  const MembershipEncoder enc;
  FuzzySet s;
  s.name = "gap";
  s.domain_lo = 0.0;
  s.domain_hi = 10.0;
  s.normalized = true;
  s.functions = {MembershipFunction::triangular("a", 0.0, 1.0, 2.0),
                 MembershipFunction::triangular("b", 8.0, 9.0, 10.0)};
  s.validate();

  expect_throws<DegenerateEncodingError>([&] { (void)enc.encode(5.0, s); },
                                         "no support at x -> DegenerateEncodingError");

  s.normalized = false;
  const std::vector<double> raw = enc.encode(5.0, s);
  expect_near(sum(raw), 0.0, 0.0, "unnormalized set returns raw zeros");
}

void test_validation() {
  FuzzySet bad = two_triangles();
  bad.functions.push_back(MembershipFunction::triangular("low", 0.0, 1.0, 2.0));
  expect_throws<ValidationError>([&] { bad.validate(); }, "duplicate function name rejected");

  expect_throws<ValidationError>([] { MembershipFunction::gaussian("g", 0.0, 0.0).validate(); },
                                 "gaussian sigma 0 rejected");

  const MembershipEncoder enc;
  expect_throws<ValidationError>([&] { (void)enc.encode(std::nan(""), two_triangles()); },
                                 "non-finite input rejected");
}

void test_family_shapes() {
  const MembershipFunction tri = MembershipFunction::triangular("t", 0.0, 2.0, 4.0);
  expect_near(tri.evaluate(1.0), 0.5, 1e-15, "triangle rising edge");
  expect_near(tri.evaluate(2.0), 1.0, 0.0, "triangle peak");
  expect_near(tri.evaluate(4.5), 0.0, 0.0, "triangle outside support");

  const MembershipFunction trap = MembershipFunction::trapezoidal("z", 0.0, 2.0, 4.0, 6.0);
  expect_near(trap.evaluate(1.0), 0.5, 1e-15, "trapezoid rising edge");
  expect_near(trap.evaluate(3.0), 1.0, 0.0, "trapezoid plateau");
  expect_near(trap.evaluate(5.5), 0.25, 1e-15, "trapezoid falling edge");

  const MembershipFunction gauss = MembershipFunction::gaussian("g", 0.0, 1.0);
  expect_near(gauss.evaluate(1.0), std::exp(-0.5), 1e-15, "gaussian one sigma");

  const MembershipFunction sig = MembershipFunction::sigmoid("s", 5.0, 2.0);
  expect_near(sig.evaluate(5.0), 0.5, 1e-15, "sigmoid centre");
  expect_near(sig.evaluate(6.0), 1.0 / (1.0 + std::exp(-2.0)), 1e-12, "sigmoid one unit right");
}

}  // namespace

int main() {
  run_case("partition of unity", test_partition_of_unity);
  run_case("midpoint split", test_midpoint_split);
  run_case("clamping", test_clamping);
  run_case("degenerate encoding", test_degenerate);
  run_case("validation", test_validation);
  run_case("family shapes", test_family_shapes);
  return exit_code();
}
