#include "vdm/fuzzy/membership.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace vdm::fuzzy {

namespace {

double unit_clamp(double v) noexcept {
  if (!is_finite(v)) return 0.0;
  return clamp(v, 0.0, 1.0);
}

// Shape helpers. Named apart from the MembershipFunction factories so that
// lookup inside member functions does not land on the static builders.
double triangle_shape(double x, double a, double b, double c) noexcept {
  if (x < a || x > c) return 0.0;
  if (x == b) return 1.0;
  if (x < b) return safe_div(x - a, b - a, 1.0);
  return safe_div(c - x, c - b, 1.0);
}

double trapezoid_shape(double x, double a, double b, double c, double d) noexcept {
  if (x < a || x > d) return 0.0;
  if (x >= b && x <= c) return 1.0;
  if (x < b) return safe_div(x - a, b - a, 1.0);
  return safe_div(d - x, d - c, 1.0);
}

double gaussian_shape(double x, double mean, double sigma) noexcept {
  const double z = (x - mean) / sigma;
  return std::exp(-0.5 * z * z);
}

double sigmoid_shape(double x, double center, double slope) noexcept {
  return vdm::sigmoid(slope * (x - center));
}

}  // namespace

const char* to_string(MembershipFamily f) noexcept {
  switch (f) {
    case MembershipFamily::Triangular: return "triangular";
    case MembershipFamily::Trapezoidal: return "trapezoidal";
    case MembershipFamily::Gaussian: return "gaussian";
    case MembershipFamily::Sigmoid: return "sigmoid";
    default: return "triangular";
  }
}

bool parse_membership_family(const std::string& s, MembershipFamily* out) noexcept {
  if (!out) return false;
  if (s == "triangular") { *out = MembershipFamily::Triangular; return true; }
  if (s == "trapezoidal") { *out = MembershipFamily::Trapezoidal; return true; }
  if (s == "gaussian") { *out = MembershipFamily::Gaussian; return true; }
  if (s == "sigmoid") { *out = MembershipFamily::Sigmoid; return true; }
  return false;
}

double MembershipFunction::evaluate(double x) const noexcept {
  const auto& p = params;
  switch (family) {
    case MembershipFamily::Triangular:
      return unit_clamp(triangle_shape(x, p[0], p[1], p[2]));
    case MembershipFamily::Trapezoidal:
      return unit_clamp(trapezoid_shape(x, p[0], p[1], p[2], p[3]));
    case MembershipFamily::Gaussian:
      return unit_clamp(gaussian_shape(x, p[0], p[1]));
    case MembershipFamily::Sigmoid:
      return unit_clamp(sigmoid_shape(x, p[0], p[1]));
    default:
      return 0.0;
  }
}

void MembershipFunction::validate() const {
  for (double v : params) {
    VDM_REQUIRE(is_finite(v), ValidationError, "membership '" + name + "': non-finite parameter");
  }
  switch (family) {
    case MembershipFamily::Triangular:
      VDM_REQUIRE(params.size() == 3, ValidationError, "triangular '" + name + "' needs 3 params (a,b,c)");
      VDM_REQUIRE(params[0] <= params[1] && params[1] <= params[2] && params[0] < params[2],
                  ValidationError, "triangular '" + name + "' requires a <= b <= c, a < c");
      break;
    case MembershipFamily::Trapezoidal:
      VDM_REQUIRE(params.size() == 4, ValidationError, "trapezoidal '" + name + "' needs 4 params (a,b,c,d)");
      VDM_REQUIRE(params[0] <= params[1] && params[1] <= params[2] && params[2] <= params[3] &&
                      params[0] < params[3],
                  ValidationError, "trapezoidal '" + name + "' requires a <= b <= c <= d, a < d");
      break;
    case MembershipFamily::Gaussian:
      VDM_REQUIRE(params.size() == 2, ValidationError, "gaussian '" + name + "' needs 2 params (mean,sigma)");
      VDM_REQUIRE(params[1] > 0.0, ValidationError, "gaussian '" + name + "' requires sigma > 0");
      break;
    case MembershipFamily::Sigmoid:
      VDM_REQUIRE(params.size() == 2, ValidationError, "sigmoid '" + name + "' needs 2 params (center,slope)");
      VDM_REQUIRE(params[1] != 0.0, ValidationError, "sigmoid '" + name + "' requires slope != 0");
      break;
    default:
      VDM_REQUIRE(false, ValidationError, "membership '" + name + "': unknown family");
  }
}

MembershipFunction MembershipFunction::triangular(std::string name, double a, double b, double c) {
  MembershipFunction f{std::move(name), MembershipFamily::Triangular, {a, b, c}};
  f.validate();
  return f;
}

MembershipFunction MembershipFunction::trapezoidal(std::string name, double a, double b, double c, double d) {
  MembershipFunction f{std::move(name), MembershipFamily::Trapezoidal, {a, b, c, d}};
  f.validate();
  return f;
}

MembershipFunction MembershipFunction::gaussian(std::string name, double mean, double sigma) {
  MembershipFunction f{std::move(name), MembershipFamily::Gaussian, {mean, sigma}};
  f.validate();
  return f;
}

MembershipFunction MembershipFunction::sigmoid(std::string name, double center, double slope) {
  MembershipFunction f{std::move(name), MembershipFamily::Sigmoid, {center, slope}};
  f.validate();
  return f;
}

void FuzzySet::validate() const {
  VDM_REQUIRE(!name.empty(), ValidationError, "fuzzy set name empty");
  VDM_REQUIRE(is_finite(domain_lo) && is_finite(domain_hi) && domain_lo < domain_hi,
              ValidationError, "fuzzy set '" + name + "': domain must be finite with lo < hi");
  VDM_REQUIRE(!functions.empty(), ValidationError, "fuzzy set '" + name + "' has no membership functions");
  for (std::size_t i = 0; i < functions.size(); ++i) {
    functions[i].validate();
    for (std::size_t j = 0; j < i; ++j) {
      VDM_REQUIRE(functions[j].name != functions[i].name, ValidationError,
                  "fuzzy set '" + name + "': duplicate function '" + functions[i].name + "'");
    }
  }
}

std::size_t FuzzySet::index_of(const std::string& fn_name) const noexcept {
  for (std::size_t i = 0; i < functions.size(); ++i) {
    if (functions[i].name == fn_name) return i;
  }
  return npos;
}

MembershipEncoder::MembershipEncoder(double partition_tol) : partition_tol_(partition_tol) {
  VDM_REQUIRE(is_finite(partition_tol) && partition_tol > 0.0, ValidationError,
              "MembershipEncoder: partition_tol must be > 0");
}

std::vector<double> MembershipEncoder::encode(double x, const FuzzySet& set) const {
  std::vector<double> out;
  encode_into(x, set, out);
  return out;
}

void MembershipEncoder::encode_into(double x, const FuzzySet& set, std::vector<double>& out) const {
  VDM_REQUIRE(is_finite(x), ValidationError, "encode: non-finite input for set '" + set.name + "'");

  const double xc = clamp(x, set.domain_lo, set.domain_hi);
  out.resize(set.functions.size());

  double sum = 0.0;
  for (std::size_t i = 0; i < set.functions.size(); ++i) {
    out[i] = set.functions[i].evaluate(xc);
    sum += out[i];
  }

  if (!set.normalized) return;

  if (!(sum > 0.0)) {
    std::ostringstream oss;
    oss << "encode: every membership of '" << set.name << "' is 0 at x=" << x
        << " (clamped " << xc << ")";
    throw DegenerateEncodingError(oss.str());
  }

  for (double& a : out) a /= sum;

  // Renormalize once more if rounding drifted outside tolerance.
  double check = 0.0;
  for (double a : out) check += a;
  if (std::fabs(check - 1.0) > partition_tol_) {
    for (double& a : out) a /= check;
  }
}

}  // namespace vdm::fuzzy
