#include "vdm/stability/stability.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/require.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace vdm::stability {

const char* to_string(StabilityVerdict v) noexcept {
  switch (v) {
    case StabilityVerdict::Stable: return "stable";
    case StabilityVerdict::Unstable: return "unstable";
    default: return "unstable";
  }
}

StabilityAnalyzer::StabilityAnalyzer(double margin) : margin_(margin) {
  VDM_REQUIRE(is_finite(margin) && margin >= 0.0 && margin < 1.0, ValidationError,
              "StabilityAnalyzer: margin must be within [0,1)");
}

Eigen::MatrixXd StabilityAnalyzer::closed_loop_matrix(const model::LinearizedModel& lin,
                                                      const Eigen::MatrixXd& Kx, const Eigen::MatrixXd& Ku) {
  const Eigen::Index na = lin.Phi.rows();
  const Eigen::Index m = lin.Gamma.cols();
  const auto n = static_cast<Eigen::Index>(lin.state_dim);
  VDM_REQUIRE(lin.Phi.cols() == na && lin.Gamma.rows() == na && n <= na, ValidationError,
              "closed_loop_matrix: inconsistent linearization");
  VDM_REQUIRE(Kx.rows() == m && Kx.cols() == n && Ku.rows() == m && Ku.cols() == m, ValidationError,
              "closed_loop_matrix: gain dimensions do not match the linearization");

  Eigen::MatrixXd Kxa = Eigen::MatrixXd::Zero(m, na);
  Kxa.leftCols(n) = Kx;

  Eigen::MatrixXd A(na + m, na + m);
  A.topLeftCorner(na, na) = lin.Phi + lin.Gamma * Kxa;
  A.topRightCorner(na, m) = lin.Gamma * Ku;
  A.bottomLeftCorner(m, na) = Kxa;
  A.bottomRightCorner(m, m) = Ku;
  return A;
}

StabilityReport StabilityAnalyzer::check_poles(std::vector<std::complex<double>> poles) const {
  StabilityReport r;
  r.margin = margin_;
  std::stable_sort(poles.begin(), poles.end(), [](const std::complex<double>& a, const std::complex<double>& b) {
    return std::abs(a) > std::abs(b);
  });
  r.poles = std::move(poles);

  const double limit = 1.0 - margin_;
  std::vector<std::complex<double>> offending;
  for (const auto& p : r.poles) {
    VDM_REQUIRE(is_finite(p.real()) && is_finite(p.imag()), NumericalError, "StabilityAnalyzer: non-finite pole");
    const double mag = std::abs(p);
    r.spectral_radius = std::max(r.spectral_radius, mag);
    if (!(mag < limit)) offending.push_back(p);
  }

  if (offending.empty()) {
    r.verdict = StabilityVerdict::Stable;
    return r;
  }

  r.verdict = StabilityVerdict::Unstable;
  std::ostringstream oss;
  oss << offending.size() << " of " << r.poles.size() << " closed-loop poles on or outside |z| = " << limit
      << " (spectral radius " << r.spectral_radius << ")";
  r.warning = UnstableModelWarning{oss.str(), std::move(offending)};
  log(LogLevel::WARN, "stability", r.warning->message);
  return r;
}

StabilityReport StabilityAnalyzer::check_matrix(const Eigen::MatrixXd& A) const {
  VDM_REQUIRE(A.rows() == A.cols() && A.rows() > 0, ValidationError, "StabilityAnalyzer: matrix must be square");
  VDM_REQUIRE(A.allFinite(), NumericalError, "StabilityAnalyzer: non-finite state matrix");
  Eigen::EigenSolver<Eigen::MatrixXd> es(A, false);
  VDM_REQUIRE(es.info() == Eigen::Success, NumericalError, "StabilityAnalyzer: eigenvalue solver failed");
  const Eigen::VectorXcd ev = es.eigenvalues();
  std::vector<std::complex<double>> poles(ev.data(), ev.data() + ev.size());
  return check_poles(std::move(poles));
}

StabilityReport StabilityAnalyzer::check(const model::InverseModel& inverse,
                                         const Eigen::VectorXd& x_op, const Eigen::VectorXd& u_op) const {
  const model::LinearizedModel lin = inverse.forward().linearize(x_op, u_op);
  return check_matrix(closed_loop_matrix(lin, inverse.Kx().value(), inverse.Ku().value()));
}

StabilityReport StabilityAnalyzer::check(const model::InverseModel& inverse) const {
  return check(inverse, inverse.spec().nominal_state, inverse.spec().nominal_control);
}

}  // namespace vdm::stability
