#include "vdm/model/vehicle.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/require.hpp"

#include <cmath>

namespace vdm::model {

const char* to_string(IntegratorKind k) noexcept {
  switch (k) {
    case IntegratorKind::Euler: return "euler";
    case IntegratorKind::BodyFrame: return "body_frame";
    default: return "euler";
  }
}

bool parse_integrator_kind(const std::string& s, IntegratorKind* out) noexcept {
  if (!out) return false;
  if (s == "euler") { *out = IntegratorKind::Euler; return true; }
  if (s == "body_frame") { *out = IntegratorKind::BodyFrame; return true; }
  return false;
}

// ----------------------------- Integrator ------------------------------------

Eigen::VectorXd Integrator::step(const Eigen::VectorXd& x, const Eigen::VectorXd& d) const {
  VDM_REQUIRE(x.size() == d.size(), ValidationError, "Integrator::step: state/derivative size mismatch");
  Eigen::VectorXd next = x + sample_time * d;
  if (kind == IntegratorKind::BodyFrame) {
    const auto ivy = static_cast<Eigen::Index>(vy);
    next(ivy) -= sample_time * x(static_cast<Eigen::Index>(r)) * x(static_cast<Eigen::Index>(vx));
  }
  return next;
}

Eigen::VectorXd Integrator::derivative_target(const Eigen::VectorXd& x, const Eigen::VectorXd& x_next) const {
  VDM_REQUIRE(x.size() == x_next.size(), ValidationError, "Integrator::derivative_target: size mismatch");
  Eigen::VectorXd d = (x_next - x) / sample_time;
  if (kind == IntegratorKind::BodyFrame) {
    const auto ivy = static_cast<Eigen::Index>(vy);
    d(ivy) += x(static_cast<Eigen::Index>(r)) * x(static_cast<Eigen::Index>(vx));
  }
  return d;
}

void Integrator::validate(std::size_t state_dim) const {
  require_positive(sample_time, "Integrator: sample_time must be > 0");
  if (kind == IntegratorKind::BodyFrame) {
    VDM_REQUIRE(vx < state_dim && vy < state_dim && r < state_dim, ValidationError,
                "Integrator: body_frame needs vx, vy and r state channels");
    VDM_REQUIRE(vx != vy && vx != r && vy != r, ValidationError,
                "Integrator: body_frame channels must be distinct");
  }
}

// ----------------------------- FrictionEllipse -------------------------------

double FrictionEllipse::mu_eff(const Eigen::VectorXd& signal) const {
  const double v = signal(static_cast<Eigen::Index>(speed_channel));
  const double b = (brake_channel == npos) ? 0.0 : signal(static_cast<Eigen::Index>(brake_channel));
  return mu_min + (mu_max - mu_min) * sigmoid(speed_gain * v + brake_gain * b);
}

void FrictionEllipse::saturate(Eigen::VectorXd& d, const Eigen::VectorXd& signal) const {
  if (!enabled) return;
  const double mu = mu_eff(signal);
  const double denom = mu * g + eps;
  const auto iax = static_cast<Eigen::Index>(ax_output);
  const auto iay = static_cast<Eigen::Index>(ay_output);
  const double nx = d(iax) / denom;
  const double ny = d(iay) / denom;
  const double eta = std::sqrt(nx * nx + ny * ny + eps);
  if (eta > 1.0) {
    d(iax) /= eta;
    d(iay) /= eta;
  }
}

void FrictionEllipse::validate(std::size_t signal_dim, std::size_t output_dim) const {
  if (!enabled) return;
  VDM_REQUIRE(is_finite(mu_min) && is_finite(mu_max) && mu_min > 0.0 && mu_min <= mu_max, ValidationError,
              "FrictionEllipse: requires 0 < mu_min <= mu_max");
  require_positive(g, "FrictionEllipse: g must be > 0");
  require_positive(eps, "FrictionEllipse: eps must be > 0");
  VDM_REQUIRE(is_finite(speed_gain) && is_finite(brake_gain), ValidationError,
              "FrictionEllipse: non-finite gains");
  VDM_REQUIRE(speed_channel < signal_dim, ValidationError, "FrictionEllipse: unknown speed channel");
  VDM_REQUIRE(brake_channel == npos || brake_channel < signal_dim, ValidationError,
              "FrictionEllipse: unknown brake channel");
  VDM_REQUIRE(ax_output < output_dim && ay_output < output_dim && ax_output != ay_output, ValidationError,
              "FrictionEllipse: ax/ay outputs must be two distinct state channels");
}

}  // namespace vdm::model
