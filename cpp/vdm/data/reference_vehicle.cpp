#include "vdm/data/reference_vehicle.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/hashing.hpp"
#include "vdm/core/require.hpp"
#include "vdm/core/rng.hpp"
#include "vdm/model/vehicle.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace vdm::data {

void ReferenceVehicleParams::validate_or_throw() const {
  require_positive(sample_time, "ReferenceVehicleParams: sample_time must be > 0");
  require_positive(top_speed, "ReferenceVehicleParams: top_speed must be > 0");
  require_positive(hold_s, "ReferenceVehicleParams: hold_s must be > 0");
  VDM_REQUIRE(is_finite(actuator_lag_s) && actuator_lag_s >= 0.0, ValidationError,
              "ReferenceVehicleParams: actuator_lag_s must be >= 0");
  VDM_REQUIRE(is_finite(initial_speed) && initial_speed >= 0.0, ValidationError,
              "ReferenceVehicleParams: initial_speed must be >= 0");
  VDM_REQUIRE(is_finite(max_steer) && max_steer >= 0.0, ValidationError,
              "ReferenceVehicleParams: max_steer must be >= 0");
}

Episode simulate_reference_episode(const std::string& id, const ReferenceVehicleParams& p, std::size_t steps,
                                   std::uint64_t seed) {
  p.validate_or_throw();
  VDM_REQUIRE(steps >= 2, ValidationError, "simulate_reference_episode: need at least 2 steps");

  model::Integrator integ;
  integ.kind = model::IntegratorKind::BodyFrame;
  integ.sample_time = p.sample_time;
  integ.vx = 0;
  integ.vy = 1;
  integ.r = 2;

  // Signal vector [vx vy r delta throttle brake].
  model::FrictionEllipse fe;
  fe.enabled = p.friction;
  fe.speed_channel = 0;
  fe.brake_channel = 5;
  fe.ax_output = 0;
  fe.ay_output = 1;

  Rng64 rng(seed);
  const double alpha = p.actuator_lag_s > 0.0 ? p.sample_time / (p.actuator_lag_s + p.sample_time) : 1.0;
  const auto hold = static_cast<std::size_t>(std::max(1.0, std::round(p.hold_s / p.sample_time)));

  Eigen::VectorXd x(3);
  x << p.initial_speed, 0.0, 0.0;
  Eigen::VectorXd cmd = Eigen::VectorXd::Zero(3);  // delta throttle brake
  Eigen::VectorXd act = Eigen::VectorXd::Zero(3);
  Eigen::VectorXd s(6);
  Eigen::VectorXd d(3);

  std::vector<Eigen::VectorXd> states;
  std::vector<Eigen::VectorXd> controls;
  states.reserve(steps);
  controls.reserve(steps);

  for (std::size_t k = 0; k < steps; ++k) {
    if (k % hold == 0) {
      const double throttle = rng.uniform(0.0, 1.0);
      cmd(0) = rng.uniform(-p.max_steer, p.max_steer);
      cmd(1) = throttle < 0.15 ? 0.0 : throttle;
      cmd(2) = throttle < 0.15 ? rng.uniform(0.2, 0.6) : 0.0;
    }
    states.push_back(x);
    controls.push_back(cmd);

    act += alpha * (cmd - act);
    const double vx = x(0);
    const double vy = x(1);
    const double r = x(2);
    d(0) = p.drive_gain * act(1) * (1.0 - vx / p.top_speed) - p.brake_gain * act(2) - p.drag * vx * std::fabs(vx);
    d(1) = p.lateral_gain * act(0) * vx - p.lateral_damping * vy + r * vx;
    d(2) = p.yaw_gain * act(0) * vx - p.yaw_damping * r;

    s << x, cmd;
    fe.saturate(d, s);
    x = integ.step(x, d);
    if (x(0) < 0.0) x(0) = 0.0;
    require_finite(x.sum(), "simulate_reference_episode: state diverged");
  }

  return make_uniform_episode(id, 0.0, p.sample_time, states, controls);
}

std::vector<Episode> simulate_reference_corpus(const ReferenceVehicleParams& p, std::size_t episodes,
                                               std::size_t steps, std::uint64_t seed) {
  std::vector<Episode> out;
  out.reserve(episodes);
  for (std::size_t i = 0; i < episodes; ++i) {
    char id[32];
    std::snprintf(id, sizeof(id), "ref-%03zu", i);
    out.push_back(simulate_reference_episode(id, p, steps, mix_seed(seed, i)));
  }
  return out;
}

}  // namespace vdm::data
