#pragma once
/*
================================================================================
Fragment 3.7 - Model: Vehicle Kinematics + Friction Ellipse
FILE: cpp/vdm/model/vehicle.hpp

Purpose:
  - Integrator turns a predicted state derivative into the next state.
      Euler      x_{k+1} = x_k + Ts * d_k
      BodyFrame  vx += Ts*ax ; vy += Ts*(ay - r*vx) ; r += Ts*rdot
                 (other states Euler; right-hand sides use step-k values)
  - derivative_target() inverts step() so training can regress derivatives
    from consecutive observed states.
  - FrictionEllipse saturates the (ax, ay) pair to the combined-slip limit
      mu_eff = mu_min + (mu_max - mu_min) * sigmoid(ks*vx + kb*brake)
      eta    = sqrt((ax/(mu g + eps))^2 + (ay/(mu g + eps))^2 + eps)
      eta > 1 -> ax, ay scaled by 1/eta
================================================================================
*/

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <string>

namespace vdm::model {

enum class IntegratorKind : std::uint8_t { Euler = 0, BodyFrame = 1 };

const char* to_string(IntegratorKind k) noexcept;
bool parse_integrator_kind(const std::string& s, IntegratorKind* out) noexcept;

struct Integrator final {
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  IntegratorKind kind = IntegratorKind::Euler;
  double sample_time = 0.01;

  // State indices used by BodyFrame.
  std::size_t vx = npos;
  std::size_t vy = npos;
  std::size_t r = npos;

  Eigen::VectorXd step(const Eigen::VectorXd& x, const Eigen::VectorXd& d) const;
  Eigen::VectorXd derivative_target(const Eigen::VectorXd& x, const Eigen::VectorXd& x_next) const;

  void validate(std::size_t state_dim) const;
};

struct FrictionEllipse final {
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  bool enabled = false;
  double mu_min = 0.6;
  double mu_max = 2.0;
  double g = 9.81;
  double eps = 1e-6;
  double speed_gain = 0.5;
  double brake_gain = 2.0;

  std::size_t speed_channel = npos;  // signal index
  std::size_t brake_channel = npos;  // signal index; npos -> brake treated as 0
  std::size_t ax_output = npos;      // derivative index
  std::size_t ay_output = npos;      // derivative index

  double mu_eff(const Eigen::VectorXd& signal) const;

  // In place on the derivative vector d; no-op when disabled.
  void saturate(Eigen::VectorXd& d, const Eigen::VectorXd& signal) const;

  void validate(std::size_t signal_dim, std::size_t output_dim) const;
};

}  // namespace vdm::model
