#pragma once
/*
================================================================================
Fragment 5.1 - Stability: Closed-Loop Pole Analysis
FILE: cpp/vdm/stability/stability.hpp

Purpose:
  - Certify a trained inverse/forward loop: discrete (z-domain) poles of the
    closed loop linearized at the inverse model's nominal operating point.

Closed loop (z the companion-form forward state of LinearizedModel, i.e.
[x ; xr ; delayed FIR signals], u_prev the policy memory):

      [ z_{k+1} ]   [ Phi + Gamma Kx'   Gamma Ku ] [ z_k      ]
      [ u_k     ] = [ Kx'               Ku       ] [ u_{k-1}  ]

  with Kx' = [Kx 0] acting on the physical states only. Reference and bias
  enter additively and do not move poles; clamping is ignored.

Verdict:
  - stable iff every |pole| < 1 - margin (margin >= 0, configurable).
  - The full pole list is always returned, sorted by descending magnitude.
  - Advisory only: an unstable verdict carries an UnstableModelWarning and
    logs at WARN. Nothing here throws for an unstable loop.
================================================================================
*/

#include "vdm/model/forward_model.hpp"
#include "vdm/model/inverse_model.hpp"

#include <Eigen/Dense>

#include <complex>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vdm::stability {

enum class StabilityVerdict : std::uint8_t { Stable = 0, Unstable = 1 };

const char* to_string(StabilityVerdict v) noexcept;

// Non-fatal; attached to a report, never thrown.
struct UnstableModelWarning final {
  std::string message;
  std::vector<std::complex<double>> offending_poles;
};

struct StabilityReport final {
  StabilityVerdict verdict = StabilityVerdict::Stable;
  std::vector<std::complex<double>> poles;
  double spectral_radius = 0.0;
  double margin = 0.0;
  std::optional<UnstableModelWarning> warning;

  bool stable() const noexcept { return verdict == StabilityVerdict::Stable; }
};

class StabilityAnalyzer final {
 public:
  explicit StabilityAnalyzer(double margin = 0.0);

  double margin() const noexcept { return margin_; }

  // Closed loop at the inverse model's nominal operating point.
  StabilityReport check(const model::InverseModel& inverse) const;
  StabilityReport check(const model::InverseModel& inverse,
                        const Eigen::VectorXd& x_op, const Eigen::VectorXd& u_op) const;

  // Poles of an arbitrary square state matrix.
  StabilityReport check_matrix(const Eigen::MatrixXd& A) const;

  // Verdict over an explicit pole list.
  StabilityReport check_poles(std::vector<std::complex<double>> poles) const;

  static Eigen::MatrixXd closed_loop_matrix(const model::LinearizedModel& lin,
                                            const Eigen::MatrixXd& Kx, const Eigen::MatrixXd& Ku);

 private:
  double margin_;
};

}  // namespace vdm::stability
