#pragma once
/*
================================================================================
Fragment 3.10 - Model: Inverse Model
FILE: cpp/vdm/model/inverse_model.hpp

Purpose:
  - target trajectory + initial condition -> control sequence.
  - Affine feedback policy on the state the frozen forward model
    reconstructs:

      u_k = clamp( Kr r_{k+1} + Kx xhat_k + Ku u_{k-1} + c )
      xhat_{k+1} = ForwardModel.step(xhat_k, u_k)

Training (InverseModelTrainer):
  - Optional direct-inverse initialization: ridge least squares of the
    recorded u_k on (x_{k+1}, x_k, u_{k-1}, 1).
  - Inverse-in-series-with-forward epochs: minimize the weighted MSE between
    target and reconstructed trajectory w.r.t. (Kr, Kx, Ku, c) only, central
    finite-difference gradient, backtracking step.
  - The forward model is held through a const handle and must be FROZEN;
    otherwise ConfigurationError.
================================================================================
*/

#include "vdm/core/settings.hpp"
#include "vdm/data/episode.hpp"
#include "vdm/model/forward_model.hpp"
#include "vdm/model/nonlinearity.hpp"
#include "vdm/model/parameters.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <memory>
#include <vector>

namespace vdm::model {

struct InitialCondition final {
  Eigen::VectorXd state;
  Eigen::VectorXd previous_control;
};

struct InverseModelSpec final {
  Eigen::VectorXd control_lo;       // empty -> unbounded
  Eigen::VectorXd control_hi;       // empty -> unbounded
  Eigen::VectorXd loss_weights;     // per state channel; empty -> ones
  Eigen::VectorXd nominal_state;    // stability operating point; empty -> zeros
  Eigen::VectorXd nominal_control;  // empty -> zeros
};

struct InverseRollout final {
  std::vector<Eigen::VectorXd> controls;  // u_0 .. u_{N-1}
  Trajectory states;                      // xhat_0 .. xhat_N
};

class InverseModel final {
 public:
  InverseModel(std::shared_ptr<const ForwardModel> forward, InverseModelSpec spec = InverseModelSpec());

  const ForwardModel& forward() const noexcept { return *forward_; }
  const InverseModelSpec& spec() const noexcept { return spec_; }
  std::size_t state_dim() const noexcept { return n_; }
  std::size_t control_dim() const noexcept { return m_; }

  const ParameterGroup& Kr() const noexcept { return Kr_; }
  const ParameterGroup& Kx() const noexcept { return Kx_; }
  const ParameterGroup& Ku() const noexcept { return Ku_; }
  const ParameterGroup& c() const noexcept { return c_; }

  std::vector<ParameterGroup*> parameters() { return {&Kr_, &Kx_, &Ku_, &c_}; }
  std::vector<const ParameterGroup*> parameters() const { return {&Kr_, &Kx_, &Ku_, &c_}; }

  // Concatenated [Kr | Kx | Ku | c] (each column-major).
  Eigen::VectorXd flat_parameters() const;
  void assign_flat_parameters(const Eigen::VectorXd& theta);

  bool frozen() const noexcept { return all_frozen(parameters()); }
  void freeze() noexcept { freeze_all(parameters()); }

  Eigen::VectorXd control(const Eigen::VectorXd& r_next, const Eigen::VectorXd& xhat,
                          const Eigen::VectorXd& u_prev) const;

  // target[k] is the desired state after control k.
  std::vector<Eigen::VectorXd> predict(const Trajectory& target, const InitialCondition& ic) const;
  InverseRollout rollout(const Trajectory& target, const InitialCondition& ic) const;

  // Weighted mean squared error between target[k] and xhat_{k+1}.
  double tracking_loss(const Trajectory& target, const InitialCondition& ic) const;

 private:
  std::shared_ptr<const ForwardModel> forward_;
  InverseModelSpec spec_;
  std::size_t n_ = 0;
  std::size_t m_ = 0;
  ParameterGroup Kr_;
  ParameterGroup Kx_;
  ParameterGroup Ku_;
  ParameterGroup c_;
};

// One training target built from a recorded episode.
struct InverseSequence final {
  Trajectory target;                            // x_1 .. x_{T-1}
  InitialCondition initial;                     // x_0, u_0 as previous control
  std::vector<Eigen::VectorXd> recorded;        // u_0 .. u_{T-2}
};

InverseSequence make_inverse_sequence(const data::Episode& e);

struct InverseTrainingReport final {
  std::size_t sequences = 0;
  bool direct_init = false;
  double direct_init_rmse = 0.0;  // control fit
  double initial_loss = 0.0;
  double final_loss = 0.0;
  TrainingTrace trace;
  double wall_time_ms = 0.0;
};

class InverseModelTrainer final {
 public:
  InverseModelTrainer(TrainingSettings training, NumericalSettings numerics);

  InverseTrainingReport train(InverseModel& inverse, const std::vector<data::Episode>& corpus,
                              bool freeze = true) const;

  // Returns the RMS of the recorded-control fit.
  double direct_inverse_init(InverseModel& inverse, const std::vector<InverseSequence>& data) const;

  // Mean tracking loss + inverse_ridge * |theta|^2.
  double objective(const InverseModel& inverse, const std::vector<InverseSequence>& data) const;

 private:
  void require_frozen_forward(const InverseModel& inverse) const;

  TrainingSettings training_;
  NumericalSettings numerics_;
};

}  // namespace vdm::model
