#pragma once
/*
================================================================================
Fragment 3.8 - Model: Forward Model
FILE: cpp/vdm/model/forward_model.hpp

Purpose:
  - controls + initial state -> predicted trajectory.
  - Per step k, with s_k = [x_k ; u_k]:
      1. push s_k into the FIR history
      2. encode every operating variable (fuzzy activations)
      3. per derivative channel: superpose the gated local-model terms
      4. friction-ellipse saturation of (ax, ay) when enabled
      5. + scale * xr_k   (tanh-state correction, when enabled)
         xr_{k+1} = tanh(A xr_k + B u_k + b)
      6. x_{k+1} = Integrator(x_k, d_k)
  - FIR history and recurrent state are reset only at episode boundaries
    (begin()).

Lifecycle:
  UNTRAINED -> TRAINED -> FROZEN
  freeze() freezes every parameter group; later writes throw
  FrozenParameterViolation. Inverse training requires FROZEN.

Wiring invariants (constructor):
  - every gate targets an existing derivative channel and bank model
  - every bank model is referenced by exactly one gate
  - membership gates reference an existing variable/member
================================================================================
*/

#include "vdm/core/settings.hpp"
#include "vdm/fuzzy/membership.hpp"
#include "vdm/model/gate.hpp"
#include "vdm/model/local_model.hpp"
#include "vdm/model/nonlinearity.hpp"
#include "vdm/model/signals.hpp"
#include "vdm/model/superposition.hpp"
#include "vdm/model/vehicle.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vdm::data {
class Episode;
}

namespace vdm::model {

struct OperatingVariable final {
  std::string name;
  std::size_t channel = 0;  // signal index
  fuzzy::FuzzySet set;
};

enum class ForwardStage : std::uint8_t { Untrained = 0, Trained = 1, Frozen = 2 };

const char* to_string(ForwardStage s) noexcept;

struct ForwardModelSpec final {
  ChannelLayout layout;
  Integrator integrator;
  std::vector<OperatingVariable> variables;
  FrictionEllipse friction;
  bool recurrent_enabled = false;
  Eigen::VectorXd recurrent_scale;  // per state channel; empty -> ones
  NumericalSettings numerics;

  void validate() const;
};

// Per-episode rollout state. Scratch buffers are reused across steps.
struct RolloutState final {
  SignalHistory history;
  Eigen::VectorXd x;
  Eigen::VectorXd xr;
  std::size_t steps = 0;

  std::vector<std::vector<double>> activations;
  std::vector<Eigen::VectorXd> features;
};

struct StepBreakdown final {
  Eigen::VectorXd combined;    // superposition totals per derivative channel
  Eigen::VectorXd derivative;  // after saturation and recurrent correction
  std::vector<SuperpositionResult> outputs;
  double mu_eff = 0.0;
};

// z_{k+1} ~ Phi z_k + Gamma u_k around an operating point, companion form:
//
//   z_k = [ x_k ; xr_k ; s_{k-1} ; ... ; s_{k-D+1} ],   s = [x ; u]
//
// D is the FIR history depth of the bank. xr is present only with the
// recurrent correction enabled. Delayed signal blocks are shift-register
// rows: s_k enters from (x_k, u_k), older blocks move down one slot.
struct LinearizedModel final {
  Eigen::MatrixXd Phi;
  Eigen::MatrixXd Gamma;
  std::size_t state_dim = 0;      // physical states occupy the leading rows
  std::size_t history_depth = 1;  // D
};

// states[0] is the initial state; states[k+1] follows controls[k].
using Trajectory = std::vector<Eigen::VectorXd>;

class ForwardModel final {
 public:
  ForwardModel(ForwardModelSpec spec, LocalModelBank bank, std::vector<Gate> gates);

  ForwardModel(ForwardModel&&) = default;
  ForwardModel& operator=(ForwardModel&&) = default;
  ForwardModel(const ForwardModel&) = delete;
  ForwardModel& operator=(const ForwardModel&) = delete;

  // Deep copy; the copy starts in the same stage with the same flags.
  ForwardModel clone() const;

  const ForwardModelSpec& spec() const noexcept { return spec_; }
  const ChannelLayout& layout() const noexcept { return spec_.layout; }
  double sample_time() const noexcept { return spec_.integrator.sample_time; }
  std::size_t state_dim() const noexcept { return spec_.layout.state_dim(); }
  std::size_t control_dim() const noexcept { return spec_.layout.control_dim(); }

  ForwardStage stage() const noexcept { return stage_; }
  bool frozen() const noexcept { return stage_ == ForwardStage::Frozen; }
  void mark_trained();
  void freeze() noexcept;

  // ---- inference ----
  RolloutState begin(const Eigen::VectorXd& x0) const;
  const Eigen::VectorXd& step(RolloutState& st, const Eigen::VectorXd& u, StepBreakdown* breakdown = nullptr) const;
  Trajectory predict(const std::vector<Eigen::VectorXd>& controls, const Eigen::VectorXd& x0) const;

  // Observation-driven one-step predictions; out[k] estimates x_{k+1}.
  Trajectory predict_one_step(const data::Episode& e) const;

  // Central finite differences at the steady point (x_op, u_op): every
  // delayed tap equals [x_op ; u_op] and the recurrent state sits at its
  // fixed point. Delayed taps stay separate states (see LinearizedModel).
  LinearizedModel linearize(const Eigen::VectorXd& x_op, const Eigen::VectorXd& u_op) const;

  // ---- building blocks shared with training ----
  void encode_operating(const Eigen::VectorXd& signal, std::vector<std::vector<double>>& out) const;
  void compute_features(const SignalHistory& h, std::vector<Eigen::VectorXd>& out) const;
  const std::vector<const Gate*>& gates_for_output(std::size_t o) const;

  LocalModelBank& bank() noexcept { return bank_; }
  const LocalModelBank& bank() const noexcept { return bank_; }
  const std::vector<Gate>& gates() const noexcept { return gates_; }
  Gate& gate(std::size_t i);
  RecurrentCorrection& recurrent() noexcept { return recurrent_; }
  const RecurrentCorrection& recurrent() const noexcept { return recurrent_; }
  const Eigen::VectorXd& recurrent_scale() const noexcept { return scale_; }

  std::vector<ParameterGroup*> parameters();
  std::vector<const ParameterGroup*> parameters() const;

 private:
  void index_gates();

  ForwardModelSpec spec_;
  LocalModelBank bank_;
  std::vector<Gate> gates_;
  std::vector<std::vector<const Gate*>> by_output_;
  RecurrentCorrection recurrent_;
  Eigen::VectorXd scale_;
  fuzzy::MembershipEncoder encoder_;
  SuperpositionCombiner combiner_;
  ForwardStage stage_ = ForwardStage::Untrained;
};

}  // namespace vdm::model
