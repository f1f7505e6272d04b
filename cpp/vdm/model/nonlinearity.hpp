#pragma once
/*
================================================================================
Fragment 3.3 - Model: Nonlinearity Learner
FILE: cpp/vdm/model/nonlinearity.hpp

Purpose:
  - Method A: one-parameter corrections on a local model's output d
      bias       g(d) = d + c
      quadratic  g(d) = d + a*d^2   (even; cannot represent asymmetry)
      cubic      g(d) = d + a*d^3   (odd; captures asymmetric response)
    The scalar is fit by least squares against residual error.

  - Method B: tanh-state correction  x_{k+1} = tanh(A x_k + B u_k + b)
    trained with a two-phase freeze protocol:

        UNTRAINED --train_base--> PHASE1_BASE --refine--> PHASE2_REFINED

    PHASE1_BASE : B held at 0 (frozen), A and b fit.
    refine      : only after phase-1 convergence (caller criterion);
                  A and b frozen, B unfrozen and fit.
    refine while UNTRAINED or before convergence -> PrematureRefinementError.
    train_base after refinement                  -> FrozenParameterViolation.

Training is observation-driven one-step-ahead: targets t_k are observed
residual states, pairs (t_k, u_k) -> t_{k+1}, full-batch gradient descent.
================================================================================
*/

#include "vdm/model/parameters.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace vdm::model {

// ----------------------------- Method A --------------------------------------
enum class NonlinearityKind : std::uint8_t { None = 0, Bias = 1, Quadratic = 2, Cubic = 3 };

const char* to_string(NonlinearityKind k) noexcept;
bool parse_nonlinearity_kind(const std::string& s, NonlinearityKind* out) noexcept;

struct PolynomialFit final {
  double coefficient = 0.0;
  double rms_before = 0.0;
  double rms_after = 0.0;
  std::size_t samples = 0;
};

class PolynomialCorrection final {
 public:
  explicit PolynomialCorrection(NonlinearityKind kind = NonlinearityKind::None,
                                const std::string& owner = "");

  NonlinearityKind kind() const noexcept { return kind_; }
  double coefficient() const noexcept { return param_.at(0, 0); }

  // Correction basis: 1, d^2, d^3 (0 for None).
  double basis(double d) const noexcept;
  // g(d) = d + a * basis(d)
  double apply(double d) const noexcept { return d + coefficient() * basis(d); }

  // Fit a on pairs (d_k, y_k) with y_k ~= g(d_k).
  PolynomialFit fit(const std::vector<double>& deltas, const std::vector<double>& targets);

  // Fit a on a prepared regression r_k ~= a * q_k (q_k already includes
  // gate weight and sign). Used by backfitting inside a superposition.
  PolynomialFit fit_regression(const std::vector<double>& q, const std::vector<double>& r);

  void reset();

  ParameterGroup& parameters() noexcept { return param_; }
  const ParameterGroup& parameters() const noexcept { return param_; }

 private:
  NonlinearityKind kind_;
  ParameterGroup param_;
};

// ----------------------------- Convergence -----------------------------------
struct ConvergenceCriterion final {
  // Fixed epoch budget.
  std::size_t max_epochs = 200;

  // Plateau: relative improvement below rel_tol for `patience` epochs.
  double rel_tol = 1e-6;
  std::size_t patience = 5;

  // When the budget runs out without a plateau, count it as converged.
  bool budget_is_convergence = true;

  // Optional caller predicate over the loss history; replaces the plateau
  // test when set.
  std::function<bool(const std::vector<double>&)> custom;

  bool should_stop(const std::vector<double>& loss_history) const;
  void validate() const;
};

struct TrainingTrace final {
  std::vector<double> loss;
  std::size_t epochs = 0;
  bool converged = false;
  std::string stop_reason;
};

// ----------------------------- Method B --------------------------------------
enum class RecurrentPhase : std::uint8_t { Untrained = 0, Phase1Base = 1, Phase2Refined = 2 };

const char* to_string(RecurrentPhase p) noexcept;

// One episode worth of observation-driven data. targets[k] is the observed
// state at step k; inputs[k] the input applied at step k. Sizes match.
struct RecurrentSequence final {
  std::vector<Eigen::VectorXd> targets;
  std::vector<Eigen::VectorXd> inputs;
};

class RecurrentCorrection final {
 public:
  RecurrentCorrection() = default;
  RecurrentCorrection(std::size_t state_dim, std::size_t input_dim, const std::string& owner = "recurrent");

  std::size_t state_dim() const noexcept { return static_cast<std::size_t>(A_.rows()); }
  std::size_t input_dim() const noexcept { return static_cast<std::size_t>(B_.cols()); }

  RecurrentPhase phase() const noexcept { return phase_; }
  bool phase1_converged() const noexcept { return phase1_converged_; }

  Eigen::VectorXd next_state(const Eigen::VectorXd& x, const Eigen::VectorXd& u) const;

  // Mean squared one-step error over all pairs.
  double loss(const std::vector<RecurrentSequence>& data) const;

  TrainingTrace train_base(const std::vector<RecurrentSequence>& data,
                           const ConvergenceCriterion& criterion,
                           double learning_rate);

  TrainingTrace refine(const std::vector<RecurrentSequence>& data,
                       const ConvergenceCriterion& criterion,
                       double learning_rate);

  const ParameterGroup& A() const noexcept { return A_; }
  const ParameterGroup& B() const noexcept { return B_; }
  const ParameterGroup& b() const noexcept { return b_; }

  std::vector<ParameterGroup*> groups() { return {&A_, &B_, &b_}; }
  std::vector<const ParameterGroup*> groups() const { return {&A_, &B_, &b_}; }

 private:
  double gradients(const std::vector<RecurrentSequence>& data,
                   Eigen::MatrixXd* gA, Eigen::MatrixXd* gB, Eigen::VectorXd* gb) const;
  TrainingTrace run(const std::vector<RecurrentSequence>& data,
                    const ConvergenceCriterion& criterion,
                    double learning_rate, bool base_phase);
  void validate_data(const std::vector<RecurrentSequence>& data) const;

  ParameterGroup A_;
  ParameterGroup B_;
  ParameterGroup b_;
  RecurrentPhase phase_ = RecurrentPhase::Untrained;
  bool phase1_converged_ = false;
};

}  // namespace vdm::model
