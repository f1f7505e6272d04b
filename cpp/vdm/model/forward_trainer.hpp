#pragma once
/*
================================================================================
Fragment 3.9 - Model: Forward Model Trainer
FILE: cpp/vdm/model/forward_trainer.hpp

Purpose:
  - Fit a ForwardModel to an episode corpus, then freeze it.

Stages (each one completes, workers joined, before the next starts):
  1. dataset    one-step derivative targets from consecutive states,
                observation-driven FIR features, activations, gate values
  2. backfit    Gauss-Seidel weighted least squares over the terms of each
                derivative channel; channels fit concurrently (their local
                models are disjoint)
  3. gates      gradient descent on learned gate networks, then one more
                backfit under the updated gates
  4. method A   scalar bias / quadratic / cubic correction per local model
  5. recurrent  two-phase tanh-state learner on the remaining residual
  6. freeze     every parameter group, stage FROZEN
================================================================================
*/

#include "vdm/core/settings.hpp"
#include "vdm/data/episode.hpp"
#include "vdm/model/forward_model.hpp"
#include "vdm/model/nonlinearity.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace vdm::model {

// Observation-driven training rows, one per consecutive sample pair.
struct ForwardDataset final {
  std::size_t rows = 0;
  std::vector<Eigen::MatrixXd> features;                    // per bank model: rows x feature_count
  std::vector<std::vector<std::vector<double>>> activations; // per row: per variable
  std::vector<Eigen::VectorXd> signals;                      // per row: s_k
  Eigen::MatrixXd targets;                                   // rows x state_dim (derivatives)
  std::vector<std::size_t> episode_begin;                    // first row of each episode, plus end

  GateContext context(std::size_t row) const { return GateContext{&activations[row], &signals[row]}; }
};

struct ForwardTrainingReport final {
  std::size_t episodes = 0;
  std::size_t rows = 0;
  int backfit_sweeps = 0;

  std::vector<double> derivative_rmse_linear;  // per channel after backfit
  std::vector<double> derivative_rmse;         // per channel after Method A
  std::vector<std::string> correction_models;
  std::vector<PolynomialFit> corrections;

  TrainingTrace gate_trace;
  TrainingTrace recurrent_phase1;
  TrainingTrace recurrent_phase2;
  bool recurrent_refined = false;

  std::vector<double> one_step_rmse;  // per state channel, full model
  double wall_time_ms = 0.0;
};

class ForwardModelTrainer final {
 public:
  ForwardModelTrainer(TrainingSettings training, NumericalSettings numerics);

  // A TRAINED (not frozen) model may be trained again; the recurrent
  // correction then restarts from phase 1. FROZEN models throw.
  ForwardTrainingReport train(ForwardModel& model, const std::vector<data::Episode>& corpus,
                              bool freeze = true) const;

  // ---- individual stages ----
  ForwardDataset build_dataset(const ForwardModel& model, const std::vector<data::Episode>& corpus) const;
  void backfit(ForwardModel& model, const ForwardDataset& ds) const;
  TrainingTrace fit_learned_gates(ForwardModel& model, const ForwardDataset& ds) const;
  std::vector<PolynomialFit> fit_corrections(ForwardModel& model, const ForwardDataset& ds) const;
  void fit_recurrent(ForwardModel& model, const ForwardDataset& ds, ForwardTrainingReport& report) const;

  // Per derivative channel RMS of (target - superposition).
  std::vector<double> derivative_rmse(const ForwardModel& model, const ForwardDataset& ds,
                                      bool with_friction = false) const;

 private:
  TrainingSettings training_;
  NumericalSettings numerics_;
};

}  // namespace vdm::model
