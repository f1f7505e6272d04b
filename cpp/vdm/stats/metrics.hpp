#pragma once
/*
================================================================================
Fragment 6.2 - Stats: Evaluation Metrics
FILE: cpp/vdm/stats/metrics.hpp

Purpose:
  - Report accuracy and cost of trained models per channel:
      RMSE, max |error|, mean error (bias), samples, wall-clock time.
  - Forward model: free-run simulation from each episode's initial state
    under the recorded controls, or observation-driven one-step prediction.
  - Inverse model: target tracking of the closed loop through the frozen
    forward model.
================================================================================
*/

#include "vdm/data/episode.hpp"
#include "vdm/model/forward_model.hpp"
#include "vdm/model/inverse_model.hpp"
#include "vdm/stats/online_stats.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace vdm::stats {

struct ChannelError final {
  std::string channel;
  double rmse = 0.0;
  double max_abs = 0.0;
  double mean = 0.0;
  std::size_t samples = 0;
};

struct EvaluationMetrics final {
  std::string mode;
  std::size_t episodes = 0;
  std::vector<ChannelError> channels;
  double compute_time_ms = 0.0;
  double time_per_step_us = 0.0;
};

enum class ForwardEvalMode { FreeRun, OneStep };

EvaluationMetrics evaluate_forward(const model::ForwardModel& model, const std::vector<data::Episode>& corpus,
                                   ForwardEvalMode mode = ForwardEvalMode::FreeRun);

EvaluationMetrics evaluate_inverse(const model::InverseModel& inverse, const std::vector<data::Episode>& corpus);

// Accumulate (predicted - reference) per channel into `acc` (resized).
void accumulate_errors(const model::Trajectory& predicted, const model::Trajectory& reference,
                       std::vector<OnlineStats>& acc);

}  // namespace vdm::stats
