#include "vdm/stats/metrics.hpp"

#include "vdm/core/errors.hpp"

#include <chrono>

namespace vdm::stats {

namespace {

std::vector<ChannelError> summarize(const std::vector<OnlineStats>& acc, const std::vector<std::string>& names) {
  std::vector<ChannelError> out(acc.size());
  for (std::size_t i = 0; i < acc.size(); ++i) {
    out[i].channel = i < names.size() ? names[i] : std::to_string(i);
    out[i].rmse = acc[i].rms();
    out[i].max_abs = acc[i].max_abs();
    out[i].mean = acc[i].mean;
    out[i].samples = static_cast<std::size_t>(acc[i].count());
  }
  return out;
}

double elapsed_ms(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
}

}  // namespace

void accumulate_errors(const model::Trajectory& predicted, const model::Trajectory& reference,
                       std::vector<OnlineStats>& acc) {
  VDM_REQUIRE(predicted.size() == reference.size(), ValidationError, "accumulate_errors: length mismatch");
  if (predicted.empty()) return;
  const auto dim = static_cast<std::size_t>(reference.front().size());
  if (acc.size() < dim) acc.resize(dim);
  for (std::size_t k = 0; k < predicted.size(); ++k) {
    VDM_REQUIRE(static_cast<std::size_t>(predicted[k].size()) == dim &&
                    static_cast<std::size_t>(reference[k].size()) == dim,
                ValidationError, "accumulate_errors: dimension mismatch");
    for (std::size_t i = 0; i < dim; ++i) {
      const auto ii = static_cast<Eigen::Index>(i);
      acc[i].push(predicted[k](ii) - reference[k](ii));
    }
  }
}

EvaluationMetrics evaluate_forward(const model::ForwardModel& model, const std::vector<data::Episode>& corpus,
                                   ForwardEvalMode mode) {
  EvaluationMetrics m;
  m.mode = (mode == ForwardEvalMode::FreeRun) ? "free_run" : "one_step";
  m.episodes = corpus.size();

  std::vector<OnlineStats> acc(model.state_dim());
  std::size_t steps = 0;
  const auto t0 = std::chrono::steady_clock::now();
  for (const data::Episode& e : corpus) {
    if (e.size() < 2) continue;
    const model::Trajectory ref = e.states();
    if (mode == ForwardEvalMode::FreeRun) {
      std::vector<Eigen::VectorXd> u = e.controls();
      u.pop_back();
      const model::Trajectory pred = model.predict(u, e[0].x);
      accumulate_errors(model::Trajectory(pred.begin() + 1, pred.end()),
                        model::Trajectory(ref.begin() + 1, ref.end()), acc);
      steps += u.size();
    } else {
      const model::Trajectory pred = model.predict_one_step(e);
      accumulate_errors(pred, model::Trajectory(ref.begin() + 1, ref.end()), acc);
      steps += pred.size();
    }
  }
  m.compute_time_ms = elapsed_ms(t0);
  m.time_per_step_us = steps ? 1000.0 * m.compute_time_ms / static_cast<double>(steps) : 0.0;
  m.channels = summarize(acc, model.layout().state_names);
  return m;
}

EvaluationMetrics evaluate_inverse(const model::InverseModel& inverse, const std::vector<data::Episode>& corpus) {
  EvaluationMetrics m;
  m.mode = "inverse_tracking";
  m.episodes = corpus.size();

  std::vector<OnlineStats> acc(inverse.state_dim());
  std::size_t steps = 0;
  const auto t0 = std::chrono::steady_clock::now();
  for (const data::Episode& e : corpus) {
    if (e.size() < 2) continue;
    const model::InverseSequence seq = model::make_inverse_sequence(e);
    const model::InverseRollout ro = inverse.rollout(seq.target, seq.initial);
    accumulate_errors(model::Trajectory(ro.states.begin() + 1, ro.states.end()), seq.target, acc);
    steps += seq.target.size();
  }
  m.compute_time_ms = elapsed_ms(t0);
  m.time_per_step_us = steps ? 1000.0 * m.compute_time_ms / static_cast<double>(steps) : 0.0;
  m.channels = summarize(acc, inverse.forward().layout().state_names);
  return m;
}

}  // namespace vdm::stats
