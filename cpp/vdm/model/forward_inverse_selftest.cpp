/*
  Fragment 3.10 - Forward / Inverse Training Selftest

  Trains the built-in racing-car configuration on synthetic
  reference-vehicle episodes and checks the stage protocol end to end:
    1) UNTRAINED -> FROZEN forward lifecycle; frozen writes throw.
    2) Predictions are deterministic and shaped N+1.
    3) Inverse training refuses an unfrozen forward model.
    4) Inverse training never modifies forward parameters.
    5) A TRAINED model can be trained again, recurrent phases included.
    6) Overflowing trial policies count as infinite loss; the report
       only claims convergence when the loop actually converged.

  Non-zero return code indicates failure.
*/

#include "vdm/config/model_config.hpp"
#include "vdm/core/errors.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/selftest.hpp"
#include "vdm/data/reference_vehicle.hpp"
#include "vdm/model/forward_trainer.hpp"
#include "vdm/model/gate.hpp"
#include "vdm/model/inverse_model.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace vdm;
using namespace vdm::model;
using namespace vdm::selftest;

namespace {

config::ModelConfig small_config() {
  config::ModelConfig cfg = config::default_vehicle_config();
  cfg.settings.training.gate_epochs = 5;
  cfg.settings.training.recurrent_max_epochs = 100;
  cfg.settings.training.inverse_epochs = 1;
  cfg.settings.training.threads = 2;
  return cfg;
}

Eigen::VectorXd flat(const std::vector<const ParameterGroup*>& groups) {
  Eigen::Index n = 0;
  for (const auto* g : groups) n += g->size();
  Eigen::VectorXd out(n);
  Eigen::Index j = 0;
  for (const auto* g : groups) {
    out.segment(j, g->size()) = g->flat();
    j += g->size();
  }
  return out;
}

bool all_finite(const std::vector<double>& v) {
  for (double x : v) {
    if (!std::isfinite(x)) return false;
  }
  return true;
}

void test_forward_and_inverse() {
  const config::ModelConfig cfg = small_config();
  const data::ReferenceVehicleParams plant;
  const std::vector<data::Episode> corpus = data::simulate_reference_corpus(plant, 3, 250, 5);

  auto fwd = std::make_shared<ForwardModel>(config::make_forward_model(cfg));
  expect_true(fwd->stage() == ForwardStage::Untrained, "new forward model is UNTRAINED");

  // Inverse training before the forward model is frozen.
  {
    InverseModel inv(fwd, config::make_inverse_spec(cfg));
    const InverseModelTrainer itrainer(cfg.settings.training, cfg.settings.numerics);
    expect_throws<ConfigurationError>([&] { (void)itrainer.train(inv, corpus); },
                                      "inverse training on an unfrozen forward model throws");
  }

  const ForwardModelTrainer trainer(cfg.settings.training, cfg.settings.numerics);
  const ForwardTrainingReport rep = trainer.train(*fwd, corpus);
  expect_true(fwd->frozen() && all_frozen(std::as_const(*fwd).parameters()), "trained forward model is FROZEN");
  expect_true(rep.episodes == 3 && rep.rows == 3 * 249, "one training row per consecutive sample pair");
  expect_true(rep.one_step_rmse.size() == 3 && all_finite(rep.one_step_rmse), "one-step rmse per state channel");
  expect_true(rep.one_step_rmse[0] < 1.0, "one-step vx error is small");
  expect_true(fwd->recurrent().phase() != RecurrentPhase::Untrained, "recurrent correction trained");

  expect_throws<FrozenParameterViolation>([&] { fwd->bank().get(0).parameters()[0]->set(0, 0, 1.0); },
                                          "write to a frozen local model throws");
  expect_throws<FrozenParameterViolation>([&] { (void)trainer.train(*fwd, corpus); },
                                          "retraining a frozen forward model throws");

  // Free-run prediction shape and determinism.
  const data::Episode& e = corpus.front();
  const std::vector<Eigen::VectorXd> u = e.controls();
  const Trajectory p1 = fwd->predict(u, e[0].x);
  const Trajectory p2 = fwd->predict(u, e[0].x);
  expect_true(p1.size() == u.size() + 1, "predict returns N+1 states");
  bool same = true;
  for (std::size_t k = 0; k < p1.size(); ++k) same = same && (p1[k] == p2[k]);
  expect_true(same, "predict is deterministic");
  expect_true(fwd->predict_one_step(e).size() == e.size() - 1, "one-step predictions cover T-1 samples");

  const ForwardModel copy = fwd->clone();
  expect_true(copy.frozen(), "clone keeps the FROZEN stage");

  // Inverse training leaves the forward model untouched.
  const Eigen::VectorXd before = flat(static_cast<const ForwardModel&>(*fwd).parameters());
  const std::vector<data::Episode> short_corpus = data::simulate_reference_corpus(plant, 2, 120, 9);

  InverseModel inv(fwd, config::make_inverse_spec(cfg));
  const InverseModelTrainer itrainer(cfg.settings.training, cfg.settings.numerics);
  const InverseTrainingReport irep = itrainer.train(inv, short_corpus);
  const Eigen::VectorXd after = flat(static_cast<const ForwardModel&>(*fwd).parameters());

  expect_true(before == after, "forward parameters bit-identical after inverse training");
  expect_true(inv.frozen(), "inverse model frozen after training");
  expect_true(irep.sequences == 2, "one inverse sequence per episode");
  expect_true(std::isfinite(irep.final_loss) && irep.final_loss <= irep.initial_loss,
              "inverse loss does not increase");

  const InverseSequence seq = make_inverse_sequence(short_corpus.front());
  const InverseRollout ro = inv.rollout(seq.target, seq.initial);
  expect_true(ro.controls.size() == seq.target.size() && ro.states.size() == seq.target.size() + 1,
              "rollout yields one control per target step");
  bool bounded = true;
  for (const auto& c : ro.controls) {
    if (c(0) < -0.5 - 1e-12 || c(0) > 0.5 + 1e-12 || c(1) < -1e-12 || c(1) > 1.0 + 1e-12) bounded = false;
  }
  expect_true(bounded, "inverse controls respect the configured bounds");

  expect_throws<FrozenParameterViolation>([&] { (void)itrainer.train(inv, short_corpus); },
                                          "retraining a frozen inverse model throws");
}

void test_forward_retraining() {
  const config::ModelConfig cfg = small_config();
  const std::vector<data::Episode> corpus =
      data::simulate_reference_corpus(data::ReferenceVehicleParams(), 2, 150, 11);
  const ForwardModelTrainer trainer(cfg.settings.training, cfg.settings.numerics);

  ForwardModel fm = config::make_forward_model(cfg);
  const ForwardTrainingReport first = trainer.train(fm, corpus, false);
  expect_true(fm.stage() == ForwardStage::Trained && !fm.frozen(), "training without freeze leaves the model TRAINED");
  const RecurrentPhase phase = fm.recurrent().phase();
  expect_true(phase != RecurrentPhase::Untrained, "recurrent correction trained on the first pass");

  const ForwardTrainingReport second = trainer.train(fm, corpus, false);
  expect_true(fm.recurrent().phase() == phase && second.recurrent_refined == first.recurrent_refined,
              "second pass reruns both recurrent phases");
  expect_true(all_finite(second.one_step_rmse), "second pass reports finite one-step errors");
}

// x' = u, Euler at Ts = 1, frozen.
std::shared_ptr<const ForwardModel> integrator_plant() {
  ForwardModelSpec spec;
  spec.layout.state_names = {"x"};
  spec.layout.control_names = {"u"};
  spec.integrator.sample_time = 1.0;

  std::vector<std::unique_ptr<LocalModel>> models;
  models.push_back(std::make_unique<FirLocalModel>("drive", std::vector<FirInput>{FirInput{"u", 1, 1}}));
  Eigen::MatrixXd theta(2, 1);
  theta << 1.0, 0.0;
  models.front()->parameters()[0]->assign(theta);
  std::vector<Gate> gates;
  gates.push_back(Gate{"g_drive", 0, 0, 1.0, std::make_unique<ConstantGate>(1.0)});

  auto fm = std::make_shared<ForwardModel>(std::move(spec), LocalModelBank(std::move(models)), std::move(gates));
  fm->freeze();
  return fm;
}

// State held at 1 for `steps` samples.
data::Episode hold_episode(std::size_t steps) {
  std::vector<data::Sample> samples;
  for (std::size_t k = 0; k <= steps; ++k) {
    samples.push_back(data::Sample{static_cast<double>(k), Eigen::VectorXd::Constant(1, 1.0), Eigen::VectorXd::Zero(1)});
  }
  return data::Episode("hold", std::move(samples));
}

void test_inverse_overflowing_trials() {
  const auto plant = integrator_plant();
  const std::vector<data::Episode> corpus = {hold_episode(100)};
  TrainingSettings ts;
  ts.inverse_direct_init = false;
  ts.inverse_epochs = 3;
  ts.inverse_ridge = 0.0;
  const InverseModelTrainer trainer(ts, NumericalSettings());

  // u = 9 x grows the state tenfold per step: the loss is near 1e198 and its
  // gradient so large that every backtracking candidate overflows the policy.
  InverseModel fast(plant);
  Eigen::VectorXd theta = Eigen::VectorXd::Zero(fast.flat_parameters().size());
  theta(1) = 9.0;  // [Kr | Kx | Ku | c]
  fast.assign_flat_parameters(theta);
  const InverseTrainingReport r = trainer.train(fast, corpus);
  expect_true(std::isfinite(r.initial_loss) && r.initial_loss > 1e150, "initial loss is finite but huge");
  expect_true(r.trace.stop_reason == "no descent step", "overflowing candidates are rejected, not thrown");
  expect_true(!r.trace.converged, "a stalled line search is not reported as converged");
  expect_true(r.final_loss == r.initial_loss && fast.Kx().at(0, 0) == 9.0, "policy keeps its last accepted gains");

  // A starting policy that overflows at once falls back to zero gains.
  InverseModel wild(plant);
  theta(1) = 1e300;
  wild.assign_flat_parameters(theta);
  const InverseTrainingReport w = trainer.train(wild, corpus);
  expect_near(w.initial_loss, 0.0, 0.0, "zero gains track the held state exactly");
  expect_near(w.final_loss, 0.0, 0.0, "no step beats a zero loss");

  expect_throws<NumericalError>(
      [&] {
        InverseModel huge_gain(plant);
        huge_gain.assign_flat_parameters(theta);
        (void)huge_gain.control(Eigen::VectorXd::Zero(1), Eigen::VectorXd::Constant(1, 1e300),
                                 Eigen::VectorXd::Zero(1));
      },
      "non-finite policy output is a numerical error");

  TrainingSettings idle = ts;
  idle.inverse_epochs = 0;
  InverseModel untouched(plant);
  const InverseTrainingReport b = InverseModelTrainer(idle, NumericalSettings()).train(untouched, corpus);
  expect_true(b.trace.stop_reason == "epoch budget" && b.trace.converged, "an exhausted budget counts as converged");
}

}  // namespace

int main() {
  set_log_level(LogLevel::WARN);
  run_case("forward and inverse stage protocol", test_forward_and_inverse);
  run_case("forward retraining", test_forward_retraining);
  run_case("inverse overflowing trials", test_inverse_overflowing_trials);
  return exit_code();
}
