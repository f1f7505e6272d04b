/*
  Fragment 3.9 - Model Building Blocks Selftest

  Framework-free checks of the pieces the forward model is assembled from:
    - ParameterGroup stage gate (frozen writes throw, reads do not)
    - gate functions and the superposition combiner (additivity, sign,
      phi == 0 skips the local model)
    - FIR local model least squares
    - Method A polynomial corrections
    - Method B two-phase recurrent learner and its freeze protocol
    - hand-built forward models: rollout recurrent state and the
      companion-form linearization of delayed FIR taps

  Non-zero return code indicates failure.
*/

#include "vdm/core/errors.hpp"
#include "vdm/core/rng.hpp"
#include "vdm/core/selftest.hpp"
#include "vdm/model/forward_model.hpp"
#include "vdm/model/gate.hpp"
#include "vdm/model/local_model.hpp"
#include "vdm/model/nonlinearity.hpp"
#include "vdm/model/parameters.hpp"
#include "vdm/model/superposition.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <limits>
#include <memory>
#include <vector>

using namespace vdm;
using namespace vdm::model;
using namespace vdm::selftest;

namespace {

// ----------------------------- parameters ------------------------------------

void test_parameter_freeze() {
  ParameterGroup g("w", 2, 1, 0.0);
  g.set(0, 0, 1.5);
  expect_near(g.at(0), 1.5, 0.0, "mutable group accepts set");

  g.freeze();
  expect_throws<FrozenParameterViolation>([&] { g.set(1, 0, 2.0); }, "set on frozen group throws");
  expect_throws<FrozenParameterViolation>([&] { g.assign(Eigen::MatrixXd::Ones(2, 1)); },
                                          "assign on frozen group throws");
  expect_throws<FrozenParameterViolation>([&] { g.add_scaled(Eigen::MatrixXd::Ones(2, 1), 0.1); },
                                          "add_scaled on frozen group throws");
  expect_near(g.at(0), 1.5, 0.0, "frozen value unchanged");

  g.unfreeze();
  expect_throws<ValidationError>([&] { g.assign(Eigen::MatrixXd::Ones(3, 1)); }, "shape mismatch rejected");
  Eigen::VectorXd nan_v(2);
  nan_v << 1.0, std::numeric_limits<double>::quiet_NaN();
  expect_throws<ValidationError>([&] { g.assign_flat(nan_v); }, "non-finite values rejected");
}

// ----------------------------- superposition ---------------------------------

LocalModelBank two_model_bank() {
  std::vector<std::unique_ptr<LocalModel>> models;

  FirInput a;
  a.channel_name = "s0";
  a.channel = 0;
  a.taps = 2;
  auto m0 = std::make_unique<FirLocalModel>("m0", std::vector<FirInput>{a});
  Eigen::MatrixXd th0(3, 1);
  th0 << 1.0, 2.0, 0.5;
  m0->parameters()[0]->assign(th0);

  FirInput b;
  b.channel_name = "s1";
  b.channel = 1;
  b.taps = 1;
  auto m1 = std::make_unique<FirLocalModel>("m1", std::vector<FirInput>{b});
  Eigen::MatrixXd th1(2, 1);
  th1 << -1.0, 0.0;
  m1->parameters()[0]->assign(th1);

  models.push_back(std::move(m0));
  models.push_back(std::move(m1));
  return LocalModelBank(std::move(models));
}

Gate make_gate(const char* name, std::size_t model, double sign, std::unique_ptr<GateFunction> phi) {
  Gate g;
  g.name = name;
  g.output = 0;
  g.model_index = model;
  g.sign = sign;
  g.phi = std::move(phi);
  return g;
}

void test_superposition() {
  const LocalModelBank bank = two_model_bank();
  const SuperpositionCombiner comb;

  Eigen::VectorXd signal = Eigen::VectorXd::Zero(2);
  const std::vector<std::vector<double>> act;
  GateContext ctx;
  ctx.activations = &act;
  ctx.signal = &signal;

  std::vector<Eigen::VectorXd> features(2);
  features[0] = Eigen::Vector2d(1.0, 1.0);  // m0 -> 1 + 2 + 0.5 = 3.5
  features[1] = Eigen::VectorXd::Constant(1, 2.0);  // m1 -> -2

  Gate g0 = make_gate("g0", 0, 1.0, std::make_unique<ConstantGate>(1.0));
  Gate g1 = make_gate("g1", 1, -1.0, std::make_unique<ConstantGate>(0.5));
  const std::vector<const Gate*> gates = {&g0, &g1};

  const SuperpositionResult r = comb.combine(gates, bank, ctx, features);
  expect_near(r.terms[0].contribution, 3.5, 1e-12, "term 0 = +1 * 1 * 3.5");
  expect_near(r.terms[1].contribution, 1.0, 1e-12, "term 1 = -1 * 0.5 * -2");
  expect_near(r.total, 4.5, 1e-12, "total is the signed sum of terms");
  expect_near(comb.total(gates, bank, ctx, features), r.total, 0.0, "total() matches combine()");

  // Switching a gate off removes exactly its term.
  g1.phi = std::make_unique<ConstantGate>(0.0);
  const SuperpositionResult off = comb.combine(gates, bank, ctx, features);
  expect_near(off.total, 3.5, 1e-12, "disabled gate contributes 0");
  expect_true(!off.terms[1].evaluated, "disabled gate skips its local model");

  // A disabled model cannot leak NaN into the sum.
  features[1](0) = std::numeric_limits<double>::quiet_NaN();
  expect_near(comb.total(gates, bank, ctx, features), 3.5, 1e-12, "NaN features behind phi=0 ignored");

  g1.phi = std::make_unique<ConstantGate>(1.0);
  expect_throws<NumericalError>([&] { (void)comb.total(gates, bank, ctx, features); },
                                "non-finite local output is a NumericalError");
}

void test_gate_functions() {
  const std::vector<std::vector<double>> act = {{0.3, 0.7}};
  Eigen::VectorXd signal(2);
  signal << 0.5, 0.0;
  GateContext ctx;
  ctx.activations = &act;
  ctx.signal = &signal;

  expect_near(MembershipGate(0, 1, "speed.high").evaluate(ctx), 0.7, 0.0, "membership gate reads activation");
  expect_near(ControlRuleGate(0, "brake", 0.01, true).evaluate(ctx), 1.0, 0.0, "rule gate on above threshold");
  expect_near(ControlRuleGate(1, "throttle", 0.01, true).evaluate(ctx), 0.0, 0.0, "rule gate off below threshold");

  const LearnedGate lg("lat", {0, 1}, {1.0, 1.0}, 4, 11, 0.9);
  const double phi = lg.evaluate(ctx);
  expect_true(phi > 0.0 && phi < 1.0, "learned gate output in (0,1)");
  expect_true(lg.learnable() && !ConstantGate(1.0).learnable(), "only learned gates expose parameters");

  expect_throws<ValidationError>([] { ConstantGate g(1.5); }, "constant gate outside [0,1] rejected");
}

// ----------------------------- local model fit -------------------------------

void test_fir_fit() {
  FirInput a;
  a.channel_name = "s0";
  a.channel = 0;
  a.taps = 2;
  FirLocalModel m("fit", {a});

  Rng64 rng(7);
  const Eigen::Index n = 60;
  Eigen::MatrixXd F(n, 2);
  Eigen::VectorXd y(n);
  for (Eigen::Index k = 0; k < n; ++k) {
    F(k, 0) = rng.uniform(-1.0, 1.0);
    F(k, 1) = rng.uniform(-1.0, 1.0);
    y(k) = 1.0 * F(k, 0) - 2.0 * F(k, 1) + 0.25;
  }
  m.fit(F, Eigen::VectorXd::Ones(n), y, 1e-10);
  expect_near(m.weights().at(0), 1.0, 1e-6, "fir weight 0 recovered");
  expect_near(m.weights().at(1), -2.0, 1e-6, "fir weight 1 recovered");
  expect_near(m.weights().at(2), 0.25, 1e-6, "fir bias recovered");
}

// ----------------------------- Method A --------------------------------------

void test_polynomial_correction() {
  std::vector<double> d, y;
  for (int i = -20; i <= 20; ++i) {
    const double v = 0.1 * i;
    d.push_back(v);
    y.push_back(v + 0.3 * v * v * v);
  }

  PolynomialCorrection cubic(NonlinearityKind::Cubic, "m");
  const PolynomialFit fit = cubic.fit(d, y);
  expect_near(fit.coefficient, 0.3, 1e-12, "cubic coefficient recovered");
  expect_near(fit.rms_after, 0.0, 1e-9, "cubic residual vanishes");
  expect_true(fit.rms_before > fit.rms_after, "fit reduces residual");
  expect_near(cubic.apply(2.0), 2.0 + 0.3 * 8.0, 1e-12, "g(d) = d + a d^3");

  // An even correction cannot represent an odd residual.
  PolynomialCorrection quad(NonlinearityKind::Quadratic, "m");
  expect_near(quad.fit(d, y).coefficient, 0.0, 1e-12, "quadratic sees no even component");

  PolynomialCorrection none(NonlinearityKind::None, "m");
  none.fit(d, y);
  expect_near(none.apply(1.7), 1.7, 0.0, "none is the identity");

  expect_throws<ValidationError>([&] { (void)cubic.fit({1.0}, {1.0, 2.0}); }, "size mismatch rejected");
}

// ----------------------------- Method B --------------------------------------

std::vector<RecurrentSequence> recurrent_data() {
  Eigen::Matrix2d A;
  A << 0.5, 0.1, 0.0, 0.3;
  const Eigen::Vector2d B(0.4, 0.2);
  const Eigen::Vector2d b(0.05, -0.02);

  Rng64 rng(3);
  std::vector<RecurrentSequence> out(2);
  for (auto& seq : out) {
    Eigen::VectorXd x = Eigen::Vector2d(0.1, -0.1);
    for (int k = 0; k < 200; ++k) {
      const Eigen::VectorXd u = Eigen::VectorXd::Constant(1, rng.uniform(-1.0, 1.0));
      seq.targets.push_back(x);
      seq.inputs.push_back(u);
      x = (A * x + B * u(0) + b).array().tanh().matrix();
    }
  }
  return out;
}

void test_two_phase_recurrent() {
  const std::vector<RecurrentSequence> data = recurrent_data();
  ConvergenceCriterion crit;
  crit.max_epochs = 300;

  RecurrentCorrection untouched(2, 1);
  expect_throws<PrematureRefinementError>([&] { (void)untouched.refine(data, crit, 0.5); },
                                          "refine while UNTRAINED throws");

  ConvergenceCriterion short_run;
  short_run.max_epochs = 1;
  short_run.budget_is_convergence = false;
  RecurrentCorrection early(2, 1);
  (void)early.train_base(data, short_run, 0.5);
  expect_true(early.phase() == RecurrentPhase::Phase1Base && !early.phase1_converged(), "phase 1 not converged");
  expect_throws<PrematureRefinementError>([&] { (void)early.refine(data, crit, 0.5); },
                                          "refine before phase-1 convergence throws");

  RecurrentCorrection rc(2, 1);
  const double l0 = rc.loss(data);
  const TrainingTrace t1 = rc.train_base(data, crit, 0.5);
  expect_true(t1.converged, "phase 1 converged");
  expect_true(rc.B().frozen() && rc.B().value().isZero(0.0), "B held at 0 during phase 1");
  const double l1 = rc.loss(data);
  expect_true(l1 < l0, "phase 1 reduces loss");

  const Eigen::MatrixXd A1 = rc.A().value();
  const Eigen::MatrixXd b1 = rc.b().value();
  (void)rc.refine(data, crit, 0.5);
  expect_true(rc.phase() == RecurrentPhase::Phase2Refined, "phase is PHASE2_REFINED");
  expect_true(rc.A().value() == A1 && rc.b().value() == b1, "refinement leaves A and b bit-identical");
  expect_true(rc.A().frozen() && rc.b().frozen() && !rc.B().frozen(), "A, b frozen; B mutable");
  expect_true(rc.loss(data) <= l1 + 1e-12, "phase 2 does not increase loss");
  expect_true(rc.B().value().norm() > 0.0, "phase 2 learns B");

  expect_throws<FrozenParameterViolation>([&] { (void)rc.train_base(data, crit, 0.5); },
                                          "train_base after refinement throws");

  // A second refinement keeps the phase-1 parameters untouched.
  (void)rc.refine(data, crit, 0.5);
  expect_true(rc.A().value() == A1 && rc.b().value() == b1, "repeated refinement is idempotent on A and b");
}

// ----------------------------- forward model ---------------------------------

// One state x, one control u, one FIR model behind a constant gate of 1.
ForwardModel scalar_plant(double ts, std::vector<FirInput> inputs, const Eigen::VectorXd& theta,
                          bool recurrent = false) {
  ForwardModelSpec spec;
  spec.layout.state_names = {"x"};
  spec.layout.control_names = {"u"};
  spec.integrator.kind = IntegratorKind::Euler;
  spec.integrator.sample_time = ts;
  spec.recurrent_enabled = recurrent;

  std::vector<std::unique_ptr<LocalModel>> models;
  models.push_back(std::make_unique<FirLocalModel>("plant", std::move(inputs)));
  models.front()->parameters()[0]->assign(theta);
  std::vector<Gate> gates;
  gates.push_back(Gate{"g_plant", 0, 0, 1.0, std::make_unique<ConstantGate>(1.0)});
  return ForwardModel(std::move(spec), LocalModelBank(std::move(models)), std::move(gates));
}

void test_recurrent_rollout_state() {
  // Zero FIR weights, so d_k = xr_k with xr_{k+1} = tanh(0.5 xr_k + 0.5).
  ForwardModel fm = scalar_plant(0.1, {FirInput{"u", 1, 1}}, Eigen::VectorXd::Zero(2), true);
  fm.recurrent().groups()[0]->assign(Eigen::MatrixXd::Constant(1, 1, 0.5));
  fm.recurrent().groups()[2]->assign(Eigen::MatrixXd::Constant(1, 1, 0.5));

  const Eigen::VectorXd x0 = Eigen::VectorXd::Constant(1, 1.0);
  const Eigen::VectorXd u0 = Eigen::VectorXd::Zero(1);
  const Trajectory a = fm.predict(std::vector<Eigen::VectorXd>(3, u0), x0);
  const double xr1 = std::tanh(0.5);
  const double xr2 = std::tanh(0.5 * xr1 + 0.5);
  expect_near(a[1](0), 1.0, 0.0, "recurrent state starts at zero");
  expect_near(a[2](0), 1.0 + 0.1 * xr1, 1e-14, "recurrent state carries into step 2");
  expect_near(a[3](0), 1.0 + 0.1 * (xr1 + xr2), 1e-14, "recurrent state carries into step 3");

  RolloutState st = fm.begin(x0);
  fm.step(st, u0);
  fm.step(st, u0);
  expect_true(st.xr(0) != 0.0, "recurrent state is live mid-episode");
  st = fm.begin(x0);
  expect_true(st.xr(0) == 0.0, "begin() resets the recurrent state");
  expect_near(fm.step(st, u0)(0), 1.0, 0.0, "first step of a new episode has no recurrent term");

  const Trajectory b = fm.predict(std::vector<Eigen::VectorXd>(3, u0), x0);
  expect_true(a == b, "each predict() starts a fresh episode");
}

void test_linearize_one_tap() {
  // x' = -2 x + 3 u, Euler at Ts = 0.1: Phi = 1 + Ts a = 0.8, Gamma = Ts b = 0.3.
  Eigen::VectorXd theta(3);
  theta << -2.0, 3.0, 0.0;
  const ForwardModel fm = scalar_plant(0.1, {FirInput{"x", 0, 1}, FirInput{"u", 1, 1}}, theta);
  const LinearizedModel lin = fm.linearize(Eigen::VectorXd::Constant(1, 0.7), Eigen::VectorXd::Constant(1, -0.2));
  expect_true(lin.history_depth == 1 && lin.Phi.rows() == 1 && lin.Phi.cols() == 1 && lin.Gamma.rows() == 1 &&
                  lin.Gamma.cols() == 1,
              "one-tap plant linearizes to a 1x1 system");
  expect_near(lin.Phi(0, 0), 0.8, 1e-8, "Phi = 1 + Ts a");
  expect_near(lin.Gamma(0, 0), 0.3, 1e-8, "Gamma = Ts b");
}

void test_linearize_delayed_taps() {
  // Two taps on x, Euler at Ts = 1: x_{k+1} = -0.5 x_k + 0.6 x_{k-1}.
  // Companion state z = [x_k ; x_{k-1} ; u_{k-1}].
  Eigen::VectorXd theta(3);
  theta << -1.5, 0.6, 0.0;
  const ForwardModel fm = scalar_plant(1.0, {FirInput{"x", 0, 2}}, theta);
  const LinearizedModel lin = fm.linearize(Eigen::VectorXd::Zero(1), Eigen::VectorXd::Zero(1));
  expect_true(lin.history_depth == 2 && lin.state_dim == 1 && lin.Phi.rows() == 3 && lin.Phi.cols() == 3 &&
                  lin.Gamma.rows() == 3 && lin.Gamma.cols() == 1,
              "delayed tap adds one signal block to the state");

  Eigen::MatrixXd Phi(3, 3);
  Phi << -0.5, 0.6, 0.0,
         1.0, 0.0, 0.0,
         0.0, 0.0, 0.0;
  Eigen::MatrixXd Gamma(3, 1);
  Gamma << 0.0, 0.0, 1.0;
  expect_true((lin.Phi - Phi).cwiseAbs().maxCoeff() < 1e-8, "Phi holds the FIR row and the shift register");
  expect_true((lin.Gamma - Gamma).cwiseAbs().maxCoeff() < 1e-8, "Gamma feeds u_k into the delayed block");
}

}  // namespace

int main() {
  run_case("parameter freeze", test_parameter_freeze);
  run_case("superposition", test_superposition);
  run_case("gate functions", test_gate_functions);
  run_case("fir fit", test_fir_fit);
  run_case("polynomial correction", test_polynomial_correction);
  run_case("two-phase recurrent", test_two_phase_recurrent);
  run_case("recurrent rollout state", test_recurrent_rollout_state);
  run_case("linearize one tap", test_linearize_one_tap);
  run_case("linearize delayed taps", test_linearize_delayed_taps);
  return exit_code();
}
