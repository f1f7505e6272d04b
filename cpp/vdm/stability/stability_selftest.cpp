/*
  Fragment 7.2 - Stability Analyzer Selftest

  Checks the pole test |p| < 1 - margin and the closed-loop assembly of a
  linearized plant with inverse-model gains. Unstable verdicts must carry
  a warning listing the offending poles and must never throw. A forward
  model with delayed FIR taps is checked end to end against the poles of
  its hand-derived characteristic polynomial.

  Non-zero return code indicates failure.
*/

#include "vdm/core/errors.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/selftest.hpp"
#include "vdm/model/gate.hpp"
#include "vdm/model/local_model.hpp"
#include "vdm/stability/stability.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <complex>
#include <limits>
#include <memory>
#include <vector>

using namespace vdm;
using namespace vdm::stability;
using namespace vdm::selftest;

namespace {

void test_matrix_poles() {
  const StabilityAnalyzer an;
  const StabilityReport ok = an.check_matrix(0.5 * Eigen::MatrixXd::Identity(2, 2));
  expect_true(ok.stable() && !ok.warning, "poles at 0.5 are stable");
  expect_near(ok.spectral_radius, 0.5, 1e-12, "spectral radius 0.5");
  expect_true(ok.poles.size() == 2, "one pole per state");

  Eigen::MatrixXd A = Eigen::MatrixXd::Zero(2, 2);
  A(0, 0) = 1.2;
  A(1, 1) = 0.3;
  const StabilityReport bad = an.check_matrix(A);
  expect_true(!bad.stable(), "pole at 1.2 is unstable");
  expect_true(bad.warning.has_value() && bad.warning->offending_poles.size() == 1, "warning lists one pole");
  expect_near(std::abs(bad.warning->offending_poles.front()), 1.2, 1e-12, "offending pole is 1.2");
  expect_near(std::abs(bad.poles.front()), 1.2, 1e-12, "poles sorted by magnitude");

  // Complex pair on the unit circle.
  Eigen::MatrixXd R(2, 2);
  R << 0.0, -1.0, 1.0, 0.0;
  expect_true(!an.check_matrix(R).stable(), "|p| = 1 is not stable");
}

void test_margin() {
  const std::vector<std::complex<double>> poles = {{0.95, 0.0}, {0.2, 0.1}};
  expect_true(StabilityAnalyzer(0.0).check_poles(poles).stable(), "0.95 stable with margin 0");
  const StabilityReport r = StabilityAnalyzer(0.1).check_poles(poles);
  expect_true(!r.stable() && r.warning->offending_poles.size() == 1, "0.95 unstable with margin 0.1");
  expect_near(r.margin, 0.1, 0.0, "report carries the margin");

  expect_throws<ValidationError>([] { StabilityAnalyzer a(1.0); }, "margin 1 rejected");
  expect_throws<ValidationError>([] { StabilityAnalyzer a(-0.1); }, "negative margin rejected");

  const std::vector<std::complex<double>> nan_pole = {{std::numeric_limits<double>::quiet_NaN(), 0.0}};
  expect_throws<NumericalError>([&] { (void)StabilityAnalyzer().check_poles(nan_pole); }, "NaN pole rejected");
}

void test_closed_loop() {
  model::LinearizedModel lin;
  lin.Phi = Eigen::MatrixXd::Constant(1, 1, 0.9);
  lin.Gamma = Eigen::MatrixXd::Constant(1, 1, 1.0);
  lin.state_dim = 1;
  const Eigen::MatrixXd Ku = Eigen::MatrixXd::Zero(1, 1);

  const StabilityAnalyzer an;
  const StabilityReport damped =
      an.check_matrix(StabilityAnalyzer::closed_loop_matrix(lin, Eigen::MatrixXd::Constant(1, 1, -0.5), Ku));
  expect_true(damped.stable(), "negative feedback stabilizes");
  expect_near(damped.spectral_radius, 0.4, 1e-12, "closed-loop pole at 0.9 - 0.5");

  const StabilityReport pushed =
      an.check_matrix(StabilityAnalyzer::closed_loop_matrix(lin, Eigen::MatrixXd::Constant(1, 1, 0.5), Ku));
  expect_true(!pushed.stable(), "positive feedback destabilizes");
  expect_near(pushed.spectral_radius, 1.4, 1e-12, "closed-loop pole at 0.9 + 0.5");

  expect_throws<ValidationError>(
      [&] { (void)StabilityAnalyzer::closed_loop_matrix(lin, Eigen::MatrixXd::Zero(2, 1), Ku); },
      "gain shape mismatch rejected");
}

// x_{k+1} = (1 + w0) x_k + w1 x_{k-1}: two FIR taps on x, Euler at Ts = 1.
std::shared_ptr<const model::ForwardModel> delayed_plant(double w0, double w1) {
  model::ForwardModelSpec spec;
  spec.layout.state_names = {"x"};
  spec.layout.control_names = {"u"};
  spec.integrator.sample_time = 1.0;

  std::vector<std::unique_ptr<model::LocalModel>> models;
  models.push_back(std::make_unique<model::FirLocalModel>(
      "lagged", std::vector<model::FirInput>{model::FirInput{"x", 0, 2}}));
  Eigen::MatrixXd theta(3, 1);
  theta << w0, w1, 0.0;
  models.front()->parameters()[0]->assign(theta);
  std::vector<model::Gate> gates;
  gates.push_back(model::Gate{"g_lagged", 0, 0, 1.0, std::make_unique<model::ConstantGate>(1.0)});
  return std::make_shared<const model::ForwardModel>(std::move(spec), model::LocalModelBank(std::move(models)),
                                                     std::move(gates));
}

void test_delayed_forward_loop() {
  const StabilityAnalyzer an;

  // z^2 + 0.5 z - 0.6: poles 0.564 and -1.064.
  const auto diverging = delayed_plant(-1.5, 0.6);
  const model::InverseModel open_loop(diverging);
  const StabilityReport r = an.check(open_loop);
  const double root = std::sqrt(0.25 + 2.4);
  expect_true(!r.stable(), "delayed taps with a pole at -1.064 are unstable");
  expect_near(r.spectral_radius, 0.5 * (0.5 + root), 1e-6, "spectral radius from the characteristic polynomial");
  expect_true(r.warning.has_value() && r.warning->offending_poles.size() == 1, "only the outer pole offends");
  expect_near(r.poles.front().real(), -0.5 * (0.5 + root), 1e-6, "dominant pole is real and negative");

  const model::Trajectory run = diverging->predict(std::vector<Eigen::VectorXd>(60, Eigen::VectorXd::Zero(1)),
                                                   Eigen::VectorXd::Constant(1, 1.0));
  expect_true(std::fabs(run.back()(0)) > 5.0, "free run from x0 = 1 diverges as the poles predict");

  // z^2 - 0.5 z - 0.2: poles 0.762 and -0.262.
  const auto settling = delayed_plant(-0.5, 0.2);
  const StabilityReport ok = an.check(model::InverseModel(settling));
  expect_true(ok.stable(), "delayed taps with poles inside the unit circle are stable");
  expect_near(ok.spectral_radius, 0.5 * (0.5 + std::sqrt(0.25 + 0.8)), 1e-6, "stable spectral radius");
}

}  // namespace

int main() {
  set_log_level(LogLevel::ERROR);
  run_case("matrix poles", test_matrix_poles);
  run_case("margin", test_margin);
  run_case("closed loop", test_closed_loop);
  run_case("delayed forward loop", test_delayed_forward_loop);
  return exit_code();
}
