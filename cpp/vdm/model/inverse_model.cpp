#include "vdm/model/inverse_model.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/require.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace vdm::model {

namespace {

Eigen::VectorXd or_default(const Eigen::VectorXd& v, std::size_t n, double fill) {
  if (v.size() == 0) return Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n), fill);
  return v;
}

}  // namespace

// ----------------------------- InverseModel ----------------------------------

InverseModel::InverseModel(std::shared_ptr<const ForwardModel> forward, InverseModelSpec spec)
    : forward_(std::move(forward)), spec_(std::move(spec)) {
  if (!forward_) {
    throw ConfigurationError("InverseModel: no forward model");
  }
  n_ = forward_->state_dim();
  m_ = forward_->control_dim();
  VDM_REQUIRE(m_ >= 1, ConfigurationError, "InverseModel: forward model has no control channels");

  const auto n = static_cast<Eigen::Index>(n_);
  const auto m = static_cast<Eigen::Index>(m_);
  Kr_ = ParameterGroup("inverse.Kr", m, n);
  Kx_ = ParameterGroup("inverse.Kx", m, n);
  Ku_ = ParameterGroup("inverse.Ku", m, m);
  c_ = ParameterGroup("inverse.c", m, 1);

  const bool has_lo = spec_.control_lo.size() != 0;
  const bool has_hi = spec_.control_hi.size() != 0;
  VDM_REQUIRE(!has_lo || spec_.control_lo.size() == m, ValidationError, "InverseModel: control_lo size mismatch");
  VDM_REQUIRE(!has_hi || spec_.control_hi.size() == m, ValidationError, "InverseModel: control_hi size mismatch");
  if (has_lo && has_hi) {
    VDM_REQUIRE((spec_.control_lo.array() <= spec_.control_hi.array()).all(), ValidationError,
                "InverseModel: control_lo must be <= control_hi");
  }

  spec_.loss_weights = or_default(spec_.loss_weights, n_, 1.0);
  spec_.nominal_state = or_default(spec_.nominal_state, n_, 0.0);
  spec_.nominal_control = or_default(spec_.nominal_control, m_, 0.0);
  VDM_REQUIRE(spec_.loss_weights.size() == n && (spec_.loss_weights.array() >= 0.0).all() &&
                  spec_.loss_weights.sum() > 0.0,
              ValidationError, "InverseModel: loss_weights must be >= 0, one per state, not all zero");
  VDM_REQUIRE(spec_.nominal_state.size() == n && spec_.nominal_control.size() == m, ValidationError,
              "InverseModel: nominal operating point dimension mismatch");
}

Eigen::VectorXd InverseModel::flat_parameters() const {
  const auto total = Kr_.size() + Kx_.size() + Ku_.size() + c_.size();
  Eigen::VectorXd theta(total);
  theta << Kr_.flat(), Kx_.flat(), Ku_.flat(), c_.flat();
  return theta;
}

void InverseModel::assign_flat_parameters(const Eigen::VectorXd& theta) {
  const auto total = Kr_.size() + Kx_.size() + Ku_.size() + c_.size();
  VDM_REQUIRE(theta.size() == total, ValidationError, "InverseModel: parameter vector size mismatch");
  Eigen::Index off = 0;
  for (ParameterGroup* g : parameters()) {
    g->assign_flat(theta.segment(off, g->size()));
    off += g->size();
  }
}

Eigen::VectorXd InverseModel::control(const Eigen::VectorXd& r_next, const Eigen::VectorXd& xhat,
                                      const Eigen::VectorXd& u_prev) const {
  VDM_REQUIRE(static_cast<std::size_t>(r_next.size()) == n_ && static_cast<std::size_t>(xhat.size()) == n_ &&
                  static_cast<std::size_t>(u_prev.size()) == m_,
              ValidationError, "InverseModel::control: dimension mismatch");
  Eigen::VectorXd u = Kr_.value() * r_next + Kx_.value() * xhat + Ku_.value() * u_prev + c_.value().col(0);
  VDM_REQUIRE(u.allFinite(), NumericalError, "InverseModel::control: policy output became non-finite");
  if (spec_.control_lo.size() != 0) u = u.cwiseMax(spec_.control_lo);
  if (spec_.control_hi.size() != 0) u = u.cwiseMin(spec_.control_hi);
  return u;
}

InverseRollout InverseModel::rollout(const Trajectory& target, const InitialCondition& ic) const {
  VDM_REQUIRE(static_cast<std::size_t>(ic.previous_control.size()) == m_, ValidationError,
              "InverseModel: previous control dimension mismatch");
  InverseRollout out;
  out.controls.reserve(target.size());
  out.states.reserve(target.size() + 1);

  RolloutState st = forward_->begin(ic.state);
  out.states.push_back(st.x);
  Eigen::VectorXd u_prev = ic.previous_control;
  for (const Eigen::VectorXd& r : target) {
    Eigen::VectorXd u = control(r, st.x, u_prev);
    out.states.push_back(forward_->step(st, u));
    out.controls.push_back(u);
    u_prev = std::move(u);
  }
  return out;
}

std::vector<Eigen::VectorXd> InverseModel::predict(const Trajectory& target, const InitialCondition& ic) const {
  return rollout(target, ic).controls;
}

double InverseModel::tracking_loss(const Trajectory& target, const InitialCondition& ic) const {
  if (target.empty()) return 0.0;
  const InverseRollout ro = rollout(target, ic);
  double sse = 0.0;
  for (std::size_t k = 0; k < target.size(); ++k) {
    sse += (target[k] - ro.states[k + 1]).cwiseAbs2().dot(spec_.loss_weights);
  }
  return sse / static_cast<double>(target.size() * n_);
}

InverseSequence make_inverse_sequence(const data::Episode& e) {
  VDM_REQUIRE(e.size() >= 2, ValidationError, "episode '" + e.id() + "': need at least 2 samples");
  InverseSequence seq;
  seq.initial.state = e[0].x;
  seq.initial.previous_control = e[0].u;
  for (std::size_t k = 0; k + 1 < e.size(); ++k) {
    seq.target.push_back(e[k + 1].x);
    seq.recorded.push_back(e[k].u);
  }
  return seq;
}

// ----------------------------- InverseModelTrainer ---------------------------

InverseModelTrainer::InverseModelTrainer(TrainingSettings training, NumericalSettings numerics)
    : training_(training), numerics_(numerics) {
  training_.validate_or_throw();
  numerics_.validate_or_throw();
}

void InverseModelTrainer::require_frozen_forward(const InverseModel& inverse) const {
  const ForwardModel& fm = inverse.forward();
  if (!fm.frozen() || !all_frozen(fm.parameters())) {
    throw ConfigurationError(std::string("InverseModelTrainer: forward model must be trained and frozen (stage ") +
                             to_string(fm.stage()) + ")");
  }
}

double InverseModelTrainer::direct_inverse_init(InverseModel& inverse, const std::vector<InverseSequence>& data) const {
  const auto n = static_cast<Eigen::Index>(inverse.state_dim());
  const auto m = static_cast<Eigen::Index>(inverse.control_dim());
  const Eigen::Index p = 2 * n + m + 1;

  std::size_t rows = 0;
  for (const auto& s : data) rows += s.recorded.size();
  VDM_REQUIRE(rows > 0, ValidationError, "InverseModelTrainer: no recorded controls");

  Eigen::MatrixXd X(static_cast<Eigen::Index>(rows), p);
  Eigen::MatrixXd U(static_cast<Eigen::Index>(rows), m);
  Eigen::Index k = 0;
  for (const auto& s : data) {
    Eigen::VectorXd x = s.initial.state;
    Eigen::VectorXd u_prev = s.initial.previous_control;
    for (std::size_t j = 0; j < s.recorded.size(); ++j, ++k) {
      X.row(k) << s.target[j].transpose(), x.transpose(), u_prev.transpose(), 1.0;
      U.row(k) = s.recorded[j].transpose();
      x = s.target[j];
      u_prev = s.recorded[j];
    }
  }

  Eigen::MatrixXd A = X.transpose() * X;
  A.diagonal().array() += std::max(training_.inverse_ridge, 1e-12) * static_cast<double>(rows);
  Eigen::LDLT<Eigen::MatrixXd> ldlt(A);
  VDM_REQUIRE(ldlt.info() == Eigen::Success, NumericalError, "InverseModelTrainer: direct-inverse factorization failed");
  const Eigen::MatrixXd Theta = ldlt.solve(X.transpose() * U);  // p x m
  VDM_REQUIRE(Theta.allFinite(), NumericalError, "InverseModelTrainer: non-finite direct-inverse solution");

  auto groups = inverse.parameters();
  groups[0]->assign(Theta.middleRows(0, n).transpose());
  groups[1]->assign(Theta.middleRows(n, n).transpose());
  groups[2]->assign(Theta.middleRows(2 * n, m).transpose());
  groups[3]->assign(Theta.row(p - 1).transpose());

  const Eigen::MatrixXd E = U - X * Theta;
  return std::sqrt(E.squaredNorm() / static_cast<double>(E.size()));
}

double InverseModelTrainer::objective(const InverseModel& inverse, const std::vector<InverseSequence>& data) const {
  VDM_REQUIRE(!data.empty(), ValidationError, "InverseModelTrainer: no training sequences");
  double total = 0.0;
  for (const auto& s : data) total += inverse.tracking_loss(s.target, s.initial);
  return total / static_cast<double>(data.size()) + training_.inverse_ridge * inverse.flat_parameters().squaredNorm();
}

InverseTrainingReport InverseModelTrainer::train(InverseModel& inverse, const std::vector<data::Episode>& corpus,
                                                 bool freeze) const {
  require_frozen_forward(inverse);
  if (inverse.frozen()) {
    throw FrozenParameterViolation("InverseModelTrainer: inverse model is frozen");
  }
  const auto t0 = std::chrono::steady_clock::now();

  std::vector<InverseSequence> data;
  for (const data::Episode& e : corpus) {
    VDM_REQUIRE(e.state_dim() == inverse.state_dim() && e.control_dim() == inverse.control_dim(), ValidationError,
                "InverseModelTrainer: episode '" + e.id() + "' dimensions do not match the model");
    if (e.size() < 2) continue;
    data.push_back(make_inverse_sequence(e));
  }
  VDM_REQUIRE(!data.empty(), ValidationError, "InverseModelTrainer: corpus has no usable episode");

  InverseTrainingReport report;
  report.sequences = data.size();
  if (training_.inverse_direct_init) {
    report.direct_init_rmse = direct_inverse_init(inverse, data);
    report.direct_init = true;
  }

  // Trial evaluations run on a copy so the model only ever holds accepted
  // parameters. A diverging trial rollout counts as an infinite loss: the
  // policy or the forward state overflows (NumericalError), or the
  // reconstructed state leaves every fuzzy region (DegenerateEncodingError).
  InverseModel trial = inverse;
  auto eval = [&](const Eigen::VectorXd& theta) {
    trial.assign_flat_parameters(theta);
    try {
      return objective(trial, data);
    } catch (const NumericalError&) {
      return std::numeric_limits<double>::infinity();
    } catch (const DegenerateEncodingError&) {
      return std::numeric_limits<double>::infinity();
    }
  };

  ConvergenceCriterion crit;
  crit.max_epochs = static_cast<std::size_t>(training_.inverse_epochs);
  crit.rel_tol = training_.recurrent_rel_tol;
  crit.patience = static_cast<std::size_t>(training_.recurrent_patience);

  Eigen::VectorXd theta = inverse.flat_parameters();
  double current = eval(theta);
  if (!is_finite(current)) {
    log(LogLevel::WARN, "inverse", "initial policy diverges in closed loop; restarting from zero gains");
    theta.setZero();
    inverse.assign_flat_parameters(theta);
    current = eval(theta);
  }
  report.initial_loss = current;
  report.trace.loss.push_back(current);
  report.trace.stop_reason = "epoch budget";

  for (int epoch = 0; epoch < training_.inverse_epochs; ++epoch) {
    Eigen::VectorXd grad(theta.size());
    for (Eigen::Index j = 0; j < theta.size(); ++j) {
      const double h = numerics_.fd_step * std::max(1.0, std::fabs(theta(j)));
      Eigen::VectorXd tp = theta, tm = theta;
      tp(j) += h;
      tm(j) -= h;
      const double lp = eval(tp);
      const double lm = eval(tm);
      grad(j) = (is_finite(lp) && is_finite(lm)) ? (lp - lm) / (2.0 * h) : 0.0;
    }
    if (grad.squaredNorm() == 0.0) {
      report.trace.stop_reason = "zero gradient";
      break;
    }

    double step = training_.inverse_learning_rate;
    bool accepted = false;
    for (int bt = 0; bt < 30; ++bt, step *= 0.5) {
      const Eigen::VectorXd cand = theta - step * grad;
      const double l = eval(cand);
      if (l < current) {
        theta = cand;
        current = l;
        accepted = true;
        break;
      }
    }
    report.trace.epochs = static_cast<std::size_t>(epoch + 1);
    if (!accepted) {
      report.trace.stop_reason = "no descent step";
      break;
    }
    inverse.assign_flat_parameters(theta);
    report.trace.loss.push_back(current);
    if (crit.should_stop(report.trace.loss)) {
      report.trace.stop_reason = "plateau";
      break;
    }
  }

  // A stalled line search is not convergence; the budget counts only when
  // the criterion says so.
  const std::string& why = report.trace.stop_reason;
  report.trace.converged = why == "plateau" || why == "zero gradient" ||
                           (why == "epoch budget" && crit.budget_is_convergence);

  report.final_loss = current;
  if (freeze) inverse.freeze();
  report.wall_time_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

  std::ostringstream oss;
  oss << "inverse trained on " << report.sequences << " sequences: loss " << report.initial_loss << " -> "
      << report.final_loss << " (" << report.trace.stop_reason << ", " << report.trace.epochs << " epochs)";
  log(LogLevel::INFO, "inverse", oss.str());
  return report;
}

}  // namespace vdm::model
