#include "vdm/model/nonlinearity.hpp"

#include "vdm/core/logging.hpp"
#include "vdm/core/require.hpp"

#include <cmath>
#include <sstream>

namespace vdm::model {

const char* to_string(NonlinearityKind k) noexcept {
  switch (k) {
    case NonlinearityKind::None: return "none";
    case NonlinearityKind::Bias: return "bias";
    case NonlinearityKind::Quadratic: return "quadratic";
    case NonlinearityKind::Cubic: return "cubic";
    default: return "none";
  }
}

bool parse_nonlinearity_kind(const std::string& s, NonlinearityKind* out) noexcept {
  if (!out) return false;
  if (s == "none") { *out = NonlinearityKind::None; return true; }
  if (s == "bias") { *out = NonlinearityKind::Bias; return true; }
  if (s == "quadratic") { *out = NonlinearityKind::Quadratic; return true; }
  if (s == "cubic") { *out = NonlinearityKind::Cubic; return true; }
  return false;
}

const char* to_string(RecurrentPhase p) noexcept {
  switch (p) {
    case RecurrentPhase::Untrained: return "UNTRAINED";
    case RecurrentPhase::Phase1Base: return "PHASE1_BASE";
    case RecurrentPhase::Phase2Refined: return "PHASE2_REFINED";
    default: return "UNTRAINED";
  }
}

// ----------------------------- PolynomialCorrection --------------------------

PolynomialCorrection::PolynomialCorrection(NonlinearityKind kind, const std::string& owner)
    : kind_(kind), param_(owner.empty() ? std::string("correction") : owner + ".correction", 1, 1, 0.0) {}

double PolynomialCorrection::basis(double d) const noexcept {
  switch (kind_) {
    case NonlinearityKind::Bias: return 1.0;
    case NonlinearityKind::Quadratic: return d * d;
    case NonlinearityKind::Cubic: return d * d * d;
    case NonlinearityKind::None:
    default: return 0.0;
  }
}

PolynomialFit PolynomialCorrection::fit(const std::vector<double>& deltas, const std::vector<double>& targets) {
  VDM_REQUIRE(deltas.size() == targets.size(), ValidationError, "PolynomialCorrection::fit: size mismatch");
  std::vector<double> q(deltas.size());
  std::vector<double> r(deltas.size());
  for (std::size_t k = 0; k < deltas.size(); ++k) {
    q[k] = basis(deltas[k]);
    r[k] = targets[k] - deltas[k];
  }
  return fit_regression(q, r);
}

PolynomialFit PolynomialCorrection::fit_regression(const std::vector<double>& q, const std::vector<double>& r) {
  VDM_REQUIRE(q.size() == r.size(), ValidationError, "PolynomialCorrection::fit_regression: size mismatch");

  PolynomialFit out;
  out.samples = q.size();
  if (kind_ == NonlinearityKind::None || q.empty()) {
    param_.set(0, 0, 0.0);
    return out;
  }

  double sqq = 0.0, sqr = 0.0, srr = 0.0;
  for (std::size_t k = 0; k < q.size(); ++k) {
    VDM_REQUIRE(is_finite(q[k]) && is_finite(r[k]), NumericalError,
                "PolynomialCorrection: non-finite regression sample");
    sqq += q[k] * q[k];
    sqr += q[k] * r[k];
    srr += r[k] * r[k];
  }

  const double a = safe_div(sqr, sqq, 0.0);
  param_.set(0, 0, a);

  const double n = static_cast<double>(q.size());
  const double sse_after = std::fmax(0.0, srr - 2.0 * a * sqr + a * a * sqq);
  out.coefficient = a;
  out.rms_before = std::sqrt(srr / n);
  out.rms_after = std::sqrt(sse_after / n);
  return out;
}

void PolynomialCorrection::reset() {
  param_.set(0, 0, 0.0);
}

// ----------------------------- ConvergenceCriterion --------------------------

bool ConvergenceCriterion::should_stop(const std::vector<double>& h) const {
  if (h.empty()) return false;
  if (custom) return custom(h);
  if (h.back() <= 0.0) return true;
  if (h.size() <= patience) return false;

  for (std::size_t i = h.size() - patience; i < h.size(); ++i) {
    const double prev = h[i - 1];
    const double cur = h[i];
    const double rel = safe_div(prev - cur, std::fabs(prev), 0.0);
    if (rel >= rel_tol) return false;
  }
  return true;
}

void ConvergenceCriterion::validate() const {
  VDM_REQUIRE(max_epochs >= 1, ValidationError, "ConvergenceCriterion: max_epochs must be >= 1");
  VDM_REQUIRE(is_finite(rel_tol) && rel_tol >= 0.0, ValidationError, "ConvergenceCriterion: rel_tol must be >= 0");
  VDM_REQUIRE(patience >= 1, ValidationError, "ConvergenceCriterion: patience must be >= 1");
}

// ----------------------------- RecurrentCorrection ---------------------------

RecurrentCorrection::RecurrentCorrection(std::size_t state_dim, std::size_t input_dim, const std::string& owner)
    : A_(owner + ".A", static_cast<Eigen::Index>(state_dim), static_cast<Eigen::Index>(state_dim)),
      B_(owner + ".B", static_cast<Eigen::Index>(state_dim), static_cast<Eigen::Index>(input_dim)),
      b_(owner + ".b", static_cast<Eigen::Index>(state_dim), 1) {
  VDM_REQUIRE(state_dim >= 1, ValidationError, "RecurrentCorrection: state_dim must be >= 1");
}

Eigen::VectorXd RecurrentCorrection::next_state(const Eigen::VectorXd& x, const Eigen::VectorXd& u) const {
  const Eigen::VectorXd pre = A_.value() * x + B_.value() * u + b_.value().col(0);
  return pre.array().tanh().matrix();
}

void RecurrentCorrection::validate_data(const std::vector<RecurrentSequence>& data) const {
  VDM_REQUIRE(!data.empty(), ValidationError, "RecurrentCorrection: no training sequences");
  for (const auto& seq : data) {
    VDM_REQUIRE(seq.targets.size() == seq.inputs.size(), ValidationError,
                "RecurrentCorrection: targets/inputs length mismatch");
    for (std::size_t k = 0; k < seq.targets.size(); ++k) {
      VDM_REQUIRE(static_cast<std::size_t>(seq.targets[k].size()) == state_dim(), ValidationError,
                  "RecurrentCorrection: target dimension mismatch");
      VDM_REQUIRE(static_cast<std::size_t>(seq.inputs[k].size()) == input_dim(), ValidationError,
                  "RecurrentCorrection: input dimension mismatch");
    }
  }
}

double RecurrentCorrection::gradients(const std::vector<RecurrentSequence>& data,
                                      Eigen::MatrixXd* gA, Eigen::MatrixXd* gB, Eigen::VectorXd* gb) const {
  const Eigen::Index n = A_.rows();
  if (gA) gA->setZero(n, n);
  if (gB) gB->setZero(n, B_.cols());
  if (gb) gb->setZero(n);

  double sse = 0.0;
  std::size_t count = 0;
  for (const auto& seq : data) {
    for (std::size_t k = 0; k + 1 < seq.targets.size(); ++k) {
      const Eigen::VectorXd xhat = next_state(seq.targets[k], seq.inputs[k]);
      const Eigen::VectorXd err = xhat - seq.targets[k + 1];
      sse += err.squaredNorm();
      ++count;
      if (!gA && !gB && !gb) continue;
      // d(err^2)/d(pre) = 2 err * (1 - xhat^2)
      const Eigen::VectorXd dpre = 2.0 * err.cwiseProduct((1.0 - xhat.array().square()).matrix());
      if (gA) gA->noalias() += dpre * seq.targets[k].transpose();
      if (gB) gB->noalias() += dpre * seq.inputs[k].transpose();
      if (gb) *gb += dpre;
    }
  }

  VDM_REQUIRE(count > 0, ValidationError, "RecurrentCorrection: sequences need at least 2 samples");
  const double inv = 1.0 / static_cast<double>(count);
  if (gA) *gA *= inv;
  if (gB) *gB *= inv;
  if (gb) *gb *= inv;
  const double l = sse * inv;
  VDM_REQUIRE(is_finite(l), NumericalError, "RecurrentCorrection: loss became non-finite");
  return l;
}

double RecurrentCorrection::loss(const std::vector<RecurrentSequence>& data) const {
  validate_data(data);
  return gradients(data, nullptr, nullptr, nullptr);
}

TrainingTrace RecurrentCorrection::run(const std::vector<RecurrentSequence>& data,
                                       const ConvergenceCriterion& criterion,
                                       double learning_rate, bool base_phase) {
  TrainingTrace tr;
  Eigen::MatrixXd gA, gB;
  Eigen::VectorXd gb;

  for (std::size_t epoch = 0; epoch < criterion.max_epochs; ++epoch) {
    const double l = base_phase ? gradients(data, &gA, nullptr, &gb)
                                : gradients(data, nullptr, &gB, nullptr);
    tr.loss.push_back(l);
    tr.epochs = epoch + 1;
    if (criterion.should_stop(tr.loss)) {
      tr.converged = true;
      tr.stop_reason = "plateau";
      return tr;
    }
    if (base_phase) {
      A_.add_scaled(gA, -learning_rate);
      b_.add_scaled(gb, -learning_rate);
    } else {
      B_.add_scaled(gB, -learning_rate);
    }
  }

  tr.loss.push_back(gradients(data, nullptr, nullptr, nullptr));
  tr.converged = criterion.budget_is_convergence;
  tr.stop_reason = "epoch budget";
  return tr;
}

TrainingTrace RecurrentCorrection::train_base(const std::vector<RecurrentSequence>& data,
                                              const ConvergenceCriterion& criterion,
                                              double learning_rate) {
  if (phase_ == RecurrentPhase::Phase2Refined) {
    throw FrozenParameterViolation("RecurrentCorrection: A and b are frozen after refinement");
  }
  criterion.validate();
  VDM_REQUIRE(is_finite(learning_rate) && learning_rate > 0.0, ValidationError,
              "RecurrentCorrection: learning_rate must be > 0");
  validate_data(data);

  if (phase_ == RecurrentPhase::Untrained) {
    B_.unfreeze();
    B_.assign(Eigen::MatrixXd::Zero(B_.rows(), B_.cols()));
    B_.freeze();
    phase_ = RecurrentPhase::Phase1Base;
  }

  TrainingTrace tr = run(data, criterion, learning_rate, true);
  phase1_converged_ = phase1_converged_ || tr.converged;

  std::ostringstream oss;
  oss << "phase-1 " << tr.stop_reason << " after " << tr.epochs << " epochs, loss "
      << tr.loss.front() << " -> " << tr.loss.back();
  log(LogLevel::DEBUG, "recurrent", oss.str());
  return tr;
}

TrainingTrace RecurrentCorrection::refine(const std::vector<RecurrentSequence>& data,
                                          const ConvergenceCriterion& criterion,
                                          double learning_rate) {
  if (phase_ == RecurrentPhase::Untrained) {
    throw PrematureRefinementError("RecurrentCorrection: refine requested while UNTRAINED");
  }
  if (phase_ == RecurrentPhase::Phase1Base && !phase1_converged_) {
    throw PrematureRefinementError("RecurrentCorrection: refine requested before phase-1 convergence");
  }
  criterion.validate();
  VDM_REQUIRE(is_finite(learning_rate) && learning_rate > 0.0, ValidationError,
              "RecurrentCorrection: learning_rate must be > 0");
  validate_data(data);

  if (phase_ == RecurrentPhase::Phase1Base) {
    A_.freeze();
    b_.freeze();
    B_.unfreeze();
    phase_ = RecurrentPhase::Phase2Refined;
  }

  TrainingTrace tr = run(data, criterion, learning_rate, false);

  std::ostringstream oss;
  oss << "phase-2 " << tr.stop_reason << " after " << tr.epochs << " epochs, loss "
      << tr.loss.front() << " -> " << tr.loss.back();
  log(LogLevel::DEBUG, "recurrent", oss.str());
  return tr;
}

}  // namespace vdm::model
