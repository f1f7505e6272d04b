#include "vdm/model/forward_model.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/require.hpp"
#include "vdm/data/episode.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace vdm::model {

const char* to_string(ForwardStage s) noexcept {
  switch (s) {
    case ForwardStage::Untrained: return "UNTRAINED";
    case ForwardStage::Trained: return "TRAINED";
    case ForwardStage::Frozen: return "FROZEN";
    default: return "UNTRAINED";
  }
}

void ForwardModelSpec::validate() const {
  layout.validate();
  integrator.validate(layout.state_dim());
  friction.validate(layout.signal_dim(), layout.state_dim());
  numerics.validate_or_throw();
  for (std::size_t v = 0; v < variables.size(); ++v) {
    const auto& ov = variables[v];
    VDM_REQUIRE(!ov.name.empty(), ValidationError, "operating variable with empty name");
    VDM_REQUIRE(ov.channel < layout.signal_dim(), ValidationError,
                "operating variable '" + ov.name + "': unknown channel");
    ov.set.validate();
    for (std::size_t w = 0; w < v; ++w) {
      VDM_REQUIRE(variables[w].name != ov.name, ValidationError,
                  "duplicate operating variable '" + ov.name + "'");
    }
  }
  if (recurrent_scale.size() != 0) {
    VDM_REQUIRE(static_cast<std::size_t>(recurrent_scale.size()) == layout.state_dim(), ValidationError,
                "recurrent scale must have one entry per state channel");
    VDM_REQUIRE(recurrent_scale.allFinite() && (recurrent_scale.array() > 0.0).all(), ValidationError,
                "recurrent scale entries must be > 0");
  }
}

// ----------------------------- construction ----------------------------------

ForwardModel::ForwardModel(ForwardModelSpec spec, LocalModelBank bank, std::vector<Gate> gates)
    : spec_(std::move(spec)),
      bank_(std::move(bank)),
      gates_(std::move(gates)),
      encoder_(spec_.numerics.partition_tol) {
  spec_.validate();
  VDM_REQUIRE(bank_.size() > 0, ValidationError, "ForwardModel: empty local model bank");
  VDM_REQUIRE(!gates_.empty(), ValidationError, "ForwardModel: no gates");

  const std::size_t n = spec_.layout.state_dim();
  std::vector<std::size_t> uses(bank_.size(), 0);
  for (std::size_t i = 0; i < gates_.size(); ++i) {
    const Gate& g = gates_[i];
    g.validate();
    VDM_REQUIRE(g.output < n, ValidationError, "gate '" + g.name + "': output channel out of range");
    VDM_REQUIRE(g.model_index < bank_.size(), ValidationError, "gate '" + g.name + "': model index out of range");
    ++uses[g.model_index];
    for (std::size_t j = 0; j < i; ++j) {
      VDM_REQUIRE(gates_[j].name != g.name, ValidationError, "duplicate gate name '" + g.name + "'");
    }
    if (const auto* mg = dynamic_cast<const MembershipGate*>(g.phi.get())) {
      VDM_REQUIRE(mg->variable() < spec_.variables.size(), ValidationError,
                  "gate '" + g.name + "': unknown operating variable");
      VDM_REQUIRE(mg->member() < spec_.variables[mg->variable()].set.functions.size(), ValidationError,
                  "gate '" + g.name + "': unknown membership function");
    }
  }
  for (std::size_t m = 0; m < uses.size(); ++m) {
    VDM_REQUIRE(uses[m] == 1, ValidationError,
                "local model '" + bank_.get(m).name() + "' must be referenced by exactly one gate");
  }

  scale_ = spec_.recurrent_scale.size() == 0 ? Eigen::VectorXd::Ones(static_cast<Eigen::Index>(n))
                                             : spec_.recurrent_scale;
  if (spec_.recurrent_enabled) {
    recurrent_ = RecurrentCorrection(n, spec_.layout.control_dim(), "recurrent");
  }
  index_gates();
}

void ForwardModel::index_gates() {
  by_output_.assign(spec_.layout.state_dim(), {});
  for (const Gate& g : gates_) by_output_[g.output].push_back(&g);
}

ForwardModel ForwardModel::clone() const {
  std::vector<Gate> gates;
  gates.reserve(gates_.size());
  for (const Gate& g : gates_) gates.push_back(g.clone());
  ForwardModel copy(spec_, bank_.clone(), std::move(gates));
  copy.recurrent_ = recurrent_;
  copy.stage_ = stage_;
  return copy;
}

void ForwardModel::mark_trained() {
  if (stage_ == ForwardStage::Frozen) {
    throw FrozenParameterViolation("ForwardModel: already frozen");
  }
  stage_ = ForwardStage::Trained;
}

void ForwardModel::freeze() noexcept {
  freeze_all(parameters());
  stage_ = ForwardStage::Frozen;
}

Gate& ForwardModel::gate(std::size_t i) {
  VDM_REQUIRE(i < gates_.size(), ValidationError, "ForwardModel: gate index out of range");
  return gates_[i];
}

const std::vector<const Gate*>& ForwardModel::gates_for_output(std::size_t o) const {
  VDM_REQUIRE(o < by_output_.size(), ValidationError, "ForwardModel: output index out of range");
  return by_output_[o];
}

std::vector<ParameterGroup*> ForwardModel::parameters() {
  std::vector<ParameterGroup*> out = bank_.parameters();
  for (Gate& g : gates_) {
    if (ParameterGroup* p = g.phi->parameters()) out.push_back(p);
  }
  if (spec_.recurrent_enabled) {
    for (ParameterGroup* p : recurrent_.groups()) out.push_back(p);
  }
  return out;
}

std::vector<const ParameterGroup*> ForwardModel::parameters() const {
  std::vector<const ParameterGroup*> out = bank_.parameters();
  for (const Gate& g : gates_) {
    const GateFunction& phi = *g.phi;
    if (const ParameterGroup* p = phi.parameters()) out.push_back(p);
  }
  if (spec_.recurrent_enabled) {
    const RecurrentCorrection& rc = recurrent_;
    for (const ParameterGroup* p : rc.groups()) out.push_back(p);
  }
  return out;
}

// ----------------------------- building blocks -------------------------------

void ForwardModel::encode_operating(const Eigen::VectorXd& signal, std::vector<std::vector<double>>& out) const {
  out.resize(spec_.variables.size());
  for (std::size_t v = 0; v < spec_.variables.size(); ++v) {
    const auto& ov = spec_.variables[v];
    encoder_.encode_into(signal(static_cast<Eigen::Index>(ov.channel)), ov.set, out[v]);
  }
}

void ForwardModel::compute_features(const SignalHistory& h, std::vector<Eigen::VectorXd>& out) const {
  out.resize(bank_.size());
  for (std::size_t m = 0; m < bank_.size(); ++m) bank_.get(m).features(h, out[m]);
}

// ----------------------------- inference -------------------------------------

RolloutState ForwardModel::begin(const Eigen::VectorXd& x0) const {
  VDM_REQUIRE(static_cast<std::size_t>(x0.size()) == state_dim(), ValidationError,
              "ForwardModel: initial state dimension mismatch");
  VDM_REQUIRE(x0.allFinite(), ValidationError, "ForwardModel: non-finite initial state");
  RolloutState st;
  st.history = SignalHistory(bank_.max_history_depth(), spec_.layout.signal_dim());
  st.x = x0;
  st.xr = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(state_dim()));
  return st;
}

const Eigen::VectorXd& ForwardModel::step(RolloutState& st, const Eigen::VectorXd& u, StepBreakdown* breakdown) const {
  VDM_REQUIRE(static_cast<std::size_t>(u.size()) == control_dim(), ValidationError,
              "ForwardModel: control dimension mismatch");
  VDM_REQUIRE(u.allFinite(), ValidationError, "ForwardModel: non-finite control");

  const Eigen::VectorXd s = spec_.layout.signal(st.x, u);
  st.history.push(s);
  encode_operating(s, st.activations);
  compute_features(st.history, st.features);

  const GateContext ctx{&st.activations, &s};
  const std::size_t n = state_dim();
  Eigen::VectorXd d(static_cast<Eigen::Index>(n));
  if (breakdown) breakdown->outputs.clear();
  for (std::size_t o = 0; o < n; ++o) {
    if (breakdown) {
      breakdown->outputs.push_back(combiner_.combine(by_output_[o], bank_, ctx, st.features));
      d(static_cast<Eigen::Index>(o)) = breakdown->outputs.back().total;
    } else {
      d(static_cast<Eigen::Index>(o)) = combiner_.total(by_output_[o], bank_, ctx, st.features);
    }
  }
  if (breakdown) breakdown->combined = d;

  if (spec_.friction.enabled) {
    spec_.friction.saturate(d, s);
    if (breakdown) breakdown->mu_eff = spec_.friction.mu_eff(s);
  }

  if (spec_.recurrent_enabled) {
    d += scale_.cwiseProduct(st.xr);
    st.xr = recurrent_.next_state(st.xr, u);
  }
  if (breakdown) breakdown->derivative = d;

  Eigen::VectorXd next = spec_.integrator.step(st.x, d);
  VDM_REQUIRE(next.allFinite(), NumericalError, "ForwardModel: prediction became non-finite");
  st.x = std::move(next);
  ++st.steps;
  return st.x;
}

Trajectory ForwardModel::predict(const std::vector<Eigen::VectorXd>& controls, const Eigen::VectorXd& x0) const {
  RolloutState st = begin(x0);
  Trajectory out;
  out.reserve(controls.size() + 1);
  out.push_back(x0);
  for (const auto& u : controls) out.push_back(step(st, u));
  return out;
}

Trajectory ForwardModel::predict_one_step(const data::Episode& e) const {
  VDM_REQUIRE(e.state_dim() == state_dim() && e.control_dim() == control_dim(), ValidationError,
              "ForwardModel: episode '" + e.id() + "' dimensions do not match the model");
  Trajectory out;
  if (e.size() < 2) return out;
  out.reserve(e.size() - 1);
  RolloutState st = begin(e[0].x);
  for (std::size_t k = 0; k + 1 < e.size(); ++k) {
    st.x = e[k].x;
    out.push_back(step(st, e[k].u));
  }
  return out;
}

LinearizedModel ForwardModel::linearize(const Eigen::VectorXd& x_op, const Eigen::VectorXd& u_op) const {
  const std::size_t n = state_dim();
  const std::size_t m = control_dim();
  VDM_REQUIRE(static_cast<std::size_t>(x_op.size()) == n && static_cast<std::size_t>(u_op.size()) == m,
              ValidationError, "ForwardModel::linearize: operating point dimension mismatch");

  const bool rec = spec_.recurrent_enabled;
  const std::size_t depth = std::max<std::size_t>(1, bank_.max_history_depth());
  const std::size_t lags = depth - 1;

  const auto N = static_cast<Eigen::Index>(n);
  const auto M = static_cast<Eigen::Index>(m);
  const auto NR = rec ? N : Eigen::Index{0};
  const auto P = static_cast<Eigen::Index>(spec_.layout.signal_dim());
  const Eigen::Index nd = N + NR;  // rows produced by the model itself
  const Eigen::Index na = nd + static_cast<Eigen::Index>(lags) * P;
  auto past = [&](std::size_t lag) { return nd + static_cast<Eigen::Index>(lag - 1) * P; };  // s_{k-lag}

  Eigen::VectorXd xr_op = Eigen::VectorXd::Zero(N);
  if (rec) {
    for (int it = 0; it < 200; ++it) xr_op = recurrent_.next_state(xr_op, u_op);
  }

  const Eigen::VectorXd s_op = spec_.layout.signal(x_op, u_op);
  Eigen::VectorXd z_op(na);
  z_op.head(N) = x_op;
  if (rec) z_op.segment(N, NR) = xr_op;
  for (std::size_t lag = 1; lag <= lags; ++lag) z_op.segment(past(lag), P) = s_op;

  // (x_{k+1}, xr_{k+1}) for augmented state z and control u. The window is
  // rebuilt oldest first from the delayed blocks; step() pushes s_k.
  auto next = [&](const Eigen::VectorXd& z, const Eigen::VectorXd& u) {
    RolloutState st = begin(z.head(N));
    if (rec) st.xr = z.segment(N, NR);
    if (lags > 0) {
      st.history.reset(z.segment(past(lags), P));
      for (std::size_t lag = lags - 1; lag >= 1; --lag) st.history.push(z.segment(past(lag), P));
    }
    step(st, u);
    Eigen::VectorXd out(nd);
    out.head(N) = st.x;
    if (rec) out.tail(NR) = st.xr;
    return out;
  };

  const double h0 = spec_.numerics.fd_step;
  LinearizedModel lin;
  lin.state_dim = n;
  lin.history_depth = depth;
  lin.Phi = Eigen::MatrixXd::Zero(na, na);
  lin.Gamma = Eigen::MatrixXd::Zero(na, M);

  for (Eigen::Index j = 0; j < na; ++j) {
    const double h = h0 * std::max(1.0, std::fabs(z_op(j)));
    Eigen::VectorXd zp = z_op, zm = z_op;
    zp(j) += h;
    zm(j) -= h;
    lin.Phi.col(j).head(nd) = (next(zp, u_op) - next(zm, u_op)) / (2.0 * h);
  }
  for (Eigen::Index j = 0; j < M; ++j) {
    const double h = h0 * std::max(1.0, std::fabs(u_op(j)));
    Eigen::VectorXd up = u_op, um = u_op;
    up(j) += h;
    um(j) -= h;
    lin.Gamma.col(j).head(nd) = (next(z_op, up) - next(z_op, um)) / (2.0 * h);
  }

  // Shift register: s_{k} = [x_k ; u_k] becomes the first delayed block.
  if (lags > 0) {
    lin.Phi.block(past(1), 0, N, N).setIdentity();
    lin.Gamma.block(past(1) + N, 0, M, M).setIdentity();
    for (std::size_t lag = 2; lag <= lags; ++lag) {
      lin.Phi.block(past(lag), past(lag - 1), P, P).setIdentity();
    }
  }

  VDM_REQUIRE(lin.Phi.allFinite() && lin.Gamma.allFinite(), NumericalError,
              "ForwardModel::linearize: non-finite Jacobian");
  return lin;
}

}  // namespace vdm::model
