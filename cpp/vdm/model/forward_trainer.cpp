#include "vdm/model/forward_trainer.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/parallel.hpp"
#include "vdm/core/require.hpp"

#include <chrono>
#include <cmath>
#include <sstream>
#include <utility>

namespace vdm::model {

namespace {

std::size_t gate_index(const ForwardModel& model, const Gate* g) {
  return static_cast<std::size_t>(g - model.gates().data());
}

Eigen::VectorXd gate_values(const ForwardDataset& ds, const Gate& g) {
  Eigen::VectorXd phi(static_cast<Eigen::Index>(ds.rows));
  for (std::size_t k = 0; k < ds.rows; ++k) {
    const double v = g.phi->evaluate(ds.context(k));
    VDM_REQUIRE(is_finite(v) && v >= 0.0 && v <= 1.0, NumericalError,
                "gate '" + g.name + "': activation outside [0,1]");
    phi(static_cast<Eigen::Index>(k)) = v;
  }
  return phi;
}

// raw d_k and corrected g(d_k) of one local model over every dataset row.
void model_outputs(const LocalModel& m, const Eigen::MatrixXd& F, Eigen::VectorXd* raw, Eigen::VectorXd* out) {
  const Eigen::Index rows = F.rows();
  if (raw) raw->resize(rows);
  if (out) out->resize(rows);
  Eigen::VectorXd f;
  for (Eigen::Index k = 0; k < rows; ++k) {
    f = F.row(k).transpose();
    const double d = m.raw(f);
    if (raw) (*raw)(k) = d;
    if (out) (*out)(k) = m.correction().apply(d);
  }
}

// Signed weights z = sign * phi for every gate.
std::vector<Eigen::VectorXd> gate_weights(const ForwardModel& model, const ForwardDataset& ds) {
  std::vector<Eigen::VectorXd> z(model.gates().size());
  for (std::size_t i = 0; i < z.size(); ++i) {
    const Gate& g = model.gates()[i];
    z[i] = g.sign * gate_values(ds, g);
  }
  return z;
}

// Superposition totals per row (rows x state_dim).
Eigen::MatrixXd combined_outputs(const ForwardModel& model, const ForwardDataset& ds,
                                 const std::vector<Eigen::VectorXd>& z) {
  Eigen::MatrixXd D = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(ds.rows),
                                            static_cast<Eigen::Index>(model.state_dim()));
  Eigen::VectorXd out;
  for (std::size_t i = 0; i < model.gates().size(); ++i) {
    const Gate& g = model.gates()[i];
    model_outputs(model.bank().get(g.model_index), ds.features[g.model_index], nullptr, &out);
    D.col(static_cast<Eigen::Index>(g.output)) += z[i].cwiseProduct(out);
  }
  return D;
}

double rms(const Eigen::VectorXd& e) {
  if (e.size() == 0) return 0.0;
  return std::sqrt(e.squaredNorm() / static_cast<double>(e.size()));
}

std::string format_vector(const std::vector<double>& v) {
  std::ostringstream oss;
  oss << "[";
  for (std::size_t i = 0; i < v.size(); ++i) oss << (i ? ", " : "") << v[i];
  oss << "]";
  return oss.str();
}

}  // namespace

ForwardModelTrainer::ForwardModelTrainer(TrainingSettings training, NumericalSettings numerics)
    : training_(training), numerics_(numerics) {
  training_.validate_or_throw();
  numerics_.validate_or_throw();
}

// ----------------------------- dataset ---------------------------------------

ForwardDataset ForwardModelTrainer::build_dataset(const ForwardModel& model,
                                                  const std::vector<data::Episode>& corpus) const {
  VDM_REQUIRE(!corpus.empty(), ValidationError, "ForwardModelTrainer: empty corpus");
  const ChannelLayout& layout = model.layout();
  const std::size_t nm = model.bank().size();
  const double Ts = model.sample_time();

  ForwardDataset ds;
  std::vector<std::vector<Eigen::VectorXd>> feats(nm);
  std::vector<Eigen::VectorXd> targets;
  std::vector<std::vector<double>> act;
  std::vector<Eigen::VectorXd> f;

  for (const data::Episode& e : corpus) {
    VDM_REQUIRE(e.state_dim() == layout.state_dim() && e.control_dim() == layout.control_dim(), ValidationError,
                "ForwardModelTrainer: episode '" + e.id() + "' dimensions do not match the model");
    ds.episode_begin.push_back(targets.size());
    if (e.size() < 2) {
      log(LogLevel::WARN, "forward", "episode '" + e.id() + "' has fewer than 2 samples; skipped");
      continue;
    }
    if (std::fabs(e.sample_period() - Ts) > 0.01 * Ts) {
      std::ostringstream oss;
      oss << "episode '" << e.id() << "' sample period " << e.sample_period() << " s differs from model Ts " << Ts;
      log(LogLevel::WARN, "forward", oss.str());
    }

    RolloutState st = model.begin(e[0].x);
    for (std::size_t k = 0; k + 1 < e.size(); ++k) {
      Eigen::VectorXd s = layout.signal(e[k].x, e[k].u);
      st.history.push(s);
      model.encode_operating(s, act);
      model.compute_features(st.history, f);
      for (std::size_t m = 0; m < nm; ++m) feats[m].push_back(f[m]);
      ds.activations.push_back(act);
      ds.signals.push_back(std::move(s));
      targets.push_back(model.spec().integrator.derivative_target(e[k].x, e[k + 1].x));
    }
  }
  ds.episode_begin.push_back(targets.size());

  ds.rows = targets.size();
  VDM_REQUIRE(ds.rows > 0, ValidationError, "ForwardModelTrainer: corpus has no consecutive sample pairs");

  ds.targets.resize(static_cast<Eigen::Index>(ds.rows), static_cast<Eigen::Index>(layout.state_dim()));
  for (std::size_t k = 0; k < ds.rows; ++k) ds.targets.row(static_cast<Eigen::Index>(k)) = targets[k].transpose();

  ds.features.resize(nm);
  for (std::size_t m = 0; m < nm; ++m) {
    const auto cols = static_cast<Eigen::Index>(model.bank().get(m).feature_count());
    ds.features[m].resize(static_cast<Eigen::Index>(ds.rows), cols);
    for (std::size_t k = 0; k < ds.rows; ++k) ds.features[m].row(static_cast<Eigen::Index>(k)) = feats[m][k].transpose();
  }
  return ds;
}

// ----------------------------- backfitting -----------------------------------

void ForwardModelTrainer::backfit(ForwardModel& model, const ForwardDataset& ds) const {
  for (std::size_t m = 0; m < model.bank().size(); ++m) model.bank().get(m).correction().reset();

  const std::vector<Eigen::VectorXd> z = gate_weights(model, ds);
  const std::size_t n = model.state_dim();

  parallel_for(n, resolve_thread_count(training_.threads), [&](std::size_t o) {
    const std::vector<const Gate*>& terms = model.gates_for_output(o);
    if (terms.empty()) return;
    const Eigen::VectorXd y = ds.targets.col(static_cast<Eigen::Index>(o));

    std::vector<Eigen::VectorXd> contrib(terms.size());
    Eigen::VectorXd sum = Eigen::VectorXd::Zero(y.size());
    Eigen::VectorXd out;
    for (std::size_t t = 0; t < terms.size(); ++t) {
      const Gate& g = *terms[t];
      model_outputs(model.bank().get(g.model_index), ds.features[g.model_index], nullptr, &out);
      contrib[t] = z[gate_index(model, &g)].cwiseProduct(out);
      sum += contrib[t];
    }

    for (int sweep = 0; sweep < training_.backfit_sweeps; ++sweep) {
      for (std::size_t t = 0; t < terms.size(); ++t) {
        const Gate& g = *terms[t];
        const Eigen::VectorXd& zg = z[gate_index(model, &g)];
        LocalModel& lm = model.bank().get(g.model_index);
        const Eigen::VectorXd r = y - (sum - contrib[t]);
        lm.fit(ds.features[g.model_index], zg, r, training_.ridge);
        model_outputs(lm, ds.features[g.model_index], nullptr, &out);
        Eigen::VectorXd next = zg.cwiseProduct(out);
        sum += next - contrib[t];
        contrib[t] = std::move(next);
      }
    }

    std::ostringstream oss;
    oss << "channel '" << model.layout().state_names[o] << "': " << terms.size() << " terms, derivative rms "
        << rms(y - sum);
    log(LogLevel::DEBUG, "forward", oss.str());
  });
}

// ----------------------------- learned gates ---------------------------------

TrainingTrace ForwardModelTrainer::fit_learned_gates(ForwardModel& model, const ForwardDataset& ds) const {
  TrainingTrace tr;
  std::vector<std::size_t> learnable;
  for (std::size_t i = 0; i < model.gates().size(); ++i) {
    if (model.gates()[i].phi->learnable()) learnable.push_back(i);
  }
  if (learnable.empty() || training_.gate_epochs == 0) {
    tr.converged = true;
    tr.stop_reason = learnable.empty() ? "no learned gates" : "disabled";
    return tr;
  }

  ConvergenceCriterion crit;
  crit.max_epochs = static_cast<std::size_t>(training_.gate_epochs);
  crit.rel_tol = training_.recurrent_rel_tol;
  crit.patience = static_cast<std::size_t>(training_.recurrent_patience);

  const std::size_t ng = model.gates().size();
  std::vector<Eigen::VectorXd> out(ng);
  for (std::size_t i = 0; i < ng; ++i) {
    const Gate& g = model.gates()[i];
    model_outputs(model.bank().get(g.model_index), ds.features[g.model_index], nullptr, &out[i]);
  }
  const double denom = static_cast<double>(ds.rows * model.state_dim());

  for (std::size_t epoch = 0; epoch < crit.max_epochs; ++epoch) {
    Eigen::MatrixXd D = Eigen::MatrixXd::Zero(ds.targets.rows(), ds.targets.cols());
    for (std::size_t i = 0; i < ng; ++i) {
      const Gate& g = model.gates()[i];
      D.col(static_cast<Eigen::Index>(g.output)) += g.sign * gate_values(ds, g).cwiseProduct(out[i]);
    }
    const Eigen::MatrixXd E = ds.targets - D;
    tr.loss.push_back(E.squaredNorm() / denom);
    tr.epochs = epoch + 1;
    if (crit.should_stop(tr.loss)) {
      tr.converged = true;
      tr.stop_reason = "plateau";
      return tr;
    }

    for (std::size_t i : learnable) {
      Gate& g = model.gate(i);
      ParameterGroup* p = g.phi->parameters();
      Eigen::VectorXd grad = Eigen::VectorXd::Zero(p->size());
      const auto col = static_cast<Eigen::Index>(g.output);
      for (std::size_t k = 0; k < ds.rows; ++k) {
        const auto kk = static_cast<Eigen::Index>(k);
        const double scale = -2.0 * E(kk, col) * g.sign * out[i](kk) / denom;
        if (scale != 0.0) g.phi->accumulate_gradient(ds.context(k), scale, grad);
      }
      p->add_scaled(grad, -training_.gate_learning_rate);
    }
  }

  tr.converged = crit.budget_is_convergence;
  tr.stop_reason = "epoch budget";
  return tr;
}

// ----------------------------- Method A --------------------------------------

std::vector<PolynomialFit> ForwardModelTrainer::fit_corrections(ForwardModel& model, const ForwardDataset& ds) const {
  std::vector<PolynomialFit> fits(model.bank().size());
  const std::vector<Eigen::VectorXd> z = gate_weights(model, ds);

  parallel_for(model.state_dim(), resolve_thread_count(training_.threads), [&](std::size_t o) {
    const std::vector<const Gate*>& terms = model.gates_for_output(o);
    if (terms.empty()) return;
    const Eigen::VectorXd y = ds.targets.col(static_cast<Eigen::Index>(o));

    std::vector<Eigen::VectorXd> raw(terms.size()), contrib(terms.size());
    Eigen::VectorXd sum = Eigen::VectorXd::Zero(y.size());
    Eigen::VectorXd out;
    for (std::size_t t = 0; t < terms.size(); ++t) {
      const Gate& g = *terms[t];
      model_outputs(model.bank().get(g.model_index), ds.features[g.model_index], &raw[t], &out);
      contrib[t] = z[gate_index(model, &g)].cwiseProduct(out);
      sum += contrib[t];
    }

    for (std::size_t t = 0; t < terms.size(); ++t) {
      const Gate& g = *terms[t];
      LocalModel& lm = model.bank().get(g.model_index);
      PolynomialCorrection& pc = lm.correction();
      if (pc.kind() == NonlinearityKind::None) continue;

      const Eigen::VectorXd& zg = z[gate_index(model, &g)];
      const Eigen::VectorXd others = sum - contrib[t];
      std::vector<double> q(ds.rows), r(ds.rows);
      for (std::size_t k = 0; k < ds.rows; ++k) {
        const auto kk = static_cast<Eigen::Index>(k);
        const double d = raw[t](kk);
        q[k] = zg(kk) * pc.basis(d);
        r[k] = y(kk) - others(kk) - zg(kk) * d;
      }
      fits[g.model_index] = pc.fit_regression(q, r);

      for (Eigen::Index k = 0; k < out.size(); ++k) out(k) = pc.apply(raw[t](k));
      contrib[t] = zg.cwiseProduct(out);
      sum = others + contrib[t];
    }
  });
  return fits;
}

// ----------------------------- recurrent -------------------------------------

void ForwardModelTrainer::fit_recurrent(ForwardModel& model, const ForwardDataset& ds,
                                        ForwardTrainingReport& report) const {
  if (!model.spec().recurrent_enabled) return;

  const std::size_t m = model.control_dim();
  const Eigen::MatrixXd D = combined_outputs(model, ds, gate_weights(model, ds));
  const Eigen::VectorXd& scale = model.recurrent_scale();

  std::vector<RecurrentSequence> seqs;
  for (std::size_t e = 0; e + 1 < ds.episode_begin.size(); ++e) {
    const std::size_t b = ds.episode_begin[e];
    const std::size_t end = ds.episode_begin[e + 1];
    if (end - b < 2) continue;
    RecurrentSequence seq;
    for (std::size_t k = b; k < end; ++k) {
      Eigen::VectorXd d = D.row(static_cast<Eigen::Index>(k)).transpose();
      model.spec().friction.saturate(d, ds.signals[k]);
      const Eigen::VectorXd resid = ds.targets.row(static_cast<Eigen::Index>(k)).transpose() - d;
      Eigen::VectorXd t = resid.cwiseQuotient(scale);
      for (Eigen::Index i = 0; i < t.size(); ++i) t(i) = clamp(t(i), -0.99, 0.99);
      seq.targets.push_back(std::move(t));
      seq.inputs.push_back(ds.signals[k].tail(static_cast<Eigen::Index>(m)));
    }
    seqs.push_back(std::move(seq));
  }
  if (seqs.empty()) {
    log(LogLevel::WARN, "forward", "no episode long enough for the recurrent correction; skipped");
    return;
  }

  ConvergenceCriterion crit;
  crit.max_epochs = static_cast<std::size_t>(training_.recurrent_max_epochs);
  crit.rel_tol = training_.recurrent_rel_tol;
  crit.patience = static_cast<std::size_t>(training_.recurrent_patience);

  RecurrentCorrection& rc = model.recurrent();
  if (rc.phase() != RecurrentPhase::Untrained) {
    // Retraining restarts the two-phase protocol; the previous refine froze A and b.
    log(LogLevel::DEBUG, "forward", "recurrent correction reset for retraining");
    rc = RecurrentCorrection(model.state_dim(), m, "recurrent");
  }
  report.recurrent_phase1 = rc.train_base(seqs, crit, training_.recurrent_learning_rate);
  if (!rc.phase1_converged()) {
    log(LogLevel::WARN, "forward", "recurrent phase 1 did not converge; refinement skipped");
    return;
  }
  report.recurrent_phase2 = rc.refine(seqs, crit, training_.recurrent_learning_rate);
  report.recurrent_refined = true;
}

// ----------------------------- metrics ---------------------------------------

std::vector<double> ForwardModelTrainer::derivative_rmse(const ForwardModel& model, const ForwardDataset& ds,
                                                         bool with_friction) const {
  Eigen::MatrixXd D = combined_outputs(model, ds, gate_weights(model, ds));
  if (with_friction && model.spec().friction.enabled) {
    for (std::size_t k = 0; k < ds.rows; ++k) {
      Eigen::VectorXd d = D.row(static_cast<Eigen::Index>(k)).transpose();
      model.spec().friction.saturate(d, ds.signals[k]);
      D.row(static_cast<Eigen::Index>(k)) = d.transpose();
    }
  }
  std::vector<double> out(model.state_dim());
  for (std::size_t o = 0; o < out.size(); ++o) {
    const auto c = static_cast<Eigen::Index>(o);
    out[o] = rms(ds.targets.col(c) - D.col(c));
  }
  return out;
}

// ----------------------------- pipeline --------------------------------------

ForwardTrainingReport ForwardModelTrainer::train(ForwardModel& model, const std::vector<data::Episode>& corpus,
                                                 bool freeze) const {
  if (model.frozen()) {
    throw FrozenParameterViolation("ForwardModelTrainer: forward model is frozen");
  }
  const auto t0 = std::chrono::steady_clock::now();

  ForwardTrainingReport report;
  const ForwardDataset ds = build_dataset(model, corpus);
  report.episodes = corpus.size();
  report.rows = ds.rows;

  backfit(model, ds);
  report.backfit_sweeps = training_.backfit_sweeps;

  report.gate_trace = fit_learned_gates(model, ds);
  if (report.gate_trace.epochs > 0) backfit(model, ds);
  report.derivative_rmse_linear = derivative_rmse(model, ds);

  const std::vector<PolynomialFit> fits = fit_corrections(model, ds);
  for (std::size_t m = 0; m < fits.size(); ++m) {
    if (model.bank().get(m).correction().kind() == NonlinearityKind::None) continue;
    report.correction_models.push_back(model.bank().get(m).name());
    report.corrections.push_back(fits[m]);
  }
  report.derivative_rmse = derivative_rmse(model, ds);

  fit_recurrent(model, ds, report);
  model.mark_trained();

  // Full-model one-step error per state channel.
  Eigen::VectorXd sse = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(model.state_dim()));
  std::size_t count = 0;
  for (const data::Episode& e : corpus) {
    const Trajectory pred = model.predict_one_step(e);
    for (std::size_t k = 0; k < pred.size(); ++k) {
      sse += (pred[k] - e[k + 1].x).cwiseAbs2();
      ++count;
    }
  }
  report.one_step_rmse.resize(model.state_dim());
  for (std::size_t i = 0; i < model.state_dim(); ++i) {
    report.one_step_rmse[i] = count ? std::sqrt(sse(static_cast<Eigen::Index>(i)) / static_cast<double>(count)) : 0.0;
  }

  if (freeze) model.freeze();

  report.wall_time_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

  std::ostringstream oss;
  oss << "trained on " << report.rows << " rows from " << report.episodes << " episodes in "
      << report.wall_time_ms << " ms; one-step rmse " << format_vector(report.one_step_rmse)
      << "; stage " << to_string(model.stage());
  log(LogLevel::INFO, "forward", oss.str());
  return report;
}

}  // namespace vdm::model
