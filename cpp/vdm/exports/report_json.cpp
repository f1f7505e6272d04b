/*
================================================================================
Fragment 7.1 - Exports: Report JSON (Implementation)
FILE: cpp/vdm/exports/report_json.cpp
================================================================================
*/

#include "vdm/exports/report_json.hpp"

#include "vdm/config/json.hpp"
#include "vdm/core/hashing.hpp"

#include <complex>
#include <fstream>

namespace vdm::exports {

using config::JsonWriter;

namespace {

void emit_trace(JsonWriter& j, const model::TrainingTrace& t) {
  j.obj_begin();
  j.key("epochs"); j.num_u(t.epochs);
  j.key("converged"); j.b(t.converged);
  j.key("stop_reason"); j.str(t.stop_reason);
  j.key("initial_loss"); j.num(t.loss.empty() ? 0.0 : t.loss.front());
  j.key("final_loss"); j.num(t.loss.empty() ? 0.0 : t.loss.back());
  j.obj_end();
}

// {"channel": value, ...} in layout order.
void emit_channels(JsonWriter& j, const std::vector<std::string>& names, const std::vector<double>& v) {
  j.obj_begin();
  for (std::size_t i = 0; i < v.size(); ++i) {
    j.key(i < names.size() ? names[i] : std::to_string(i));
    j.num(v[i]);
  }
  j.obj_end();
}

void emit_poles(JsonWriter& j, const std::vector<std::complex<double>>& poles) {
  j.arr_begin();
  for (const auto& p : poles) {
    j.obj_begin();
    j.key("re"); j.num(p.real());
    j.key("im"); j.num(p.imag());
    j.key("abs"); j.num(std::abs(p));
    j.obj_end();
  }
  j.arr_end();
}

}  // namespace

std::string forward_report_to_json(const model::ForwardTrainingReport& r, const model::ForwardModel& m) {
  const auto& names = m.layout().state_names;
  JsonWriter j;
  j.obj_begin();
  j.key("stage"); j.str(model::to_string(m.stage()));
  j.key("episodes"); j.num_u(r.episodes);
  j.key("rows"); j.num_u(r.rows);
  j.key("backfit_sweeps"); j.num_i(r.backfit_sweeps);
  j.key("derivative_rmse_linear"); emit_channels(j, names, r.derivative_rmse_linear);
  j.key("derivative_rmse"); emit_channels(j, names, r.derivative_rmse);

  j.key("corrections");
  j.arr_begin();
  for (std::size_t i = 0; i < r.corrections.size(); ++i) {
    const model::PolynomialFit& f = r.corrections[i];
    j.obj_begin();
    j.key("model"); j.str(i < r.correction_models.size() ? r.correction_models[i] : std::string());
    j.key("coefficient"); j.num(f.coefficient);
    j.key("rms_before"); j.num(f.rms_before);
    j.key("rms_after"); j.num(f.rms_after);
    j.key("samples"); j.num_u(f.samples);
    j.obj_end();
  }
  j.arr_end();

  j.key("gate_training"); emit_trace(j, r.gate_trace);
  j.key("recurrent");
  j.obj_begin();
  j.key("phase"); j.str(model::to_string(m.recurrent().phase()));
  j.key("refined"); j.b(r.recurrent_refined);
  j.key("phase1"); emit_trace(j, r.recurrent_phase1);
  j.key("phase2"); emit_trace(j, r.recurrent_phase2);
  j.obj_end();

  j.key("one_step_rmse"); emit_channels(j, names, r.one_step_rmse);
  j.key("wall_time_ms"); j.num(r.wall_time_ms);
  j.obj_end();
  return j.text() + "\n";
}

std::string inverse_report_to_json(const model::InverseTrainingReport& r) {
  JsonWriter j;
  j.obj_begin();
  j.key("sequences"); j.num_u(r.sequences);
  j.key("direct_init"); j.b(r.direct_init);
  j.key("direct_init_rmse"); j.num(r.direct_init_rmse);
  j.key("initial_loss"); j.num(r.initial_loss);
  j.key("final_loss"); j.num(r.final_loss);
  j.key("training"); emit_trace(j, r.trace);
  j.key("wall_time_ms"); j.num(r.wall_time_ms);
  j.obj_end();
  return j.text() + "\n";
}

std::string stability_report_to_json(const stability::StabilityReport& r) {
  JsonWriter j;
  j.obj_begin();
  j.key("verdict"); j.str(stability::to_string(r.verdict));
  j.key("spectral_radius"); j.num(r.spectral_radius);
  j.key("margin"); j.num(r.margin);
  j.key("poles"); emit_poles(j, r.poles);
  j.key("warning");
  if (r.warning) {
    j.obj_begin();
    j.key("message"); j.str(r.warning->message);
    j.key("offending_poles"); emit_poles(j, r.warning->offending_poles);
    j.obj_end();
  } else {
    j.null();
  }
  j.obj_end();
  return j.text() + "\n";
}

std::string provenance_to_json(const std::vector<augment::AugmentedEpisode>& eps) {
  JsonWriter j;
  j.arr_begin();
  for (const auto& a : eps) {
    const augment::Provenance& p = a.provenance;
    j.obj_begin();
    j.key("id"); j.str(a.episode.id());
    j.key("operator"); j.str(augment::to_string(p.op));
    j.key("parents"); j.str_list(p.parents);
    j.key("seed"); j.str(hash_to_hex(Hash64{p.seed}));
    j.key("split_time"); j.num(p.split_time);
    j.key("perturbation"); j.str(p.perturbation);
    j.key("samples"); j.num_u(a.episode.size());
    j.obj_end();
  }
  j.arr_end();
  return j.text() + "\n";
}

std::string metrics_to_json(const stats::EvaluationMetrics& m) {
  JsonWriter j;
  j.obj_begin();
  j.key("mode"); j.str(m.mode);
  j.key("episodes"); j.num_u(m.episodes);
  j.key("channels");
  j.arr_begin();
  for (const auto& c : m.channels) {
    j.obj_begin();
    j.key("channel"); j.str(c.channel);
    j.key("rmse"); j.num(c.rmse);
    j.key("max_abs"); j.num(c.max_abs);
    j.key("mean"); j.num(c.mean);
    j.key("samples"); j.num_u(c.samples);
    j.obj_end();
  }
  j.arr_end();
  j.key("compute_time_ms"); j.num(m.compute_time_ms);
  j.key("time_per_step_us"); j.num(m.time_per_step_us);
  j.obj_end();
  return j.text() + "\n";
}

bool write_text_file(const std::string& text, const std::string& file_path) {
  std::ofstream f(file_path, std::ios::out | std::ios::trunc);
  if (!f) return false;
  f << text;
  return static_cast<bool>(f);
}

}  // namespace vdm::exports
