#include "vdm/config/model_config.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/require.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace vdm::config {

const char* to_string(GateKind k) noexcept {
  switch (k) {
    case GateKind::Constant: return "constant";
    case GateKind::Membership: return "membership";
    case GateKind::ControlRule: return "control_rule";
    case GateKind::Learned: return "learned";
    default: return "constant";
  }
}

bool parse_gate_kind(const std::string& s, GateKind* out) noexcept {
  if (!out) return false;
  if (s == "constant") { *out = GateKind::Constant; return true; }
  if (s == "membership") { *out = GateKind::Membership; return true; }
  if (s == "control_rule") { *out = GateKind::ControlRule; return true; }
  if (s == "learned") { *out = GateKind::Learned; return true; }
  return false;
}

namespace {

// Schema violation at a parsed value; converted to JsonParseError at the API
// boundary.
struct SchemaError {
  std::string message;
  const JsonValue* at = nullptr;
};

[[noreturn]] void schema_fail(const JsonValue& at, std::string msg) {
  throw SchemaError{std::move(msg), &at};
}

const JsonValue& require_type(const JsonValue& v, JsonType t, const std::string& what) {
  if (v.t != t) {
    schema_fail(v, what + " must be " + to_string(t) + " (got " + to_string(v.t) + ")");
  }
  return v;
}

const JsonValue& required(const JsonValue& o, const char* k, const std::string& where) {
  const JsonValue* v = o.find(k);
  if (!v) schema_fail(o, where + ": missing field '" + k + "'");
  return *v;
}

void read_number(const JsonValue& o, const char* k, double& out) {
  if (const JsonValue* v = o.find(k)) out = require_type(*v, JsonType::kNum, k).num;
}

void read_bool(const JsonValue& o, const char* k, bool& out) {
  if (const JsonValue* v = o.find(k)) out = require_type(*v, JsonType::kBool, k).b;
}

void read_string(const JsonValue& o, const char* k, std::string& out) {
  if (const JsonValue* v = o.find(k)) out = require_type(*v, JsonType::kStr, k).str;
}

double integral_value(const JsonValue& v, const char* k, double lo, double hi) {
  require_type(v, JsonType::kNum, k);
  if (std::floor(v.num) != v.num || v.num < lo || v.num > hi) {
    schema_fail(v, std::string(k) + " must be an integer");
  }
  return v.num;
}

void read_int(const JsonValue& o, const char* k, int& out) {
  if (const JsonValue* v = o.find(k)) {
    out = static_cast<int>(integral_value(*v, k, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
  }
}

void read_size(const JsonValue& o, const char* k, std::size_t& out) {
  if (const JsonValue* v = o.find(k)) out = static_cast<std::size_t>(integral_value(*v, k, 0.0, 9.0e15));
}

void read_u64(const JsonValue& o, const char* k, std::uint64_t& out) {
  if (const JsonValue* v = o.find(k)) out = static_cast<std::uint64_t>(integral_value(*v, k, 0.0, 9.0e15));
}

std::string string_value(const JsonValue& o, const char* k, const std::string& where) {
  return require_type(required(o, k, where), JsonType::kStr, where + "." + k).str;
}

std::vector<double> number_list(const JsonValue& v, const std::string& what) {
  require_type(v, JsonType::kArr, what);
  std::vector<double> out;
  out.reserve(v.arr.size());
  for (const auto& e : v.arr) out.push_back(require_type(e, JsonType::kNum, what + "[]").num);
  return out;
}

std::vector<std::string> string_list(const JsonValue& v, const std::string& what) {
  require_type(v, JsonType::kArr, what);
  std::vector<std::string> out;
  out.reserve(v.arr.size());
  for (const auto& e : v.arr) out.push_back(require_type(e, JsonType::kStr, what + "[]").str);
  return out;
}

void read_number_list(const JsonValue& o, const char* k, std::vector<double>& out) {
  if (const JsonValue* v = o.find(k)) out = number_list(*v, k);
}

// ----------------------------- sections --------------------------------------

fuzzy::MembershipFunction parse_membership_function(const JsonValue& v, const std::string& where) {
  require_type(v, JsonType::kObj, where);
  fuzzy::MembershipFunction f;
  f.name = string_value(v, "name", where);
  const JsonValue& type = required(v, "type", where);
  if (!fuzzy::parse_membership_family(require_type(type, JsonType::kStr, where + ".type").str, &f.family)) {
    schema_fail(type, where + ": unknown membership type '" + type.str + "'");
  }
  f.params = number_list(required(v, "params", where), where + ".params");
  return f;
}

OperatingVariableConfig parse_operating_variable(const JsonValue& v) {
  require_type(v, JsonType::kObj, "operating_variables[]");
  OperatingVariableConfig ov;
  ov.name = string_value(v, "name", "operating_variables[]");
  const std::string where = "operating variable '" + ov.name + "'";
  ov.channel = string_value(v, "channel", where);
  ov.set.name = ov.name;

  const JsonValue& dom = required(v, "domain", where);
  const std::vector<double> d = number_list(dom, where + ".domain");
  if (d.size() != 2) schema_fail(dom, where + ": domain must be [lo, hi]");
  ov.set.domain_lo = d[0];
  ov.set.domain_hi = d[1];
  read_bool(v, "normalized", ov.set.normalized);

  const JsonValue& fns = require_type(required(v, "functions", where), JsonType::kArr, where + ".functions");
  for (const auto& f : fns.arr) ov.set.functions.push_back(parse_membership_function(f, where + ".functions[]"));
  return ov;
}

LocalModelConfig parse_local_model(const JsonValue& v, double sample_time) {
  require_type(v, JsonType::kObj, "local_models[]");
  LocalModelConfig lm;
  lm.name = string_value(v, "name", "local_models[]");
  const std::string where = "local model '" + lm.name + "'";

  if (const JsonValue* nl = v.find("nonlinearity")) {
    if (!model::parse_nonlinearity_kind(require_type(*nl, JsonType::kStr, where + ".nonlinearity").str,
                                        &lm.nonlinearity)) {
      schema_fail(*nl, where + ": unknown nonlinearity '" + nl->str + "'");
    }
  }

  const JsonValue& inputs = require_type(required(v, "inputs", where), JsonType::kArr, where + ".inputs");
  for (const auto& in : inputs.arr) {
    require_type(in, JsonType::kObj, where + ".inputs[]");
    LocalModelInputConfig ic;
    ic.channel = string_value(in, "channel", where + ".inputs[]");
    const JsonValue* w = in.find("window");
    const JsonValue* ws = in.find("window_s");
    if (w && ws) schema_fail(in, where + ": give either window or window_s, not both");
    if (w) {
      ic.taps = static_cast<std::size_t>(integral_value(*w, "window", 1.0, 1.0e6));
    } else if (ws) {
      const double sec = require_type(*ws, JsonType::kNum, "window_s").num;
      if (!(sec > 0.0)) schema_fail(*ws, where + ": window_s must be > 0");
      const double taps = std::round(sec / sample_time);
      ic.taps = taps < 1.0 ? 1 : static_cast<std::size_t>(taps);
    }
    if (const JsonValue* tr = in.find("transform")) {
      if (!model::parse_feature_transform(require_type(*tr, JsonType::kStr, "transform").str, &ic.transform)) {
        schema_fail(*tr, where + ": unknown transform '" + tr->str + "'");
      }
    }
    lm.inputs.push_back(std::move(ic));
  }
  return lm;
}

GateConfig parse_gate(const JsonValue& v) {
  require_type(v, JsonType::kObj, "gates[]");
  GateConfig g;
  g.name = string_value(v, "name", "gates[]");
  const std::string where = "gate '" + g.name + "'";
  g.output = string_value(v, "output", where);
  g.model = string_value(v, "model", where);
  read_number(v, "sign", g.sign);

  const JsonValue* phi = v.find("phi");
  if (!phi) return g;  // constant 1
  require_type(*phi, JsonType::kObj, where + ".phi");
  const JsonValue& type = required(*phi, "type", where + ".phi");
  if (!parse_gate_kind(require_type(type, JsonType::kStr, where + ".phi.type").str, &g.kind)) {
    schema_fail(type, where + ": unknown gate type '" + type.str + "'");
  }
  switch (g.kind) {
    case GateKind::Constant:
      read_number(*phi, "value", g.value);
      break;
    case GateKind::Membership:
      g.variable = string_value(*phi, "variable", where + ".phi");
      g.member = string_value(*phi, "member", where + ".phi");
      break;
    case GateKind::ControlRule:
      g.channel = string_value(*phi, "channel", where + ".phi");
      read_number(*phi, "threshold", g.threshold);
      read_bool(*phi, "above", g.above);
      break;
    case GateKind::Learned:
      g.inputs = string_list(required(*phi, "inputs", where + ".phi"), where + ".phi.inputs");
      read_number_list(*phi, "scales", g.scales);
      read_size(*phi, "hidden", g.hidden);
      read_u64(*phi, "seed", g.seed);
      read_number(*phi, "initial", g.initial);
      break;
  }
  return g;
}

std::vector<augment::ChannelPerturbation> parse_channel_perturbations(const JsonValue& v, const std::string& what) {
  require_type(v, JsonType::kArr, what);
  std::vector<augment::ChannelPerturbation> out;
  for (const auto& e : v.arr) {
    require_type(e, JsonType::kObj, what + "[]");
    augment::ChannelPerturbation c;
    read_number(e, "sigma", c.sigma);
    read_number(e, "scale_lo", c.scale_lo);
    read_number(e, "scale_hi", c.scale_hi);
    read_number(e, "lo", c.lo);
    read_number(e, "hi", c.hi);
    out.push_back(c);
  }
  return out;
}

void parse_augment(const JsonValue& v, ModelConfig& cfg) {
  require_type(v, JsonType::kObj, "augment");
  read_size(v, "crossovers", cfg.augment.crossovers);
  read_size(v, "mutations", cfg.augment.mutations);
  read_u64(v, "seed", cfg.settings.augment.seed);
  read_number(v, "split_fraction_min", cfg.settings.augment.split_fraction_min);
  read_number(v, "split_fraction_max", cfg.settings.augment.split_fraction_max);
  read_number(v, "default_sigma", cfg.settings.augment.default_sigma);

  if (const JsonValue* p = v.find("perturbation")) {
    require_type(*p, JsonType::kObj, "augment.perturbation");
    augment::Perturbation& pert = cfg.augment.perturbation;
    if (const JsonValue* kind = p->find("kind")) {
      if (!augment::parse_perturbation_kind(require_type(*kind, JsonType::kStr, "perturbation.kind").str,
                                            &pert.kind)) {
        schema_fail(*kind, "unknown perturbation kind '" + kind->str + "'");
      }
    }
    read_number(*p, "correlation", pert.correlation);
    if (const JsonValue* s = p->find("state")) pert.state = parse_channel_perturbations(*s, "perturbation.state");
    if (const JsonValue* c = p->find("control")) {
      pert.control = parse_channel_perturbations(*c, "perturbation.control");
    }
    cfg.augment.has_perturbation = true;
  }
}

void parse_numerics(const JsonValue& v, NumericalSettings& n) {
  require_type(v, JsonType::kObj, "numerics");
  read_number(v, "eps", n.eps);
  read_number(v, "partition_tol", n.partition_tol);
  read_number(v, "time_tol", n.time_tol);
  read_number(v, "stability_margin", n.stability_margin);
  read_number(v, "fd_step", n.fd_step);
}

void parse_training(const JsonValue& v, TrainingSettings& t) {
  require_type(v, JsonType::kObj, "training");
  read_number(v, "ridge", t.ridge);
  read_int(v, "backfit_sweeps", t.backfit_sweeps);
  read_int(v, "gate_epochs", t.gate_epochs);
  read_number(v, "gate_learning_rate", t.gate_learning_rate);
  read_number(v, "recurrent_learning_rate", t.recurrent_learning_rate);
  read_int(v, "recurrent_max_epochs", t.recurrent_max_epochs);
  read_number(v, "recurrent_rel_tol", t.recurrent_rel_tol);
  read_int(v, "recurrent_patience", t.recurrent_patience);
  read_bool(v, "inverse_direct_init", t.inverse_direct_init);
  read_int(v, "inverse_epochs", t.inverse_epochs);
  read_number(v, "inverse_learning_rate", t.inverse_learning_rate);
  read_number(v, "inverse_ridge", t.inverse_ridge);
  read_int(v, "threads", t.threads);
}

void fill_config_from_root(const JsonValue& root, ModelConfig& cfg) {
  require_type(root, JsonType::kObj, "root");
  cfg = ModelConfig{};

  read_number(root, "sample_time", cfg.sample_time);
  if (!(cfg.sample_time > 0.0)) schema_fail(*root.find("sample_time"), "sample_time must be > 0");
  cfg.state_channels = string_list(required(root, "state_channels", "root"), "state_channels");
  cfg.control_channels = string_list(required(root, "control_channels", "root"), "control_channels");

  if (const JsonValue* integ = root.find("integrator")) {
    if (!model::parse_integrator_kind(require_type(*integ, JsonType::kStr, "integrator").str, &cfg.integrator)) {
      schema_fail(*integ, "unknown integrator '" + integ->str + "'");
    }
  }
  if (const JsonValue* bf = root.find("body_frame")) {
    require_type(*bf, JsonType::kObj, "body_frame");
    read_string(*bf, "vx", cfg.body_vx);
    read_string(*bf, "vy", cfg.body_vy);
    read_string(*bf, "r", cfg.body_r);
  }

  if (const JsonValue* ovs = root.find("operating_variables")) {
    require_type(*ovs, JsonType::kArr, "operating_variables");
    for (const auto& v : ovs->arr) cfg.operating_variables.push_back(parse_operating_variable(v));
  }

  const JsonValue& lms = require_type(required(root, "local_models", "root"), JsonType::kArr, "local_models");
  for (const auto& v : lms.arr) cfg.local_models.push_back(parse_local_model(v, cfg.sample_time));

  const JsonValue& gates = require_type(required(root, "gates", "root"), JsonType::kArr, "gates");
  for (const auto& v : gates.arr) cfg.gates.push_back(parse_gate(v));

  if (const JsonValue* fe = root.find("friction_ellipse")) {
    require_type(*fe, JsonType::kObj, "friction_ellipse");
    FrictionConfig& f = cfg.friction;
    f.enabled = true;
    read_bool(*fe, "enabled", f.enabled);
    read_number(*fe, "mu_min", f.mu_min);
    read_number(*fe, "mu_max", f.mu_max);
    read_number(*fe, "g", f.g);
    read_number(*fe, "eps", f.eps);
    read_number(*fe, "speed_gain", f.speed_gain);
    read_number(*fe, "brake_gain", f.brake_gain);
    read_string(*fe, "speed_channel", f.speed_channel);
    read_string(*fe, "brake_channel", f.brake_channel);
    read_string(*fe, "ax_output", f.ax_output);
    read_string(*fe, "ay_output", f.ay_output);
  }

  if (const JsonValue* rec = root.find("recurrent")) {
    require_type(*rec, JsonType::kObj, "recurrent");
    cfg.recurrent_enabled = true;
    read_bool(*rec, "enabled", cfg.recurrent_enabled);
    read_number_list(*rec, "scale", cfg.recurrent_scale);
  }

  if (const JsonValue* inv = root.find("inverse")) {
    require_type(*inv, JsonType::kObj, "inverse");
    read_number_list(*inv, "control_lo", cfg.inverse.control_lo);
    read_number_list(*inv, "control_hi", cfg.inverse.control_hi);
    read_number_list(*inv, "loss_weights", cfg.inverse.loss_weights);
    read_number_list(*inv, "nominal_state", cfg.inverse.nominal_state);
    read_number_list(*inv, "nominal_control", cfg.inverse.nominal_control);
  }

  if (const JsonValue* aug = root.find("augment")) parse_augment(*aug, cfg);
  if (const JsonValue* num = root.find("numerics")) parse_numerics(*num, cfg.settings.numerics);
  if (const JsonValue* tr = root.find("training")) parse_training(*tr, cfg.settings.training);

  if (const JsonValue* lvl = root.find("log_level")) {
    if (!parse_log_level(require_type(*lvl, JsonType::kStr, "log_level").str, &cfg.log_level)) {
      schema_fail(*lvl, "unknown log_level '" + lvl->str + "'");
    }
  }
}

// ----------------------------- name resolution -------------------------------

std::size_t signal_index(const model::ChannelLayout& layout, const std::string& name, const std::string& who) {
  const std::size_t i = layout.index_of(name);
  VDM_REQUIRE(i != model::ChannelLayout::npos, ValidationError, who + ": unknown channel '" + name + "'");
  return i;
}

std::size_t state_index(const model::ChannelLayout& layout, const std::string& name, const std::string& who) {
  const std::size_t i = layout.state_index(name);
  VDM_REQUIRE(i != model::ChannelLayout::npos, ValidationError, who + ": '" + name + "' is not a state channel");
  return i;
}

std::size_t model_index(const ModelConfig& cfg, const std::string& name, const std::string& who) {
  for (std::size_t i = 0; i < cfg.local_models.size(); ++i) {
    if (cfg.local_models[i].name == name) return i;
  }
  throw ValidationError(who + ": unknown local model '" + name + "'");
}

std::size_t variable_index(const ModelConfig& cfg, const std::string& name, const std::string& who) {
  for (std::size_t i = 0; i < cfg.operating_variables.size(); ++i) {
    if (cfg.operating_variables[i].name == name) return i;
  }
  throw ValidationError(who + ": unknown operating variable '" + name + "'");
}

void require_size(const std::vector<double>& v, std::size_t n, const char* what) {
  VDM_REQUIRE(v.empty() || v.size() == n, ValidationError,
              std::string(what) + ": expected " + std::to_string(n) + " entries");
  for (const double x : v) {
    VDM_REQUIRE(is_finite(x), ValidationError, std::string(what) + ": non-finite entry");
  }
}

Eigen::VectorXd to_vector(const std::vector<double>& v) {
  Eigen::VectorXd out(static_cast<Eigen::Index>(v.size()));
  for (std::size_t i = 0; i < v.size(); ++i) out(static_cast<Eigen::Index>(i)) = v[i];
  return out;
}

std::vector<std::size_t> resolve_signals(const model::ChannelLayout& layout, const std::vector<std::string>& names,
                                         const std::string& who) {
  std::vector<std::size_t> out;
  out.reserve(names.size());
  for (const auto& n : names) out.push_back(signal_index(layout, n, who));
  return out;
}

}  // namespace

// ----------------------------- ModelConfig -----------------------------------

model::ChannelLayout ModelConfig::layout() const {
  model::ChannelLayout l;
  l.state_names = state_channels;
  l.control_names = control_channels;
  return l;
}

void ModelConfig::validate_or_throw() const {
  VDM_REQUIRE(is_finite(sample_time) && sample_time > 0.0, ValidationError, "ModelConfig: sample_time must be > 0");
  settings.validate_or_throw();

  const model::ChannelLayout l = layout();
  l.validate();
  const std::size_t n = l.state_dim();
  const std::size_t m = l.control_dim();

  if (integrator == model::IntegratorKind::BodyFrame) {
    state_index(l, body_vx, "body_frame.vx");
    state_index(l, body_vy, "body_frame.vy");
    state_index(l, body_r, "body_frame.r");
  }

  for (std::size_t v = 0; v < operating_variables.size(); ++v) {
    const auto& ov = operating_variables[v];
    VDM_REQUIRE(!ov.name.empty(), ValidationError, "ModelConfig: operating variable with empty name");
    signal_index(l, ov.channel, "operating variable '" + ov.name + "'");
    ov.set.validate();
    for (std::size_t w = 0; w < v; ++w) {
      VDM_REQUIRE(operating_variables[w].name != ov.name, ValidationError,
                  "ModelConfig: duplicate operating variable '" + ov.name + "'");
    }
  }

  VDM_REQUIRE(!local_models.empty(), ValidationError, "ModelConfig: no local models");
  for (std::size_t i = 0; i < local_models.size(); ++i) {
    const auto& lm = local_models[i];
    const std::string who = "local model '" + lm.name + "'";
    VDM_REQUIRE(!lm.name.empty(), ValidationError, "ModelConfig: local model with empty name");
    VDM_REQUIRE(!lm.inputs.empty(), ValidationError, who + ": no inputs");
    for (const auto& in : lm.inputs) {
      signal_index(l, in.channel, who);
      VDM_REQUIRE(in.taps >= 1, ValidationError, who + ": window must be >= 1 sample");
    }
    for (std::size_t j = 0; j < i; ++j) {
      VDM_REQUIRE(local_models[j].name != lm.name, ValidationError, "ModelConfig: duplicate local model '" + lm.name + "'");
    }
  }

  std::vector<std::size_t> uses(local_models.size(), 0);
  for (std::size_t i = 0; i < gates.size(); ++i) {
    const GateConfig& g = gates[i];
    const std::string who = "gate '" + g.name + "'";
    VDM_REQUIRE(!g.name.empty(), ValidationError, "ModelConfig: gate with empty name");
    state_index(l, g.output, who);
    ++uses[model_index(*this, g.model, who)];
    VDM_REQUIRE(g.sign == 1.0 || g.sign == -1.0, ValidationError, who + ": sign must be +1 or -1");
    for (std::size_t j = 0; j < i; ++j) {
      VDM_REQUIRE(gates[j].name != g.name, ValidationError, "ModelConfig: duplicate gate '" + g.name + "'");
    }
    switch (g.kind) {
      case GateKind::Constant:
        VDM_REQUIRE(is_finite(g.value) && g.value >= 0.0 && g.value <= 1.0, ValidationError,
                    who + ": constant value must be within [0,1]");
        break;
      case GateKind::Membership: {
        const std::size_t v = variable_index(*this, g.variable, who);
        VDM_REQUIRE(operating_variables[v].set.index_of(g.member) != fuzzy::FuzzySet::npos, ValidationError,
                    who + ": unknown membership function '" + g.member + "'");
      } break;
      case GateKind::ControlRule:
        signal_index(l, g.channel, who);
        VDM_REQUIRE(is_finite(g.threshold), ValidationError, who + ": threshold must be finite");
        break;
      case GateKind::Learned:
        VDM_REQUIRE(!g.inputs.empty(), ValidationError, who + ": learned gate needs inputs");
        resolve_signals(l, g.inputs, who);
        VDM_REQUIRE(g.scales.empty() || g.scales.size() == g.inputs.size(), ValidationError,
                    who + ": scales must match inputs");
        for (const double s : g.scales) {
          VDM_REQUIRE(is_finite(s) && s > 0.0, ValidationError, who + ": scales must be > 0");
        }
        VDM_REQUIRE(g.hidden >= 1 && g.hidden <= 1024, ValidationError, who + ": hidden must be within [1,1024]");
        VDM_REQUIRE(is_finite(g.initial) && g.initial > 0.0 && g.initial < 1.0, ValidationError,
                    who + ": initial must be within (0,1)");
        break;
    }
  }
  for (std::size_t i = 0; i < uses.size(); ++i) {
    VDM_REQUIRE(uses[i] == 1, ValidationError,
                "local model '" + local_models[i].name + "' must be referenced by exactly one gate");
  }

  if (friction.enabled) {
    signal_index(l, friction.speed_channel, "friction_ellipse.speed_channel");
    if (!friction.brake_channel.empty()) signal_index(l, friction.brake_channel, "friction_ellipse.brake_channel");
    state_index(l, friction.ax_output, "friction_ellipse.ax_output");
    state_index(l, friction.ay_output, "friction_ellipse.ay_output");
  }

  require_size(recurrent_scale, n, "recurrent.scale");
  for (const double s : recurrent_scale) {
    VDM_REQUIRE(s > 0.0, ValidationError, "recurrent.scale: entries must be > 0");
  }

  require_size(inverse.control_lo, m, "inverse.control_lo");
  require_size(inverse.control_hi, m, "inverse.control_hi");
  require_size(inverse.loss_weights, n, "inverse.loss_weights");
  require_size(inverse.nominal_state, n, "inverse.nominal_state");
  require_size(inverse.nominal_control, m, "inverse.nominal_control");
  if (!inverse.control_lo.empty() && !inverse.control_hi.empty()) {
    for (std::size_t j = 0; j < m; ++j) {
      VDM_REQUIRE(inverse.control_lo[j] <= inverse.control_hi[j], ValidationError,
                  "inverse: control_lo must be <= control_hi");
    }
  }
  for (const double w : inverse.loss_weights) {
    VDM_REQUIRE(w >= 0.0, ValidationError, "inverse.loss_weights: entries must be >= 0");
  }

  if (augment.has_perturbation) augment.perturbation.validate(n, m);
}

// ----------------------------- parse / load ----------------------------------

bool parse_model_config_json(std::string_view json, ModelConfig* out, JsonParseError* err) {
  if (!out) return false;

  JsonValue root;
  if (!parse_json(json, &root, err)) return false;

  ModelConfig cfg;
  try {
    fill_config_from_root(root, cfg);
  } catch (const SchemaError& e) {
    if (err) {
      err->message = e.message;
      err->offset = e.at ? e.at->offset : 0;
      err->line = e.at ? e.at->line : 1;
      err->col = e.at ? e.at->col : 1;
    }
    return false;
  }

  *out = std::move(cfg);
  return true;
}

ModelConfig load_model_config_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw IOError("cannot open model config '" + path + "'");
  std::ostringstream ss;
  ss << f.rdbuf();

  ModelConfig cfg;
  JsonParseError err;
  if (!parse_model_config_json(ss.str(), &cfg, &err)) {
    throw ValidationError(path + ": " + err.describe());
  }
  cfg.validate_or_throw();
  return cfg;
}

std::string model_config_to_json(const ModelConfig& cfg) {
  JsonWriter j;
  j.obj_begin();
  j.key("sample_time"); j.num(cfg.sample_time);
  j.key("state_channels"); j.str_list(cfg.state_channels);
  j.key("control_channels"); j.str_list(cfg.control_channels);
  j.key("integrator"); j.str(model::to_string(cfg.integrator));
  j.key("body_frame");
  j.obj_begin();
  j.key("vx"); j.str(cfg.body_vx);
  j.key("vy"); j.str(cfg.body_vy);
  j.key("r"); j.str(cfg.body_r);
  j.obj_end();

  j.key("operating_variables");
  j.arr_begin();
  for (const auto& ov : cfg.operating_variables) {
    j.obj_begin();
    j.key("name"); j.str(ov.name);
    j.key("channel"); j.str(ov.channel);
    j.key("domain"); j.num_list({ov.set.domain_lo, ov.set.domain_hi});
    j.key("normalized"); j.b(ov.set.normalized);
    j.key("functions");
    j.arr_begin();
    for (const auto& f : ov.set.functions) {
      j.obj_begin();
      j.key("name"); j.str(f.name);
      j.key("type"); j.str(fuzzy::to_string(f.family));
      j.key("params"); j.num_list(f.params);
      j.obj_end();
    }
    j.arr_end();
    j.obj_end();
  }
  j.arr_end();

  j.key("local_models");
  j.arr_begin();
  for (const auto& lm : cfg.local_models) {
    j.obj_begin();
    j.key("name"); j.str(lm.name);
    j.key("nonlinearity"); j.str(model::to_string(lm.nonlinearity));
    j.key("inputs");
    j.arr_begin();
    for (const auto& in : lm.inputs) {
      j.obj_begin();
      j.key("channel"); j.str(in.channel);
      j.key("window"); j.num_u(in.taps);
      j.key("transform"); j.str(model::to_string(in.transform));
      j.obj_end();
    }
    j.arr_end();
    j.obj_end();
  }
  j.arr_end();

  j.key("gates");
  j.arr_begin();
  for (const auto& g : cfg.gates) {
    j.obj_begin();
    j.key("name"); j.str(g.name);
    j.key("output"); j.str(g.output);
    j.key("model"); j.str(g.model);
    j.key("sign"); j.num(g.sign);
    j.key("phi");
    j.obj_begin();
    j.key("type"); j.str(to_string(g.kind));
    switch (g.kind) {
      case GateKind::Constant:
        j.key("value"); j.num(g.value);
        break;
      case GateKind::Membership:
        j.key("variable"); j.str(g.variable);
        j.key("member"); j.str(g.member);
        break;
      case GateKind::ControlRule:
        j.key("channel"); j.str(g.channel);
        j.key("threshold"); j.num(g.threshold);
        j.key("above"); j.b(g.above);
        break;
      case GateKind::Learned:
        j.key("inputs"); j.str_list(g.inputs);
        j.key("scales"); j.num_list(g.scales);
        j.key("hidden"); j.num_u(g.hidden);
        j.key("seed"); j.num_u(g.seed);
        j.key("initial"); j.num(g.initial);
        break;
    }
    j.obj_end();
    j.obj_end();
  }
  j.arr_end();

  const FrictionConfig& f = cfg.friction;
  j.key("friction_ellipse");
  j.obj_begin();
  j.key("enabled"); j.b(f.enabled);
  j.key("mu_min"); j.num(f.mu_min);
  j.key("mu_max"); j.num(f.mu_max);
  j.key("g"); j.num(f.g);
  j.key("eps"); j.num(f.eps);
  j.key("speed_gain"); j.num(f.speed_gain);
  j.key("brake_gain"); j.num(f.brake_gain);
  j.key("speed_channel"); j.str(f.speed_channel);
  j.key("brake_channel"); j.str(f.brake_channel);
  j.key("ax_output"); j.str(f.ax_output);
  j.key("ay_output"); j.str(f.ay_output);
  j.obj_end();

  j.key("recurrent");
  j.obj_begin();
  j.key("enabled"); j.b(cfg.recurrent_enabled);
  j.key("scale"); j.num_list(cfg.recurrent_scale);
  j.obj_end();

  j.key("inverse");
  j.obj_begin();
  j.key("control_lo"); j.num_list(cfg.inverse.control_lo);
  j.key("control_hi"); j.num_list(cfg.inverse.control_hi);
  j.key("loss_weights"); j.num_list(cfg.inverse.loss_weights);
  j.key("nominal_state"); j.num_list(cfg.inverse.nominal_state);
  j.key("nominal_control"); j.num_list(cfg.inverse.nominal_control);
  j.obj_end();

  const AugmentSettings& as = cfg.settings.augment;
  j.key("augment");
  j.obj_begin();
  j.key("crossovers"); j.num_u(cfg.augment.crossovers);
  j.key("mutations"); j.num_u(cfg.augment.mutations);
  j.key("seed"); j.num_u(as.seed);
  j.key("split_fraction_min"); j.num(as.split_fraction_min);
  j.key("split_fraction_max"); j.num(as.split_fraction_max);
  j.key("default_sigma"); j.num(as.default_sigma);
  if (cfg.augment.has_perturbation) {
    const augment::Perturbation& p = cfg.augment.perturbation;
    auto channels = [&](const char* name, const std::vector<augment::ChannelPerturbation>& chs) {
      j.key(name);
      j.arr_begin();
      for (const auto& c : chs) {
        j.obj_begin();
        j.key("sigma"); j.num(c.sigma);
        j.key("scale_lo"); j.num(c.scale_lo);
        j.key("scale_hi"); j.num(c.scale_hi);
        // Unbounded sides are omitted.
        if (is_finite(c.lo)) { j.key("lo"); j.num(c.lo); }
        if (is_finite(c.hi)) { j.key("hi"); j.num(c.hi); }
        j.obj_end();
      }
      j.arr_end();
    };
    j.key("perturbation");
    j.obj_begin();
    j.key("kind"); j.str(augment::to_string(p.kind));
    j.key("correlation"); j.num(p.correlation);
    channels("state", p.state);
    channels("control", p.control);
    j.obj_end();
  }
  j.obj_end();

  const NumericalSettings& nu = cfg.settings.numerics;
  j.key("numerics");
  j.obj_begin();
  j.key("eps"); j.num(nu.eps);
  j.key("partition_tol"); j.num(nu.partition_tol);
  j.key("time_tol"); j.num(nu.time_tol);
  j.key("stability_margin"); j.num(nu.stability_margin);
  j.key("fd_step"); j.num(nu.fd_step);
  j.obj_end();

  const TrainingSettings& t = cfg.settings.training;
  j.key("training");
  j.obj_begin();
  j.key("ridge"); j.num(t.ridge);
  j.key("backfit_sweeps"); j.num_i(t.backfit_sweeps);
  j.key("gate_epochs"); j.num_i(t.gate_epochs);
  j.key("gate_learning_rate"); j.num(t.gate_learning_rate);
  j.key("recurrent_learning_rate"); j.num(t.recurrent_learning_rate);
  j.key("recurrent_max_epochs"); j.num_i(t.recurrent_max_epochs);
  j.key("recurrent_rel_tol"); j.num(t.recurrent_rel_tol);
  j.key("recurrent_patience"); j.num_i(t.recurrent_patience);
  j.key("inverse_direct_init"); j.b(t.inverse_direct_init);
  j.key("inverse_epochs"); j.num_i(t.inverse_epochs);
  j.key("inverse_learning_rate"); j.num(t.inverse_learning_rate);
  j.key("inverse_ridge"); j.num(t.inverse_ridge);
  j.key("threads"); j.num_i(t.threads);
  j.obj_end();

  const char* lvl = "info";
  switch (cfg.log_level) {
    case LogLevel::DEBUG: lvl = "debug"; break;
    case LogLevel::INFO: lvl = "info"; break;
    case LogLevel::WARN: lvl = "warn"; break;
    case LogLevel::ERROR: lvl = "error"; break;
  }
  j.key("log_level"); j.str(lvl);
  j.obj_end();
  return j.text() + "\n";
}

// ----------------------------- Builders --------------------------------------

model::ForwardModelSpec make_forward_spec(const ModelConfig& cfg) {
  model::ForwardModelSpec spec;
  spec.layout = cfg.layout();
  spec.numerics = cfg.settings.numerics;

  spec.integrator.kind = cfg.integrator;
  spec.integrator.sample_time = cfg.sample_time;
  if (cfg.integrator == model::IntegratorKind::BodyFrame) {
    spec.integrator.vx = state_index(spec.layout, cfg.body_vx, "body_frame.vx");
    spec.integrator.vy = state_index(spec.layout, cfg.body_vy, "body_frame.vy");
    spec.integrator.r = state_index(spec.layout, cfg.body_r, "body_frame.r");
  }

  for (const auto& ov : cfg.operating_variables) {
    model::OperatingVariable v;
    v.name = ov.name;
    v.channel = signal_index(spec.layout, ov.channel, "operating variable '" + ov.name + "'");
    v.set = ov.set;
    v.set.name = ov.name;
    spec.variables.push_back(std::move(v));
  }

  const FrictionConfig& f = cfg.friction;
  spec.friction.enabled = f.enabled;
  spec.friction.mu_min = f.mu_min;
  spec.friction.mu_max = f.mu_max;
  spec.friction.g = f.g;
  spec.friction.eps = f.eps;
  spec.friction.speed_gain = f.speed_gain;
  spec.friction.brake_gain = f.brake_gain;
  if (f.enabled) {
    spec.friction.speed_channel = signal_index(spec.layout, f.speed_channel, "friction_ellipse.speed_channel");
    if (!f.brake_channel.empty()) {
      spec.friction.brake_channel = signal_index(spec.layout, f.brake_channel, "friction_ellipse.brake_channel");
    }
    spec.friction.ax_output = state_index(spec.layout, f.ax_output, "friction_ellipse.ax_output");
    spec.friction.ay_output = state_index(spec.layout, f.ay_output, "friction_ellipse.ay_output");
  }

  spec.recurrent_enabled = cfg.recurrent_enabled;
  spec.recurrent_scale = to_vector(cfg.recurrent_scale);
  return spec;
}

model::LocalModelBank make_local_model_bank(const ModelConfig& cfg) {
  const model::ChannelLayout l = cfg.layout();
  std::vector<std::unique_ptr<model::LocalModel>> models;
  models.reserve(cfg.local_models.size());
  for (const auto& lm : cfg.local_models) {
    std::vector<model::FirInput> inputs;
    for (const auto& in : lm.inputs) {
      model::FirInput fi;
      fi.channel_name = in.channel;
      fi.channel = signal_index(l, in.channel, "local model '" + lm.name + "'");
      fi.taps = in.taps;
      fi.transform = in.transform;
      inputs.push_back(std::move(fi));
    }
    models.push_back(std::make_unique<model::FirLocalModel>(lm.name, std::move(inputs), lm.nonlinearity));
  }
  return model::LocalModelBank(std::move(models));
}

std::vector<model::Gate> make_gates(const ModelConfig& cfg) {
  const model::ChannelLayout l = cfg.layout();
  std::vector<model::Gate> gates;
  gates.reserve(cfg.gates.size());
  for (const GateConfig& gc : cfg.gates) {
    const std::string who = "gate '" + gc.name + "'";
    model::Gate g;
    g.name = gc.name;
    g.output = state_index(l, gc.output, who);
    g.model_index = model_index(cfg, gc.model, who);
    g.sign = gc.sign;
    switch (gc.kind) {
      case GateKind::Constant:
        g.phi = std::make_unique<model::ConstantGate>(gc.value);
        break;
      case GateKind::Membership: {
        const std::size_t v = variable_index(cfg, gc.variable, who);
        const std::size_t member = cfg.operating_variables[v].set.index_of(gc.member);
        VDM_REQUIRE(member != fuzzy::FuzzySet::npos, ValidationError,
                    who + ": unknown membership function '" + gc.member + "'");
        g.phi = std::make_unique<model::MembershipGate>(v, member, gc.variable + "." + gc.member);
      } break;
      case GateKind::ControlRule:
        g.phi = std::make_unique<model::ControlRuleGate>(signal_index(l, gc.channel, who), gc.channel, gc.threshold,
                                                         gc.above);
        break;
      case GateKind::Learned: {
        std::vector<double> scales = gc.scales;
        if (scales.empty()) scales.assign(gc.inputs.size(), 1.0);
        g.phi = std::make_unique<model::LearnedGate>(gc.name, resolve_signals(l, gc.inputs, who), std::move(scales),
                                                     gc.hidden, gc.seed, gc.initial);
      } break;
    }
    gates.push_back(std::move(g));
  }
  return gates;
}

model::ForwardModel make_forward_model(const ModelConfig& cfg) {
  cfg.validate_or_throw();
  return model::ForwardModel(make_forward_spec(cfg), make_local_model_bank(cfg), make_gates(cfg));
}

model::InverseModelSpec make_inverse_spec(const ModelConfig& cfg) {
  model::InverseModelSpec spec;
  spec.control_lo = to_vector(cfg.inverse.control_lo);
  spec.control_hi = to_vector(cfg.inverse.control_hi);
  spec.loss_weights = to_vector(cfg.inverse.loss_weights);
  spec.nominal_state = to_vector(cfg.inverse.nominal_state);
  spec.nominal_control = to_vector(cfg.inverse.nominal_control);
  return spec;
}

augment::AugmentPlan make_augment_plan(const ModelConfig& cfg) {
  augment::AugmentPlan plan;
  plan.crossovers = cfg.augment.crossovers;
  plan.mutations = cfg.augment.mutations;
  plan.seed = cfg.settings.augment.seed;
  plan.perturbation = cfg.augment.has_perturbation
                          ? cfg.augment.perturbation
                          : augment::Perturbation::gaussian(cfg.settings.augment.default_sigma,
                                                            cfg.state_channels.size(), cfg.control_channels.size());
  return plan;
}

// ----------------------------- Defaults --------------------------------------

ModelConfig default_vehicle_config() {
  ModelConfig cfg;
  cfg.sample_time = 0.01;
  cfg.state_channels = {"vx", "vy", "r"};
  cfg.control_channels = {"delta", "throttle", "brake"};
  cfg.integrator = model::IntegratorKind::BodyFrame;

  OperatingVariableConfig speed;
  speed.name = "speed";
  speed.channel = "vx";
  speed.set.name = "speed";
  speed.set.domain_lo = 0.0;
  speed.set.domain_hi = 60.0;
  speed.set.normalized = true;
  speed.set.functions = {
      fuzzy::MembershipFunction::triangular("low", -30.0, 0.0, 30.0),
      fuzzy::MembershipFunction::triangular("mid", 0.0, 30.0, 60.0),
      fuzzy::MembershipFunction::triangular("high", 30.0, 60.0, 90.0),
  };
  cfg.operating_variables.push_back(speed);

  auto input = [](const char* ch, std::size_t taps,
                  model::FeatureTransform tr = model::FeatureTransform::Identity) {
    LocalModelInputConfig in;
    in.channel = ch;
    in.taps = taps;
    in.transform = tr;
    return in;
  };
  auto add_model = [&](const char* name, std::vector<LocalModelInputConfig> inputs, model::NonlinearityKind nl) {
    LocalModelConfig lm;
    lm.name = name;
    lm.inputs = std::move(inputs);
    lm.nonlinearity = nl;
    cfg.local_models.push_back(std::move(lm));
  };
  auto add_gate = [&](const char* name, const char* output, const char* model_name, double sign) -> GateConfig& {
    GateConfig g;
    g.name = name;
    g.output = output;
    g.model = model_name;
    g.sign = sign;
    cfg.gates.push_back(std::move(g));
    return cfg.gates.back();
  };

  // Longitudinal: speed-scheduled drive, rule-gated brake, drag.
  const char* bands[] = {"low", "mid", "high"};
  for (const char* band : bands) {
    const std::string name = std::string("drive_") + band;
    add_model(name.c_str(), {input("throttle", 10), input("vx", 2)}, model::NonlinearityKind::Cubic);
    GateConfig& g = add_gate(("g_" + name).c_str(), "vx", name.c_str(), 1.0);
    g.kind = GateKind::Membership;
    g.variable = "speed";
    g.member = band;
  }
  add_model("brake", {input("brake", 10)}, model::NonlinearityKind::None);
  {
    GateConfig& g = add_gate("g_brake", "vx", "brake", -1.0);
    g.kind = GateKind::ControlRule;
    g.channel = "brake";
    g.threshold = 0.01;
    g.above = true;
  }
  add_model("drag", {input("vx", 1, model::FeatureTransform::SignedSquare)}, model::NonlinearityKind::None);
  add_gate("g_drag", "vx", "drag", -1.0);

  // Lateral + yaw.
  add_model("lateral", {input("delta", 10), input("vy", 5), input("r", 5), input("vx", 1)},
            model::NonlinearityKind::Cubic);
  {
    GateConfig& g = add_gate("g_lateral", "vy", "lateral", 1.0);
    g.kind = GateKind::Learned;
    g.inputs = {"vx", "delta"};
    g.scales = {30.0, 0.2};
    g.hidden = 4;
    g.seed = 11;
    g.initial = 0.9;
  }
  add_model("yaw", {input("delta", 10), input("vy", 5), input("r", 5)}, model::NonlinearityKind::Bias);
  add_gate("g_yaw", "r", "yaw", 1.0);

  cfg.friction.enabled = true;
  cfg.friction.speed_channel = "vx";
  cfg.friction.brake_channel = "brake";
  cfg.friction.ax_output = "vx";
  cfg.friction.ay_output = "vy";

  cfg.recurrent_enabled = true;
  cfg.recurrent_scale = {0.5, 0.2, 0.1};

  cfg.inverse.control_lo = {-0.5, 0.0, 0.0};
  cfg.inverse.control_hi = {0.5, 1.0, 1.0};
  cfg.inverse.loss_weights = {1.0, 1.0, 1.0};
  cfg.inverse.nominal_state = {20.0, 0.0, 0.0};
  cfg.inverse.nominal_control = {0.0, 0.2, 0.0};

  cfg.augment.crossovers = 4;
  cfg.augment.mutations = 4;
  cfg.augment.has_perturbation = true;
  augment::Perturbation& p = cfg.augment.perturbation;
  p.kind = augment::PerturbationKind::Gaussian;
  p.correlation = 0.5;
  auto channel = [](double sigma, double lo, double hi) {
    augment::ChannelPerturbation c;
    c.sigma = sigma;
    c.lo = lo;
    c.hi = hi;
    return c;
  };
  const double inf = std::numeric_limits<double>::infinity();
  p.state = {channel(0.05, 0.0, inf), channel(0.01, -inf, inf), channel(0.005, -inf, inf)};
  p.control = {channel(0.005, -0.5, 0.5), channel(0.01, 0.0, 1.0), channel(0.01, 0.0, 1.0)};

  return cfg;
}

}  // namespace vdm::config
