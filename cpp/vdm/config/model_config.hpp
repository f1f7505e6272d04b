#pragma once
/*
================================================================================
Fragment 5.2 - Config: Model Configuration
FILE: cpp/vdm/config/model_config.hpp

Purpose:
  - One JSON document declares a complete model: channels, sample time,
    fuzzy operating variables, local models, gates, Method A families,
    recurrent correction, friction ellipse, inverse policy, augmentation and
    numerical/training settings.
  - Everything refers to channels and models by NAME. Builders resolve names
    to indices after validate_or_throw() checked every reference.

Schema (unknown keys ignored):
  {
    "sample_time": 0.01,
    "state_channels": ["vx","vy","r"],
    "control_channels": ["delta","throttle","brake"],
    "integrator": "body_frame" | "euler",
    "body_frame": {"vx":"vx","vy":"vy","r":"r"},
    "operating_variables": [
      {"name":"speed","channel":"vx","domain":[0,60],"normalized":true,
       "functions":[{"name":"low","type":"triangular","params":[-30,0,30]}, ...]}],
    "local_models": [
      {"name":"drive","nonlinearity":"cubic",
       "inputs":[{"channel":"throttle","window_s":0.10,"transform":"identity"},
                 {"channel":"vx","window":3}]}],
    "gates": [
      {"name":"g_drive","output":"vx","model":"drive","sign":1,
       "phi":{"type":"membership","variable":"speed","member":"low"}}],
       phi types: constant{value} | membership{variable,member}
                  | control_rule{channel,threshold,above}
                  | learned{inputs,scales,hidden,seed,initial}
    "friction_ellipse": {"enabled":true,"mu_min":0.6,"mu_max":2.0,"g":9.81,
                         "speed_channel":"vx","brake_channel":"brake",
                         "ax_output":"vx","ay_output":"vy", ...},
    "recurrent": {"enabled":true,"scale":[0.5,0.5,0.5]},
    "inverse": {"control_lo":[...],"control_hi":[...],"loss_weights":[...],
                "nominal_state":[...],"nominal_control":[...]},
    "augment": {"crossovers":8,"mutations":8,"seed":7,
                "split_fraction_min":0.25,"split_fraction_max":0.75,
                "default_sigma":0.01,
                "perturbation":{"kind":"gaussian","correlation":0.0,
                                "state":[{"sigma":0.05,"lo":0}],"control":[...]}},
    "numerics": {...NumericalSettings...},
    "training": {...TrainingSettings...},
    "log_level": "info"
  }

Errors:
  - parse_model_config_json: false + JsonParseError (line/col of the
    offending value) for malformed JSON or wrong types.
  - validate_or_throw / builders: ValidationError for bad references.
================================================================================
*/

#include "vdm/augment/augmenter.hpp"
#include "vdm/config/json.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/settings.hpp"
#include "vdm/fuzzy/membership.hpp"
#include "vdm/model/forward_model.hpp"
#include "vdm/model/gate.hpp"
#include "vdm/model/inverse_model.hpp"
#include "vdm/model/local_model.hpp"
#include "vdm/model/nonlinearity.hpp"
#include "vdm/model/vehicle.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vdm::config {

struct OperatingVariableConfig {
  std::string name;
  std::string channel;
  fuzzy::FuzzySet set;  // set.name == name
};

struct LocalModelInputConfig {
  std::string channel;
  std::size_t taps = 1;  // resolved from "window" or "window_s"
  model::FeatureTransform transform = model::FeatureTransform::Identity;
};

struct LocalModelConfig {
  std::string name;
  std::vector<LocalModelInputConfig> inputs;
  model::NonlinearityKind nonlinearity = model::NonlinearityKind::None;
};

enum class GateKind : std::uint8_t { Constant = 0, Membership = 1, ControlRule = 2, Learned = 3 };

const char* to_string(GateKind k) noexcept;
bool parse_gate_kind(const std::string& s, GateKind* out) noexcept;

struct GateConfig {
  std::string name;
  std::string output;  // state channel whose derivative the term feeds
  std::string model;   // local model name
  double sign = 1.0;

  GateKind kind = GateKind::Constant;
  double value = 1.0;            // constant
  std::string variable;          // membership
  std::string member;            // membership
  std::string channel;           // control_rule
  double threshold = 0.0;        // control_rule
  bool above = true;             // control_rule
  std::vector<std::string> inputs;  // learned
  std::vector<double> scales;       // learned; empty -> ones
  std::size_t hidden = 4;           // learned
  std::uint64_t seed = 1;           // learned
  double initial = 0.5;             // learned
};

struct FrictionConfig {
  bool enabled = false;
  double mu_min = 0.6;
  double mu_max = 2.0;
  double g = 9.81;
  double eps = 1e-6;
  double speed_gain = 0.5;
  double brake_gain = 2.0;
  std::string speed_channel;
  std::string brake_channel;  // empty -> brake treated as 0
  std::string ax_output;
  std::string ay_output;
};

struct InverseConfig {
  std::vector<double> control_lo;
  std::vector<double> control_hi;
  std::vector<double> loss_weights;
  std::vector<double> nominal_state;
  std::vector<double> nominal_control;
};

struct AugmentConfig {
  std::size_t crossovers = 0;
  std::size_t mutations = 0;
  bool has_perturbation = false;
  augment::Perturbation perturbation;
};

struct ModelConfig {
  double sample_time = 0.01;
  std::vector<std::string> state_channels;
  std::vector<std::string> control_channels;

  model::IntegratorKind integrator = model::IntegratorKind::Euler;
  std::string body_vx = "vx";
  std::string body_vy = "vy";
  std::string body_r = "r";

  std::vector<OperatingVariableConfig> operating_variables;
  std::vector<LocalModelConfig> local_models;
  std::vector<GateConfig> gates;

  FrictionConfig friction;
  bool recurrent_enabled = false;
  std::vector<double> recurrent_scale;  // empty -> ones

  InverseConfig inverse;
  AugmentConfig augment;

  EngineSettings settings;
  LogLevel log_level = LogLevel::INFO;

  // Cross-reference and range checks. Throws ValidationError.
  void validate_or_throw() const;

  model::ChannelLayout layout() const;
};

/// Parse a model config from JSON text. Does not call validate_or_throw().
bool parse_model_config_json(std::string_view json, ModelConfig* out, JsonParseError* err = nullptr);

/// Read + parse + validate. Throws IOError / ValidationError.
ModelConfig load_model_config_file(const std::string& path);

/// Serialize (round-trips through parse_model_config_json).
std::string model_config_to_json(const ModelConfig& cfg);

// ----------------------------- Builders --------------------------------------
model::ForwardModelSpec make_forward_spec(const ModelConfig& cfg);
model::LocalModelBank make_local_model_bank(const ModelConfig& cfg);
std::vector<model::Gate> make_gates(const ModelConfig& cfg);
model::ForwardModel make_forward_model(const ModelConfig& cfg);
model::InverseModelSpec make_inverse_spec(const ModelConfig& cfg);
augment::AugmentPlan make_augment_plan(const ModelConfig& cfg);

/// Racing-car layout: states vx, vy, r; controls delta, throttle, brake;
/// speed-scheduled FIR blocks, friction ellipse, body-frame integration.
ModelConfig default_vehicle_config();

}  // namespace vdm::config
