#pragma once
/*
================================================================================
Fragment 3.5 - Model: Gates
FILE: cpp/vdm/model/gate.hpp

Purpose:
  - A Gate pairs one local model with a gate function phi in [0,1] and a
    static sign (+1 or -1). The sign encodes a fixed physical direction
    (drag opposes motion, brake opposes drive).
  - Every gate function implements the same GateFunction interface:
      constant      fixed value (0 hard-disables the term)
      membership    activation i of an operating variable's fuzzy set
      control_rule  1 when a signal channel is above/below a threshold
      learned       small feed-forward network, sigmoid output
    Fixed gates are the special case with no parameters.
================================================================================
*/

#include "vdm/model/parameters.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vdm::model {

// Inputs visible to gate functions at one step.
struct GateContext final {
  // activations[v][i]: activation i of operating variable v.
  const std::vector<std::vector<double>>* activations = nullptr;
  // Current signal vector s_k = [x_k ; u_k].
  const Eigen::VectorXd* signal = nullptr;
};

class GateFunction {
 public:
  virtual ~GateFunction() = default;

  virtual double evaluate(const GateContext& ctx) const = 0;
  virtual std::unique_ptr<GateFunction> clone() const = 0;
  virtual std::string describe() const = 0;

  // Learnable gates expose one flat parameter group and dphi/dtheta.
  virtual ParameterGroup* parameters() noexcept { return nullptr; }
  virtual const ParameterGroup* parameters() const noexcept { return nullptr; }
  // grad += scale * dphi/dtheta
  virtual void accumulate_gradient(const GateContext& ctx, double scale, Eigen::VectorXd& grad) const;

  bool learnable() const noexcept { return parameters() != nullptr; }
};

class ConstantGate final : public GateFunction {
 public:
  explicit ConstantGate(double value);

  double evaluate(const GateContext&) const override { return value_; }
  std::unique_ptr<GateFunction> clone() const override;
  std::string describe() const override;

  double value() const noexcept { return value_; }

 private:
  double value_;
};

class MembershipGate final : public GateFunction {
 public:
  MembershipGate(std::size_t variable, std::size_t member, std::string label);

  double evaluate(const GateContext& ctx) const override;
  std::unique_ptr<GateFunction> clone() const override;
  std::string describe() const override { return "membership(" + label_ + ")"; }

  std::size_t variable() const noexcept { return variable_; }
  std::size_t member() const noexcept { return member_; }

 private:
  std::size_t variable_;
  std::size_t member_;
  std::string label_;
};

class ControlRuleGate final : public GateFunction {
 public:
  ControlRuleGate(std::size_t channel, std::string channel_name, double threshold, bool above);

  double evaluate(const GateContext& ctx) const override;
  std::unique_ptr<GateFunction> clone() const override;
  std::string describe() const override;

 private:
  std::size_t channel_;
  std::string channel_name_;
  double threshold_;
  bool above_;
};

// phi = sigmoid(w2 . tanh(W1 * (s[channels] / scales) + b1) + b2)
class LearnedGate final : public GateFunction {
 public:
  LearnedGate(std::string name, std::vector<std::size_t> channels, std::vector<double> scales,
              std::size_t hidden, std::uint64_t seed, double initial = 0.5);

  double evaluate(const GateContext& ctx) const override;
  std::unique_ptr<GateFunction> clone() const override;
  std::string describe() const override;

  ParameterGroup* parameters() noexcept override { return &theta_; }
  const ParameterGroup* parameters() const noexcept override { return &theta_; }
  void accumulate_gradient(const GateContext& ctx, double scale, Eigen::VectorXd& grad) const override;

  std::size_t hidden() const noexcept { return hidden_; }

 private:
  // Forward pass; fills hidden activations and returns phi.
  double forward(const GateContext& ctx, Eigen::VectorXd& xin, Eigen::VectorXd& a) const;

  std::vector<std::size_t> channels_;
  std::vector<double> scales_;
  std::size_t hidden_;
  ParameterGroup theta_;  // [W1 (hidden x inputs, row-major) | b1 | w2 | b2]
};

struct Gate final {
  std::string name;
  std::size_t output = 0;       // derivative channel the term contributes to
  std::size_t model_index = 0;  // index into the LocalModelBank
  double sign = 1.0;            // +1 or -1
  std::unique_ptr<GateFunction> phi;

  Gate clone() const;
  void validate() const;
};

}  // namespace vdm::model
