#include "vdm/model/gate.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/require.hpp"
#include "vdm/core/rng.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace vdm::model {

void GateFunction::accumulate_gradient(const GateContext&, double, Eigen::VectorXd&) const {}

// ----------------------------- ConstantGate ----------------------------------

ConstantGate::ConstantGate(double value) : value_(value) {
  VDM_REQUIRE(is_finite(value) && value >= 0.0 && value <= 1.0, ValidationError,
              "ConstantGate: value must be within [0,1]");
}

std::unique_ptr<GateFunction> ConstantGate::clone() const {
  return std::make_unique<ConstantGate>(*this);
}

std::string ConstantGate::describe() const {
  std::ostringstream oss;
  oss << "constant(" << value_ << ")";
  return oss.str();
}

// ----------------------------- MembershipGate --------------------------------

MembershipGate::MembershipGate(std::size_t variable, std::size_t member, std::string label)
    : variable_(variable), member_(member), label_(std::move(label)) {}

double MembershipGate::evaluate(const GateContext& ctx) const {
  VDM_REQUIRE(ctx.activations != nullptr, ValidationError, "MembershipGate: no activations in context");
  VDM_REQUIRE(variable_ < ctx.activations->size(), ValidationError, "MembershipGate: variable out of range");
  const auto& act = (*ctx.activations)[variable_];
  VDM_REQUIRE(member_ < act.size(), ValidationError, "MembershipGate: member out of range");
  return act[member_];
}

std::unique_ptr<GateFunction> MembershipGate::clone() const {
  return std::make_unique<MembershipGate>(*this);
}

// ----------------------------- ControlRuleGate -------------------------------

ControlRuleGate::ControlRuleGate(std::size_t channel, std::string channel_name, double threshold, bool above)
    : channel_(channel), channel_name_(std::move(channel_name)), threshold_(threshold), above_(above) {
  VDM_REQUIRE(is_finite(threshold), ValidationError, "ControlRuleGate: non-finite threshold");
}

double ControlRuleGate::evaluate(const GateContext& ctx) const {
  VDM_REQUIRE(ctx.signal != nullptr, ValidationError, "ControlRuleGate: no signal in context");
  VDM_REQUIRE(static_cast<Eigen::Index>(channel_) < ctx.signal->size(), ValidationError,
              "ControlRuleGate: channel out of range");
  const double v = (*ctx.signal)(static_cast<Eigen::Index>(channel_));
  const bool on = above_ ? (v > threshold_) : (v < threshold_);
  return on ? 1.0 : 0.0;
}

std::unique_ptr<GateFunction> ControlRuleGate::clone() const {
  return std::make_unique<ControlRuleGate>(*this);
}

std::string ControlRuleGate::describe() const {
  std::ostringstream oss;
  oss << "control_rule(" << channel_name_ << (above_ ? " > " : " < ") << threshold_ << ")";
  return oss.str();
}

// ----------------------------- LearnedGate -----------------------------------

LearnedGate::LearnedGate(std::string name, std::vector<std::size_t> channels, std::vector<double> scales,
                         std::size_t hidden, std::uint64_t seed, double initial)
    : channels_(std::move(channels)), scales_(std::move(scales)), hidden_(hidden) {
  VDM_REQUIRE(!channels_.empty(), ValidationError, "LearnedGate '" + name + "': no input channels");
  VDM_REQUIRE(hidden_ >= 1, ValidationError, "LearnedGate '" + name + "': hidden must be >= 1");
  if (scales_.empty()) scales_.assign(channels_.size(), 1.0);
  VDM_REQUIRE(scales_.size() == channels_.size(), ValidationError,
              "LearnedGate '" + name + "': scales/channels length mismatch");
  for (double s : scales_) {
    VDM_REQUIRE(is_finite(s) && s > 0.0, ValidationError, "LearnedGate '" + name + "': scales must be > 0");
  }
  VDM_REQUIRE(is_finite(initial) && initial > 0.0 && initial < 1.0, ValidationError,
              "LearnedGate '" + name + "': initial must be within (0,1)");

  const std::size_t I = channels_.size();
  const std::size_t H = hidden_;
  Eigen::VectorXd th(static_cast<Eigen::Index>(H * I + 2 * H + 1));
  Rng64 rng(seed);
  Eigen::Index j = 0;
  for (std::size_t k = 0; k < H * I; ++k) th(j++) = rng.uniform(-0.5, 0.5);
  for (std::size_t k = 0; k < H; ++k) th(j++) = 0.0;
  for (std::size_t k = 0; k < H; ++k) th(j++) = rng.uniform(-0.5, 0.5);
  th(j) = std::log(initial / (1.0 - initial));

  theta_ = ParameterGroup(name + ".gate", th.size(), 1, 0.0);
  theta_.assign_flat(th);
}

double LearnedGate::forward(const GateContext& ctx, Eigen::VectorXd& xin, Eigen::VectorXd& a) const {
  VDM_REQUIRE(ctx.signal != nullptr, ValidationError, "LearnedGate: no signal in context");
  const std::size_t I = channels_.size();
  const std::size_t H = hidden_;
  const Eigen::MatrixXd& th = theta_.value();

  xin.resize(static_cast<Eigen::Index>(I));
  for (std::size_t i = 0; i < I; ++i) {
    VDM_REQUIRE(static_cast<Eigen::Index>(channels_[i]) < ctx.signal->size(), ValidationError,
                "LearnedGate: channel out of range");
    xin(static_cast<Eigen::Index>(i)) = (*ctx.signal)(static_cast<Eigen::Index>(channels_[i])) / scales_[i];
  }

  const std::size_t b1 = H * I;
  const std::size_t w2 = b1 + H;
  const std::size_t b2 = w2 + H;

  a.resize(static_cast<Eigen::Index>(H));
  double z = th(static_cast<Eigen::Index>(b2), 0);
  for (std::size_t h = 0; h < H; ++h) {
    double pre = th(static_cast<Eigen::Index>(b1 + h), 0);
    for (std::size_t i = 0; i < I; ++i) {
      pre += th(static_cast<Eigen::Index>(h * I + i), 0) * xin(static_cast<Eigen::Index>(i));
    }
    a(static_cast<Eigen::Index>(h)) = std::tanh(pre);
    z += th(static_cast<Eigen::Index>(w2 + h), 0) * a(static_cast<Eigen::Index>(h));
  }
  return sigmoid(z);
}

double LearnedGate::evaluate(const GateContext& ctx) const {
  Eigen::VectorXd xin, a;
  return forward(ctx, xin, a);
}

void LearnedGate::accumulate_gradient(const GateContext& ctx, double scale, Eigen::VectorXd& grad) const {
  VDM_REQUIRE(grad.size() == theta_.size(), ValidationError, "LearnedGate: gradient size mismatch");
  Eigen::VectorXd xin, a;
  const double phi = forward(ctx, xin, a);
  const double s = scale * phi * (1.0 - phi);

  const std::size_t I = channels_.size();
  const std::size_t H = hidden_;
  const std::size_t b1 = H * I;
  const std::size_t w2 = b1 + H;
  const std::size_t b2 = w2 + H;
  const Eigen::MatrixXd& th = theta_.value();

  for (std::size_t h = 0; h < H; ++h) {
    const double ah = a(static_cast<Eigen::Index>(h));
    const double wh = th(static_cast<Eigen::Index>(w2 + h), 0);
    const double dpre = s * wh * (1.0 - ah * ah);
    grad(static_cast<Eigen::Index>(w2 + h)) += s * ah;
    grad(static_cast<Eigen::Index>(b1 + h)) += dpre;
    for (std::size_t i = 0; i < I; ++i) {
      grad(static_cast<Eigen::Index>(h * I + i)) += dpre * xin(static_cast<Eigen::Index>(i));
    }
  }
  grad(static_cast<Eigen::Index>(b2)) += s;
}

std::unique_ptr<GateFunction> LearnedGate::clone() const {
  return std::make_unique<LearnedGate>(*this);
}

std::string LearnedGate::describe() const {
  std::ostringstream oss;
  oss << "learned(" << channels_.size() << "->" << hidden_ << "->1)";
  return oss.str();
}

// ----------------------------- Gate ------------------------------------------

Gate Gate::clone() const {
  Gate g;
  g.name = name;
  g.output = output;
  g.model_index = model_index;
  g.sign = sign;
  g.phi = phi ? phi->clone() : nullptr;
  return g;
}

void Gate::validate() const {
  VDM_REQUIRE(!name.empty(), ValidationError, "Gate: empty name");
  VDM_REQUIRE(sign == 1.0 || sign == -1.0, ValidationError, "Gate '" + name + "': sign must be +1 or -1");
  VDM_REQUIRE(phi != nullptr, ValidationError, "Gate '" + name + "': missing gate function");
}

}  // namespace vdm::model
