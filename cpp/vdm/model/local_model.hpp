#pragma once
/*
================================================================================
Fragment 3.4 - Model: Local Models + Bank
FILE: cpp/vdm/model/local_model.hpp

Purpose:
  - A LocalModel approximates one physical effect (drive force, drag,
    steering response...) from a window of past signals.
  - FirLocalModel: finite impulse response over named channel windows plus a
    bias, each channel passed through a feature transform first.
  - LocalModelBank owns a fixed set of models. Fitting one model only writes
    that model's ParameterGroup.

Notes:
  - raw() is the FIR output d; output() applies the model's Method A
    correction g(d). The combiner always consumes output().
================================================================================
*/

#include "vdm/model/nonlinearity.hpp"
#include "vdm/model/parameters.hpp"
#include "vdm/model/signals.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vdm::model {

enum class FeatureTransform : std::uint8_t {
  Identity = 0,
  SignedSquare = 1,  // v*|v|, drag-like
  Abs = 2
};

const char* to_string(FeatureTransform t) noexcept;
bool parse_feature_transform(const std::string& s, FeatureTransform* out) noexcept;
double apply_transform(FeatureTransform t, double v) noexcept;

// One windowed input: taps s_k, s_{k-1}, ..., s_{k-taps+1} of `channel`.
struct FirInput final {
  std::string channel_name;
  std::size_t channel = 0;  // signal index
  std::size_t taps = 1;
  FeatureTransform transform = FeatureTransform::Identity;
};

class LocalModel {
 public:
  LocalModel(std::string name, NonlinearityKind correction);
  virtual ~LocalModel() = default;

  LocalModel(const LocalModel&) = default;
  LocalModel& operator=(const LocalModel&) = delete;

  const std::string& name() const noexcept { return name_; }

  virtual std::size_t feature_count() const noexcept = 0;
  virtual std::size_t history_depth() const noexcept = 0;

  // Feature vector for the current history window.
  virtual void features(const SignalHistory& history, Eigen::VectorXd& out) const = 0;

  // Uncorrected output d for a feature vector.
  virtual double raw(const Eigen::VectorXd& f) const = 0;

  double output(const Eigen::VectorXd& f) const { return correction_.apply(raw(f)); }

  // Weighted ridge least squares: minimize sum_k (w_k * raw(F_k) - y_k)^2.
  // Rows with w_k == 0 do not constrain the fit.
  virtual void fit(const Eigen::MatrixXd& F, const Eigen::VectorXd& weight,
                   const Eigen::VectorXd& target, double ridge) = 0;

  virtual std::unique_ptr<LocalModel> clone() const = 0;

  // Own parameter groups (main weights first, correction last).
  virtual std::vector<ParameterGroup*> parameters() = 0;
  virtual std::vector<const ParameterGroup*> parameters() const = 0;

  PolynomialCorrection& correction() noexcept { return correction_; }
  const PolynomialCorrection& correction() const noexcept { return correction_; }

 private:
  std::string name_;
  PolynomialCorrection correction_;
};

class FirLocalModel final : public LocalModel {
 public:
  FirLocalModel(std::string name, std::vector<FirInput> inputs,
                NonlinearityKind correction = NonlinearityKind::None);

  const std::vector<FirInput>& inputs() const noexcept { return inputs_; }

  std::size_t feature_count() const noexcept override { return features_; }
  std::size_t history_depth() const noexcept override { return depth_; }

  void features(const SignalHistory& history, Eigen::VectorXd& out) const override;
  double raw(const Eigen::VectorXd& f) const override;
  void fit(const Eigen::MatrixXd& F, const Eigen::VectorXd& weight,
           const Eigen::VectorXd& target, double ridge) override;

  std::unique_ptr<LocalModel> clone() const override;

  std::vector<ParameterGroup*> parameters() override;
  std::vector<const ParameterGroup*> parameters() const override;

  // Weights (features_ rows) followed by the bias.
  const ParameterGroup& weights() const noexcept { return theta_; }

 private:
  std::vector<FirInput> inputs_;
  std::size_t features_ = 0;
  std::size_t depth_ = 1;
  ParameterGroup theta_;
};

class LocalModelBank final {
 public:
  LocalModelBank() = default;
  explicit LocalModelBank(std::vector<std::unique_ptr<LocalModel>> models);

  LocalModelBank(LocalModelBank&&) noexcept = default;
  LocalModelBank& operator=(LocalModelBank&&) noexcept = default;
  LocalModelBank(const LocalModelBank&) = delete;
  LocalModelBank& operator=(const LocalModelBank&) = delete;

  LocalModelBank clone() const;

  std::size_t size() const noexcept { return models_.size(); }

  LocalModel& get(std::size_t i);
  const LocalModel& get(std::size_t i) const;

  std::vector<const LocalModel*> all() const;

  std::size_t find(const std::string& name) const noexcept;
  std::size_t max_history_depth() const noexcept;

  std::vector<ParameterGroup*> parameters();
  std::vector<const ParameterGroup*> parameters() const;

  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

 private:
  std::vector<std::unique_ptr<LocalModel>> models_;
};

}  // namespace vdm::model
