#include "vdm/model/local_model.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/require.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace vdm::model {

const char* to_string(FeatureTransform t) noexcept {
  switch (t) {
    case FeatureTransform::Identity: return "identity";
    case FeatureTransform::SignedSquare: return "signed_square";
    case FeatureTransform::Abs: return "abs";
    default: return "identity";
  }
}

bool parse_feature_transform(const std::string& s, FeatureTransform* out) noexcept {
  if (!out) return false;
  if (s == "identity") { *out = FeatureTransform::Identity; return true; }
  if (s == "signed_square") { *out = FeatureTransform::SignedSquare; return true; }
  if (s == "abs") { *out = FeatureTransform::Abs; return true; }
  return false;
}

double apply_transform(FeatureTransform t, double v) noexcept {
  switch (t) {
    case FeatureTransform::SignedSquare: return v * std::fabs(v);
    case FeatureTransform::Abs: return std::fabs(v);
    case FeatureTransform::Identity:
    default: return v;
  }
}

// ----------------------------- LocalModel ------------------------------------

LocalModel::LocalModel(std::string name, NonlinearityKind correction)
    : name_(std::move(name)), correction_(correction, name_) {
  VDM_REQUIRE(!name_.empty(), ValidationError, "LocalModel: empty name");
}

// ----------------------------- FirLocalModel ---------------------------------

FirLocalModel::FirLocalModel(std::string name, std::vector<FirInput> inputs, NonlinearityKind correction)
    : LocalModel(std::move(name), correction), inputs_(std::move(inputs)) {
  VDM_REQUIRE(!inputs_.empty(), ValidationError, "FirLocalModel '" + this->name() + "': no inputs");
  for (const auto& in : inputs_) {
    VDM_REQUIRE(in.taps >= 1, ValidationError,
                "FirLocalModel '" + this->name() + "': window on '" + in.channel_name + "' must have >= 1 tap");
    features_ += in.taps;
    depth_ = std::max(depth_, in.taps);
  }
  theta_ = ParameterGroup(this->name() + ".fir", static_cast<Eigen::Index>(features_ + 1), 1, 0.0);
}

void FirLocalModel::features(const SignalHistory& history, Eigen::VectorXd& out) const {
  VDM_REQUIRE(history.depth() >= depth_, ValidationError,
              "FirLocalModel '" + name() + "': history shallower than window");
  out.resize(static_cast<Eigen::Index>(features_));
  Eigen::Index j = 0;
  for (const auto& in : inputs_) {
    for (std::size_t lag = 0; lag < in.taps; ++lag) {
      out(j++) = apply_transform(in.transform, history.tap(in.channel, lag));
    }
  }
}

double FirLocalModel::raw(const Eigen::VectorXd& f) const {
  const Eigen::MatrixXd& th = theta_.value();
  const Eigen::Index n = static_cast<Eigen::Index>(features_);
  VDM_REQUIRE(f.size() == n, ValidationError, "FirLocalModel '" + name() + "': feature size mismatch");
  return th.col(0).head(n).dot(f) + th(n, 0);
}

void FirLocalModel::fit(const Eigen::MatrixXd& F, const Eigen::VectorXd& weight,
                        const Eigen::VectorXd& target, double ridge) {
  const Eigen::Index n = static_cast<Eigen::Index>(features_);
  VDM_REQUIRE(F.cols() == n, ValidationError, "FirLocalModel '" + name() + "': feature matrix width mismatch");
  VDM_REQUIRE(F.rows() == weight.size() && F.rows() == target.size(), ValidationError,
              "FirLocalModel '" + name() + "': fit row count mismatch");

  if (weight.squaredNorm() == 0.0) {
    log(LogLevel::DEBUG, "local_model", "'" + name() + "' never gated on; parameters kept");
    return;
  }

  Eigen::MatrixXd X(F.rows(), n + 1);
  X.leftCols(n) = weight.asDiagonal() * F;
  X.col(n) = weight;

  const double lambda = std::max(ridge, 1e-12);
  Eigen::MatrixXd A = X.transpose() * X;
  A.diagonal().array() += lambda;
  const Eigen::VectorXd rhs = X.transpose() * target;

  Eigen::LDLT<Eigen::MatrixXd> ldlt(A);
  VDM_REQUIRE(ldlt.info() == Eigen::Success, NumericalError,
              "FirLocalModel '" + name() + "': normal equations factorization failed");
  const Eigen::VectorXd sol = ldlt.solve(rhs);
  VDM_REQUIRE(sol.allFinite(), NumericalError, "FirLocalModel '" + name() + "': non-finite solution");

  theta_.assign(sol);
}

std::unique_ptr<LocalModel> FirLocalModel::clone() const {
  return std::make_unique<FirLocalModel>(*this);
}

std::vector<ParameterGroup*> FirLocalModel::parameters() {
  return {&theta_, &correction().parameters()};
}

std::vector<const ParameterGroup*> FirLocalModel::parameters() const {
  return {&theta_, &correction().parameters()};
}

// ----------------------------- LocalModelBank --------------------------------

LocalModelBank::LocalModelBank(std::vector<std::unique_ptr<LocalModel>> models) : models_(std::move(models)) {
  for (std::size_t i = 0; i < models_.size(); ++i) {
    VDM_REQUIRE(models_[i] != nullptr, ValidationError, "LocalModelBank: null model");
    for (std::size_t j = 0; j < i; ++j) {
      VDM_REQUIRE(models_[j]->name() != models_[i]->name(), ValidationError,
                  "LocalModelBank: duplicate model name '" + models_[i]->name() + "'");
    }
  }
}

LocalModelBank LocalModelBank::clone() const {
  std::vector<std::unique_ptr<LocalModel>> copy;
  copy.reserve(models_.size());
  for (const auto& m : models_) copy.push_back(m->clone());
  return LocalModelBank(std::move(copy));
}

LocalModel& LocalModelBank::get(std::size_t i) {
  VDM_REQUIRE(i < models_.size(), ValidationError, "LocalModelBank: index out of range");
  return *models_[i];
}

const LocalModel& LocalModelBank::get(std::size_t i) const {
  VDM_REQUIRE(i < models_.size(), ValidationError, "LocalModelBank: index out of range");
  return *models_[i];
}

std::vector<const LocalModel*> LocalModelBank::all() const {
  std::vector<const LocalModel*> out;
  out.reserve(models_.size());
  for (const auto& m : models_) out.push_back(m.get());
  return out;
}

std::size_t LocalModelBank::find(const std::string& name) const noexcept {
  for (std::size_t i = 0; i < models_.size(); ++i) {
    if (models_[i]->name() == name) return i;
  }
  return npos;
}

std::size_t LocalModelBank::max_history_depth() const noexcept {
  std::size_t d = 1;
  for (const auto& m : models_) d = std::max(d, m->history_depth());
  return d;
}

std::vector<ParameterGroup*> LocalModelBank::parameters() {
  std::vector<ParameterGroup*> out;
  for (auto& m : models_) {
    for (ParameterGroup* g : m->parameters()) out.push_back(g);
  }
  return out;
}

std::vector<const ParameterGroup*> LocalModelBank::parameters() const {
  std::vector<const ParameterGroup*> out;
  for (const auto& m : models_) {
    const LocalModel& cm = *m;
    for (const ParameterGroup* g : cm.parameters()) out.push_back(g);
  }
  return out;
}

}  // namespace vdm::model
