#include "vdm/model/parameters.hpp"

#include "vdm/core/errors.hpp"

#include <cmath>
#include <utility>

namespace vdm::model {

ParameterGroup::ParameterGroup(std::string name, Eigen::Index rows, Eigen::Index cols, double fill)
    : name_(std::move(name)), value_(Eigen::MatrixXd::Constant(rows, cols, fill)) {
  VDM_REQUIRE(rows >= 0 && cols >= 0, ValidationError, "ParameterGroup '" + name_ + "': negative shape");
}

void ParameterGroup::require_mutable(const char* op) const {
  if (frozen_) {
    throw FrozenParameterViolation("ParameterGroup '" + name_ + "' is frozen; " + op + " rejected");
  }
}

void ParameterGroup::assign(const Eigen::MatrixXd& m) {
  require_mutable("assign");
  VDM_REQUIRE(m.rows() == value_.rows() && m.cols() == value_.cols(), ValidationError,
              "ParameterGroup '" + name_ + "': assign shape mismatch");
  VDM_REQUIRE(m.allFinite(), ValidationError, "ParameterGroup '" + name_ + "': non-finite assign");
  value_ = m;
}

void ParameterGroup::set(Eigen::Index r, Eigen::Index c, double v) {
  require_mutable("set");
  VDM_REQUIRE(r >= 0 && r < value_.rows() && c >= 0 && c < value_.cols(), ValidationError,
              "ParameterGroup '" + name_ + "': index out of range");
  VDM_REQUIRE(std::isfinite(v), ValidationError, "ParameterGroup '" + name_ + "': non-finite set");
  value_(r, c) = v;
}

void ParameterGroup::add_scaled(const Eigen::MatrixXd& delta, double scale) {
  require_mutable("add_scaled");
  VDM_REQUIRE(delta.rows() == value_.rows() && delta.cols() == value_.cols(), ValidationError,
              "ParameterGroup '" + name_ + "': update shape mismatch");
  Eigen::MatrixXd next = value_ + scale * delta;
  VDM_REQUIRE(next.allFinite(), NumericalError, "ParameterGroup '" + name_ + "': update produced non-finite values");
  value_ = std::move(next);
}

Eigen::VectorXd ParameterGroup::flat() const {
  return Eigen::Map<const Eigen::VectorXd>(value_.data(), value_.size());
}

void ParameterGroup::assign_flat(const Eigen::VectorXd& v) {
  require_mutable("assign_flat");
  VDM_REQUIRE(v.size() == value_.size(), ValidationError, "ParameterGroup '" + name_ + "': flat size mismatch");
  VDM_REQUIRE(v.allFinite(), ValidationError, "ParameterGroup '" + name_ + "': non-finite assign");
  Eigen::Map<Eigen::VectorXd>(value_.data(), value_.size()) = v;
}

void freeze_all(const std::vector<ParameterGroup*>& groups) noexcept {
  for (ParameterGroup* g : groups) {
    if (g) g->freeze();
  }
}

bool all_frozen(const std::vector<const ParameterGroup*>& groups) noexcept {
  for (const ParameterGroup* g : groups) {
    if (g && !g->frozen()) return false;
  }
  return true;
}

}  // namespace vdm::model
