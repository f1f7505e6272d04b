#pragma once
/*
================================================================================
Fragment 3.1 - Model: Parameter Groups (Stage Gate)
FILE: cpp/vdm/model/parameters.hpp

Purpose:
  - Every trainable quantity in vdm lives in a named ParameterGroup with an
    explicit frozen/mutable flag.
  - Stage transitions (phase-1 -> phase-2 of the recurrent learner, forward
    -> inverse training) freeze groups; any later write fails loudly with
    FrozenParameterViolation instead of relying on convention.

Notes:
  - Reads are always allowed. Only assign/set/add_scaled check the flag.
================================================================================
*/

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace vdm::model {

class ParameterGroup final {
 public:
  ParameterGroup() = default;
  ParameterGroup(std::string name, Eigen::Index rows, Eigen::Index cols, double fill = 0.0);

  const std::string& name() const noexcept { return name_; }
  Eigen::Index rows() const noexcept { return value_.rows(); }
  Eigen::Index cols() const noexcept { return value_.cols(); }
  Eigen::Index size() const noexcept { return value_.size(); }

  bool frozen() const noexcept { return frozen_; }
  void freeze() noexcept { frozen_ = true; }
  void unfreeze() noexcept { frozen_ = false; }

  const Eigen::MatrixXd& value() const noexcept { return value_; }
  double at(Eigen::Index r, Eigen::Index c = 0) const { return value_(r, c); }

  // Mutators. Throw FrozenParameterViolation when frozen, ValidationError on
  // shape mismatch or non-finite input.
  void assign(const Eigen::MatrixXd& m);
  void set(Eigen::Index r, Eigen::Index c, double v);
  void add_scaled(const Eigen::MatrixXd& delta, double scale);

  // Flattened (column-major) view for optimizers that treat parameters as a
  // single vector.
  Eigen::VectorXd flat() const;
  void assign_flat(const Eigen::VectorXd& v);

 private:
  void require_mutable(const char* op) const;

  std::string name_;
  Eigen::MatrixXd value_;
  bool frozen_ = false;
};

// Freeze/inspect helpers over a set of groups.
void freeze_all(const std::vector<ParameterGroup*>& groups) noexcept;
bool all_frozen(const std::vector<const ParameterGroup*>& groups) noexcept;

}  // namespace vdm::model
