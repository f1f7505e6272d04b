#pragma once
/*
================================================================================
Fragment 3.6 - Model: Superposition Combiner
FILE: cpp/vdm/model/superposition.hpp

Purpose:
  - total = sum_i sign_i * phi_i * g_i(LocalModel_i(features_i))
  - No renormalization across gates: brake and throttle terms may both be
    active at the same step.

Contract:
  - A gate with phi == 0 contributes exactly 0 and its local model is not
    evaluated (degenerate inputs cannot leak NaN into the sum).
  - phi outside [0,1] or a non-finite local output is a NumericalError.
  - The gate list is whatever the caller passes, in order.
================================================================================
*/

#include "vdm/model/gate.hpp"
#include "vdm/model/local_model.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace vdm::model {

struct SuperpositionTerm final {
  std::string gate;
  std::size_t model_index = 0;
  double activation = 0.0;    // phi
  double raw = 0.0;           // d = LocalModel(features)
  double local_output = 0.0;  // g(d)
  double contribution = 0.0;  // sign * phi * g(d)
  bool evaluated = false;
};

struct SuperpositionResult final {
  double total = 0.0;
  std::vector<SuperpositionTerm> terms;
};

class SuperpositionCombiner final {
 public:
  // features[m] is the feature vector for bank model m.
  SuperpositionResult combine(const std::vector<const Gate*>& gates,
                              const LocalModelBank& bank,
                              const GateContext& ctx,
                              const std::vector<Eigen::VectorXd>& features) const;

  // Total only; same arithmetic as combine().
  double total(const std::vector<const Gate*>& gates,
               const LocalModelBank& bank,
               const GateContext& ctx,
               const std::vector<Eigen::VectorXd>& features) const;
};

}  // namespace vdm::model
