#include "vdm/model/superposition.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/require.hpp"

namespace vdm::model {

namespace {

SuperpositionTerm evaluate_term(const Gate& g, const LocalModelBank& bank, const GateContext& ctx,
                                const std::vector<Eigen::VectorXd>& features) {
  SuperpositionTerm t;
  t.gate = g.name;
  t.model_index = g.model_index;
  t.activation = g.phi->evaluate(ctx);
  VDM_REQUIRE(is_finite(t.activation) && t.activation >= 0.0 && t.activation <= 1.0, NumericalError,
              "gate '" + g.name + "': activation outside [0,1]");
  if (t.activation == 0.0) return t;

  VDM_REQUIRE(g.model_index < features.size(), ValidationError,
              "gate '" + g.name + "': no features for model");
  const LocalModel& m = bank.get(g.model_index);
  t.raw = m.raw(features[g.model_index]);
  t.local_output = m.correction().apply(t.raw);
  VDM_REQUIRE(is_finite(t.local_output), NumericalError,
              "gate '" + g.name + "': local model '" + m.name() + "' produced a non-finite output");
  t.contribution = g.sign * t.activation * t.local_output;
  t.evaluated = true;
  return t;
}

}  // namespace

SuperpositionResult SuperpositionCombiner::combine(const std::vector<const Gate*>& gates,
                                                   const LocalModelBank& bank,
                                                   const GateContext& ctx,
                                                   const std::vector<Eigen::VectorXd>& features) const {
  SuperpositionResult out;
  out.terms.reserve(gates.size());
  for (const Gate* g : gates) {
    VDM_REQUIRE(g != nullptr && g->phi != nullptr, ValidationError, "SuperpositionCombiner: null gate");
    out.terms.push_back(evaluate_term(*g, bank, ctx, features));
    out.total += out.terms.back().contribution;
  }
  return out;
}

double SuperpositionCombiner::total(const std::vector<const Gate*>& gates,
                                    const LocalModelBank& bank,
                                    const GateContext& ctx,
                                    const std::vector<Eigen::VectorXd>& features) const {
  double sum = 0.0;
  for (const Gate* g : gates) {
    VDM_REQUIRE(g != nullptr && g->phi != nullptr, ValidationError, "SuperpositionCombiner: null gate");
    sum += evaluate_term(*g, bank, ctx, features).contribution;
  }
  return sum;
}

}  // namespace vdm::model
