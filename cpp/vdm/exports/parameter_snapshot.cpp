#include "vdm/exports/parameter_snapshot.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/require.hpp"

#include <utility>

namespace vdm::exports {

namespace {

const config::JsonValue& field(const config::JsonValue& o, const char* k, config::JsonType t) {
  const config::JsonValue* v = o.find(k);
  VDM_REQUIRE(v && v->t == t, ValidationError,
              std::string("parameter snapshot: missing or invalid '") + k + "' near line " + std::to_string(o.line));
  return *v;
}

}  // namespace

std::string parameters_to_json(const std::string& kind, const std::string& stage,
                               const std::vector<const model::ParameterGroup*>& groups) {
  config::JsonWriter j;
  j.obj_begin();
  j.key("kind"); j.str(kind);
  j.key("stage"); j.str(stage);
  j.key("groups");
  j.arr_begin();
  for (const model::ParameterGroup* g : groups) {
    j.obj_begin();
    j.key("name"); j.str(g->name());
    j.key("rows"); j.num_i(static_cast<long long>(g->rows()));
    j.key("cols"); j.num_i(static_cast<long long>(g->cols()));
    j.key("frozen"); j.b(g->frozen());
    j.key("values");
    j.arr_begin();
    const Eigen::VectorXd flat = g->flat();
    for (Eigen::Index i = 0; i < flat.size(); ++i) j.num(flat(i));
    j.arr_end();
    j.obj_end();
  }
  j.arr_end();
  j.obj_end();
  return j.text() + "\n";
}

void load_parameters_json(std::string_view json, const std::string& kind,
                          const std::vector<model::ParameterGroup*>& groups) {
  config::JsonValue root;
  config::JsonParseError err;
  if (!config::parse_json(json, &root, &err)) {
    throw ValidationError("parameter snapshot: " + err.describe());
  }
  VDM_REQUIRE(root.is_object(), ValidationError, "parameter snapshot: root must be an object");
  const std::string& got = field(root, "kind", config::JsonType::kStr).str;
  VDM_REQUIRE(got == kind, ValidationError, "parameter snapshot: expected kind '" + kind + "', got '" + got + "'");
  const config::JsonValue& list = field(root, "groups", config::JsonType::kArr);

  for (model::ParameterGroup* g : groups) {
    const config::JsonValue* entry = nullptr;
    for (const auto& e : list.arr) {
      const config::JsonValue* name = e.find("name");
      if (name && name->t == config::JsonType::kStr && name->str == g->name()) entry = &e;
    }
    VDM_REQUIRE(entry != nullptr, ValidationError, "parameter snapshot: missing group '" + g->name() + "'");

    const double rows = field(*entry, "rows", config::JsonType::kNum).num;
    const double cols = field(*entry, "cols", config::JsonType::kNum).num;
    VDM_REQUIRE(rows == static_cast<double>(g->rows()) && cols == static_cast<double>(g->cols()), ValidationError,
                "parameter snapshot: shape mismatch for group '" + g->name() + "'");

    const config::JsonValue& values = field(*entry, "values", config::JsonType::kArr);
    VDM_REQUIRE(static_cast<Eigen::Index>(values.arr.size()) == g->size(), ValidationError,
                "parameter snapshot: value count mismatch for group '" + g->name() + "'");
    Eigen::VectorXd flat(g->size());
    for (std::size_t i = 0; i < values.arr.size(); ++i) {
      VDM_REQUIRE(values.arr[i].t == config::JsonType::kNum, ValidationError,
                  "parameter snapshot: non-numeric value in group '" + g->name() + "'");
      flat(static_cast<Eigen::Index>(i)) = values.arr[i].num;
    }
    g->assign_flat(flat);

    if (const config::JsonValue* fz = entry->find("frozen")) {
      if (fz->t == config::JsonType::kBool && fz->b) g->freeze();
    }
  }
}

std::string forward_snapshot(const model::ForwardModel& m) {
  return parameters_to_json("forward", model::to_string(m.stage()), m.parameters());
}

void restore_forward_snapshot(std::string_view json, model::ForwardModel& m) {
  load_parameters_json(json, "forward", m.parameters());
  m.mark_trained();
  m.freeze();
}

std::string inverse_snapshot(const model::InverseModel& inv) {
  return parameters_to_json("inverse", inv.frozen() ? "FROZEN" : "TRAINED", inv.parameters());
}

void restore_inverse_snapshot(std::string_view json, model::InverseModel& inv) {
  load_parameters_json(json, "inverse", inv.parameters());
  inv.freeze();
}

}  // namespace vdm::exports
