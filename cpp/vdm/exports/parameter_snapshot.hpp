#pragma once
/*
================================================================================
Fragment 7.2 - Exports: Parameter Snapshot
FILE: cpp/vdm/exports/parameter_snapshot.hpp

Purpose:
  - Persist trained ParameterGroups between CLI invocations
    (train-forward -> train-inverse -> stability).
  - The model structure is NOT stored; a snapshot is loaded into a model
    rebuilt from the same ModelConfig. Groups are matched by name and shape.

Format:
  {"kind":"forward","stage":"FROZEN",
   "groups":[{"name":"drag.fir","rows":2,"cols":1,"frozen":true,
              "values":[...column-major...]}, ...]}
================================================================================
*/

#include "vdm/config/json.hpp"
#include "vdm/model/forward_model.hpp"
#include "vdm/model/inverse_model.hpp"
#include "vdm/model/parameters.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace vdm::exports {

std::string parameters_to_json(const std::string& kind, const std::string& stage,
                               const std::vector<const model::ParameterGroup*>& groups);

// Assigns every group in `groups` from the snapshot and applies the stored
// frozen flags. Throws ValidationError on malformed text, a kind mismatch, a
// missing group or a shape mismatch.
void load_parameters_json(std::string_view json, const std::string& kind,
                          const std::vector<model::ParameterGroup*>& groups);

// Convenience wrappers. Loading a forward snapshot leaves the model FROZEN.
std::string forward_snapshot(const model::ForwardModel& m);
void restore_forward_snapshot(std::string_view json, model::ForwardModel& m);

std::string inverse_snapshot(const model::InverseModel& inv);
void restore_inverse_snapshot(std::string_view json, model::InverseModel& inv);

}  // namespace vdm::exports
