#pragma once
/*
================================================================================
Fragment 7.1 - Exports: Report JSON
FILE: cpp/vdm/exports/report_json.hpp

Purpose:
  - Deterministic JSON for training summaries, stability verdicts,
    augmentation provenance and evaluation metrics.
  - Non-finite numbers serialize as null.
  - Stable key ordering so diffs between runs are readable.
================================================================================
*/

#include "vdm/augment/augmenter.hpp"
#include "vdm/model/forward_model.hpp"
#include "vdm/model/forward_trainer.hpp"
#include "vdm/model/inverse_model.hpp"
#include "vdm/stability/stability.hpp"
#include "vdm/stats/metrics.hpp"

#include <string>
#include <vector>

namespace vdm::exports {

std::string forward_report_to_json(const model::ForwardTrainingReport& r, const model::ForwardModel& m);

std::string inverse_report_to_json(const model::InverseTrainingReport& r);

std::string stability_report_to_json(const stability::StabilityReport& r);

std::string provenance_to_json(const std::vector<augment::AugmentedEpisode>& eps);

std::string metrics_to_json(const stats::EvaluationMetrics& m);

// Write text to a file path. Returns true on success, false on failure.
bool write_text_file(const std::string& text, const std::string& file_path);

}  // namespace vdm::exports
