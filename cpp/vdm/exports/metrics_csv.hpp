#pragma once
/*
================================================================================
Fragment 7.3 - Exports: Metrics CSV
FILE: cpp/vdm/exports/metrics_csv.hpp

Purpose:
  - One row per (evaluation, channel) so several runs (free-run, one-step,
    inverse tracking) can be compared in one table.

Hardening:
  - Explicit CSV escaping for strings with delimiters/quotes
  - NaN/unset values export as empty string (not "nan")
  - Stable column ordering
================================================================================
*/

#include "vdm/stats/metrics.hpp"

#include <string>
#include <vector>

namespace vdm::exports {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
};

std::string metrics_csv_header(const CsvExportOptions& opt = CsvExportOptions());

// Rows for every channel of `m`, each terminated by a newline.
std::string metrics_to_csv_rows(const stats::EvaluationMetrics& m, const CsvExportOptions& opt = CsvExportOptions());

// Returns true on success, false on I/O error.
bool write_metrics_csv_file(const std::vector<stats::EvaluationMetrics>& runs, const std::string& file_path,
                            const CsvExportOptions& opt = CsvExportOptions());

}  // namespace vdm::exports
