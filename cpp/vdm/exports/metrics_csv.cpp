#include "vdm/exports/metrics_csv.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace vdm::exports {

// Quote if the field contains the delimiter, a quote or a newline.
static std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }
  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

static std::string csv_double(double x, int precision = 9) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::setprecision(precision) << x;
  return oss.str();
}

std::string metrics_csv_header(const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  std::ostringstream h;
  h << "mode" << d << "episodes" << d << "channel" << d << "rmse" << d << "max_abs" << d << "mean" << d
    << "samples" << d << "compute_time_ms" << d << "time_per_step_us";
  return h.str();
}

std::string metrics_to_csv_rows(const stats::EvaluationMetrics& m, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  std::ostringstream rows;
  for (const auto& c : m.channels) {
    rows << csv_escape(m.mode, d) << d << m.episodes << d << csv_escape(c.channel, d) << d << csv_double(c.rmse) << d
         << csv_double(c.max_abs) << d << csv_double(c.mean) << d << c.samples << d
         << csv_double(m.compute_time_ms) << d << csv_double(m.time_per_step_us) << "\n";
  }
  return rows.str();
}

bool write_metrics_csv_file(const std::vector<stats::EvaluationMetrics>& runs, const std::string& file_path,
                            const CsvExportOptions& opt) {
  std::ofstream ofs(file_path);
  if (!ofs.is_open()) return false;
  if (opt.include_header) ofs << metrics_csv_header(opt) << "\n";
  for (const auto& m : runs) ofs << metrics_to_csv_rows(m, opt);
  return static_cast<bool>(ofs);
}

}  // namespace vdm::exports
