/*
  Fragment 8.3 - Stats + Metrics Export Selftest

  Framework-free checks of the streaming accumulator, per-channel error
  accumulation and the CSV / JSON metric emitters.

  Non-zero return code indicates failure.
*/

#include "vdm/config/json.hpp"
#include "vdm/core/errors.hpp"
#include "vdm/core/selftest.hpp"
#include "vdm/exports/metrics_csv.hpp"
#include "vdm/exports/report_json.hpp"
#include "vdm/stats/metrics.hpp"
#include "vdm/stats/online_stats.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace vdm;
using namespace vdm::stats;
using namespace vdm::selftest;

namespace {

void test_online_stats() {
  OnlineStats a;
  for (double x : {1.0, 2.0, 3.0, 4.0}) a.push(x);
  a.push(std::numeric_limits<double>::quiet_NaN());
  expect_true(a.count() == 4 && a.rejected == 1, "non-finite samples counted as rejected");
  expect_near(a.mean, 2.5, 1e-15, "mean");
  expect_near(a.variance_population(), 1.25, 1e-15, "population variance");
  expect_near(a.rms(), std::sqrt(7.5), 1e-15, "rms");
  expect_near(a.max_abs(), 4.0, 0.0, "max |x|");

  OnlineStats lo, hi;
  for (double x : {1.0, 2.0}) lo.push(x);
  for (double x : {3.0, 4.0}) hi.push(x);
  lo.merge(hi);
  expect_near(lo.mean, a.mean, 1e-15, "merged mean");
  expect_near(lo.variance_population(), a.variance_population(), 1e-15, "merged variance");
  expect_true(lo.min() == 1.0 && lo.max() == 4.0, "merged extrema");

  OnlineStats empty;
  expect_true(empty.rms() == 0.0 && empty.max_abs() == 0.0, "empty accumulator reports 0");
}

void test_accumulate_errors() {
  const model::Trajectory ref = {Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(1.0, 1.0)};
  const model::Trajectory pred = {Eigen::Vector2d(0.5, 0.0), Eigen::Vector2d(1.0, -1.0)};
  std::vector<OnlineStats> acc;
  accumulate_errors(pred, ref, acc);
  expect_true(acc.size() == 2, "one accumulator per channel");
  expect_near(acc[0].rms(), std::sqrt(0.125), 1e-15, "channel 0 rms");
  expect_near(acc[1].max_abs(), 2.0, 0.0, "channel 1 max error");
  expect_near(acc[1].mean, -1.0, 1e-15, "channel 1 bias");

  const model::Trajectory short_ref = {Eigen::Vector2d(0.0, 0.0)};
  expect_throws<ValidationError>([&] { accumulate_errors(pred, short_ref, acc); }, "length mismatch rejected");
}

EvaluationMetrics sample_metrics() {
  EvaluationMetrics m;
  m.mode = "free_run";
  m.episodes = 2;
  ChannelError vx;
  vx.channel = "vx";
  vx.rmse = 0.25;
  vx.max_abs = 1.0;
  vx.samples = 100;
  ChannelError r;
  r.channel = "r";
  r.rmse = std::numeric_limits<double>::quiet_NaN();
  m.channels = {vx, r};
  m.compute_time_ms = 3.5;
  return m;
}

void test_metric_exports() {
  const EvaluationMetrics m = sample_metrics();
  const std::string rows = exports::metrics_to_csv_rows(m);
  expect_true(std::count(rows.begin(), rows.end(), '\n') == 2, "one csv row per channel");
  expect_true(rows.find("free_run,2,vx,0.25,") == 0, "csv row layout");
  expect_true(rows.find(",r,,") != std::string::npos, "NaN written as an empty cell");
  expect_true(exports::metrics_csv_header().rfind("mode,", 0) == 0, "csv header");

  config::JsonValue v;
  expect_true(config::parse_json(exports::metrics_to_json(m), &v), "metrics json parses");
  const config::JsonValue* chans = v.find("channels");
  expect_true(chans && chans->is_array() && chans->arr.size() == 2, "channels listed");
}

}  // namespace

int main() {
  run_case("online stats", test_online_stats);
  run_case("accumulate errors", test_accumulate_errors);
  run_case("metric exports", test_metric_exports);
  return exit_code();
}
