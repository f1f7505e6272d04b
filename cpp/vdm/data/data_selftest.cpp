/*
  Fragment 4.4 - Episode Data Selftest

  Framework-free checks:
    1) Episode invariants (increasing time, consistent dimensions).
    2) CSV write/read is exact and header columns are matched by name.
    3) Malformed rows report their line.
    4) Reference-vehicle episodes are deterministic in (params, steps, seed).

  Non-zero return code indicates failure.
*/

#include "vdm/core/errors.hpp"
#include "vdm/core/selftest.hpp"
#include "vdm/data/episode.hpp"
#include "vdm/data/episode_csv.hpp"
#include "vdm/data/reference_vehicle.hpp"
#include "vdm/model/signals.hpp"

#include <Eigen/Dense>

#include <sstream>
#include <string>
#include <vector>

using namespace vdm;
using namespace vdm::data;
using namespace vdm::selftest;

namespace {

model::ChannelLayout layout_xu() {
  model::ChannelLayout l;
  l.state_names = {"vx", "vy"};
  l.control_names = {"delta"};
  return l;
}

void test_episode_invariants() {
  Sample a;
  a.t = 0.0;
  a.x = Eigen::Vector2d(1.0, 2.0);
  a.u = Eigen::VectorXd::Constant(1, 0.1);
  Sample b = a;
  b.t = 0.0;

  expect_throws<ValidationError>([&] { Episode e("dup", {a, b}); }, "non-increasing time rejected");
  b.t = 0.1;
  b.x = Eigen::VectorXd::Constant(3, 0.0);
  expect_throws<ValidationError>([&] { Episode e("dim", {a, b}); }, "dimension change rejected");
  expect_throws<ValidationError>([] { Episode e("empty", {}); }, "empty episode rejected");

  b.x = Eigen::Vector2d(1.5, 2.5);
  const Episode ok("ok", {a, b});
  expect_near(ok.sample_period(), 0.1, 1e-15, "sample period");
  expect_true(ok.state_dim() == 2 && ok.control_dim() == 1, "dimensions");
}

void test_csv_round_trip() {
  const model::ChannelLayout l = layout_xu();
  std::vector<Eigen::VectorXd> xs, us;
  for (int k = 0; k < 5; ++k) {
    xs.push_back(Eigen::Vector2d(0.1 * k + 1.0 / 3.0, -2.5e-7 * k));
    us.push_back(Eigen::VectorXd::Constant(1, 0.01 * k));
  }
  const Episode e = make_uniform_episode("run", 0.0, 0.01, xs, us);

  std::istringstream in(episode_to_csv(e, l));
  const Episode back = parse_episode_csv(in, l, "run");
  bool same = back.size() == e.size();
  for (std::size_t k = 0; same && k < e.size(); ++k) {
    same = back[k].t == e[k].t && back[k].x == e[k].x && back[k].u == e[k].u;
  }
  expect_true(same, "csv round-trip is exact");

  std::istringstream reordered("# logger v2\ndelta,extra,vy,time,vx\n0.5,9,2,0,1\n\n0.6,9,3,0.01,4\n");
  const Episode r = parse_episode_csv(reordered, l, "reordered");
  expect_true(r.size() == 2, "comment and blank lines skipped");
  expect_true(r[1].x(0) == 4.0 && r[1].x(1) == 3.0 && r[1].u(0) == 0.6, "columns matched by header name");

  std::istringstream missing("time,vx,delta\n0,1,2\n");
  expect_throws<ValidationError>([&] { (void)parse_episode_csv(missing, l, "m"); }, "missing column rejected");

  std::istringstream garbage("time,vx,vy,delta\n0,1,2,3\n0.01,1,abc,3\n");
  try {
    (void)parse_episode_csv(garbage, l, "g");
    fail("non-numeric cell accepted");
  } catch (const ValidationError& ex) {
    expect_true(std::string(ex.what()).find("line 3") != std::string::npos, "error names the bad line");
  }

  CsvOptions positional;
  positional.header = false;
  positional.delimiter = ';';
  std::istringstream plain("0;1;2;3\n0.5;4;5;6\n");
  const Episode p = parse_episode_csv(plain, l, "p", positional);
  expect_true(p.size() == 2 && p[1].u(0) == 6.0, "headerless positional columns");
}

void test_reference_vehicle() {
  const ReferenceVehicleParams params;
  const Episode a = simulate_reference_episode("a", params, 300, 17);
  const Episode b = simulate_reference_episode("a", params, 300, 17);
  const Episode c = simulate_reference_episode("a", params, 300, 18);

  bool same = a.size() == b.size();
  for (std::size_t k = 0; same && k < a.size(); ++k) same = a[k].x == b[k].x && a[k].u == b[k].u;
  expect_true(same, "same seed gives the same episode");

  bool differs = false;
  for (std::size_t k = 0; k < a.size(); ++k) differs = differs || a[k].u != c[k].u;
  expect_true(differs, "different seed gives different commands");

  bool sane = a.state_dim() == 3 && a.control_dim() == 3;
  for (std::size_t k = 0; k < a.size(); ++k) sane = sane && a[k].x.allFinite() && a[k].x(0) >= 0.0;
  expect_true(sane, "states finite and forward speed non-negative");
  expect_near(a.sample_period(), params.sample_time, 1e-12, "sampled at the configured period");

  const std::vector<Episode> corpus = simulate_reference_corpus(params, 3, 50, 1);
  expect_true(corpus.size() == 3 && corpus[2].id() == "ref-002", "corpus ids are sequential");

  ReferenceVehicleParams bad;
  bad.sample_time = 0.0;
  expect_throws<ValidationError>([&] { bad.validate_or_throw(); }, "zero sample time rejected");
  expect_throws<ValidationError>([&] { (void)simulate_reference_episode("x", params, 1, 1); },
                                 "fewer than 2 steps rejected");
}

}  // namespace

int main() {
  run_case("episode invariants", test_episode_invariants);
  run_case("csv round trip", test_csv_round_trip);
  run_case("reference vehicle", test_reference_vehicle);
  return exit_code();
}
