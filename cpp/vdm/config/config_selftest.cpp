/*
  Fragment 5.4 - Config + JSON + Snapshot Selftest

  Framework-free checks:
    1) JSON parser rejects malformed input with a line/column location.
    2) JsonWriter numbers parse back to the same double; NaN -> null.
    3) Model config parse errors point at the offending value.
    4) Bad cross references fail validation.
    5) model_config_to_json(parse(x)) is stable.
    6) A forward model built from JSON trains on a plant it can represent.
    7) Parameter snapshots restore bit-identical, frozen parameters.

  Non-zero return code indicates failure.
*/

#include "vdm/config/json.hpp"
#include "vdm/config/model_config.hpp"
#include "vdm/core/errors.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/rng.hpp"
#include "vdm/core/selftest.hpp"
#include "vdm/data/episode.hpp"
#include "vdm/exports/parameter_snapshot.hpp"
#include "vdm/model/forward_trainer.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace vdm;
using namespace vdm::config;
using namespace vdm::selftest;

namespace {

const char* kTinyConfig = R"({
  "sample_time": 0.01,
  "state_channels": ["v"],
  "control_channels": ["u"],
  "integrator": "euler",
  "local_models": [
    {"name": "push", "inputs": [{"channel": "u", "window_s": 0.03}]}
  ],
  "gates": [
    {"name": "g_push", "output": "v", "model": "push", "sign": 1,
     "phi": {"type": "constant", "value": 1}}
  ],
  "log_level": "warn"
})";

// ----------------------------- json ------------------------------------------

void test_json_parser() {
  JsonValue v;
  JsonParseError err;
  expect_true(parse_json(R"({"a": [1, 2.5, -3e2], "b": {"c": null}, "s": "x\"y"})", &v, &err), "valid document");
  expect_true(v.find("a") && v.find("a")->arr.size() == 3, "array parsed");
  expect_near(v.find("a")->arr[2].num, -300.0, 0.0, "exponent parsed");
  expect_true(v.find("b")->find("c")->is_null(), "null parsed");
  expect_true(v.find("s")->str == "x\"y", "escape parsed");

  expect_true(parse_json(R"({"k": 1, "k": 2})", &v, &err) && v.find("k")->num == 2.0, "last duplicate key wins");

  expect_true(!parse_json("{\"a\": 1} x", &v, &err), "trailing characters rejected");
  expect_true(!parse_json("[NaN]", &v, &err), "NaN literal rejected");
  expect_true(!parse_json("{\n  \"a\": tru\n}", &v, &err) && err.line == 2, "error reports its line");

  const std::string deep(300, '[');
  expect_true(!parse_json(deep, &v, &err), "nesting depth is bounded");

  expect_true(!parse_json("{\"gates\" 1}", &v, &err), "missing colon rejected");
  expect_true(err.message.find("\"gates\"") != std::string::npos && err.col == 10,
              "missing colon names the key and its column");
  expect_true(!parse_json("{\"ts\": 1e999}", &v, &err) && err.col == 8, "overflowing number points at its start");
  expect_true(!parse_json("[1, 2", &v, &err) && err.describe().find("line 1") == 0, "unterminated array described");

  expect_true(parse_json(R"(["\u00e9\ud83d\ude97"])", &v, &err), "unicode escapes parsed");
  expect_true(v.arr[0].str == "\xC3\xA9\xF0\x9F\x9A\x97", "surrogate pair decoded to UTF-8");
  expect_true(!parse_json(R"(["\udc00"])", &v, &err), "lone low surrogate rejected");
}

void test_json_writer() {
  JsonWriter j;
  j.obj_begin();
  j.key("x"); j.num(0.1);
  j.key("third"); j.num(1.0 / 3.0);
  j.key("bad"); j.num(std::numeric_limits<double>::quiet_NaN());
  j.key("list"); j.arr_begin(); j.num_i(-2); j.num_u(7); j.arr_end();
  j.key("name"); j.str("a\nb");
  j.obj_end();

  JsonValue v;
  expect_true(parse_json(j.text(), &v), "writer output parses");
  expect_true(v.find("x")->num == 0.1, "0.1 round-trips exactly");
  expect_true(v.find("third")->num == 1.0 / 3.0, "1/3 round-trips exactly");
  expect_true(v.find("bad")->is_null(), "NaN written as null");
  expect_true(v.find("list")->arr.size() == 2 && v.find("name")->str == "a\nb", "array and escaped string");
}

// ----------------------------- model config ----------------------------------

void test_config_parse() {
  ModelConfig cfg;
  JsonParseError err;
  expect_true(parse_model_config_json(kTinyConfig, &cfg, &err), "tiny config parses");
  cfg.validate_or_throw();
  expect_true(cfg.local_models.size() == 1 && cfg.local_models[0].inputs[0].taps == 3, "window_s -> 3 taps");
  expect_true(cfg.log_level == LogLevel::WARN, "log level parsed");

  const std::string wrong_type = "{\n  \"sample_time\": \"fast\"\n}";
  expect_true(!parse_model_config_json(wrong_type, &cfg, &err), "string sample_time rejected");
  expect_true(err.line == 2 && err.col == 18, "schema error points at the value");

  std::string bad_ref = kTinyConfig;
  bad_ref.replace(bad_ref.find("\"model\": \"push\""), 15, "\"model\": \"pull\"");
  ModelConfig bad;
  expect_true(parse_model_config_json(bad_ref, &bad, &err), "unknown model name still parses");
  expect_throws<ValidationError>([&] { bad.validate_or_throw(); }, "gate to unknown model fails validation");

  ModelConfig unused = cfg;
  LocalModelConfig extra = cfg.local_models[0];
  extra.name = "orphan";
  unused.local_models.push_back(extra);
  expect_throws<ValidationError>([&] { unused.validate_or_throw(); }, "model without a gate fails validation");
}

void test_config_round_trip() {
  const ModelConfig def = default_vehicle_config();
  def.validate_or_throw();
  const std::string a = model_config_to_json(def);

  ModelConfig back;
  JsonParseError err;
  expect_true(parse_model_config_json(a, &back, &err), "serialized default config parses");
  back.validate_or_throw();
  expect_true(model_config_to_json(back) == a, "config JSON round-trip is stable");
  expect_true(back.gates.size() == def.gates.size() && back.local_models.size() == def.local_models.size(),
              "gates and models preserved");
}

// ----------------------------- build + snapshot ------------------------------

std::vector<data::Episode> push_plant(std::size_t episodes, std::size_t steps) {
  // v' = 2 u
  Rng64 rng(5);
  std::vector<data::Episode> out;
  for (std::size_t e = 0; e < episodes; ++e) {
    std::vector<Eigen::VectorXd> xs, us;
    double v = 0.0;
    for (std::size_t k = 0; k < steps; ++k) {
      const double u = rng.uniform(-1.0, 1.0);
      xs.push_back(Eigen::VectorXd::Constant(1, v));
      us.push_back(Eigen::VectorXd::Constant(1, u));
      v += 0.01 * 2.0 * u;
    }
    out.push_back(data::make_uniform_episode("push-" + std::to_string(e), 0.0, 0.01, xs, us));
  }
  return out;
}

void test_build_and_snapshot() {
  ModelConfig cfg;
  JsonParseError err;
  if (!parse_model_config_json(kTinyConfig, &cfg, &err)) {
    fail("tiny config: " + err.describe());
    return;
  }

  model::ForwardModel fwd = make_forward_model(cfg);
  const model::ForwardModelTrainer trainer(cfg.settings.training, cfg.settings.numerics);
  const model::ForwardTrainingReport rep = trainer.train(fwd, push_plant(2, 200));
  expect_near(rep.one_step_rmse[0], 0.0, 1e-6, "linear plant fit exactly");
  expect_near(fwd.bank().get(0).parameters()[0]->at(0), 2.0, 1e-4, "current-tap weight recovered");

  const std::string snap = exports::forward_snapshot(fwd);
  model::ForwardModel restored = make_forward_model(cfg);
  exports::restore_forward_snapshot(snap, restored);
  expect_true(restored.frozen(), "restored model is FROZEN");

  const auto pa = static_cast<const model::ForwardModel&>(fwd).parameters();
  const auto pb = static_cast<const model::ForwardModel&>(restored).parameters();
  bool same = pa.size() == pb.size();
  for (std::size_t i = 0; same && i < pa.size(); ++i) same = pa[i]->value() == pb[i]->value();
  expect_true(same, "snapshot restores bit-identical parameters");

  model::ForwardModel other = make_forward_model(cfg);
  expect_throws<ValidationError>([&] { exports::restore_forward_snapshot("{\"kind\": \"inverse\"}", other); },
                                 "snapshot kind mismatch rejected");
  expect_throws<ValidationError>([&] { exports::restore_forward_snapshot("{", other); },
                                 "malformed snapshot rejected");
}

}  // namespace

int main() {
  set_log_level(LogLevel::ERROR);
  run_case("json parser", test_json_parser);
  run_case("json writer", test_json_writer);
  run_case("config parse", test_config_parse);
  run_case("config round trip", test_config_round_trip);
  run_case("build and snapshot", test_build_and_snapshot);
  return exit_code();
}
