/*
================================================================================
Fragment 8.0 - CLI: Main Entry Point (vdm_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line harness around the vdm engine: trains, evaluates, augments
    and checks models from a JSON model config and CSV episode folders.
  - Persists trained parameters as JSON snapshots between commands.

Usage:
  vdm_cli <command> [--key value ...]

Hardening:
  - Explicit exit codes for CI integration
  - Every engine exception mapped to a documented exit code
  - Deterministic output format
================================================================================
*/

#include "vdm/augment/augmenter.hpp"
#include "vdm/config/model_config.hpp"
#include "vdm/core/errors.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/settings.hpp"
#include "vdm/data/episode_csv.hpp"
#include "vdm/data/reference_vehicle.hpp"
#include "vdm/exports/metrics_csv.hpp"
#include "vdm/exports/parameter_snapshot.hpp"
#include "vdm/exports/report_json.hpp"
#include "vdm/fuzzy/membership.hpp"
#include "vdm/model/forward_trainer.hpp"
#include "vdm/model/inverse_model.hpp"
#include "vdm/stability/stability.hpp"
#include "vdm/stats/metrics.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vdm;

namespace {

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4,
  UNSTABLE = 5
};

void print_help() {
  std::cout << R"(
vdm_cli - Fuzzy-gated local-model vehicle dynamics engine

Usage:
  vdm_cli <command> [options]

Commands:
  config-template  Print the built-in racing-car model config
                     [--out <path>]
  simulate         Write reference-vehicle episodes as CSV
                     --out-dir <dir> [--episodes N] [--steps N] [--seed S]
  encode           Fuzzy activations of one operating variable
                     --config <path> --variable <name> --value <x>
  train-forward    Train + freeze the forward model
                     --config <path> --data <dir> --out <params.json>
                     [--report <path>]
  evaluate         Free-run and one-step accuracy of a forward model
                     --config <path> --forward <params.json> --data <dir>
                     [--report <path>] [--csv <path>]
  augment          Crossover/mutation of a corpus
                     --config <path> --data <dir> --out-dir <dir>
                     [--provenance <path>] [--threads N]
  train-inverse    Train the inverse model against a frozen forward model
                     --config <path> --forward <params.json> --data <dir>
                     --out <params.json> [--augment 0|1] [--report <path>]
  stability        Closed-loop pole check of an inverse model
                     --config <path> --forward <params.json>
                     --inverse <params.json> [--report <path>]
  demo             End-to-end run on synthetic reference-vehicle data
                     [--episodes N] [--steps N] [--seed S] [--out-dir <dir>]
  help             Show this help message

Common options:
  --log-level debug|info|warn|error

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed (config, stage order, incompatible data)
  3 - Computation failed
  4 - I/O error
  5 - Closed loop unstable
)";
}

// ----------------------------- arguments -------------------------------------

struct Args {
  std::map<std::string, std::string> kv;

  bool has(const std::string& k) const { return kv.count(k) != 0; }

  std::string get(const std::string& k, const std::string& fallback = std::string()) const {
    auto it = kv.find(k);
    return it == kv.end() ? fallback : it->second;
  }

  std::string require(const std::string& k) const {
    auto it = kv.find(k);
    if (it == kv.end() || it->second.empty()) throw std::invalid_argument("--" + k + " is required");
    return it->second;
  }
};

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool parse_size(const std::string& s, std::size_t* out) {
  if (s.empty() || !out) return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  *out = static_cast<std::size_t>(v);
  return true;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    if (std::strncmp(k, "--", 2) != 0 || k[2] == '\0') {
      if (err) *err = std::string("unexpected argument '") + k + "'";
      return false;
    }
    const char* v = nullptr;
    if (!get_next(i, argc, argv, &v)) {
      if (err) *err = std::string(k) + " requires a value";
      return false;
    }
    a->kv[k + 2] = v;
  }
  return true;
}

std::size_t size_option(const Args& a, const std::string& k, std::size_t fallback) {
  if (!a.has(k)) return fallback;
  std::size_t v = 0;
  if (!parse_size(a.get(k), &v)) throw std::invalid_argument("--" + k + " must be a non-negative integer");
  return v;
}

// ----------------------------- helpers ---------------------------------------

std::string read_text_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw IOError("cannot open '" + path + "'");
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

void write_or_throw(const std::string& text, const std::string& path) {
  if (!exports::write_text_file(text, path)) throw IOError("cannot write '" + path + "'");
}

void ensure_dir(const std::string& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) throw IOError("cannot create directory '" + dir + "': " + ec.message());
}

config::ModelConfig load_config(const Args& a) {
  config::ModelConfig cfg = config::load_model_config_file(a.require("config"));
  if (!a.has("log-level")) set_log_level(cfg.log_level);
  return cfg;
}

std::shared_ptr<model::ForwardModel> load_forward(const config::ModelConfig& cfg, const std::string& path) {
  auto fwd = std::make_shared<model::ForwardModel>(config::make_forward_model(cfg));
  exports::restore_forward_snapshot(read_text_file(path), *fwd);
  return fwd;
}

void print_channels(const char* title, const std::vector<std::string>& names, const std::vector<double>& v) {
  std::cout << "  " << title << ":";
  for (std::size_t i = 0; i < v.size(); ++i) {
    std::cout << " " << (i < names.size() ? names[i] : std::to_string(i)) << "=" << v[i];
  }
  std::cout << "\n";
}

void print_metrics(const stats::EvaluationMetrics& m) {
  std::cout << "  [" << m.mode << "] episodes=" << m.episodes << " time=" << m.compute_time_ms << " ms ("
            << m.time_per_step_us << " us/step)\n";
  for (const auto& c : m.channels) {
    std::cout << "    " << std::setw(8) << c.channel << "  rmse=" << c.rmse << "  max=" << c.max_abs
              << "  bias=" << c.mean << "\n";
  }
}

void print_stability(const stability::StabilityReport& r) {
  std::cout << "  verdict: " << stability::to_string(r.verdict) << "\n";
  std::cout << "  spectral radius: " << r.spectral_radius << " (margin " << r.margin << ")\n";
  if (r.warning) std::cout << "  warning: " << r.warning->message << "\n";
}

std::vector<data::Episode> training_corpus(const std::vector<data::Episode>& recorded,
                                           const std::vector<augment::AugmentedEpisode>& augmented) {
  std::vector<data::Episode> out = recorded;
  for (const auto& a : augmented) out.push_back(a.episode);
  return out;
}

// ----------------------------- commands --------------------------------------

int cmd_config_template(const Args& a) {
  const std::string text = config::model_config_to_json(config::default_vehicle_config());
  if (a.has("out")) {
    write_or_throw(text, a.get("out"));
    std::cout << "Wrote " << a.get("out") << "\n";
  } else {
    std::cout << text;
  }
  return SUCCESS;
}

int cmd_simulate(const Args& a) {
  const std::string dir = a.require("out-dir");
  const std::size_t episodes = size_option(a, "episodes", 6);
  const std::size_t steps = size_option(a, "steps", 600);
  const std::uint64_t seed = size_option(a, "seed", 1);

  const data::ReferenceVehicleParams p;
  const auto corpus = data::simulate_reference_corpus(p, episodes, steps, seed);
  const model::ChannelLayout layout = config::default_vehicle_config().layout();

  ensure_dir(dir);
  for (const auto& e : corpus) {
    const std::string path = (std::filesystem::path(dir) / (e.id() + ".csv")).string();
    if (!data::write_episode_csv(e, layout, path)) throw IOError("cannot write '" + path + "'");
  }
  std::cout << "Wrote " << corpus.size() << " episodes x " << steps << " samples to " << dir << "\n";
  return SUCCESS;
}

int cmd_encode(const Args& a) {
  const config::ModelConfig cfg = load_config(a);
  const std::string var = a.require("variable");
  double x = 0.0;
  if (!parse_double(a.require("value").c_str(), &x)) throw std::invalid_argument("--value must be a finite number");

  for (const auto& ov : cfg.operating_variables) {
    if (ov.name != var) continue;
    const fuzzy::MembershipEncoder enc(cfg.settings.numerics.partition_tol);
    const std::vector<double> act = enc.encode(x, ov.set);
    std::cout << "Operating variable: " << ov.name << " (channel " << ov.channel << ")\n";
    for (std::size_t i = 0; i < act.size(); ++i) {
      std::cout << "  " << ov.set.functions[i].name << ": " << act[i] << "\n";
    }
    return SUCCESS;
  }
  throw ValidationError("unknown operating variable '" + var + "'");
}

int cmd_train_forward(const Args& a) {
  const config::ModelConfig cfg = load_config(a);
  const auto corpus = data::read_corpus_folder(a.require("data"), cfg.layout());
  const std::string out = a.require("out");

  model::ForwardModel fwd = config::make_forward_model(cfg);
  const model::ForwardModelTrainer trainer(cfg.settings.training, cfg.settings.numerics);
  const model::ForwardTrainingReport rep = trainer.train(fwd, corpus);

  write_or_throw(exports::forward_snapshot(fwd), out);
  if (a.has("report")) write_or_throw(exports::forward_report_to_json(rep, fwd), a.get("report"));

  std::cout << "=== Forward Model Training ===\n";
  std::cout << "  episodes: " << rep.episodes << "  rows: " << rep.rows << "\n";
  print_channels("derivative rmse (linear)", cfg.state_channels, rep.derivative_rmse_linear);
  print_channels("derivative rmse (corrected)", cfg.state_channels, rep.derivative_rmse);
  print_channels("one-step rmse", cfg.state_channels, rep.one_step_rmse);
  std::cout << "  recurrent: " << model::to_string(fwd.recurrent().phase()) << "\n";
  std::cout << "  stage: " << model::to_string(fwd.stage()) << "\n";
  std::cout << "Wrote " << out << "\n";
  return SUCCESS;
}

int cmd_evaluate(const Args& a) {
  const config::ModelConfig cfg = load_config(a);
  const auto fwd = load_forward(cfg, a.require("forward"));
  const auto corpus = data::read_corpus_folder(a.require("data"), cfg.layout());

  const stats::EvaluationMetrics free_run = stats::evaluate_forward(*fwd, corpus, stats::ForwardEvalMode::FreeRun);
  const stats::EvaluationMetrics one_step = stats::evaluate_forward(*fwd, corpus, stats::ForwardEvalMode::OneStep);

  std::cout << "=== Forward Model Evaluation ===\n";
  print_metrics(free_run);
  print_metrics(one_step);

  if (a.has("report")) {
    write_or_throw("[\n" + exports::metrics_to_json(free_run) + ",\n" + exports::metrics_to_json(one_step) + "]\n",
                   a.get("report"));
  }
  if (a.has("csv") && !exports::write_metrics_csv_file({free_run, one_step}, a.get("csv"))) {
    throw IOError("cannot write '" + a.get("csv") + "'");
  }
  return SUCCESS;
}

int cmd_augment(const Args& a) {
  const config::ModelConfig cfg = load_config(a);
  const auto corpus = data::read_corpus_folder(a.require("data"), cfg.layout());
  const std::string dir = a.require("out-dir");
  const std::size_t threads = size_option(a, "threads", static_cast<std::size_t>(cfg.settings.training.threads));

  const augment::EpisodeAugmenter aug(cfg.settings.numerics, cfg.settings.augment);
  const auto out = aug.augment_corpus(corpus, config::make_augment_plan(cfg), threads);

  ensure_dir(dir);
  const model::ChannelLayout layout = cfg.layout();
  for (const auto& e : out) {
    const std::string path = (std::filesystem::path(dir) / (e.episode.id() + ".csv")).string();
    if (!data::write_episode_csv(e.episode, layout, path)) throw IOError("cannot write '" + path + "'");
  }
  if (a.has("provenance")) write_or_throw(exports::provenance_to_json(out), a.get("provenance"));

  std::cout << "Wrote " << out.size() << " augmented episodes to " << dir << "\n";
  return SUCCESS;
}

int cmd_train_inverse(const Args& a) {
  const config::ModelConfig cfg = load_config(a);
  const auto fwd = load_forward(cfg, a.require("forward"));
  const auto recorded = data::read_corpus_folder(a.require("data"), cfg.layout());
  const std::string out = a.require("out");

  std::vector<data::Episode> corpus = recorded;
  if (a.get("augment", "1") == "1") {
    const augment::EpisodeAugmenter aug(cfg.settings.numerics, cfg.settings.augment);
    const std::size_t threads = static_cast<std::size_t>(cfg.settings.training.threads);
    corpus = training_corpus(recorded, aug.augment_corpus(recorded, config::make_augment_plan(cfg), threads));
  }

  model::InverseModel inv(fwd, config::make_inverse_spec(cfg));
  const model::InverseModelTrainer trainer(cfg.settings.training, cfg.settings.numerics);
  const model::InverseTrainingReport rep = trainer.train(inv, corpus);

  write_or_throw(exports::inverse_snapshot(inv), out);
  if (a.has("report")) write_or_throw(exports::inverse_report_to_json(rep), a.get("report"));

  std::cout << "=== Inverse Model Training ===\n";
  std::cout << "  sequences: " << rep.sequences << "\n";
  std::cout << "  loss: " << rep.initial_loss << " -> " << rep.final_loss << " (" << rep.trace.stop_reason << ")\n";
  std::cout << "Wrote " << out << "\n";
  return SUCCESS;
}

int cmd_stability(const Args& a) {
  const config::ModelConfig cfg = load_config(a);
  const auto fwd = load_forward(cfg, a.require("forward"));
  model::InverseModel inv(fwd, config::make_inverse_spec(cfg));
  exports::restore_inverse_snapshot(read_text_file(a.require("inverse")), inv);

  const stability::StabilityAnalyzer analyzer(cfg.settings.numerics.stability_margin);
  const stability::StabilityReport rep = analyzer.check(inv);
  if (a.has("report")) write_or_throw(exports::stability_report_to_json(rep), a.get("report"));

  std::cout << "=== Closed-Loop Stability ===\n";
  print_stability(rep);
  return rep.stable() ? SUCCESS : UNSTABLE;
}

int cmd_demo(const Args& a) {
  const std::size_t episodes = size_option(a, "episodes", 6);
  const std::size_t steps = size_option(a, "steps", 400);
  const std::uint64_t seed = size_option(a, "seed", 1);
  if (episodes < 2) throw std::invalid_argument("--episodes must be >= 2");

  config::ModelConfig cfg = config::default_vehicle_config();
  cfg.settings.training.gate_epochs = 20;
  cfg.settings.training.inverse_epochs = 5;
  cfg.validate_or_throw();

  std::cout << "=== vdm demo: reference vehicle ===\n";
  const auto all = data::simulate_reference_corpus(data::ReferenceVehicleParams(), episodes, steps, seed);
  const std::size_t n_val = episodes / 3 > 0 ? episodes / 3 : 1;
  const std::vector<data::Episode> train(all.begin(), all.end() - static_cast<std::ptrdiff_t>(n_val));
  const std::vector<data::Episode> val(all.end() - static_cast<std::ptrdiff_t>(n_val), all.end());
  std::cout << "  episodes: " << train.size() << " train / " << val.size() << " validation, " << steps
            << " samples each\n";

  auto fwd = std::make_shared<model::ForwardModel>(config::make_forward_model(cfg));
  const model::ForwardModelTrainer ftrainer(cfg.settings.training, cfg.settings.numerics);
  const model::ForwardTrainingReport frep = ftrainer.train(*fwd, train);
  std::cout << "\nForward model (" << model::to_string(fwd->stage()) << ")\n";
  print_channels("one-step rmse (train)", cfg.state_channels, frep.one_step_rmse);
  const stats::EvaluationMetrics free_run = stats::evaluate_forward(*fwd, val, stats::ForwardEvalMode::FreeRun);
  print_metrics(free_run);

  const augment::EpisodeAugmenter aug(cfg.settings.numerics, cfg.settings.augment);
  const auto augmented = aug.augment_corpus(train, config::make_augment_plan(cfg),
                                            static_cast<std::size_t>(cfg.settings.training.threads));
  std::cout << "\nAugmentation: " << augmented.size() << " episodes\n";
  for (const auto& e : augmented) {
    std::cout << "  " << e.episode.id() << "  " << augment::to_string(e.provenance.op) << " of";
    for (const auto& p : e.provenance.parents) std::cout << " " << p;
    std::cout << "\n";
  }

  model::InverseModel inv(fwd, config::make_inverse_spec(cfg));
  const model::InverseModelTrainer itrainer(cfg.settings.training, cfg.settings.numerics);
  const model::InverseTrainingReport irep = itrainer.train(inv, training_corpus(train, augmented));
  std::cout << "\nInverse model: loss " << irep.initial_loss << " -> " << irep.final_loss << " ("
            << irep.trace.stop_reason << ")\n";
  print_metrics(stats::evaluate_inverse(inv, val));

  const stability::StabilityAnalyzer analyzer(cfg.settings.numerics.stability_margin);
  const stability::StabilityReport srep = analyzer.check(inv);
  std::cout << "\nStability\n";
  print_stability(srep);

  if (a.has("out-dir")) {
    const std::filesystem::path dir(a.get("out-dir"));
    ensure_dir(dir.string());
    write_or_throw(config::model_config_to_json(cfg), (dir / "model_config.json").string());
    write_or_throw(exports::forward_snapshot(*fwd), (dir / "forward_params.json").string());
    write_or_throw(exports::inverse_snapshot(inv), (dir / "inverse_params.json").string());
    write_or_throw(exports::forward_report_to_json(frep, *fwd), (dir / "forward_report.json").string());
    write_or_throw(exports::inverse_report_to_json(irep), (dir / "inverse_report.json").string());
    write_or_throw(exports::stability_report_to_json(srep), (dir / "stability.json").string());
    write_or_throw(exports::provenance_to_json(augmented), (dir / "provenance.json").string());
    std::cout << "\nWrote reports to " << dir.string() << "\n";
  }
  return SUCCESS;
}

int dispatch(const std::string& cmd, const Args& a) {
  if (cmd == "config-template") return cmd_config_template(a);
  if (cmd == "simulate") return cmd_simulate(a);
  if (cmd == "encode") return cmd_encode(a);
  if (cmd == "train-forward") return cmd_train_forward(a);
  if (cmd == "evaluate") return cmd_evaluate(a);
  if (cmd == "augment") return cmd_augment(a);
  if (cmd == "train-inverse") return cmd_train_inverse(a);
  if (cmd == "stability") return cmd_stability(a);
  if (cmd == "demo") return cmd_demo(a);

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'vdm_cli help' for usage information.\n";
  return INVALID_ARGS;
}

}  // namespace

int main(int argc, char** argv) {
  const std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return SUCCESS;
  }

  Args args;
  std::string err;
  if (!parse_args(argc, argv, &args, &err)) {
    std::cerr << "Error: " << err << "\n";
    return INVALID_ARGS;
  }
  if (args.has("log-level")) {
    LogLevel lvl = LogLevel::INFO;
    if (!parse_log_level(args.get("log-level"), &lvl)) {
      std::cerr << "Error: unknown log level '" << args.get("log-level") << "'\n";
      return INVALID_ARGS;
    }
    set_log_level(lvl);
  }

  try {
    return dispatch(cmd, args);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return INVALID_ARGS;
  } catch (const IOError& e) {
    std::cerr << "I/O error: " << e.what() << "\n";
    return IO_ERROR;
  } catch (const NumericalError& e) {
    std::cerr << "Computation FAILED: " << e.what() << "\n";
    return COMPUTATION_FAILED;
  } catch (const DegenerateEncodingError& e) {
    std::cerr << "Computation FAILED: " << e.what() << "\n";
    return COMPUTATION_FAILED;
  } catch (const VdmError& e) {
    // Validation, configuration, stage-order and incompatible-data errors.
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return VALIDATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return COMPUTATION_FAILED;
  }
}
