#include "vdm/augment/augmenter.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/parallel.hpp"
#include "vdm/core/require.hpp"
#include "vdm/core/rng.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace vdm::augment {

namespace {

void validate_channels(const std::vector<ChannelPerturbation>& chs, std::size_t dim, PerturbationKind kind,
                       const char* block) {
  if (chs.empty()) return;
  VDM_REQUIRE(chs.size() == dim, ValidationError,
              std::string("Perturbation: ") + block + " needs one entry per channel");
  for (const auto& c : chs) {
    VDM_REQUIRE(!std::isnan(c.lo) && !std::isnan(c.hi) && c.lo <= c.hi, ValidationError,
                std::string("Perturbation: ") + block + " bounds must satisfy lo <= hi");
    if (kind == PerturbationKind::Gaussian) {
      VDM_REQUIRE(is_finite(c.sigma) && c.sigma >= 0.0, ValidationError,
                  std::string("Perturbation: ") + block + " sigma must be >= 0");
    } else {
      VDM_REQUIRE(is_finite(c.scale_lo) && is_finite(c.scale_hi) && c.scale_lo <= c.scale_hi, ValidationError,
                  std::string("Perturbation: ") + block + " scale window must satisfy lo <= hi");
    }
  }
}

// Per-channel perturbation state: AR(1) noise memory or a drawn factor.
struct ChannelState {
  const ChannelPerturbation* spec = nullptr;
  double value = 0.0;
};

std::vector<ChannelState> draw_channels(const std::vector<ChannelPerturbation>& chs, PerturbationKind kind,
                                        Rng64& rng) {
  std::vector<ChannelState> out(chs.size());
  for (std::size_t i = 0; i < chs.size(); ++i) {
    out[i].spec = &chs[i];
    if (kind == PerturbationKind::Scaling) out[i].value = rng.uniform(chs[i].scale_lo, chs[i].scale_hi);
  }
  return out;
}

void perturb(Eigen::VectorXd& v, std::vector<ChannelState>& chs, const Perturbation& p, bool first, Rng64& rng) {
  for (std::size_t i = 0; i < chs.size(); ++i) {
    ChannelState& c = chs[i];
    const auto ii = static_cast<Eigen::Index>(i);
    if (p.kind == PerturbationKind::Gaussian) {
      const double xi = rng.std_normal() * c.spec->sigma;
      c.value = first ? xi : p.correlation * c.value + std::sqrt(1.0 - p.correlation * p.correlation) * xi;
      v(ii) += c.value;
    } else {
      v(ii) *= c.value;
    }
    v(ii) = clamp(v(ii), c.spec->lo, c.spec->hi);
  }
}

}  // namespace

const char* to_string(PerturbationKind k) noexcept {
  switch (k) {
    case PerturbationKind::Gaussian: return "gaussian";
    case PerturbationKind::Scaling: return "scaling";
    default: return "gaussian";
  }
}

bool parse_perturbation_kind(const std::string& s, PerturbationKind* out) noexcept {
  if (!out) return false;
  if (s == "gaussian") { *out = PerturbationKind::Gaussian; return true; }
  if (s == "scaling") { *out = PerturbationKind::Scaling; return true; }
  return false;
}

const char* to_string(AugmentOperator op) noexcept {
  switch (op) {
    case AugmentOperator::Crossover: return "crossover";
    case AugmentOperator::Mutation: return "mutation";
    default: return "mutation";
  }
}

// ----------------------------- Perturbation ----------------------------------

void Perturbation::validate(std::size_t state_dim, std::size_t control_dim) const {
  VDM_REQUIRE(is_finite(correlation) && correlation >= 0.0 && correlation < 1.0, ValidationError,
              "Perturbation: correlation must be within [0,1)");
  validate_channels(state, state_dim, kind, "state");
  validate_channels(control, control_dim, kind, "control");
}

std::string Perturbation::describe() const {
  std::ostringstream oss;
  oss << std::setprecision(17);  // round-trip exact; the text feeds the fingerprint
  oss << to_string(kind) << " rho=" << correlation;
  auto block = [&](const char* name, const std::vector<ChannelPerturbation>& chs) {
    oss << " " << name << "=[";
    for (std::size_t i = 0; i < chs.size(); ++i) {
      const auto& c = chs[i];
      if (i) oss << ";";
      if (kind == PerturbationKind::Gaussian) oss << c.sigma;
      else oss << c.scale_lo << ".." << c.scale_hi;
      oss << "@" << c.lo << ".." << c.hi;
    }
    oss << "]";
  };
  block("state", state);
  block("control", control);
  return oss.str();
}

Perturbation Perturbation::gaussian(double sigma, std::size_t state_dim, std::size_t control_dim) {
  Perturbation p;
  p.kind = PerturbationKind::Gaussian;
  ChannelPerturbation c;
  c.sigma = sigma;
  p.state.assign(state_dim, c);
  p.control.assign(control_dim, c);
  return p;
}

// ----------------------------- Provenance ------------------------------------

Hash64 Provenance::fingerprint() const {
  Fnv1a64 h;
  h.update_string(to_string(op));
  h.update_u64(static_cast<uint64_t>(parents.size()));
  for (const auto& p : parents) h.update_string(p);
  h.update_u64(seed);
  h.update_f64(split_time);
  h.update_string(perturbation);
  return h.digest();
}

// ----------------------------- EpisodeAugmenter ------------------------------

EpisodeAugmenter::EpisodeAugmenter(NumericalSettings numerics, AugmentSettings settings)
    : numerics_(numerics), settings_(settings) {
  numerics_.validate_or_throw();
  settings_.validate_or_throw();
}

bool EpisodeAugmenter::compatible(const data::Episode& e1, const data::Episode& e2) const noexcept {
  if (e1.size() < 2 || e2.size() < 2) return false;
  if (e1.state_dim() != e2.state_dim() || e1.control_dim() != e2.control_dim()) return false;
  if (std::fabs(e1.start_time() - e2.start_time()) > numerics_.time_tol) return false;
  if (std::fabs(e1.sample_period() - e2.sample_period()) > numerics_.time_tol) return false;
  return true;
}

void EpisodeAugmenter::require_compatible(const data::Episode& e1, const data::Episode& e2) const {
  const std::string pair = "'" + e1.id() + "' x '" + e2.id() + "'";
  if (e1.size() < 2 || e2.size() < 2) {
    throw IncompatibleEpisodeError("crossover " + pair + ": episodes need at least 2 samples");
  }
  if (e1.state_dim() != e2.state_dim() || e1.control_dim() != e2.control_dim()) {
    throw IncompatibleEpisodeError("crossover " + pair + ": state/control dimensions differ");
  }
  if (std::fabs(e1.start_time() - e2.start_time()) > numerics_.time_tol) {
    std::ostringstream oss;
    oss << "crossover " << pair << ": start times differ (" << e1.start_time() << " vs " << e2.start_time() << ")";
    throw IncompatibleEpisodeError(oss.str());
  }
  if (std::fabs(e1.sample_period() - e2.sample_period()) > numerics_.time_tol) {
    std::ostringstream oss;
    oss << "crossover " << pair << ": sample periods differ (" << e1.sample_period() << " vs "
        << e2.sample_period() << ")";
    throw IncompatibleEpisodeError(oss.str());
  }
}

AugmentedEpisode EpisodeAugmenter::crossover(const data::Episode& e1, const data::Episode& e2,
                                             double split_time) const {
  require_compatible(e1, e2);
  const double lo = e1.start_time();
  if (!(is_finite(split_time) && split_time > lo && split_time < e1.end_time() && split_time < e2.end_time())) {
    std::ostringstream oss;
    oss << "crossover '" << e1.id() << "' x '" << e2.id() << "': split " << split_time
        << " is not strictly inside both spans";
    throw IncompatibleEpisodeError(oss.str());
  }

  std::vector<data::Sample> samples;
  samples.reserve(e1.size() + e2.size());
  for (const auto& s : e1.samples()) {
    if (s.t < split_time) samples.push_back(s);
  }
  for (const auto& s : e2.samples()) {
    if (s.t >= split_time) samples.push_back(s);
  }

  AugmentedEpisode out;
  out.provenance.op = AugmentOperator::Crossover;
  out.provenance.parents = {e1.id(), e2.id()};
  out.provenance.seed = 0;
  out.provenance.split_time = split_time;
  out.episode = data::Episode("aug-" + hash_to_hex(out.provenance.fingerprint()), std::move(samples));
  return out;
}

AugmentedEpisode EpisodeAugmenter::crossover_random(const data::Episode& e1, const data::Episode& e2,
                                                    std::uint64_t seed) const {
  require_compatible(e1, e2);
  const double t0 = e1.start_time();
  const double t1 = std::min(e1.end_time(), e2.end_time());
  Rng64 rng(seed);
  const double f = rng.uniform(settings_.split_fraction_min, settings_.split_fraction_max);
  const double split = t0 + f * (t1 - t0);

  AugmentedEpisode out = crossover(e1, e2, split);
  out.provenance.seed = seed;
  out.episode = data::Episode("aug-" + hash_to_hex(out.provenance.fingerprint()), out.episode.samples());
  return out;
}

AugmentedEpisode EpisodeAugmenter::mutate(const data::Episode& e, const Perturbation& p, std::uint64_t seed) const {
  VDM_REQUIRE(!e.empty(), ValidationError, "mutate: empty episode");
  p.validate(e.state_dim(), e.control_dim());

  Rng64 rng(seed);
  std::vector<ChannelState> xs = draw_channels(p.state, p.kind, rng);
  std::vector<ChannelState> us = draw_channels(p.control, p.kind, rng);

  std::vector<data::Sample> samples = e.samples();
  for (std::size_t k = 0; k < samples.size(); ++k) {
    perturb(samples[k].x, xs, p, k == 0, rng);
    perturb(samples[k].u, us, p, k == 0, rng);
  }

  AugmentedEpisode out;
  out.provenance.op = AugmentOperator::Mutation;
  out.provenance.parents = {e.id()};
  out.provenance.seed = seed;
  out.provenance.perturbation = p.describe();
  out.episode = data::Episode("aug-" + hash_to_hex(out.provenance.fingerprint()), std::move(samples));
  return out;
}

std::vector<AugmentedEpisode> EpisodeAugmenter::augment_corpus(const std::vector<data::Episode>& corpus,
                                                               const AugmentPlan& plan, std::size_t threads) const {
  const std::size_t jobs = plan.crossovers + plan.mutations;
  if (jobs == 0) return {};
  VDM_REQUIRE(!corpus.empty(), ValidationError, "augment_corpus: empty corpus");

  std::vector<std::pair<std::size_t, std::size_t>> pairs;
  if (plan.crossovers > 0) {
    for (std::size_t i = 0; i < corpus.size(); ++i) {
      for (std::size_t j = 0; j < corpus.size(); ++j) {
        if (i != j && compatible(corpus[i], corpus[j])) pairs.emplace_back(i, j);
      }
    }
    if (pairs.empty()) {
      throw IncompatibleEpisodeError("augment_corpus: no pair of episodes shares a time base");
    }
  }
  if (plan.mutations > 0) {
    for (const auto& e : corpus) plan.perturbation.validate(e.state_dim(), e.control_dim());
  }

  std::vector<AugmentedEpisode> out(jobs);
  parallel_for(jobs, threads, [&](std::size_t job) {
    const std::uint64_t seed = mix_seed(plan.seed, job);
    Rng64 pick(seed);
    if (job < plan.crossovers) {
      const auto& pr = pairs[pick.uniform_index(0, pairs.size() - 1)];
      out[job] = crossover_random(corpus[pr.first], corpus[pr.second], pick.next_u64());
    } else {
      const std::size_t i = pick.uniform_index(0, corpus.size() - 1);
      out[job] = mutate(corpus[i], plan.perturbation, pick.next_u64());
    }
  });

  std::ostringstream oss;
  oss << "generated " << plan.crossovers << " crossovers and " << plan.mutations << " mutations from "
      << corpus.size() << " episodes";
  log(LogLevel::INFO, "augment", oss.str());
  return out;
}

}  // namespace vdm::augment
