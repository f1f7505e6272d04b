#pragma once
/*
================================================================================
Fragment 4.3 - Augment: Episode Crossover + Mutation
FILE: cpp/vdm/augment/augmenter.hpp

Purpose:
  - Grow an inverse-model training corpus from recorded episodes.
      crossover  prefix of e1 (t < split) + suffix of e2 (t >= split)
      mutate     additive gaussian noise or per-channel scaling, clamped to
                 caller bounds
  - Pure functions over immutable Episodes. Every result carries its
    Provenance (operator, parent ids, seed, split time / perturbation) and
    its id is the FNV-1a fingerprint of that provenance.

Determinism:
  - Random draws come from Rng64 seeded explicitly. Same inputs + seed ->
    identical output, on every platform.
  - augment_corpus derives one seed per job with mix_seed(seed, job), so the
    output does not depend on the worker count.

Errors:
  - IncompatibleEpisodeError: start times or sample periods differ by more
    than time_tol, dimensions differ, or the split is not strictly inside
    both spans.
  - ValidationError: malformed perturbation.
================================================================================
*/

#include "vdm/core/hashing.hpp"
#include "vdm/core/settings.hpp"
#include "vdm/data/episode.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace vdm::augment {

enum class PerturbationKind : std::uint8_t { Gaussian = 0, Scaling = 1 };

const char* to_string(PerturbationKind k) noexcept;
bool parse_perturbation_kind(const std::string& s, PerturbationKind* out) noexcept;

struct ChannelPerturbation {
  double sigma = 0.0;     // Gaussian: noise standard deviation
  double scale_lo = 1.0;  // Scaling: factor drawn uniformly in [scale_lo, scale_hi]
  double scale_hi = 1.0;
  double lo = -std::numeric_limits<double>::infinity();  // physical bounds
  double hi = std::numeric_limits<double>::infinity();
};

struct Perturbation {
  PerturbationKind kind = PerturbationKind::Gaussian;

  // AR(1) coefficient of the noise sequence; 0 = white.
  double correlation = 0.0;

  // One entry per channel; an empty list leaves that block untouched.
  std::vector<ChannelPerturbation> state;
  std::vector<ChannelPerturbation> control;

  void validate(std::size_t state_dim, std::size_t control_dim) const;
  std::string describe() const;

  // Same unbounded white noise on every channel.
  static Perturbation gaussian(double sigma, std::size_t state_dim, std::size_t control_dim);
};

enum class AugmentOperator : std::uint8_t { Crossover = 0, Mutation = 1 };

const char* to_string(AugmentOperator op) noexcept;

struct Provenance {
  AugmentOperator op = AugmentOperator::Mutation;
  std::vector<std::string> parents;
  std::uint64_t seed = 0;
  double split_time = std::numeric_limits<double>::quiet_NaN();
  std::string perturbation;

  Hash64 fingerprint() const;
};

struct AugmentedEpisode {
  data::Episode episode;
  Provenance provenance;
};

struct AugmentPlan {
  std::size_t crossovers = 0;
  std::size_t mutations = 0;
  Perturbation perturbation;
  std::uint64_t seed = 1;
};

class EpisodeAugmenter final {
 public:
  EpisodeAugmenter(NumericalSettings numerics = NumericalSettings(), AugmentSettings settings = AugmentSettings());

  bool compatible(const data::Episode& e1, const data::Episode& e2) const noexcept;

  AugmentedEpisode crossover(const data::Episode& e1, const data::Episode& e2, double split_time) const;

  // Split drawn uniformly in the configured fraction window of the shared span.
  AugmentedEpisode crossover_random(const data::Episode& e1, const data::Episode& e2, std::uint64_t seed) const;

  AugmentedEpisode mutate(const data::Episode& e, const Perturbation& p, std::uint64_t seed) const;

  // Jobs [0, crossovers) are crossovers, then mutations. Output is in job order.
  std::vector<AugmentedEpisode> augment_corpus(const std::vector<data::Episode>& corpus, const AugmentPlan& plan,
                                               std::size_t threads) const;

 private:
  void require_compatible(const data::Episode& e1, const data::Episode& e2) const;

  NumericalSettings numerics_;
  AugmentSettings settings_;
};

}  // namespace vdm::augment
