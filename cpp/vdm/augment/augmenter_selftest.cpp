/*
  Fragment 6.2 - Episode Augmenter Selftest

  Framework-free checks:
    1) Crossover prefix / suffix are exact copies of the parents.
    2) Mismatched time bases raise IncompatibleEpisodeError.
    3) Mutation is reproducible from its seed, leaves the parent untouched
       and respects physical bounds. Perturbations that differ anywhere in
       their parameters get distinct provenance and ids.
    4) augment_corpus output does not depend on the worker count.

  Non-zero return code indicates failure.
*/

#include "vdm/augment/augmenter.hpp"
#include "vdm/core/errors.hpp"
#include "vdm/core/logging.hpp"
#include "vdm/core/selftest.hpp"
#include "vdm/data/episode.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

using namespace vdm;
using namespace vdm::augment;
using namespace vdm::selftest;

namespace {

// x = [base + k, 2*base], u = [-k]
data::Episode ramp(const std::string& id, double base, std::size_t n, double t0 = 0.0, double dt = 0.1) {
  std::vector<Eigen::VectorXd> xs, us;
  for (std::size_t k = 0; k < n; ++k) {
    xs.push_back(Eigen::Vector2d(base + static_cast<double>(k), 2.0 * base));
    us.push_back(Eigen::VectorXd::Constant(1, -static_cast<double>(k)));
  }
  return data::make_uniform_episode(id, t0, dt, xs, us);
}

bool same_samples(const data::Episode& a, const data::Episode& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t k = 0; k < a.size(); ++k) {
    if (a[k].t != b[k].t || a[k].x != b[k].x || a[k].u != b[k].u) return false;
  }
  return true;
}

void test_crossover() {
  const EpisodeAugmenter aug;
  const data::Episode e1 = ramp("e1", 0.0, 10);
  const data::Episode e2 = ramp("e2", 100.0, 10);

  const AugmentedEpisode c = aug.crossover(e1, e2, 0.45);
  expect_true(c.episode.size() == 10, "crossover keeps the shared grid");
  bool prefix = true, suffix = true;
  for (std::size_t k = 0; k < c.episode.size(); ++k) {
    const data::Sample& s = c.episode[k];
    const data::Sample& ref = (s.t < 0.45) ? e1[k] : e2[k];
    const bool eq = s.t == ref.t && s.x == ref.x && s.u == ref.u;
    if (s.t < 0.45) prefix = prefix && eq;
    else suffix = suffix && eq;
  }
  expect_true(prefix, "samples before the split come from e1 unchanged");
  expect_true(suffix, "samples from the split on come from e2 unchanged");
  expect_true(c.provenance.op == AugmentOperator::Crossover && c.provenance.parents.size() == 2 &&
                  c.provenance.parents[0] == "e1" && c.provenance.parents[1] == "e2",
              "crossover provenance lists both parents");
  expect_true(c.episode.id() != "e1" && c.episode.id() != "e2", "augmented episode gets a new id");

  expect_throws<IncompatibleEpisodeError>([&] { (void)aug.crossover(e1, e2, 0.0); },
                                          "split at the start is rejected");
  expect_throws<IncompatibleEpisodeError>([&] { (void)aug.crossover(e1, e2, 5.0); },
                                          "split past the end is rejected");
}

void test_incompatible() {
  const EpisodeAugmenter aug;
  const data::Episode e1 = ramp("e1", 0.0, 10);
  const data::Episode shifted = ramp("late", 0.0, 10, 1.0);
  const data::Episode slower = ramp("slow", 0.0, 10, 0.0, 0.2);

  expect_true(!aug.compatible(e1, shifted), "different start times are incompatible");
  expect_throws<IncompatibleEpisodeError>([&] { (void)aug.crossover(e1, shifted, 0.45); },
                                          "crossover across start times throws");
  expect_throws<IncompatibleEpisodeError>([&] { (void)aug.crossover(e1, slower, 0.45); },
                                          "crossover across sample periods throws");

  const std::vector<data::Episode> corpus = {e1, shifted};
  AugmentPlan plan;
  plan.crossovers = 1;
  expect_throws<IncompatibleEpisodeError>([&] { (void)aug.augment_corpus(corpus, plan, 1); },
                                          "corpus without a compatible pair throws");
}

void test_mutation() {
  const EpisodeAugmenter aug;
  const data::Episode e = ramp("e", 1.0, 20);
  const data::Episode original = e;

  Perturbation p = Perturbation::gaussian(0.5, 2, 1);
  p.state[0].lo = 0.0;
  p.state[0].hi = 10.0;

  const AugmentedEpisode a = aug.mutate(e, p, 42);
  const AugmentedEpisode b = aug.mutate(e, p, 42);
  const AugmentedEpisode c = aug.mutate(e, p, 43);

  expect_true(same_samples(a.episode, b.episode) && a.episode.id() == b.episode.id(),
              "mutation with the same seed is reproducible");
  expect_true(!same_samples(a.episode, c.episode), "a different seed gives a different episode");
  expect_true(same_samples(e, original), "parent episode is unchanged");

  bool times = true, bounded = true;
  for (std::size_t k = 0; k < a.episode.size(); ++k) {
    times = times && a.episode[k].t == e[k].t;
    bounded = bounded && a.episode[k].x(0) >= 0.0 && a.episode[k].x(0) <= 10.0;
  }
  expect_true(times, "mutation keeps the time base");
  expect_true(bounded, "mutated channel respects its bounds");
  expect_true(a.provenance.seed == 42 && a.provenance.parents.size() == 1, "mutation provenance records seed");

  // Sigmas equal to six significant digits must still be told apart.
  const Perturbation p1 = Perturbation::gaussian(0.1, 2, 1);
  const Perturbation p2 = Perturbation::gaussian(0.1000000001, 2, 1);
  expect_true(p1.describe() != p2.describe(), "perturbation text keeps full precision");
  const AugmentedEpisode m1 = aug.mutate(e, p1, 7);
  const AugmentedEpisode m2 = aug.mutate(e, p2, 7);
  expect_true(m1.provenance.fingerprint() != m2.provenance.fingerprint() && m1.episode.id() != m2.episode.id(),
              "close perturbations get distinct fingerprints and ids");

  Perturbation bad = Perturbation::gaussian(0.1, 3, 1);
  expect_throws<ValidationError>([&] { (void)aug.mutate(e, bad, 1); }, "perturbation width mismatch rejected");
}

void test_thread_independence() {
  const EpisodeAugmenter aug;
  std::vector<data::Episode> corpus;
  for (int i = 0; i < 4; ++i) corpus.push_back(ramp("e" + std::to_string(i), 10.0 * i, 30));

  AugmentPlan plan;
  plan.crossovers = 6;
  plan.mutations = 6;
  plan.perturbation = Perturbation::gaussian(0.1, 2, 1);
  plan.seed = 42;

  const std::vector<AugmentedEpisode> one = aug.augment_corpus(corpus, plan, 1);
  const std::vector<AugmentedEpisode> many = aug.augment_corpus(corpus, plan, 4);

  bool same = one.size() == 12 && many.size() == 12;
  for (std::size_t i = 0; same && i < one.size(); ++i) {
    same = one[i].episode.id() == many[i].episode.id() && same_samples(one[i].episode, many[i].episode) &&
           one[i].provenance.op == many[i].provenance.op;
  }
  expect_true(same, "augment_corpus is identical for 1 and 4 threads");
  expect_true(one[0].provenance.op == AugmentOperator::Crossover &&
                  one[11].provenance.op == AugmentOperator::Mutation,
              "crossover jobs come before mutation jobs");
}

}  // namespace

int main() {
  set_log_level(LogLevel::WARN);
  run_case("crossover", test_crossover);
  run_case("incompatible episodes", test_incompatible);
  run_case("mutation", test_mutation);
  run_case("thread independence", test_thread_independence);
  return exit_code();
}
