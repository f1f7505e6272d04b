#pragma once
/*
================================================================================
Fragment 4.1 - Data: Episode
FILE: cpp/vdm/data/episode.hpp

Purpose:
  - An Episode is a recorded or synthesized trajectory: ordered
    (time, state, control) samples under one id.
  - Immutable after construction. Augmentation derives new episodes and
    never edits its inputs, so episodes can be shared across threads.

Invariants (checked by the constructor):
  - At least one sample.
  - Time strictly increasing and finite.
  - Every sample has the same state and control dimension.
================================================================================
*/

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace vdm::data {

struct Sample final {
  double t = 0.0;
  Eigen::VectorXd x;  // state
  Eigen::VectorXd u;  // control
};

class Episode final {
 public:
  Episode() = default;
  Episode(std::string id, std::vector<Sample> samples);

  const std::string& id() const noexcept { return id_; }
  const std::vector<Sample>& samples() const noexcept { return samples_; }
  const Sample& operator[](std::size_t i) const { return samples_[i]; }

  std::size_t size() const noexcept { return samples_.size(); }
  bool empty() const noexcept { return samples_.empty(); }

  std::size_t state_dim() const noexcept;
  std::size_t control_dim() const noexcept;

  double start_time() const noexcept;
  double end_time() const noexcept;
  // (end - start) / (n - 1); 0 for single-sample episodes.
  double sample_period() const noexcept;

  std::vector<Eigen::VectorXd> states() const;
  std::vector<Eigen::VectorXd> controls() const;

 private:
  std::string id_;
  std::vector<Sample> samples_;
};

// Build an episode on a uniform grid t_k = t0 + k*dt.
Episode make_uniform_episode(std::string id, double t0, double dt,
                             const std::vector<Eigen::VectorXd>& states,
                             const std::vector<Eigen::VectorXd>& controls);

}  // namespace vdm::data
