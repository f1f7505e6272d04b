#pragma once
/*
================================================================================
Fragment 3.2 - Model: Channel Layout + Signal History
FILE: cpp/vdm/model/signals.hpp

Purpose:
  - Name the channels of the signal vector s_k = [x_k ; u_k] (state first,
    then controls) so config can refer to "vx" or "brake" by name.
  - Keep a fixed-depth window of past signal vectors for FIR local models.

Notes:
  - Before `depth` samples exist the window is padded with the first sample
    of the episode (reset() fills every slot). History is only reset at
    episode boundaries.
================================================================================
*/

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace vdm::model {

struct ChannelLayout final {
  std::vector<std::string> state_names;
  std::vector<std::string> control_names;

  std::size_t state_dim() const noexcept { return state_names.size(); }
  std::size_t control_dim() const noexcept { return control_names.size(); }
  std::size_t signal_dim() const noexcept { return state_names.size() + control_names.size(); }

  // Index into the signal vector, or npos.
  std::size_t index_of(const std::string& name) const noexcept;
  // Index into the state vector, or npos.
  std::size_t state_index(const std::string& name) const noexcept;
  const std::string& channel_name(std::size_t signal_index) const;

  Eigen::VectorXd signal(const Eigen::VectorXd& x, const Eigen::VectorXd& u) const;

  void validate() const;

  static constexpr std::size_t npos = static_cast<std::size_t>(-1);
};

class SignalHistory final {
 public:
  SignalHistory() = default;
  SignalHistory(std::size_t depth, std::size_t dim);

  // Start of an episode: every slot becomes s.
  void reset(const Eigen::VectorXd& s);
  // Advance one step.
  void push(const Eigen::VectorXd& s);

  // s_{k-lag}[channel]; lag < depth().
  double tap(std::size_t channel, std::size_t lag) const;
  const Eigen::VectorXd& current() const;

  std::size_t depth() const noexcept { return ring_.size(); }
  bool primed() const noexcept { return primed_; }

 private:
  std::vector<Eigen::VectorXd> ring_;
  std::size_t head_ = 0;
  bool primed_ = false;
};

}  // namespace vdm::model
