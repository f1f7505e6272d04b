#include "vdm/model/signals.hpp"

#include "vdm/core/errors.hpp"

namespace vdm::model {

std::size_t ChannelLayout::index_of(const std::string& name) const noexcept {
  for (std::size_t i = 0; i < state_names.size(); ++i) {
    if (state_names[i] == name) return i;
  }
  for (std::size_t i = 0; i < control_names.size(); ++i) {
    if (control_names[i] == name) return state_names.size() + i;
  }
  return npos;
}

std::size_t ChannelLayout::state_index(const std::string& name) const noexcept {
  for (std::size_t i = 0; i < state_names.size(); ++i) {
    if (state_names[i] == name) return i;
  }
  return npos;
}

const std::string& ChannelLayout::channel_name(std::size_t signal_index) const {
  VDM_REQUIRE(signal_index < signal_dim(), ValidationError, "channel index out of range");
  if (signal_index < state_names.size()) return state_names[signal_index];
  return control_names[signal_index - state_names.size()];
}

Eigen::VectorXd ChannelLayout::signal(const Eigen::VectorXd& x, const Eigen::VectorXd& u) const {
  VDM_REQUIRE(static_cast<std::size_t>(x.size()) == state_dim(), ValidationError,
              "signal: state dimension mismatch");
  VDM_REQUIRE(static_cast<std::size_t>(u.size()) == control_dim(), ValidationError,
              "signal: control dimension mismatch");
  Eigen::VectorXd s(static_cast<Eigen::Index>(signal_dim()));
  s << x, u;
  return s;
}

void ChannelLayout::validate() const {
  VDM_REQUIRE(!state_names.empty(), ValidationError, "ChannelLayout: no state channels");
  const std::size_t n = signal_dim();
  for (std::size_t i = 0; i < n; ++i) {
    const std::string& a = channel_name(i);
    VDM_REQUIRE(!a.empty(), ValidationError, "ChannelLayout: empty channel name");
    for (std::size_t j = 0; j < i; ++j) {
      VDM_REQUIRE(channel_name(j) != a, ValidationError, "ChannelLayout: duplicate channel '" + a + "'");
    }
  }
}

SignalHistory::SignalHistory(std::size_t depth, std::size_t dim)
    : ring_(depth == 0 ? 1 : depth, Eigen::VectorXd::Zero(static_cast<Eigen::Index>(dim))) {}

void SignalHistory::reset(const Eigen::VectorXd& s) {
  VDM_REQUIRE(!ring_.empty(), ValidationError, "SignalHistory: not sized");
  for (auto& slot : ring_) slot = s;
  head_ = 0;
  primed_ = true;
}

void SignalHistory::push(const Eigen::VectorXd& s) {
  if (!primed_) {
    reset(s);
    return;
  }
  head_ = (head_ + 1) % ring_.size();
  ring_[head_] = s;
}

double SignalHistory::tap(std::size_t channel, std::size_t lag) const {
  VDM_REQUIRE(lag < ring_.size(), ValidationError, "SignalHistory: lag beyond depth");
  const std::size_t idx = (head_ + ring_.size() - lag) % ring_.size();
  return ring_[idx](static_cast<Eigen::Index>(channel));
}

const Eigen::VectorXd& SignalHistory::current() const {
  return ring_[head_];
}

}  // namespace vdm::model
