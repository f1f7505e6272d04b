#include "vdm/data/episode.hpp"

#include "vdm/core/errors.hpp"
#include "vdm/core/require.hpp"

#include <utility>

namespace vdm::data {

Episode::Episode(std::string id, std::vector<Sample> samples) : id_(std::move(id)), samples_(std::move(samples)) {
  VDM_REQUIRE(!samples_.empty(), ValidationError, "Episode '" + id_ + "': no samples");
  const Eigen::Index nx = samples_.front().x.size();
  const Eigen::Index nu = samples_.front().u.size();
  for (std::size_t k = 0; k < samples_.size(); ++k) {
    const Sample& s = samples_[k];
    VDM_REQUIRE(is_finite(s.t), ValidationError, "Episode '" + id_ + "': non-finite time");
    VDM_REQUIRE(s.x.size() == nx && s.u.size() == nu, ValidationError,
                "Episode '" + id_ + "': inconsistent sample dimensions");
    VDM_REQUIRE(s.x.allFinite() && s.u.allFinite(), ValidationError,
                "Episode '" + id_ + "': non-finite sample value");
    if (k > 0) {
      VDM_REQUIRE(s.t > samples_[k - 1].t, ValidationError,
                  "Episode '" + id_ + "': time must be strictly increasing");
    }
  }
}

std::size_t Episode::state_dim() const noexcept {
  return samples_.empty() ? 0 : static_cast<std::size_t>(samples_.front().x.size());
}

std::size_t Episode::control_dim() const noexcept {
  return samples_.empty() ? 0 : static_cast<std::size_t>(samples_.front().u.size());
}

double Episode::start_time() const noexcept {
  return samples_.empty() ? 0.0 : samples_.front().t;
}

double Episode::end_time() const noexcept {
  return samples_.empty() ? 0.0 : samples_.back().t;
}

double Episode::sample_period() const noexcept {
  if (samples_.size() < 2) return 0.0;
  return (end_time() - start_time()) / static_cast<double>(samples_.size() - 1);
}

std::vector<Eigen::VectorXd> Episode::states() const {
  std::vector<Eigen::VectorXd> out;
  out.reserve(samples_.size());
  for (const auto& s : samples_) out.push_back(s.x);
  return out;
}

std::vector<Eigen::VectorXd> Episode::controls() const {
  std::vector<Eigen::VectorXd> out;
  out.reserve(samples_.size());
  for (const auto& s : samples_) out.push_back(s.u);
  return out;
}

Episode make_uniform_episode(std::string id, double t0, double dt,
                             const std::vector<Eigen::VectorXd>& states,
                             const std::vector<Eigen::VectorXd>& controls) {
  require_positive(dt, "make_uniform_episode: dt must be > 0");
  VDM_REQUIRE(states.size() == controls.size(), ValidationError,
              "make_uniform_episode: states/controls length mismatch");
  std::vector<Sample> samples;
  samples.reserve(states.size());
  for (std::size_t k = 0; k < states.size(); ++k) {
    samples.push_back(Sample{t0 + dt * static_cast<double>(k), states[k], controls[k]});
  }
  return Episode(std::move(id), std::move(samples));
}

}  // namespace vdm::data
