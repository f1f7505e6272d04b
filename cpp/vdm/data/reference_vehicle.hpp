#pragma once
/*
================================================================================
Fragment 4.4 - Data: Reference Vehicle Simulator
FILE: cpp/vdm/data/reference_vehicle.hpp

Purpose:
  - Synthesize episodes from a known plant for demos and end-to-end tests:
    states (vx, vy, r), controls (delta, throttle, brake) at fixed Ts.
  - Plant (c = controls after a first-order actuator lag):
      ax   = k_drive*throttle*(1 - vx/v_top) - k_brake*brake - c_drag*vx|vx|
      ay   = k_lat*delta*vx - d_lat*vy + r*vx
      rdot = k_yaw*delta*vx - d_yaw*r
    integrated body-frame, with the same friction ellipse as the model.
  - Commands are piecewise-constant targets redrawn every hold period;
    recorded controls are the commands, not the lagged actuator values.

Deterministic: (params, steps, seed) -> identical episode.
================================================================================
*/

#include "vdm/data/episode.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vdm::data {

struct ReferenceVehicleParams {
  double sample_time = 0.01;
  double drive_gain = 6.0;
  double top_speed = 50.0;
  double brake_gain = 9.0;
  double drag = 0.0015;
  double lateral_gain = 3.0;
  double lateral_damping = 4.0;
  double yaw_gain = 1.2;
  double yaw_damping = 3.0;
  double actuator_lag_s = 0.05;
  bool friction = true;

  // Command generator.
  double hold_s = 1.0;
  double max_steer = 0.04;
  double initial_speed = 10.0;

  void validate_or_throw() const;
};

Episode simulate_reference_episode(const std::string& id, const ReferenceVehicleParams& p, std::size_t steps,
                                   std::uint64_t seed);

// Episodes "ref-000", "ref-001", ... with per-episode seeds mix_seed(seed, i).
std::vector<Episode> simulate_reference_corpus(const ReferenceVehicleParams& p, std::size_t episodes,
                                               std::size_t steps, std::uint64_t seed);

}  // namespace vdm::data
