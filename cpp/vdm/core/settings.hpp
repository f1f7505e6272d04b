#pragma once
/*
================================================================================
Fragment 1.6 - Core: Numerical + Training Settings
FILE: cpp/vdm/core/settings.hpp

Purpose:
  - Centralize every tolerance and training knob that changes results into
    validated objects, so runs are reproducible from config alone.

Hardening:
  - validate_or_throw() catches nonsensical values early.
  - Conservative defaults; the partition-of-unity tolerance and the stability
    margin are knobs here, not literals in the algorithms.
================================================================================
*/

#include <cstdint>
#include <string>

#include "vdm/core/errors.hpp"

namespace vdm {

// ----------------------------- Numerical -------------------------------------
struct NumericalSettings {
  // Generic epsilon for denominators
  double eps = 1e-12;

  // Allowed |sum(activations) - 1| for normalized fuzzy sets.
  double partition_tol = 1e-9;

  // Two episodes share a time base when start times and sample periods
  // agree within this tolerance (seconds).
  double time_tol = 1e-9;

  // Stable iff every |pole| < 1 - stability_margin.
  double stability_margin = 0.0;

  // Central finite-difference step (linearization, inverse gradients).
  double fd_step = 1e-6;

  void validate_or_throw() const {
    if (eps <= 0.0 || eps > 1e-3) {
      throw ValidationError("NumericalSettings: eps outside sane bounds");
    }
    if (partition_tol <= 0.0 || partition_tol > 1e-2) {
      throw ValidationError("NumericalSettings: partition_tol outside sane bounds");
    }
    if (time_tol <= 0.0 || time_tol > 1e-1) {
      throw ValidationError("NumericalSettings: time_tol outside sane bounds");
    }
    if (stability_margin < 0.0 || stability_margin >= 1.0) {
      throw ValidationError("NumericalSettings: stability_margin must be [0,1)");
    }
    if (fd_step <= 0.0 || fd_step > 1e-2) {
      throw ValidationError("NumericalSettings: fd_step outside sane bounds");
    }
  }
};

// ----------------------------- Training --------------------------------------
struct TrainingSettings {
  // Ridge regularization for local-model least squares.
  double ridge = 1e-8;

  // Gauss-Seidel backfitting sweeps over the terms of one output channel.
  int backfit_sweeps = 8;

  // Gradient epochs for learned gates (0 = keep initial gate parameters).
  int gate_epochs = 50;
  double gate_learning_rate = 0.05;

  // Two-phase recurrent learner.
  double recurrent_learning_rate = 0.5;
  int recurrent_max_epochs = 400;
  double recurrent_rel_tol = 1e-6;
  int recurrent_patience = 5;

  // Inverse model (inverse-in-series-with-forward).
  // Direct-inverse least squares from episode controls before the
  // series training epochs.
  bool inverse_direct_init = true;
  int inverse_epochs = 30;
  double inverse_learning_rate = 0.1;
  double inverse_ridge = 1e-6;

  // Worker threads for per-output-channel fitting and augmentation.
  // 0 = hardware concurrency.
  int threads = 0;

  void validate_or_throw() const {
    if (ridge < 0.0 || ridge > 1e3) {
      throw ValidationError("TrainingSettings: ridge outside sane bounds");
    }
    if (backfit_sweeps < 1 || backfit_sweeps > 10000) {
      throw ValidationError("TrainingSettings: backfit_sweeps outside sane bounds");
    }
    if (gate_epochs < 0 || gate_epochs > 1000000) {
      throw ValidationError("TrainingSettings: gate_epochs outside sane bounds");
    }
    if (gate_learning_rate <= 0.0 || gate_learning_rate > 10.0) {
      throw ValidationError("TrainingSettings: gate_learning_rate outside sane bounds");
    }
    if (recurrent_learning_rate <= 0.0 || recurrent_learning_rate > 100.0) {
      throw ValidationError("TrainingSettings: recurrent_learning_rate outside sane bounds");
    }
    if (recurrent_max_epochs < 1 || recurrent_max_epochs > 10000000) {
      throw ValidationError("TrainingSettings: recurrent_max_epochs outside sane bounds");
    }
    if (recurrent_rel_tol < 0.0 || recurrent_rel_tol > 1.0) {
      throw ValidationError("TrainingSettings: recurrent_rel_tol must be [0,1]");
    }
    if (recurrent_patience < 1 || recurrent_patience > 100000) {
      throw ValidationError("TrainingSettings: recurrent_patience outside sane bounds");
    }
    if (inverse_epochs < 0 || inverse_epochs > 1000000) {
      throw ValidationError("TrainingSettings: inverse_epochs outside sane bounds");
    }
    if (inverse_learning_rate <= 0.0 || inverse_learning_rate > 100.0) {
      throw ValidationError("TrainingSettings: inverse_learning_rate outside sane bounds");
    }
    if (inverse_ridge < 0.0 || inverse_ridge > 1e3) {
      throw ValidationError("TrainingSettings: inverse_ridge outside sane bounds");
    }
    if (threads < 0 || threads > 1024) {
      throw ValidationError("TrainingSettings: threads outside sane bounds");
    }
  }
};

// ----------------------------- Augmentation ----------------------------------
struct AugmentSettings {
  // Random crossover split is drawn inside this fraction of the shared span.
  double split_fraction_min = 0.25;
  double split_fraction_max = 0.75;

  // Base seed; per-job seeds are derived from it with mix_seed().
  uint64_t seed = 1;

  // Gaussian mutation sigma on every channel when no perturbation is configured.
  double default_sigma = 0.01;

  void validate_or_throw() const {
    if (split_fraction_min <= 0.0 || split_fraction_max >= 1.0 ||
        split_fraction_min > split_fraction_max) {
      throw ValidationError("AugmentSettings: split fraction window must satisfy 0 < min <= max < 1");
    }
    if (!(default_sigma >= 0.0) || default_sigma > 1e6) {
      throw ValidationError("AugmentSettings: default_sigma outside sane bounds");
    }
  }
};

// ----------------------------- Settings --------------------------------------
struct EngineSettings {
  NumericalSettings numerics;
  TrainingSettings training;
  AugmentSettings augment;

  void validate_or_throw() const {
    numerics.validate_or_throw();
    training.validate_or_throw();
    augment.validate_or_throw();
  }

  static EngineSettings defaults() {
    EngineSettings s;
    return s;
  }
};

}  // namespace vdm
