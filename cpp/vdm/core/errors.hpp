#pragma once
/*
================================================================================
Fragment 1.2 - Core: Error Types
FILE: cpp/vdm/core/errors.hpp

Purpose:
  - Uniform exception types so validation, stage-order and numerical failures
    are searchable, catchable by category and reportable cleanly.
  - Every error here is local and recoverable by the caller (fix config,
    retrain). Nothing in vdm terminates the host process.

Hardening:
  - Small, dependency-free exceptions.
  - Safe what() storage via std::string.
  - VDM_REQUIRE attaches file:line context.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace vdm {

// Base error for the engine.
class VdmError : public std::runtime_error {
 public:
  explicit VdmError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when user/config input fails validation.
class ValidationError : public VdmError {
 public:
  explicit ValidationError(std::string msg) : VdmError(std::move(msg)) {}
};

// Thrown when stages are wired in the wrong order (e.g. inverse training
// against a forward model that was never trained and frozen).
class ConfigurationError : public VdmError {
 public:
  explicit ConfigurationError(std::string msg) : VdmError(std::move(msg)) {}
};

// Thrown when a computation becomes numerically invalid.
class NumericalError : public VdmError {
 public:
  explicit NumericalError(std::string msg) : VdmError(std::move(msg)) {}
};

// Thrown for I/O or filesystem related issues.
class IOError : public VdmError {
 public:
  explicit IOError(std::string msg) : VdmError(std::move(msg)) {}
};

// All membership functions of a normalized fuzzy set returned 0.
class DegenerateEncodingError : public VdmError {
 public:
  explicit DegenerateEncodingError(std::string msg) : VdmError(std::move(msg)) {}
};

// Phase-2 nonlinearity training requested before phase-1 converged.
class PrematureRefinementError : public VdmError {
 public:
  explicit PrematureRefinementError(std::string msg) : VdmError(std::move(msg)) {}
};

// Crossover across episodes whose time bases or dimensions disagree.
class IncompatibleEpisodeError : public VdmError {
 public:
  explicit IncompatibleEpisodeError(std::string msg) : VdmError(std::move(msg)) {}
};

// Write attempted on a frozen parameter group.
class FrozenParameterViolation : public VdmError {
 public:
  explicit FrozenParameterViolation(std::string msg) : VdmError(std::move(msg)) {}
};

namespace detail {

inline std::string with_site(const std::string& msg, const char* file, int line) {
  std::ostringstream oss;
  oss << msg;
  if (file && *file) oss << " @ " << file << ":" << line;
  return oss.str();
}

}  // namespace detail

}  // namespace vdm

// Require macro: throws EXC (a vdm error type) with file/line context.
#define VDM_REQUIRE(cond, EXC, msg)                                      \
  do {                                                                   \
    if (!(cond)) {                                                       \
      throw EXC(::vdm::detail::with_site((msg), __FILE__, __LINE__));    \
    }                                                                    \
  } while (0)
