#pragma once
/*
===========================================================
Fragment 1.1 - Core: Logging
FILE: cpp/vdm/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by ALL vdm modules.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation). Training workers
    and augmentation workers log concurrently.
  - WARN/ERROR routed to stderr.
===========================================================
*/

#include <string>

namespace vdm {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Parse "debug" / "info" / "warn" / "error". Returns false on unknown text.
bool parse_log_level(const std::string& s, LogLevel* out) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

// Tagged variant: "[component] msg".
void log(LogLevel lvl, const char* component, const std::string& msg) noexcept;

}  // namespace vdm
