/*
===========================================================
Fragment 1.1 - Core: Logging (Implementation)
FILE: cpp/vdm/core/logging.cpp
===========================================================
*/

#include "vdm/core/logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace vdm {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mu;

static const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool parse_log_level(const std::string& s, LogLevel* out) noexcept {
  if (!out) return false;
  if (s == "debug") { *out = LogLevel::DEBUG; return true; }
  if (s == "info")  { *out = LogLevel::INFO;  return true; }
  if (s == "warn")  { *out = LogLevel::WARN;  return true; }
  if (s == "error") { *out = LogLevel::ERROR; return true; }
  return false;
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  std::time_t tt = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  try {
    const int cur = g_level.load(std::memory_order_relaxed);
    if (static_cast<int>(lvl) < cur) return;

    const std::string ts = utc_timestamp();
    std::lock_guard<std::mutex> lk(g_log_mu);

    std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    out << "[" << ts << "]"
        << "[" << level_tag(lvl) << "] "
        << msg << "\n";
    out.flush();
  } catch (...) {
    // Must never throw. Output is best-effort.
  }
}

void log(LogLevel lvl, const char* component, const std::string& msg) noexcept {
  try {
    if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
    std::string line;
    line.reserve(msg.size() + 16);
    line += "[";
    line += (component && *component) ? component : "vdm";
    line += "] ";
    line += msg;
    log(lvl, line);
  } catch (...) {
    // Must never throw. Output is best-effort.
  }
}

}  // namespace vdm
