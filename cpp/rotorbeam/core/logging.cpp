/*
===========================================================
Fragment 1.1 — Core: Logging (Implementation)
FILE: cpp/rotorbeam/core/logging.cpp
===========================================================
*/

#include "rotorbeam/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace rotorbeam {

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

static bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool parse_log_level(std::string_view text, LogLevel& out) noexcept {
  if (iequals(text, "debug")) { out = LogLevel::DEBUG; return true; }
  if (iequals(text, "info"))  { out = LogLevel::INFO;  return true; }
  if (iequals(text, "warn") || iequals(text, "warning")) { out = LogLevel::WARN; return true; }
  if (iequals(text, "error")) { out = LogLevel::ERROR; return true; }
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

static void emit(LogLevel lvl, std::string_view component, const std::string& msg) {
  const int cur = g_level.load(std::memory_order_relaxed);
  if (static_cast<int>(lvl) < cur) return;

  const std::string ts = utc_timestamp();

  std::lock_guard<std::mutex> lk(g_log_mu);

  std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
  out << "[" << ts << "]"
      << "[" << level_tag(lvl) << "]";
  if (!component.empty()) out << "[" << component << "]";
  out << " " << msg << "\n";
  out.flush();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  try {
    emit(lvl, std::string_view{}, msg);
  } catch (...) {
    // Must never throw. Swallow everything.
  }
}

void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept {
  try {
    emit(lvl, component, msg);
  } catch (...) {
    // Must never throw. Swallow everything.
  }
}

} // namespace rotorbeam
