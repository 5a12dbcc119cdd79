#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/rotorbeam/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by ALL modules.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - WARN/ERROR go to stderr, DEBUG/INFO to stdout.

Notes:
  - Keep this tiny. No fmt, no spdlog. This is the base layer.
  - Component tags ("sections", "grid", "io", "cli") keep audit output greppable.
===========================================================
*/

#include <string>
#include <string_view>

namespace rotorbeam {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Parse "debug"/"info"/"warn"/"error" (case-insensitive).
// Returns false and leaves `out` untouched on unknown text.
bool parse_log_level(std::string_view text, LogLevel& out) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

// Same, with a component tag: "[ts][WARN][sections] msg".
void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept;

} // namespace rotorbeam
