#pragma once
/*
================================================================================
Fragment 1.2 — Core: Error Types + Require Macro (Engine-Wide)
FILE: cpp/rotorbeam/core/errors.hpp

Purpose:
  - Uniform exception types so every structural failure is:
      * catchable by category (shape, signal lookup, sections, domain, config)
      * tagged with a stable numeric code for logs and exit codes
      * traceable to the throwing site (file/function/line)

Policy:
  - Malformed input (bad shapes, non-monotonic sections) is fatal and local:
    thrown where it is detected.
  - Tolerance/bound conflicts in section selection are NOT errors; they are
    recorded as report warnings.

Hardening:
  - Small, dependency-free exceptions.
  - Safe what() storage via std::string.
================================================================================
*/

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace rotorbeam {

// Stable error codes. Keep these values stable once public.
enum class ErrorCode : std::uint16_t {
  Ok = 0,

  // Input data / contracts
  DataShape = 10,
  UnknownSignal = 11,
  InvalidSections = 12,
  InsufficientDomain = 13,
  InvalidConfig = 14,

  // IO / parsing
  IOError = 40,
  ParseError = 41
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::Ok:                 return "Ok";
    case ErrorCode::DataShape:          return "DataShape";
    case ErrorCode::UnknownSignal:      return "UnknownSignal";
    case ErrorCode::InvalidSections:    return "InvalidSections";
    case ErrorCode::InsufficientDomain: return "InsufficientDomain";
    case ErrorCode::InvalidConfig:      return "InvalidConfig";
    case ErrorCode::IOError:            return "IOError";
    case ErrorCode::ParseError:         return "ParseError";
    default:                            return "Unknown";
  }
}

struct ErrorSite final {
  const char* file = "";
  const char* func = "";
  int line = 0;
};

// Base error for the engine.
class RotorBeamError : public std::runtime_error {
 public:
  RotorBeamError(ErrorCode code, const std::string& msg, ErrorSite site = {})
      : std::runtime_error(msg.empty() ? std::string{"<empty error message>"} : msg),
        code_(code),
        site_(site) {}

  ErrorCode code() const noexcept { return code_; }
  const ErrorSite& where() const noexcept { return site_; }

 private:
  ErrorCode code_;
  ErrorSite site_;
};

// Empty, mismatched-length or non-finite sample series.
class DataShapeError : public RotorBeamError {
 public:
  explicit DataShapeError(const std::string& msg, ErrorSite site = {})
      : RotorBeamError(ErrorCode::DataShape, msg, site) {}
};

// Query for a signal name that was never bound.
class UnknownSignalError : public RotorBeamError {
 public:
  explicit UnknownSignalError(const std::string& msg, ErrorSite site = {})
      : RotorBeamError(ErrorCode::UnknownSignal, msg, site) {}
};

// Grid construction given a non-monotonic or too-short section list.
class InvalidSectionsError : public RotorBeamError {
 public:
  explicit InvalidSectionsError(const std::string& msg, ErrorSite site = {})
      : RotorBeamError(ErrorCode::InvalidSections, msg, site) {}
};

// Fewer than 2 usable structural samples.
class InsufficientDomainError : public RotorBeamError {
 public:
  explicit InsufficientDomainError(const std::string& msg, ErrorSite site = {})
      : RotorBeamError(ErrorCode::InsufficientDomain, msg, site) {}
};

// Thrown when user/config input fails validation.
class ValidationError : public RotorBeamError {
 public:
  explicit ValidationError(const std::string& msg, ErrorSite site = {})
      : RotorBeamError(ErrorCode::InvalidConfig, msg, site) {}
};

// Thrown for I/O or filesystem related issues.
class IOError : public RotorBeamError {
 public:
  explicit IOError(const std::string& msg, ErrorSite site = {})
      : RotorBeamError(ErrorCode::IOError, msg, site) {}
};

// Thrown when a table file cannot be interpreted.
class ParseError : public RotorBeamError {
 public:
  explicit ParseError(const std::string& msg, ErrorSite site = {})
      : RotorBeamError(ErrorCode::ParseError, msg, site) {}
};

template <typename E>
[[noreturn]] inline void fail(const std::string& msg, ErrorSite site) {
  static_assert(std::is_base_of<RotorBeamError, E>::value, "fail<E> requires a RotorBeamError");
  throw E(msg, site);
}

// -----------------------------
// Numeric guards
// -----------------------------
inline bool is_finite(double x) noexcept {
  return std::isfinite(x) != 0;
}

template <typename T>
inline constexpr T clamp(T v, T lo, T hi) noexcept {
  static_assert(std::is_arithmetic<T>::value, "clamp requires arithmetic type");
  return (v < lo) ? lo : ((v > hi) ? hi : v);
}

}  // namespace rotorbeam

// Site macro
#define ROTORBEAM_SITE ::rotorbeam::ErrorSite{__FILE__, __func__, __LINE__}

// Require macro (hard fail for invalid states).
#define ROTORBEAM_REQUIRE(cond, ExcType, msg)               \
  do {                                                      \
    if (!(cond)) {                                          \
      ::rotorbeam::fail<ExcType>((msg), ROTORBEAM_SITE);    \
    }                                                       \
  } while (0)
