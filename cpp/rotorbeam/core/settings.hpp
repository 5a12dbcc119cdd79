#pragma once
/*
================================================================================
Fragment 1.4 — Core: Section Selection + Run Settings
FILE: cpp/rotorbeam/core/settings.hpp

Purpose:
  - Centralize every knob that changes the generated beam model (section
    placement tolerances, element bounds, material constants, IO paths) in
    validated objects.
  - Identical settings + identical tables => identical sections and tags.

Hardening:
  - validate_or_throw() rejects nonsensical values early (ValidationError).
  - Optional bounds use std::optional; "absent" is never encoded as 0.
================================================================================
*/

#include <optional>
#include <string>

#include "rotorbeam/core/errors.hpp"
#include "rotorbeam/core/logging.hpp"

namespace rotorbeam {

// ----------------------------- Section selection -----------------------------
struct SelectionSettings {
  // Forced start position; auto-detected from chord/stiffness when absent.
  std::optional<double> start_override;

  // Relative midpoint interpolation error threshold.
  double error_tolerance = 0.05;

  // Relative change between neighbouring raw samples that forces a section.
  double jump_tolerance = 0.10;

  // Hard cap on element count.
  int max_elements = 40;

  // Absolute element span bounds (same length unit as the station column).
  std::optional<double> max_segment_length;
  std::optional<double> min_segment_length;

  // Chord above this marks the effective blade start.
  double chord_epsilon = 1e-3;

  void validate_or_throw() const {
    if (start_override && !is_finite(*start_override)) {
      throw ValidationError("SelectionSettings: start_override must be finite");
    }
    if (!is_finite(error_tolerance) || error_tolerance <= 0.0) {
      throw ValidationError("SelectionSettings: error_tolerance must be > 0");
    }
    if (!is_finite(jump_tolerance) || jump_tolerance <= 0.0) {
      throw ValidationError("SelectionSettings: jump_tolerance must be > 0");
    }
    if (max_elements < 1) {
      throw ValidationError("SelectionSettings: max_elements must be >= 1");
    }
    if (max_segment_length && (!is_finite(*max_segment_length) || *max_segment_length <= 0.0)) {
      throw ValidationError("SelectionSettings: max_segment_length must be > 0");
    }
    if (min_segment_length && (!is_finite(*min_segment_length) || *min_segment_length <= 0.0)) {
      throw ValidationError("SelectionSettings: min_segment_length must be > 0");
    }
    if (max_segment_length && min_segment_length && !(*min_segment_length < *max_segment_length)) {
      throw ValidationError("SelectionSettings: min_segment_length must be < max_segment_length");
    }
    if (!is_finite(chord_epsilon) || chord_epsilon < 0.0) {
      throw ValidationError("SelectionSettings: chord_epsilon must be >= 0");
    }
  }
};

// ----------------------------- Material --------------------------------------
struct MaterialSettings {
  // Poisson ratio used for the shear stiffness GA = EA / (2 (1 + nu)).
  double nu = 0.33;

  void validate_or_throw() const {
    if (!is_finite(nu) || nu <= -1.0 || nu > 0.5) {
      throw ValidationError("MaterialSettings: nu must be in (-1, 0.5]");
    }
  }
};

// ----------------------------- Run -------------------------------------------
// One blade generation: inputs, outputs and all knobs.
struct RunSettings {
  std::string name = "blade";
  std::string out_dir = ".";
  std::string structural_path;
  std::optional<std::string> aero_path;

  LogLevel log_level = LogLevel::INFO;

  SelectionSettings selection;
  MaterialSettings material;

  void validate_or_throw() const {
    if (name.empty()) {
      throw ValidationError("RunSettings: name empty");
    }
    if (out_dir.empty()) {
      throw ValidationError("RunSettings: out_dir empty");
    }
    if (structural_path.empty()) {
      throw ValidationError("RunSettings: structural table path required");
    }
    if (aero_path && aero_path->empty()) {
      throw ValidationError("RunSettings: aero table path given but empty");
    }
    selection.validate_or_throw();
    material.validate_or_throw();
  }

  static RunSettings defaults() {
    RunSettings s;
    return s;
  }
};

// Keep [A-Za-z0-9_-]; everything else becomes '_'. Leading/trailing '_' are
// trimmed; an empty result falls back to `fallback`.
inline std::string sanitize_name(const std::string& raw, const std::string& fallback) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                      (c >= '0' && c <= '9') || c == '_' || c == '-';
    out.push_back(keep ? c : '_');
  }
  const auto first = out.find_first_not_of('_');
  if (first == std::string::npos) return fallback;
  const auto last = out.find_last_not_of('_');
  return out.substr(first, last - first + 1);
}

}  // namespace rotorbeam
