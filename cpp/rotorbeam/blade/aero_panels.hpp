// ============================================================================
// Fragment 2.5.01 — Aerodynamic Panels (Chord at End-Mid-End per Element)
// File: aero_panels.hpp
// ============================================================================
//
// Purpose:
// - Sample the aero closure the way the aerodynamic beam3 emitter does: one
//   panel per element, chord at start / mid / end, referenced to the three
//   grid nodes of that element (2i-1, 2i, 2i+1).
// - BC point = -0.5 * chord. AC and twist stay 0 (pitch rides on the
//   structural feathering references).
// - Non-finite chord samples become 0.
//
// CSV:
// - Fixed column order, fixed-point 10 digits.
//
// ============================================================================

#pragma once
#include "rotorbeam/blade/blade_grid.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace rotorbeam::blade {

struct AeroPanel final {
    std::size_t index = 0;                  // 1-based element id
    std::array<std::size_t, 3> nodes{};     // 1-based node ids, end-mid-end
    ElementSpan span;
    std::array<double, 3> chord{};
    std::array<double, 3> bc{};
};

// Throws UnknownSignalError when no aero closure is attached or it lacks Chord.
std::vector<AeroPanel> aero_panels(const BladeGrid& grid);

std::string aero_csv_header();
std::string aero_csv(const std::vector<AeroPanel>& panels);

// Throws IOError.
void write_aero_csv(const std::string& path, const std::vector<AeroPanel>& panels);

} // namespace rotorbeam::blade
