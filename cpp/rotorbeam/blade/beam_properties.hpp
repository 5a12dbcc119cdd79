// ============================================================================
// Fragment 2.4.01 — Beam Properties (Gauss-Point Stiffness + Lumped Node Bodies)
// File: beam_properties.hpp
// ============================================================================
//
// Purpose:
// - Sample the grid closures the way the beam3 emitter does:
//     * 6x6 constitutive matrix at each element's two Gauss points
//     * one lumped body (mass + diagonal inertia) per grid node
// - Export both as CSV for inspection and downstream tooling.
//
// Stiffness (beam-local, ROTAN in degrees):
//   Y1 = YCT - YNA, Z1 = ZCT - ZNA, c = cos(ROTAN), s = sin(ROTAN)
//   GA  = EA / (2 (1 + nu))                 (both shear directions)
//   A22 = EJY c^2 + EJZ s^2 + Z1^2 EA
//   A33 = EJZ c^2 + EJY s^2 + Y1^2 EA
//   A23 = (EJY - EJZ) c s - Y1 Z1 EA
//
//       [ EA     0   0   0   Z1 EA  -Y1 EA ]
//       [ 0      GA  0   0   0       0     ]
//   K = [ 0      0   GA  0   0       0     ]
//       [ 0      0   0   GJ  0       0     ]
//       [ Z1 EA  0   0   0   A22     A23   ]
//       [ -Y1 EA 0   0   0   A23     A33   ]
//
// Bodies:
// - Node i owns [xL, xR]: midpoints to its neighbours, clamped to the first
//   and last section. dL = xR - xL.
//     M  = mean(dM(xL), dM(xR)) dL
//     JX = mean(dJX) dL
//     JY = mean(dJY) dL + M dL^2 / 12     (same for JZ)
//   Negative results are clamped to 0.
//
// CSV:
// - Fixed column order, fixed-point 10 digits, empty cell for non-finite.
//
// ============================================================================

#pragma once
#include "rotorbeam/blade/blade_grid.hpp"
#include "rotorbeam/core/settings.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace rotorbeam::blade {

using Matrix6 = std::array<std::array<double, 6>, 6>;

struct SectionStiffness final {
    double x = 0.0;
    double y1 = 0.0; // shear-centre offset from the neutral axis
    double z1 = 0.0;
    Matrix6 K{};
};

struct ElementStiffness final {
    std::size_t index = 0; // 1-based
    ElementSpan span;
    SectionStiffness first;
    SectionStiffness second;
};

struct NodeBody final {
    std::size_t index = 0; // 1-based
    double x = 0.0;
    double x_left = 0.0;
    double x_right = 0.0;
    double length = 0.0;
    double mass = 0.0;
    double jx = 0.0;
    double jy = 0.0;
    double jz = 0.0;
};

Matrix6 assemble_stiffness(double EA, double EJY, double EJZ, double GJ,
                           double y1, double z1, double rotan_deg, double nu) noexcept;

// Throws UnknownSignalError when no structural closure is attached.
SectionStiffness section_stiffness(const BladeGrid& grid, double x, const MaterialSettings& mat);

// Both Gauss matrices for every element. Throws ValidationError / UnknownSignalError.
std::vector<ElementStiffness> element_stiffness(const BladeGrid& grid, const MaterialSettings& mat);

// Throws InvalidSectionsError on an empty grid, UnknownSignalError without structural closure.
std::vector<NodeBody> lump_node_masses(const BladeGrid& grid);

double total_mass(const std::vector<NodeBody>& bodies) noexcept;

std::string elements_csv_header();
std::string elements_csv(const std::vector<ElementStiffness>& elems);

std::string bodies_csv_header();
std::string bodies_csv(const std::vector<NodeBody>& bodies);

// Throw IOError.
void write_elements_csv(const std::string& path, const std::vector<ElementStiffness>& elems);
void write_bodies_csv(const std::string& path, const std::vector<NodeBody>& bodies);

} // namespace rotorbeam::blade
