// ============================================================================
// Fragment 2.2.01 — Blade Grid (End–Mid–End Nodes + Two-Point Gauss Stations) (C++)
// File: blade_grid.hpp
// ============================================================================
//
// Purpose:
// - Turn K frozen control sections into the beam3 discretization:
//     * nodes       : 2K-1 positions  [s0, m01, s1, m12, s2, ..., sK-1]
//     * elements    : K-1 triples     (start, mid, end), mid = 0.5*(start+end)
//     * eval_points : K-1 pairs       mid -/+ (0.5/sqrt(3)) * (end-start)
// - Own the interpolation closures the emitters sample from.
//
// Section policy:
// - K >= 2, strictly increasing (difference > 0). Anything else throws
//   InvalidSectionsError.
//
// Closures:
// - attach_interpolators() binds the structural table (required) and the aero
//   table (optional). Without aero, has_aero() is false and evaluate_aero()
//   throws UnknownSignalError.
//
// ============================================================================

#pragma once
#include "rotorbeam/blade/interpolator.hpp"
#include "rotorbeam/blade/sample_series.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rotorbeam::blade {

struct ElementSpan final {
    double start = 0.0;
    double mid = 0.0;
    double end = 0.0;

    double length() const noexcept { return end - start; }
};

struct GaussPair final {
    double first = 0.0;
    double second = 0.0;
};

// 0.5 / sqrt(3): two-point Gauss-Legendre abscissa on a unit-length element.
inline constexpr double kGaussHalfOffset = 0.28867513459481288225;

class BladeGrid final {
public:
    std::vector<double> sections;
    std::vector<double> nodes;
    std::vector<ElementSpan> elements;
    std::vector<GaussPair> eval_points;

    std::size_t element_count() const noexcept { return elements.size(); }
    std::size_t node_count() const noexcept { return nodes.size(); }

    void attach_structural(SignalInterpolator interp) { structural_.emplace(std::move(interp)); }
    void attach_aero(SignalInterpolator interp) { aero_.emplace(std::move(interp)); }

    bool has_structural() const noexcept { return structural_.has_value(); }
    bool has_aero() const noexcept { return aero_.has_value(); }

    // Throw UnknownSignalError when the closure is absent or the name is unbound.
    double evaluate_structural(const std::string& name, double x) const;
    double evaluate_aero(const std::string& name, double x) const;

    const SignalInterpolator* structural() const noexcept { return structural_ ? &*structural_ : nullptr; }
    const SignalInterpolator* aero() const noexcept { return aero_ ? &*aero_ : nullptr; }

private:
    std::optional<SignalInterpolator> structural_;
    std::optional<SignalInterpolator> aero_;
};

// Throws InvalidSectionsError.
void validate_sections(const std::vector<double>& sections);

// Pure, deterministic. Throws InvalidSectionsError.
BladeGrid build_grid(const std::vector<double>& sections);

// Binds closures over the raw tables (re-normalized on binding).
// Throws DataShapeError for malformed tables.
void attach_interpolators(BladeGrid& grid, const SignalTable& structural, const SignalTable* aero);

} // namespace rotorbeam::blade
