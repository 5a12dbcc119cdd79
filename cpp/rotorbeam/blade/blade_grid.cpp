// ============================================================================
// Fragment 2.2.01 — Blade Grid (Implementation)
// File: blade_grid.cpp
// ============================================================================

#include "rotorbeam/blade/blade_grid.hpp"

#include <utility>

namespace rotorbeam::blade {

double BladeGrid::evaluate_structural(const std::string& name, double x) const {
    ROTORBEAM_REQUIRE(structural_.has_value(), UnknownSignalError,
                      "structural interpolator not attached (signal '" + name + "')");
    return structural_->evaluate(name, x);
}

double BladeGrid::evaluate_aero(const std::string& name, double x) const {
    ROTORBEAM_REQUIRE(aero_.has_value(), UnknownSignalError,
                      "no aerodynamic data attached (signal '" + name + "')");
    return aero_->evaluate(name, x);
}

void validate_sections(const std::vector<double>& sections) {
    ROTORBEAM_REQUIRE(sections.size() >= 2, InvalidSectionsError,
                      "need at least 2 control sections, got " + std::to_string(sections.size()));
    for (std::size_t i = 0; i < sections.size(); ++i) {
        ROTORBEAM_REQUIRE(is_finite(sections[i]), InvalidSectionsError, "control section not finite");
        if (i == 0) continue;
        ROTORBEAM_REQUIRE(sections[i] - sections[i - 1] > 0.0, InvalidSectionsError,
                          "control sections must be strictly increasing without duplicates (index " +
                              std::to_string(i) + ")");
    }
}

BladeGrid build_grid(const std::vector<double>& sections) {
    validate_sections(sections);

    const std::size_t k = sections.size();

    BladeGrid g;
    g.sections = sections;
    g.nodes.reserve(2 * k - 1);
    g.elements.reserve(k - 1);
    g.eval_points.reserve(k - 1);

    for (std::size_t i = 0; i + 1 < k; ++i) {
        const double a = sections[i];
        const double b = sections[i + 1];
        const double mid = 0.5 * (a + b);

        if (i == 0) g.nodes.push_back(a);
        g.nodes.push_back(mid);
        g.nodes.push_back(b);

        g.elements.push_back(ElementSpan{a, mid, b});

        const double off = kGaussHalfOffset * (b - a);
        g.eval_points.push_back(GaussPair{mid - off, mid + off});
    }

    return g;
}

void attach_interpolators(BladeGrid& grid, const SignalTable& structural, const SignalTable* aero) {
    grid.attach_structural(SignalInterpolator(structural));
    if (aero != nullptr) {
        grid.attach_aero(SignalInterpolator(*aero));
    }
}

} // namespace rotorbeam::blade
