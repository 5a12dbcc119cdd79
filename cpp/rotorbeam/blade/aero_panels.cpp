// ============================================================================
// Fragment 2.5.01 — Aerodynamic Panels (Implementation)
// File: aero_panels.cpp
// ============================================================================

#include "rotorbeam/blade/aero_panels.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace rotorbeam::blade {

namespace {

double finite_or_zero(double v) noexcept { return is_finite(v) ? v : 0.0; }

void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f) {
        throw IOError("cannot open CSV for writing: " + path);
    }
    f << content;
    f.flush();
    if (!f) {
        throw IOError("failed writing CSV: " + path);
    }
}

} // namespace

std::vector<AeroPanel> aero_panels(const BladeGrid& grid) {
    ROTORBEAM_REQUIRE(grid.has_aero(), UnknownSignalError, "aero closure not attached");

    std::vector<AeroPanel> out;
    out.reserve(grid.element_count());
    for (std::size_t i = 0; i < grid.element_count(); ++i) {
        const ElementSpan& e = grid.elements[i];
        AeroPanel p;
        p.index = i + 1;
        p.nodes = {2 * i + 1, 2 * i + 2, 2 * i + 3};
        p.span = e;

        const std::array<double, 3> at{e.start, e.mid, e.end};
        for (std::size_t k = 0; k < 3; ++k) {
            p.chord[k] = finite_or_zero(grid.evaluate_aero("Chord", at[k]));
            p.bc[k] = -0.5 * p.chord[k];
        }
        out.push_back(p);
    }
    return out;
}

std::string aero_csv_header() {
    return
        "element,node1,node2,node3,start,mid,end,"
        "chord1,chord_mid,chord2,bc1,bc_mid,bc2\n";
}

std::string aero_csv(const std::vector<AeroPanel>& panels) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os << std::setprecision(10);
    os << aero_csv_header();
    for (const auto& p : panels) {
        os << p.index << ","
           << p.nodes[0] << "," << p.nodes[1] << "," << p.nodes[2] << ","
           << p.span.start << "," << p.span.mid << "," << p.span.end << ","
           << p.chord[0] << "," << p.chord[1] << "," << p.chord[2] << ","
           << p.bc[0] << "," << p.bc[1] << "," << p.bc[2] << "\n";
    }
    return os.str();
}

void write_aero_csv(const std::string& path, const std::vector<AeroPanel>& panels) {
    write_text_file(path, aero_csv(panels));
}

} // namespace rotorbeam::blade
