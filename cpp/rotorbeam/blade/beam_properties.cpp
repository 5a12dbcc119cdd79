// ============================================================================
// Fragment 2.4.01 — Beam Properties (Implementation)
// File: beam_properties.cpp
// ============================================================================

#include "rotorbeam/blade/beam_properties.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace rotorbeam::blade {

namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

double mean2(double a, double b) noexcept { return 0.5 * (a + b); }

// Empty cell for non-finite values.
void put_num(std::ostringstream& os, double v) {
    if (is_finite(v)) os << v;
}

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

void put_gauss_row(std::ostringstream& os, const ElementStiffness& e, int which, const SectionStiffness& s) {
    os << e.index << ",";
    put_num(os, e.span.start); os << ",";
    put_num(os, e.span.mid);   os << ",";
    put_num(os, e.span.end);   os << ",";
    os << which << ",";
    put_num(os, s.x);  os << ",";
    put_num(os, s.y1); os << ",";
    put_num(os, s.z1); os << ",";
    put_num(os, s.K[0][0]); os << ",";
    put_num(os, s.K[0][4]); os << ",";
    put_num(os, s.K[0][5]); os << ",";
    put_num(os, s.K[1][1]); os << ",";
    put_num(os, s.K[2][2]); os << ",";
    put_num(os, s.K[3][3]); os << ",";
    put_num(os, s.K[4][4]); os << ",";
    put_num(os, s.K[4][5]); os << ",";
    put_num(os, s.K[5][5]);
    os << "\n";
}

} // namespace

Matrix6 assemble_stiffness(double EA, double EJY, double EJZ, double GJ,
                           double y1, double z1, double rotan_deg, double nu) noexcept {
    const double c = std::cos(rotan_deg * kDegToRad);
    const double s = std::sin(rotan_deg * kDegToRad);
    const double GA = EA / (2.0 * (1.0 + nu));

    const double A22 = EJY * c * c + EJZ * s * s + z1 * z1 * EA;
    const double A33 = EJZ * c * c + EJY * s * s + y1 * y1 * EA;
    const double A23 = (EJY - EJZ) * c * s - y1 * z1 * EA;
    const double K15 = z1 * EA;
    const double K16 = -y1 * EA;

    Matrix6 K{};
    K[0][0] = EA;
    K[1][1] = GA;
    K[2][2] = GA;
    K[3][3] = GJ;
    K[0][4] = K[4][0] = K15;
    K[0][5] = K[5][0] = K16;
    K[4][4] = A22;
    K[5][5] = A33;
    K[4][5] = K[5][4] = A23;
    return K;
}

SectionStiffness section_stiffness(const BladeGrid& grid, double x, const MaterialSettings& mat) {
    const double EA = grid.evaluate_structural("EA", x);
    const double EJY = grid.evaluate_structural("EJY", x);
    const double EJZ = grid.evaluate_structural("EJZ", x);
    const double GJ = grid.evaluate_structural("GJ", x);
    const double rot = grid.evaluate_structural("ROTAN_deg", x);

    SectionStiffness out;
    out.x = x;
    out.y1 = grid.evaluate_structural("YCT", x) - grid.evaluate_structural("YNA", x);
    out.z1 = grid.evaluate_structural("ZCT", x) - grid.evaluate_structural("ZNA", x);
    out.K = assemble_stiffness(EA, EJY, EJZ, GJ, out.y1, out.z1, rot, mat.nu);
    return out;
}

std::vector<ElementStiffness> element_stiffness(const BladeGrid& grid, const MaterialSettings& mat) {
    mat.validate_or_throw();

    std::vector<ElementStiffness> out;
    out.reserve(grid.element_count());
    for (std::size_t i = 0; i < grid.element_count(); ++i) {
        ElementStiffness e;
        e.index = i + 1;
        e.span = grid.elements[i];
        e.first = section_stiffness(grid, grid.eval_points[i].first, mat);
        e.second = section_stiffness(grid, grid.eval_points[i].second, mat);
        out.push_back(e);
    }
    return out;
}

std::vector<NodeBody> lump_node_masses(const BladeGrid& grid) {
    const auto& nodes = grid.nodes;
    const auto& sections = grid.sections;
    ROTORBEAM_REQUIRE(!nodes.empty(), InvalidSectionsError, "grid has no nodes");
    ROTORBEAM_REQUIRE(sections.size() >= 2, InvalidSectionsError, "grid has fewer than 2 control sections");

    const std::size_t n = nodes.size();
    std::vector<NodeBody> out;
    out.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        NodeBody b;
        b.index = i + 1;
        b.x = nodes[i];
        b.x_left = (i == 0) ? sections.front() : 0.5 * (nodes[i - 1] + nodes[i]);
        b.x_right = (i + 1 == n) ? sections.back() : 0.5 * (nodes[i] + nodes[i + 1]);
        b.length = std::max(0.0, b.x_right - b.x_left);

        if (b.length > 0.0) {
            const double xl = b.x_left;
            const double xr = b.x_right;
            const double dl = b.length;

            b.mass = std::max(0.0, mean2(grid.evaluate_structural("dM", xl), grid.evaluate_structural("dM", xr)) * dl);
            b.jx = std::max(0.0, mean2(grid.evaluate_structural("dJX", xl), grid.evaluate_structural("dJX", xr)) * dl);

            // slender-rod term about the node
            const double rod = b.mass * dl * dl / 12.0;
            b.jy = std::max(0.0, mean2(grid.evaluate_structural("dJY", xl), grid.evaluate_structural("dJY", xr)) * dl + rod);
            b.jz = std::max(0.0, mean2(grid.evaluate_structural("dJZ", xl), grid.evaluate_structural("dJZ", xr)) * dl + rod);
        }
        out.push_back(b);
    }
    return out;
}

double total_mass(const std::vector<NodeBody>& bodies) noexcept {
    double m = 0.0;
    for (const auto& b : bodies) m += b.mass;
    return m;
}

std::string elements_csv_header() {
    return
        "element,start,mid,end,gauss,x,y1,z1,"
        "K11,K15,K16,K22,K33,K44,K55,K56,K66\n";
}

std::string elements_csv(const std::vector<ElementStiffness>& elems) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os << std::setprecision(10);
    os << elements_csv_header();
    for (const auto& e : elems) {
        put_gauss_row(os, e, 1, e.first);
        put_gauss_row(os, e, 2, e.second);
    }
    return os.str();
}

std::string bodies_csv_header() {
    return "node,x,x_left,x_right,length,mass,JX,JY,JZ\n";
}

std::string bodies_csv(const std::vector<NodeBody>& bodies) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os << std::setprecision(10);
    os << bodies_csv_header();
    for (const auto& b : bodies) {
        os << b.index << ",";
        put_num(os, b.x);       os << ",";
        put_num(os, b.x_left);  os << ",";
        put_num(os, b.x_right); os << ",";
        put_num(os, b.length);  os << ",";
        put_num(os, b.mass);    os << ",";
        put_num(os, b.jx);      os << ",";
        put_num(os, b.jy);      os << ",";
        put_num(os, b.jz);
        os << "\n";
    }
    return os.str();
}

void write_elements_csv(const std::string& path, const std::vector<ElementStiffness>& elems) {
    write_text_file(path, elements_csv(elems));
}

void write_bodies_csv(const std::string& path, const std::vector<NodeBody>& bodies) {
    write_text_file(path, bodies_csv(bodies));
}

} // namespace rotorbeam::blade
