/*
  Fragment 2.4.01 — Beam Properties Selftest

  Objective
  ---------
    1) 6x6 constitutive matrix: diagonal terms, rotation by ROTAN,
       shear-centre coupling, symmetry.
    2) Gauss-point matrices sampled at the grid's evaluation points.
    3) Lumped bodies conserve the integral of the line mass density.
    4) CSV exports: fixed header, one row per Gauss point / node, empty cell
       for non-finite values.

  Expected use
  ------------
      ./beam_properties_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

#include "rotorbeam/blade/beam_properties.hpp"

namespace rotorbeam {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  got " << a << " want " << b << "\n";
  } else {
    pass(msg);
  }
}

template <typename E, typename F>
void expect_throws(F&& f, std::string_view msg) {
  try {
    f();
    fail(msg);
    std::cerr << "  no exception thrown\n";
  } catch (const E&) {
    pass(msg);
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  wrong exception: " << e.what() << "\n";
  }
}

std::size_t count_lines(const std::string& s) {
  std::size_t n = 0;
  for (char c : s) n += (c == '\n');
  return n;
}

blade::SignalTable uniform_structural() {
  blade::SignalTable t;
  t.x = {0.0, 2.0};
  const auto both = [](double v) { return std::vector<double>{v, v}; };
  t.columns["EA"] = both(1.0e8);
  t.columns["EJY"] = both(2.0e5);
  t.columns["EJZ"] = both(8.0e5);
  t.columns["GJ"] = both(5.0e4);
  t.columns["ROTAN_deg"] = both(0.0);
  t.columns["YCT"] = both(0.03);
  t.columns["YNA"] = both(0.01);
  t.columns["ZCT"] = both(-0.02);
  t.columns["ZNA"] = both(0.0);
  t.columns["dM"] = both(2.0);
  t.columns["dJX"] = both(0.3);
  t.columns["dJY"] = both(0.1);
  t.columns["dJZ"] = both(0.2);
  return t;
}

void test_assemble_diagonal() {
  const auto K = blade::assemble_stiffness(1.0e8, 2.0e5, 8.0e5, 5.0e4, 0.0, 0.0, 0.0, 0.33);
  expect_near(K[0][0], 1.0e8, 0.0, "K11 = EA");
  expect_near(K[1][1], 1.0e8 / 2.66, 1e-3, "K22 = EA / (2 (1 + nu))");
  expect_near(K[2][2], K[1][1], 0.0, "K33 = K22");
  expect_near(K[3][3], 5.0e4, 0.0, "K44 = GJ");
  expect_near(K[4][4], 2.0e5, 1e-9, "K55 = EJY at zero rotation");
  expect_near(K[5][5], 8.0e5, 1e-9, "K66 = EJZ at zero rotation");

  bool off_zero = true;
  for (int i = 0; i < 6; ++i)
    for (int j = 0; j < 6; ++j)
      if (i != j) off_zero = off_zero && K[i][j] == 0.0;
  expect_true(off_zero, "no coupling without offsets or rotation");
}

void test_assemble_rotation_and_offsets() {
  const auto R = blade::assemble_stiffness(1.0e8, 2.0e5, 8.0e5, 5.0e4, 0.0, 0.0, 90.0, 0.33);
  expect_near(R[4][4], 8.0e5, 1e-6, "90 deg rotation swaps bending (K55)");
  expect_near(R[5][5], 2.0e5, 1e-6, "90 deg rotation swaps bending (K66)");
  expect_near(R[4][5], 0.0, 1e-6, "90 deg rotation: no cross term");

  const auto Q = blade::assemble_stiffness(1.0, 3.0, 1.0, 1.0, 0.0, 0.0, 45.0, 0.0);
  expect_near(Q[4][5], 1.0, 1e-12, "45 deg: A23 = (EJY - EJZ) c s");

  const double ea = 1.0e8, y1 = 0.02, z1 = -0.02;
  const auto K = blade::assemble_stiffness(ea, 2.0e5, 8.0e5, 5.0e4, y1, z1, 0.0, 0.33);
  expect_near(K[0][4], z1 * ea, 1e-6, "K15 = Z1 EA");
  expect_near(K[0][5], -y1 * ea, 1e-6, "K16 = -Y1 EA");
  expect_near(K[4][4], 2.0e5 + z1 * z1 * ea, 1e-6, "A22 includes Z1^2 EA");
  expect_near(K[5][5], 8.0e5 + y1 * y1 * ea, 1e-6, "A33 includes Y1^2 EA");
  expect_near(K[4][5], -y1 * z1 * ea, 1e-6, "A23 = -Y1 Z1 EA at zero rotation");

  bool sym = true;
  for (int i = 0; i < 6; ++i)
    for (int j = 0; j < 6; ++j) sym = sym && K[i][j] == K[j][i];
  expect_true(sym, "matrix symmetric");
}

void test_element_stiffness_from_grid() {
  auto g = blade::build_grid({0.0, 1.0, 2.0});
  const auto st = uniform_structural();
  blade::attach_interpolators(g, st, nullptr);

  const MaterialSettings mat;
  const auto elems = blade::element_stiffness(g, mat);
  expect_true(elems.size() == 2, "one entry per element");
  expect_true(elems[0].index == 1 && elems[1].index == 2, "1-based element index");
  expect_near(elems[1].first.x, g.eval_points[1].first, 0.0, "first matrix at first Gauss point");
  expect_near(elems[1].second.x, g.eval_points[1].second, 0.0, "second matrix at second Gauss point");
  expect_near(elems[0].first.y1, 0.02, 1e-15, "Y1 = YCT - YNA");
  expect_near(elems[0].first.z1, -0.02, 1e-15, "Z1 = ZCT - ZNA");
  expect_near(elems[0].first.K[0][4], -0.02 * 1.0e8, 1e-6, "grid sample feeds coupling term");

  MaterialSettings bad;
  bad.nu = 0.9;
  expect_throws<ValidationError>([&] { (void)blade::element_stiffness(g, bad); }, "invalid nu -> ValidationError");

  const auto bare = blade::build_grid({0.0, 1.0});
  expect_throws<UnknownSignalError>([&] { (void)blade::element_stiffness(bare, mat); },
                                    "no structural closure -> UnknownSignalError");
}

void test_lumped_masses() {
  auto g = blade::build_grid({0.0, 2.0});
  const auto st = uniform_structural();
  blade::attach_interpolators(g, st, nullptr);

  const auto bodies = blade::lump_node_masses(g);
  expect_true(bodies.size() == 3, "one body per node");
  expect_near(bodies[0].x_left, 0.0, 0.0, "first body clamped to first section");
  expect_near(bodies[0].x_right, 0.5, 0.0, "first body ends halfway to next node");
  expect_near(bodies[1].length, 1.0, 1e-15, "middle body spans neighbour midpoints");
  expect_near(bodies[2].x_right, 2.0, 0.0, "last body clamped to last section");

  expect_near(bodies[0].mass, 1.0, 1e-12, "end body mass = dM * dL");
  expect_near(bodies[1].mass, 2.0, 1e-12, "middle body mass = dM * dL");
  expect_near(blade::total_mass(bodies), 4.0, 1e-12, "total mass = dM * span");
  expect_near(bodies[1].jx, 0.3, 1e-12, "JX = dJX * dL");
  expect_near(bodies[1].jy, 0.1 + 2.0 / 12.0, 1e-12, "JY = dJY * dL + M dL^2 / 12");
  expect_near(bodies[1].jz, 0.2 + 2.0 / 12.0, 1e-12, "JZ = dJZ * dL + M dL^2 / 12");

  const auto bare = blade::build_grid({0.0, 1.0});
  expect_throws<UnknownSignalError>([&] { (void)blade::lump_node_masses(bare); },
                                    "bodies without structural closure -> UnknownSignalError");
  expect_throws<InvalidSectionsError>([] { (void)blade::lump_node_masses(blade::BladeGrid{}); },
                                      "empty grid -> InvalidSectionsError");
}

void test_csv() {
  auto g = blade::build_grid({0.0, 1.0, 2.0});
  const auto st = uniform_structural();
  blade::attach_interpolators(g, st, nullptr);

  const auto ecsv = blade::elements_csv(blade::element_stiffness(g, MaterialSettings{}));
  expect_true(ecsv.rfind(blade::elements_csv_header(), 0) == 0, "elements CSV starts with header");
  expect_true(count_lines(ecsv) == 1 + 2 * 2, "elements CSV: one row per Gauss point");

  std::vector<blade::NodeBody> bodies = blade::lump_node_masses(g);
  bodies[0].mass = std::numeric_limits<double>::quiet_NaN();
  const auto bcsv = blade::bodies_csv(bodies);
  expect_true(bcsv.rfind(blade::bodies_csv_header(), 0) == 0, "bodies CSV starts with header");
  expect_true(count_lines(bcsv) == 1 + bodies.size(), "bodies CSV: one row per node");
  expect_true(bcsv.find(",,") != std::string::npos, "bodies CSV: non-finite value -> empty cell");
  expect_true(bcsv.find("nan") == std::string::npos, "bodies CSV: no nan literal");
}

}  // namespace
}  // namespace rotorbeam

int main() {
  using namespace rotorbeam;

  test_assemble_diagonal();
  test_assemble_rotation_and_offsets();
  test_element_stiffness_from_grid();
  test_lumped_masses();
  test_csv();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
