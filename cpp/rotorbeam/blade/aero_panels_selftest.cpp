/*
  Fragment 2.5.02 — Aerodynamic Panels Selftest

  Objective
  ---------
    1) One panel per element, node ids 2i-1 / 2i / 2i+1.
    2) Chord sampled at start / mid / end through the aero closure.
    3) BC = -0.5 * chord; non-finite chord -> 0.
    4) Missing aero closure -> UnknownSignalError.
    5) CSV: fixed header, one row per element.

  Expected use
  ------------
      ./aero_panels_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "rotorbeam/blade/aero_panels.hpp"

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

blade::SignalTable flat_structural() {
  blade::SignalTable t;
  t.x = {0.0, 4.0};
  t.columns["EA"] = {1.0e6, 1.0e6};
  return t;
}

// Chord falls linearly from 0.6 at r=0 to 0.2 at r=4.
blade::SignalTable tapered_aero() {
  blade::SignalTable t;
  t.x = {0.0, 4.0};
  t.columns["Chord"] = {0.6, 0.2};
  return t;
}

void test_panels_follow_grid() {
  auto g = blade::build_grid({0.0, 1.0, 4.0});
  const auto st = flat_structural();
  const auto aero = tapered_aero();
  blade::attach_interpolators(g, st, &aero);

  const auto panels = blade::aero_panels(g);
  expect_true(panels.size() == g.element_count(), "one panel per element");
  expect_true(panels[0].index == 1 && panels[1].index == 2, "1-based element ids");
  expect_true(panels[1].nodes[0] == 3 && panels[1].nodes[1] == 4 && panels[1].nodes[2] == 5,
              "element 2 references nodes 3, 4, 5");
  expect_true(panels.back().nodes[2] == g.node_count(), "last panel ends on last node");

  expect_near(panels[1].span.mid, 2.5, 0.0, "panel span copied from element");
  expect_near(panels[1].chord[0], 0.5, 1e-12, "chord at element start");
  expect_near(panels[1].chord[1], 0.35, 1e-12, "chord at element mid");
  expect_near(panels[1].chord[2], 0.2, 1e-12, "chord at element end");
  expect_near(panels[0].bc[1], -0.5 * panels[0].chord[1], 0.0, "BC = -0.5 chord");
}

void test_non_finite_chord_zeroed() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  auto g = blade::build_grid({0.0, 2.0, 4.0});
  const auto st = flat_structural();
  blade::SignalTable aero;
  aero.x = {0.0, 2.0, 4.0};
  aero.columns["Chord"] = {0.5, nan, 0.3};
  blade::attach_interpolators(g, st, &aero);

  const auto panels = blade::aero_panels(g);
  expect_near(panels[0].chord[2], 0.0, 0.0, "NaN chord sample -> 0");
  expect_near(panels[0].bc[2], 0.0, 0.0, "NaN chord sample -> BC 0");
  expect_near(panels[0].chord[0], 0.5, 0.0, "finite chord sample kept");
}

void test_missing_aero() {
  auto g = blade::build_grid({0.0, 4.0});
  const auto st = flat_structural();
  blade::attach_interpolators(g, st, nullptr);
  expect_throws<UnknownSignalError>([&g] { (void)blade::aero_panels(g); },
                                    "no aero closure -> UnknownSignalError");

  blade::SignalTable twist_only;
  twist_only.x = {0.0, 4.0};
  twist_only.columns["Twist"] = {5.0, 1.0};
  blade::attach_interpolators(g, st, &twist_only);
  expect_throws<UnknownSignalError>([&g] { (void)blade::aero_panels(g); },
                                    "aero without Chord -> UnknownSignalError");
}

void test_csv() {
  auto g = blade::build_grid({0.0, 1.0, 4.0});
  const auto st = flat_structural();
  const auto aero = tapered_aero();
  blade::attach_interpolators(g, st, &aero);

  const std::string csv = blade::aero_csv(blade::aero_panels(g));
  std::size_t lines = 0;
  for (char c : csv) lines += (c == '\n');
  expect_true(csv.rfind(blade::aero_csv_header(), 0) == 0, "aero CSV starts with header");
  expect_true(lines == 1 + g.element_count(), "aero CSV: one row per element");
  expect_true(csv.find("2,3,4,5,1.0000000000,2.5000000000,4.0000000000,") != std::string::npos,
              "aero CSV: ids and span in fixed point");
}

}  // namespace
}  // namespace rotorbeam

int main() {
  using namespace rotorbeam;

  test_panels_follow_grid();
  test_non_finite_chord_zeroed();
  test_missing_aero();
  test_csv();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
