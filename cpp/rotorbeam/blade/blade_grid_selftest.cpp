/*
  Fragment 2.2.01 — Blade Grid Selftest

  Objective
  ---------
    1) K sections -> 2K-1 nodes, K-1 elements, K-1 Gauss pairs.
    2) Gauss stations sit at mid -/+ (0.5/sqrt(3)) * length.
    3) Invalid section lists fail with InvalidSectionsError.
    4) Closures: structural required, aero optional (absent -> UnknownSignalError).

  Expected use
  ------------
      ./blade_grid_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "rotorbeam/blade/blade_grid.hpp"

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

blade::SignalTable linear_structural() {
  blade::SignalTable t;
  t.x = {0.0, 4.0};
  t.columns["EA"] = {100.0, 500.0};
  t.columns["GJ"] = {1.0, 1.0};
  return t;
}

void test_grid_layout() {
  const auto g = blade::build_grid({0.0, 1.0, 3.0});

  expect_true(g.sections.size() == 3, "grid: sections kept");
  expect_true(g.node_count() == 5, "grid: 2K-1 nodes");
  expect_true(g.element_count() == 2, "grid: K-1 elements");
  expect_true(g.eval_points.size() == 2, "grid: K-1 Gauss pairs");

  const std::vector<double> want_nodes{0.0, 0.5, 1.0, 2.0, 3.0};
  bool nodes_ok = g.nodes.size() == want_nodes.size();
  for (std::size_t i = 0; nodes_ok && i < want_nodes.size(); ++i) nodes_ok = g.nodes[i] == want_nodes[i];
  expect_true(nodes_ok, "grid: end-mid-end node order");

  expect_near(g.elements[1].start, 1.0, 0.0, "element 2 start");
  expect_near(g.elements[1].mid, 2.0, 0.0, "element 2 mid");
  expect_near(g.elements[1].end, 3.0, 0.0, "element 2 end");
  expect_near(g.elements[1].length(), 2.0, 0.0, "element 2 length");

  const double off = 0.5 / std::sqrt(3.0);
  expect_near(g.eval_points[0].first, 0.5 - off, 1e-15, "Gauss point 1 of element 1");
  expect_near(g.eval_points[0].second, 0.5 + off, 1e-15, "Gauss point 2 of element 1");
  expect_near(g.eval_points[1].first, 2.0 - 2.0 * off, 1e-15, "Gauss point 1 scales with length");
  expect_near(g.eval_points[1].second, 2.0 + 2.0 * off, 1e-15, "Gauss point 2 scales with length");

  for (std::size_t e = 0; e < g.element_count(); ++e) {
    expect_true(g.nodes[2 * e] == g.elements[e].start && g.nodes[2 * e + 1] == g.elements[e].mid &&
                    g.nodes[2 * e + 2] == g.elements[e].end,
                "grid: element nodes are consecutive grid nodes");
  }
}

void test_invalid_sections() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  expect_throws<InvalidSectionsError>([] { blade::build_grid({}); }, "no sections -> InvalidSectionsError");
  expect_throws<InvalidSectionsError>([] { blade::build_grid({1.0}); }, "one section -> InvalidSectionsError");
  expect_throws<InvalidSectionsError>([] { blade::build_grid({0.0, 2.0, 1.0}); },
                                      "decreasing -> InvalidSectionsError");
  expect_throws<InvalidSectionsError>([] { blade::build_grid({0.0, 1.0, 1.0}); },
                                      "duplicate -> InvalidSectionsError");
  expect_throws<InvalidSectionsError>([nan] { blade::build_grid({0.0, nan}); },
                                      "non-finite -> InvalidSectionsError");
}

void test_closures() {
  auto g = blade::build_grid({0.0, 2.0, 4.0});
  expect_true(!g.has_structural() && !g.has_aero(), "grid: no closures before attach");
  expect_throws<UnknownSignalError>([&g] { (void)g.evaluate_structural("EA", 1.0); },
                                    "structural before attach -> UnknownSignalError");

  const auto st = linear_structural();
  blade::attach_interpolators(g, st, nullptr);

  expect_true(g.has_structural(), "grid: structural attached");
  expect_true(!g.has_aero(), "grid: aero absent when not provided");
  expect_near(g.evaluate_structural("EA", 1.0), 200.0, 1e-12, "structural closure interpolates");
  expect_near(g.evaluate_structural("EA", 9.0), 500.0, 0.0, "structural closure clamps");
  expect_true(g.structural() != nullptr && g.aero() == nullptr, "closure accessors");
  expect_throws<UnknownSignalError>([&g] { (void)g.evaluate_aero("Chord", 1.0); },
                                    "aero without data -> UnknownSignalError");
  expect_throws<UnknownSignalError>([&g] { (void)g.evaluate_structural("EJY", 1.0); },
                                    "unbound structural name -> UnknownSignalError");

  blade::SignalTable aero;
  aero.x = {0.0, 4.0};
  aero.columns["Chord"] = {0.5, 0.3};
  blade::attach_interpolators(g, st, &aero);
  expect_true(g.has_aero(), "grid: aero attached");
  expect_near(g.evaluate_aero("Chord", 2.0), 0.4, 1e-15, "aero closure interpolates");
}

}  // namespace
}  // namespace rotorbeam

int main() {
  using namespace rotorbeam;

  test_grid_layout();
  test_invalid_sections();
  test_closures();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
