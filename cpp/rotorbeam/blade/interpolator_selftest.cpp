/*
  Fragment 2.1.02 — Signal Interpolator Selftest

  Objective
  ---------
    1) Clamped linear evaluation: constant extrapolation outside the table,
       exact at samples, linear in between.
    2) Interpolators normalize unsorted / duplicated input on construction.
    3) Unknown names fail with UnknownSignalError.

  Expected use
  ------------
      ./interpolator_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "rotorbeam/blade/interpolator.hpp"

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

void test_interp_clamped() {
  const std::vector<double> x{0.0, 1.0, 3.0};
  const std::vector<double> y{2.0, 4.0, 0.0};

  expect_near(blade::interp_clamped(x, y, -5.0), 2.0, 0.0, "below range -> first value");
  expect_near(blade::interp_clamped(x, y, 10.0), 0.0, 0.0, "above range -> last value");
  expect_near(blade::interp_clamped(x, y, 1.0), 4.0, 1e-15, "exact at interior sample");
  expect_near(blade::interp_clamped(x, y, 0.25), 2.5, 1e-15, "linear in first interval");
  expect_near(blade::interp_clamped(x, y, 2.0), 2.0, 1e-15, "linear in second interval");
  expect_near(blade::interp_clamped({}, {}, 1.0), 0.0, 0.0, "empty table -> 0");
  expect_near(blade::interp_clamped({1.0}, {7.0}, 5.0), 7.0, 0.0, "single sample -> constant");
}

void test_interpolator_normalizes() {
  blade::ColumnMap cols;
  cols["EA"] = {30.0, 10.0, 12.0, 20.0};
  cols["Chord"] = {0.3, 0.1, 0.1, 0.2};
  const blade::SignalInterpolator f({2.0, 0.0, 0.0, 1.0}, cols);

  expect_true(f.sample_count() == 3, "interpolator: duplicates collapsed");
  expect_near(f.x_min(), 0.0, 0.0, "interpolator: x_min");
  expect_near(f.x_max(), 2.0, 0.0, "interpolator: x_max");
  expect_near(f.evaluate("EA", 0.0), 11.0, 1e-12, "interpolator: duplicate mean at x=0");
  expect_near(f("EA", 0.5), 15.5, 1e-12, "interpolator: operator() interpolates");
  expect_near(f.evaluate("Chord", 5.0), 0.3, 1e-15, "interpolator: clamp above");
  expect_true(f.has_signal("Chord") && !f.has_signal("GJ"), "interpolator: has_signal");
  expect_true(f.signal_names().size() == 2, "interpolator: signal_names");
}

void test_unknown_signal() {
  blade::ColumnMap cols;
  cols["EA"] = {1.0, 2.0};
  const blade::SignalInterpolator f({0.0, 1.0}, cols);
  try {
    (void)f.evaluate("EJY", 0.5);
    fail("unknown signal must throw");
  } catch (const UnknownSignalError& e) {
    pass("unknown signal -> UnknownSignalError");
    expect_true(e.code() == ErrorCode::UnknownSignal, "UnknownSignalError carries its code");
  }
}

void test_from_table() {
  blade::SignalTable t;
  t.x = {1.0, 0.0};
  t.columns["GJ"] = {4.0, 2.0};
  const blade::SignalInterpolator f(t);
  expect_near(f.evaluate("GJ", 0.5), 3.0, 1e-15, "interpolator from SignalTable");
}

}  // namespace
}  // namespace rotorbeam

int main() {
  using namespace rotorbeam;

  test_interp_clamped();
  test_interpolator_normalizes();
  test_unknown_signal();
  test_from_table();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
