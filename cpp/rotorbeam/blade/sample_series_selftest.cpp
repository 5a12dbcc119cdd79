/*
  Fragment 2.1.01 — Sample Series Selftest

  Objective
  ---------
  Framework-free checks for table normalization:
    1) Rows come out sorted by x with duplicates collapsed to their mean.
    2) The result does not depend on input row order.
    3) Malformed tables fail loudly with DataShapeError.
    4) Unknown column lookups fail with UnknownSignalError.

  Expected use
  ------------
      ./sample_series_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "rotorbeam/blade/sample_series.hpp"

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

void expect_vec(const std::vector<double>& a, const std::vector<double>& b, std::string_view msg) {
  bool ok = a.size() == b.size();
  for (std::size_t i = 0; ok && i < a.size(); ++i) {
    ok = std::fabs(a[i] - b[i]) <= 1e-12 * std::max(1.0, std::fabs(b[i]));
  }
  if (!ok) {
    fail(msg);
    std::cerr << "  got:";
    for (double v : a) std::cerr << " " << v;
    std::cerr << "\n  want:";
    for (double v : b) std::cerr << " " << v;
    std::cerr << "\n";
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

void test_sort_and_grouped_mean() {
  blade::ColumnMap cols;
  cols["EA"] = {30.0, 10.0, 20.0, 14.0};
  cols["GJ"] = {3.0, 1.0, 2.0, 3.0};
  const auto t = blade::normalize_columns({3.0, 1.0, 2.0, 1.0}, cols);

  expect_vec(t.x, {1.0, 2.0, 3.0}, "normalize: abscissa sorted and unique");
  expect_vec(t.column("EA"), {12.0, 20.0, 30.0}, "normalize: duplicate x averaged (EA)");
  expect_vec(t.column("GJ"), {2.0, 2.0, 3.0}, "normalize: duplicate x averaged (GJ)");
  expect_true(blade::strictly_increasing(t.x), "normalize: output strictly increasing");
}

void test_order_independence() {
  const std::vector<double> x1{0.0, 1.0, 1.0, 1.0, 2.0};
  const std::vector<double> y1{5.0, 0.1, 0.2, 0.3, 7.0};
  const std::vector<double> x2{1.0, 2.0, 1.0, 0.0, 1.0};
  const std::vector<double> y2{0.3, 7.0, 0.1, 5.0, 0.2};

  const auto a = blade::make_series(x1, y1);
  const auto b = blade::make_series(x2, y2);
  expect_true(a.x == b.x, "make_series: abscissa independent of row order");
  expect_true(a.y == b.y, "make_series: grouped mean bit-identical for permuted rows");
}

void test_already_normalized_passthrough() {
  const auto s = blade::make_series({0.0, 0.5, 2.0}, {1.0, -1.0, 4.0});
  expect_vec(s.x, {0.0, 0.5, 2.0}, "make_series: sorted input kept");
  expect_vec(s.y, {1.0, -1.0, 4.0}, "make_series: values kept");
  expect_true(s.x_min() == 0.0 && s.x_max() == 2.0, "SampleSeries: x_min/x_max");
}

void test_shape_errors() {
  const double nan = std::numeric_limits<double>::quiet_NaN();

  expect_throws<DataShapeError>([] { blade::make_series({}, {}); },
                                "empty series -> DataShapeError");
  expect_throws<DataShapeError>([] { blade::make_series({0.0, 1.0}, {1.0}); },
                                "length mismatch -> DataShapeError");
  expect_throws<DataShapeError>([nan] { blade::make_series({0.0, nan}, {1.0, 2.0}); },
                                "non-finite abscissa -> DataShapeError");
  expect_throws<DataShapeError>([nan] { blade::make_series({0.0, 1.0}, {nan, nan}); },
                                "column without finite value -> DataShapeError");
}

void test_non_finite_duplicates() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  const auto a = blade::make_series({0.0, 1.0, 1.0, 1.0, 2.0}, {1.0, 0.5, nan, 0.25, 3.0});
  const auto b = blade::make_series({1.0, 2.0, 1.0, 0.0, 1.0}, {nan, 3.0, 0.25, 1.0, 0.5});
  expect_true(a.y.size() == 3 && std::isnan(a.y[1]), "grouped mean: NaN in a group yields NaN");
  expect_true(a.y[0] == b.y[0] && a.y[2] == b.y[2] && std::isnan(b.y[1]),
              "grouped mean: NaN group independent of row order");

  const auto c = blade::make_series({0.0, 0.0, 1.0}, {inf, 2.0, 1.0});
  expect_true(c.y[0] == inf, "grouped mean: inf in a group yields inf");
}

void test_unknown_column() {
  blade::ColumnMap cols;
  cols["EA"] = {1.0, 2.0};
  const auto t = blade::normalize_columns({0.0, 1.0}, cols);

  expect_true(t.has("EA") && !t.has("GJ"), "SignalTable: has()");
  expect_throws<UnknownSignalError>([&t] { (void)t.column("GJ"); },
                                    "unknown column -> UnknownSignalError");
  expect_throws<UnknownSignalError>([&t] { (void)t.series("GJ"); },
                                    "unknown series -> UnknownSignalError");
  expect_true(t.names() == std::vector<std::string>{"EA"}, "SignalTable: names()");
}

}  // namespace
}  // namespace rotorbeam

int main() {
  using namespace rotorbeam;

  test_sort_and_grouped_mean();
  test_order_independence();
  test_already_normalized_passthrough();
  test_shape_errors();
  test_non_finite_duplicates();
  test_unknown_column();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
