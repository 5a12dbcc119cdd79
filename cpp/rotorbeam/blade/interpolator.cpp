/*
===============================================================================
Fragment 2.1.02 — Signal Interpolator (Implementation)
File: interpolator.cpp
===============================================================================
*/

#include "rotorbeam/blade/interpolator.hpp"

#include <algorithm>
#include <iterator>

namespace rotorbeam::blade {

namespace {
// returns i such that x[i] <= xq < x[i+1], clamped to [0, n-2]
std::size_t lower_index(const std::vector<double>& x, double xq) {
    const std::size_t n = x.size();
    if (n < 2) return 0;

    auto it = std::upper_bound(x.begin(), x.end(), xq);
    const std::size_t j = static_cast<std::size_t>(std::distance(x.begin(), it));
    if (j == 0) return 0;
    return std::min(j - 1, n - 2);
}

double lerp(double a, double b, double t) noexcept {
    return a + (b - a) * t;
}
} // namespace

double interp_clamped(const std::vector<double>& x, const std::vector<double>& y, double xq) noexcept {
    if (x.empty() || y.size() != x.size()) return 0.0;
    if (xq <= x.front()) return y.front();
    if (xq >= x.back()) return y.back();

    const std::size_t i = lower_index(x, xq);
    const double x0 = x[i];
    const double x1 = x[i + 1];
    if (!(x1 > x0)) return y[i];

    const double t = clamp((xq - x0) / (x1 - x0), 0.0, 1.0);
    return lerp(y[i], y[i + 1], t);
}

SignalInterpolator::SignalInterpolator(const std::vector<double>& x, const ColumnMap& columns)
    : table_(normalize_columns(x, columns)) {}

SignalInterpolator::SignalInterpolator(const SignalTable& table)
    : SignalInterpolator(table.x, table.columns) {}

double SignalInterpolator::evaluate(const std::string& name, double xq) const {
    auto it = table_.columns.find(name);
    ROTORBEAM_REQUIRE(it != table_.columns.end(), UnknownSignalError, "unknown signal '" + name + "'");
    return interp_clamped(table_.x, it->second, xq);
}

} // namespace rotorbeam::blade
