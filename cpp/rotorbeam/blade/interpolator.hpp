/*
===============================================================================
Fragment 2.1.02 — Signal Interpolator (Clamped Linear Closure over Tables) (C++)
File: interpolator.hpp
===============================================================================

evaluate(name, x):
  x <= x_min  -> y at x_min
  x >= x_max  -> y at x_max
  otherwise   -> linear between the bracketing samples

The bound table is normalized (sorted, duplicates averaged) at construction
and immutable afterwards.
*/

#pragma once

#include "rotorbeam/blade/sample_series.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace rotorbeam::blade {

// Clamped linear interpolation on a strictly increasing abscissa.
// Empty input returns 0.0.
double interp_clamped(const std::vector<double>& x, const std::vector<double>& y, double xq) noexcept;

inline double interp_clamped(const SampleSeries& s, double xq) noexcept {
    return interp_clamped(s.x, s.y, xq);
}

class SignalInterpolator final {
public:
    // Normalizes (x, columns). Throws DataShapeError.
    SignalInterpolator(const std::vector<double>& x, const ColumnMap& columns);
    explicit SignalInterpolator(const SignalTable& table);

    // Throws UnknownSignalError.
    double evaluate(const std::string& name, double xq) const;
    double operator()(const std::string& name, double xq) const { return evaluate(name, xq); }

    bool has_signal(const std::string& name) const noexcept { return table_.has(name); }
    std::vector<std::string> signal_names() const { return table_.names(); }

    double x_min() const noexcept { return table_.x.front(); }
    double x_max() const noexcept { return table_.x.back(); }
    std::size_t sample_count() const noexcept { return table_.size(); }

    const SignalTable& table() const noexcept { return table_; }

private:
    SignalTable table_;
};

} // namespace rotorbeam::blade
