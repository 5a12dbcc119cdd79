// ============================================================================
// Fragment 2.1.01 — Sample Series + Signal Tables (Sort / Grouped-Mean Dedupe) (C++)
// File: sample_series.hpp
// ============================================================================
//
// Purpose:
// - Canonical in-memory form of a tabulated blade property: strictly
//   increasing abscissa, one or more named columns sharing it.
// - Every consumer (interpolator, section selector, exporters) sees only
//   normalized tables; raw readers hand over unsorted columns once.
//
// Normalization policy:
// - Stable sort of rows by x ascending.
// - Rows with identical x collapse to one row; each column takes the
//   arithmetic mean of the merged values. Values inside a group are summed
//   in ascending order so the mean does not depend on input row order.
//
// Failure (DataShapeError):
// - empty abscissa, column length != abscissa length, non-finite abscissa,
//   column without a single finite value.
//
// ============================================================================

#pragma once
#include "rotorbeam/core/errors.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace rotorbeam::blade {

// One named quantity sampled at raw stations.
struct SampleSeries final {
    std::vector<double> x;
    std::vector<double> y;

    std::size_t size() const noexcept { return x.size(); }
    bool empty() const noexcept { return x.empty(); }
    double x_min() const noexcept { return x.empty() ? 0.0 : x.front(); }
    double x_max() const noexcept { return x.empty() ? 0.0 : x.back(); }
};

using ColumnMap = std::map<std::string, std::vector<double>>;

// Several named columns over one shared, normalized abscissa.
struct SignalTable final {
    std::vector<double> x;
    ColumnMap columns;

    std::size_t size() const noexcept { return x.size(); }
    bool empty() const noexcept { return x.empty(); }

    bool has(const std::string& name) const noexcept { return columns.count(name) != 0; }

    // Throws UnknownSignalError.
    const std::vector<double>& column(const std::string& name) const;

    // Copy of one column paired with the abscissa. Throws UnknownSignalError.
    SampleSeries series(const std::string& name) const;

    std::vector<std::string> names() const;
};

// Sort + grouped-mean dedupe of a multi-column table.
SignalTable normalize_columns(const std::vector<double>& x, const ColumnMap& columns);

// Single-column form of normalize_columns.
SampleSeries make_series(const std::vector<double>& x, const std::vector<double>& y);

// True when x is strictly increasing (size < 2 counts as increasing).
bool strictly_increasing(const std::vector<double>& x) noexcept;

} // namespace rotorbeam::blade
