// ============================================================================
// Fragment 2.1.01 — Sample Series + Signal Tables (Implementation)
// File: sample_series.cpp
// ============================================================================

#include "rotorbeam/blade/sample_series.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace rotorbeam::blade {

namespace {

struct Group final {
    double x = 0.0;
    std::size_t begin = 0; // into the sorted row order
    std::size_t end = 0;
};

double group_mean(const std::vector<double>& col,
                  const std::vector<std::size_t>& order,
                  const Group& g) {
    if (g.end - g.begin == 1) return col[order[g.begin]];

    // Finite values are summed in sorted order; non-finite ones are added
    // afterwards (NaN or inf wins regardless of row order).
    std::vector<double> vals;
    vals.reserve(g.end - g.begin);
    double tail = 0.0;
    for (std::size_t k = g.begin; k < g.end; ++k) {
        const double v = col[order[k]];
        if (is_finite(v)) vals.push_back(v);
        else tail += v;
    }

    std::sort(vals.begin(), vals.end());
    double sum = 0.0;
    for (double v : vals) sum += v;
    return (sum + tail) / static_cast<double>(g.end - g.begin);
}

bool any_finite(const std::vector<double>& v) noexcept {
    for (double y : v) {
        if (is_finite(y)) return true;
    }
    return false;
}

} // namespace

const std::vector<double>& SignalTable::column(const std::string& name) const {
    auto it = columns.find(name);
    ROTORBEAM_REQUIRE(it != columns.end(), UnknownSignalError, "unknown signal '" + name + "'");
    return it->second;
}

SampleSeries SignalTable::series(const std::string& name) const {
    SampleSeries s;
    s.x = x;
    s.y = column(name);
    return s;
}

std::vector<std::string> SignalTable::names() const {
    std::vector<std::string> out;
    out.reserve(columns.size());
    for (const auto& kv : columns) out.push_back(kv.first);
    return out;
}

bool strictly_increasing(const std::vector<double>& x) noexcept {
    for (std::size_t i = 1; i < x.size(); ++i) {
        if (!(x[i] - x[i - 1] > 0.0)) return false;
    }
    return true;
}

SignalTable normalize_columns(const std::vector<double>& x, const ColumnMap& columns) {
    ROTORBEAM_REQUIRE(!x.empty(), DataShapeError, "sample series empty");
    for (std::size_t i = 0; i < x.size(); ++i) {
        ROTORBEAM_REQUIRE(is_finite(x[i]), DataShapeError, "sample abscissa contains non-finite value");
    }
    for (const auto& kv : columns) {
        ROTORBEAM_REQUIRE(kv.second.size() == x.size(), DataShapeError,
                          "column '" + kv.first + "' length " + std::to_string(kv.second.size()) +
                              " does not match abscissa length " + std::to_string(x.size()));
        ROTORBEAM_REQUIRE(any_finite(kv.second), DataShapeError,
                          "column '" + kv.first + "' has no finite value");
    }

    std::vector<std::size_t> order(x.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return x[a] < x[b]; });

    std::vector<Group> groups;
    for (std::size_t k = 0; k < order.size(); ++k) {
        const double xv = x[order[k]];
        if (groups.empty() || groups.back().x != xv) {
            groups.push_back(Group{xv, k, k + 1});
        } else {
            groups.back().end = k + 1;
        }
    }

    SignalTable out;
    out.x.reserve(groups.size());
    for (const auto& g : groups) out.x.push_back(g.x);

    for (const auto& kv : columns) {
        std::vector<double> col;
        col.reserve(groups.size());
        for (const auto& g : groups) col.push_back(group_mean(kv.second, order, g));
        out.columns.emplace(kv.first, std::move(col));
    }
    return out;
}

SampleSeries make_series(const std::vector<double>& x, const std::vector<double>& y) {
    ColumnMap cols;
    cols.emplace("y", y);
    SignalTable t = normalize_columns(x, cols);

    SampleSeries s;
    s.x = std::move(t.x);
    s.y = std::move(t.columns.at("y"));
    return s;
}

} // namespace rotorbeam::blade
