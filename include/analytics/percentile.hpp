#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace equipstat::analytics {

/// All values of one numeric column, in record order
[[nodiscard]] inline std::vector<double> column_values(const RecordTable& records, NumericColumn c) {
    std::vector<double> values;
    values.reserve(records.size());
    for (const auto& rec : records) {
        values.push_back(rec.value(c));
    }
    return values;
}

/**
 * @brief q-th quantile (q in [0,1]) by linear interpolation between closest ranks
 *
 * Position is q * (n - 1) over the sorted values; same result as the
 * "linear" method of common numeric libraries. Empty input yields NaN.
 */
[[nodiscard]] inline double percentile_sorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return std::numeric_limits<double>::quiet_NaN();
    if (sorted.size() == 1) return sorted.front();

    const double pos = std::clamp(q, 0.0, 1.0) * static_cast<double>(sorted.size() - 1);
    const auto lo = static_cast<size_t>(std::floor(pos));
    const auto hi = static_cast<size_t>(std::ceil(pos));
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

[[nodiscard]] inline double percentile(std::vector<double> values, double q) {
    std::sort(values.begin(), values.end());
    return percentile_sorted(values, q);
}

} // namespace equipstat::analytics
