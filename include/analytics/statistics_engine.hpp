#pragma once

#include "core/types.hpp"

#include <vector>

namespace equipstat {

/**
 * @brief Descriptive statistics over a validated equipment table
 *
 * Produces every summary field except outliers: total count, per-column
 * avg/min/max/sample std, type distribution, per-type averages and the
 * Pearson correlation matrix of the three numeric columns.
 *
 * Undefined quantities are NaN, never zero: std for N <= 1, avg/min/max
 * for N == 0, off-diagonal correlation when a column has zero variance.
 * The correlation diagonal is always 1.0.
 */
class StatisticsEngine {
public:
    [[nodiscard]] static AnalysisSummary summarize(const RecordTable& records);

    [[nodiscard]] static ColumnStats column_stats(const std::vector<double>& values);

    /// Pearson correlation; NaN when n < 2 or either side has zero variance
    [[nodiscard]] static double pearson(const std::vector<double>& x,
                                        const std::vector<double>& y);
};

} // namespace equipstat
