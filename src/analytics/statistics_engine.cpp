#include "analytics/statistics_engine.hpp"
#include "analytics/percentile.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace equipstat {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double mean(const std::vector<double>& values) {
    if (values.empty()) return kNaN;
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

} // anonymous namespace

ColumnStats StatisticsEngine::column_stats(const std::vector<double>& values) {
    ColumnStats stats;
    if (values.empty()) {
        stats.avg = stats.min = stats.max = stats.stddev = kNaN;
        return stats;
    }

    stats.avg = mean(values);
    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    stats.min = *lo;
    stats.max = *hi;

    if (values.size() < 2) {
        stats.stddev = kNaN;
        return stats;
    }

    double sq_sum = 0.0;
    for (const double v : values) {
        const double diff = v - stats.avg;
        sq_sum += diff * diff;
    }
    stats.stddev = std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
    return stats;
}

double StatisticsEngine::pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) return kNaN;

    const double mx = std::accumulate(x.begin(), x.begin() + n, 0.0) / static_cast<double>(n);
    const double my = std::accumulate(y.begin(), y.begin() + n, 0.0) / static_cast<double>(n);

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    if (sxx == 0.0 || syy == 0.0) return kNaN;
    const double r = sxy / std::sqrt(sxx * syy);
    // Rounding can push |r| a hair past 1
    return std::clamp(r, -1.0, 1.0);
}

AnalysisSummary StatisticsEngine::summarize(const RecordTable& records) {
    AnalysisSummary summary;
    summary.total_count = records.size();

    std::array<std::vector<double>, kNumericColumnCount> columns;
    for (const auto c : kNumericColumns) {
        columns[column_index(c)] = analytics::column_values(records, c);
        summary.columns[column_index(c)] = column_stats(columns[column_index(c)]);
    }

    // Type distribution and per-type sums
    std::map<std::string, std::array<double, kNumericColumnCount>> type_sums;
    for (const auto& rec : records) {
        ++summary.type_distribution[rec.type];
        auto& sums = type_sums[rec.type];
        for (const auto c : kNumericColumns) {
            sums[column_index(c)] += rec.value(c);
        }
    }

    for (const auto& [type, count] : summary.type_distribution) {
        TypeGroupStats group;
        group.count = count;
        const auto& sums = type_sums[type];
        for (size_t i = 0; i < kNumericColumnCount; ++i) {
            group.averages[i] = sums[i] / static_cast<double>(count);
        }
        summary.type_comparison.emplace(type, group);
    }

    // Correlation over the full record set; symmetric by construction
    for (size_t a = 0; a < kNumericColumnCount; ++a) {
        summary.correlation_matrix[a][a] = 1.0;
        for (size_t b = a + 1; b < kNumericColumnCount; ++b) {
            const double r = pearson(columns[a], columns[b]);
            summary.correlation_matrix[a][b] = r;
            summary.correlation_matrix[b][a] = r;
        }
    }

    return summary;
}

} // namespace equipstat
