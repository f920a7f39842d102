#include "analytics/outlier_detector.hpp"
#include "analytics/percentile.hpp"

#include <algorithm>
#include <unordered_map>

namespace equipstat {

OutlierDetector::ColumnBounds OutlierDetector::bounds(const std::vector<double>& values,
                                                      double iqr_multiplier) {
    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    ColumnBounds b;
    b.q1 = analytics::percentile_sorted(sorted, 0.25);
    b.q3 = analytics::percentile_sorted(sorted, 0.75);
    const double iqr = b.q3 - b.q1;
    b.lower = b.q1 - iqr_multiplier * iqr;
    b.upper = b.q3 + iqr_multiplier * iqr;
    return b;
}

std::vector<OutlierEntry> OutlierDetector::detect(const RecordTable& records,
                                                  double iqr_multiplier) {
    std::vector<OutlierEntry> entries;
    if (records.empty()) return entries;

    // equipment name -> index into entries
    std::unordered_map<std::string, size_t> entry_index;

    for (const auto c : kNumericColumns) {
        const auto b = bounds(analytics::column_values(records, c), iqr_multiplier);

        for (const auto& rec : records) {
            const double v = rec.value(c);
            if (v >= b.lower && v <= b.upper) continue;

            OutlierParameter param;
            param.parameter = c;
            param.value = v;
            param.lower_bound = b.lower;
            param.upper_bound = b.upper;

            const auto [it, inserted] = entry_index.try_emplace(rec.equipment_name, entries.size());
            if (inserted) {
                entries.push_back(OutlierEntry{rec.equipment_name, {}});
            }
            entries[it->second].parameters.push_back(param);
        }
    }

    return entries;
}

} // namespace equipstat
