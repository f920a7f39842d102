#include "analytics/health_classifier.hpp"
#include "analytics/outlier_detector.hpp"
#include "analytics/percentile.hpp"

#include <array>
#include <unordered_set>

namespace equipstat {

std::vector<HealthAssessment> HealthClassifier::classify(
    const RecordTable& records,
    const std::vector<OutlierEntry>& outliers,
    double warning_percentile) {

    std::unordered_set<std::string> critical;
    for (const auto& entry : outliers) {
        critical.insert(entry.equipment_name);
    }

    std::array<double, kNumericColumnCount> warning_levels{};
    for (const auto c : kNumericColumns) {
        warning_levels[column_index(c)] =
            analytics::percentile(analytics::column_values(records, c), warning_percentile);
    }

    std::vector<HealthAssessment> result;
    result.reserve(records.size());

    for (const auto& rec : records) {
        HealthAssessment assessment;
        if (critical.contains(rec.equipment_name)) {
            assessment.status = HealthStatus::CRITICAL;
        } else {
            for (const auto c : kNumericColumns) {
                if (rec.value(c) > warning_levels[column_index(c)]) {
                    assessment.status = HealthStatus::WARNING;
                    break;
                }
            }
        }
        result.push_back(assessment);
    }

    return result;
}

HealthClassifier::Classification HealthClassifier::run(const RecordTable& records,
                                                       const ThresholdPair& thresholds) {
    Classification out;
    out.outliers = OutlierDetector::detect(records, thresholds.outlier_iqr_multiplier);
    out.health = classify(records, out.outliers, thresholds.warning_percentile);
    return out;
}

} // namespace equipstat
