#pragma once

#include "core/types.hpp"

#include <vector>

namespace equipstat {

/**
 * @brief Three-level per-record health classification
 *
 * Priority: listed in outliers -> CRITICAL; any numeric value strictly above
 * its column's warning percentile (over the whole table) -> WARNING;
 * otherwise NORMAL. Output is parallel to the input records.
 */
class HealthClassifier {
public:
    [[nodiscard]] static std::vector<HealthAssessment> classify(
        const RecordTable& records,
        const std::vector<OutlierEntry>& outliers,
        double warning_percentile);

    /// Outlier detection followed by classification, with one threshold pair
    struct Classification {
        std::vector<OutlierEntry> outliers;
        std::vector<HealthAssessment> health;
    };

    [[nodiscard]] static Classification run(const RecordTable& records,
                                            const ThresholdPair& thresholds);
};

} // namespace equipstat
