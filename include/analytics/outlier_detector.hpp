#pragma once

#include "core/types.hpp"

#include <vector>

namespace equipstat {

/**
 * @brief IQR-rule outlier detection over the three numeric columns
 *
 * Each column is scanned independently (flowrate, pressure, temperature).
 * A value strictly outside [Q1 - k*IQR, Q3 + k*IQR] is a violation.
 * Violations are grouped per equipment name (exact string equality): the
 * first violation opens an entry, later ones append to its parameters.
 * Entry order is first-violation order.
 */
class OutlierDetector {
public:
    struct ColumnBounds {
        double q1 = 0.0;
        double q3 = 0.0;
        double lower = 0.0;
        double upper = 0.0;
    };

    [[nodiscard]] static ColumnBounds bounds(const std::vector<double>& values,
                                             double iqr_multiplier);

    [[nodiscard]] static std::vector<OutlierEntry> detect(const RecordTable& records,
                                                          double iqr_multiplier);
};

} // namespace equipstat
