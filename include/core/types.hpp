#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace equipstat {

// ============================================================================
// Numeric Columns
// ============================================================================

enum class NumericColumn {
    FLOWRATE,
    PRESSURE,
    TEMPERATURE
};

inline constexpr size_t kNumericColumnCount = 3;

/// Fixed scan order used by every per-column pass
inline constexpr std::array<NumericColumn, kNumericColumnCount> kNumericColumns = {
    NumericColumn::FLOWRATE, NumericColumn::PRESSURE, NumericColumn::TEMPERATURE
};

inline constexpr size_t column_index(NumericColumn c) noexcept {
    return static_cast<size_t>(c);
}

/// Source table header, e.g. "Flowrate"
inline constexpr const char* column_header(NumericColumn c) {
    switch (c) {
        case NumericColumn::FLOWRATE:    return "Flowrate";
        case NumericColumn::PRESSURE:    return "Pressure";
        case NumericColumn::TEMPERATURE: return "Temperature";
    }
    return "Unknown";
}

/// Lowercase key used in summary fields, e.g. "flowrate" in "avg_flowrate"
inline constexpr const char* column_key(NumericColumn c) {
    switch (c) {
        case NumericColumn::FLOWRATE:    return "flowrate";
        case NumericColumn::PRESSURE:    return "pressure";
        case NumericColumn::TEMPERATURE: return "temperature";
    }
    return "unknown";
}

inline std::optional<NumericColumn> column_from_header(const std::string& header) {
    for (const auto c : kNumericColumns) {
        if (header == column_header(c)) return c;
    }
    return std::nullopt;
}

// ============================================================================
// Equipment Record
// ============================================================================

struct EquipmentRecord {
    std::string equipment_name;
    std::string type;
    double flowrate = 0.0;
    double pressure = 0.0;
    double temperature = 0.0;

    [[nodiscard]] double value(NumericColumn c) const {
        switch (c) {
            case NumericColumn::FLOWRATE:    return flowrate;
            case NumericColumn::PRESSURE:    return pressure;
            case NumericColumn::TEMPERATURE: return temperature;
        }
        return 0.0;
    }
};

using RecordTable = std::vector<EquipmentRecord>;

// ============================================================================
// Outliers
// ============================================================================

enum class BoundViolation {
    LOW,
    HIGH
};

inline constexpr const char* bound_violation_to_string(BoundViolation v) {
    return v == BoundViolation::HIGH ? "high" : "low";
}

struct OutlierParameter {
    NumericColumn parameter = NumericColumn::FLOWRATE;
    double value = 0.0;
    double lower_bound = 0.0;
    double upper_bound = 0.0;

    /// Which bound was crossed (reporting only)
    [[nodiscard]] BoundViolation violation() const {
        return value > upper_bound ? BoundViolation::HIGH : BoundViolation::LOW;
    }
};

struct OutlierEntry {
    std::string equipment_name;
    std::vector<OutlierParameter> parameters;
};

// ============================================================================
// Health Classification
// ============================================================================

enum class HealthStatus {
    NORMAL,
    WARNING,
    CRITICAL
};

inline constexpr const char* health_status_to_string(HealthStatus s) {
    switch (s) {
        case HealthStatus::NORMAL:   return "normal";
        case HealthStatus::WARNING:  return "warning";
        case HealthStatus::CRITICAL: return "critical";
    }
    return "unknown";
}

inline constexpr const char* health_color(HealthStatus s) {
    switch (s) {
        case HealthStatus::NORMAL:   return "#10b981";
        case HealthStatus::WARNING:  return "#f59e0b";
        case HealthStatus::CRITICAL: return "#ef4444";
    }
    return "#000000";
}

inline std::optional<HealthStatus> health_status_from_string(const std::string& s) {
    if (s == "normal") return HealthStatus::NORMAL;
    if (s == "warning") return HealthStatus::WARNING;
    if (s == "critical") return HealthStatus::CRITICAL;
    return std::nullopt;
}

struct HealthAssessment {
    HealthStatus status = HealthStatus::NORMAL;

    [[nodiscard]] const char* color() const { return health_color(status); }
};

// ============================================================================
// Summary
// ============================================================================

struct ColumnStats {
    double avg = 0.0;
    double min = 0.0;
    double max = 0.0;
    double stddev = 0.0;   // sample (N-1); NaN when N <= 1
};

struct TypeGroupStats {
    size_t count = 0;
    std::array<double, kNumericColumnCount> averages{};   // indexed by column_index()
};

using CorrelationMatrix =
    std::array<std::array<double, kNumericColumnCount>, kNumericColumnCount>;

struct AnalysisSummary {
    size_t total_count = 0;
    std::array<ColumnStats, kNumericColumnCount> columns{};
    std::map<std::string, size_t> type_distribution;
    std::map<std::string, TypeGroupStats> type_comparison;
    CorrelationMatrix correlation_matrix{};
    std::vector<OutlierEntry> outliers;

    [[nodiscard]] const ColumnStats& column(NumericColumn c) const {
        return columns[column_index(c)];
    }
};

// ============================================================================
// Snapshot
// ============================================================================

/// Reference to the stored raw upload a snapshot was computed from
struct SourceRef {
    std::string path;
    std::string sha256;

    [[nodiscard]] bool empty() const { return path.empty(); }
};

struct AnalysisSnapshot {
    int64_t id = 0;
    std::string owner;
    int64_t sequence_index = 0;
    std::chrono::system_clock::time_point uploaded_at;
    RecordTable records;
    AnalysisSummary summary;
    std::vector<HealthAssessment> health;   // parallel to records
    SourceRef source;
};

// ============================================================================
// Thresholds
// ============================================================================

struct ThresholdLimits {
    static constexpr double kWarningMin = 0.50;
    static constexpr double kWarningMax = 0.95;
    static constexpr double kIqrMin = 0.5;
    static constexpr double kIqrMax = 3.0;

    static constexpr double kDefaultWarning = 0.75;
    static constexpr double kDefaultIqr = 1.5;
};

struct ThresholdPair {
    double warning_percentile = ThresholdLimits::kDefaultWarning;
    double outlier_iqr_multiplier = ThresholdLimits::kDefaultIqr;
};

/// Per-user override row
struct ThresholdSettings {
    std::string user;
    double warning_percentile = ThresholdLimits::kDefaultWarning;
    double outlier_iqr_multiplier = ThresholdLimits::kDefaultIqr;
    std::chrono::system_clock::time_point updated_at;
};

/// Partial update: omitted fields stay unchanged
struct ThresholdUpdate {
    std::optional<double> warning_percentile;
    std::optional<double> outlier_iqr_multiplier;
};

} // namespace equipstat
