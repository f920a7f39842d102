#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace equipstat {

/**
 * @brief JSON encoding of snapshots and their parts
 *
 * The same documents are used for persistence (records, summary and health
 * columns) and for the representation handed to reporting consumers.
 * NaN statistics are written as null and read back as NaN.
 *
 * Decoders throw JsonValue::parse_error on malformed JSON and
 * std::runtime_error on a document of the wrong shape.
 */
class SnapshotCodec {
public:
    [[nodiscard]] static std::string encode_records(const RecordTable& records);
    [[nodiscard]] static RecordTable decode_records(const std::string& json);

    [[nodiscard]] static std::string encode_summary(const AnalysisSummary& summary);
    [[nodiscard]] static AnalysisSummary decode_summary(const std::string& json);

    [[nodiscard]] static std::string encode_health(const std::vector<HealthAssessment>& health);
    [[nodiscard]] static std::vector<HealthAssessment> decode_health(const std::string& json);

    /**
     * @brief Full representation: id, user_upload_index, uploaded_at,
     *        username, summary and processed_data rows with health fields
     */
    [[nodiscard]] static std::string encode_snapshot(const AnalysisSnapshot& snapshot);

    /// JSON array of encode_snapshot() documents
    [[nodiscard]] static std::string encode_history(const std::vector<AnalysisSnapshot>& snapshots);

private:
    [[nodiscard]] static std::string encode_outliers(const std::vector<OutlierEntry>& outliers);
};

} // namespace equipstat
