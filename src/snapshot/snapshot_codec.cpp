#include "snapshot/snapshot_codec.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace equipstat {

namespace {

std::string encode_record_fields(const EquipmentRecord& rec) {
    return std::format(
        "\"Equipment Name\":\"{}\",\"Type\":\"{}\",\"Flowrate\":{},\"Pressure\":{},\"Temperature\":{}",
        utils::escape_json(rec.equipment_name), utils::escape_json(rec.type),
        utils::json_number(rec.flowrate), utils::json_number(rec.pressure),
        utils::json_number(rec.temperature));
}

JsonValue parse_expecting(const std::string& json, bool want_array, const char* what) {
    auto doc = JsonValue::parse(json);
    if (want_array ? !doc.is_array() : !doc.is_object()) {
        throw std::runtime_error(std::format("{} document has wrong shape", what));
    }
    return doc;
}

} // anonymous namespace

// ============================================================================
// Records
// ============================================================================

std::string SnapshotCodec::encode_records(const RecordTable& records) {
    std::string json = "[";
    for (size_t i = 0; i < records.size(); ++i) {
        if (i > 0) json += ',';
        json += '{';
        json += encode_record_fields(records[i]);
        json += '}';
    }
    json += ']';
    return json;
}

RecordTable SnapshotCodec::decode_records(const std::string& json) {
    const auto doc = parse_expecting(json, true, "records");

    RecordTable records;
    records.reserve(doc.size());
    for (size_t i = 0; i < doc.size(); ++i) {
        const auto row = doc[i];
        EquipmentRecord rec;
        rec.equipment_name = row.value("Equipment Name", std::string{});
        rec.type = row.value("Type", std::string{});
        rec.flowrate = row.number_or_nan("Flowrate");
        rec.pressure = row.number_or_nan("Pressure");
        rec.temperature = row.number_or_nan("Temperature");
        records.push_back(std::move(rec));
    }
    return records;
}

// ============================================================================
// Summary
// ============================================================================

std::string SnapshotCodec::encode_outliers(const std::vector<OutlierEntry>& outliers) {
    std::string json = "[";
    for (size_t i = 0; i < outliers.size(); ++i) {
        if (i > 0) json += ',';
        json += std::format("{{\"equipment\":\"{}\",\"parameters\":[",
                            utils::escape_json(outliers[i].equipment_name));
        const auto& params = outliers[i].parameters;
        for (size_t j = 0; j < params.size(); ++j) {
            if (j > 0) json += ',';
            const auto& p = params[j];
            json += std::format(
                "{{\"parameter\":\"{}\",\"value\":{},\"lower_bound\":{},\"upper_bound\":{},\"status\":\"{}\"}}",
                column_header(p.parameter), utils::json_number(p.value),
                utils::json_number(p.lower_bound), utils::json_number(p.upper_bound),
                bound_violation_to_string(p.violation()));
        }
        json += "]}";
    }
    json += ']';
    return json;
}

std::string SnapshotCodec::encode_summary(const AnalysisSummary& summary) {
    std::string json = std::format("{{\"total_count\":{}", summary.total_count);

    for (const auto c : kNumericColumns) {
        const auto& stats = summary.column(c);
        const char* key = column_key(c);
        json += std::format(",\"avg_{0}\":{1},\"min_{0}\":{2},\"max_{0}\":{3},\"std_{0}\":{4}",
                            key, utils::json_number(stats.avg), utils::json_number(stats.min),
                            utils::json_number(stats.max), utils::json_number(stats.stddev));
    }

    json += ",\"type_distribution\":{";
    bool first = true;
    for (const auto& [type, count] : summary.type_distribution) {
        if (!first) json += ',';
        first = false;
        json += std::format("\"{}\":{}", utils::escape_json(type), count);
    }
    json += '}';

    json += ",\"type_comparison\":{";
    first = true;
    for (const auto& [type, group] : summary.type_comparison) {
        if (!first) json += ',';
        first = false;
        json += std::format("\"{}\":{{\"count\":{}", utils::escape_json(type), group.count);
        for (const auto c : kNumericColumns) {
            json += std::format(",\"avg_{}\":{}", column_key(c),
                                utils::json_number(group.averages[column_index(c)]));
        }
        json += '}';
    }
    json += '}';

    json += ",\"correlation_matrix\":{";
    for (const auto row : kNumericColumns) {
        if (row != kNumericColumns.front()) json += ',';
        json += std::format("\"{}\":{{", column_header(row));
        for (const auto col : kNumericColumns) {
            if (col != kNumericColumns.front()) json += ',';
            json += std::format("\"{}\":{}", column_header(col),
                utils::json_number(summary.correlation_matrix[column_index(row)][column_index(col)]));
        }
        json += '}';
    }
    json += '}';

    json += ",\"outliers\":";
    json += encode_outliers(summary.outliers);
    json += '}';
    return json;
}

AnalysisSummary SnapshotCodec::decode_summary(const std::string& json) {
    const auto doc = parse_expecting(json, false, "summary");

    AnalysisSummary summary;
    summary.total_count = doc.value("total_count", size_t{0});

    for (const auto c : kNumericColumns) {
        auto& stats = summary.columns[column_index(c)];
        const std::string key = column_key(c);
        stats.avg = doc.number_or_nan("avg_" + key);
        stats.min = doc.number_or_nan("min_" + key);
        stats.max = doc.number_or_nan("max_" + key);
        stats.stddev = doc.number_or_nan("std_" + key);
    }

    const auto distribution = doc["type_distribution"];
    for (const auto& [type, count] : distribution.items()) {
        if (count.is_number()) {
            summary.type_distribution[type] = count.get<size_t>();
        }
    }

    const auto comparison = doc["type_comparison"];
    for (const auto& [type, group_doc] : comparison.items()) {
        TypeGroupStats group;
        group.count = group_doc.value("count", size_t{0});
        for (const auto c : kNumericColumns) {
            group.averages[column_index(c)] =
                group_doc.number_or_nan(std::string("avg_") + column_key(c));
        }
        summary.type_comparison.emplace(type, group);
    }

    const auto matrix = doc["correlation_matrix"];
    for (const auto row : kNumericColumns) {
        const auto row_doc = matrix[column_header(row)];
        for (const auto col : kNumericColumns) {
            summary.correlation_matrix[column_index(row)][column_index(col)] =
                row_doc.number_or_nan(column_header(col));
        }
    }

    const auto outliers = doc["outliers"];
    for (size_t i = 0; i < outliers.size(); ++i) {
        const auto entry_doc = outliers[i];
        OutlierEntry entry;
        entry.equipment_name = entry_doc.value("equipment", std::string{});
        const auto params = entry_doc["parameters"];
        for (size_t j = 0; j < params.size(); ++j) {
            const auto p = params[j];
            const auto column = column_from_header(p.value("parameter", std::string{}));
            if (!column) {
                throw std::runtime_error("summary outlier has unknown parameter");
            }
            entry.parameters.push_back(OutlierParameter{
                *column, p.number_or_nan("value"),
                p.number_or_nan("lower_bound"), p.number_or_nan("upper_bound")});
        }
        summary.outliers.push_back(std::move(entry));
    }

    return summary;
}

// ============================================================================
// Health
// ============================================================================

std::string SnapshotCodec::encode_health(const std::vector<HealthAssessment>& health) {
    std::string json = "[";
    for (size_t i = 0; i < health.size(); ++i) {
        if (i > 0) json += ',';
        json += std::format("\"{}\"", health_status_to_string(health[i].status));
    }
    json += ']';
    return json;
}

std::vector<HealthAssessment> SnapshotCodec::decode_health(const std::string& json) {
    const auto doc = parse_expecting(json, true, "health");

    std::vector<HealthAssessment> health;
    health.reserve(doc.size());
    for (size_t i = 0; i < doc.size(); ++i) {
        const auto v = doc[i];
        const auto status = v.is_string() ? health_status_from_string(v.get<std::string>())
                                          : std::nullopt;
        if (!status) {
            throw std::runtime_error(std::format("health entry {} is not a known status", i));
        }
        health.push_back(HealthAssessment{*status});
    }
    return health;
}

// ============================================================================
// Full representation
// ============================================================================

std::string SnapshotCodec::encode_snapshot(const AnalysisSnapshot& snapshot) {
    std::string json = std::format(
        "{{\"id\":{},\"user_upload_index\":{},\"uploaded_at\":\"{}\",\"username\":\"{}\"",
        snapshot.id, snapshot.sequence_index, utils::format_timestamp(snapshot.uploaded_at),
        utils::escape_json(snapshot.owner));

    if (!snapshot.source.empty()) {
        json += std::format(",\"file_sha256\":\"{}\"", utils::escape_json(snapshot.source.sha256));
    }

    json += ",\"summary\":";
    json += encode_summary(snapshot.summary);

    json += ",\"processed_data\":[";
    for (size_t i = 0; i < snapshot.records.size(); ++i) {
        if (i > 0) json += ',';
        json += '{';
        json += encode_record_fields(snapshot.records[i]);
        if (i < snapshot.health.size()) {
            json += std::format(",\"health_status\":\"{}\",\"health_color\":\"{}\"",
                                health_status_to_string(snapshot.health[i].status),
                                snapshot.health[i].color());
        }
        json += '}';
    }
    json += "]}";
    return json;
}

std::string SnapshotCodec::encode_history(const std::vector<AnalysisSnapshot>& snapshots) {
    std::string json = "[";
    for (size_t i = 0; i < snapshots.size(); ++i) {
        if (i > 0) json += ',';
        json += encode_snapshot(snapshots[i]);
    }
    json += ']';
    return json;
}

} // namespace equipstat
