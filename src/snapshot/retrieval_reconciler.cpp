#include "snapshot/retrieval_reconciler.hpp"
#include "analytics/health_classifier.hpp"
#include "core/utils.hpp"
#include "ingest/csv_reader.hpp"
#include "storage/digest.hpp"

#include <cmath>
#include <format>
#include <stdexcept>

namespace equipstat {

RetrievalReconciler::RetrievalReconciler(std::shared_ptr<const ThresholdResolver> resolver,
                                         std::shared_ptr<IFileStore> file_store)
    : resolver_(std::move(resolver)),
      file_store_(std::move(file_store)) {}

RecordTable RetrievalReconciler::load_records(const AnalysisSnapshot& snapshot) const {
    if (!file_store_ || snapshot.source.empty()) {
        return snapshot.records;
    }

    const auto content = file_store_->read(snapshot.source.path);
    if (!content) {
        throw std::runtime_error(std::format("backing file {} unavailable", snapshot.source.path));
    }
    if (!snapshot.source.sha256.empty() && sha256_hex(*content) != snapshot.source.sha256) {
        throw std::runtime_error(std::format("backing file {} digest mismatch", snapshot.source.path));
    }

    auto parsed = CsvTableReader::read(*content);
    if (parsed.is_error()) {
        throw std::runtime_error(parsed.error_message());
    }
    if (parsed.value().size() != snapshot.records.size()) {
        throw std::runtime_error(std::format("backing file has {} records, snapshot has {}",
                                             parsed.value().size(), snapshot.records.size()));
    }
    return std::move(parsed.value());
}

RetrievalReconciler::View RetrievalReconciler::view(const AnalysisSnapshot& snapshot,
                                                    const std::string& requesting_user) const {
    View result;
    result.snapshot = snapshot;

    try {
        const auto records = load_records(snapshot);
        for (const auto& rec : records) {
            for (const auto c : kNumericColumns) {
                if (!std::isfinite(rec.value(c))) {
                    throw std::runtime_error(
                        std::format("non-finite {} for '{}'", column_header(c), rec.equipment_name));
                }
            }
        }

        const auto thresholds = resolver_->resolve(requesting_user);
        auto classification = HealthClassifier::run(records, thresholds);

        result.snapshot.summary.outliers = std::move(classification.outliers);
        result.snapshot.health = std::move(classification.health);
        result.thresholds = thresholds;
        result.recomputed = true;
    } catch (const std::exception& e) {
        utils::log::warn(std::format(
            "Serving stored classification for snapshot {}: recomputation failed: {}",
            snapshot.id, e.what()));
    }

    return result;
}

} // namespace equipstat
