#include "pipeline/upload_pipeline.hpp"
#include "analytics/health_classifier.hpp"
#include "analytics/statistics_engine.hpp"
#include "core/utils.hpp"
#include "ingest/csv_reader.hpp"

#include <format>

namespace equipstat {

UploadPipeline::UploadPipeline(const Config& config,
                               std::shared_ptr<ISnapshotStore> store,
                               std::shared_ptr<const ThresholdResolver> resolver,
                               std::shared_ptr<IFileStore> file_store)
    : config_(config),
      store_(std::move(store)),
      resolver_(std::move(resolver)),
      file_store_(std::move(file_store)) {}

void UploadPipeline::remove_source(const SourceRef& source) {
    if (file_store_ && !source.empty()) {
        file_store_->remove(source.path);
    }
}

void UploadPipeline::rollback(const ProvisionalSnapshot& provisional, const SourceRef& source) {
    try {
        store_->discard(provisional.id);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Failed to discard provisional snapshot {}: {}",
                                      provisional.id, e.what()));
    }
    remove_source(source);
}

void UploadPipeline::apply_retention(const std::string& owner) {
    try {
        const auto evicted = store_->enforce_retention(owner, config_.retention_keep);
        for (const auto& e : evicted) {
            remove_source(e.source);
        }
    } catch (const std::exception& e) {
        // Snapshot is committed; the next upload retries retention
        utils::log::error(std::format("Retention enforcement for '{}' failed: {}", owner, e.what()));
    }
}

Result<AnalysisSnapshot> UploadPipeline::upload(const std::string& owner,
                                                const std::string& file_name,
                                                const std::string& content) {
    if (owner.empty()) {
        return Result<AnalysisSnapshot>::error(ErrorCategory::VALIDATION_ERROR,
                                               "Upload owner must not be empty");
    }
    if (config_.require_csv_extension && !utils::ends_with_ci(file_name, ".csv")) {
        return Result<AnalysisSnapshot>::error(ErrorCategory::VALIDATION_ERROR,
                                               "Only CSV files are allowed");
    }

    const utils::Timer timer;

    SourceRef source;
    if (file_store_) {
        try {
            const auto stored = file_store_->save(file_name, content);
            source = SourceRef{stored.path, stored.sha256};
        } catch (const std::exception& e) {
            return Result<AnalysisSnapshot>::error(ErrorCategory::STORAGE_ERROR,
                std::format("Failed to store upload: {}", e.what()));
        }
    }

    ProvisionalSnapshot provisional;
    try {
        provisional = store_->begin_create(owner, source);
    } catch (const std::exception& e) {
        remove_source(source);
        return Result<AnalysisSnapshot>::error(ErrorCategory::STORAGE_ERROR,
            std::format("Failed to create snapshot: {}", e.what()));
    }

    auto parsed = CsvTableReader::read(content);
    if (parsed.is_error()) {
        rollback(provisional, source);
        utils::log::warn(std::format("Upload '{}' by '{}' rejected: {}",
                                     file_name, owner, parsed.error_message()));
        return Result<AnalysisSnapshot>::error(parsed.error_category(), parsed.error_message());
    }
    auto& records = parsed.value();

    AnalysisSummary summary;
    HealthClassifier::Classification classification;
    try {
        summary = StatisticsEngine::summarize(records);
        const auto thresholds = resolver_->resolve(owner);
        classification = HealthClassifier::run(records, thresholds);
        summary.outliers = std::move(classification.outliers);
    } catch (const std::exception& e) {
        rollback(provisional, source);
        return Result<AnalysisSnapshot>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Analysis failed: {}", e.what()));
    }

    AnalysisSnapshot snapshot;
    try {
        snapshot = store_->commit(provisional.id, std::move(records), std::move(summary),
                                  std::move(classification.health));
    } catch (const std::exception& e) {
        rollback(provisional, source);
        return Result<AnalysisSnapshot>::error(ErrorCategory::STORAGE_ERROR,
            std::format("Failed to persist snapshot: {}", e.what()));
    }

    apply_retention(owner);

    utils::log::info(std::format(
        "Snapshot {} (#{} for '{}') created: {} records, {} outliers in {}ms",
        snapshot.id, snapshot.sequence_index, owner, snapshot.summary.total_count,
        snapshot.summary.outliers.size(), timer.elapsed_ms().count()));

    return Result<AnalysisSnapshot>::ok(std::move(snapshot));
}

} // namespace equipstat
