#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "snapshot/isnapshot_store.hpp"
#include "storage/ifile_store.hpp"
#include "thresholds/threshold_resolver.hpp"

#include <memory>
#include <string>

namespace equipstat {

/**
 * @brief Upload flow: ingest -> validate -> statistics -> outliers ->
 *        health -> persist -> retention
 *
 * The snapshot is written provisionally before the table is read; any
 * validation or storage failure discards it (and the stored raw upload),
 * so failed uploads never become visible or count toward retention.
 */
class UploadPipeline {
public:
    struct Config {
        size_t retention_keep = kDefaultRetention;
        bool require_csv_extension = true;
    };

    UploadPipeline(const Config& config,
                   std::shared_ptr<ISnapshotStore> store,
                   std::shared_ptr<const ThresholdResolver> resolver,
                   std::shared_ptr<IFileStore> file_store = nullptr);

    [[nodiscard]] Result<AnalysisSnapshot> upload(const std::string& owner,
                                                  const std::string& file_name,
                                                  const std::string& content);

private:
    void rollback(const ProvisionalSnapshot& provisional, const SourceRef& source);
    void remove_source(const SourceRef& source);
    void apply_retention(const std::string& owner);

    Config config_;
    std::shared_ptr<ISnapshotStore> store_;
    std::shared_ptr<const ThresholdResolver> resolver_;
    std::shared_ptr<IFileStore> file_store_;
};

} // namespace equipstat
