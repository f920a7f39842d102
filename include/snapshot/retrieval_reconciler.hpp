#pragma once

#include "core/types.hpp"
#include "storage/ifile_store.hpp"
#include "thresholds/threshold_resolver.hpp"

#include <memory>
#include <string>

namespace equipstat {

/**
 * @brief Serves snapshots with classification recomputed on read
 *
 * Outliers and per-record health are recomputed against the requesting
 * user's current thresholds; every other field (counts, averages, type
 * comparison, correlation, raw values) is served as stored.
 *
 * With a file store attached, records are re-read from the snapshot's raw
 * upload (digest checked, record count must match). Any failure while
 * recomputing leaves the stored classification in place.
 */
class RetrievalReconciler {
public:
    struct View {
        AnalysisSnapshot snapshot;
        ThresholdPair thresholds;       // thresholds the view reflects, if recomputed
        bool recomputed = false;
    };

    explicit RetrievalReconciler(std::shared_ptr<const ThresholdResolver> resolver,
                                 std::shared_ptr<IFileStore> file_store = nullptr);

    [[nodiscard]] View view(const AnalysisSnapshot& snapshot,
                            const std::string& requesting_user) const;

private:
    /// Records to classify; throws when the backing upload is unusable
    [[nodiscard]] RecordTable load_records(const AnalysisSnapshot& snapshot) const;

    std::shared_ptr<const ThresholdResolver> resolver_;
    std::shared_ptr<IFileStore> file_store_;
};

} // namespace equipstat
