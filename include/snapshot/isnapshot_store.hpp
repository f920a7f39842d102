#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace equipstat {

/// Maximum snapshots kept per owner after retention enforcement
inline constexpr size_t kDefaultRetention = 5;

/**
 * @brief Snapshot handle returned before analysis results are attached
 *
 * Provisional snapshots are never listed, counted or returned by get().
 */
struct ProvisionalSnapshot {
    int64_t id = 0;
    std::string owner;
    int64_t sequence_index = 0;
    std::chrono::system_clock::time_point uploaded_at;
};

struct EvictedSnapshot {
    int64_t id = 0;
    int64_t sequence_index = 0;
    SourceRef source;
};

/**
 * @brief Persistence for analysis snapshots
 *
 * Sequence indices are assigned per owner inside begin_create(), atomically
 * with the provisional write: max(existing index) + 1, never reused, and in
 * the same order as uploaded_at. Implementations throw StoreError on backend
 * failure.
 */
class ISnapshotStore {
public:
    virtual ~ISnapshotStore() = default;

    virtual ProvisionalSnapshot begin_create(const std::string& owner,
                                             const SourceRef& source) = 0;

    /**
     * @brief Attach analysis results and make the snapshot visible
     * @throws StoreError if @p id is not a pending provisional snapshot
     */
    virtual AnalysisSnapshot commit(int64_t id,
                                    RecordTable records,
                                    AnalysisSummary summary,
                                    std::vector<HealthAssessment> health) = 0;

    /// Roll back a provisional snapshot. @return true if it existed
    virtual bool discard(int64_t id) = 0;

    [[nodiscard]] virtual std::optional<AnalysisSnapshot> get(int64_t id) = 0;

    /// Owner's committed snapshots, newest uploaded_at first
    [[nodiscard]] virtual std::vector<AnalysisSnapshot> list_recent(
        const std::string& owner, size_t limit) = 0;

    [[nodiscard]] virtual size_t count(const std::string& owner) = 0;

    /**
     * @brief Keep the owner's @p keep newest snapshots, delete the rest in one batch
     *
     * Idempotent. @return the evicted snapshots
     */
    virtual std::vector<EvictedSnapshot> enforce_retention(const std::string& owner,
                                                           size_t keep = kDefaultRetention) = 0;

    /**
     * @brief One-shot create: provisional write + commit, rolled back on failure
     */
    AnalysisSnapshot create(const std::string& owner,
                            RecordTable records,
                            AnalysisSummary summary,
                            std::vector<HealthAssessment> health,
                            const SourceRef& source = {});

    /// get() restricted to snapshots owned by @p owner
    [[nodiscard]] std::optional<AnalysisSnapshot> get_for_owner(int64_t id,
                                                                const std::string& owner);
};

} // namespace equipstat
