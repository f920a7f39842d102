#pragma once

#include "db/connection_pool.hpp"
#include "snapshot/isnapshot_store.hpp"

#include <memory>

namespace equipstat {

/**
 * @brief PostgreSQL-backed snapshot store
 *
 * Tables:
 *   owner_sequences(owner PK, last_index)  -- per-owner index counter
 *   snapshots(id, owner, sequence_index, uploaded_at, committed,
 *             records/summary/health JSONB, source_path, source_sha256)
 *
 * begin_create() bumps the owner's counter with an upsert, which takes the
 * row lock that serializes concurrent uploads of one owner until COMMIT.
 * uploaded_at is taken inside that lock and clamped above the owner's newest
 * row, so index order and time order agree.
 */
class PgSnapshotStore : public ISnapshotStore {
public:
    explicit PgSnapshotStore(std::shared_ptr<ConnectionPool> pool);

    /// CREATE TABLE IF NOT EXISTS for both tables. Throws StoreError.
    void ensure_schema();

    ProvisionalSnapshot begin_create(const std::string& owner,
                                     const SourceRef& source) override;

    AnalysisSnapshot commit(int64_t id,
                            RecordTable records,
                            AnalysisSummary summary,
                            std::vector<HealthAssessment> health) override;

    bool discard(int64_t id) override;

    std::optional<AnalysisSnapshot> get(int64_t id) override;

    std::vector<AnalysisSnapshot> list_recent(const std::string& owner, size_t limit) override;

    size_t count(const std::string& owner) override;

    std::vector<EvictedSnapshot> enforce_retention(const std::string& owner,
                                                   size_t keep = kDefaultRetention) override;

    /// Decode one row of kSelectColumns. Throws StoreError on malformed data.
    [[nodiscard]] static AnalysisSnapshot decode_row(const DbResultSet& rs, size_t row);

private:
    [[nodiscard]] std::unique_ptr<PooledConnection> connection();

    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace equipstat
