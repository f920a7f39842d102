#pragma once

#include "snapshot/isnapshot_store.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>

namespace equipstat {

/**
 * @brief In-process snapshot store
 *
 * A single mutex serializes index assignment, commit and retention, which
 * gives per-owner serialization for free. uploaded_at is forced strictly
 * increasing per owner so index order and time order always agree.
 */
class MemorySnapshotStore : public ISnapshotStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    MemorySnapshotStore();
    explicit MemorySnapshotStore(Clock clock);

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

    /// Provisional entries still pending (tests)
    [[nodiscard]] size_t pending_count() const;

private:
    struct Entry {
        AnalysisSnapshot snapshot;
        bool committed = false;
    };

    struct OwnerSequence {
        int64_t last_index = 0;
        std::chrono::system_clock::time_point last_uploaded_at{};
    };

    /// Committed entries of one owner, newest first. Caller holds mutex_.
    [[nodiscard]] std::vector<const Entry*> committed_newest_first(const std::string& owner) const;

    Clock clock_;
    mutable std::mutex mutex_;
    int64_t next_id_ = 1;
    std::map<int64_t, Entry> entries_;
    std::unordered_map<std::string, OwnerSequence> sequences_;
};

} // namespace equipstat
