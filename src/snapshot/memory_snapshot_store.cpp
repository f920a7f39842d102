#include "snapshot/memory_snapshot_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace equipstat {

MemorySnapshotStore::MemorySnapshotStore()
    : MemorySnapshotStore([] { return std::chrono::system_clock::now(); }) {}

MemorySnapshotStore::MemorySnapshotStore(Clock clock)
    : clock_(std::move(clock)) {}

ProvisionalSnapshot MemorySnapshotStore::begin_create(const std::string& owner,
                                                      const SourceRef& source) {
    std::lock_guard lock(mutex_);

    auto& seq = sequences_[owner];

    // Counter never moves backwards, so indices survive eviction unreused
    for (const auto& [id, entry] : entries_) {
        if (entry.snapshot.owner == owner) {
            seq.last_index = std::max(seq.last_index, entry.snapshot.sequence_index);
        }
    }
    ++seq.last_index;

    auto uploaded_at = clock_();
    if (uploaded_at <= seq.last_uploaded_at) {
        uploaded_at = seq.last_uploaded_at + std::chrono::microseconds(1);
    }
    seq.last_uploaded_at = uploaded_at;

    Entry entry;
    entry.snapshot.id = next_id_++;
    entry.snapshot.owner = owner;
    entry.snapshot.sequence_index = seq.last_index;
    entry.snapshot.uploaded_at = uploaded_at;
    entry.snapshot.source = source;

    ProvisionalSnapshot provisional{entry.snapshot.id, owner, seq.last_index, uploaded_at};
    entries_.emplace(entry.snapshot.id, std::move(entry));
    return provisional;
}

AnalysisSnapshot MemorySnapshotStore::commit(int64_t id,
                                             RecordTable records,
                                             AnalysisSummary summary,
                                             std::vector<HealthAssessment> health) {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end() || it->second.committed) {
        throw StoreError(std::format("Snapshot {} is not pending", id));
    }
    auto& snapshot = it->second.snapshot;
    snapshot.records = std::move(records);
    snapshot.summary = std::move(summary);
    snapshot.health = std::move(health);
    it->second.committed = true;
    return snapshot;
}

bool MemorySnapshotStore::discard(int64_t id) {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end() || it->second.committed) return false;
    entries_.erase(it);
    return true;
}

std::optional<AnalysisSnapshot> MemorySnapshotStore::get(int64_t id) {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end() || !it->second.committed) return std::nullopt;
    return it->second.snapshot;
}

std::vector<const MemorySnapshotStore::Entry*> MemorySnapshotStore::committed_newest_first(
    const std::string& owner) const {
    std::vector<const Entry*> owned;
    for (const auto& [id, entry] : entries_) {
        if (entry.committed && entry.snapshot.owner == owner) {
            owned.push_back(&entry);
        }
    }
    std::sort(owned.begin(), owned.end(), [](const Entry* a, const Entry* b) {
        if (a->snapshot.uploaded_at != b->snapshot.uploaded_at) {
            return a->snapshot.uploaded_at > b->snapshot.uploaded_at;
        }
        return a->snapshot.sequence_index > b->snapshot.sequence_index;
    });
    return owned;
}

std::vector<AnalysisSnapshot> MemorySnapshotStore::list_recent(const std::string& owner,
                                                               size_t limit) {
    std::lock_guard lock(mutex_);
    const auto owned = committed_newest_first(owner);

    std::vector<AnalysisSnapshot> result;
    for (size_t i = 0; i < owned.size() && i < limit; ++i) {
        result.push_back(owned[i]->snapshot);
    }
    return result;
}

size_t MemorySnapshotStore::count(const std::string& owner) {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [&owner](const auto& kv) {
            return kv.second.committed && kv.second.snapshot.owner == owner;
        }));
}

std::vector<EvictedSnapshot> MemorySnapshotStore::enforce_retention(const std::string& owner,
                                                                    size_t keep) {
    std::lock_guard lock(mutex_);
    const auto owned = committed_newest_first(owner);

    std::vector<EvictedSnapshot> evicted;
    for (size_t i = keep; i < owned.size(); ++i) {
        const auto& s = owned[i]->snapshot;
        evicted.push_back({s.id, s.sequence_index, s.source});
    }
    for (const auto& e : evicted) {
        entries_.erase(e.id);
    }

    if (!evicted.empty()) {
        utils::log::info(std::format("Retention: evicted {} snapshot(s) of '{}' (keep={})",
                                     evicted.size(), owner, keep));
    }
    return evicted;
}

size_t MemorySnapshotStore::pending_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const auto& kv) { return !kv.second.committed; }));
}

} // namespace equipstat
