#pragma once

#include "core/error.hpp"
#include "snapshot/memory_snapshot_store.hpp"
#include "thresholds/ithreshold_store.hpp"

#include <atomic>
#include <new>

namespace equipstat::testing {

/**
 * @brief Threshold store whose every operation throws StoreError
 */
class FailingThresholdStore : public IThresholdStore {
public:
    std::optional<ThresholdSettings> get(const std::string&) override {
        ++calls;
        throw StoreError("threshold backend unavailable");
    }

    ThresholdSettings merge(const std::string&, const ThresholdUpdate&,
                            const ThresholdPair&) override {
        ++calls;
        throw StoreError("threshold backend unavailable");
    }

    bool remove(const std::string&) override {
        ++calls;
        throw StoreError("threshold backend unavailable");
    }

    std::atomic<int> calls{0};
};

/**
 * @brief Threshold store whose lookup runs out of memory
 */
class ExhaustedThresholdStore : public IThresholdStore {
public:
    std::optional<ThresholdSettings> get(const std::string&) override {
        throw std::bad_alloc();
    }

    ThresholdSettings merge(const std::string&, const ThresholdUpdate&,
                            const ThresholdPair&) override {
        throw std::bad_alloc();
    }

    bool remove(const std::string&) override { return false; }
};

/**
 * @brief MemorySnapshotStore with switchable commit / discard / retention failures
 */
class FlakySnapshotStore : public MemorySnapshotStore {
public:
    AnalysisSnapshot commit(int64_t id,
                            RecordTable records,
                            AnalysisSummary summary,
                            std::vector<HealthAssessment> health) override {
        if (fail_commit) throw StoreError("commit refused");
        return MemorySnapshotStore::commit(id, std::move(records), std::move(summary),
                                           std::move(health));
    }

    bool discard(int64_t id) override {
        if (fail_discard) throw StoreError("discard refused");
        return MemorySnapshotStore::discard(id);
    }

    std::vector<EvictedSnapshot> enforce_retention(const std::string& owner,
                                                   size_t keep) override {
        if (fail_retention) throw StoreError("retention refused");
        return MemorySnapshotStore::enforce_retention(owner, keep);
    }

    bool fail_commit = false;
    bool fail_discard = false;
    bool fail_retention = false;
};

} // namespace equipstat::testing
