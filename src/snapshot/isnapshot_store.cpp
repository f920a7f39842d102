#include "snapshot/isnapshot_store.hpp"
#include "core/utils.hpp"

#include <format>

namespace equipstat {

AnalysisSnapshot ISnapshotStore::create(const std::string& owner,
                                        RecordTable records,
                                        AnalysisSummary summary,
                                        std::vector<HealthAssessment> health,
                                        const SourceRef& source) {
    const auto provisional = begin_create(owner, source);
    try {
        return commit(provisional.id, std::move(records), std::move(summary), std::move(health));
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Rolling back snapshot {} for '{}': {}",
                                     provisional.id, owner, e.what()));
        try {
            discard(provisional.id);
        } catch (const std::exception& discard_error) {
            utils::log::error(std::format("Failed to discard provisional snapshot {}: {}",
                                          provisional.id, discard_error.what()));
        }
        throw;
    }
}

std::optional<AnalysisSnapshot> ISnapshotStore::get_for_owner(int64_t id,
                                                              const std::string& owner) {
    auto snapshot = get(id);
    if (!snapshot || snapshot->owner != owner) return std::nullopt;
    return snapshot;
}

} // namespace equipstat
