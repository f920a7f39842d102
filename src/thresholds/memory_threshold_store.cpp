#include "thresholds/memory_threshold_store.hpp"

#include <chrono>

namespace equipstat {

std::optional<ThresholdSettings> MemoryThresholdStore::get(const std::string& user) {
    std::lock_guard lock(mutex_);
    const auto it = rows_.find(user);
    if (it == rows_.end()) return std::nullopt;
    return it->second;
}

ThresholdSettings MemoryThresholdStore::merge(const std::string& user,
                                              const ThresholdUpdate& update,
                                              const ThresholdPair& initial) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = rows_.try_emplace(user);
    auto& row = it->second;
    if (inserted) {
        row.user = user;
        row.warning_percentile = initial.warning_percentile;
        row.outlier_iqr_multiplier = initial.outlier_iqr_multiplier;
    }
    if (update.warning_percentile) {
        row.warning_percentile = *update.warning_percentile;
    }
    if (update.outlier_iqr_multiplier) {
        row.outlier_iqr_multiplier = *update.outlier_iqr_multiplier;
    }
    row.updated_at = std::chrono::system_clock::now();
    return row;
}

bool MemoryThresholdStore::remove(const std::string& user) {
    std::lock_guard lock(mutex_);
    return rows_.erase(user) > 0;
}

size_t MemoryThresholdStore::size() const {
    std::lock_guard lock(mutex_);
    return rows_.size();
}

} // namespace equipstat
