#pragma once

#include "thresholds/ithreshold_store.hpp"

#include <mutex>
#include <unordered_map>

namespace equipstat {

/**
 * @brief In-process threshold store (tests, single-process mode)
 */
class MemoryThresholdStore : public IThresholdStore {
public:
    std::optional<ThresholdSettings> get(const std::string& user) override;

    ThresholdSettings merge(const std::string& user,
                            const ThresholdUpdate& update,
                            const ThresholdPair& initial) override;

    bool remove(const std::string& user) override;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ThresholdSettings> rows_;
};

} // namespace equipstat
