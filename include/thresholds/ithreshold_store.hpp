#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>

namespace equipstat {

/**
 * @brief Storage for per-user threshold overrides
 *
 * One row per user. Implementations throw StoreError on backend failure.
 */
class IThresholdStore {
public:
    virtual ~IThresholdStore() = default;

    [[nodiscard]] virtual std::optional<ThresholdSettings> get(const std::string& user) = 0;

    /**
     * @brief Atomic field-wise upsert
     *
     * Fields present in @p update overwrite the stored values; omitted fields
     * keep their stored value, or take @p initial when no row exists yet.
     * Concurrent merges touching distinct fields never lose each other's write.
     *
     * @return The row as stored after the merge
     */
    virtual ThresholdSettings merge(const std::string& user,
                                    const ThresholdUpdate& update,
                                    const ThresholdPair& initial) = 0;

    /**
     * @brief Delete the user's row
     * @return true if a row existed
     */
    virtual bool remove(const std::string& user) = 0;
};

} // namespace equipstat
