#pragma once

#include "db/connection_pool.hpp"
#include "thresholds/ithreshold_store.hpp"

#include <memory>

namespace equipstat {

/**
 * @brief PostgreSQL-backed threshold overrides (table user_thresholds)
 *
 * merge() is a single INSERT .. ON CONFLICT DO UPDATE with COALESCE per
 * field, so concurrent partial updates of different fields both land.
 */
class PgThresholdStore : public IThresholdStore {
public:
    explicit PgThresholdStore(std::shared_ptr<ConnectionPool> pool);

    void ensure_schema();

    std::optional<ThresholdSettings> get(const std::string& user) override;

    ThresholdSettings merge(const std::string& user,
                            const ThresholdUpdate& update,
                            const ThresholdPair& initial) override;

    bool remove(const std::string& user) override;

private:
    [[nodiscard]] std::unique_ptr<PooledConnection> connection();

    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace equipstat
