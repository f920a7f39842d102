#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace equipstat {

/**
 * @brief Abstract factory for creating database connections
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace equipstat
