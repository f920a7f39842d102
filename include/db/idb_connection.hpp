#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace equipstat {

/**
 * @brief Result set from a query execution
 *
 * Owns the result data (copied from native result handles). SQL NULL is
 * reported as an empty string plus a set bit in the parallel null mask.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT / RETURNING
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::vector<bool>> nulls;

    // For DML
    uint64_t affected_rows = 0;

    bool has_rows = false;

    [[nodiscard]] bool is_null(size_t row, size_t col) const {
        return row < nulls.size() && col < nulls[row].size() && nulls[row][col];
    }
};

/// Positional statement parameter; nullopt binds SQL NULL
using DbParam = std::optional<std::string>;

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Implementations are not
 * thread-safe; thread safety comes from the pool.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a statement with $1..$n placeholders bound as text
     */
    [[nodiscard]] virtual DbResultSet execute_params(const std::string& sql,
                                                     const std::vector<DbParam>& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set statement timeout for subsequent queries (0 = no timeout)
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    virtual void close() = 0;
};

} // namespace equipstat
