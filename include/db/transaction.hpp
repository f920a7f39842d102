#pragma once

#include "db/idb_connection.hpp"
#include <string>

namespace equipstat {

/**
 * @brief RAII transaction scope on one connection
 *
 * BEGIN on construction, ROLLBACK on destruction unless commit() succeeded.
 * Throws StoreError when BEGIN or COMMIT fails.
 */
class Transaction {
public:
    explicit Transaction(IDbConnection& conn);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    IDbConnection& conn_;
    bool done_ = false;
};

/// Throw StoreError("<context>: <error>") when @p rs failed, else return it
const DbResultSet& check_result(const DbResultSet& rs, const std::string& context);

} // namespace equipstat
