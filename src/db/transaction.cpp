#include "db/transaction.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>

namespace equipstat {

const DbResultSet& check_result(const DbResultSet& rs, const std::string& context) {
    if (!rs.success) {
        throw StoreError(std::format("{}: {}", context, utils::trim(rs.error_message)));
    }
    return rs;
}

Transaction::Transaction(IDbConnection& conn) : conn_(conn) {
    check_result(conn_.execute("BEGIN"), "BEGIN failed");
}

Transaction::~Transaction() {
    if (done_) return;
    const auto rs = conn_.execute("ROLLBACK");
    if (!rs.success) {
        utils::log::warn(std::format("ROLLBACK failed: {}", utils::trim(rs.error_message)));
    }
}

void Transaction::commit() {
    check_result(conn_.execute("COMMIT"), "COMMIT failed");
    done_ = true;
}

} // namespace equipstat
