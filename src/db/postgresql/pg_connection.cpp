#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace equipstat {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return {false, "Connection is null"};
    }
    return consume(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute_params(const std::string& sql,
                                         const std::vector<DbParam>& params) {
    if (!conn_) {
        return {false, "Connection is null"};
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    // Text-format parameters; server infers types from the statement
    PGresult* res = PQexecParams(conn_, sql.c_str(),
                                 static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    return consume(res);
}

DbResultSet PgConnection::consume(PGresult* res) {
    if (!res) {
        return {false, PQerrorMessage(conn_)};
    }

    const ExecStatusType status = PQresultStatus(res);
    DbResultSet result;
    if (status == PGRES_TUPLES_OK) {
        result = process_tuples_result(res);
    } else if (status == PGRES_COMMAND_OK) {
        result = process_command_result(res);
    } else {
        result.success = false;
        const char* msg = PQresultErrorMessage(res);
        result.error_message = (msg && *msg) ? msg : PQerrorMessage(conn_);
    }
    PQclear(res);
    return result;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);
    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);

    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }

    const bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    return success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.push_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);
    result.nulls.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::string> row;
        std::vector<bool> null_mask(ncols, false);
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                null_mask[j] = true;
                row.emplace_back();
                continue;
            }
            const char* val = PQgetvalue(res, i, j);
            row.emplace_back(val ? val : "");
        }
        result.rows.push_back(std::move(row));
        result.nulls.push_back(std::move(null_mask));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = std::stoull(affected);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    // Timestamps are exchanged as UTC text
    PGresult* res = PQexec(conn, "SET TIME ZONE 'UTC'");
    if (res) PQclear(res);

    return std::make_unique<PgConnection>(conn);
}

} // namespace equipstat
