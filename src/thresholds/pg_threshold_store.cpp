#include "thresholds/pg_threshold_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/transaction.hpp"

#include <format>

namespace equipstat {

namespace {

constexpr const char* kSchemaSql = R"(
CREATE TABLE IF NOT EXISTS user_thresholds (
    username                TEXT PRIMARY KEY,
    warning_percentile      DOUBLE PRECISION NOT NULL,
    outlier_iqr_multiplier  DOUBLE PRECISION NOT NULL,
    updated_at              TIMESTAMPTZ NOT NULL DEFAULT now()
)
)";

constexpr const char* kReturning =
    R"(RETURNING username, warning_percentile, outlier_iqr_multiplier, )"
    R"(to_char(updated_at AT TIME ZONE 'UTC', 'YYYY-MM-DD"T"HH24:MI:SS.US"Z"'))";

DbParam number_param(const std::optional<double>& v) {
    if (!v) return std::nullopt;
    return std::format("{}", *v);
}

ThresholdSettings decode_row(const std::vector<std::string>& row) {
    const auto warning = utils::try_parse_double(row[1]);
    const auto iqr = utils::try_parse_double(row[2]);
    if (!warning || !iqr) {
        throw StoreError(std::format("Malformed threshold row for '{}'", row[0]));
    }
    ThresholdSettings s;
    s.user = row[0];
    s.warning_percentile = *warning;
    s.outlier_iqr_multiplier = *iqr;
    s.updated_at = utils::parse_timestamp(row[3]).value_or(std::chrono::system_clock::time_point{});
    return s;
}

} // anonymous namespace

PgThresholdStore::PgThresholdStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

std::unique_ptr<PooledConnection> PgThresholdStore::connection() {
    auto conn = pool_->acquire();
    if (!conn) {
        throw StoreError(std::format("No database connection available from pool '{}'",
                                     pool_->name()));
    }
    return conn;
}

void PgThresholdStore::ensure_schema() {
    auto conn = connection();
    check_result((*conn)->execute(kSchemaSql), "Threshold schema setup failed");
}

std::optional<ThresholdSettings> PgThresholdStore::get(const std::string& user) {
    auto conn = connection();
    const auto rs = check_result((*conn)->execute_params(
        "SELECT username, warning_percentile, outlier_iqr_multiplier, "
        R"(to_char(updated_at AT TIME ZONE 'UTC', 'YYYY-MM-DD"T"HH24:MI:SS.US"Z"') )"
        "FROM user_thresholds WHERE username = $1::text",
        {user}), "Threshold lookup failed");
    if (rs.rows.empty()) return std::nullopt;
    return decode_row(rs.rows[0]);
}

ThresholdSettings PgThresholdStore::merge(const std::string& user,
                                          const ThresholdUpdate& update,
                                          const ThresholdPair& initial) {
    auto conn = connection();
    const auto rs = check_result((*conn)->execute_params(std::format(
        "INSERT INTO user_thresholds AS t (username, warning_percentile, outlier_iqr_multiplier) "
        "VALUES ($1::text, COALESCE($2::float8, $4::float8), COALESCE($3::float8, $5::float8)) "
        "ON CONFLICT (username) DO UPDATE SET "
        "warning_percentile = COALESCE($2::float8, t.warning_percentile), "
        "outlier_iqr_multiplier = COALESCE($3::float8, t.outlier_iqr_multiplier), "
        "updated_at = now() {}", kReturning),
        {user,
         number_param(update.warning_percentile),
         number_param(update.outlier_iqr_multiplier),
         number_param(initial.warning_percentile),
         number_param(initial.outlier_iqr_multiplier)}),
        "Threshold merge failed");
    if (rs.rows.empty()) {
        throw StoreError("Threshold merge returned no row");
    }
    return decode_row(rs.rows[0]);
}

bool PgThresholdStore::remove(const std::string& user) {
    auto conn = connection();
    const auto rs = check_result((*conn)->execute_params(
        "DELETE FROM user_thresholds WHERE username = $1::text", {user}),
        "Threshold delete failed");
    return rs.affected_rows > 0;
}

} // namespace equipstat
