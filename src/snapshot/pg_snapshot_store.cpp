#include "snapshot/pg_snapshot_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/transaction.hpp"
#include "snapshot/snapshot_codec.hpp"

#include <format>

namespace equipstat {

namespace {

constexpr const char* kSchemaSql = R"(
CREATE TABLE IF NOT EXISTS owner_sequences (
    owner       TEXT PRIMARY KEY,
    last_index  BIGINT NOT NULL
);
CREATE TABLE IF NOT EXISTS snapshots (
    id              BIGSERIAL PRIMARY KEY,
    owner           TEXT NOT NULL,
    sequence_index  BIGINT NOT NULL,
    uploaded_at     TIMESTAMPTZ NOT NULL,
    committed       BOOLEAN NOT NULL DEFAULT FALSE,
    records         JSONB,
    summary         JSONB,
    health          JSONB,
    source_path     TEXT,
    source_sha256   TEXT,
    UNIQUE (owner, sequence_index)
);
CREATE INDEX IF NOT EXISTS snapshots_owner_uploaded_idx
    ON snapshots (owner, uploaded_at DESC);
)";

// Microsecond UTC text, readable by utils::parse_timestamp
constexpr const char* kUploadedAtText =
    R"(to_char(uploaded_at AT TIME ZONE 'UTC', 'YYYY-MM-DD"T"HH24:MI:SS.US"Z"'))";

std::string select_columns() {
    return std::format(
        "id, owner, sequence_index, {}, records::text, summary::text, health::text, "
        "source_path, source_sha256", kUploadedAtText);
}

int64_t parse_id(const std::string& text, const char* what) {
    const auto v = utils::try_parse_int<int64_t>(text);
    if (!v) {
        throw StoreError(std::format("Malformed {} '{}'", what, text));
    }
    return *v;
}

std::chrono::system_clock::time_point parse_time(const std::string& text) {
    const auto tp = utils::parse_timestamp(text);
    if (!tp) {
        throw StoreError(std::format("Malformed timestamp '{}'", text));
    }
    return *tp;
}

DbParam optional_text(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

} // anonymous namespace

PgSnapshotStore::PgSnapshotStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

std::unique_ptr<PooledConnection> PgSnapshotStore::connection() {
    auto conn = pool_->acquire();
    if (!conn) {
        throw StoreError(std::format("No database connection available from pool '{}'",
                                     pool_->name()));
    }
    return conn;
}

void PgSnapshotStore::ensure_schema() {
    auto conn = connection();
    check_result((*conn)->execute(kSchemaSql), "Snapshot schema setup failed");
}

ProvisionalSnapshot PgSnapshotStore::begin_create(const std::string& owner,
                                                  const SourceRef& source) {
    auto conn = connection();
    Transaction tx(*conn->get());

    const auto seq = check_result((*conn)->execute_params(
        "INSERT INTO owner_sequences (owner, last_index) VALUES ($1, 1) "
        "ON CONFLICT (owner) DO UPDATE SET last_index = owner_sequences.last_index + 1 "
        "RETURNING last_index",
        {owner}), "Sequence assignment failed");
    if (seq.rows.empty()) {
        throw StoreError("Sequence assignment returned no row");
    }
    const auto index_text = seq.rows[0][0];

    const auto inserted = check_result((*conn)->execute_params(std::format(
        "INSERT INTO snapshots (owner, sequence_index, uploaded_at, source_path, source_sha256) "
        "SELECT $1::text, $2::bigint, "
        "GREATEST(clock_timestamp(), COALESCE(MAX(uploaded_at) + interval '1 microsecond', "
        "clock_timestamp())), $3::text, $4::text "
        "FROM snapshots WHERE owner = $1::text "
        "RETURNING id, sequence_index, {}", kUploadedAtText),
        {owner, index_text, optional_text(source.path), optional_text(source.sha256)}),
        "Provisional snapshot insert failed");
    if (inserted.rows.empty()) {
        throw StoreError("Provisional snapshot insert returned no row");
    }

    tx.commit();

    const auto& row = inserted.rows[0];
    return ProvisionalSnapshot{parse_id(row[0], "snapshot id"), owner,
                               parse_id(row[1], "sequence index"), parse_time(row[2])};
}

AnalysisSnapshot PgSnapshotStore::commit(int64_t id,
                                         RecordTable records,
                                         AnalysisSummary summary,
                                         std::vector<HealthAssessment> health) {
    auto conn = connection();
    const auto rs = check_result((*conn)->execute_params(std::format(
        "UPDATE snapshots SET records = $2::jsonb, summary = $3::jsonb, health = $4::jsonb, "
        "committed = TRUE WHERE id = $1::bigint AND committed = FALSE "
        "RETURNING owner, sequence_index, {}, source_path, source_sha256", kUploadedAtText),
        {std::to_string(id),
         SnapshotCodec::encode_records(records),
         SnapshotCodec::encode_summary(summary),
         SnapshotCodec::encode_health(health)}),
        "Snapshot commit failed");
    if (rs.rows.empty()) {
        throw StoreError(std::format("Snapshot {} is not pending", id));
    }

    const auto& row = rs.rows[0];
    AnalysisSnapshot snapshot;
    snapshot.id = id;
    snapshot.owner = row[0];
    snapshot.sequence_index = parse_id(row[1], "sequence index");
    snapshot.uploaded_at = parse_time(row[2]);
    snapshot.records = std::move(records);
    snapshot.summary = std::move(summary);
    snapshot.health = std::move(health);
    snapshot.source = SourceRef{row[3], row[4]};
    return snapshot;
}

bool PgSnapshotStore::discard(int64_t id) {
    auto conn = connection();
    const auto rs = check_result((*conn)->execute_params(
        "DELETE FROM snapshots WHERE id = $1::bigint AND committed = FALSE",
        {std::to_string(id)}), "Snapshot discard failed");
    return rs.affected_rows > 0;
}

AnalysisSnapshot PgSnapshotStore::decode_row(const DbResultSet& rs, size_t row) {
    const auto& r = rs.rows[row];
    if (r.size() < 9) {
        throw StoreError("Snapshot row has too few columns");
    }

    AnalysisSnapshot snapshot;
    snapshot.id = parse_id(r[0], "snapshot id");
    snapshot.owner = r[1];
    snapshot.sequence_index = parse_id(r[2], "sequence index");
    snapshot.uploaded_at = parse_time(r[3]);
    try {
        snapshot.records = SnapshotCodec::decode_records(r[4]);
        snapshot.summary = SnapshotCodec::decode_summary(r[5]);
        snapshot.health = SnapshotCodec::decode_health(r[6]);
    } catch (const std::exception& e) {
        throw StoreError(std::format("Snapshot {} has malformed content: {}", snapshot.id, e.what()));
    }
    snapshot.source = SourceRef{r[7], r[8]};
    return snapshot;
}

std::optional<AnalysisSnapshot> PgSnapshotStore::get(int64_t id) {
    auto conn = connection();
    const auto rs = check_result((*conn)->execute_params(std::format(
        "SELECT {} FROM snapshots WHERE id = $1::bigint AND committed", select_columns()),
        {std::to_string(id)}), "Snapshot lookup failed");
    if (rs.rows.empty()) return std::nullopt;
    return decode_row(rs, 0);
}

std::vector<AnalysisSnapshot> PgSnapshotStore::list_recent(const std::string& owner, size_t limit) {
    auto conn = connection();
    const auto rs = check_result((*conn)->execute_params(std::format(
        "SELECT {} FROM snapshots WHERE owner = $1::text AND committed "
        "ORDER BY uploaded_at DESC, sequence_index DESC LIMIT $2::bigint", select_columns()),
        {owner, std::to_string(limit)}), "Snapshot listing failed");

    std::vector<AnalysisSnapshot> result;
    result.reserve(rs.rows.size());
    for (size_t i = 0; i < rs.rows.size(); ++i) {
        result.push_back(decode_row(rs, i));
    }
    return result;
}

size_t PgSnapshotStore::count(const std::string& owner) {
    auto conn = connection();
    const auto rs = check_result((*conn)->execute_params(
        "SELECT COUNT(*) FROM snapshots WHERE owner = $1::text AND committed",
        {owner}), "Snapshot count failed");
    if (rs.rows.empty()) return 0;
    return static_cast<size_t>(parse_id(rs.rows[0][0], "count"));
}

std::vector<EvictedSnapshot> PgSnapshotStore::enforce_retention(const std::string& owner,
                                                                size_t keep) {
    auto conn = connection();
    // One statement: the batch is deleted atomically
    const auto rs = check_result((*conn)->execute_params(
        "DELETE FROM snapshots WHERE id IN ("
        "  SELECT id FROM snapshots WHERE owner = $1::text AND committed "
        "  ORDER BY uploaded_at DESC, sequence_index DESC OFFSET $2::bigint) "
        "RETURNING id, sequence_index, source_path, source_sha256",
        {owner, std::to_string(keep)}), "Retention enforcement failed");

    std::vector<EvictedSnapshot> evicted;
    evicted.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        evicted.push_back(EvictedSnapshot{parse_id(row[0], "snapshot id"),
                                          parse_id(row[1], "sequence index"),
                                          SourceRef{row[2], row[3]}});
    }
    if (!evicted.empty()) {
        utils::log::info(std::format("Retention evicted {} snapshot(s) of '{}'",
                                     evicted.size(), owner));
    }
    return evicted;
}

} // namespace equipstat
