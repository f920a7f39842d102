#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace equipstat::testing {

/**
 * @brief Statement log and scripted responses shared by mock connections
 */
struct DbScript {
    struct Call {
        std::string sql;
        std::vector<DbParam> params;
    };

    using Handler = std::function<DbResultSet(const std::string&, const std::vector<DbParam>&)>;

    /// Default: every statement succeeds with no rows
    Handler handler = [](const std::string&, const std::vector<DbParam>&) {
        DbResultSet rs;
        rs.success = true;
        return rs;
    };

    std::mutex mutex;
    std::vector<Call> calls;

    DbResultSet run(const std::string& sql, const std::vector<DbParam>& params) {
        std::lock_guard lock(mutex);
        calls.push_back({sql, params});
        return handler(sql, params);
    }

    /// Index of the first call whose SQL starts with @p prefix, or -1
    int find(const std::string& prefix) {
        std::lock_guard lock(mutex);
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i].sql.starts_with(prefix)) return static_cast<int>(i);
        }
        return -1;
    }
};

inline DbResultSet rows_result(std::vector<std::vector<std::string>> rows) {
    DbResultSet rs;
    rs.success = true;
    rs.has_rows = true;
    rs.affected_rows = rows.size();
    rs.rows = std::move(rows);
    return rs;
}

inline DbResultSet error_result(std::string message) {
    DbResultSet rs;
    rs.success = false;
    rs.error_message = std::move(message);
    return rs;
}

class MockDbConnection : public IDbConnection {
public:
    MockDbConnection(int id, std::shared_ptr<DbScript> script)
        : id_(id), script_(std::move(script)) {}

    DbResultSet execute(const std::string& sql) override {
        return script_->run(sql, {});
    }

    DbResultSet execute_params(const std::string& sql,
                               const std::vector<DbParam>& params) override {
        return script_->run(sql, params);
    }

    bool is_healthy(const std::string&) override { return connected_ && healthy; }
    bool is_connected() const override { return connected_; }
    bool set_query_timeout(uint32_t timeout_ms) override {
        timeout_ms_ = timeout_ms;
        return true;
    }
    void close() override { connected_ = false; }

    int id() const { return id_; }
    uint32_t timeout_ms() const { return timeout_ms_; }

    bool healthy = true;

private:
    int id_;
    std::shared_ptr<DbScript> script_;
    bool connected_ = true;
    uint32_t timeout_ms_ = 0;
};

/**
 * @brief Factory handing out MockDbConnections; can be told to fail
 */
class MockConnectionFactory : public IConnectionFactory {
public:
    explicit MockConnectionFactory(std::shared_ptr<DbScript> script = std::make_shared<DbScript>())
        : script_(std::move(script)) {}

    std::unique_ptr<IDbConnection> create(const std::string&) override {
        if (fail) return nullptr;
        const int id = next_id_.fetch_add(1);
        return std::make_unique<MockDbConnection>(id, script_);
    }

    int total_created() const { return next_id_.load(); }

    std::atomic<bool> fail{false};

private:
    std::shared_ptr<DbScript> script_;
    std::atomic<int> next_id_{0};
};

} // namespace equipstat::testing
