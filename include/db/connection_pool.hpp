#pragma once

#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace equipstat {

/**
 * @brief Pool configuration
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 8;
    std::chrono::milliseconds connection_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};  // 0 = disabled
    uint32_t statement_timeout_ms = 0;         // 0 = server default
};

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
};

/**
 * @brief Bounded connection pool over any IConnectionFactory
 *
 * - max_connections enforced via counting_semaphore
 * - connections created lazily up to max, min_connections pre-warmed
 * - connections idle longer than idle_timeout are health-checked on acquire
 * - connections older than max_lifetime are replaced on acquire
 * - PooledConnection returns the connection on destruction
 */
class ConnectionPool {
public:
    ConnectionPool(std::string name,
                   const PoolConfig& config,
                   std::shared_ptr<IConnectionFactory> factory);

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Acquire connection (blocking up to @p timeout)
     * @return RAII handle, or nullptr on timeout/connect failure/shutdown
     */
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout);

    /// acquire() with config.connection_timeout
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire();

    [[nodiscard]] PoolStats get_stats() const;

    /// Close all idle connections and refuse further acquires
    void drain();

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    struct Timestamps {
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_used;
    };

    std::unique_ptr<IDbConnection> create_connection();

    /// Close and forget a connection. Caller must not hold mutex_.
    void retire(std::unique_ptr<IDbConnection> conn);

    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, Timestamps> timestamps_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace equipstat
