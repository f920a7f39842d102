#include <catch2/catch_test_macros.hpp>
#include "db/connection_pool.hpp"
#include "mocks/mock_db_connection.hpp"

#include <thread>

using namespace equipstat;
using equipstat::testing::MockConnectionFactory;
using equipstat::testing::MockDbConnection;

TEST_CASE("Pool: min_connections are pre-warmed and reused", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;

    ConnectionPool pool("test-db", config, factory);
    CHECK(factory->total_created() == 1);

    for (int i = 0; i < 3; ++i) {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }
    CHECK(factory->total_created() == 1);

    const auto stats = pool.get_stats();
    CHECK(stats.total_connections == 1);
    CHECK(stats.idle_connections == 1);
    CHECK(stats.total_acquires == 3);
}

TEST_CASE("Pool: acquire times out when exhausted", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.min_connections = 0;
    config.max_connections = 1;

    ConnectionPool pool("test-db", config, factory);
    auto held = pool.acquire();
    REQUIRE(held != nullptr);

    auto second = pool.acquire(std::chrono::milliseconds(20));
    CHECK(second == nullptr);
    CHECK(pool.get_stats().failed_acquires == 1);

    held.reset();
    CHECK(pool.acquire(std::chrono::milliseconds(20)) != nullptr);
}

TEST_CASE("Pool: factory failure releases the slot", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    factory->fail = true;
    PoolConfig config;
    config.min_connections = 0;
    config.max_connections = 1;

    ConnectionPool pool("test-db", config, factory);
    CHECK(pool.acquire(std::chrono::milliseconds(20)) == nullptr);

    factory->fail = false;
    CHECK(pool.acquire(std::chrono::milliseconds(20)) != nullptr);
}

TEST_CASE("Pool: statement timeout is applied to new connections", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.min_connections = 0;
    config.statement_timeout_ms = 1500;

    ConnectionPool pool("test-db", config, factory);
    auto conn = pool.acquire();
    REQUIRE(conn != nullptr);
    const auto* mock = dynamic_cast<MockDbConnection*>(conn->get());
    REQUIRE(mock != nullptr);
    CHECK(mock->timeout_ms() == 1500);
}

TEST_CASE("Pool: expired connection is recycled", "[pool][lifetime]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::seconds(1);

    ConnectionPool pool("test-db", config, factory);
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }
    CHECK(pool.get_stats().connections_recycled == 1);
    CHECK(factory->total_created() == 2);
}

TEST_CASE("Pool: unhealthy idle connection is replaced", "[pool][health]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.min_connections = 0;
    config.max_connections = 1;
    config.idle_timeout = std::chrono::milliseconds(0);

    ConnectionPool pool("test-db", config, factory);
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        dynamic_cast<MockDbConnection*>(conn->get())->healthy = false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    auto conn = pool.acquire();
    REQUIRE(conn != nullptr);
    CHECK(dynamic_cast<MockDbConnection*>(conn->get())->id() == 1);
    CHECK(pool.get_stats().health_check_failures == 1);
}

TEST_CASE("Pool: drained pool refuses acquires", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.min_connections = 2;

    ConnectionPool pool("test-db", config, factory);
    pool.drain();
    CHECK(pool.get_stats().total_connections == 0);
    CHECK(pool.acquire(std::chrono::milliseconds(10)) == nullptr);
}
