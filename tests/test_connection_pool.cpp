#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "mocks/fake_db_connection.hpp"

#include <thread>

using namespace dpgw;
using dpgw::testing::FakeConnectionFactory;

TEST_CASE("Pool: min_connections are opened up front", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();

    PoolConfig config;
    config.connection_string = "host='db' port=5432";
    config.min_connections = 2;
    config.max_connections = 4;

    GenericConnectionPool pool("test-db", config, factory);

    CHECK(factory->total_created() == 2);
    CHECK(factory->last_connection_string() == "host='db' port=5432");
    const auto stats = pool.get_stats();
    CHECK(stats.total_connections == 2);
    CHECK(stats.idle_connections == 2);
    CHECK(stats.active_connections == 0);
}

TEST_CASE("Pool: short max_lifetime causes connection recycling", "[pool][lifetime]") {
    auto factory = std::make_shared<FakeConnectionFactory>();

    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::seconds(1);

    GenericConnectionPool pool("test-db", config, factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(1200));

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    const auto stats = pool.get_stats();
    CHECK(stats.connections_recycled >= 1);
    CHECK(factory->total_created() == 2);
    CHECK(factory->script()->close_count.load() == 1);
}

TEST_CASE("Pool: max_lifetime=0 disables recycling", "[pool][lifetime]") {
    auto factory = std::make_shared<FakeConnectionFactory>();

    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::seconds(0);

    GenericConnectionPool pool("test-db", config, factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    CHECK(pool.get_stats().connections_recycled == 0);
    CHECK(factory->total_created() == 1);
}

TEST_CASE("Pool: idle connection failing its health check is replaced", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();

    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 1;
    config.idle_timeout = std::chrono::milliseconds(0);

    GenericConnectionPool pool("test-db", config, factory);
    factory->script()->healthy = false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    auto conn = pool.acquire();
    REQUIRE(conn != nullptr);

    const auto stats = pool.get_stats();
    CHECK(stats.health_check_failures == 1);
    CHECK(factory->total_created() == 2);
    CHECK(stats.total_connections == 1);
}

TEST_CASE("Pool: acquire times out when every connection is checked out", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();

    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 1;

    GenericConnectionPool pool("test-db", config, factory);

    auto held = pool.acquire();
    REQUIRE(held != nullptr);

    auto second = pool.acquire(std::chrono::milliseconds(50));
    CHECK(second == nullptr);
    CHECK(pool.get_stats().failed_acquires == 1);

    held.reset();
    auto third = pool.acquire(std::chrono::milliseconds(50));
    CHECK(third != nullptr);
}

TEST_CASE("Pool: waiting acquire succeeds once a connection is returned", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();

    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 1;

    GenericConnectionPool pool("test-db", config, factory);

    auto held = pool.acquire();
    REQUIRE(held != nullptr);

    std::thread releaser([&held] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        held.reset();
    });

    auto waited = pool.acquire(std::chrono::milliseconds(5000));
    releaser.join();

    REQUIRE(waited != nullptr);
    CHECK(factory->total_created() == 1);
}

TEST_CASE("Pool: factory failure yields nullptr and frees the slot", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->set_should_succeed(false);

    PoolConfig config;
    config.min_connections = 0;
    config.max_connections = 1;

    GenericConnectionPool pool("test-db", config, factory);

    CHECK(pool.acquire(std::chrono::milliseconds(50)) == nullptr);
    CHECK(pool.get_stats().failed_acquires == 1);

    factory->set_should_succeed(true);
    CHECK(pool.acquire(std::chrono::milliseconds(50)) != nullptr);
}

TEST_CASE("Pool: discarded connection is closed instead of reused", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();

    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;

    GenericConnectionPool pool("test-db", config, factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        conn->discard();
    }

    CHECK(factory->script()->close_count.load() == 1);
    CHECK(pool.get_stats().total_connections == 0);

    auto next = pool.acquire();
    REQUIRE(next != nullptr);
    CHECK(factory->total_created() == 2);
}

TEST_CASE("Pool: cancel_active reaches only checked-out connections", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();

    PoolConfig config;
    config.min_connections = 2;
    config.max_connections = 2;

    GenericConnectionPool pool("test-db", config, factory);

    CHECK(pool.cancel_active() == 0);

    auto held = pool.acquire();
    REQUIRE(held != nullptr);
    CHECK(pool.get_stats().active_connections == 1);

    CHECK(pool.cancel_active() == 1);
    CHECK(factory->script()->cancel_count.load() == 1);
}

TEST_CASE("Pool: drain closes idle connections and refuses new acquires", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();

    PoolConfig config;
    config.min_connections = 2;
    config.max_connections = 3;

    GenericConnectionPool pool("test-db", config, factory);

    auto held = pool.acquire();
    REQUIRE(held != nullptr);

    pool.drain();
    CHECK(factory->script()->close_count.load() == 1);
    CHECK(pool.acquire(std::chrono::milliseconds(10)) == nullptr);

    // Returned after drain: closed, not pooled
    held.reset();
    CHECK(factory->script()->close_count.load() == 2);
    CHECK(pool.get_stats().total_connections == 0);
}
