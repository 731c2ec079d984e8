#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "mocks/mock_db_connection.hpp"

#include <chrono>
#include <thread>

using namespace sqlrag;
using namespace sqlrag::testing;

namespace {

PoolConfig small_pool(size_t min, size_t max) {
    PoolConfig cfg;
    cfg.min_connections = min;
    cfg.max_connections = max;
    return cfg;
}

} // anonymous namespace

TEST_CASE("ConnectionPool: pre-warms min connections", "[pool]") {
    auto state = std::make_shared<MockDbState>();
    GenericConnectionPool pool("test", small_pool(2, 4), std::make_shared<MockConnectionFactory>(state));

    const auto stats = pool.get_stats();
    CHECK(stats.total_connections == 2);
    CHECK(stats.idle_connections == 2);
    CHECK(state->connections_created.load() == 2);
}

TEST_CASE("ConnectionPool: checkout returns on scope exit", "[pool]") {
    auto state = std::make_shared<MockDbState>();
    GenericConnectionPool pool("test", small_pool(1, 2), std::make_shared<MockConnectionFactory>(state));

    {
        auto conn = pool.acquire(std::chrono::milliseconds{100});
        REQUIRE(conn);
        CHECK(conn->is_valid());
        CHECK(pool.get_stats().active_connections == 1);
    }

    const auto stats = pool.get_stats();
    CHECK(stats.active_connections == 0);
    CHECK(stats.total_acquires == 1);
    CHECK(stats.total_releases == 1);
}

TEST_CASE("ConnectionPool: bounded by max_connections", "[pool]") {
    auto state = std::make_shared<MockDbState>();
    GenericConnectionPool pool("test", small_pool(0, 2), std::make_shared<MockConnectionFactory>(state));

    auto a = pool.acquire(std::chrono::milliseconds{50});
    auto b = pool.acquire(std::chrono::milliseconds{50});
    REQUIRE(a);
    REQUIRE(b);

    auto c = pool.acquire(std::chrono::milliseconds{30});
    CHECK_FALSE(c);
    CHECK(pool.get_stats().failed_acquires == 1);

    SECTION("a release unblocks a waiter") {
        std::thread releaser([&a] {
            std::this_thread::sleep_for(std::chrono::milliseconds{20});
            a.reset();
        });
        auto d = pool.acquire(std::chrono::milliseconds{1000});
        releaser.join();
        CHECK(d);
    }
}

TEST_CASE("ConnectionPool: broken connections are discarded", "[pool]") {
    auto state = std::make_shared<MockDbState>();
    GenericConnectionPool pool("test", small_pool(1, 2), std::make_shared<MockConnectionFactory>(state));

    {
        auto conn = pool.acquire(std::chrono::milliseconds{100});
        REQUIRE(conn);
        conn->mark_broken();
    }
    CHECK(pool.get_stats().discarded_connections == 1);
    CHECK(pool.get_stats().total_connections == 0);

    auto fresh = pool.acquire(std::chrono::milliseconds{100});
    REQUIRE(fresh);
    CHECK(state->connections_created.load() == 2);
}

TEST_CASE("ConnectionPool: refused connections fail the acquire", "[pool]") {
    auto state = std::make_shared<MockDbState>();
    state->refuse_connections = true;
    GenericConnectionPool pool("test", small_pool(1, 2), std::make_shared<MockConnectionFactory>(state));

    CHECK(pool.get_stats().total_connections == 0);
    CHECK_FALSE(pool.acquire(std::chrono::milliseconds{50}));
    CHECK(pool.get_stats().failed_acquires == 1);

    // The slot was released, so a recovered datastore is usable again
    state->refuse_connections = false;
    CHECK(pool.acquire(std::chrono::milliseconds{50}));
}

TEST_CASE("ConnectionPool: drain refuses further checkouts", "[pool]") {
    auto state = std::make_shared<MockDbState>();
    GenericConnectionPool pool("test", small_pool(2, 4), std::make_shared<MockConnectionFactory>(state));

    pool.drain();
    CHECK(pool.get_stats().total_connections == 0);
    CHECK_FALSE(pool.acquire(std::chrono::milliseconds{10}));
}
