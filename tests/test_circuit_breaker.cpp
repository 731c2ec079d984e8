#include <catch2/catch_test_macros.hpp>
#include "executor/circuit_breaker.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace sqlrag;

namespace {

CircuitBreaker::Config fast_config() {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 3;
    cfg.success_threshold = 2;
    cfg.cooldown = std::chrono::milliseconds{50};
    cfg.half_open_max_calls = 1;
    return cfg;
}

} // anonymous namespace

TEST_CASE("CircuitBreaker: opens after consecutive infrastructure failures", "[circuit_breaker]") {
    CircuitBreaker breaker("test", fast_config());

    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    breaker.record_failure();
    breaker.record_failure();
    CHECK(breaker.get_state() == CircuitState::CLOSED);
    breaker.record_failure();
    CHECK(breaker.get_state() == CircuitState::OPEN);

    CHECK_FALSE(breaker.allow_request());
    CHECK(breaker.get_stats().rejected_count == 1);
    CHECK(breaker.get_stats().transitions_to_open == 1);
    CHECK(breaker.retry_after() > std::chrono::milliseconds{0});
}

TEST_CASE("CircuitBreaker: success clears the failure streak", "[circuit_breaker]") {
    CircuitBreaker breaker("test", fast_config());

    breaker.record_failure();
    breaker.record_failure();
    breaker.record_success();
    breaker.record_failure();
    breaker.record_failure();
    CHECK(breaker.get_state() == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker: application failures never trip", "[circuit_breaker]") {
    CircuitBreaker breaker("test", fast_config());

    for (int i = 0; i < 10; ++i) {
        breaker.record_failure(FailureCategory::APPLICATION);
    }
    CHECK(breaker.get_state() == CircuitState::CLOSED);

    const auto stats = breaker.get_stats();
    CHECK(stats.application_failure_count == 10);
    CHECK(stats.infrastructure_failure_count == 0);
}

TEST_CASE("CircuitBreaker: half-open probes close the circuit", "[circuit_breaker]") {
    CircuitBreaker breaker("test", fast_config());
    for (int i = 0; i < 3; ++i) breaker.record_failure();
    REQUIRE(breaker.get_state() == CircuitState::OPEN);

    std::this_thread::sleep_for(std::chrono::milliseconds{70});

    SECTION("two successful probes close") {
        REQUIRE(breaker.allow_request());
        CHECK(breaker.get_state() == CircuitState::HALF_OPEN);
        breaker.record_success();
        CHECK(breaker.get_state() == CircuitState::HALF_OPEN);

        REQUIRE(breaker.allow_request());
        breaker.record_success();
        CHECK(breaker.get_state() == CircuitState::CLOSED);
        CHECK(breaker.retry_after() == std::chrono::milliseconds{0});
    }

    SECTION("probe failure reopens") {
        REQUIRE(breaker.allow_request());
        breaker.record_failure();
        CHECK(breaker.get_state() == CircuitState::OPEN);
        CHECK(breaker.get_stats().transitions_to_open == 2);
        CHECK_FALSE(breaker.allow_request());
    }

    SECTION("only one probe in flight") {
        REQUIRE(breaker.allow_request());
        CHECK_FALSE(breaker.allow_request());
    }
}

TEST_CASE("CircuitBreaker: concurrent callers admit a single probe", "[circuit_breaker]") {
    CircuitBreaker breaker("test", fast_config());
    for (int i = 0; i < 3; ++i) breaker.record_failure();
    std::this_thread::sleep_for(std::chrono::milliseconds{70});

    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            if (breaker.allow_request()) admitted.fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();

    CHECK(admitted.load() == 1);
    CHECK(breaker.get_state() == CircuitState::HALF_OPEN);
}

TEST_CASE("CircuitBreaker: state change callback sees every transition", "[circuit_breaker]") {
    CircuitBreaker breaker("primary", fast_config());

    std::vector<std::pair<CircuitState, CircuitState>> seen;
    breaker.set_on_state_change([&seen](const StateChangeEvent& e) {
        CHECK(e.breaker_name == "primary");
        seen.emplace_back(e.from, e.to);
    });

    for (int i = 0; i < 3; ++i) breaker.record_failure();
    std::this_thread::sleep_for(std::chrono::milliseconds{70});
    REQUIRE(breaker.allow_request());
    breaker.record_success();
    REQUIRE(breaker.allow_request());
    breaker.record_success();

    REQUIRE(seen.size() == 3);
    CHECK(seen[0] == std::pair{CircuitState::CLOSED, CircuitState::OPEN});
    CHECK(seen[1] == std::pair{CircuitState::OPEN, CircuitState::HALF_OPEN});
    CHECK(seen[2] == std::pair{CircuitState::HALF_OPEN, CircuitState::CLOSED});
}

TEST_CASE("CircuitBreaker: reset forces closed", "[circuit_breaker]") {
    CircuitBreaker breaker("test", fast_config());
    for (int i = 0; i < 3; ++i) breaker.record_failure();
    REQUIRE(breaker.get_state() == CircuitState::OPEN);

    breaker.reset();
    CHECK(breaker.get_state() == CircuitState::CLOSED);
    CHECK(breaker.allow_request());
}
