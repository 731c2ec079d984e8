#pragma once

#include "core/deadline.hpp"
#include "core/types.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"
#include "executor/circuit_breaker.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlrag {

/**
 * @brief Resilient read-only executor
 *
 * Every call passes the circuit breaker first; while it is open the pool
 * is never touched. Transient errors (connection loss, pool exhaustion,
 * deadlock, lock/serialization/statement timeout) are retried with capped
 * exponential backoff that never sleeps past the deadline. Other errors
 * fail immediately and do not count against the breaker.
 *
 * Results come from a server-side cursor in tiers:
 *   1. fetch initial_batch_rows; fewer means the result is complete
 *   2. run a bounded count (LIMIT large_result_ceiling + 1)
 *      - above the ceiling: keep the first batch and recommend narrowing
 *      - otherwise fetch up to hard_cap_rows, flagging truncation
 */
class ExecutionGuard {
public:
    struct Config {
        std::chrono::milliseconds acquire_timeout{2000};
        std::chrono::milliseconds query_timeout{30000};
        std::chrono::milliseconds lock_timeout{5000};
        uint32_t max_retries = 3;
        std::chrono::milliseconds initial_backoff{100};
        double backoff_multiplier = 2.0;
        std::chrono::milliseconds max_backoff{2000};
        size_t initial_batch_rows = 1000;
        size_t hard_cap_rows = 10000;
        uint64_t large_result_ceiling = 100000;
    };

    ExecutionGuard(std::shared_ptr<IConnectionPool> pool,
                   std::shared_ptr<CircuitBreaker> breaker,
                   Config config);

    [[nodiscard]] ExecutionResult execute(const std::string& sql, const Deadline& deadline);

    /**
     * @brief Count query that stops scanning after ceiling + 1 rows
     */
    [[nodiscard]] static std::string bounded_count_sql(const std::string& sql, uint64_t ceiling);

    [[nodiscard]] std::chrono::milliseconds backoff_for(uint32_t attempt) const;

    struct Stats {
        uint64_t executions;
        uint64_t retries;
        uint64_t circuit_rejections;
        uint64_t failures;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct AttemptOutcome {
        ExecutionResult result;
        DbErrorClass error_class = DbErrorClass::NONE;
    };

    AttemptOutcome attempt_once(const std::string& sql, const Deadline& deadline);

    void fetch_tiers(IDbConnection& conn, const std::string& sql,
                     DbResultSet first, ExecutionResult& result);

    std::shared_ptr<IConnectionPool> pool_;
    std::shared_ptr<CircuitBreaker> breaker_;
    Config config_;

    std::atomic<uint64_t> executions_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> circuit_rejections_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace sqlrag
