#include "executor/execution_guard.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <thread>

namespace sqlrag {

namespace {

ExecutionResult failure(ErrorKind kind, std::string message) {
    ExecutionResult r;
    r.success = false;
    r.error_kind = kind;
    r.error_message = std::move(message);
    return r;
}

// Closes the cursor on every exit path of an attempt
class CursorGuard {
public:
    explicit CursorGuard(IDbConnection& conn) : conn_(conn) {}
    ~CursorGuard() { conn_.close_cursor(); }

    CursorGuard(const CursorGuard&) = delete;
    CursorGuard& operator=(const CursorGuard&) = delete;

private:
    IDbConnection& conn_;
};

ErrorKind terminal_kind(DbErrorClass cls) {
    switch (cls) {
        case DbErrorClass::QUERY_TIMEOUT:  return ErrorKind::TIMEOUT;
        case DbErrorClass::POOL_EXHAUSTED: return ErrorKind::TRANSIENT_EXHAUSTED;
        default:                           return ErrorKind::EXECUTION_FAILED;
    }
}

uint32_t to_timeout_ms(std::chrono::milliseconds ms) {
    // 0 disables the server-side timeout, so never send it for an almost-expired deadline
    return static_cast<uint32_t>(std::clamp<int64_t>(ms.count(), 1, UINT32_MAX));
}

} // anonymous namespace

ExecutionGuard::ExecutionGuard(std::shared_ptr<IConnectionPool> pool,
                               std::shared_ptr<CircuitBreaker> breaker,
                               Config config)
    : pool_(std::move(pool)),
      breaker_(std::move(breaker)),
      config_(config) {}

std::string ExecutionGuard::bounded_count_sql(const std::string& sql, uint64_t ceiling) {
    std::string inner = utils::trim(sql);
    while (!inner.empty() && inner.back() == ';') {
        inner.pop_back();
        inner = utils::trim(inner);
    }
    return std::format(
        "SELECT count(*) FROM (SELECT 1 FROM ({}) AS sqlrag_q LIMIT {}) AS sqlrag_bounded",
        inner, ceiling + 1);
}

std::chrono::milliseconds ExecutionGuard::backoff_for(uint32_t attempt) const {
    const double factor = std::pow(config_.backoff_multiplier, attempt > 0 ? attempt - 1 : 0);
    const auto ms = static_cast<int64_t>(static_cast<double>(config_.initial_backoff.count()) * factor);
    return std::min(std::chrono::milliseconds{ms}, config_.max_backoff);
}

ExecutionResult ExecutionGuard::execute(const std::string& sql, const Deadline& deadline) {
    executions_.fetch_add(1, std::memory_order_relaxed);
    utils::Timer timer;

    for (uint32_t attempt = 1;; ++attempt) {
        if (deadline.expired()) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            auto r = failure(ErrorKind::TIMEOUT, "Request deadline reached before the query completed");
            r.attempts = attempt - 1;
            return r;
        }

        if (!breaker_->allow_request()) {
            circuit_rejections_.fetch_add(1, std::memory_order_relaxed);
            auto r = failure(ErrorKind::CIRCUIT_OPEN, std::format(
                "Datastore temporarily unavailable; retry in {}s",
                std::max<int64_t>(1, std::chrono::duration_cast<std::chrono::seconds>(
                    breaker_->retry_after()).count())));
            r.attempts = attempt - 1;
            return r;
        }

        auto outcome = attempt_once(sql, deadline);
        outcome.result.attempts = attempt;

        if (outcome.result.success) {
            breaker_->record_success();
            outcome.result.execution_time = timer.elapsed_us();
            return std::move(outcome.result);
        }

        if (!is_transient(outcome.error_class)) {
            // Slow statements and a saturated pool say nothing about datastore health
            breaker_->record_failure(FailureCategory::APPLICATION);
            failures_.fetch_add(1, std::memory_order_relaxed);
            outcome.result.error_kind = terminal_kind(outcome.error_class);
            outcome.result.execution_time = timer.elapsed_us();
            return std::move(outcome.result);
        }

        breaker_->record_failure(FailureCategory::INFRASTRUCTURE);

        const auto backoff = backoff_for(attempt);
        const bool out_of_retries = attempt > config_.max_retries;
        const bool past_deadline = !deadline.unbounded() && backoff >= deadline.remaining();

        if (out_of_retries || past_deadline) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("ExecutionGuard: giving up after {} attempt(s): {} ({})",
                attempt, outcome.result.error_message, db_error_class_to_string(outcome.error_class)));
            outcome.result.error_kind = ErrorKind::TRANSIENT_EXHAUSTED;
            outcome.result.execution_time = timer.elapsed_us();
            return std::move(outcome.result);
        }

        utils::log::debug(std::format("ExecutionGuard: transient {} on attempt {}, retrying in {}ms",
            db_error_class_to_string(outcome.error_class), attempt, backoff.count()));
        retries_.fetch_add(1, std::memory_order_relaxed);
        std::this_thread::sleep_for(backoff);
    }
}

ExecutionGuard::AttemptOutcome ExecutionGuard::attempt_once(const std::string& sql,
                                                            const Deadline& deadline) {
    AttemptOutcome outcome;

    auto conn = pool_->acquire(deadline.clamp(config_.acquire_timeout));
    if (!conn) {
        outcome.result = failure(ErrorKind::TRANSIENT_EXHAUSTED, "All datastore connections are busy");
        outcome.error_class = DbErrorClass::POOL_EXHAUSTED;
        return outcome;
    }

    auto& db = *conn->get();
    if (!db.set_query_timeout(to_timeout_ms(deadline.clamp(config_.query_timeout))) ||
        !db.set_lock_timeout(to_timeout_ms(config_.lock_timeout))) {
        if (!db.is_connected()) {
            conn->mark_broken();
            outcome.result = failure(ErrorKind::EXECUTION_FAILED, "Connection lost while configuring timeouts");
            outcome.error_class = DbErrorClass::CONNECTION_LOST;
            return outcome;
        }
        utils::log::warn("ExecutionGuard: could not apply session timeouts");
    }

    const auto fail_with = [&](const DbResultSet& rs) {
        outcome.result = failure(ErrorKind::EXECUTION_FAILED, rs.error_message);
        outcome.error_class = rs.error_class;
        if (rs.error_class == DbErrorClass::CONNECTION_LOST) {
            conn->mark_broken();
        }
    };

    const auto opened = db.open_cursor(sql);
    if (!opened.success) {
        fail_with(opened);
        return outcome;
    }

    CursorGuard cursor(db);

    auto first = db.fetch(config_.initial_batch_rows);
    if (!first.success) {
        fail_with(first);
        return outcome;
    }

    outcome.result.success = true;
    fetch_tiers(db, sql, std::move(first), outcome.result);
    return outcome;
}

void ExecutionGuard::fetch_tiers(IDbConnection& conn, const std::string& sql,
                                 DbResultSet first, ExecutionResult& result) {
    result.column_names = std::move(first.column_names);
    result.rows = std::move(first.rows);
    result.row_count = result.rows.size();

    if (result.rows.size() < config_.initial_batch_rows) {
        result.complete = true;
        return;
    }

    const auto counted = conn.execute(bounded_count_sql(sql, config_.large_result_ceiling));
    if (!counted.success || counted.rows.empty() || counted.rows[0].empty()) {
        // The transaction is aborted after a failed count; keep what was fetched
        utils::log::warn(std::format("ExecutionGuard: bounded count failed: {}", counted.error_message));
        result.complete = false;
        result.warnings.push_back(std::format(
            "Showing the first {} rows; the total row count could not be determined",
            result.row_count));
        return;
    }

    const uint64_t total = utils::parse_int<uint64_t>(counted.rows[0][0]);
    result.estimated_total_rows = total;

    if (total > config_.large_result_ceiling) {
        result.complete = false;
        result.warnings.push_back(std::format(
            "Result has more than {} rows; showing the first {}. "
            "Add filters or export the full result instead.",
            config_.large_result_ceiling, result.row_count));
        return;
    }

    if (result.rows.size() < config_.hard_cap_rows) {
        auto more = conn.fetch(config_.hard_cap_rows - result.rows.size());
        if (!more.success) {
            utils::log::warn(std::format("ExecutionGuard: follow-up fetch failed: {}", more.error_message));
        } else {
            for (auto& row : more.rows) {
                result.rows.push_back(std::move(row));
            }
        }
        result.row_count = result.rows.size();
    }

    result.complete = result.row_count >= total;
    if (!result.complete) {
        result.warnings.push_back(std::format(
            "Result truncated to {} of {} rows", result.row_count, total));
    }
}

ExecutionGuard::Stats ExecutionGuard::get_stats() const {
    return {
        .executions = executions_.load(std::memory_order_relaxed),
        .retries = retries_.load(std::memory_order_relaxed),
        .circuit_rejections = circuit_rejections_.load(std::memory_order_relaxed),
        .failures = failures_.load(std::memory_order_relaxed),
    };
}

} // namespace sqlrag
