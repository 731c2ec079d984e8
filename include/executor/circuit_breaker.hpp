#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace sqlrag {

/**
 * @brief Circuit Breaker guarding the datastore
 *
 * Three states:
 * - CLOSED:     Normal operation, all requests pass through
 * - OPEN:       Failing, reject requests immediately (no pool checkout)
 * - HALF_OPEN:  Cool-down elapsed, probe calls test recovery
 *
 * State transitions:
 * - CLOSED → OPEN:      failure_threshold consecutive infrastructure failures
 * - OPEN → HALF_OPEN:   cooldown elapsed; the caller that wins the CAS is the probe
 * - HALF_OPEN → CLOSED: success_threshold consecutive probe successes
 * - HALF_OPEN → OPEN:   any probe failure
 *
 * At most half_open_max_calls probes are in flight at once (default 1).
 * All transitions are compare-and-swap so concurrent callers cannot
 * double-open or race past the probe limit.
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
    std::string breaker_name;
};

class CircuitBreaker {
public:
    struct Config {
        uint32_t failure_threshold = 5;         // Consecutive failures to trip OPEN
        uint32_t success_threshold = 2;         // Probe successes to close from HALF_OPEN
        std::chrono::milliseconds cooldown{30000};
        uint32_t half_open_max_calls = 1;       // Concurrent probes in HALF_OPEN
    };

    explicit CircuitBreaker(std::string name);
    CircuitBreaker(std::string name, const Config& config);

    /**
     * @brief Check if request can proceed
     * @return true if allowed (caller must then record success or failure)
     */
    [[nodiscard]] bool allow_request();

    void record_success();

    /**
     * @brief Record failure; only INFRASTRUCTURE failures count toward the threshold
     */
    void record_failure(FailureCategory category = FailureCategory::INFRASTRUCTURE);

    [[nodiscard]] CircuitState get_state() const;

    [[nodiscard]] CircuitBreakerStats get_stats() const;

    /**
     * @brief Time left before an OPEN breaker admits a probe (zero otherwise)
     */
    [[nodiscard]] std::chrono::milliseconds retry_after() const;

    /**
     * @brief Force reset to CLOSED state
     */
    void reset();

    [[nodiscard]] const std::string& name() const { return name_; }

    [[nodiscard]] const Config& config() const { return config_; }

    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

private:
    bool acquire_probe_slot();
    void trip(CircuitState from);
    bool attempt_reset();
    void close_circuit();
    void emit_transition(CircuitState from, CircuitState to);

    std::string name_;
    Config config_;

    std::atomic<CircuitState> state_{CircuitState::CLOSED};
    std::atomic<uint64_t> failure_count_{0};         // consecutive, CLOSED only
    std::atomic<uint64_t> success_count_{0};         // consecutive probe successes
    std::atomic<uint64_t> half_open_calls_{0};       // probes in flight

    std::atomic<uint64_t> infrastructure_failure_count_{0};
    std::atomic<uint64_t> application_failure_count_{0};
    std::atomic<uint64_t> rejected_count_{0};
    std::atomic<uint64_t> transitions_to_open_{0};

    std::atomic<std::chrono::system_clock::time_point::rep> last_failure_time_{0};
    std::atomic<std::chrono::system_clock::time_point::rep> opened_time_{0};

    std::function<void(const StateChangeEvent&)> on_state_change_;
    mutable std::mutex callback_mutex_;
};

} // namespace sqlrag
