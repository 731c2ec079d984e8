#include "executor/circuit_breaker.hpp"

namespace sqlrag {

namespace {

std::chrono::system_clock::time_point from_rep(std::chrono::system_clock::time_point::rep rep) {
    return std::chrono::system_clock::time_point(
        std::chrono::system_clock::time_point::duration(rep));
}

} // anonymous namespace

CircuitBreaker::CircuitBreaker(std::string name)
    : CircuitBreaker(std::move(name), Config{}) {}

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)),
      config_(config) {
    if (config_.half_open_max_calls == 0) {
        config_.half_open_max_calls = 1;
    }
}

bool CircuitBreaker::allow_request() {
    const CircuitState current_state = state_.load(std::memory_order_acquire);

    switch (current_state) {
        case CircuitState::CLOSED:
            return true;

        case CircuitState::OPEN: {
            const auto opened = from_rep(opened_time_.load(std::memory_order_acquire));
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now() - opened);

            if (elapsed < config_.cooldown) {
                rejected_count_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }

            // Winner of OPEN → HALF_OPEN owns the first probe slot
            if (attempt_reset()) {
                return true;
            }
            // Lost the race: someone else moved the state, compete for a slot
            if (state_.load(std::memory_order_acquire) == CircuitState::HALF_OPEN &&
                acquire_probe_slot()) {
                return true;
            }
            rejected_count_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        case CircuitState::HALF_OPEN:
            if (acquire_probe_slot()) {
                return true;
            }
            rejected_count_.fetch_add(1, std::memory_order_relaxed);
            return false;
    }

    return false;
}

bool CircuitBreaker::acquire_probe_slot() {
    uint64_t current = half_open_calls_.load(std::memory_order_acquire);
    while (current < config_.half_open_max_calls) {
        if (half_open_calls_.compare_exchange_weak(current, current + 1,
                                                   std::memory_order_acq_rel,
                                                   std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

void CircuitBreaker::record_success() {
    const CircuitState current_state = state_.load(std::memory_order_acquire);

    if (current_state == CircuitState::HALF_OPEN) {
        const uint64_t successes = success_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (successes >= config_.success_threshold) {
            close_circuit();
        } else {
            half_open_calls_.fetch_sub(1, std::memory_order_acq_rel);
        }
    } else if (current_state == CircuitState::CLOSED) {
        // Consecutive-failure semantics: any success clears the streak
        failure_count_.store(0, std::memory_order_release);
    }
}

void CircuitBreaker::record_failure(FailureCategory category) {
    const CircuitState current_state = state_.load(std::memory_order_acquire);

    if (category == FailureCategory::APPLICATION) {
        application_failure_count_.fetch_add(1, std::memory_order_relaxed);
        // The datastore answered: a probe that ends this way frees its slot
        if (current_state == CircuitState::HALF_OPEN) {
            half_open_calls_.fetch_sub(1, std::memory_order_acq_rel);
        }
        return;
    }

    infrastructure_failure_count_.fetch_add(1, std::memory_order_relaxed);
    last_failure_time_.store(
        std::chrono::system_clock::now().time_since_epoch().count(),
        std::memory_order_release);

    if (current_state == CircuitState::HALF_OPEN) {
        trip(CircuitState::HALF_OPEN);
    } else if (current_state == CircuitState::CLOSED) {
        const uint64_t failures = failure_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (failures >= config_.failure_threshold) {
            trip(CircuitState::CLOSED);
        }
    }
}

CircuitState CircuitBreaker::get_state() const {
    return state_.load(std::memory_order_acquire);
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    CircuitBreakerStats stats;

    stats.state = state_.load(std::memory_order_acquire);
    stats.failure_count = failure_count_.load(std::memory_order_relaxed);
    stats.success_count = success_count_.load(std::memory_order_relaxed);
    stats.infrastructure_failure_count = infrastructure_failure_count_.load(std::memory_order_relaxed);
    stats.application_failure_count = application_failure_count_.load(std::memory_order_relaxed);
    stats.rejected_count = rejected_count_.load(std::memory_order_relaxed);
    stats.transitions_to_open = transitions_to_open_.load(std::memory_order_relaxed);

    const auto last_failure_rep = last_failure_time_.load(std::memory_order_acquire);
    if (last_failure_rep > 0) {
        stats.last_failure = from_rep(last_failure_rep);
    }

    const auto opened_rep = opened_time_.load(std::memory_order_acquire);
    if (opened_rep > 0 && stats.state != CircuitState::CLOSED) {
        stats.opened_at = from_rep(opened_rep);
    }

    return stats;
}

std::chrono::milliseconds CircuitBreaker::retry_after() const {
    if (state_.load(std::memory_order_acquire) != CircuitState::OPEN) {
        return std::chrono::milliseconds{0};
    }
    const auto opened = from_rep(opened_time_.load(std::memory_order_acquire));
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - opened);
    return elapsed >= config_.cooldown ? std::chrono::milliseconds{0}
                                       : config_.cooldown - elapsed;
}

void CircuitBreaker::reset() {
    const CircuitState previous = state_.exchange(CircuitState::CLOSED, std::memory_order_acq_rel);
    failure_count_.store(0, std::memory_order_relaxed);
    success_count_.store(0, std::memory_order_relaxed);
    half_open_calls_.store(0, std::memory_order_relaxed);
    opened_time_.store(0, std::memory_order_relaxed);
    if (previous != CircuitState::CLOSED) {
        emit_transition(previous, CircuitState::CLOSED);
    }
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::lock_guard lock(callback_mutex_);
    on_state_change_ = std::move(cb);
}

void CircuitBreaker::trip(CircuitState from) {
    // Publish the open time and fill the probe slots before the state flips,
    // so a reader that observes OPEN never pairs it with a stale timestamp.
    opened_time_.store(std::chrono::system_clock::now().time_since_epoch().count(),
                       std::memory_order_release);
    half_open_calls_.store(config_.half_open_max_calls, std::memory_order_release);

    CircuitState expected = from;
    if (state_.compare_exchange_strong(expected, CircuitState::OPEN,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        failure_count_.store(0, std::memory_order_relaxed);
        success_count_.store(0, std::memory_order_relaxed);
        transitions_to_open_.fetch_add(1, std::memory_order_relaxed);
        emit_transition(from, CircuitState::OPEN);
    }
}

bool CircuitBreaker::attempt_reset() {
    CircuitState expected = CircuitState::OPEN;
    if (state_.compare_exchange_strong(expected, CircuitState::HALF_OPEN,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        // Slots stay full (set by trip) until the winner claims exactly one
        success_count_.store(0, std::memory_order_relaxed);
        half_open_calls_.store(1, std::memory_order_release);
        emit_transition(CircuitState::OPEN, CircuitState::HALF_OPEN);
        return true;
    }
    return false;
}

void CircuitBreaker::close_circuit() {
    CircuitState expected = CircuitState::HALF_OPEN;
    if (state_.compare_exchange_strong(expected, CircuitState::CLOSED,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        failure_count_.store(0, std::memory_order_relaxed);
        success_count_.store(0, std::memory_order_relaxed);
        half_open_calls_.store(0, std::memory_order_relaxed);
        emit_transition(CircuitState::HALF_OPEN, CircuitState::CLOSED);
    }
}

void CircuitBreaker::emit_transition(CircuitState from, CircuitState to) {
    std::function<void(const StateChangeEvent&)> cb;
    {
        std::lock_guard lock(callback_mutex_);
        cb = on_state_change_;
    }
    if (cb) {
        cb(StateChangeEvent{from, to, std::chrono::system_clock::now(), name_});
    }
}

} // namespace sqlrag
