#pragma once

#include "core/deadline.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace sqlrag {

/**
 * @brief Token bucket guarding calls to the generative backend
 *
 * max_calls tokens refill continuously over window; the bucket starts full.
 * acquire() blocks until a token is available, the timeout passes or the
 * deadline's token is cancelled.
 */
class RateLimiter {
public:
    struct Config {
        uint32_t max_calls = 60;
        std::chrono::milliseconds window{60000};
    };

    RateLimiter() : RateLimiter(Config{}) {}
    explicit RateLimiter(const Config& config);

    [[nodiscard]] bool try_acquire();

    /**
     * @return true if a token was taken
     */
    [[nodiscard]] bool acquire(std::chrono::milliseconds timeout, const Deadline& deadline = {});

    /**
     * @brief Time until the next token is available (0 when one is available now)
     */
    [[nodiscard]] std::chrono::milliseconds time_until_available();

    [[nodiscard]] double available_tokens();

    void reset();

    [[nodiscard]] uint64_t rejected() const { return rejected_.load(std::memory_order_relaxed); }

private:
    void refill_locked(std::chrono::steady_clock::time_point now);

    Config config_;
    double refill_per_ms_;

    std::mutex mutex_;
    double tokens_;
    std::chrono::steady_clock::time_point last_refill_;

    std::atomic<uint64_t> rejected_{0};
};

} // namespace sqlrag
