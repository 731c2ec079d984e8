#include "llm/rate_limiter.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace sqlrag {

namespace {

// Waiters re-check cancellation at least this often
constexpr std::chrono::milliseconds kPollInterval{50};

} // anonymous namespace

RateLimiter::RateLimiter(const Config& config)
    : config_(config),
      refill_per_ms_(config.window.count() > 0
                         ? static_cast<double>(config.max_calls) / static_cast<double>(config.window.count())
                         : static_cast<double>(config.max_calls)),
      tokens_(static_cast<double>(config.max_calls)),
      last_refill_(std::chrono::steady_clock::now()) {}

void RateLimiter::refill_locked(std::chrono::steady_clock::time_point now) {
    const auto elapsed = std::chrono::duration<double, std::milli>(now - last_refill_).count();
    if (elapsed > 0.0) {
        tokens_ = std::min(static_cast<double>(config_.max_calls), tokens_ + elapsed * refill_per_ms_);
        last_refill_ = now;
    }
}

bool RateLimiter::try_acquire() {
    std::lock_guard lock(mutex_);
    refill_locked(std::chrono::steady_clock::now());
    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return true;
    }
    return false;
}

std::chrono::milliseconds RateLimiter::time_until_available() {
    std::lock_guard lock(mutex_);
    refill_locked(std::chrono::steady_clock::now());
    if (tokens_ >= 1.0 || refill_per_ms_ <= 0.0) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::milliseconds{static_cast<int64_t>(std::ceil((1.0 - tokens_) / refill_per_ms_))};
}

bool RateLimiter::acquire(std::chrono::milliseconds timeout, const Deadline& deadline) {
    const auto give_up_at = std::chrono::steady_clock::now() + deadline.clamp(timeout);

    while (true) {
        if (try_acquire()) {
            return true;
        }
        if (deadline.cancelled()) {
            break;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= give_up_at) {
            break;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(give_up_at - now);
        const auto wait = std::max(time_until_available(), std::chrono::milliseconds{1});
        std::this_thread::sleep_for(std::min({wait, left, kPollInterval}));
    }

    rejected_.fetch_add(1, std::memory_order_relaxed);
    return false;
}

double RateLimiter::available_tokens() {
    std::lock_guard lock(mutex_);
    refill_locked(std::chrono::steady_clock::now());
    return tokens_;
}

void RateLimiter::reset() {
    std::lock_guard lock(mutex_);
    tokens_ = static_cast<double>(config_.max_calls);
    last_refill_ = std::chrono::steady_clock::now();
}

} // namespace sqlrag
