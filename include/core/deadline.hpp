#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>

namespace sqlrag {

/**
 * @brief Shared cancellation flag
 *
 * Copies share the same flag, so a token handed to a detached task can be
 * cancelled by the request that spawned it.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Request deadline passed through every external call boundary
 *
 * Adapters derive their own timeouts from remaining() and check
 * expired() before issuing work.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    Deadline() : at_(Clock::time_point::max()) {}

    explicit Deadline(Clock::time_point at, CancellationToken token = {})
        : at_(at), token_(std::move(token)) {}

    static Deadline after(std::chrono::milliseconds budget, CancellationToken token = {}) {
        return Deadline(Clock::now() + budget, std::move(token));
    }

    // No time limit; still cancellable through the token
    static Deadline none() { return Deadline(); }

    [[nodiscard]] bool expired() const {
        return token_.is_cancelled() || Clock::now() >= at_;
    }

    [[nodiscard]] bool cancelled() const { return token_.is_cancelled(); }

    [[nodiscard]] bool unbounded() const { return at_ == Clock::time_point::max(); }

    [[nodiscard]] std::chrono::milliseconds remaining() const {
        if (unbounded()) return std::chrono::milliseconds::max();
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - Clock::now());
        return std::max(left, std::chrono::milliseconds{0});
    }

    // Smaller of the configured timeout and the time left
    [[nodiscard]] std::chrono::milliseconds clamp(std::chrono::milliseconds timeout) const {
        return std::min(timeout, remaining());
    }

    [[nodiscard]] const CancellationToken& token() const { return token_; }

    void cancel() { token_.cancel(); }

private:
    Clock::time_point at_;
    CancellationToken token_;
};

} // namespace sqlrag
