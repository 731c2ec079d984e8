#pragma once

#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace sqlrag {

/**
 * @brief Backend-agnostic bounded connection pool
 *
 * - Bounded: max_connections enforced via counting_semaphore
 * - Lazy: connections created on demand up to max, min pre-warmed
 * - Health: connections idle longer than idle_timeout are checked before reuse
 * - Lifetime: connections older than max_lifetime are recycled
 * - RAII: PooledConnection returns on destruction; closed connections are dropped
 */
class GenericConnectionPool : public IConnectionPool {
public:
    GenericConnectionPool(std::string name,
                          const PoolConfig& config,
                          std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return name_; }

private:
    struct Tracking {
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_used;
    };

    std::unique_ptr<IDbConnection> create_connection();
    void discard(std::unique_ptr<IDbConnection> conn);
    bool needs_replacement(IDbConnection* conn);
    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, Tracking> tracking_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> discarded_connections_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace sqlrag
