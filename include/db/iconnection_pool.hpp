#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlrag {

class PooledConnection;

struct PoolConfig {
    size_t min_connections = 1;
    size_t max_connections = 8;
    std::chrono::milliseconds idle_timeout{300000};   // health-check after this much idle time
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};          // 0 = disabled
};

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t discarded_connections = 0;
};

/**
 * @brief Bounded connection pool
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Check out a connection, waiting up to timeout for a free slot
     * @return RAII handle, or nullptr when the pool is exhausted or the
     *         datastore refuses new connections
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Close idle connections and refuse further checkouts
     */
    virtual void drain() = 0;

    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace sqlrag
