#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlrag {

GenericConnectionPool::GenericConnectionPool(
    std::string name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format(
                "Pool '{}': failed to pre-warm connection {} of {}",
                name_, i + 1, config_.min_connections));
            break;
        }
        std::lock_guard lock(mutex_);
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::info(std::format("Pool '{}' ready: {} connections (min={}, max={})",
        name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Shutdown may have raced the semaphore wait
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    std::unique_ptr<IDbConnection> conn;
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
        }
    }

    if (conn && needs_replacement(conn.get())) {
        discard(std::move(conn));
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    auto return_fn = [this](std::unique_ptr<IDbConnection> c) {
        this->return_connection(std::move(c));
    };
    return std::make_unique<PooledConnection>(std::move(conn), std::move(return_fn));
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.discarded_connections = discarded_connections_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);
    for (auto& conn : idle_connections_) {
        if (conn) {
            tracking_.erase(conn.get());
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }
    idle_connections_.clear();

    utils::log::info(std::format("Pool '{}' drained", name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create();
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard lock(mutex_);
        tracking_[conn.get()] = Tracking{now, now};
    }
    return conn;
}

void GenericConnectionPool::discard(std::unique_ptr<IDbConnection> conn) {
    {
        std::lock_guard lock(mutex_);
        tracking_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
    discarded_connections_.fetch_add(1, std::memory_order_relaxed);
}

bool GenericConnectionPool::needs_replacement(IDbConnection* conn) {
    Tracking t;
    {
        std::lock_guard lock(mutex_);
        const auto it = tracking_.find(conn);
        if (it == tracking_.end()) return false;
        t = it->second;
    }

    const auto now = std::chrono::steady_clock::now();
    if (config_.max_lifetime.count() > 0 && now - t.created_at > config_.max_lifetime) {
        return true;
    }
    // Recently used connections skip the health round trip
    if (now - t.last_used > config_.idle_timeout) {
        return !conn->is_healthy(config_.health_check_query);
    }
    return !conn->is_connected();
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
        discard(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        const auto it = tracking_.find(conn.get());
        if (it != tracking_.end()) {
            it->second.last_used = std::chrono::steady_clock::now();
        }
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace sqlrag
