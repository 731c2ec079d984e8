#pragma once

#include "db/idb_connection.hpp"

#include <functional>
#include <memory>

namespace sqlrag {

/**
 * @brief RAII checkout of a pooled connection
 *
 * Returns the connection to its pool on destruction, on every exit path.
 * A connection marked broken is closed first; the pool then discards it
 * instead of handing it to the next caller.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Flag the session as unusable (lost connection, aborted protocol state)
     */
    void mark_broken() { broken_ = true; }

    [[nodiscard]] bool is_broken() const { return broken_; }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool broken_ = false;
};

} // namespace sqlrag
