#pragma once

#include "db/idb_connection.hpp"

#include <memory>

namespace sqlrag {

/**
 * @brief Creates datastore connections for a pool
 *
 * The factory owns the connection settings, so the pool stays
 * backend-agnostic.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @return New connected session, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create() = 0;
};

} // namespace sqlrag
