#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <libpq-fe.h>

#include <chrono>
#include <string>

namespace sqlrag {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn*. Errors are classified from SQLSTATE so the execution
 * guard can tell transient failures from permanent ones.
 *
 * Cursors run inside BEGIN READ ONLY so even a statement that slipped
 * through validation cannot write.
 */
class PgConnection : public IDbConnection {
public:
    explicit PgConnection(PGconn* conn);
    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet open_cursor(const std::string& sql) override;
    DbResultSet fetch(size_t max_rows) override;
    void close_cursor() override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    bool set_lock_timeout(uint32_t timeout_ms) override;
    void close() override;

    /**
     * @brief Map a SQLSTATE code onto the error taxonomy
     */
    [[nodiscard]] static DbErrorClass classify_sqlstate(const std::string& sqlstate);

private:
    DbResultSet run(const std::string& sql);
    DbResultSet error_result(PGresult* res) const;
    bool run_command(const std::string& sql);

    PGconn* conn_;
    bool cursor_open_ = false;
};

class PgConnectionFactory : public IConnectionFactory {
public:
    PgConnectionFactory(std::string connection_string,
                        std::chrono::seconds connect_timeout = std::chrono::seconds{5});

    std::unique_ptr<IDbConnection> create() override;

private:
    std::string connection_string_;
    std::chrono::seconds connect_timeout_;
};

} // namespace sqlrag
