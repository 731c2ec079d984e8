#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"

#include <cstring>
#include <format>

namespace sqlrag {

namespace {

constexpr const char* kCursorName = "sqlrag_cursor";

struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbErrorClass PgConnection::classify_sqlstate(const std::string& sqlstate) {
    if (sqlstate.empty()) {
        return DbErrorClass::CONNECTION_LOST;   // no server response at all
    }
    if (sqlstate == "40P01") return DbErrorClass::DEADLOCK;
    if (sqlstate == "55P03") return DbErrorClass::LOCK_TIMEOUT;
    if (sqlstate == "40001") return DbErrorClass::SERIALIZATION_FAILURE;
    if (sqlstate == "57014") return DbErrorClass::QUERY_TIMEOUT;
    if (sqlstate == "42501") return DbErrorClass::PERMISSION_DENIED;
    if (sqlstate == "42601") return DbErrorClass::SYNTAX_ERROR;
    if (sqlstate == "42P01" || sqlstate == "42703" || sqlstate == "42883") {
        return DbErrorClass::UNDEFINED_OBJECT;
    }
    // Class 08: connection exception; 57P01-57P03: admin shutdown / cannot connect now
    if (sqlstate.starts_with("08") || sqlstate == "57P01" ||
        sqlstate == "57P02" || sqlstate == "57P03") {
        return DbErrorClass::CONNECTION_LOST;
    }
    return DbErrorClass::OTHER;
}

DbResultSet PgConnection::error_result(PGresult* res) const {
    const char* state = res ? PQresultErrorField(res, PG_DIAG_SQLSTATE) : nullptr;
    std::string sqlstate = state ? state : "";
    std::string message = res ? PQresultErrorMessage(res) : "";
    if (message.empty() && conn_) {
        message = PQerrorMessage(conn_);
    }

    auto cls = classify_sqlstate(sqlstate);
    if (conn_ && PQstatus(conn_) != CONNECTION_OK) {
        cls = DbErrorClass::CONNECTION_LOST;
    }

    auto result = DbResultSet::failure(cls, utils::trim(message));
    result.sqlstate = std::move(sqlstate);
    return result;
}

DbResultSet PgConnection::run(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure(DbErrorClass::CONNECTION_LOST, "Connection is closed");
    }

    PGResultPtr res(PQexec(conn_, sql.c_str()));
    if (!res) {
        return DbResultSet::failure(DbErrorClass::CONNECTION_LOST, PQerrorMessage(conn_));
    }

    const ExecStatusType status = PQresultStatus(res.get());

    if (status == PGRES_TUPLES_OK) {
        DbResultSet result;
        result.success = true;
        result.has_rows = true;

        const int ncols = PQnfields(res.get());
        result.column_names.reserve(static_cast<size_t>(ncols));
        for (int i = 0; i < ncols; ++i) {
            result.column_names.emplace_back(PQfname(res.get(), i));
        }

        const int nrows = PQntuples(res.get());
        result.rows.reserve(static_cast<size_t>(nrows));
        for (int r = 0; r < nrows; ++r) {
            std::vector<std::string> row;
            row.reserve(static_cast<size_t>(ncols));
            for (int c = 0; c < ncols; ++c) {
                if (PQgetisnull(res.get(), r, c)) {
                    row.emplace_back("NULL");
                } else {
                    row.emplace_back(PQgetvalue(res.get(), r, c));
                }
            }
            result.rows.push_back(std::move(row));
        }
        return result;
    }

    if (status == PGRES_COMMAND_OK) {
        DbResultSet result;
        result.success = true;
        const char* affected = PQcmdTuples(res.get());
        if (affected && std::strlen(affected) > 0) {
            result.affected_rows = utils::parse_int<uint64_t>(affected);
        }
        return result;
    }

    return error_result(res.get());
}

bool PgConnection::run_command(const std::string& sql) {
    const auto result = run(sql);
    if (!result.success) {
        utils::log::warn(std::format("PgConnection: '{}' failed: {}", sql, result.error_message));
    }
    return result.success;
}

DbResultSet PgConnection::execute(const std::string& sql) {
    return run(sql);
}

DbResultSet PgConnection::open_cursor(const std::string& sql) {
    if (cursor_open_) {
        close_cursor();
    }

    auto begin = run("BEGIN READ ONLY");
    if (!begin.success) {
        return begin;
    }

    auto declared = run(std::format("DECLARE {} NO SCROLL CURSOR FOR {}", kCursorName, sql));
    if (!declared.success) {
        // Failed transaction must be rolled back before the session is reusable
        run_command("ROLLBACK");
        return declared;
    }

    cursor_open_ = true;
    return declared;
}

DbResultSet PgConnection::fetch(size_t max_rows) {
    if (!cursor_open_) {
        return DbResultSet::failure(DbErrorClass::OTHER, "No open cursor");
    }
    return run(std::format("FETCH FORWARD {} FROM {}", max_rows, kCursorName));
}

void PgConnection::close_cursor() {
    if (!cursor_open_) {
        return;
    }
    cursor_open_ = false;
    // ROLLBACK closes the cursor and ends the read-only transaction; it also
    // recovers the session after an error aborted the transaction.
    if (conn_ && PQstatus(conn_) == CONNECTION_OK) {
        run_command("ROLLBACK");
    }
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }
    return run(health_check_query).success;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    return run_command(std::format("SET statement_timeout = {}", timeout_ms));
}

bool PgConnection::set_lock_timeout(uint32_t timeout_ms) {
    return run_command(std::format("SET lock_timeout = {}", timeout_ms));
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
    cursor_open_ = false;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

PgConnectionFactory::PgConnectionFactory(std::string connection_string,
                                         std::chrono::seconds connect_timeout)
    : connection_string_(std::move(connection_string)),
      connect_timeout_(connect_timeout) {}

std::unique_ptr<IDbConnection> PgConnectionFactory::create() {
    std::string conninfo = connection_string_;
    if (conninfo.find("connect_timeout") == std::string::npos &&
        conninfo.find("://") == std::string::npos) {
        conninfo += std::format(" connect_timeout={}", connect_timeout_.count());
    }

    PGconn* conn = PQconnectdb(conninfo.c_str());
    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", utils::trim(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace sqlrag
