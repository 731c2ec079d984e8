#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sqlrag {

/**
 * @brief Classified datastore error
 *
 * Transient classes are worth retrying; the rest propagate immediately.
 */
enum class DbErrorClass {
    NONE,
    CONNECTION_LOST,
    POOL_EXHAUSTED,
    DEADLOCK,
    LOCK_TIMEOUT,
    SERIALIZATION_FAILURE,
    QUERY_TIMEOUT,
    SYNTAX_ERROR,
    UNDEFINED_OBJECT,
    PERMISSION_DENIED,
    OTHER
};

// Worth another attempt. A statement timeout would only time out again, and
// pool exhaustion was already waited out during acquisition.
[[nodiscard]] inline bool is_transient(DbErrorClass cls) {
    switch (cls) {
        case DbErrorClass::CONNECTION_LOST:
        case DbErrorClass::DEADLOCK:
        case DbErrorClass::LOCK_TIMEOUT:
        case DbErrorClass::SERIALIZATION_FAILURE:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] inline const char* db_error_class_to_string(DbErrorClass cls) {
    switch (cls) {
        case DbErrorClass::NONE:                  return "none";
        case DbErrorClass::CONNECTION_LOST:       return "connection_lost";
        case DbErrorClass::POOL_EXHAUSTED:        return "pool_exhausted";
        case DbErrorClass::DEADLOCK:              return "deadlock";
        case DbErrorClass::LOCK_TIMEOUT:          return "lock_timeout";
        case DbErrorClass::SERIALIZATION_FAILURE: return "serialization_failure";
        case DbErrorClass::QUERY_TIMEOUT:         return "query_timeout";
        case DbErrorClass::SYNTAX_ERROR:          return "syntax_error";
        case DbErrorClass::UNDEFINED_OBJECT:      return "undefined_object";
        case DbErrorClass::PERMISSION_DENIED:     return "permission_denied";
        case DbErrorClass::OTHER:                 return "other";
    }
    return "unknown";
}

/**
 * @brief Result set from a statement or cursor fetch
 *
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    DbErrorClass error_class = DbErrorClass::NONE;
    std::string sqlstate;

    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;

    uint64_t affected_rows = 0;
    bool has_rows = false;

    static DbResultSet failure(DbErrorClass cls, std::string message) {
        DbResultSet r;
        r.success = false;
        r.error_class = cls;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Implementations are not
 * thread-safe; thread safety comes from the pool.
 *
 * Cursor calls let the execution guard fetch results in tiers without
 * materialising an unbounded result. At most one cursor is open per
 * connection; close_cursor() must be safe to call when none is open.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a statement and materialise its full result
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Open a read-only cursor over a SELECT
     * @return success flag and classified error; no rows are returned
     */
    [[nodiscard]] virtual DbResultSet open_cursor(const std::string& sql) = 0;

    /**
     * @brief Fetch up to max_rows from the open cursor
     * Fewer rows than requested means the cursor is drained.
     */
    [[nodiscard]] virtual DbResultSet fetch(size_t max_rows) = 0;

    /**
     * @brief Close the cursor and end its transaction
     */
    virtual void close_cursor() = 0;

    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set statement timeout for subsequent statements (0 = none)
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Set lock wait timeout for subsequent statements (0 = none)
     */
    virtual bool set_lock_timeout(uint32_t timeout_ms) = 0;

    virtual void close() = 0;
};

} // namespace sqlrag
