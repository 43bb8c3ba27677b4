#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace askql {

/// How a statement ended at the database layer.
enum class DbStatus {
    OK,
    TIMEOUT,
    CONNECTION_ERROR,
    REJECTED_BY_DATABASE
};

inline const char* db_status_to_string(DbStatus status) {
    switch (status) {
        case DbStatus::OK: return "ok";
        case DbStatus::TIMEOUT: return "timeout";
        case DbStatus::CONNECTION_ERROR: return "connection_error";
        case DbStatus::REJECTED_BY_DATABASE: return "rejected_by_database";
        default: return "unknown";
    }
}

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 * error_message and sqlstate are for logs only.
 */
struct DbResultSet {
    DbStatus status = DbStatus::OK;
    std::string error_message;
    std::string sqlstate;

    std::vector<std::string> column_names;
    std::vector<Row> rows;
    bool truncated = false;

    [[nodiscard]] bool ok() const { return status == DbStatus::OK; }
};

/**
 * @brief Abstract database session
 *
 * Wraps a single native connection handle. One instance serves exactly one
 * question and is closed afterwards. Not thread-safe.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a single statement
     * @param sql SQL text
     * @param deadline Client-side deadline; the statement is cancelled when it passes
     * @param max_rows Stop materializing rows after this many (0 = unbounded)
     */
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql,
        std::chrono::steady_clock::time_point deadline,
        size_t max_rows) = 0;

    /**
     * @brief Make every transaction on this session read-only
     *
     * PostgreSQL: SET SESSION CHARACTERISTICS AS TRANSACTION READ ONLY
     */
    [[nodiscard]] virtual bool set_read_only() = 0;

    /**
     * @brief Set server-side statement timeout for subsequent statements
     * @param timeout_ms Timeout in milliseconds
     *
     * PostgreSQL: SET statement_timeout = N
     */
    [[nodiscard]] virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the session and release resources (idempotent)
     */
    virtual void close() = 0;
};

} // namespace askql
