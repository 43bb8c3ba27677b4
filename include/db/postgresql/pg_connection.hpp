#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace askql {

/**
 * @brief PostgreSQL session implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here. Statements run through the
 * asynchronous API so the client-side deadline holds even when the
 * server never answers.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql,
                        std::chrono::steady_clock::time_point deadline,
                        size_t max_rows) override;
    bool set_read_only() override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    bool is_connected() const override;
    void close() override;

    /// SQLSTATE 57014 (query_canceled) is how statement_timeout reports.
    [[nodiscard]] static DbStatus classify_sqlstate(const std::string& sqlstate);

private:
    enum class WaitOutcome { READY, TIMED_OUT, FAILED };

    /**
     * @brief Block until a result can be read without blocking, or the deadline passes
     */
    WaitOutcome wait_for_result(std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Ask the server to cancel the running statement
     */
    void cancel_running_query();

    bool run_command(const std::string& sql);

    void append_tuples(PGresult* res, DbResultSet& result, size_t max_rows);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdbParams.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string,
                                          std::chrono::seconds connect_timeout) override;
};

} // namespace askql
