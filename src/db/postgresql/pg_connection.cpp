#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_handles.hpp"
#include "core/utils.hpp"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <format>

namespace askql {

static constexpr std::string_view kQueryCanceled = "57014";
static constexpr std::string_view kConnectionExceptionClass = "08";

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql,
                                  std::chrono::steady_clock::time_point deadline,
                                  size_t max_rows) {
    DbResultSet result;
    if (!conn_) {
        result.status = DbStatus::CONNECTION_ERROR;
        result.error_message = "Connection is null";
        return result;
    }

    if (PQsendQuery(conn_, sql.c_str()) == 0) {
        result.status = DbStatus::CONNECTION_ERROR;
        result.error_message = utils::trim(PQerrorMessage(conn_));
        return result;
    }

    // Must be requested before the first PQgetResult
    if (max_rows > 0 && PQsetSingleRowMode(conn_) == 0) {
        utils::log::warn("PgConnection: single-row mode unavailable, rows capped after retrieval");
    }

    while (true) {
        const auto outcome = wait_for_result(deadline);
        if (outcome == WaitOutcome::TIMED_OUT) {
            cancel_running_query();
            close();
            result = DbResultSet{};
            result.status = DbStatus::TIMEOUT;
            result.error_message = "Client-side statement deadline exceeded";
            return result;
        }
        if (outcome == WaitOutcome::FAILED) {
            const std::string message = conn_ ? utils::trim(PQerrorMessage(conn_)) : "";
            close();
            result = DbResultSet{};
            result.status = DbStatus::CONNECTION_ERROR;
            result.error_message = message.empty() ? "Lost connection while waiting for result" : message;
            return result;
        }

        PGResultPtr res(PQgetResult(conn_));
        if (!res) {
            break;  // all results consumed
        }

        switch (PQresultStatus(res.get())) {
            case PGRES_SINGLE_TUPLE:
            case PGRES_TUPLES_OK:
                if (result.ok()) {
                    append_tuples(res.get(), result, max_rows);
                }
                break;
            case PGRES_COMMAND_OK:
            case PGRES_EMPTY_QUERY:
                break;
            default:
                // Keep the first error; later results only drain the stream
                if (result.ok()) {
                    const char* state = PQresultErrorField(res.get(), PG_DIAG_SQLSTATE);
                    result.sqlstate = state ? state : "";
                    result.status = (PQstatus(conn_) == CONNECTION_BAD)
                        ? DbStatus::CONNECTION_ERROR
                        : classify_sqlstate(result.sqlstate);
                    result.error_message = utils::trim(PQresultErrorMessage(res.get()));
                }
                break;
        }
    }

    if (!result.ok()) {
        result.column_names.clear();
        result.rows.clear();
    }
    return result;
}

bool PgConnection::set_read_only() {
    return run_command("SET SESSION CHARACTERISTICS AS TRANSACTION READ ONLY");
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    return run_command(std::format("SET statement_timeout = {}", timeout_ms));
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbStatus PgConnection::classify_sqlstate(const std::string& sqlstate) {
    if (sqlstate == kQueryCanceled) {
        return DbStatus::TIMEOUT;
    }
    if (sqlstate.starts_with(kConnectionExceptionClass)) {
        return DbStatus::CONNECTION_ERROR;
    }
    return DbStatus::REJECTED_BY_DATABASE;
}

PgConnection::WaitOutcome PgConnection::wait_for_result(
    std::chrono::steady_clock::time_point deadline) {
    while (PQisBusy(conn_)) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return WaitOutcome::TIMED_OUT;
        }

        pollfd pfd{};
        pfd.fd = PQsocket(conn_);
        pfd.events = POLLIN;
        if (pfd.fd < 0) {
            return WaitOutcome::FAILED;
        }

        const int wait_ms = static_cast<int>(
            std::min<long long>(remaining.count(), INT_MAX));
        const int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return WaitOutcome::FAILED;
        }
        if (rc == 0) {
            continue;  // loop re-checks the deadline
        }
        if (PQconsumeInput(conn_) == 0) {
            return WaitOutcome::FAILED;
        }
    }
    return WaitOutcome::READY;
}

void PgConnection::cancel_running_query() {
    if (!conn_) return;

    PGCancelPtr cancel(PQgetCancel(conn_));
    if (!cancel) {
        utils::log::warn("PgConnection: could not obtain cancel handle");
        return;
    }

    char errbuf[256] = {};
    if (PQcancel(cancel.get(), errbuf, sizeof(errbuf)) == 0) {
        utils::log::warn(std::format("PgConnection: cancel request failed: {}", errbuf));
    }
}

bool PgConnection::run_command(const std::string& sql) {
    if (!conn_) {
        return false;
    }

    PGResultPtr res(PQexec(conn_, sql.c_str()));
    if (!res) {
        return false;
    }

    if (PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        utils::log::error(std::format("PgConnection: '{}' failed: {}",
                                      sql, utils::trim(PQresultErrorMessage(res.get()))));
        return false;
    }
    return true;
}

void PgConnection::append_tuples(PGresult* res, DbResultSet& result, size_t max_rows) {
    const int ncols = PQnfields(res);
    if (result.column_names.empty()) {
        result.column_names.reserve(static_cast<size_t>(ncols));
        for (int i = 0; i < ncols; ++i) {
            result.column_names.emplace_back(PQfname(res, i));
        }
    }

    const int nrows = PQntuples(res);
    for (int i = 0; i < nrows; ++i) {
        if (max_rows > 0 && result.rows.size() >= max_rows) {
            result.truncated = true;
            return;
        }

        Row row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; ++j) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j)));
            }
        }
        result.rows.push_back(std::move(row));
    }
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string, std::chrono::seconds connect_timeout) {

    const std::string timeout = std::to_string(connect_timeout.count());
    const char* const keywords[] = {"dbname", "connect_timeout", "application_name", nullptr};
    const char* const values[] = {connection_string.c_str(), timeout.c_str(), "askql", nullptr};

    PGconn* conn = PQconnectdbParams(keywords, values, /*expand_dbname=*/1);

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

} // namespace askql
