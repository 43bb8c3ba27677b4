#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace askql::testing {

/**
 * @brief Shared record of what the mock sessions were asked to do
 */
struct SessionLog {
    std::mutex mutex;
    std::vector<std::string> calls;     // "read_only", "timeout:5000", "execute:<sql>", "close"
    int opened = 0;
    int closed = 0;
    size_t last_max_rows = 0;

    void add(std::string call) {
        std::lock_guard lock(mutex);
        calls.push_back(std::move(call));
    }
};

/// Scripted behaviour for every session the factory hands out.
struct SessionScript {
    bool connect_ok = true;
    bool read_only_ok = true;
    bool timeout_ok = true;
    DbResultSet result;
};

class MockDbConnection : public IDbConnection {
public:
    MockDbConnection(std::shared_ptr<SessionLog> log, SessionScript script)
        : log_(std::move(log)), script_(std::move(script)) {}

    ~MockDbConnection() override { close(); }

    DbResultSet execute(const std::string& sql,
                        std::chrono::steady_clock::time_point /*deadline*/,
                        size_t max_rows) override {
        log_->add("execute:" + sql);
        {
            std::lock_guard lock(log_->mutex);
            log_->last_max_rows = max_rows;
        }
        return script_.result;
    }

    bool set_read_only() override {
        log_->add("read_only");
        return script_.read_only_ok;
    }

    bool set_query_timeout(uint32_t timeout_ms) override {
        log_->add("timeout:" + std::to_string(timeout_ms));
        return script_.timeout_ok;
    }

    bool is_connected() const override { return !closed_; }

    void close() override {
        if (closed_) return;
        closed_ = true;
        log_->add("close");
        std::lock_guard lock(log_->mutex);
        ++log_->closed;
    }

private:
    std::shared_ptr<SessionLog> log_;
    SessionScript script_;
    bool closed_ = false;
};

class MockConnectionFactory : public IConnectionFactory {
public:
    explicit MockConnectionFactory(SessionScript script = {})
        : log_(std::make_shared<SessionLog>()), script_(std::move(script)) {}

    std::unique_ptr<IDbConnection> create(const std::string& /*connection_string*/,
                                          std::chrono::seconds /*connect_timeout*/) override {
        if (!script_.connect_ok) {
            return nullptr;
        }
        {
            std::lock_guard lock(log_->mutex);
            ++log_->opened;
        }
        return std::make_unique<MockDbConnection>(log_, script_);
    }

    void set_script(SessionScript script) { script_ = std::move(script); }

    [[nodiscard]] SessionLog& log() { return *log_; }

private:
    std::shared_ptr<SessionLog> log_;
    SessionScript script_;
};

/// A successful result set with the given columns and text rows.
inline DbResultSet make_rows(std::vector<std::string> columns,
                             std::vector<Row> rows) {
    DbResultSet rs;
    rs.status = DbStatus::OK;
    rs.column_names = std::move(columns);
    rs.rows = std::move(rows);
    return rs;
}

} // namespace askql::testing
