#pragma once

#include "db/idb_connection.hpp"
#include <memory>

namespace askql {

/**
 * @brief RAII owner of one database session
 *
 * Closes the session on destruction, whichever way the scope is left.
 * Move-only to prevent accidental copying.
 */
class SessionGuard {
public:
    explicit SessionGuard(std::unique_ptr<IDbConnection> conn)
        : conn_(std::move(conn)) {}

    ~SessionGuard() {
        if (conn_) {
            conn_->close();
        }
    }

    SessionGuard(SessionGuard&& other) noexcept = default;
    SessionGuard& operator=(SessionGuard&& other) noexcept {
        if (this != &other) {
            if (conn_) conn_->close();
            conn_ = std::move(other.conn_);
        }
        return *this;
    }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

private:
    std::unique_ptr<IDbConnection> conn_;
};

} // namespace askql
