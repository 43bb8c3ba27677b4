#pragma once

#include "db/idb_connection.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace askql {

/**
 * @brief Abstract factory for creating database sessions
 *
 * The backend wraps its native connect call (PQconnectdbParams).
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a new database session
     * @param connection_string Backend-specific connection string
     * @param connect_timeout Upper bound on connection establishment
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string,
        std::chrono::seconds connect_timeout) = 0;
};

} // namespace askql
