#pragma once

#include "core/types.hpp"
#include "db/iconnection_factory.hpp"
#include "security/safety_validator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace askql {

/**
 * @brief Runs sanitized queries under hard resource bounds
 *
 * Every run opens a fresh session, makes it read-only, sets the server-side
 * statement timeout, and executes the single statement against a client-side
 * deadline (statement timeout + grace). Rows are materialized up to the
 * ceiling. The session is closed on every exit path.
 *
 * Never retries. Database error text goes to the log only; callers see a
 * generic message.
 */
class BoundedExecutor {
public:
    struct Config {
        std::string connection_string;
        std::chrono::milliseconds statement_timeout{5000};
        std::chrono::seconds connect_timeout{5};
        std::chrono::milliseconds deadline_grace{500};
        size_t max_rows = 1000;                         // row ceiling
    };

    BoundedExecutor(Config config, std::shared_ptr<IConnectionFactory> factory);

    /**
     * @brief Execute a validated query
     * @return Rows on success; EXECUTION_TIMEOUT or EXECUTION_FAILURE otherwise
     */
    [[nodiscard]] QueryResult run(const SanitizedQuery& query);

    [[nodiscard]] const Config& config() const { return config_; }

    struct Stats {
        uint64_t executed;
        uint64_t timeouts;
        uint64_t failures;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    QueryResult failure(ErrorCode code, std::string message);

    Config config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::atomic<uint64_t> executed_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace askql
