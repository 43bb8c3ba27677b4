#include "executor/bounded_executor.hpp"
#include "db/session_guard.hpp"
#include "core/utils.hpp"

#include <format>

namespace askql {

namespace {
constexpr const char* kGenericFailure =
    "The query could not be executed. Try rephrasing the question.";
}

BoundedExecutor::BoundedExecutor(Config config, std::shared_ptr<IConnectionFactory> factory)
    : config_(std::move(config)), factory_(std::move(factory)) {}

QueryResult BoundedExecutor::failure(ErrorCode code, std::string message) {
    if (code == ErrorCode::EXECUTION_TIMEOUT) {
        timeouts_.fetch_add(1, std::memory_order_relaxed);
    } else {
        failures_.fetch_add(1, std::memory_order_relaxed);
    }
    QueryResult result;
    result.success = false;
    result.error_code = code;
    result.error_message = std::move(message);
    return result;
}

QueryResult BoundedExecutor::run(const SanitizedQuery& query) {
    utils::Timer timer;
    executed_.fetch_add(1, std::memory_order_relaxed);

    const auto timeout_message = std::format(
        "The query exceeded the {} ms execution limit. Try a narrower question.",
        config_.statement_timeout.count());

    try {
        SessionGuard session(factory_->create(config_.connection_string, config_.connect_timeout));
        if (!session.get()) {
            utils::log::error("BoundedExecutor: could not open a database session");
            return failure(ErrorCode::EXECUTION_FAILURE, kGenericFailure);
        }

        if (!session->set_read_only()) {
            utils::log::error("BoundedExecutor: failed to make the session read-only, not executing");
            return failure(ErrorCode::EXECUTION_FAILURE, kGenericFailure);
        }
        if (!session->set_query_timeout(static_cast<uint32_t>(config_.statement_timeout.count()))) {
            utils::log::error("BoundedExecutor: failed to set statement timeout, not executing");
            return failure(ErrorCode::EXECUTION_FAILURE, kGenericFailure);
        }

        const auto deadline = std::chrono::steady_clock::now()
                            + config_.statement_timeout + config_.deadline_grace;
        auto rs = session->execute(query.sql(), deadline, config_.max_rows);

        switch (rs.status) {
            case DbStatus::OK:
                break;
            case DbStatus::TIMEOUT:
                utils::log::warn(std::format("BoundedExecutor: timed out after {} ms: {}",
                                             timer.elapsed_ms().count(), query.sql()));
                return failure(ErrorCode::EXECUTION_TIMEOUT, timeout_message);
            default:
                utils::log::error(std::format("BoundedExecutor: {} [{}] {}",
                                              db_status_to_string(rs.status), rs.sqlstate,
                                              rs.error_message));
                return failure(ErrorCode::EXECUTION_FAILURE, kGenericFailure);
        }

        QueryResult result;
        result.success = true;
        result.column_names = std::move(rs.column_names);
        result.rows = std::move(rs.rows);
        result.truncated = rs.truncated;
        result.execution_time = timer.elapsed_us();
        if (result.truncated) {
            utils::log::warn(std::format("BoundedExecutor: result stopped at the {} row ceiling",
                                         config_.max_rows));
        }
        return result;
    } catch (const std::exception& e) {
        utils::log::error(std::format("BoundedExecutor: {}", e.what()));
        return failure(ErrorCode::EXECUTION_FAILURE, kGenericFailure);
    }
}

BoundedExecutor::Stats BoundedExecutor::get_stats() const {
    return {
        .executed = executed_.load(std::memory_order_relaxed),
        .timeouts = timeouts_.load(std::memory_order_relaxed),
        .failures = failures_.load(std::memory_order_relaxed),
    };
}

} // namespace askql
