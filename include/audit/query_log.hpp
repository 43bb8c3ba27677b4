#pragma once

#include "core/types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace askql {

struct QueryLogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string user_id;
    std::string role;
    std::string question;
    std::string sql;                // empty when no candidate was produced
    ErrorCode outcome;
    RejectReason reason;
    size_t row_count;
    bool cache_hit;
    std::chrono::microseconds latency;

    QueryLogEntry()
        : timestamp(std::chrono::system_clock::now()),
          outcome(ErrorCode::NONE),
          reason(RejectReason::NONE),
          row_count(0),
          cache_hit(false),
          latency(0) {}
};

/**
 * @brief Bounded in-memory log of recent questions, oldest dropped first
 */
class QueryLog {
public:
    struct Config {
        size_t max_entries = 1000;
    };

    QueryLog() : QueryLog(Config{}) {}
    explicit QueryLog(const Config& config);

    void record(QueryLogEntry entry);

    /**
     * @brief Most recent entries, oldest first
     * @param limit Max entries to return (0 = all)
     */
    [[nodiscard]] std::vector<QueryLogEntry> recent(size_t limit = 0) const;

    [[nodiscard]] size_t size() const;

    [[nodiscard]] uint64_t total_recorded() const {
        return total_recorded_.load(std::memory_order_relaxed);
    }

    void clear();

private:
    Config config_;
    mutable std::mutex mutex_;
    std::deque<QueryLogEntry> entries_;
    std::atomic<uint64_t> total_recorded_{0};
};

} // namespace askql
