#include "audit/query_log.hpp"

namespace askql {

QueryLog::QueryLog(const Config& config)
    : config_(config) {}

void QueryLog::record(QueryLogEntry entry) {
    total_recorded_.fetch_add(1, std::memory_order_relaxed);
    if (config_.max_entries == 0) return;

    std::lock_guard lock(mutex_);
    entries_.push_back(std::move(entry));
    while (entries_.size() > config_.max_entries) {
        entries_.pop_front();
    }
}

std::vector<QueryLogEntry> QueryLog::recent(size_t limit) const {
    std::lock_guard lock(mutex_);

    if (limit == 0 || limit >= entries_.size()) {
        return {entries_.begin(), entries_.end()};
    }

    const auto start = entries_.end() - static_cast<std::ptrdiff_t>(limit);
    return {start, entries_.end()};
}

size_t QueryLog::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void QueryLog::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

} // namespace askql
