#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace askql {

/// A previously computed answer, as stored in and returned by the cache.
struct CachedAnswer {
    std::string sql;
    std::vector<std::string> column_names;
    std::vector<Row> rows;
    std::string explanation;
    CandidateSource source = CandidateSource::TEMPLATE;
    std::chrono::system_clock::time_point created_at{};
};

/**
 * @brief Per-identity answer cache with LRU eviction and a TTL
 *
 * Keyed by (user_id, role, normalized question). Entries are visible only to
 * the identity that stored them: the key hash is only a locator, and every
 * lookup also compares the stored identity and question.
 *
 * An expired entry is a miss and is removed on the spot, without touching
 * recency. Sharded: each shard has its own mutex, LRU list and slice of
 * max_entries.
 */
class ResultCache {
public:
    struct Config {
        bool enabled = true;
        size_t max_entries = 1000;
        size_t num_shards = 4;
        std::chrono::seconds ttl{3600};
    };

    explicit ResultCache(const Config& config);

    /// Lookup cached answer. Returns nullopt on miss or expiry.
    [[nodiscard]] std::optional<CachedAnswer> get(const Identity& identity,
                                                  const std::string& question);

    /// Insert or replace the answer for (identity, question).
    void put(const Identity& identity, const std::string& question, CachedAnswer answer);

    /// Drop every entry. Counters are kept.
    void clear();

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    /// Lowercase, trim, collapse whitespace runs.
    [[nodiscard]] static std::string normalize_question(const std::string& question);

    /// XXH64 over user_id, role and normalized question.
    [[nodiscard]] static uint64_t make_key(const Identity& identity,
                                           const std::string& normalized_question);

    struct Stats {
        size_t entry_count;
        size_t max_entries;
        uint64_t ttl_seconds;
        uint64_t hit_count;
        uint64_t miss_count;
        uint64_t evictions;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        uint64_t key;
        std::string user_id;
        std::string role;
        std::string question;           // normalized
        CachedAnswer answer;
        std::chrono::steady_clock::time_point expires_at;
    };

    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<CachedAnswer> get(uint64_t key, const Identity& identity,
                                        const std::string& question);
        void put(CacheEntry entry);
        void clear();
        size_t size() const;

        std::atomic<uint64_t> evictions{0};

    private:
        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<CacheEntry> lru_list_;
        std::unordered_map<uint64_t, std::list<CacheEntry>::iterator> map_;
    };

    size_t select_shard(uint64_t key) const;

    Config config_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace askql
