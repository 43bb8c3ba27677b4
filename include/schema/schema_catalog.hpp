#pragma once

#include "core/types.hpp"
#include "db/ischema_loader.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace askql {

/**
 * @brief Immutable catalog snapshot
 *
 * Replaced wholesale on refresh, never mutated after publication.
 */
struct CatalogSnapshot {
    SchemaMap tables;
    std::chrono::steady_clock::time_point fetched_at;
    uint64_t version = 0;

    [[nodiscard]] bool has_table(const std::string& name) const {
        return tables.contains(name);
    }

    [[nodiscard]] std::shared_ptr<const TableMetadata> find_table(const std::string& name) const {
        const auto it = tables.find(name);
        return it != tables.end() ? it->second : nullptr;
    }

    [[nodiscard]] std::vector<std::string> table_names() const;
};

/**
 * @brief Schema catalog with RCU (Read-Copy-Update) snapshots and a TTL
 *
 * Readers get a shared_ptr to the current snapshot via atomic load and never
 * block. A refresh builds a complete new snapshot offline and publishes it
 * with an atomic store; in-flight requests keep the snapshot they loaded.
 *
 * Refresh happens either on a background thread (refresh_interval > 0) or
 * lazily when a reader finds the snapshot older than the TTL. Only one
 * refresh runs at a time; readers that lose the race keep the old snapshot.
 * A failed refresh keeps the previous snapshot and is retried after
 * retry_interval.
 *
 * Thread-safety: Multiple readers + single writer safe
 */
class SchemaCatalog {
public:
    struct Config {
        std::string connection_string;
        std::string schema = "public";
        std::chrono::seconds ttl{3600};
        std::chrono::seconds refresh_interval{0};   // 0 = lazy refresh only
        std::chrono::seconds retry_interval{30};
    };

    SchemaCatalog(Config config, std::shared_ptr<ISchemaLoader> loader);
    ~SchemaCatalog();

    SchemaCatalog(const SchemaCatalog&) = delete;
    SchemaCatalog& operator=(const SchemaCatalog&) = delete;

    /**
     * @brief Current snapshot, refreshing first if it is missing or stale
     * @return Never null; an empty snapshot (version 0) before the first successful load
     */
    [[nodiscard]] std::shared_ptr<const CatalogSnapshot> snapshot();

    /**
     * @brief Current snapshot without any refresh attempt (may be null)
     */
    [[nodiscard]] std::shared_ptr<const CatalogSnapshot> current() const;

    /**
     * @brief Reload from the database and publish a new snapshot
     * @return true if a new snapshot was published
     */
    bool refresh();

    [[nodiscard]] bool is_stale() const;

    /**
     * @brief Start the periodic refresher (no-op when refresh_interval is 0)
     */
    void start();

    /**
     * @brief Stop the refresher and wait for it
     *
     * From the refresher thread itself (a loader giving up, say) this only
     * requests the stop; the loop ends once the current refresh returns.
     */
    void stop();

    [[nodiscard]] const Config& config() const { return config_; }

    struct Stats {
        uint64_t version;
        uint64_t refreshes;
        uint64_t refresh_failures;
        size_t table_count;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    bool refresh_locked();
    [[nodiscard]] bool retry_allowed() const;
    void refresh_loop(std::stop_token stop);

    Config config_;
    std::shared_ptr<ISchemaLoader> loader_;

    // RCU: readers load this shared_ptr atomically
    std::shared_ptr<const CatalogSnapshot> snapshot_ptr_;

    // Only one refresh at a time
    mutable std::mutex refresh_mutex_;

    std::atomic<uint64_t> version_{0};
    std::atomic<uint64_t> refreshes_{0};
    std::atomic<uint64_t> refresh_failures_{0};
    std::atomic<int64_t> last_failure_ns_{0};   // steady_clock epoch, 0 = none

    std::jthread refresh_thread_;
    std::atomic<std::thread::id> refresher_id_{};
    std::atomic<bool> stopped_from_refresher_{false};
};

} // namespace askql
