#include "schema/schema_catalog.hpp"
#include "core/utils.hpp"

#include <format>

namespace askql {

namespace {

std::shared_ptr<const CatalogSnapshot> empty_snapshot() {
    static const auto empty = std::make_shared<const CatalogSnapshot>();
    return empty;
}

int64_t steady_now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

std::vector<std::string> CatalogSnapshot::table_names() const {
    std::vector<std::string> names;
    names.reserve(tables.size());
    for (const auto& [name, _] : tables) {
        names.push_back(name);
    }
    return names;
}

// ============================================================================
// Construction
// ============================================================================

SchemaCatalog::SchemaCatalog(Config config, std::shared_ptr<ISchemaLoader> loader)
    : config_(std::move(config)),
      loader_(std::move(loader)) {}

SchemaCatalog::~SchemaCatalog() {
    stop();
}

// ============================================================================
// Read Operations (wait-free via RCU)
// ============================================================================

std::shared_ptr<const CatalogSnapshot> SchemaCatalog::current() const {
    return std::atomic_load_explicit(&snapshot_ptr_, std::memory_order_acquire);
}

bool SchemaCatalog::is_stale() const {
    const auto snap = current();
    if (!snap) return true;
    return std::chrono::steady_clock::now() - snap->fetched_at >= config_.ttl;
}

std::shared_ptr<const CatalogSnapshot> SchemaCatalog::snapshot() {
    auto snap = current();
    if (snap && !is_stale()) {
        return snap;
    }
    if (!retry_allowed()) {
        return snap ? snap : empty_snapshot();
    }

    std::unique_lock lock(refresh_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        if (snap) {
            return snap;    // another request is refreshing; serve the old snapshot
        }
        lock.lock();        // first load: wait for it
    }

    // Re-check under the lock: the winner may already have published
    snap = current();
    if ((!snap || is_stale()) && retry_allowed()) {
        refresh_locked();
        snap = current();
    }
    return snap ? snap : empty_snapshot();
}

// ============================================================================
// Write Operations (mutex-protected)
// ============================================================================

bool SchemaCatalog::refresh() {
    std::lock_guard lock(refresh_mutex_);
    return refresh_locked();
}

bool SchemaCatalog::refresh_locked() {
    try {
        auto loaded = loader_ ? loader_->load_schema(config_.connection_string, config_.schema)
                              : nullptr;
        if (!loaded) {
            refresh_failures_.fetch_add(1, std::memory_order_relaxed);
            last_failure_ns_.store(steady_now_ns(), std::memory_order_relaxed);
            utils::log::warn("Schema catalog refresh failed (keeping existing snapshot)");
            return false;
        }

        auto next = std::make_shared<CatalogSnapshot>();
        next->tables = std::move(*loaded);
        next->fetched_at = std::chrono::steady_clock::now();
        next->version = version_.load(std::memory_order_acquire) + 1;

        // RCU write: in-flight readers keep the old snapshot alive
        std::atomic_store_explicit(&snapshot_ptr_,
                                   std::shared_ptr<const CatalogSnapshot>(std::move(next)),
                                   std::memory_order_release);
        const auto version = version_.fetch_add(1, std::memory_order_acq_rel) + 1;
        refreshes_.fetch_add(1, std::memory_order_relaxed);
        last_failure_ns_.store(0, std::memory_order_relaxed);

        utils::log::info(std::format("Schema catalog refreshed: version {}, {} table(s)",
                                     version, current()->tables.size()));
        return true;
    } catch (const std::exception& e) {
        refresh_failures_.fetch_add(1, std::memory_order_relaxed);
        last_failure_ns_.store(steady_now_ns(), std::memory_order_relaxed);
        utils::log::error(std::format("Schema catalog refresh failed (keeping existing snapshot): {}",
                                      e.what()));
        return false;
    }
}

bool SchemaCatalog::retry_allowed() const {
    const int64_t last = last_failure_ns_.load(std::memory_order_relaxed);
    if (last == 0) return true;
    const auto retry_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        config_.retry_interval).count();
    return steady_now_ns() - last >= retry_ns;
}

// ============================================================================
// Background Refresher
// ============================================================================

void SchemaCatalog::start() {
    if (config_.refresh_interval.count() <= 0 || refresh_thread_.joinable()) {
        return;
    }
    stopped_from_refresher_.store(false);
    refresh_thread_ = std::jthread([this](std::stop_token stop) {
        refresher_id_.store(std::this_thread::get_id());
        refresh_loop(std::move(stop));
    });
    utils::log::info(std::format("Schema catalog refresher started: every {}s",
                                 config_.refresh_interval.count()));
}

void SchemaCatalog::stop() {
    // A thread cannot join itself; the refresher never touches refresh_thread_
    if (std::this_thread::get_id() == refresher_id_.load()) {
        stopped_from_refresher_.store(true);
        return;
    }
    if (!refresh_thread_.joinable()) return;
    refresh_thread_.request_stop();
    refresh_thread_.join();
    refresher_id_.store(std::thread::id{});
    utils::log::info("Schema catalog refresher stopped");
}

void SchemaCatalog::refresh_loop(std::stop_token stop) {
    const auto stopping = [&] {
        return stop.stop_requested() || stopped_from_refresher_.load();
    };
    while (!stopping()) {
        // Sleep in 100ms increments for responsive shutdown
        const auto ticks = config_.refresh_interval.count() * 10;
        for (int64_t i = 0; i < ticks && !stopping(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
        if (stopping()) break;

        refresh();
    }
}

// ============================================================================
// Stats
// ============================================================================

SchemaCatalog::Stats SchemaCatalog::get_stats() const {
    const auto snap = current();
    return {
        .version = version_.load(std::memory_order_acquire),
        .refreshes = refreshes_.load(std::memory_order_relaxed),
        .refresh_failures = refresh_failures_.load(std::memory_order_relaxed),
        .table_count = snap ? snap->tables.size() : 0,
    };
}

} // namespace askql
