#include "cache/result_cache.hpp"
#include "core/utils.hpp"

#include <xxhash.h>

#include <algorithm>

namespace askql {

// ============================================================================
// ResultCache
// ============================================================================

ResultCache::ResultCache(const Config& config)
    : config_(config) {
    // Shard capacities sum to exactly max_entries; never more shards than entries
    const size_t capacity = std::max(config_.max_entries, size_t{1});
    const size_t num_shards = std::clamp(config_.num_shards, size_t{1}, capacity);
    const size_t per_shard = capacity / num_shards;
    const size_t remainder = capacity % num_shards;
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard + (i < remainder ? 1 : 0)));
    }
}

std::string ResultCache::normalize_question(const std::string& question) {
    return utils::to_lower(utils::collapse_whitespace(question));
}

uint64_t ResultCache::make_key(const Identity& identity, const std::string& normalized_question) {
    // Unit separator keeps ("ab", "c") and ("a", "bc") apart
    std::string material;
    material.reserve(identity.user_id.size() + identity.role.size() +
                     normalized_question.size() + 2);
    material += identity.user_id;
    material += '\x1f';
    material += identity.role;
    material += '\x1f';
    material += normalized_question;
    return XXH64(material.data(), material.size(), 0);
}

size_t ResultCache::select_shard(uint64_t key) const {
    return key % shards_.size();
}

std::optional<CachedAnswer> ResultCache::get(const Identity& identity,
                                             const std::string& question) {
    if (!config_.enabled) return std::nullopt;

    const auto normalized = normalize_question(question);
    const auto key = make_key(identity, normalized);
    auto result = shards_[select_shard(key)]->get(key, identity, normalized);
    if (result) {
        hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

void ResultCache::put(const Identity& identity, const std::string& question,
                      CachedAnswer answer) {
    if (!config_.enabled) return;

    auto normalized = normalize_question(question);
    const auto key = make_key(identity, normalized);
    if (answer.created_at == std::chrono::system_clock::time_point{}) {
        answer.created_at = std::chrono::system_clock::now();
    }

    shards_[select_shard(key)]->put(CacheEntry{
        key,
        identity.user_id,
        identity.role,
        std::move(normalized),
        std::move(answer),
        std::chrono::steady_clock::now() + config_.ttl,
    });
}

void ResultCache::clear() {
    for (auto& shard : shards_) {
        shard->clear();
    }
}

ResultCache::Stats ResultCache::get_stats() const {
    size_t entries = 0;
    uint64_t evictions = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
        evictions += shard->evictions.load(std::memory_order_relaxed);
    }
    return {
        .entry_count = entries,
        .max_entries = config_.max_entries,
        .ttl_seconds = static_cast<uint64_t>(config_.ttl.count()),
        .hit_count = hits_.load(std::memory_order_relaxed),
        .miss_count = misses_.load(std::memory_order_relaxed),
        .evictions = evictions,
    };
}

// ============================================================================
// Shard
// ============================================================================

std::optional<CachedAnswer> ResultCache::Shard::get(uint64_t key, const Identity& identity,
                                                    const std::string& question) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    auto& entry = *it->second;

    // Hash collision: another identity's or another question's entry
    if (entry.user_id != identity.user_id || entry.role != identity.role ||
        entry.question != question) {
        return std::nullopt;
    }

    // TTL check
    if (std::chrono::steady_clock::now() >= entry.expires_at) {
        lru_list_.erase(it->second);
        map_.erase(it);
        return std::nullopt;
    }

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return entry.answer;
}

void ResultCache::Shard::put(CacheEntry entry) {
    std::lock_guard lock(mutex_);

    // If key exists, replace it (a colliding owner loses its slot)
    auto it = map_.find(entry.key);
    if (it != map_.end()) {
        *it->second = std::move(entry);
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    // Evict LRU if at capacity
    while (map_.size() >= max_entries_ && !lru_list_.empty()) {
        map_.erase(lru_list_.back().key);
        lru_list_.pop_back();
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    const auto key = entry.key;
    lru_list_.push_front(std::move(entry));
    map_[key] = lru_list_.begin();
}

void ResultCache::Shard::clear() {
    std::lock_guard lock(mutex_);
    map_.clear();
    lru_list_.clear();
}

size_t ResultCache::Shard::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

} // namespace askql
