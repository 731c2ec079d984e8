#include "cache/response_cache.hpp"
#include "core/utils.hpp"

#include <xxhash.h>

#include <algorithm>
#include <format>

namespace sqlrag {

// ============================================================================
// ResponseCache
// ============================================================================

ResponseCache::ResponseCache(const Config& config)
    : config_(config) {
    const size_t num_shards = std::max(config_.num_shards, size_t{1});
    const size_t per_shard = std::max(config_.max_entries / num_shards, size_t{1});
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard));
    }
}

uint64_t ResponseCache::fingerprint(const std::string& normalized_text) {
    return XXH3_64bits(normalized_text.data(), normalized_text.size());
}

uint64_t ResponseCache::observe_version(const std::string& schema_version) {
    std::lock_guard lock(version_mutex_);
    if (schema_version != current_version_) {
        if (!current_version_.empty()) {
            utils::log::info(std::format("ResponseCache: schema version {} -> {}, invalidating",
                current_version_, schema_version));
            invalidations_.fetch_add(1, std::memory_order_relaxed);
        }
        current_version_ = schema_version;
        generation_.fetch_add(1, std::memory_order_acq_rel);
    }
    return generation_.load(std::memory_order_acquire);
}

std::optional<Response> ResponseCache::get(const std::string& normalized_text,
                                           const std::string& schema_version) {
    if (!config_.enabled) {
        return std::nullopt;
    }

    const uint64_t generation = observe_version(schema_version);
    const uint64_t key = fingerprint(normalized_text);
    auto result = shards_[select_shard(key)]->get(key, normalized_text, generation);
    if (result) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        result->cache_hit = true;
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

void ResponseCache::put(const std::string& normalized_text, const std::string& schema_version,
                        const Response& response) {
    if (!config_.enabled) {
        return;
    }

    const uint64_t generation = observe_version(schema_version);
    const uint64_t key = fingerprint(normalized_text);
    const auto expires = std::chrono::steady_clock::now() + config_.ttl;
    shards_[select_shard(key)]->put(key, normalized_text, response, expires, generation);
}

void ResponseCache::invalidate_all() {
    generation_.fetch_add(1, std::memory_order_acq_rel);
    invalidations_.fetch_add(1, std::memory_order_relaxed);
}

ResponseCache::Stats ResponseCache::get_stats() const {
    size_t entries = 0;
    uint64_t evictions = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
        evictions += shard->evictions.load(std::memory_order_relaxed);
    }
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions,
        .invalidations = invalidations_.load(std::memory_order_relaxed),
        .current_entries = entries,
    };
}

// ============================================================================
// Shard
// ============================================================================

std::optional<Response> ResponseCache::Shard::get(uint64_t key, const std::string& text,
                                                  uint64_t generation) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    auto& entry = *it->second;

    // Stale generation or expired TTL: evict lazily
    if (entry.generation < generation ||
        std::chrono::steady_clock::now() >= entry.expires_at) {
        lru_list_.erase(it->second);
        map_.erase(it);
        return std::nullopt;
    }

    if (entry.normalized_text != text) {
        return std::nullopt;
    }

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return entry.response;
}

void ResponseCache::Shard::put(uint64_t key, const std::string& text, Response response,
                               std::chrono::steady_clock::time_point expires_at,
                               uint64_t generation) {
    std::lock_guard lock(mutex_);

    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->normalized_text = text;
        it->second->response = std::move(response);
        it->second->expires_at = expires_at;
        it->second->generation = generation;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    // Evict LRU if at capacity
    while (map_.size() >= max_entries_ && !lru_list_.empty()) {
        map_.erase(lru_list_.back().key);
        lru_list_.pop_back();
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    lru_list_.emplace_front(CacheEntry{key, text, std::move(response), expires_at, generation});
    map_[key] = lru_list_.begin();
}

size_t ResponseCache::Shard::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

} // namespace sqlrag
