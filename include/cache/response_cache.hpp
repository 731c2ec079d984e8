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

namespace sqlrag {

/**
 * @brief Sharded LRU of complete responses
 *
 * Keyed by fingerprint = XXH3(normalized question text). Each entry also
 * records the schema version it was produced under. Seeing a new version
 * on get() or put() bumps a global generation, which invalidates every
 * older entry in O(1); stale entries are dropped lazily.
 */
class ResponseCache {
public:
    struct Config {
        bool enabled = true;
        size_t max_entries = 1000;
        size_t num_shards = 8;
        std::chrono::seconds ttl{300};
    };

    explicit ResponseCache(const Config& config);

    [[nodiscard]] static uint64_t fingerprint(const std::string& normalized_text);

    /// Lookup cached response. Returns nullopt on miss, expiry or version change.
    [[nodiscard]] std::optional<Response> get(const std::string& normalized_text,
                                              const std::string& schema_version);

    void put(const std::string& normalized_text, const std::string& schema_version,
             const Response& response);

    /// Drop everything (generation bump)
    void invalidate_all();

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        uint64_t invalidations;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        uint64_t key;
        std::string normalized_text;        // guards against fingerprint collisions
        Response response;
        std::chrono::steady_clock::time_point expires_at;
        uint64_t generation = 0;
    };

    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<Response> get(uint64_t key, const std::string& text, uint64_t generation);
        void put(uint64_t key, const std::string& text, Response response,
                 std::chrono::steady_clock::time_point expires_at, uint64_t generation);
        size_t size() const;

        std::atomic<uint64_t> evictions{0};

    private:
        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<CacheEntry> lru_list_;
        std::unordered_map<uint64_t, std::list<CacheEntry>::iterator> map_;
    };

    // Returns the generation for this schema version, bumping it on change
    uint64_t observe_version(const std::string& schema_version);

    size_t select_shard(uint64_t key) const { return key % shards_.size(); }

    Config config_;
    std::vector<std::unique_ptr<Shard>> shards_;

    std::mutex version_mutex_;
    std::string current_version_;
    std::atomic<uint64_t> generation_{0};

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> invalidations_{0};
};

} // namespace sqlrag
