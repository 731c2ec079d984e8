#pragma once

#include "core/types.hpp"
#include "db/ischema_provider.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sqlrag {

struct SchemaChangeEvent {
    std::string from_version;
    std::string to_version;
    std::shared_ptr<const SchemaMap> snapshot;
};

/**
 * @brief Schema snapshot cache with RCU (Read-Copy-Update) refresh
 *
 * Readers load the current snapshot shared_ptr atomically and never block.
 * A refresh builds a new map from the provider offline, then swaps it in;
 * in-flight validations keep the snapshot they started with.
 *
 * The snapshot is refreshed when its TTL elapses or when the provider
 * reports a different schema version.
 *
 * When a reload publishes a snapshot under a different version than the
 * one it replaces, the change callback runs after the reload lock is
 * released. The first load is not a change.
 *
 * Thread-safety: multiple readers + single writer
 */
class SchemaCache {
public:
    struct Config {
        std::chrono::seconds ttl{3600};
    };

    explicit SchemaCache(std::shared_ptr<ISchemaProvider> provider);
    SchemaCache(std::shared_ptr<ISchemaProvider> provider, Config config);

    /**
     * @brief Current snapshot, refreshed first if stale
     */
    [[nodiscard]] std::shared_ptr<const SchemaMap> snapshot();

    /**
     * @brief Version of the provider schema, as last reported
     */
    [[nodiscard]] std::string version();

    [[nodiscard]] std::shared_ptr<const TableMetadata> get_table(const std::string& name);

    [[nodiscard]] bool has_table(const std::string& name);

    [[nodiscard]] bool has_column(const std::string& table, const std::string& column);

    [[nodiscard]] std::vector<std::string> suggest_tables(const std::string& name, size_t limit = 5);

    [[nodiscard]] std::vector<std::string> suggest_columns(
        const std::string& table, const std::string& column, size_t limit = 5);

    [[nodiscard]] std::vector<std::string> table_names();

    /**
     * @brief Estimated row count, 0 when unknown
     */
    [[nodiscard]] uint64_t row_count(const std::string& table);

    /**
     * @brief Reload from the provider unconditionally (RCU update)
     * @return true if the provider returned a non-empty schema
     */
    bool refresh();

    [[nodiscard]] uint64_t reload_count() const {
        return reload_count_.load(std::memory_order_relaxed);
    }

    void set_on_change(std::function<void(const SchemaChangeEvent&)> cb);

private:
    bool is_stale(const std::string& provider_version) const;

    static std::string normalize_table_name(const std::string& name);

    std::shared_ptr<ISchemaProvider> provider_;
    Config config_;

    // RCU: readers atomically load, writers store under reload_mutex_
    std::shared_ptr<const SchemaMap> cache_ptr_;

    std::mutex reload_mutex_;
    std::string loaded_version_;
    std::string published_version_;     // version of cache_ptr_, empty before the first load
    std::chrono::steady_clock::time_point loaded_at_{};
    std::atomic<uint64_t> reload_count_{0};

    std::function<void(const SchemaChangeEvent&)> on_change_;
    mutable std::mutex callback_mutex_;
};

} // namespace sqlrag
