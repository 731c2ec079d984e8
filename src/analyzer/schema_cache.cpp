#include "analyzer/schema_cache.hpp"
#include "core/utils.hpp"

#include <format>
#include <optional>

namespace sqlrag {

SchemaCache::SchemaCache(std::shared_ptr<ISchemaProvider> provider)
    : SchemaCache(std::move(provider), Config{}) {}

SchemaCache::SchemaCache(std::shared_ptr<ISchemaProvider> provider, Config config)
    : provider_(std::move(provider)),
      config_(config),
      cache_ptr_(std::make_shared<const SchemaMap>()) {}

std::string SchemaCache::normalize_table_name(const std::string& name) {
    // "public.patients" and "patients" resolve to the same entry
    std::string lower = utils::to_lower(name);
    const auto dot = lower.rfind('.');
    if (dot != std::string::npos) {
        lower = lower.substr(dot + 1);
    }
    if (lower.size() >= 2 && lower.front() == '"' && lower.back() == '"') {
        lower = lower.substr(1, lower.size() - 2);
    }
    return lower;
}

bool SchemaCache::is_stale(const std::string& provider_version) const {
    if (loaded_at_ == std::chrono::steady_clock::time_point{}) {
        return true;
    }
    if (provider_version != loaded_version_) {
        return true;
    }
    return std::chrono::steady_clock::now() - loaded_at_ > config_.ttl;
}

std::shared_ptr<const SchemaMap> SchemaCache::snapshot() {
    const auto provider_version = provider_->schema_version();
    {
        std::lock_guard lock(reload_mutex_);
        if (!is_stale(provider_version)) {
            return std::atomic_load_explicit(&cache_ptr_, std::memory_order_acquire);
        }
    }
    refresh();
    return std::atomic_load_explicit(&cache_ptr_, std::memory_order_acquire);
}

std::string SchemaCache::version() {
    return provider_->schema_version();
}

bool SchemaCache::refresh() {
    std::optional<SchemaChangeEvent> change;
    {
        std::lock_guard lock(reload_mutex_);

        auto fresh = provider_->load_snapshot();
        const auto version = provider_->schema_version();
        loaded_at_ = std::chrono::steady_clock::now();

        if (!fresh || fresh->empty()) {
            // Keep serving the previous snapshot; retry after the TTL
            loaded_version_ = version;
            utils::log::warn("SchemaCache: provider returned an empty schema");
            return false;
        }

        std::atomic_store_explicit(&cache_ptr_, fresh, std::memory_order_release);
        loaded_version_ = version;
        reload_count_.fetch_add(1, std::memory_order_relaxed);

        if (!published_version_.empty() && published_version_ != version) {
            change = SchemaChangeEvent{published_version_, version, fresh};
        }
        published_version_ = version;

        utils::log::debug(std::format("SchemaCache: {} tables at version {}", fresh->size(), version));
    }

    if (change) {
        utils::log::info(std::format("SchemaCache: schema changed {} -> {}",
            change->from_version, change->to_version));
        std::function<void(const SchemaChangeEvent&)> cb;
        {
            std::lock_guard lock(callback_mutex_);
            cb = on_change_;
        }
        if (cb) {
            cb(*change);
        }
    }
    return true;
}

void SchemaCache::set_on_change(std::function<void(const SchemaChangeEvent&)> cb) {
    std::lock_guard lock(callback_mutex_);
    on_change_ = std::move(cb);
}

std::shared_ptr<const TableMetadata> SchemaCache::get_table(const std::string& name) {
    const auto map = snapshot();
    const auto it = map->find(normalize_table_name(name));
    if (it == map->end()) {
        return nullptr;
    }
    return it->second;
}

bool SchemaCache::has_table(const std::string& name) {
    return get_table(name) != nullptr;
}

bool SchemaCache::has_column(const std::string& table, const std::string& column) {
    const auto meta = get_table(table);
    return meta && meta->has_column(column);
}

std::vector<std::string> SchemaCache::suggest_tables(const std::string& name, size_t limit) {
    return utils::rank_similar(normalize_table_name(name), table_names(), limit);
}

std::vector<std::string> SchemaCache::suggest_columns(
    const std::string& table, const std::string& column, size_t limit) {
    const auto meta = get_table(table);
    if (!meta) {
        return {};
    }
    return utils::rank_similar(column, meta->column_names(), limit);
}

std::vector<std::string> SchemaCache::table_names() {
    const auto map = snapshot();
    std::vector<std::string> names;
    names.reserve(map->size());
    for (const auto& [key, table] : *map) {
        names.push_back(table->name);
    }
    return names;
}

uint64_t SchemaCache::row_count(const std::string& table) {
    const auto meta = get_table(table);
    return meta ? meta->row_count_estimate : 0;
}

} // namespace sqlrag
