#include "db/postgresql/pg_schema_provider.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlrag {

namespace {

// Single-quote a literal for interpolation into catalog queries
std::string quote_literal(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

std::shared_ptr<TableMetadata> find_table(SchemaMap& map, const std::string& name) {
    const auto it = map.find(utils::to_lower(name));
    return it != map.end() ? it->second : nullptr;
}

} // anonymous namespace

PgSchemaProvider::PgSchemaProvider(std::shared_ptr<IConnectionPool> pool, Config config)
    : pool_(std::move(pool)),
      config_(std::move(config)),
      schema_literal_(quote_literal(config_.schema_name)),
      snapshot_(std::make_shared<const SchemaMap>()) {}

bool PgSchemaProvider::table_exists(const std::string& name) {
    const auto map = snapshot();
    return map->contains(utils::to_lower(name));
}

std::vector<std::string> PgSchemaProvider::suggest_similar(const std::string& name, size_t limit) {
    const auto map = snapshot();
    std::vector<std::string> names;
    names.reserve(map->size());
    for (const auto& [key, table] : *map) {
        names.push_back(table->name);
    }
    return utils::rank_similar(name, names, limit);
}

std::string PgSchemaProvider::schema_version() {
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        if (!version_.empty() && now - version_checked_at_ < config_.version_check_interval) {
            return version_;
        }
    }

    auto conn = pool_->acquire(config_.acquire_timeout);
    if (!conn) {
        utils::log::warn("PgSchemaProvider: no connection for version check");
        std::lock_guard lock(mutex_);
        return version_;
    }

    const auto sql = std::format(
        "SELECT md5(coalesce(string_agg(table_name || '.' || column_name || ':' || data_type, ',' "
        "ORDER BY table_name, ordinal_position), '')) "
        "FROM information_schema.columns WHERE table_schema = {}",
        schema_literal_);
    const auto res = (*conn)->execute(sql);

    std::lock_guard lock(mutex_);
    if (res.success && !res.rows.empty() && !res.rows[0].empty()) {
        if (version_ != res.rows[0][0] && !version_.empty()) {
            utils::log::info(std::format("Schema version changed: {} -> {}",
                version_, res.rows[0][0]));
        }
        version_ = res.rows[0][0];
        version_checked_at_ = std::chrono::steady_clock::now();
    } else {
        utils::log::warn(std::format("PgSchemaProvider: version check failed: {}",
            res.error_message));
    }
    return version_;
}

std::shared_ptr<const SchemaMap> PgSchemaProvider::snapshot() {
    const auto version = schema_version();
    {
        std::lock_guard lock(mutex_);
        if (!snapshot_->empty() && snapshot_version_ == version) {
            return snapshot_;
        }
    }
    return load_snapshot();
}

std::shared_ptr<const SchemaMap> PgSchemaProvider::load_snapshot() {
    auto conn = pool_->acquire(config_.acquire_timeout);
    if (!conn) {
        utils::log::error("PgSchemaProvider: no connection available for schema load");
        std::lock_guard lock(mutex_);
        return snapshot_;
    }

    auto map = std::make_shared<SchemaMap>();
    if (!load_columns(*conn->get(), *map)) {
        std::lock_guard lock(mutex_);
        return snapshot_;
    }
    load_primary_keys(*conn->get(), *map);
    load_foreign_keys(*conn->get(), *map);
    load_table_stats(*conn->get(), *map);
    conn.reset();

    const auto version = schema_version();

    utils::log::info(std::format("Schema loaded: {} tables from '{}' (version {})",
        map->size(), config_.schema_name, version));

    std::lock_guard lock(mutex_);
    snapshot_ = map;
    snapshot_version_ = version;
    return snapshot_;
}

bool PgSchemaProvider::load_columns(IDbConnection& conn, SchemaMap& map) const {
    const auto sql = std::format(
        "SELECT table_name, column_name, data_type, is_nullable "
        "FROM information_schema.columns "
        "WHERE table_schema = {} "
        "ORDER BY table_name, ordinal_position",
        schema_literal_);

    const auto res = conn.execute(sql);
    if (!res.success) {
        utils::log::error(std::format("PgSchemaProvider: column query failed: {}",
            res.error_message));
        return false;
    }

    // Ordered by table, so columns of one table arrive consecutively
    std::shared_ptr<TableMetadata> current;
    for (const auto& row : res.rows) {
        if (row.size() < 4) continue;
        const std::string key = utils::to_lower(row[0]);
        if (!current || current->name != row[0]) {
            auto [it, inserted] = map.try_emplace(key, nullptr);
            if (inserted) {
                it->second = std::make_shared<TableMetadata>();
                it->second->schema = config_.schema_name;
                it->second->name = row[0];
            }
            current = it->second;
        }
        current->add_column(ColumnMetadata(row[1], utils::to_lower(row[2]), row[3] == "YES"));
    }
    return true;
}

void PgSchemaProvider::load_primary_keys(IDbConnection& conn, SchemaMap& map) const {
    const auto sql = std::format(
        "SELECT c.relname, a.attname "
        "FROM pg_index i "
        "JOIN pg_class c ON c.oid = i.indrelid "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "JOIN pg_attribute a ON a.attrelid = c.oid AND a.attnum = ANY(i.indkey) "
        "WHERE i.indisprimary AND n.nspname = {}",
        schema_literal_);

    const auto res = conn.execute(sql);
    if (!res.success) {
        utils::log::warn(std::format("PgSchemaProvider: primary key query failed: {}",
            res.error_message));
        return;
    }

    for (const auto& row : res.rows) {
        if (row.size() < 2) continue;
        const auto table = find_table(map, row[0]);
        if (!table) continue;
        const auto it = table->column_index.find(utils::to_lower(row[1]));
        if (it != table->column_index.end()) {
            table->columns[it->second].is_primary_key = true;
        }
    }
}

void PgSchemaProvider::load_foreign_keys(IDbConnection& conn, SchemaMap& map) const {
    const auto sql = std::format(
        "SELECT tc.table_name, kcu.column_name, ccu.table_name, ccu.column_name "
        "FROM information_schema.table_constraints tc "
        "JOIN information_schema.key_column_usage kcu "
        "  ON tc.constraint_name = kcu.constraint_name AND tc.table_schema = kcu.table_schema "
        "JOIN information_schema.constraint_column_usage ccu "
        "  ON ccu.constraint_name = tc.constraint_name AND ccu.table_schema = tc.table_schema "
        "WHERE tc.constraint_type = 'FOREIGN KEY' AND tc.table_schema = {}",
        schema_literal_);

    const auto res = conn.execute(sql);
    if (!res.success) {
        utils::log::warn(std::format("PgSchemaProvider: foreign key query failed: {}",
            res.error_message));
        return;
    }

    for (const auto& row : res.rows) {
        if (row.size() < 4) continue;
        const auto table = find_table(map, row[0]);
        if (!table) continue;
        table->foreign_keys.push_back(ForeignKey{row[1], row[2], row[3]});
    }
}

void PgSchemaProvider::load_table_stats(IDbConnection& conn, SchemaMap& map) const {
    const auto sql = std::format(
        "SELECT c.relname, GREATEST(c.reltuples, 0)::bigint, "
        "       COALESCE(obj_description(c.oid, 'pg_class'), '') "
        "FROM pg_class c JOIN pg_namespace n ON n.oid = c.relnamespace "
        "WHERE c.relkind IN ('r', 'p', 'v', 'm') AND n.nspname = {}",
        schema_literal_);

    const auto res = conn.execute(sql);
    if (!res.success) {
        utils::log::warn(std::format("PgSchemaProvider: table stats query failed: {}",
            res.error_message));
        return;
    }

    for (const auto& row : res.rows) {
        if (row.size() < 3) continue;
        const auto table = find_table(map, row[0]);
        if (!table) continue;
        table->row_count_estimate = utils::parse_int<uint64_t>(row[1]);
        table->description = row[2];
    }
}

} // namespace sqlrag
