#pragma once

#include "db/iconnection_pool.hpp"
#include "db/ischema_provider.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace sqlrag {

class IDbConnection;

/**
 * @brief Schema provider reading the PostgreSQL catalog
 *
 * Loads columns from information_schema, primary and foreign keys from the
 * constraint views, and row estimates plus table comments from pg_class.
 * Queries run on connections borrowed from the shared pool.
 *
 * schema_version() is an md5 over the column listing; it is re-read at most
 * once per version_check_interval.
 */
class PgSchemaProvider : public ISchemaProvider {
public:
    struct Config {
        std::string schema_name = "public";
        std::chrono::milliseconds acquire_timeout{2000};
        std::chrono::milliseconds version_check_interval{30000};
    };

    PgSchemaProvider(std::shared_ptr<IConnectionPool> pool, Config config);

    bool table_exists(const std::string& name) override;
    std::vector<std::string> suggest_similar(const std::string& name, size_t limit = 5) override;
    std::string schema_version() override;
    std::shared_ptr<const SchemaMap> load_snapshot() override;

private:
    std::shared_ptr<const SchemaMap> snapshot();
    bool load_columns(IDbConnection& conn, SchemaMap& map) const;
    void load_primary_keys(IDbConnection& conn, SchemaMap& map) const;
    void load_foreign_keys(IDbConnection& conn, SchemaMap& map) const;
    void load_table_stats(IDbConnection& conn, SchemaMap& map) const;

    std::shared_ptr<IConnectionPool> pool_;
    Config config_;
    std::string schema_literal_;   // quoted for interpolation

    std::mutex mutex_;
    std::string version_;
    std::chrono::steady_clock::time_point version_checked_at_{};
    std::shared_ptr<const SchemaMap> snapshot_;
    std::string snapshot_version_;
};

} // namespace sqlrag
