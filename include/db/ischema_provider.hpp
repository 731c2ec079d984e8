#pragma once

#include "core/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sqlrag {

/**
 * @brief Source of truth for datastore schema
 *
 * schema_version() returns an opaque token that changes whenever the
 * table/column layout changes; caches key on it.
 */
class ISchemaProvider {
public:
    virtual ~ISchemaProvider() = default;

    [[nodiscard]] virtual bool table_exists(const std::string& name) = 0;

    /**
     * @brief Table names ranked by similarity to name, best first
     */
    [[nodiscard]] virtual std::vector<std::string> suggest_similar(
        const std::string& name, size_t limit = 5) = 0;

    [[nodiscard]] virtual std::string schema_version() = 0;

    /**
     * @brief Full table/column/foreign-key snapshot (never null; empty on failure)
     */
    [[nodiscard]] virtual std::shared_ptr<const SchemaMap> load_snapshot() = 0;
};

} // namespace sqlrag
