#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sqlrag {

/**
 * @brief Column reference as written in the statement
 * qualifier is the alias or table name before the dot; empty when unqualified.
 */
struct ColumnUse {
    std::string qualifier;
    std::string column;
};

/**
 * @brief Structural facts extracted from one parse-tree walk
 *
 * Table and column names are lower-cased. CTE names are excluded from
 * tables; derived_aliases holds CTE names and subquery aliases so that
 * columns qualified by them are not checked against the catalog.
 */
struct StatementAnalysis {
    bool parsed = false;
    std::string parse_error;

    std::string statement_type;          // parse-tree node name, e.g. "SelectStmt"
    size_t statement_count = 0;

    std::vector<std::string> tables;
    std::unordered_map<std::string, std::string> alias_to_table;
    std::unordered_set<std::string> derived_aliases;
    std::vector<ColumnUse> columns;
    std::unordered_set<std::string> output_aliases;

    size_t join_count = 0;
    size_t subquery_count = 0;
    size_t max_subquery_depth = 0;
    size_t union_count = 0;

    bool has_where = false;              // top-level WHERE
    bool has_limit = false;              // top-level LIMIT
    bool has_aggregate = false;
    bool has_window = false;
    bool has_star = false;
    bool has_into = false;               // SELECT ... INTO
    bool has_locking = false;            // FOR UPDATE / FOR SHARE

    [[nodiscard]] bool is_single_select() const {
        return parsed && statement_count == 1 && statement_type == "SelectStmt";
    }

    /**
     * @brief Resolve an alias or table name to its base table
     * @return empty string when the qualifier is unknown or derived
     */
    [[nodiscard]] std::string resolve(const std::string& qualifier) const;
};

/**
 * @brief PostgreSQL statement analyzer backed by libpg_query
 *
 * Parses with the real PostgreSQL grammar and walks the JSON parse tree
 * once, collecting what the validator and generation controller need.
 * Thread-safe (stateless).
 */
class StatementAnalyzer {
public:
    [[nodiscard]] static StatementAnalysis analyze(const std::string& sql);
};

} // namespace sqlrag
