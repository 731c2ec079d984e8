#include "analyzer/statement_analyzer.hpp"
#include "core/utils.hpp"

// libpg_query C API
extern "C" {
#include <pg_query.h>
}

#include <nlohmann/json.hpp>

#include <algorithm>

using json = nlohmann::json;

namespace sqlrag {

namespace {

// ============================================================================
// Static lookup tables
// ============================================================================

const std::unordered_set<std::string> AGGREGATE_FUNCTIONS = {
    "count", "sum", "avg", "max", "min",
    "array_agg", "string_agg", "bool_and", "bool_or",
    "every", "json_agg", "jsonb_agg",
    "percentile_cont", "percentile_disc", "mode",
    "stddev", "stddev_pop", "stddev_samp",
    "variance", "var_pop", "var_samp"
};

// ============================================================================
// JSON helpers
// ============================================================================

[[nodiscard]] bool has_key(const json& node, const std::string& key) {
    return node.is_object() && node.contains(key) && !node[key].is_null();
}

[[nodiscard]] std::string get_string(const json& node, const std::string& key) {
    if (node.is_object() && node.contains(key) && node[key].is_string()) {
        return node[key].get<std::string>();
    }
    return {};
}

// String node: {"String": {"sval": "x"}} (older releases use "str")
[[nodiscard]] std::string string_node_value(const json& node) {
    if (!has_key(node, "String")) {
        return {};
    }
    const auto& s = node["String"];
    auto value = get_string(s, "sval");
    return value.empty() ? get_string(s, "str") : value;
}

// ============================================================================
// Parse tree walker
// ============================================================================

class TreeWalker {
public:
    explicit TreeWalker(StatementAnalysis& out) : out_(out) {}

    void walk(const json& node, size_t depth) {
        if (node.is_array()) {
            for (const auto& elem : node) {
                walk(elem, depth);
            }
            return;
        }
        if (!node.is_object()) {
            return;
        }

        for (auto it = node.begin(); it != node.end(); ++it) {
            const auto& key = it.key();
            const auto& value = it.value();

            if (key == "SelectStmt") {
                walk_select(value, depth);
            } else if (key == "RangeVar") {
                record_range_var(value);
            } else if (key == "JoinExpr") {
                ++out_.join_count;
                walk(value, depth);
            } else if (key == "RangeSubselect") {
                ++out_.subquery_count;
                if (has_key(value, "alias")) {
                    const auto alias = utils::to_lower(get_string(value["alias"], "aliasname"));
                    if (!alias.empty()) out_.derived_aliases.insert(alias);
                }
                if (has_key(value, "subquery")) walk(value["subquery"], depth + 1);
            } else if (key == "SubLink") {
                ++out_.subquery_count;
                if (has_key(value, "testexpr")) walk(value["testexpr"], depth);
                if (has_key(value, "subselect")) walk(value["subselect"], depth + 1);
            } else if (key == "FuncCall") {
                record_func_call(value);
                walk(value, depth);
            } else if (key == "ColumnRef") {
                record_column_ref(value);
            } else if (key == "ResTarget") {
                const auto name = utils::to_lower(get_string(value, "name"));
                if (!name.empty()) out_.output_aliases.insert(name);
                if (has_key(value, "val")) walk(value["val"], depth);
            } else if (value.is_object() || value.is_array()) {
                walk(value, depth);
            }
        }
    }

    void finish() {
        // CTE names look like RangeVars in the FROM clause; they are not catalog tables
        for (const auto& name : range_vars_) {
            if (out_.derived_aliases.contains(name)) continue;
            if (std::find(out_.tables.begin(), out_.tables.end(), name) == out_.tables.end()) {
                out_.tables.push_back(name);
            }
        }
    }

private:
    void walk_select(const json& sel, size_t depth) {
        out_.max_subquery_depth = std::max(out_.max_subquery_depth, depth);

        const auto op = get_string(sel, "op");
        if (!op.empty() && op != "SETOP_NONE") {
            ++out_.union_count;
            for (const char* side : {"larg", "rarg"}) {
                if (!has_key(sel, side)) continue;
                const auto& arm = sel[side];
                walk_select(has_key(arm, "SelectStmt") ? arm["SelectStmt"] : arm, depth);
            }
        }

        if (has_key(sel, "withClause") && has_key(sel["withClause"], "ctes")) {
            for (const auto& cte_node : sel["withClause"]["ctes"]) {
                if (!has_key(cte_node, "CommonTableExpr")) continue;
                const auto& cte = cte_node["CommonTableExpr"];
                const auto name = utils::to_lower(get_string(cte, "ctename"));
                if (!name.empty()) out_.derived_aliases.insert(name);
                if (has_key(cte, "ctequery")) walk(cte["ctequery"], depth);
            }
        }

        if (depth == 0) {
            out_.has_where = out_.has_where || has_key(sel, "whereClause");
            out_.has_limit = out_.has_limit || has_key(sel, "limitCount");
        }
        if (has_key(sel, "intoClause")) {
            out_.has_into = true;
        }
        if (has_key(sel, "lockingClause")) {
            out_.has_locking = true;
        }

        static const char* const kClauses[] = {
            "targetList", "fromClause", "whereClause", "groupClause", "havingClause",
            "sortClause", "distinctClause", "windowClause", "limitCount", "limitOffset",
            "valuesLists"
        };
        for (const char* clause : kClauses) {
            if (has_key(sel, clause)) walk(sel[clause], depth);
        }
    }

    void record_range_var(const json& rv) {
        const auto relname = utils::to_lower(get_string(rv, "relname"));
        if (relname.empty()) {
            return;
        }
        range_vars_.push_back(relname);
        out_.alias_to_table.emplace(relname, relname);

        const auto schema = utils::to_lower(get_string(rv, "schemaname"));
        if (!schema.empty()) {
            out_.alias_to_table.emplace(schema + "." + relname, relname);
        }
        if (has_key(rv, "alias")) {
            const auto alias = utils::to_lower(get_string(rv["alias"], "aliasname"));
            if (!alias.empty()) out_.alias_to_table[alias] = relname;
        }
    }

    void record_func_call(const json& fc) {
        std::string name;
        if (has_key(fc, "funcname") && fc["funcname"].is_array() && !fc["funcname"].empty()) {
            name = utils::to_lower(string_node_value(fc["funcname"].back()));
        }
        if (has_key(fc, "over")) {
            out_.has_window = true;
        } else if (AGGREGATE_FUNCTIONS.contains(name)) {
            out_.has_aggregate = true;
        }
    }

    // fields: [{"String":..}] | [{"String":..},{"String":..}] | [..,{"A_Star":{}}]
    void record_column_ref(const json& cr) {
        if (!has_key(cr, "fields") || !cr["fields"].is_array()) {
            return;
        }
        std::vector<std::string> parts;
        for (const auto& field : cr["fields"]) {
            if (has_key(field, "A_Star")) {
                if (parts.empty()) out_.has_star = true;
                return;
            }
            parts.push_back(utils::to_lower(string_node_value(field)));
        }
        if (parts.empty()) {
            return;
        }

        ColumnUse use;
        use.column = parts.back();
        if (parts.size() >= 2) {
            use.qualifier = parts[parts.size() - 2];
        }
        out_.columns.push_back(std::move(use));
    }

    StatementAnalysis& out_;
    std::vector<std::string> range_vars_;
};

} // anonymous namespace

std::string StatementAnalysis::resolve(const std::string& qualifier) const {
    const auto q = utils::to_lower(qualifier);
    if (derived_aliases.contains(q)) {
        return {};
    }
    const auto it = alias_to_table.find(q);
    return it != alias_to_table.end() ? it->second : std::string{};
}

StatementAnalysis StatementAnalyzer::analyze(const std::string& sql) {
    StatementAnalysis result;

    PgQueryParseResult parse_result = pg_query_parse(sql.c_str());
    if (parse_result.error) {
        result.parse_error = parse_result.error->message ? parse_result.error->message : "parse error";
        pg_query_free_parse_result(parse_result);
        return result;
    }

    json root;
    try {
        root = json::parse(parse_result.parse_tree ? parse_result.parse_tree : "{}");
    } catch (const json::parse_error& e) {
        result.parse_error = std::string("unreadable parse tree: ") + e.what();
        pg_query_free_parse_result(parse_result);
        return result;
    }
    pg_query_free_parse_result(parse_result);

    // Structure: {"version": N, "stmts": [{"stmt": {"SelectStmt": {...}}}]}
    if (!has_key(root, "stmts") || !root["stmts"].is_array() || root["stmts"].empty()) {
        result.parse_error = "empty statement";
        return result;
    }

    result.parsed = true;
    result.statement_count = root["stmts"].size();

    const auto& first = root["stmts"][0];
    if (has_key(first, "stmt") && first["stmt"].is_object() && !first["stmt"].empty()) {
        result.statement_type = first["stmt"].begin().key();
    }

    TreeWalker walker(result);
    for (const auto& stmt : root["stmts"]) {
        if (has_key(stmt, "stmt")) {
            walker.walk(stmt["stmt"], 0);
        }
    }
    walker.finish();

    return result;
}

} // namespace sqlrag
