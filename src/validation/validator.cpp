#include "validation/validator.hpp"
#include "core/utils.hpp"

#include <xxhash.h>

#include <algorithm>
#include <format>
#include <iterator>
#include <set>

namespace sqlrag {

namespace {

std::string strip_terminator(const std::string& sql) {
    std::string out = utils::trim(sql);
    while (!out.empty() && out.back() == ';') {
        out.pop_back();
        out = utils::trim(out);
    }
    return out;
}

std::string did_you_mean(const std::vector<std::string>& candidates) {
    if (candidates.empty()) return {};
    return std::format("Did you mean '{}'?", candidates.front());
}

void append(ValidationResult& result, std::vector<ValidationIssue> issues) {
    for (auto& issue : issues) {
        result.add(std::move(issue));
    }
}

} // anonymous namespace

Validator::Validator(std::shared_ptr<SchemaCache> schema)
    : Validator(std::move(schema), Config{}) {}

Validator::Validator(std::shared_ptr<SchemaCache> schema, Config config)
    : schema_(std::move(schema)),
      config_(config),
      cost_(CostEstimator::Config{config.large_table_rows}) {}

ValidationResult Validator::validate(const std::string& sql) {
    validations_.fetch_add(1, std::memory_order_relaxed);

    const std::string statement = strip_terminator(sql);
    const uint64_t hash = XXH3_64bits(statement.data(), statement.size());
    const std::string key = std::format("{:016x}:{}", hash, schema_->version());

    if (auto cached = cache_get(key)) {
        cache_hits_.fetch_add(1, std::memory_order_relaxed);
        return *cached;
    }

    auto result = run_layers(statement);
    if (!result.passed) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
    }
    cache_put(key, result);
    return result;
}

std::vector<ValidationIssue> Validator::screen(const std::string& sql) const {
    const std::string statement = strip_terminator(sql);
    auto issues = injection_.scan(statement);
    const bool critical = std::any_of(issues.begin(), issues.end(),
        [](const ValidationIssue& i) { return i.severity == Severity::CRITICAL; });
    if (!critical) {
        auto ops = operations_.check_text(statement);
        issues.insert(issues.end(), std::make_move_iterator(ops.begin()),
                      std::make_move_iterator(ops.end()));
    }
    return issues;
}

ValidationResult Validator::run_layers(const std::string& sql) {
    ValidationResult result;
    result.statement = sql;

    if (sql.empty()) {
        result.add(ValidationIssue{Severity::ERROR, "syntax.empty", "Statement is empty", std::nullopt, {}});
        result.finalize();
        return result;
    }

    // Layer 1: injection / obfuscation
    append(result, injection_.scan(sql));
    if (result.has_severity(Severity::CRITICAL)) {
        result.finalize();
        return result;
    }

    // Layer 2: operation allow-list (text, then parse tree)
    append(result, operations_.check_text(sql));
    if (result.has_severity(Severity::CRITICAL)) {
        result.finalize();
        return result;
    }

    const auto analysis = StatementAnalyzer::analyze(sql);
    if (!analysis.parsed) {
        result.add(ValidationIssue{Severity::ERROR, "syntax.parse_error",
            std::format("Statement does not parse: {}", analysis.parse_error), std::nullopt, {}});
        result.finalize();
        return result;
    }

    append(result, operations_.check_tree(analysis));
    if (result.has_severity(Severity::CRITICAL)) {
        result.finalize();
        return result;
    }

    // Layer 3: schema existence
    check_schema(analysis, result);

    // Layer 4: complexity ceilings
    check_complexity(analysis, result);

    // Layer 5: cost / size
    auto cost = cost_.estimate(analysis, *schema_);
    result.risk = cost.risk;
    append(result, std::move(cost.issues));

    result.finalize();
    return result;
}

void Validator::check_schema(const StatementAnalysis& analysis, ValidationResult& result) {
    std::vector<std::shared_ptr<const TableMetadata>> known;

    for (const auto& table : analysis.tables) {
        auto meta = schema_->get_table(table);
        if (meta) {
            known.push_back(std::move(meta));
            continue;
        }
        ValidationIssue issue;
        issue.severity = Severity::ERROR;
        issue.rule_id = "schema.unknown_table";
        issue.message = std::format("Table '{}' does not exist", table);
        issue.candidates = schema_->suggest_tables(table, config_.max_suggestions);
        if (!issue.candidates.empty()) issue.suggestion = did_you_mean(issue.candidates);
        result.add(std::move(issue));
    }

    const bool all_tables_known = known.size() == analysis.tables.size();
    std::set<std::pair<std::string, std::string>> reported;

    for (const auto& use : analysis.columns) {
        if (!reported.emplace(use.qualifier, use.column).second) {
            continue;
        }

        if (!use.qualifier.empty()) {
            if (analysis.derived_aliases.contains(use.qualifier)) continue;

            const auto table = analysis.resolve(use.qualifier);
            if (table.empty()) {
                ValidationIssue issue;
                issue.severity = Severity::ERROR;
                issue.rule_id = "schema.unknown_alias";
                issue.message = std::format("'{}' in '{}.{}' is not a table or alias in the FROM clause",
                    use.qualifier, use.qualifier, use.column);
                result.add(std::move(issue));
                continue;
            }

            const auto meta = schema_->get_table(table);
            if (!meta || meta->has_column(use.column)) continue;   // unknown tables already reported

            ValidationIssue issue;
            issue.severity = Severity::ERROR;
            issue.rule_id = "schema.unknown_column";
            issue.message = std::format("Column '{}' does not exist in table '{}'", use.column, meta->name);
            issue.candidates = schema_->suggest_columns(meta->name, use.column, config_.max_suggestions);
            if (!issue.candidates.empty()) issue.suggestion = did_you_mean(issue.candidates);
            result.add(std::move(issue));
            continue;
        }

        if (analysis.output_aliases.contains(use.column)) continue;
        if (!all_tables_known || known.empty()) continue;
        // Columns of CTEs and derived tables are not in the catalog
        if (!analysis.derived_aliases.empty()) continue;

        bool found = false;
        std::vector<std::string> all_columns;
        for (const auto& meta : known) {
            if (meta->has_column(use.column)) {
                found = true;
                break;
            }
            for (auto& name : meta->column_names()) {
                all_columns.push_back(std::move(name));
            }
        }
        if (found) continue;

        ValidationIssue issue;
        issue.severity = Severity::ERROR;
        issue.rule_id = "schema.unknown_column";
        issue.message = std::format("Column '{}' does not exist in any referenced table", use.column);
        issue.candidates = utils::rank_similar(use.column, all_columns, config_.max_suggestions);
        if (!issue.candidates.empty()) issue.suggestion = did_you_mean(issue.candidates);
        result.add(std::move(issue));
    }
}

void Validator::check_complexity(const StatementAnalysis& analysis, ValidationResult& result) const {
    const auto warn = [&result](const char* rule_id, std::string message) {
        result.add(ValidationIssue{Severity::WARNING, rule_id, std::move(message), std::nullopt, {}});
    };

    if (analysis.join_count > config_.max_joins) {
        warn("complexity.joins", std::format("{} joins exceeds the limit of {}",
            analysis.join_count, config_.max_joins));
    }
    if (analysis.max_subquery_depth > config_.max_subquery_depth) {
        warn("complexity.subquery_depth", std::format("Subquery depth {} exceeds the limit of {}",
            analysis.max_subquery_depth, config_.max_subquery_depth));
    }
    if (analysis.union_count > config_.max_unions) {
        warn("complexity.unions", std::format("{} set operations exceeds the limit of {}",
            analysis.union_count, config_.max_unions));
    }
}

Validator::Stats Validator::get_stats() const {
    return {
        .validations = validations_.load(std::memory_order_relaxed),
        .cache_hits = cache_hits_.load(std::memory_order_relaxed),
        .rejected = rejected_.load(std::memory_order_relaxed),
    };
}

// ============================================================================
// Validation cache (single LRU list)
// ============================================================================

std::optional<ValidationResult> Validator::cache_get(const std::string& key) {
    std::lock_guard lock(cache_mutex_);
    const auto it = cache_map_.find(key);
    if (it == cache_map_.end()) return std::nullopt;

    if (std::chrono::steady_clock::now() >= it->second->expires_at) {
        lru_list_.erase(it->second);
        cache_map_.erase(it);
        return std::nullopt;
    }

    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return it->second->result;
}

void Validator::cache_put(const std::string& key, const ValidationResult& result) {
    if (config_.cache_max_entries == 0) return;

    std::lock_guard lock(cache_mutex_);
    const auto expires = std::chrono::steady_clock::now() + config_.cache_ttl;

    const auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
        it->second->result = result;
        it->second->expires_at = expires;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    while (cache_map_.size() >= config_.cache_max_entries && !lru_list_.empty()) {
        cache_map_.erase(lru_list_.back().key);
        lru_list_.pop_back();
    }

    lru_list_.emplace_front(CacheEntry{key, result, expires});
    cache_map_[key] = lru_list_.begin();
}

} // namespace sqlrag
