#pragma once

#include "analyzer/schema_cache.hpp"
#include "analyzer/statement_analyzer.hpp"
#include "core/types.hpp"
#include "security/injection_detector.hpp"
#include "security/operation_guard.hpp"
#include "validation/cost_estimator.hpp"

#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sqlrag {

/**
 * @brief Multi-layer statement validator
 *
 * Layers run in order:
 *   1. injection / obfuscation patterns   (critical, short-circuits)
 *   2. read-only operation allow-list     (critical, short-circuits)
 *   3. schema existence                   (error, with ranked candidates)
 *   4. complexity ceilings                (warning)
 *   5. cost / result-size heuristic       (warning)
 *
 * passed is false whenever any issue is ERROR or CRITICAL.
 * Results are cached per (statement hash, schema version).
 */
class Validator {
public:
    struct Config {
        size_t max_joins = 5;
        size_t max_subquery_depth = 3;
        size_t max_unions = 3;
        uint64_t large_table_rows = 1'000'000;
        size_t max_suggestions = 3;
        size_t cache_max_entries = 1000;
        std::chrono::seconds cache_ttl{600};
    };

    explicit Validator(std::shared_ptr<SchemaCache> schema);
    Validator(std::shared_ptr<SchemaCache> schema, Config config);

    [[nodiscard]] ValidationResult validate(const std::string& sql);

    /**
     * @brief Layers 1 and 2 only, on text
     *
     * Needs no schema, so callers can reject a statement before any
     * schema-driven retry. Returns the injection findings, or the
     * allow-list findings when injection found nothing critical.
     */
    [[nodiscard]] std::vector<ValidationIssue> screen(const std::string& sql) const;

    struct Stats {
        uint64_t validations;
        uint64_t cache_hits;
        uint64_t rejected;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    ValidationResult run_layers(const std::string& sql);
    void check_schema(const StatementAnalysis& analysis, ValidationResult& result);
    void check_complexity(const StatementAnalysis& analysis, ValidationResult& result) const;

    struct CacheEntry {
        std::string key;
        ValidationResult result;
        std::chrono::steady_clock::time_point expires_at;
    };

    std::optional<ValidationResult> cache_get(const std::string& key);
    void cache_put(const std::string& key, const ValidationResult& result);

    std::shared_ptr<SchemaCache> schema_;
    Config config_;
    InjectionDetector injection_;
    OperationGuard operations_;
    CostEstimator cost_;

    mutable std::mutex cache_mutex_;
    std::list<CacheEntry> lru_list_;
    std::unordered_map<std::string, std::list<CacheEntry>::iterator> cache_map_;

    std::atomic<uint64_t> validations_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace sqlrag
