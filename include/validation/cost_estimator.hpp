#pragma once

#include "analyzer/schema_cache.hpp"
#include "analyzer/statement_analyzer.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <vector>

namespace sqlrag {

struct CostEstimate {
    double score = 0.0;
    RiskLevel risk = RiskLevel::LOW;
    std::vector<ValidationIssue> issues;
};

/**
 * @brief Heuristic cost/size scoring from structure and row estimates
 *
 *   score = sum(log10(rows + 1)) + 2*joins + 1.5*subqueries
 *         + 3 (no WHERE) + 2 (no LIMIT and no aggregate)
 *
 * Risk bands: low < 6 <= medium < 10 <= high < 14 <= very high.
 */
class CostEstimator {
public:
    struct Config {
        uint64_t large_table_rows = 1'000'000;
    };

    CostEstimator() = default;
    explicit CostEstimator(Config config) : config_(config) {}

    [[nodiscard]] CostEstimate estimate(const StatementAnalysis& analysis,
                                        SchemaCache& schema) const;

    [[nodiscard]] static RiskLevel risk_for_score(double score);

private:
    Config config_;
};

} // namespace sqlrag
