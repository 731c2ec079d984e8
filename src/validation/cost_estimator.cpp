#include "validation/cost_estimator.hpp"

#include <cmath>
#include <format>

namespace sqlrag {

RiskLevel CostEstimator::risk_for_score(double score) {
    if (score < 6.0) return RiskLevel::LOW;
    if (score < 10.0) return RiskLevel::MEDIUM;
    if (score < 14.0) return RiskLevel::HIGH;
    return RiskLevel::VERY_HIGH;
}

CostEstimate CostEstimator::estimate(const StatementAnalysis& analysis,
                                     SchemaCache& schema) const {
    CostEstimate est;

    const bool unbounded = !analysis.has_where && !analysis.has_limit && !analysis.has_aggregate;

    for (const auto& table : analysis.tables) {
        const uint64_t rows = schema.row_count(table);
        est.score += std::log10(static_cast<double>(rows) + 1.0);

        if (unbounded && rows >= config_.large_table_rows) {
            ValidationIssue issue;
            issue.severity = Severity::WARNING;
            issue.rule_id = "cost.large_result";
            issue.message = std::format(
                "Table '{}' has about {} rows and is read without a filter, limit or aggregate",
                table, rows);
            issue.suggestion = "Add a WHERE clause or a LIMIT";
            est.issues.push_back(std::move(issue));
        }
    }

    est.score += 2.0 * static_cast<double>(analysis.join_count);
    est.score += 1.5 * static_cast<double>(analysis.subquery_count);
    if (!analysis.has_where) est.score += 3.0;
    if (!analysis.has_limit && !analysis.has_aggregate) est.score += 2.0;

    est.risk = risk_for_score(est.score);

    if (est.risk == RiskLevel::HIGH || est.risk == RiskLevel::VERY_HIGH) {
        ValidationIssue issue;
        issue.severity = Severity::WARNING;
        issue.rule_id = "cost.high_risk";
        issue.message = std::format("Estimated cost score {:.1f} ({} risk)",
            est.score, risk_level_to_string(est.risk));
        issue.suggestion = "Narrow the question with a date range or filter";
        est.issues.push_back(std::move(issue));
    }

    return est;
}

} // namespace sqlrag
