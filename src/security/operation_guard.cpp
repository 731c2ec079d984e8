#include "security/operation_guard.hpp"
#include "security/injection_detector.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace sqlrag {

namespace {

ValidationIssue critical(const char* rule_id, std::string message) {
    ValidationIssue issue;
    issue.severity = Severity::CRITICAL;
    issue.rule_id = rule_id;
    issue.message = std::move(message);
    return issue;
}

std::string_view leading_keyword(std::string_view sql) {
    size_t i = 0;
    while (i < sql.size() && (std::isspace(static_cast<unsigned char>(sql[i])) || sql[i] == '(')) {
        ++i;
    }
    size_t j = i;
    while (j < sql.size() && std::isalpha(static_cast<unsigned char>(sql[j]))) {
        ++j;
    }
    return sql.substr(i, j - i);
}

} // anonymous namespace

OperationGuard::OperationGuard()
    : forbidden_(R"(\b(insert|update|delete|merge|drop|alter|create|truncate|grant|revoke|copy|)"
                 R"(vacuum|reindex|cluster|lock|call|do|set|reset|comment|refresh|into)\b)",
                 std::regex::ECMAScript | std::regex::icase | std::regex::optimize),
      locking_(R"(\bfor\s+(no\s+key\s+)?(update|share|key\s+share)\b)",
               std::regex::ECMAScript | std::regex::icase | std::regex::optimize) {}

std::vector<ValidationIssue> OperationGuard::check_text(std::string_view sql) const {
    std::vector<ValidationIssue> issues;
    const std::string masked = InjectionDetector::mask_literals(sql);

    const auto keyword = utils::to_upper(leading_keyword(masked));
    if (keyword != "SELECT" && keyword != "WITH") {
        issues.push_back(critical("operation.not_read_only",
            std::format("Only SELECT statements are allowed (found '{}')",
                keyword.empty() ? std::string("nothing") : keyword)));
    }

    std::smatch match;
    if (std::regex_search(masked, match, forbidden_)) {
        issues.push_back(critical("operation.forbidden_keyword",
            std::format("Keyword '{}' is not allowed in a read-only query",
                utils::to_upper(match.str(1)))));
    }

    if (std::regex_search(masked, locking_)) {
        issues.push_back(critical("operation.locking_clause",
            "Row-locking clauses are not allowed"));
    }

    return issues;
}

std::vector<ValidationIssue> OperationGuard::check_tree(const StatementAnalysis& analysis) const {
    std::vector<ValidationIssue> issues;
    if (!analysis.parsed) {
        return issues;
    }

    if (analysis.statement_count != 1) {
        issues.push_back(critical("operation.multiple_statements",
            std::format("Expected one statement, found {}", analysis.statement_count)));
    }
    if (analysis.statement_type != "SelectStmt") {
        issues.push_back(critical("operation.not_read_only",
            std::format("Statement type {} is not a query", analysis.statement_type)));
    }
    if (analysis.has_into) {
        issues.push_back(critical("operation.select_into", "SELECT ... INTO creates a table"));
    }
    if (analysis.has_locking) {
        issues.push_back(critical("operation.locking_clause", "Row-locking clauses are not allowed"));
    }
    return issues;
}

} // namespace sqlrag
