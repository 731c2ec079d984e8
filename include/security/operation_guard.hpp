#pragma once

#include "analyzer/statement_analyzer.hpp"
#include "core/types.hpp"

#include <regex>
#include <string_view>
#include <vector>

namespace sqlrag {

/**
 * @brief Read-only allow-list
 *
 * Text checks run on the literal-masked statement: the leading keyword
 * must be SELECT or WITH and no data-modifying or administrative keyword
 * may appear anywhere. When a parse tree is available it must hold a
 * single SelectStmt without INTO or a locking clause.
 */
class OperationGuard {
public:
    OperationGuard();

    [[nodiscard]] std::vector<ValidationIssue> check_text(std::string_view sql) const;

    [[nodiscard]] std::vector<ValidationIssue> check_tree(const StatementAnalysis& analysis) const;

private:
    std::regex forbidden_;
    std::regex locking_;
};

} // namespace sqlrag
