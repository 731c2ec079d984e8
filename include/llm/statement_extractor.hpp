#pragma once

#include "core/error.hpp"

#include <string>

namespace sqlrag {

/**
 * @brief Pulls a single SQL statement out of a raw model completion
 *
 * Strips markdown fences and a "SQL Query:" prefix, starts at the first
 * statement keyword of any kind (reads, writes, DDL, maintenance) and ends
 * at the first top-level semicolon, a closing fence, or a blank line
 * followed by narrative. Non-read statements are returned as-is so the
 * validator can reject them.
 *
 * Errors: UNANSWERABLE for a NO_SQL completion, GENERATION_FAILED when the
 * completion is empty or has no statement.
 */
class StatementExtractor {
public:
    [[nodiscard]] static Result<std::string> extract(const std::string& completion);

private:
    static std::string unfence(const std::string& text);
    static size_t statement_end(const std::string& text, size_t start);
    static bool is_continuation(const std::string& line);
};

} // namespace sqlrag
