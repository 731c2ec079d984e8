#pragma once

#include "core/types.hpp"

#include <string>

namespace sqlrag {

/**
 * @brief Intent-aware natural-language summary of an execution result
 *
 *   COUNT with one scalar      "There are 42 patients."
 *   other single scalar        "The total amount is 1234.5."
 *   no rows                    "No matching records were found."
 *   otherwise                  "Found N rows." (plus truncation notice)
 * Warnings are appended as "Note: ..." lines.
 */
class AnswerSynthesizer {
public:
    [[nodiscard]] static std::string synthesize(const Query& query,
                                                const ExecutionResult& result,
                                                const std::vector<std::string>& warnings);

private:
    static std::string subject_for(const Query& query);
    static std::string humanize(const std::string& column);
};

} // namespace sqlrag
