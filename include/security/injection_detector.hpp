#pragma once

#include "core/types.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace sqlrag {

/**
 * @brief Regex-based injection and obfuscation scan
 *
 * Runs over the statement with string literals, dollar-quoted bodies and
 * quoted identifiers masked, so data values cannot trigger or hide a match.
 * Every match is a CRITICAL issue.
 */
class InjectionDetector {
public:
    InjectionDetector();

    [[nodiscard]] std::vector<ValidationIssue> scan(std::string_view sql) const;

    /**
     * @brief Replace the contents of '...', "..." and $tag$...$tag$ with nothing
     * The delimiters stay so token boundaries are preserved.
     */
    [[nodiscard]] static std::string mask_literals(std::string_view sql);

private:
    struct Pattern {
        std::string rule_id;
        std::string message;
        std::regex regex;
    };

    std::vector<Pattern> patterns_;
};

} // namespace sqlrag
