#include "security/injection_detector.hpp"

#include <cctype>

namespace sqlrag {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

} // anonymous namespace

InjectionDetector::InjectionDetector() {
    const auto add = [this](const char* rule_id, const char* message, const char* pattern) {
        patterns_.push_back(Pattern{rule_id, message, std::regex(pattern, kFlags)});
    };

    add("injection.statement_chaining",
        "Multiple statements are not allowed",
        R"(;\s*\S)");
    add("injection.comment",
        "SQL comments are not allowed",
        R"(--|/\*)");
    add("injection.dynamic_execution",
        "Dynamic SQL execution is not allowed",
        R"(\b(exec|execute|prepare|deallocate|sp_executesql|dblink\w*)\b)");
    add("injection.privileged_function",
        "Call to a privileged server function",
        R"(\b(xp_\w+|pg_read_file|pg_read_binary_file|pg_ls_dir|pg_stat_file|pg_sleep\w*|)"
        R"(pg_terminate_backend|pg_cancel_backend|pg_reload_conf|set_config|lo_import|lo_export)\s*\()");
    add("injection.copy_program",
        "COPY ... PROGRAM is not allowed",
        R"(\bcopy\b[\s\S]*\bprogram\b)");
    add("injection.tautology",
        "Tautological predicate typical of injected filters",
        R"(\bor\s+(\d+)\s*=\s*\1\b|\bor\s+''\s*=\s*''|\bor\s+true\b)");
    add("injection.char_obfuscation",
        "Character-code obfuscation",
        R"(\bchr\s*\(\s*\d+\s*\)\s*\|\||\\x[0-9a-f]{2})");
}

std::string InjectionDetector::mask_literals(std::string_view sql) {
    std::string out;
    out.reserve(sql.size());

    size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];

        if (c == '\'' || c == '"') {
            // Quoted run; a doubled quote is an escaped quote
            out += c;
            ++i;
            while (i < sql.size()) {
                if (sql[i] == c) {
                    if (i + 1 < sql.size() && sql[i + 1] == c) {
                        i += 2;
                        continue;
                    }
                    break;
                }
                ++i;
            }
            if (i < sql.size()) {
                out += c;
                ++i;
            }
            continue;
        }

        if (c == '$') {
            // $tag$ ... $tag$ (tag may be empty)
            size_t j = i + 1;
            while (j < sql.size() && (std::isalnum(static_cast<unsigned char>(sql[j])) || sql[j] == '_')) {
                ++j;
            }
            if (j < sql.size() && sql[j] == '$') {
                const auto tag = sql.substr(i, j - i + 1);
                const auto close = sql.find(tag, j + 1);
                out += tag;
                out += tag;
                i = (close == std::string_view::npos) ? sql.size() : close + tag.size();
                continue;
            }
        }

        out += c;
        ++i;
    }
    return out;
}

std::vector<ValidationIssue> InjectionDetector::scan(std::string_view sql) const {
    std::string masked = mask_literals(sql);

    // One trailing terminator is harmless
    while (!masked.empty() && std::isspace(static_cast<unsigned char>(masked.back()))) {
        masked.pop_back();
    }
    if (!masked.empty() && masked.back() == ';') {
        masked.pop_back();
    }

    std::vector<ValidationIssue> issues;
    for (const auto& pattern : patterns_) {
        if (std::regex_search(masked, pattern.regex)) {
            ValidationIssue issue;
            issue.severity = Severity::CRITICAL;
            issue.rule_id = pattern.rule_id;
            issue.message = pattern.message;
            issues.push_back(std::move(issue));
        }
    }
    return issues;
}

} // namespace sqlrag
