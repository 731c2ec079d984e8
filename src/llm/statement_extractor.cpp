#include "llm/statement_extractor.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>
#include <regex>
#include <string_view>

namespace sqlrag {

namespace {

constexpr std::string_view kFence = "```";
constexpr std::string_view kNoSql = "NO_SQL";

// Words that may begin a line inside a multi-line statement
constexpr std::array<std::string_view, 27> kContinuationWords = {
    "select", "from", "where", "group", "order", "having", "limit", "offset",
    "join", "left", "right", "inner", "outer", "full", "cross", "on", "and",
    "or", "union", "intersect", "except", "with", "window", "fetch", "case",
    "when", "as"
};

// Any statement kind starts a statement, not just reads; the allow-list
// downstream decides what may run.
const std::regex& statement_start_regex() {
    // WITH only counts when it opens a CTE, so "with" in prose is skipped.
    // Verbs that also occur in prose need their SQL object to match.
    static const std::regex re(
        R"(\bselect\b)"
        R"(|\bwith\s+(recursive\s+)?\w+\s*(\([^)]*\)\s*)?as\s*(not\s+)?(materialized\s*)?\()"
        R"(|\b(insert|merge)\s+into\b|\bdelete\s+from\b|\bupdate\s+[\w."]+\s+set\b)"
        R"(|\b(drop|alter|create(\s+or\s+replace)?)\s+(temp(orary)?\s+|unique\s+|unlogged\s+|materialized\s+)?)"
        R"((table|view|index|schema|database|function|procedure|trigger|role|user|sequence|extension|type)\b)"
        R"(|\btruncate\s+(table\s+)?[\w."]+)"
        R"(|\b(grant|revoke)\s+(select|insert|update|delete|all|usage|execute)\b)"
        R"(|\bcopy\s+[\w."]+(\s*\([^)]*\))?\s+(from|to)\b)"
        R"(|\bvacuum\b|\breindex\b|\bcall\s+\w+\s*\()",
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return re;
}

} // anonymous namespace

std::string StatementExtractor::unfence(const std::string& text) {
    const size_t open = text.find(kFence);
    if (open == std::string::npos) {
        return text;
    }
    // Skip the language tag on the opening fence line
    size_t body = text.find('\n', open);
    if (body == std::string::npos) {
        return text.substr(open + kFence.size());
    }
    ++body;
    const size_t close = text.find(kFence, body);
    return text.substr(body, close == std::string::npos ? std::string::npos : close - body);
}

bool StatementExtractor::is_continuation(const std::string& line) {
    const auto trimmed = utils::trim(line);
    if (trimmed.empty()) return true;
    const char first = trimmed.front();
    if (first == ')' || first == '(' || first == ',') return true;

    size_t len = 0;
    while (len < trimmed.size() && (std::isalnum(static_cast<unsigned char>(trimmed[len])) ||
                                    trimmed[len] == '_')) {
        ++len;
    }
    const auto word = utils::to_lower(trimmed.substr(0, len));
    for (const auto w : kContinuationWords) {
        if (word == w) return true;
    }
    return false;
}

size_t StatementExtractor::statement_end(const std::string& text, size_t start) {
    bool in_single = false;
    bool in_double = false;
    int depth = 0;

    for (size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (in_single) {
            if (c == '\'') in_single = false;
            continue;
        }
        if (in_double) {
            if (c == '"') in_double = false;
            continue;
        }
        switch (c) {
            case '\'': in_single = true; break;
            case '"':  in_double = true; break;
            case '(':  ++depth; break;
            case ')':  if (depth > 0) --depth; break;
            case ';':
                if (depth == 0) return i;
                break;
            case '`':
                if (text.compare(i, kFence.size(), kFence) == 0) return i;
                break;
            case '\n': {
                if (depth != 0) break;
                // Blank line: stop if what follows reads as prose
                size_t j = i + 1;
                while (j < text.size() && (text[j] == ' ' || text[j] == '\t' || text[j] == '\r')) ++j;
                if (j >= text.size() || text[j] != '\n') break;
                while (j < text.size() && std::isspace(static_cast<unsigned char>(text[j]))) ++j;
                if (j >= text.size()) return i;
                const size_t eol = text.find('\n', j);
                if (!is_continuation(text.substr(j, eol == std::string::npos ? std::string::npos : eol - j))) {
                    return i;
                }
                break;
            }
            default: break;
        }
    }
    return text.size();
}

Result<std::string> StatementExtractor::extract(const std::string& completion) {
    std::string text = utils::trim(unfence(utils::trim(completion)));
    if (text.empty()) {
        return Result<std::string>::error(ErrorKind::GENERATION_FAILED,
            "The model returned an empty completion",
            {"Rephrase the question", "Check that the generative backend is healthy"});
    }

    if (utils::to_upper(text).starts_with("SQL QUERY:")) {
        text = utils::trim(text.substr(10));
    }

    std::smatch match;
    if (!std::regex_search(text, match, statement_start_regex())) {
        if (text.find(kNoSql) != std::string::npos) {
            return Result<std::string>::error(ErrorKind::UNANSWERABLE,
                "The question cannot be answered from the available schema",
                {"Ask about data that exists in the database", "Name the table or metric explicitly"});
        }
        return Result<std::string>::error(ErrorKind::GENERATION_FAILED,
            "The model response did not contain a SQL statement",
            {"Rephrase the question"});
    }

    // NO_SQL before any statement keyword wins over a stray "with" in prose
    const auto start = static_cast<size_t>(match.position(0));
    const size_t no_sql = text.find(kNoSql);
    if (no_sql != std::string::npos && no_sql < start) {
        return Result<std::string>::error(ErrorKind::UNANSWERABLE,
            "The question cannot be answered from the available schema",
            {"Ask about data that exists in the database", "Name the table or metric explicitly"});
    }

    const size_t end = statement_end(text, start);
    auto statement = utils::trim(text.substr(start, end - start));
    if (statement.empty()) {
        return Result<std::string>::error(ErrorKind::GENERATION_FAILED,
            "The model response did not contain a SQL statement", {"Rephrase the question"});
    }
    return Result<std::string>::ok(std::move(statement));
}

} // namespace sqlrag
