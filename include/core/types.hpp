#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sqlrag {

// ============================================================================
// Enums
// ============================================================================

enum class IntentKind : uint8_t {
    COUNT,
    AGGREGATE,
    LIST,
    COMPARISON,
    TREND,
    LOOKUP,
    UNKNOWN
};

enum class ComplexityTier : uint8_t {
    SIMPLE,
    MODERATE,
    COMPLEX
};

enum class Severity : uint8_t {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

enum class RiskLevel : uint8_t {
    LOW,
    MEDIUM,
    HIGH,
    VERY_HIGH
};

// Order matches the alternatives of ContextPayload
enum class ContextKind : uint8_t {
    TABLE,
    COLUMN,
    RELATIONSHIP,
    EXAMPLE,
    RULE
};

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

/**
 * @brief Failure classification for circuit breaker accounting
 *
 * INFRASTRUCTURE failures (connection loss, timeouts, deadlocks) count
 * toward the threshold. APPLICATION failures (bad SQL, permissions) do not:
 * the datastore answered, it is healthy.
 */
enum class FailureCategory {
    INFRASTRUCTURE,
    APPLICATION
};

[[nodiscard]] const char* intent_kind_to_string(IntentKind kind);
[[nodiscard]] std::optional<IntentKind> parse_intent_kind(std::string_view name);
[[nodiscard]] const char* complexity_tier_to_string(ComplexityTier tier);
[[nodiscard]] const char* severity_to_string(Severity severity);
[[nodiscard]] const char* risk_level_to_string(RiskLevel risk);
[[nodiscard]] const char* context_kind_to_string(ContextKind kind);
[[nodiscard]] std::optional<ContextKind> parse_context_kind(std::string_view name);
[[nodiscard]] const char* circuit_state_to_string(CircuitState state);

// ============================================================================
// Query
// ============================================================================

namespace entity {
    inline constexpr const char* kDate       = "date";
    inline constexpr const char* kNumber     = "number";
    inline constexpr const char* kComparator = "comparator";
    inline constexpr const char* kTableHint  = "table_hint";
    inline constexpr const char* kMetric     = "metric";
} // namespace entity

using EntityMap = std::unordered_map<std::string, std::vector<std::string>>;

struct Query {
    std::string id;
    std::string session_id;
    std::string text;
    std::string normalized_text;
    std::chrono::system_clock::time_point timestamp;
    IntentKind intent = IntentKind::UNKNOWN;
    double confidence = 0.0;
    EntityMap entities;

    [[nodiscard]] bool has_entity(const std::string& kind) const {
        const auto it = entities.find(kind);
        return it != entities.end() && !it->second.empty();
    }
};

// ============================================================================
// Context elements (tagged variant over the closed set of kinds)
// ============================================================================

struct TablePayload {
    std::string table;
    std::string description;
    uint64_t row_count = 0;
    std::vector<std::string> related_tables;
};

struct ColumnPayload {
    std::string table;
    std::string column;
    std::string data_type;
};

struct RelationshipPayload {
    std::string from_table;
    std::string from_column;
    std::string to_table;
    std::string to_column;
};

struct ExamplePayload {
    std::string question;
    std::string statement;
    IntentKind intent = IntentKind::UNKNOWN;
};

struct RulePayload {
    std::string text;
    std::vector<IntentKind> intents;   // empty = applies to every intent
};

using ContextPayload = std::variant<
    TablePayload, ColumnPayload, RelationshipPayload, ExamplePayload, RulePayload>;

struct ContextElement {
    std::string id;
    std::string content;
    ContextPayload payload;
    double score = 0.0;

    [[nodiscard]] ContextKind kind() const {
        return static_cast<ContextKind>(payload.index());
    }
};

struct RetrievalContext {
    std::string query_text;
    std::vector<ContextElement> elements;
    size_t total_tokens = 0;
    bool degraded = false;

    [[nodiscard]] std::vector<std::string> table_names() const;
    [[nodiscard]] double mean_score() const;
    [[nodiscard]] size_t count(ContextKind kind) const;
};

// ============================================================================
// Generation / validation / execution
// ============================================================================

struct GeneratedStatement {
    std::string text;
    std::string dialect = "postgresql";
    ComplexityTier tier = ComplexityTier::SIMPLE;
    std::vector<std::string> referenced_tables;
    uint32_t attempt = 1;
    double confidence = 0.0;
};

struct ValidationIssue {
    Severity severity = Severity::INFO;
    std::string rule_id;
    std::string message;
    std::optional<std::string> suggestion;
    std::vector<std::string> candidates;   // similarity-ranked, best first
};

struct ValidationResult {
    bool passed = false;
    std::vector<ValidationIssue> issues;
    std::string statement;
    RiskLevel risk = RiskLevel::LOW;

    void add(ValidationIssue issue) { issues.push_back(std::move(issue)); }

    [[nodiscard]] bool has_severity(Severity severity) const {
        for (const auto& i : issues) {
            if (i.severity == severity) return true;
        }
        return false;
    }

    [[nodiscard]] bool has_blocking() const {
        return has_severity(Severity::ERROR) || has_severity(Severity::CRITICAL);
    }

    // Recomputes passed from the issue list
    void finalize() { passed = !has_blocking(); }

    [[nodiscard]] std::vector<std::string> warnings() const;
};

struct ExecutionResult {
    bool success = false;
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;
    uint64_t row_count = 0;
    std::optional<uint64_t> estimated_total_rows;
    std::chrono::microseconds execution_time{0};
    bool complete = true;
    std::vector<std::string> warnings;
    uint32_t attempts = 0;

    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;
};

// ============================================================================
// Pipeline outcomes
// ============================================================================

struct StageTimings {
    std::chrono::microseconds intent{0};
    std::chrono::microseconds retrieval{0};
    std::chrono::microseconds generation{0};
    std::chrono::microseconds execution{0};
};

struct Response {
    std::string query_id;
    std::string statement;
    ExecutionResult execution;
    std::string answer;
    std::chrono::microseconds latency{0};
    bool cache_hit = false;
    IntentKind intent = IntentKind::UNKNOWN;
    std::vector<std::string> warnings;   // validation + execution warnings
    StageTimings timings;
};

struct ClarificationRequest {
    std::string query_id;
    double confidence = 0.0;
    std::vector<std::string> questions;
};

struct ErrorResult {
    ErrorKind kind = ErrorKind::INTERNAL_ERROR;
    std::string message;
    std::vector<std::string> suggestions;
    std::string trace_id;
};

using Outcome = std::variant<Response, ClarificationRequest, ErrorResult>;

struct Turn {
    Query query;
    Response response;
};

// ============================================================================
// Schema metadata
// ============================================================================

struct ColumnMetadata {
    std::string name;
    std::string type;
    bool nullable = true;
    bool is_primary_key = false;

    ColumnMetadata() = default;
    ColumnMetadata(std::string n, std::string t, bool null = true, bool pk = false)
        : name(std::move(n)), type(std::move(t)), nullable(null), is_primary_key(pk) {}
};

struct ForeignKey {
    std::string column;
    std::string ref_table;
    std::string ref_column;
};

struct TableMetadata {
    std::string schema = "public";
    std::string name;
    std::string description;
    uint64_t row_count_estimate = 0;
    std::vector<ColumnMetadata> columns;
    std::unordered_map<std::string, size_t> column_index;   // lower-case name -> index
    std::vector<ForeignKey> foreign_keys;

    void add_column(ColumnMetadata col);

    [[nodiscard]] bool has_column(const std::string& column) const;
    [[nodiscard]] std::vector<std::string> column_names() const;
};

// Keyed by lower-case unqualified table name
using SchemaMap = std::unordered_map<std::string, std::shared_ptr<TableMetadata>>;

struct CircuitBreakerStats {
    CircuitState state = CircuitState::CLOSED;
    uint64_t failure_count = 0;
    uint64_t success_count = 0;
    uint64_t infrastructure_failure_count = 0;
    uint64_t application_failure_count = 0;
    uint64_t rejected_count = 0;
    uint64_t transitions_to_open = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure;
    std::optional<std::chrono::system_clock::time_point> opened_at;
};

} // namespace sqlrag
