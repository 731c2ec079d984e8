#include "core/types.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <unordered_set>

namespace sqlrag {

// ============================================================================
// Enum <-> string
// ============================================================================

const char* intent_kind_to_string(IntentKind kind) {
    switch (kind) {
        case IntentKind::COUNT:      return "count";
        case IntentKind::AGGREGATE:  return "aggregate";
        case IntentKind::LIST:       return "list";
        case IntentKind::COMPARISON: return "comparison";
        case IntentKind::TREND:      return "trend";
        case IntentKind::LOOKUP:     return "lookup";
        case IntentKind::UNKNOWN:    return "unknown";
    }
    return "unknown";
}

std::optional<IntentKind> parse_intent_kind(std::string_view name) {
    static const std::unordered_map<std::string, IntentKind> lookup = {
        {"count",      IntentKind::COUNT},
        {"aggregate",  IntentKind::AGGREGATE},
        {"list",       IntentKind::LIST},
        {"comparison", IntentKind::COMPARISON},
        {"trend",      IntentKind::TREND},
        {"lookup",     IntentKind::LOOKUP},
        {"unknown",    IntentKind::UNKNOWN},
    };
    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

const char* complexity_tier_to_string(ComplexityTier tier) {
    switch (tier) {
        case ComplexityTier::SIMPLE:   return "simple";
        case ComplexityTier::MODERATE: return "moderate";
        case ComplexityTier::COMPLEX:  return "complex";
    }
    return "unknown";
}

const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::INFO:     return "info";
        case Severity::WARNING:  return "warning";
        case Severity::ERROR:    return "error";
        case Severity::CRITICAL: return "critical";
    }
    return "unknown";
}

const char* risk_level_to_string(RiskLevel risk) {
    switch (risk) {
        case RiskLevel::LOW:       return "low";
        case RiskLevel::MEDIUM:    return "medium";
        case RiskLevel::HIGH:      return "high";
        case RiskLevel::VERY_HIGH: return "very_high";
    }
    return "unknown";
}

const char* context_kind_to_string(ContextKind kind) {
    switch (kind) {
        case ContextKind::TABLE:        return "table";
        case ContextKind::COLUMN:       return "column";
        case ContextKind::RELATIONSHIP: return "relationship";
        case ContextKind::EXAMPLE:      return "example";
        case ContextKind::RULE:         return "rule";
    }
    return "unknown";
}

std::optional<ContextKind> parse_context_kind(std::string_view name) {
    static const std::unordered_map<std::string, ContextKind> lookup = {
        {"table",        ContextKind::TABLE},
        {"column",       ContextKind::COLUMN},
        {"relationship", ContextKind::RELATIONSHIP},
        {"example",      ContextKind::EXAMPLE},
        {"rule",         ContextKind::RULE},
    };
    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "closed";
        case CircuitState::OPEN:      return "open";
        case CircuitState::HALF_OPEN: return "half_open";
    }
    return "unknown";
}

// ============================================================================
// RetrievalContext
// ============================================================================

std::vector<std::string> RetrievalContext::table_names() const {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (const auto& e : elements) {
        if (const auto* t = std::get_if<TablePayload>(&e.payload)) {
            if (seen.insert(t->table).second) {
                names.push_back(t->table);
            }
        }
    }
    return names;
}

double RetrievalContext::mean_score() const {
    if (elements.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& e : elements) {
        sum += e.score;
    }
    return sum / static_cast<double>(elements.size());
}

size_t RetrievalContext::count(ContextKind kind) const {
    return static_cast<size_t>(std::count_if(elements.begin(), elements.end(),
        [kind](const ContextElement& e) { return e.kind() == kind; }));
}

// ============================================================================
// ValidationResult
// ============================================================================

std::vector<std::string> ValidationResult::warnings() const {
    std::vector<std::string> out;
    for (const auto& i : issues) {
        if (i.severity == Severity::WARNING) {
            out.push_back(i.message);
        }
    }
    return out;
}

// ============================================================================
// TableMetadata
// ============================================================================

void TableMetadata::add_column(ColumnMetadata col) {
    column_index[utils::to_lower(col.name)] = columns.size();
    columns.push_back(std::move(col));
}

bool TableMetadata::has_column(const std::string& column) const {
    return column_index.contains(utils::to_lower(column));
}

std::vector<std::string> TableMetadata::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& c : columns) {
        names.push_back(c.name);
    }
    return names;
}

} // namespace sqlrag
