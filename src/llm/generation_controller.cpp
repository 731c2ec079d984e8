#include "llm/generation_controller.hpp"
#include "llm/statement_extractor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace sqlrag {

namespace {

bool is_schema_issue(const ValidationIssue& issue) {
    return issue.rule_id.starts_with("schema.") &&
           (issue.severity == Severity::ERROR || issue.severity == Severity::CRITICAL);
}

const ValidationIssue* first_with(const ValidationResult& result, Severity severity) {
    for (const auto& issue : result.issues) {
        if (issue.severity == severity) return &issue;
    }
    return nullptr;
}

std::vector<std::string> blocking_messages(const ValidationResult& result) {
    std::vector<std::string> out;
    for (const auto& issue : result.issues) {
        if (issue.severity == Severity::ERROR || issue.severity == Severity::CRITICAL) {
            out.push_back(issue.message);
        }
    }
    return out;
}

// Share of referenced tables that retrieval put in front of the model
double schema_match_ratio(const StatementAnalysis& analysis, const RetrievalContext& context) {
    if (analysis.tables.empty()) return 1.0;
    std::unordered_set<std::string> retrieved;
    for (const auto& name : context.table_names()) {
        retrieved.insert(utils::to_lower(name));
    }
    size_t matched = 0;
    for (const auto& table : analysis.tables) {
        if (retrieved.contains(utils::to_lower(table))) ++matched;
    }
    return static_cast<double>(matched) / static_cast<double>(analysis.tables.size());
}

} // anonymous namespace

GenerationController::GenerationController(std::shared_ptr<IGenerativeBackend> backend,
                                           std::shared_ptr<ISchemaProvider> schema,
                                           std::shared_ptr<Validator> validator,
                                           Config config)
    : backend_(std::move(backend)),
      schema_(std::move(schema)),
      validator_(std::move(validator)),
      config_(std::move(config)),
      prompt_builder_(config_.prompt) {
    if (config_.max_attempts == 0) {
        config_.max_attempts = 1;
    }
}

ComplexityTier GenerationController::tier_for(const StatementAnalysis& analysis) {
    const size_t joins = analysis.join_count;
    const size_t subqueries = analysis.subquery_count;

    if (joins == 0 && subqueries == 0 && !analysis.has_window) {
        return ComplexityTier::SIMPLE;
    }
    if (joins >= 3 || subqueries >= 2 || analysis.has_window || (joins >= 2 && subqueries >= 1)) {
        return ComplexityTier::COMPLEX;
    }
    return ComplexityTier::MODERATE;
}

double GenerationController::confidence_for(double schema_match_ratio,
                                            double mean_similarity,
                                            ComplexityTier tier) {
    double factor = 1.0;
    switch (tier) {
        case ComplexityTier::SIMPLE:   factor = 1.0; break;
        case ComplexityTier::MODERATE: factor = 0.8; break;
        case ComplexityTier::COMPLEX:  factor = 0.6; break;
    }
    const double c = 0.5 * std::clamp(schema_match_ratio, 0.0, 1.0) +
                     0.3 * std::clamp(mean_similarity, 0.0, 1.0) +
                     0.2 * factor;
    return std::clamp(c, 0.0, 1.0);
}

std::vector<std::string> GenerationController::missing_tables(const StatementAnalysis& analysis,
                                                              std::vector<std::string>& candidates) {
    std::vector<std::string> problems;
    for (const auto& table : analysis.tables) {
        if (schema_->table_exists(table)) continue;

        auto similar = schema_->suggest_similar(table, config_.max_candidates);
        for (const auto& s : similar) {
            if (std::find(candidates.begin(), candidates.end(), s) == candidates.end()) {
                candidates.push_back(s);
            }
        }
        problems.push_back(similar.empty()
            ? std::format("table {} not found", table)
            : std::format("table {} not found; valid candidates: {}", table, utils::join(similar, ", ")));
    }
    return problems;
}

std::string GenerationController::schema_correction(const ValidationResult& validation) {
    std::vector<std::string> lines;
    for (const auto& issue : validation.issues) {
        if (!is_schema_issue(issue)) continue;
        if (issue.candidates.empty()) {
            lines.push_back(issue.message);
        } else {
            lines.push_back(std::format("{}; valid candidates: {}",
                issue.message, utils::join(issue.candidates, ", ")));
        }
    }
    return utils::join(lines, "\n");
}

Result<GenerationOutcome> GenerationController::generate(const Query& query,
                                                         const RetrievalContext& context,
                                                         const std::vector<Turn>& recent_turns,
                                                         const Deadline& deadline) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    const auto fail = [this](ErrorKind kind, std::string message,
                             std::vector<std::string> suggestions = {}) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return Result<GenerationOutcome>::error(kind, std::move(message), std::move(suggestions));
    };

    const auto reject = [&fail](const ValidationIssue& critical) {
        utils::log::warn(std::format("Generated statement rejected [{}]: {}",
            critical.rule_id, critical.message));
        return fail(ErrorKind::SECURITY_VIOLATION,
            std::format("The generated query was blocked: {}", critical.message),
            {"Only read-only questions about the data are supported"});
    };

    AttemptState state;
    while (state.attempt < config_.max_attempts) {
        ++state.attempt;
        attempts_.fetch_add(1, std::memory_order_relaxed);
        const bool can_retry = state.attempt < config_.max_attempts;

        if (deadline.expired() || deadline.cancelled()) {
            return fail(ErrorKind::GENERATION_TIMEOUT,
                "Statement generation ran out of time",
                {"Try again", "Ask a simpler question"});
        }

        GenerationRequest request{
            prompt_builder_.build(query, context, recent_turns, state.correction),
            config_.stop,
            config_.max_tokens,
            config_.temperature
        };

        auto completion = backend_->generate(request, deadline);
        if (completion.is_error()) {
            utils::log::warn(std::format("Generation attempt {} failed ({}): {}", state.attempt,
                error_kind_to_string(completion.error_kind()), completion.error_message()));
            switch (completion.error_kind()) {
                case ErrorKind::TIMEOUT:
                    return fail(ErrorKind::GENERATION_TIMEOUT,
                        "The language model did not respond in time",
                        {"Try again", "Ask a simpler question"});
                case ErrorKind::BACKEND_UNAVAILABLE:
                    return fail(ErrorKind::BACKEND_UNAVAILABLE,
                        "The language model service is unavailable",
                        {"Check that the model server is running", "Try again later"});
                default:
                    return fail(ErrorKind::GENERATION_FAILED, completion.error_message(),
                        {"Try again"});
            }
        }

        auto extracted = StatementExtractor::extract(completion.value());
        if (extracted.is_error()) {
            if (extracted.error_kind() == ErrorKind::GENERATION_FAILED && can_retry) {
                state.correction = "the response did not contain a SQL statement";
                regenerations_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            return fail(extracted.error_kind(), extracted.error_message(), extracted.suggestions());
        }
        const std::string& sql = extracted.value();
        utils::log::debug(std::format("Attempt {} generated: {}", state.attempt, sql));

        // Security layers run before anything that can earn a retry
        const auto screened = validator_->screen(sql);
        const auto blocked = std::find_if(screened.begin(), screened.end(),
            [](const ValidationIssue& i) { return i.severity == Severity::CRITICAL; });
        if (blocked != screened.end()) {
            return reject(*blocked);
        }

        const auto analysis = StatementAnalyzer::analyze(sql);

        // Cheap pre-check before full validation
        std::vector<std::string> candidates;
        const auto problems = analysis.parsed ? missing_tables(analysis, candidates)
                                              : std::vector<std::string>{};
        if (!problems.empty()) {
            const auto correction = utils::join(problems, "\n");
            if (can_retry) {
                utils::log::info(std::format("Regenerating: {}", correction));
                state.correction = correction;
                regenerations_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            std::vector<std::string> suggestions;
            for (const auto& c : candidates) {
                suggestions.push_back(std::format("Did you mean '{}'?", c));
            }
            return fail(ErrorKind::GENERATION_FAILED,
                std::format("The generated query references unknown tables: {}", correction),
                std::move(suggestions));
        }

        auto validation = validator_->validate(sql);

        if (const auto* critical = first_with(validation, Severity::CRITICAL)) {
            return reject(*critical);
        }

        if (validation.has_blocking()) {
            const bool schema_only = std::all_of(validation.issues.begin(), validation.issues.end(),
                [](const ValidationIssue& i) {
                    return is_schema_issue(i) ||
                           (i.severity != Severity::ERROR && i.severity != Severity::CRITICAL);
                });
            if (schema_only && can_retry) {
                state.correction = schema_correction(validation);
                utils::log::info(std::format("Regenerating: {}", *state.correction));
                regenerations_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            std::vector<std::string> suggestions;
            for (const auto& issue : validation.issues) {
                if (issue.suggestion) suggestions.push_back(*issue.suggestion);
            }
            return fail(schema_only ? ErrorKind::GENERATION_FAILED : ErrorKind::VALIDATION_FAILED,
                std::format("The generated query failed validation: {}",
                            utils::join(blocking_messages(validation), "; ")),
                std::move(suggestions));
        }

        const double match_ratio = schema_match_ratio(analysis, context);
        const auto tier = tier_for(analysis);

        GenerationOutcome outcome;
        outcome.statement.text = sql;
        outcome.statement.tier = tier;
        outcome.statement.referenced_tables = analysis.tables;
        outcome.statement.attempt = state.attempt;
        outcome.statement.confidence = confidence_for(match_ratio, context.mean_score(), tier);
        outcome.validation = std::move(validation);
        return Result<GenerationOutcome>::ok(std::move(outcome));
    }

    return fail(ErrorKind::GENERATION_FAILED,
        std::format("No valid query after {} attempts", config_.max_attempts),
        {"Rephrase the question", "Name the table you are asking about"});
}

GenerationController::Stats GenerationController::get_stats() const {
    return Stats{
        .requests = requests_.load(std::memory_order_relaxed),
        .attempts = attempts_.load(std::memory_order_relaxed),
        .regenerations = regenerations_.load(std::memory_order_relaxed),
        .failures = failures_.load(std::memory_order_relaxed),
    };
}

} // namespace sqlrag
