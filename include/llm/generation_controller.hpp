#pragma once

#include "analyzer/statement_analyzer.hpp"
#include "core/deadline.hpp"
#include "core/types.hpp"
#include "db/ischema_provider.hpp"
#include "llm/igenerative_backend.hpp"
#include "llm/prompt_builder.hpp"
#include "validation/validator.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlrag {

struct GenerationOutcome {
    GeneratedStatement statement;
    ValidationResult validation;
};

/**
 * @brief Bounded generate -> extract -> check -> validate loop
 *
 * Each attempt is one state transition (attempt number, pending correction).
 * Only schema-existence problems earn another attempt; security findings end
 * the request, other validation errors fail it. attempt never exceeds
 * max_attempts.
 */
class GenerationController {
public:
    struct Config {
        uint32_t max_attempts = 2;
        uint32_t max_tokens = 512;
        double temperature = 0.1;
        std::vector<std::string> stop = {"\n\n\n", "### User Question"};
        size_t max_candidates = 3;
        PromptBuilder::Config prompt;
    };

    GenerationController(std::shared_ptr<IGenerativeBackend> backend,
                         std::shared_ptr<ISchemaProvider> schema,
                         std::shared_ptr<Validator> validator,
                         Config config);

    [[nodiscard]] Result<GenerationOutcome> generate(const Query& query,
                                                     const RetrievalContext& context,
                                                     const std::vector<Turn>& recent_turns,
                                                     const Deadline& deadline);

    [[nodiscard]] static ComplexityTier tier_for(const StatementAnalysis& analysis);

    /**
     * @brief 0.5 * schema match + 0.3 * mean context similarity + 0.2 * tier factor
     */
    [[nodiscard]] static double confidence_for(double schema_match_ratio,
                                               double mean_similarity,
                                               ComplexityTier tier);

    struct Stats {
        uint64_t requests;
        uint64_t attempts;
        uint64_t regenerations;
        uint64_t failures;
    };
    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct AttemptState {
        uint32_t attempt = 0;
        std::optional<std::string> correction;
    };

    // Missing tables as "table X not found; valid candidates: ..." lines
    std::vector<std::string> missing_tables(const StatementAnalysis& analysis,
                                            std::vector<std::string>& candidates);

    static std::string schema_correction(const ValidationResult& validation);

    std::shared_ptr<IGenerativeBackend> backend_;
    std::shared_ptr<ISchemaProvider> schema_;
    std::shared_ptr<Validator> validator_;
    Config config_;
    PromptBuilder prompt_builder_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> regenerations_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace sqlrag
