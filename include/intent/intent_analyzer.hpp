#pragma once

#include "core/types.hpp"

#include <regex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sqlrag {

/**
 * @brief Pattern-based intent classification and entity extraction
 *
 * Works on normalized text (lower-case, collapsed whitespace). Entity
 * extractors run independently: dates, numbers, comparators, table hints
 * (against a vocabulary of table names, singular/plural tolerant) and
 * metric words.
 *
 * Confidence is built from integer points:
 *   intent pattern  strong 60 / medium 50 / weak 40 / none 20
 *   date entity     +15
 *   scope           +10  (table hint or comparator)
 *   question form   +5
 *   >= 4 words      +5
 *   resolved reference to the previous turn  +10
 * capped at 100 and divided by 100.
 *
 * analyze() is a pure function of text, history and the current vocabulary.
 */
class IntentAnalyzer {
public:
    struct Config {
        double confidence_threshold = 0.7;
    };

    IntentAnalyzer() : IntentAnalyzer(Config{}) {}
    explicit IntentAnalyzer(Config config, std::vector<std::string> table_vocabulary = {});

    [[nodiscard]] Query analyze(const std::string& text,
                                const std::vector<Turn>& history = {}) const;

    [[nodiscard]] bool is_ambiguous(const Query& query) const {
        return query.confidence < config_.confidence_threshold;
    }

    /**
     * @brief Questions that would fill the gaps in an ambiguous query (never empty)
     */
    [[nodiscard]] std::vector<std::string> clarification_questions(const Query& query) const;

    /**
     * @brief True when the text refers back to an earlier turn ("those", "same", ...)
     */
    [[nodiscard]] static bool has_anaphora(const std::string& normalized_text);

    void set_vocabulary(std::vector<std::string> table_names);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct IntentPattern {
        IntentKind kind;
        int strength;
        std::regex regex;
    };

    struct VocabularyEntry {
        std::string table;
        std::vector<std::string> forms;
    };

    void classify(const std::string& text, Query& query, int& points) const;
    void extract_dates(const std::string& text, EntityMap& entities) const;
    void extract_numbers(const std::string& text, EntityMap& entities) const;
    void extract_comparators(const std::string& text, EntityMap& entities) const;
    void extract_table_hints(const std::string& text, EntityMap& entities) const;
    void extract_metrics(const std::string& text, EntityMap& entities) const;

    Config config_;
    std::vector<IntentPattern> intent_patterns_;
    std::vector<std::regex> date_patterns_;
    std::regex number_pattern_;
    std::vector<std::pair<std::regex, std::string>> comparator_patterns_;
    std::regex metric_pattern_;

    mutable std::shared_mutex vocab_mutex_;
    std::vector<VocabularyEntry> vocabulary_;
};

} // namespace sqlrag
