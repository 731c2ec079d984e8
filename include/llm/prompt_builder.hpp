#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sqlrag {

/**
 * @brief Assembles the generation prompt
 *
 * Sections, in order: role instruction, schema (tables with typed columns,
 * then relationships), rules, examples, recent turns, the question and,
 * on retry, a correction naming the exact problem.
 */
class PromptBuilder {
public:
    struct Config {
        std::string dialect = "PostgreSQL";
        size_t max_recent_turns = 3;
    };

    PromptBuilder() : PromptBuilder(Config{}) {}
    explicit PromptBuilder(Config config) : config_(std::move(config)) {}

    [[nodiscard]] std::string build(const Query& query,
                                    const RetrievalContext& context,
                                    const std::vector<Turn>& recent_turns,
                                    const std::optional<std::string>& correction = std::nullopt) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    std::string schema_section(const RetrievalContext& context) const;

    Config config_;
};

} // namespace sqlrag
