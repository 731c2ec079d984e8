#include "llm/prompt_builder.hpp"
#include "core/utils.hpp"

#include <format>
#include <map>

namespace sqlrag {

namespace {

constexpr const char* kNoSql = "NO_SQL";

} // anonymous namespace

std::string PromptBuilder::schema_section(const RetrievalContext& context) const {
    // Keep retrieval order for tables; columns attach to their table
    std::vector<std::string> order;
    std::map<std::string, std::vector<std::string>> columns;
    std::map<std::string, std::string> descriptions;
    std::vector<std::string> relationships;

    const auto touch = [&order, &columns](const std::string& table) {
        const auto key = utils::to_lower(table);
        if (!columns.contains(key)) {
            columns[key];
            order.push_back(table);
        }
        return key;
    };

    for (const auto& element : context.elements) {
        if (const auto* t = std::get_if<TablePayload>(&element.payload)) {
            const auto key = touch(t->table);
            if (!t->description.empty()) descriptions[key] = t->description;
        } else if (const auto* c = std::get_if<ColumnPayload>(&element.payload)) {
            const auto key = touch(c->table);
            columns[key].push_back(std::format("{} ({})", c->column, c->data_type));
        } else if (const auto* r = std::get_if<RelationshipPayload>(&element.payload)) {
            relationships.push_back(std::format("- {}.{} -> {}.{}",
                r->from_table, r->from_column, r->to_table, r->to_column));
        }
    }

    if (order.empty()) {
        return "No schema information was retrieved for this question.\n";
    }

    std::string out;
    for (const auto& table : order) {
        const auto key = utils::to_lower(table);
        out += std::format("- Table: {}", table);
        if (const auto it = descriptions.find(key); it != descriptions.end()) {
            out += std::format(" -- {}", it->second);
        }
        out += '\n';
        for (const auto& col : columns[key]) {
            out += std::format("  - {}\n", col);
        }
    }
    if (!relationships.empty()) {
        out += "Relationships:\n";
        out += utils::join(relationships, "\n");
        out += '\n';
    }
    return out;
}

std::string PromptBuilder::build(const Query& query,
                                 const RetrievalContext& context,
                                 const std::vector<Turn>& recent_turns,
                                 const std::optional<std::string>& correction) const {
    std::string prompt = std::format(
        "You are an expert SQL developer. Write one correct and efficient {} "
        "SELECT statement that answers the user's question.\n\n",
        config_.dialect);

    prompt += "### Database Schema\n";
    prompt += schema_section(context);
    prompt += '\n';

    std::vector<std::string> rules;
    std::vector<std::string> examples;
    for (const auto& element : context.elements) {
        if (const auto* r = std::get_if<RulePayload>(&element.payload)) {
            rules.push_back(std::format("- {}", r->text));
        } else if (const auto* e = std::get_if<ExamplePayload>(&element.payload)) {
            examples.push_back(std::format("Question: {}\nSQL: {}", e->question, e->statement));
        }
    }

    if (!rules.empty()) {
        prompt += "### Rules\n" + utils::join(rules, "\n") + "\n\n";
    }
    if (!examples.empty()) {
        prompt += "### Examples\n" + utils::join(examples, "\n\n") + "\n\n";
    }

    if (!recent_turns.empty() && config_.max_recent_turns > 0) {
        prompt += "### Conversation So Far\n";
        const size_t first = recent_turns.size() > config_.max_recent_turns
            ? recent_turns.size() - config_.max_recent_turns : 0;
        for (size_t i = first; i < recent_turns.size(); ++i) {
            const auto& turn = recent_turns[i];
            prompt += std::format("Question: {}\n", turn.query.text);
            if (!turn.response.statement.empty()) {
                prompt += std::format("SQL: {}\n", turn.response.statement);
            }
        }
        prompt += '\n';
    }

    prompt += std::format(
        "### Instructions\n"
        "1. Return ONLY the SQL query.\n"
        "2. Do not include explanations or markdown formatting.\n"
        "3. Use {} syntax and only the tables and columns listed above.\n"
        "4. The statement must be read-only.\n"
        "5. If the question cannot be answered with the given schema, return \"{}\".\n\n",
        config_.dialect, kNoSql);

    if (correction) {
        prompt += std::format(
            "### Correction\nThe previous attempt was rejected: {}\n"
            "Fix this problem in the new query.\n\n", *correction);
    }

    prompt += std::format("### User Question\n{}\n\n### SQL Query\n", query.text);
    return prompt;
}

} // namespace sqlrag
