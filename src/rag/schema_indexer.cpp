#include "rag/schema_indexer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace sqlrag {

SchemaIndexer::SchemaIndexer(std::shared_ptr<IEmbeddingService> embeddings,
                             std::shared_ptr<IVectorStore> store)
    : embeddings_(std::move(embeddings)), store_(std::move(store)) {}

std::vector<VectorDocument> SchemaIndexer::build_documents(
    const SchemaMap& schema,
    const std::vector<ExamplePayload>& examples,
    const std::vector<RulePayload>& rules) {

    // Sorted so document order (and therefore ids of examples/rules) is stable
    std::vector<std::string> names;
    names.reserve(schema.size());
    for (const auto& [name, _] : schema) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    // Related tables are the union of both FK directions
    std::unordered_map<std::string, std::set<std::string>> related;
    for (const auto& name : names) {
        for (const auto& fk : schema.at(name)->foreign_keys) {
            const auto target = utils::to_lower(fk.ref_table);
            if (target == name) continue;
            related[name].insert(target);
            related[target].insert(name);
        }
    }

    std::vector<VectorDocument> docs;
    for (const auto& name : names) {
        const auto& table = *schema.at(name);
        const std::string description = table.description.empty()
            ? "No description" : table.description;

        TablePayload tp{table.name, table.description, table.row_count_estimate, {}};
        tp.related_tables.assign(related[name].begin(), related[name].end());

        std::string content = std::format("Table: {}\nDescription: {}", table.name, description);
        if (!tp.related_tables.empty()) {
            content += std::format("\nRelated tables: {}", utils::join(tp.related_tables, ", "));
        }
        docs.push_back(VectorDocument{
            std::format("table:{}", name), std::move(content), std::move(tp), {}});

        for (const auto& col : table.columns) {
            docs.push_back(VectorDocument{
                std::format("column:{}.{}", name, utils::to_lower(col.name)),
                std::format("Column: {}\nType: {}\nTable: {}", col.name, col.type, table.name),
                ColumnPayload{table.name, col.name, col.type},
                {}});
        }

        for (const auto& fk : table.foreign_keys) {
            docs.push_back(VectorDocument{
                std::format("relationship:{}.{}->{}.{}", name, utils::to_lower(fk.column),
                            utils::to_lower(fk.ref_table), utils::to_lower(fk.ref_column)),
                std::format("Relationship: {}.{} references {}.{}",
                            table.name, fk.column, fk.ref_table, fk.ref_column),
                RelationshipPayload{table.name, fk.column, fk.ref_table, fk.ref_column},
                {}});
        }
    }

    for (size_t i = 0; i < examples.size(); ++i) {
        const auto& ex = examples[i];
        docs.push_back(VectorDocument{
            std::format("example:{}", i),
            std::format("Question: {}\nSQL: {}", ex.question, ex.statement),
            ex, {}});
    }

    for (size_t i = 0; i < rules.size(); ++i) {
        docs.push_back(VectorDocument{
            std::format("rule:{}", i),
            std::format("Rule: {}", rules[i].text),
            rules[i], {}});
    }

    return docs;
}

Result<size_t> SchemaIndexer::index(const SchemaMap& schema,
                                    const std::vector<ExamplePayload>& examples,
                                    const std::vector<RulePayload>& rules,
                                    const Deadline& deadline) {
    auto docs = build_documents(schema, examples, rules);
    utils::Timer timer;

    for (auto& doc : docs) {
        // Examples are matched on the question, not the SQL
        const auto* ex = std::get_if<ExamplePayload>(&doc.payload);
        auto embedding = embeddings_->embed(ex ? ex->question : doc.content, deadline);
        if (embedding.is_error()) {
            return Result<size_t>::error(embedding.error_kind(),
                std::format("Indexing '{}' failed: {}", doc.id, embedding.error_message()));
        }
        doc.embedding = std::move(embedding.value());
    }

    // Everything is embedded before the store changes, so a failed run keeps
    // the previous index. Clearing drops documents of tables that no longer exist.
    store_->clear();
    auto stored = store_->add(std::move(docs));
    if (stored.is_ok()) {
        utils::log::info(std::format("Indexed {} documents ({} tables) in {}ms",
            stored.value(), schema.size(), timer.elapsed_ms().count()));
    }
    return stored;
}

} // namespace sqlrag
