#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "analyzer/schema_cache.hpp"
#include "intent/intent_analyzer.hpp"
#include "rag/in_memory_vector_store.hpp"
#include "rag/schema_indexer.hpp"
#include "mocks/mock_embedding_service.hpp"
#include "mocks/mock_schema_provider.hpp"

#include <algorithm>
#include <memory>
#include <vector>

using namespace sqlrag;
using namespace sqlrag::testing;

namespace {

const VectorDocument* find_doc(const std::vector<VectorDocument>& docs, const std::string& id) {
    const auto it = std::find_if(docs.begin(), docs.end(),
        [&id](const VectorDocument& d) { return d.id == id; });
    return it == docs.end() ? nullptr : &*it;
}

std::vector<ExamplePayload> hospital_examples() {
    return {ExamplePayload{"How many patients are there?", "SELECT COUNT(*) FROM patients",
                           IntentKind::COUNT}};
}

std::vector<RulePayload> hospital_rules() {
    return {RulePayload{"Discharged means discharged_at IS NOT NULL", {}}};
}

VectorDocument doc(const std::string& id, Embedding v,
                   ContextPayload payload = TablePayload{"t", "", 0, {}}) {
    return VectorDocument{id, id, std::move(payload), std::move(v)};
}

} // anonymous namespace

TEST_CASE("SchemaIndexer: one document per table, column and foreign key", "[indexer]") {
    const auto schema = make_hospital_schema()->load_snapshot();
    const auto docs = SchemaIndexer::build_documents(*schema, hospital_examples(), hospital_rules());

    CHECK(docs.size() == 4 + 14 + 3 + 1 + 1);

    size_t tables = 0, columns = 0, relationships = 0;
    for (const auto& d : docs) {
        if (d.kind() == ContextKind::TABLE) ++tables;
        if (d.kind() == ContextKind::COLUMN) ++columns;
        if (d.kind() == ContextKind::RELATIONSHIP) ++relationships;
    }
    CHECK(tables == 4);
    CHECK(columns == 14);
    CHECK(relationships == 3);

    // Sorted by table name
    CHECK(docs.front().id == "table:admissions");
}

TEST_CASE("SchemaIndexer: document content", "[indexer]") {
    const auto schema = make_hospital_schema()->load_snapshot();
    const auto docs = SchemaIndexer::build_documents(*schema, hospital_examples(), hospital_rules());

    SECTION("table lists related tables from both directions") {
        const auto* admissions = find_doc(docs, "table:admissions");
        REQUIRE(admissions);
        CHECK(admissions->content ==
              "Table: admissions\nDescription: Patient admissions and discharges\n"
              "Related tables: departments, lab_results, patients");

        const auto& payload = std::get<TablePayload>(admissions->payload);
        CHECK(payload.row_count == 200'000);
        CHECK(payload.related_tables == std::vector<std::string>{"departments", "lab_results", "patients"});

        const auto* patients = find_doc(docs, "table:patients");
        REQUIRE(patients);
        CHECK(std::get<TablePayload>(patients->payload).related_tables ==
              std::vector<std::string>{"admissions"});
    }

    SECTION("column") {
        const auto* col = find_doc(docs, "column:admissions.admitted_at");
        REQUIRE(col);
        CHECK(col->content == "Column: admitted_at\nType: timestamptz\nTable: admissions");
    }

    SECTION("relationship") {
        const auto* rel = find_doc(docs, "relationship:admissions.patient_id->patients.id");
        REQUIRE(rel);
        CHECK(rel->content == "Relationship: admissions.patient_id references patients.id");
        const auto& payload = std::get<RelationshipPayload>(rel->payload);
        CHECK(payload.to_table == "patients");
    }

    SECTION("example and rule") {
        const auto* ex = find_doc(docs, "example:0");
        REQUIRE(ex);
        CHECK(ex->content == "Question: How many patients are there?\nSQL: SELECT COUNT(*) FROM patients");
        const auto* rule = find_doc(docs, "rule:0");
        REQUIRE(rule);
        CHECK(rule->content == "Rule: Discharged means discharged_at IS NOT NULL");
    }

    SECTION("missing description") {
        MockSchemaProvider provider;
        provider.add_table("wards", {{"id", "integer"}});
        const auto bare = SchemaIndexer::build_documents(*provider.load_snapshot(), {}, {});
        REQUIRE(bare.size() == 2);
        CHECK(bare[0].content == "Table: wards\nDescription: No description");
    }
}

TEST_CASE("SchemaIndexer: index embeds and stores everything", "[indexer]") {
    auto embeddings = std::make_shared<MockEmbeddingService>();
    auto store = std::make_shared<InMemoryVectorStore>();
    SchemaIndexer indexer(embeddings, store);
    const auto schema = make_hospital_schema()->load_snapshot();

    auto result = indexer.index(*schema, hospital_examples(), hospital_rules(), Deadline::none());
    REQUIRE(result.is_ok());
    CHECK(result.value() == 23);
    CHECK(store->size() == 23);
    CHECK(embeddings->call_count() == 23);

    SECTION("examples are embedded by their question") {
        auto query = embeddings->embed("How many patients are there?", Deadline::none());
        REQUIRE(query.is_ok());
        auto hits = store->search(query.value(), 1, ContextKind::EXAMPLE, Deadline::none());
        REQUIRE(hits.is_ok());
        REQUIRE(hits.value().size() == 1);
        CHECK(hits.value()[0].id == "example:0");
        CHECK(hits.value()[0].score == Catch::Approx(1.0).margin(1e-5));
    }

    SECTION("re-indexing replaces by id") {
        auto again = indexer.index(*schema, hospital_examples(), hospital_rules(), Deadline::none());
        REQUIRE(again.is_ok());
        CHECK(store->size() == 23);
    }
}

TEST_CASE("SchemaIndexer: schema change re-indexes and refreshes table hints", "[indexer][schema_cache]") {
    auto provider = make_hospital_schema();
    auto schema = std::make_shared<SchemaCache>(provider);
    auto embeddings = std::make_shared<MockEmbeddingService>();
    auto store = std::make_shared<InMemoryVectorStore>();
    auto indexer = std::make_shared<SchemaIndexer>(embeddings, store);
    auto intent = std::make_shared<IntentAnalyzer>(IntentAnalyzer::Config{}, schema->table_names());

    const auto indexed_tables = [&store, &embeddings]() {
        std::vector<std::string> ids;
        const auto query_vector = embeddings->embed("tables", Deadline::none());
        REQUIRE(query_vector.is_ok());
        const auto hits = store->search(query_vector.value(), 100, ContextKind::TABLE, Deadline::none());
        REQUIRE(hits.is_ok());
        for (const auto& hit : hits.value()) ids.push_back(hit.id);
        return ids;
    };
    const auto contains = [](const std::vector<std::string>& v, const std::string& s) {
        return std::find(v.begin(), v.end(), s) != v.end();
    };

    REQUIRE(indexer->index(*schema->snapshot(), {}, {}, Deadline::none()).is_ok());
    CHECK(contains(indexed_tables(), "table:lab_results"));

    schema->set_on_change([indexer, intent](const SchemaChangeEvent& e) {
        REQUIRE(indexer->index(*e.snapshot, {}, {}, Deadline::none()).is_ok());
        std::vector<std::string> names;
        for (const auto& [key, table] : *e.snapshot) names.push_back(table->name);
        intent->set_vocabulary(std::move(names));
    });

    const auto hints = [&intent](const std::string& text) {
        const auto q = intent->analyze(text);
        const auto it = q.entities.find(entity::kTableHint);
        return it == q.entities.end() ? std::vector<std::string>{} : it->second;
    };
    CHECK(contains(hints("latest lab result for each patient"), "lab_results"));

    provider->remove_table("lab_results");
    provider->set_version("v2");
    REQUIRE_FALSE(schema->has_table("lab_results"));

    const auto expected = SchemaIndexer::build_documents(*schema->snapshot(), {}, {});
    CHECK(store->size() == expected.size());
    const auto tables = indexed_tables();
    CHECK(tables.size() == 3);
    CHECK_FALSE(contains(tables, "table:lab_results"));
    CHECK(contains(tables, "table:patients"));

    const auto after = hints("latest lab result for each patient");
    CHECK_FALSE(contains(after, "lab_results"));
    CHECK(contains(after, "patients"));
}

TEST_CASE("SchemaIndexer: an embedding failure aborts indexing", "[indexer]") {
    auto embeddings = std::make_shared<MockEmbeddingService>();
    auto store = std::make_shared<InMemoryVectorStore>();
    SchemaIndexer indexer(embeddings, store);
    embeddings->set_failing(true);

    const auto schema = make_hospital_schema()->load_snapshot();
    auto result = indexer.index(*schema, {}, {}, Deadline::none());
    REQUIRE(result.is_error());
    CHECK(result.error_kind() == ErrorKind::BACKEND_UNAVAILABLE);
    CHECK(result.error_message().find("Indexing 'table:admissions' failed") != std::string::npos);
    CHECK(embeddings->call_count() == 1);
    CHECK(store->size() == 0);
}

TEST_CASE("InMemoryVectorStore: cosine search", "[vector_store]") {
    InMemoryVectorStore store;
    auto added = store.add({
        doc("a", {1.0f, 0.0f, 0.0f}),
        doc("b", {0.7f, 0.7f, 0.0f}),
        doc("c", {0.0f, 0.0f, 5.0f}),
        doc("r", {1.0f, 0.1f, 0.0f}, RulePayload{"r", {}}),
    });
    REQUIRE(added.is_ok());
    CHECK(added.value() == 4);

    SECTION("best first, bounded by k") {
        auto hits = store.search({2.0f, 0.0f, 0.0f}, 2, std::nullopt, Deadline::none());
        REQUIRE(hits.is_ok());
        REQUIRE(hits.value().size() == 2);
        CHECK(hits.value()[0].id == "a");
        CHECK(hits.value()[0].score == Catch::Approx(1.0).margin(1e-6));
        CHECK(hits.value()[1].id == "r");
    }

    SECTION("kind filter") {
        auto hits = store.search({1.0f, 0.0f, 0.0f}, 10, ContextKind::RULE, Deadline::none());
        REQUIRE(hits.is_ok());
        REQUIRE(hits.value().size() == 1);
        CHECK(hits.value()[0].id == "r");
    }

    SECTION("replace by id") {
        REQUIRE(store.add({doc("a", {0.0f, 0.0f, 1.0f})}).is_ok());
        CHECK(store.size() == 4);
        auto hits = store.search({0.0f, 0.0f, 1.0f}, 1, ContextKind::TABLE, Deadline::none());
        REQUIRE(hits.is_ok());
        REQUIRE(hits.value().size() == 1);
        CHECK((hits.value()[0].id == "a" || hits.value()[0].id == "c"));
        CHECK(hits.value()[0].score == Catch::Approx(1.0).margin(1e-6));
    }

    SECTION("dimension mismatch") {
        auto bad = store.add({doc("d", {1.0f, 2.0f})});
        REQUIRE(bad.is_error());
        CHECK(bad.error_kind() == ErrorKind::INVALID_INPUT);

        auto query = store.search({1.0f, 2.0f}, 1, std::nullopt, Deadline::none());
        CHECK(query.is_error());
    }

    SECTION("zero vectors") {
        auto skipped = store.add({doc("z", {0.0f, 0.0f, 0.0f})});
        REQUIRE(skipped.is_ok());
        CHECK(skipped.value() == 0);
        CHECK(store.size() == 4);

        auto query = store.search({0.0f, 0.0f, 0.0f}, 1, std::nullopt, Deadline::none());
        REQUIRE(query.is_error());
        CHECK(query.error_kind() == ErrorKind::INVALID_INPUT);
    }

    SECTION("expired deadline") {
        Deadline deadline = Deadline::after(std::chrono::seconds{10});
        deadline.cancel();
        auto hits = store.search({1.0f, 0.0f, 0.0f}, 1, std::nullopt, deadline);
        REQUIRE(hits.is_error());
        CHECK(hits.error_kind() == ErrorKind::TIMEOUT);
    }

    SECTION("clear") {
        store.clear();
        CHECK(store.size() == 0);
    }
}
