#include <catch2/catch_test_macros.hpp>
#include "rag/context_retriever.hpp"
#include "mocks/mock_embedding_service.hpp"
#include "mocks/mock_vector_store.hpp"

#include <algorithm>

using namespace sqlrag;
using namespace sqlrag::testing;

namespace {

VectorHit table_hit(const std::string& name, double score,
                    std::vector<std::string> related = {}, std::string content = {}) {
    if (content.empty()) content = "Table: " + name;
    return VectorHit{"table:" + name, std::move(content),
                     TablePayload{name, "", 1000, std::move(related)}, score};
}

VectorHit column_hit(const std::string& table, const std::string& column, double score) {
    return VectorHit{"column:" + table + "." + column, "Column: " + column,
                     ColumnPayload{table, column, "integer"}, score};
}

VectorHit relationship_hit(const std::string& from, const std::string& to, double score) {
    return VectorHit{"relationship:" + from + "->" + to, "Relationship: " + from + " -> " + to,
                     RelationshipPayload{from, to + "_id", to, "id"}, score};
}

VectorHit example_hit(const std::string& question, IntentKind intent, double score) {
    return VectorHit{"example:" + question, "Question: " + question,
                     ExamplePayload{question, "SELECT 1", intent}, score};
}

VectorHit rule_hit(const std::string& text, std::vector<IntentKind> intents, double score) {
    return VectorHit{"rule:" + text, "Rule: " + text, RulePayload{text, std::move(intents)}, score};
}

Query query_with(IntentKind intent) {
    Query q;
    q.text = "question";
    q.intent = intent;
    return q;
}

std::vector<std::string> ids(const RetrievalContext& ctx) {
    std::vector<std::string> out;
    for (const auto& e : ctx.elements) out.push_back(e.id);
    return out;
}

bool has_id(const RetrievalContext& ctx, const std::string& id) {
    const auto all = ids(ctx);
    return std::find(all.begin(), all.end(), id) != all.end();
}

struct RetrieverFixture {
    std::shared_ptr<MockEmbeddingService> embeddings = std::make_shared<MockEmbeddingService>();
    std::shared_ptr<MockVectorStore> store = std::make_shared<MockVectorStore>();

    ContextRetriever make(ContextRetriever::Config cfg = {}) {
        return ContextRetriever(embeddings, store, std::make_shared<CharRatioTokenEstimator>(4), cfg);
    }
};

} // anonymous namespace

TEST_CASE("ContextRetriever: k adapts to the question", "[retriever]") {
    RetrieverFixture f;
    const auto retriever = f.make();

    CHECK(retriever.choose_top_k("How many patients?", {}) == 5);
    CHECK(retriever.choose_top_k("Count admissions by department", {}) == 15);
    CHECK(retriever.choose_top_k("Average cost versus last year", {}) == 15);
    CHECK(retriever.choose_top_k("What is the name of the oldest patient in the hospital today", {}) == 10);
    CHECK(retriever.choose_top_k("How many patients?", std::vector<Turn>(1)) == 10);
}

TEST_CASE("ContextRetriever: scores below the threshold are dropped", "[retriever]") {
    RetrieverFixture f;
    const auto retriever = f.make();

    RetrievalCandidates c;
    c.hits = {table_hit("patients", 0.8), table_hit("invoices", 0.2)};

    const auto ctx = retriever.assemble(c, query_with(IntentKind::COUNT));
    CHECK(has_id(ctx, "table:patients"));
    CHECK_FALSE(has_id(ctx, "table:invoices"));
}

TEST_CASE("ContextRetriever: related tables win over unrelated ones", "[retriever]") {
    RetrieverFixture f;
    ContextRetriever::Config cfg;
    cfg.max_tables = 2;
    const auto retriever = f.make(cfg);

    RetrievalCandidates c;
    c.hits = {
        table_hit("patients", 0.9, {"admissions"}),
        table_hit("lab_results", 0.85),
        table_hit("admissions", 0.6, {"patients"}),
        column_hit("lab_results", "value", 0.7),
        column_hit("admissions", "patient_id", 0.65),
        relationship_hit("admissions", "patients", 0.5),
        relationship_hit("lab_results", "admissions", 0.5),
    };

    const auto ctx = retriever.assemble(c, query_with(IntentKind::COUNT));
    CHECK(has_id(ctx, "table:patients"));
    CHECK(has_id(ctx, "table:admissions"));
    CHECK_FALSE(has_id(ctx, "table:lab_results"));

    // Columns and relationships follow the selected tables
    CHECK(has_id(ctx, "column:admissions.patient_id"));
    CHECK_FALSE(has_id(ctx, "column:lab_results.value"));
    CHECK(has_id(ctx, "relationship:admissions->patients"));
    CHECK_FALSE(has_id(ctx, "relationship:lab_results->admissions"));
}

TEST_CASE("ContextRetriever: hop limit bounds the expansion", "[retriever]") {
    RetrieverFixture f;
    ContextRetriever::Config cfg;
    cfg.max_hops = 1;
    cfg.max_tables = 3;
    const auto retriever = f.make(cfg);

    // a - b - c chain plus an unrelated d ranked above c
    RetrievalCandidates c;
    c.hits = {
        table_hit("a", 0.9, {"b"}),
        table_hit("d", 0.8),
        table_hit("b", 0.7, {"a", "c"}),
        table_hit("c", 0.6, {"b"}),
    };

    const auto ctx = retriever.assemble(c, query_with(IntentKind::LIST));
    const auto tables = ctx.table_names();
    REQUIRE(tables.size() == 3);
    // b by one hop, then d fills in similarity order ahead of c
    CHECK(has_id(ctx, "table:a"));
    CHECK(has_id(ctx, "table:b"));
    CHECK(has_id(ctx, "table:d"));
    CHECK_FALSE(has_id(ctx, "table:c"));
}

TEST_CASE("ContextRetriever: examples prefer the query intent", "[retriever]") {
    RetrieverFixture f;
    const auto retriever = f.make();

    RetrievalCandidates c;
    c.hits = {table_hit("admissions", 0.9)};
    c.examples = {
        example_hit("list admissions", IntentKind::LIST, 0.9),
        example_hit("count admissions today", IntentKind::COUNT, 0.6),
        example_hit("count patients", IntentKind::COUNT, 0.5),
    };

    const auto ctx = retriever.assemble(c, query_with(IntentKind::COUNT));
    CHECK(ctx.count(ContextKind::EXAMPLE) == 2);
    CHECK(has_id(ctx, "example:count admissions today"));
    CHECK(has_id(ctx, "example:count patients"));
    CHECK_FALSE(has_id(ctx, "example:list admissions"));

    // Other intents fill the remaining slots
    const auto trend = retriever.assemble(c, query_with(IntentKind::TREND));
    CHECK(trend.count(ContextKind::EXAMPLE) == 2);
    CHECK(has_id(trend, "example:list admissions"));
}

TEST_CASE("ContextRetriever: rules filtered by intent", "[retriever]") {
    RetrieverFixture f;
    const auto retriever = f.make();

    RetrievalCandidates c;
    c.rules = {
        rule_hit("always exclude test patients", {}, 0.3),
        rule_hit("bucket trends by week", {IntentKind::TREND}, 0.4),
    };

    const auto ctx = retriever.assemble(c, query_with(IntentKind::COUNT));
    CHECK(has_id(ctx, "rule:always exclude test patients"));
    CHECK_FALSE(has_id(ctx, "rule:bucket trends by week"));
}

TEST_CASE("ContextRetriever: token budget is never exceeded", "[retriever]") {
    RetrieverFixture f;
    ContextRetriever::Config cfg;
    cfg.token_budget = 40;
    cfg.prompt_overhead_tokens = 10;
    const auto retriever = f.make(cfg);
    REQUIRE(retriever.available_tokens() == 30);

    RetrievalCandidates c;
    c.hits = {
        table_hit("patients", 0.9, {}, std::string(100, 'p')),      // 25 tokens
        column_hit("admissions", "id", 0.8),                         // fits, but its table does not
        table_hit("admissions", 0.7, {}, std::string(100, 'a')),    // 25 tokens, skipped
    };

    const auto ctx = retriever.assemble(c, query_with(IntentKind::LIST));
    CHECK(ctx.total_tokens <= retriever.available_tokens());
    CHECK(has_id(ctx, "table:patients"));
    CHECK_FALSE(has_id(ctx, "table:admissions"));
    // The column lost its table and is removed as an orphan
    CHECK_FALSE(has_id(ctx, "column:admissions.id"));
    CHECK(ctx.total_tokens == 25);
}

TEST_CASE("ContextRetriever: elements are ordered by score", "[retriever]") {
    RetrieverFixture f;
    const auto retriever = f.make();

    RetrievalCandidates c;
    c.hits = {table_hit("patients", 0.6), column_hit("patients", "name", 0.9), table_hit("admissions", 0.7)};

    const auto ctx = retriever.assemble(c, query_with(IntentKind::LIST));
    REQUIRE(ctx.elements.size() == 3);
    CHECK(std::is_sorted(ctx.elements.begin(), ctx.elements.end(),
        [](const ContextElement& a, const ContextElement& b) { return a.score > b.score; }));
}

TEST_CASE("ContextRetriever: fetch searches with the chosen k", "[retriever]") {
    RetrieverFixture f;
    f.store->add_hit("table:patients", "Table: patients", TablePayload{"patients", "", 10, {}}, 0.9);
    f.store->add_hit("rule:0", "Rule: r", RulePayload{"r", {}}, 0.4);
    auto retriever = f.make();

    const auto c = retriever.fetch_candidates("How many patients?", {}, Deadline::none());
    CHECK_FALSE(c.degraded);
    CHECK(f.store->last_top_k() == 5);
    CHECK(c.rules.size() == 1);
    CHECK(c.examples.empty());
}

TEST_CASE("ContextRetriever: embeddings are cached by normalized text", "[retriever]") {
    RetrieverFixture f;
    auto retriever = f.make();

    (void)retriever.fetch_candidates("How many patients?", {}, Deadline::none());
    (void)retriever.fetch_candidates("how many  PATIENTS", {}, Deadline::none());
    CHECK(f.embeddings->call_count() == 1);
    CHECK(retriever.embedding_cache_hits() == 1);
}

TEST_CASE("ContextRetriever: follow-ups are embedded with the previous question", "[retriever]") {
    RetrieverFixture f;
    auto retriever = f.make();

    Turn previous;
    previous.query.text = "How many patients were admitted yesterday?";

    (void)retriever.fetch_candidates("show me those", {previous}, Deadline::none());
    CHECK(f.embeddings->last_text() == "How many patients were admitted yesterday? show me those");

    (void)retriever.fetch_candidates("list departments", {previous}, Deadline::none());
    CHECK(f.embeddings->last_text() == "list departments");
}

TEST_CASE("ContextRetriever: failures degrade to an empty context", "[retriever]") {
    RetrieverFixture f;
    f.store->add_hit("table:patients", "Table: patients", TablePayload{"patients", "", 10, {}}, 0.9);
    auto retriever = f.make();

    SECTION("embedding service down") {
        f.embeddings->set_failing(true);
        const auto ctx = retriever.retrieve(query_with(IntentKind::COUNT), {}, Deadline::none());
        CHECK(ctx.degraded);
        CHECK(ctx.elements.empty());
    }

    SECTION("vector store down") {
        f.store->set_failing(true);
        const auto ctx = retriever.retrieve(query_with(IntentKind::COUNT), {}, Deadline::none());
        CHECK(ctx.degraded);
        CHECK(ctx.elements.empty());
    }
}
