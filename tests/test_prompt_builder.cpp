#include <catch2/catch_test_macros.hpp>
#include "llm/prompt_builder.hpp"

using namespace sqlrag;

namespace {

RetrievalContext hospital_context() {
    RetrievalContext ctx;
    ctx.elements.push_back({"table:admissions", "Table: admissions",
        TablePayload{"admissions", "Patient admissions", 200000, {"patients"}}, 0.9});
    ctx.elements.push_back({"column:admissions.admitted_at", "Column: admitted_at",
        ColumnPayload{"admissions", "admitted_at", "timestamptz"}, 0.8});
    ctx.elements.push_back({"table:patients", "Table: patients",
        TablePayload{"patients", "", 50000, {}}, 0.7});
    ctx.elements.push_back({"column:patients.name", "Column: name",
        ColumnPayload{"patients", "name", "text"}, 0.6});
    ctx.elements.push_back({"relationship:admissions.patient_id->patients.id", "Relationship",
        RelationshipPayload{"admissions", "patient_id", "patients", "id"}, 0.6});
    ctx.elements.push_back({"rule:0", "Rule: Exclude cancelled admissions",
        RulePayload{"Exclude cancelled admissions", {}}, 0.5});
    ctx.elements.push_back({"example:0", "Question: how many admissions today",
        ExamplePayload{"how many admissions today",
                       "SELECT count(*) FROM admissions WHERE admitted_at::date = current_date",
                       IntentKind::COUNT}, 0.5});
    return ctx;
}

Query question(const std::string& text) {
    Query q;
    q.text = text;
    return q;
}

size_t pos(const std::string& haystack, const std::string& needle) {
    const auto p = haystack.find(needle);
    REQUIRE(p != std::string::npos);
    return p;
}

} // anonymous namespace

TEST_CASE("PromptBuilder: sections appear in order", "[prompt]") {
    const PromptBuilder builder;
    const auto prompt = builder.build(question("How many patients were admitted yesterday?"),
                                      hospital_context(), {});

    const auto role = pos(prompt, "You are an expert SQL developer");
    const auto schema = pos(prompt, "### Database Schema");
    const auto rules = pos(prompt, "### Rules");
    const auto examples = pos(prompt, "### Examples");
    const auto instructions = pos(prompt, "### Instructions");
    const auto user = pos(prompt, "### User Question\nHow many patients were admitted yesterday?");

    CHECK(role < schema);
    CHECK(schema < rules);
    CHECK(rules < examples);
    CHECK(examples < instructions);
    CHECK(instructions < user);
    CHECK(prompt.ends_with("### SQL Query\n"));
    CHECK(prompt.find("### Correction") == std::string::npos);
    CHECK(prompt.find("### Conversation So Far") == std::string::npos);
}

TEST_CASE("PromptBuilder: schema lists typed columns under their table", "[prompt]") {
    const PromptBuilder builder;
    const auto prompt = builder.build(question("q"), hospital_context(), {});

    CHECK(prompt.find("- Table: admissions -- Patient admissions\n  - admitted_at (timestamptz)\n") !=
          std::string::npos);
    CHECK(prompt.find("- Table: patients\n  - name (text)\n") != std::string::npos);
    CHECK(prompt.find("Relationships:\n- admissions.patient_id -> patients.id") != std::string::npos);
    CHECK(prompt.find("- Exclude cancelled admissions") != std::string::npos);
    CHECK(prompt.find("SQL: SELECT count(*) FROM admissions") != std::string::npos);
}

TEST_CASE("PromptBuilder: instructions", "[prompt]") {
    const PromptBuilder builder(PromptBuilder::Config{.dialect = "PostgreSQL", .max_recent_turns = 3});
    const auto prompt = builder.build(question("q"), hospital_context(), {});

    CHECK(prompt.find("1. Return ONLY the SQL query.") != std::string::npos);
    CHECK(prompt.find("NO_SQL") != std::string::npos);
    CHECK(prompt.find("Use PostgreSQL syntax") != std::string::npos);
}

TEST_CASE("PromptBuilder: empty context is stated", "[prompt]") {
    const PromptBuilder builder;
    const auto prompt = builder.build(question("q"), RetrievalContext{}, {});
    CHECK(prompt.find("No schema information was retrieved") != std::string::npos);
    CHECK(prompt.find("### Rules") == std::string::npos);
    CHECK(prompt.find("### Examples") == std::string::npos);
}

TEST_CASE("PromptBuilder: recent turns are bounded", "[prompt]") {
    const PromptBuilder builder(PromptBuilder::Config{.dialect = "PostgreSQL", .max_recent_turns = 2});

    std::vector<Turn> turns(3);
    turns[0].query.text = "first question";
    turns[1].query.text = "second question";
    turns[1].response.statement = "SELECT 2";
    turns[2].query.text = "third question";
    turns[2].response.statement = "SELECT 3";

    const auto prompt = builder.build(question("and those?"), hospital_context(), turns);
    CHECK(prompt.find("### Conversation So Far") != std::string::npos);
    CHECK(prompt.find("first question") == std::string::npos);
    CHECK(prompt.find("Question: second question\nSQL: SELECT 2") != std::string::npos);
    CHECK(prompt.find("Question: third question\nSQL: SELECT 3") != std::string::npos);
}

TEST_CASE("PromptBuilder: correction precedes the question", "[prompt]") {
    const PromptBuilder builder;
    const auto prompt = builder.build(question("How many patients?"), hospital_context(), {},
                                      std::string("table patient not found; valid candidates: patients"));

    const auto correction = pos(prompt,
        "### Correction\nThe previous attempt was rejected: table patient not found; valid candidates: patients");
    CHECK(correction < pos(prompt, "### User Question"));
}
