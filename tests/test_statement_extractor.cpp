#include <catch2/catch_test_macros.hpp>
#include "llm/statement_extractor.hpp"

using namespace sqlrag;

namespace {

std::string extracted(const std::string& completion) {
    auto r = StatementExtractor::extract(completion);
    REQUIRE(r.is_ok());
    return r.value();
}

} // anonymous namespace

TEST_CASE("StatementExtractor: bare statement", "[extractor]") {
    CHECK(extracted("SELECT count(*) FROM patients;") == "SELECT count(*) FROM patients");
    CHECK(extracted("  select name from departments  ") == "select name from departments");
}

TEST_CASE("StatementExtractor: fenced block", "[extractor]") {
    CHECK(extracted("```sql\nSELECT * FROM patients\n```\nThis query lists every patient.") ==
          "SELECT * FROM patients");
    CHECK(extracted("Here you go:\n```\nSELECT 1\n```") == "SELECT 1");
}

TEST_CASE("StatementExtractor: label and prose around the statement", "[extractor]") {
    CHECK(extracted("SQL Query: SELECT id FROM admissions") == "SELECT id FROM admissions");

    CHECK(extracted("Here is the query:\nSELECT name\nFROM patients\nWHERE id = 1\n\n"
                    "This returns the patient's name.") ==
          "SELECT name\nFROM patients\nWHERE id = 1");

    CHECK(extracted("Start with the patients table. SELECT * FROM patients") ==
          "SELECT * FROM patients");
}

TEST_CASE("StatementExtractor: blank line inside a statement", "[extractor]") {
    CHECK(extracted("SELECT name\n\nFROM patients\n\nORDER BY name") ==
          "SELECT name\n\nFROM patients\n\nORDER BY name");
}

TEST_CASE("StatementExtractor: quotes and parentheses", "[extractor]") {
    CHECK(extracted("SELECT ';' AS sep FROM patients; -- done") == "SELECT ';' AS sep FROM patients");
    CHECK(extracted("SELECT name FROM patients WHERE id IN (\n\n  SELECT patient_id FROM admissions)") ==
          "SELECT name FROM patients WHERE id IN (\n\n  SELECT patient_id FROM admissions)");
}

TEST_CASE("StatementExtractor: common table expressions", "[extractor]") {
    CHECK(extracted("WITH recent AS (SELECT * FROM admissions) SELECT count(*) FROM recent") ==
          "WITH recent AS (SELECT * FROM admissions) SELECT count(*) FROM recent");
    CHECK(extracted("with recursive t(n) as (select 1) select n from t") ==
          "with recursive t(n) as (select 1) select n from t");
}

TEST_CASE("StatementExtractor: non-read statements are passed through", "[extractor]") {
    CHECK(extracted("DROP TABLE patients") == "DROP TABLE patients");
    CHECK(extracted("DELETE FROM admissions WHERE id IN (SELECT id FROM admissions)") ==
          "DELETE FROM admissions WHERE id IN (SELECT id FROM admissions)");
    CHECK(extracted("```sql\nUPDATE patients SET name = 'x';\n```") ==
          "UPDATE patients SET name = 'x'");
    CHECK(extracted("Sure:\nINSERT INTO departments (name) VALUES ('ICU')") ==
          "INSERT INTO departments (name) VALUES ('ICU')");
    CHECK(extracted("TRUNCATE admissions") == "TRUNCATE admissions");

    // Prose verbs without their SQL object do not start a statement
    CHECK(extracted("We can drop the filter here. SELECT * FROM patients") ==
          "SELECT * FROM patients");
}

TEST_CASE("StatementExtractor: unanswerable marker", "[extractor]") {
    for (const std::string completion : {
             "NO_SQL",
             "I cannot answer that. NO_SQL",
             "NO_SQL: there is nothing to select from for billing data"}) {
        INFO(completion);
        const auto r = StatementExtractor::extract(completion);
        REQUIRE(r.is_error());
        CHECK(r.error_kind() == ErrorKind::UNANSWERABLE);
        CHECK_FALSE(r.suggestions().empty());
    }
}

TEST_CASE("StatementExtractor: nothing usable", "[extractor]") {
    const auto empty = StatementExtractor::extract("   \n ");
    REQUIRE(empty.is_error());
    CHECK(empty.error_kind() == ErrorKind::GENERATION_FAILED);

    const auto prose = StatementExtractor::extract("I am not sure what you mean.");
    REQUIRE(prose.is_error());
    CHECK(prose.error_kind() == ErrorKind::GENERATION_FAILED);
}
