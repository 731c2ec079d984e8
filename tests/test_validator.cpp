#include <catch2/catch_test_macros.hpp>
#include "validation/validator.hpp"
#include "mocks/mock_schema_provider.hpp"

#include <algorithm>

using namespace sqlrag;
using namespace sqlrag::testing;

namespace {

struct ValidatorFixture {
    std::shared_ptr<MockSchemaProvider> provider = make_hospital_schema();
    std::shared_ptr<SchemaCache> schema = std::make_shared<SchemaCache>(provider);
    Validator validator{schema};
};

const ValidationIssue* find_rule(const ValidationResult& r, const std::string& rule_id) {
    const auto it = std::find_if(r.issues.begin(), r.issues.end(),
        [&rule_id](const ValidationIssue& i) { return i.rule_id == rule_id; });
    return it != r.issues.end() ? &*it : nullptr;
}

bool has_rule_prefix(const ValidationResult& r, const std::string& prefix) {
    return std::any_of(r.issues.begin(), r.issues.end(),
        [&prefix](const ValidationIssue& i) { return i.rule_id.starts_with(prefix); });
}

} // anonymous namespace

TEST_CASE("Validator: well-formed read query passes", "[validator]") {
    ValidatorFixture f;
    const auto r = f.validator.validate(
        "SELECT count(*) FROM admissions a JOIN patients p ON p.id = a.patient_id "
        "WHERE a.admitted_at >= current_date - 1;");

    CHECK(r.passed);
    CHECK_FALSE(r.has_blocking());
    CHECK(r.statement.back() != ';');
}

TEST_CASE("Validator: injection patterns are critical", "[validator][security]") {
    ValidatorFixture f;

    for (const std::string sql : {
             "SELECT * FROM patients; DROP TABLE patients",
             "SELECT * FROM patients -- trailing comment",
             "SELECT * FROM patients WHERE id = 1 OR 1=1",
             "SELECT pg_sleep(10)",
             "SELECT chr(65)||chr(66) FROM patients"}) {
        const auto r = f.validator.validate(sql);
        INFO(sql);
        CHECK_FALSE(r.passed);
        CHECK(r.has_severity(Severity::CRITICAL));
        CHECK(has_rule_prefix(r, "injection."));
    }
}

TEST_CASE("Validator: string literals do not trigger patterns", "[validator][security]") {
    ValidatorFixture f;
    const auto r = f.validator.validate(
        "SELECT name FROM patients WHERE name = 'O''Brien; DROP TABLE x -- ' LIMIT 10");
    CHECK(r.passed);
}

TEST_CASE("Validator: only read-only statements", "[validator][security]") {
    ValidatorFixture f;

    SECTION("data modification") {
        const auto r = f.validator.validate("DELETE FROM patients WHERE id = 1");
        CHECK_FALSE(r.passed);
        CHECK(find_rule(r, "operation.not_read_only") != nullptr);
    }

    SECTION("modification hidden in a CTE") {
        const auto r = f.validator.validate(
            "WITH gone AS (DELETE FROM patients RETURNING id) SELECT count(*) FROM gone");
        CHECK_FALSE(r.passed);
        CHECK(find_rule(r, "operation.forbidden_keyword") != nullptr);
    }

    SECTION("row locking") {
        const auto r = f.validator.validate("SELECT * FROM patients FOR UPDATE");
        CHECK_FALSE(r.passed);
        CHECK(find_rule(r, "operation.locking_clause") != nullptr);
    }
}

TEST_CASE("Validator: screen covers the security layers without the schema", "[validator][security]") {
    ValidatorFixture f;

    auto critical_in = [](const std::vector<ValidationIssue>& issues) {
        return std::any_of(issues.begin(), issues.end(),
            [](const ValidationIssue& i) { return i.severity == Severity::CRITICAL; });
    };

    CHECK(critical_in(f.validator.screen("SELECT pg_sleep(1) FROM patientz")));
    CHECK(critical_in(f.validator.screen("SELECT * FROM patientz FOR UPDATE")));
    CHECK(critical_in(f.validator.screen("DELETE FROM admissions")));
    CHECK(critical_in(f.validator.screen("DROP TABLE patients;")));

    CHECK(f.validator.screen("SELECT count(*) FROM patientz").empty());
    CHECK(f.validator.get_stats().validations == 0);
}

TEST_CASE("Validator: unknown table carries ranked candidates", "[validator][schema]") {
    ValidatorFixture f;
    const auto r = f.validator.validate("SELECT count(*) FROM patient");

    CHECK_FALSE(r.passed);
    const auto* issue = find_rule(r, "schema.unknown_table");
    REQUIRE(issue != nullptr);
    CHECK(issue->severity == Severity::ERROR);
    CHECK(issue->message == "Table 'patient' does not exist");
    REQUIRE_FALSE(issue->candidates.empty());
    CHECK(issue->candidates.front() == "patients");
    REQUIRE(issue->suggestion.has_value());
    CHECK(*issue->suggestion == "Did you mean 'patients'?");
}

TEST_CASE("Validator: unknown columns", "[validator][schema]") {
    ValidatorFixture f;

    SECTION("qualified") {
        const auto r = f.validator.validate("SELECT a.admited_at FROM admissions a LIMIT 5");
        CHECK_FALSE(r.passed);
        const auto* issue = find_rule(r, "schema.unknown_column");
        REQUIRE(issue != nullptr);
        REQUIRE_FALSE(issue->candidates.empty());
        CHECK(issue->candidates.front() == "admitted_at");
    }

    SECTION("unqualified") {
        const auto r = f.validator.validate("SELECT full_name FROM patients LIMIT 5");
        CHECK_FALSE(r.passed);
        CHECK(find_rule(r, "schema.unknown_column") != nullptr);
    }

    SECTION("unknown alias") {
        const auto r = f.validator.validate("SELECT x.name FROM patients p LIMIT 5");
        CHECK_FALSE(r.passed);
        CHECK(find_rule(r, "schema.unknown_alias") != nullptr);
    }

    SECTION("output aliases and CTE columns are not catalog columns") {
        CHECK(f.validator.validate(
            "SELECT count(*) AS total FROM admissions GROUP BY department_id ORDER BY total").passed);
        CHECK(f.validator.validate(
            "WITH c AS (SELECT department_id, count(*) AS n FROM admissions GROUP BY department_id) "
            "SELECT c.n FROM c").passed);
    }
}

TEST_CASE("Validator: syntax errors block", "[validator]") {
    ValidatorFixture f;
    const auto r = f.validator.validate("SELECT FROM WHERE");
    CHECK_FALSE(r.passed);
    CHECK(find_rule(r, "syntax.parse_error") != nullptr);

    CHECK(find_rule(f.validator.validate("   "), "syntax.empty") != nullptr);
}

TEST_CASE("Validator: cost warnings do not block", "[validator][cost]") {
    ValidatorFixture f;
    const auto r = f.validator.validate("SELECT * FROM lab_results");

    CHECK(r.passed);
    CHECK(find_rule(r, "cost.large_result") != nullptr);
    CHECK(r.risk >= RiskLevel::MEDIUM);
    CHECK_FALSE(r.warnings().empty());
}

TEST_CASE("Validator: complexity ceilings warn", "[validator]") {
    auto provider = make_hospital_schema();
    Validator validator(std::make_shared<SchemaCache>(provider),
                        Validator::Config{.max_joins = 1});

    const auto r = validator.validate(
        "SELECT p.name FROM admissions a "
        "JOIN patients p ON p.id = a.patient_id "
        "JOIN departments d ON d.id = a.department_id LIMIT 10");
    CHECK(r.passed);
    CHECK(find_rule(r, "complexity.joins") != nullptr);
}

TEST_CASE("Validator: results are cached per schema version", "[validator]") {
    ValidatorFixture f;
    const std::string sql = "SELECT count(*) FROM invoices";

    CHECK_FALSE(f.validator.validate(sql).passed);
    CHECK_FALSE(f.validator.validate(sql).passed);
    CHECK(f.validator.get_stats().cache_hits == 1);

    f.provider->add_table("invoices", {{"id", "integer"}});
    f.provider->set_version("v2");
    CHECK(f.validator.validate(sql).passed);
    CHECK(f.validator.get_stats().cache_hits == 1);
}

TEST_CASE("CostEstimator: risk bands", "[cost]") {
    CHECK(CostEstimator::risk_for_score(2.0) == RiskLevel::LOW);
    CHECK(CostEstimator::risk_for_score(6.0) == RiskLevel::MEDIUM);
    CHECK(CostEstimator::risk_for_score(12.0) == RiskLevel::HIGH);
    CHECK(CostEstimator::risk_for_score(20.0) == RiskLevel::VERY_HIGH);
}
