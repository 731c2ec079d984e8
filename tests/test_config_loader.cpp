#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace sqlrag;

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.database.pool.max_connections == 8);
    CHECK(cfg.llm.client.endpoint.base_url == "http://localhost:11434");
    CHECK(cfg.llm.client.model == "gemma:2b");
    CHECK(cfg.embedding.model == "nomic-embed-text");
    CHECK(cfg.retrieval.token_budget == 2000);
    CHECK(cfg.generation.max_attempts == 2);
    CHECK(cfg.execution.hard_cap_rows == 10000);
    CHECK(cfg.circuit_breaker.failure_threshold == 5);
    CHECK(cfg.session.max_history == 10);
    CHECK(cfg.orchestrator.pipeline.max_query_length == 1000);
    CHECK(cfg.orchestrator.intent.confidence_threshold == Catch::Approx(0.7));
    CHECK(cfg.examples.empty());
    CHECK(cfg.rules.empty());
}

TEST_CASE("ConfigLoader: sections override defaults", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[database]
connection_string = "host=db dbname=hospital"
min_connections = 2
max_connections = 4
schema = "clinical"

[llm]
base_url = "http://ollama:11434"
model = "sqlcoder"
timeout_ms = 30000
rate_limit_calls = 10
rate_limit_window_ms = 1000

[embedding]
model = "mxbai-embed-large"

[retrieval]
similarity_threshold = 0.5
max_tables = 3
token_budget = 1500

[generation]
max_attempts = 3
temperature = 0.0
stop = [";"]

[validation]
max_joins = 4

[execution]
query_timeout_ms = 5000
max_retries = 1
hard_cap_rows = 500
initial_batch_rows = 100

[circuit_breaker]
failure_threshold = 3
cooldown_ms = 10000

[cache]
enabled = false

[session]
max_history = 5

[orchestrator]
request_timeout_ms = 60000
confidence_threshold = 0.6
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.database.connection_string == "host=db dbname=hospital");
    CHECK(cfg.database.pool.min_connections == 2);
    CHECK(cfg.database.pool.max_connections == 4);
    CHECK(cfg.database.schema.schema_name == "clinical");
    CHECK(cfg.llm.client.endpoint.base_url == "http://ollama:11434");
    CHECK(cfg.llm.client.model == "sqlcoder");
    CHECK(cfg.llm.client.endpoint.timeout == std::chrono::milliseconds{30000});
    CHECK(cfg.llm.rate_limit.max_calls == 10);
    CHECK(cfg.embedding.model == "mxbai-embed-large");
    CHECK(cfg.retrieval.similarity_threshold == Catch::Approx(0.5));
    CHECK(cfg.retrieval.max_tables == 3);
    CHECK(cfg.retrieval.token_budget == 1500);
    CHECK(cfg.generation.max_attempts == 3);
    CHECK(cfg.generation.stop == std::vector<std::string>{";"});
    CHECK(cfg.validation.validator.max_joins == 4);
    CHECK(cfg.execution.query_timeout == std::chrono::milliseconds{5000});
    CHECK(cfg.execution.max_retries == 1);
    CHECK(cfg.execution.hard_cap_rows == 500);
    CHECK(cfg.circuit_breaker.failure_threshold == 3);
    CHECK(cfg.circuit_breaker.cooldown == std::chrono::milliseconds{10000});
    CHECK_FALSE(cfg.cache.enabled);
    CHECK(cfg.session.max_history == 5);
    CHECK(cfg.orchestrator.pipeline.request_timeout == std::chrono::milliseconds{60000});
}

TEST_CASE("ConfigLoader: examples and rules", "[config]") {
    const std::string toml = R"(
[[examples]]
question = "How many patients are there?"
sql = "SELECT COUNT(*) FROM patients"
intent = "count"

[[examples]]
question = "List departments"
sql = "SELECT name FROM departments"

[[rules]]
text = "Discharged means discharged_at IS NOT NULL"

[[rules]]
text = "Group trends by week"
intents = ["trend", "comparison"]
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    REQUIRE(cfg.examples.size() == 2);
    CHECK(cfg.examples[0].intent == IntentKind::COUNT);
    CHECK(cfg.examples[0].statement == "SELECT COUNT(*) FROM patients");
    CHECK(cfg.examples[1].intent == IntentKind::UNKNOWN);

    REQUIRE(cfg.rules.size() == 2);
    CHECK(cfg.rules[0].intents.empty());
    CHECK(cfg.rules[1].intents == std::vector<IntentKind>{IntentKind::TREND, IntentKind::COMPARISON});

    SECTION("unknown intent") {
        auto bad = ConfigLoader::load_from_string(R"(
[[rules]]
text = "x"
intents = ["forecast"]
)");
        CHECK_FALSE(bad.success);
        CHECK(bad.error_message.find("Unknown intent 'forecast'") != std::string::npos);
    }

    SECTION("example without sql") {
        auto bad = ConfigLoader::load_from_string(R"(
[[examples]]
question = "How many?"
)");
        CHECK_FALSE(bad.success);
        CHECK(bad.error_message.find("'question' and 'sql'") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: environment expansion", "[config][env]") {
    ::setenv("SQLRAG_TEST_DB_PASSWORD", "s3cret", 1);
    ::unsetenv("SQLRAG_TEST_OLLAMA_URL");

    const std::string toml = R"(
[database]
connection_string = "host=localhost password=${SQLRAG_TEST_DB_PASSWORD} dbname=hospital"

[llm]
base_url = "${SQLRAG_TEST_OLLAMA_URL:http://fallback:11434}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=localhost password=s3cret dbname=hospital");
    CHECK(result.config.llm.client.endpoint.base_url == "http://fallback:11434");

    ::unsetenv("SQLRAG_TEST_DB_PASSWORD");

    SECTION("missing variable without default expands to empty") {
        CHECK(ConfigLoader::expand_env_vars("a${SQLRAG_TEST_MISSING_XYZ}b") == "ab");
    }

    SECTION("unclosed reference is an error") {
        auto bad = ConfigLoader::load_from_string(R"(
[database]
connection_string = "password=${UNCLOSED"
)");
        CHECK_FALSE(bad.success);
        CHECK(bad.error_message.find("Unclosed") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: validation", "[config][validation]") {
    SECTION("pool bounds") {
        auto result = ConfigLoader::load_from_string(R"(
[database]
min_connections = 10
max_connections = 2
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("min_connections (10) > max_connections (2)") != std::string::npos);
    }

    SECTION("threshold out of range") {
        auto result = ConfigLoader::load_from_string(R"(
[retrieval]
similarity_threshold = 1.5
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("retrieval.similarity_threshold") != std::string::npos);
    }

    SECTION("overhead exceeds budget") {
        auto result = ConfigLoader::load_from_string(R"(
[retrieval]
token_budget = 300
prompt_overhead_tokens = 400
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("prompt_overhead_tokens") != std::string::npos);
    }

    SECTION("attempts bounded") {
        auto result = ConfigLoader::load_from_string(R"(
[generation]
max_attempts = 9
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("generation.max_attempts must be 1-5, got 9") != std::string::npos);
    }

    SECTION("row caps ordered") {
        auto result = ConfigLoader::load_from_string(R"(
[execution]
initial_batch_rows = 2000
hard_cap_rows = 1000
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("initial_batch_rows") != std::string::npos);
    }

    SECTION("every violation reported") {
        SqlRagConfig cfg;
        cfg.circuit_breaker.failure_threshold = 0;
        cfg.session.max_history = 0;
        cfg.orchestrator.intent.confidence_threshold = -0.1;
        const auto errors = ConfigLoader::validate_config(cfg);
        CHECK(errors.size() == 3);
    }

    SECTION("defaults are valid") {
        CHECK(ConfigLoader::validate_config(SqlRagConfig{}).empty());
    }
}

TEST_CASE("ConfigLoader: malformed TOML", "[config]") {
    auto result = ConfigLoader::load_from_string("[database\nmax_connections = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing file", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/sqlrag.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}
