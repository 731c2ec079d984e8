#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlrag {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::chrono::milliseconds toml_ms(const toml::table& tbl, const std::string_view key,
                                  std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(tbl[key].value_or(static_cast<int64_t>(fallback.count())));
}

template<typename T>
T toml_uint(const toml::table& tbl, const std::string_view key, T fallback) {
    const int64_t v = tbl[key].value_or(static_cast<int64_t>(fallback));
    return v < 0 ? fallback : static_cast<T>(v);
}

OllamaEndpoint extract_endpoint(const toml::table& t) {
    OllamaEndpoint ep;
    ep.base_url = t["base_url"].value_or(ep.base_url);
    ep.timeout = toml_ms(t, "timeout_ms", ep.timeout);
    ep.retry_attempts = toml_uint(t, "retry_attempts", ep.retry_attempts);
    ep.backoff_base = toml_ms(t, "backoff_base_ms", ep.backoff_base);
    return ep;
}

std::vector<IntentKind> parse_intents(const std::vector<std::string>& names) {
    std::vector<IntentKind> out;
    for (const auto& n : names) {
        const auto kind = parse_intent_kind(n);
        if (!kind) {
            throw std::runtime_error(std::format("Unknown intent '{}'", n));
        }
        out.push_back(*kind);
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string body = input.substr(i + 2, close - i - 2);
            const size_t colon = body.find(':');
            const std::string var_name = body.substr(0, colon);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) {
                result += env_val;
            } else if (colon != std::string::npos) {
                result += body.substr(colon + 1);
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.connect_timeout = std::chrono::seconds(d["connect_timeout_seconds"].value_or(int64_t{5}));
    cfg.pool.min_connections = toml_uint(d, "min_connections", cfg.pool.min_connections);
    cfg.pool.max_connections = toml_uint(d, "max_connections", cfg.pool.max_connections);
    cfg.pool.idle_timeout = toml_ms(d, "idle_timeout_ms", cfg.pool.idle_timeout);
    cfg.pool.health_check_query = d["health_check_query"].value_or(cfg.pool.health_check_query);
    cfg.pool.max_lifetime = std::chrono::seconds(
        d["max_lifetime_seconds"].value_or(static_cast<int64_t>(cfg.pool.max_lifetime.count())));
    cfg.schema.schema_name = d["schema"].value_or(cfg.schema.schema_name);
    cfg.schema.acquire_timeout = toml_ms(d, "schema_acquire_timeout_ms", cfg.schema.acquire_timeout);
    cfg.schema.version_check_interval =
        toml_ms(d, "schema_version_check_interval_ms", cfg.schema.version_check_interval);
    return cfg;
}

LlmConfig ConfigLoader::extract_llm(const toml::table& root) {
    LlmConfig cfg;
    const auto* llm = root["llm"].as_table();
    if (!llm) return cfg;
    const auto& l = *llm;

    cfg.client.endpoint = extract_endpoint(l);
    cfg.client.model = l["model"].value_or(cfg.client.model);
    cfg.client.top_p = l["top_p"].value_or(cfg.client.top_p);
    cfg.rate_limit.max_calls = toml_uint(l, "rate_limit_calls", cfg.rate_limit.max_calls);
    cfg.rate_limit.window = toml_ms(l, "rate_limit_window_ms", cfg.rate_limit.window);
    return cfg;
}

OllamaEmbeddingClient::Config ConfigLoader::extract_embedding(const toml::table& root) {
    OllamaEmbeddingClient::Config cfg;
    const auto* embedding = root["embedding"].as_table();
    if (!embedding) return cfg;

    cfg.endpoint = extract_endpoint(*embedding);
    cfg.model = (*embedding)["model"].value_or(cfg.model);
    return cfg;
}

ContextRetriever::Config ConfigLoader::extract_retrieval(const toml::table& root) {
    ContextRetriever::Config cfg;
    const auto* retrieval = root["retrieval"].as_table();
    if (!retrieval) return cfg;
    const auto& r = *retrieval;

    cfg.top_k_simple = toml_uint(r, "top_k_simple", cfg.top_k_simple);
    cfg.top_k_default = toml_uint(r, "top_k_default", cfg.top_k_default);
    cfg.top_k_complex = toml_uint(r, "top_k_complex", cfg.top_k_complex);
    cfg.similarity_threshold = r["similarity_threshold"].value_or(cfg.similarity_threshold);
    cfg.max_hops = toml_uint(r, "max_hops", cfg.max_hops);
    cfg.max_tables = toml_uint(r, "max_tables", cfg.max_tables);
    cfg.max_examples = toml_uint(r, "max_examples", cfg.max_examples);
    cfg.max_rules = toml_uint(r, "max_rules", cfg.max_rules);
    cfg.token_budget = toml_uint(r, "token_budget", cfg.token_budget);
    cfg.prompt_overhead_tokens = toml_uint(r, "prompt_overhead_tokens", cfg.prompt_overhead_tokens);
    cfg.embedding_cache_size = toml_uint(r, "embedding_cache_size", cfg.embedding_cache_size);
    return cfg;
}

GenerationController::Config ConfigLoader::extract_generation(const toml::table& root) {
    GenerationController::Config cfg;
    const auto* generation = root["generation"].as_table();
    if (!generation) return cfg;
    const auto& g = *generation;

    cfg.max_attempts = toml_uint(g, "max_attempts", cfg.max_attempts);
    cfg.max_tokens = toml_uint(g, "max_tokens", cfg.max_tokens);
    cfg.temperature = g["temperature"].value_or(cfg.temperature);
    if (g["stop"].as_array()) {
        cfg.stop = toml_string_array(g, "stop");
    }
    cfg.max_candidates = toml_uint(g, "max_candidates", cfg.max_candidates);
    cfg.prompt.dialect = g["dialect"].value_or(cfg.prompt.dialect);
    cfg.prompt.max_recent_turns = toml_uint(g, "max_recent_turns", cfg.prompt.max_recent_turns);
    return cfg;
}

ValidationConfig ConfigLoader::extract_validation(const toml::table& root) {
    ValidationConfig cfg;
    const auto* validation = root["validation"].as_table();
    if (!validation) return cfg;
    const auto& v = *validation;

    cfg.validator.max_joins = toml_uint(v, "max_joins", cfg.validator.max_joins);
    cfg.validator.max_subquery_depth = toml_uint(v, "max_subquery_depth", cfg.validator.max_subquery_depth);
    cfg.validator.max_unions = toml_uint(v, "max_unions", cfg.validator.max_unions);
    cfg.validator.large_table_rows = toml_uint(v, "large_table_rows", cfg.validator.large_table_rows);
    cfg.validator.max_suggestions = toml_uint(v, "max_suggestions", cfg.validator.max_suggestions);
    cfg.validator.cache_max_entries = toml_uint(v, "cache_max_entries", cfg.validator.cache_max_entries);
    cfg.validator.cache_ttl = std::chrono::seconds(
        v["cache_ttl_seconds"].value_or(static_cast<int64_t>(cfg.validator.cache_ttl.count())));
    cfg.schema_cache.ttl = std::chrono::seconds(
        v["schema_ttl_seconds"].value_or(static_cast<int64_t>(cfg.schema_cache.ttl.count())));
    return cfg;
}

ExecutionGuard::Config ConfigLoader::extract_execution(const toml::table& root) {
    ExecutionGuard::Config cfg;
    const auto* execution = root["execution"].as_table();
    if (!execution) return cfg;
    const auto& e = *execution;

    cfg.acquire_timeout = toml_ms(e, "acquire_timeout_ms", cfg.acquire_timeout);
    cfg.query_timeout = toml_ms(e, "query_timeout_ms", cfg.query_timeout);
    cfg.lock_timeout = toml_ms(e, "lock_timeout_ms", cfg.lock_timeout);
    cfg.max_retries = toml_uint(e, "max_retries", cfg.max_retries);
    cfg.initial_backoff = toml_ms(e, "initial_backoff_ms", cfg.initial_backoff);
    cfg.backoff_multiplier = e["backoff_multiplier"].value_or(cfg.backoff_multiplier);
    cfg.max_backoff = toml_ms(e, "max_backoff_ms", cfg.max_backoff);
    cfg.initial_batch_rows = toml_uint(e, "initial_batch_rows", cfg.initial_batch_rows);
    cfg.hard_cap_rows = toml_uint(e, "hard_cap_rows", cfg.hard_cap_rows);
    cfg.large_result_ceiling = toml_uint(e, "large_result_ceiling", cfg.large_result_ceiling);
    return cfg;
}

CircuitBreaker::Config ConfigLoader::extract_circuit_breaker(const toml::table& root) {
    CircuitBreaker::Config cfg;
    const auto* cb = root["circuit_breaker"].as_table();
    if (!cb) return cfg;
    const auto& c = *cb;

    cfg.failure_threshold = toml_uint(c, "failure_threshold", cfg.failure_threshold);
    cfg.success_threshold = toml_uint(c, "success_threshold", cfg.success_threshold);
    cfg.cooldown = toml_ms(c, "cooldown_ms", cfg.cooldown);
    cfg.half_open_max_calls = toml_uint(c, "half_open_max_calls", cfg.half_open_max_calls);
    return cfg;
}

ResponseCache::Config ConfigLoader::extract_cache(const toml::table& root) {
    ResponseCache::Config cfg;
    const auto* cache = root["cache"].as_table();
    if (!cache) return cfg;
    const auto& c = *cache;

    cfg.enabled = c["enabled"].value_or(cfg.enabled);
    cfg.max_entries = toml_uint(c, "max_entries", cfg.max_entries);
    cfg.num_shards = toml_uint(c, "num_shards", cfg.num_shards);
    cfg.ttl = std::chrono::seconds(c["ttl_seconds"].value_or(static_cast<int64_t>(cfg.ttl.count())));
    return cfg;
}

SessionStore::Config ConfigLoader::extract_session(const toml::table& root) {
    SessionStore::Config cfg;
    const auto* session = root["session"].as_table();
    if (!session) return cfg;
    const auto& s = *session;

    cfg.max_history = toml_uint(s, "max_history", cfg.max_history);
    cfg.idle_timeout = std::chrono::seconds(
        s["idle_timeout_seconds"].value_or(static_cast<int64_t>(cfg.idle_timeout.count())));
    cfg.max_sessions = toml_uint(s, "max_sessions", cfg.max_sessions);
    return cfg;
}

OrchestratorConfig ConfigLoader::extract_orchestrator(const toml::table& root) {
    OrchestratorConfig cfg;
    const auto* orchestrator = root["orchestrator"].as_table();
    if (!orchestrator) return cfg;
    const auto& o = *orchestrator;

    cfg.pipeline.max_query_length = toml_uint(o, "max_query_length", cfg.pipeline.max_query_length);
    cfg.pipeline.request_timeout = toml_ms(o, "request_timeout_ms", cfg.pipeline.request_timeout);
    cfg.pipeline.history_window = toml_uint(o, "history_window", cfg.pipeline.history_window);
    cfg.intent.confidence_threshold = o["confidence_threshold"].value_or(cfg.intent.confidence_threshold);
    return cfg;
}

std::vector<ExamplePayload> ConfigLoader::extract_examples(const toml::table& root) {
    std::vector<ExamplePayload> result;
    const auto* arr = root["examples"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* ex = elem.as_table();
        if (!ex) continue;

        ExamplePayload example;
        example.question = (*ex)["question"].value_or(""s);
        example.statement = (*ex)["sql"].value_or(""s);
        if (const auto intent = (*ex)["intent"].value<std::string>()) {
            example.intent = parse_intents({*intent}).front();
        }
        if (example.question.empty() || example.statement.empty()) {
            throw std::runtime_error("examples entries need both 'question' and 'sql'");
        }
        result.emplace_back(std::move(example));
    }
    return result;
}

std::vector<RulePayload> ConfigLoader::extract_rules(const toml::table& root) {
    std::vector<RulePayload> result;
    const auto* arr = root["rules"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* r = elem.as_table();
        if (!r) continue;

        RulePayload rule;
        rule.text = (*r)["text"].value_or(""s);
        rule.intents = parse_intents(toml_string_array(*r, "intents"));
        if (rule.text.empty()) {
            throw std::runtime_error("rules entries need a non-empty 'text'");
        }
        result.emplace_back(std::move(rule));
    }
    return result;
}

SqlRagConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    SqlRagConfig config;
    config.logging = extract_logging(tbl);
    config.database = extract_database(tbl);
    config.llm = extract_llm(tbl);
    config.embedding = extract_embedding(tbl);
    config.retrieval = extract_retrieval(tbl);
    config.generation = extract_generation(tbl);
    config.validation = extract_validation(tbl);
    config.execution = extract_execution(tbl);
    config.circuit_breaker = extract_circuit_breaker(tbl);
    config.cache = extract_cache(tbl);
    config.session = extract_session(tbl);
    config.orchestrator = extract_orchestrator(tbl);
    config.examples = extract_examples(tbl);
    config.rules = extract_rules(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(SqlRagConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SqlRagConfig& config) {
    std::vector<std::string> errors;

    const auto& db = config.database;
    if (db.pool.max_connections == 0) {
        errors.push_back("database.max_connections must be > 0");
    }
    if (db.pool.min_connections > db.pool.max_connections) {
        errors.push_back(std::format("database.min_connections ({}) > max_connections ({})",
            db.pool.min_connections, db.pool.max_connections));
    }

    if (config.llm.client.endpoint.base_url.empty()) {
        errors.push_back("llm.base_url must not be empty");
    }
    if (config.llm.rate_limit.max_calls == 0) {
        errors.push_back("llm.rate_limit_calls must be > 0");
    }
    if (config.embedding.endpoint.base_url.empty()) {
        errors.push_back("embedding.base_url must not be empty");
    }

    const auto& r = config.retrieval;
    if (r.similarity_threshold < 0.0 || r.similarity_threshold > 1.0) {
        errors.push_back(std::format("retrieval.similarity_threshold must be 0-1, got {}",
            r.similarity_threshold));
    }
    if (r.top_k_simple == 0 || r.top_k_simple > r.top_k_default || r.top_k_default > r.top_k_complex) {
        errors.push_back("retrieval.top_k_* must satisfy 0 < simple <= default <= complex");
    }
    if (r.prompt_overhead_tokens >= r.token_budget) {
        errors.push_back(std::format("retrieval.prompt_overhead_tokens ({}) must be < token_budget ({})",
            r.prompt_overhead_tokens, r.token_budget));
    }
    if (r.max_tables == 0) {
        errors.push_back("retrieval.max_tables must be > 0");
    }

    const auto& g = config.generation;
    if (g.max_attempts < 1 || g.max_attempts > 5) {
        errors.push_back(std::format("generation.max_attempts must be 1-5, got {}", g.max_attempts));
    }
    if (g.temperature < 0.0 || g.temperature > 2.0) {
        errors.push_back(std::format("generation.temperature must be 0-2, got {}", g.temperature));
    }
    if (g.max_tokens == 0) {
        errors.push_back("generation.max_tokens must be > 0");
    }

    const auto& e = config.execution;
    if (e.query_timeout.count() <= 0) {
        errors.push_back("execution.query_timeout_ms must be > 0");
    }
    if (e.initial_batch_rows == 0 || e.initial_batch_rows > e.hard_cap_rows) {
        errors.push_back("execution.initial_batch_rows must satisfy 0 < initial_batch_rows <= hard_cap_rows");
    }
    if (e.hard_cap_rows > e.large_result_ceiling) {
        errors.push_back("execution.hard_cap_rows must be <= large_result_ceiling");
    }
    if (e.backoff_multiplier < 1.0) {
        errors.push_back("execution.backoff_multiplier must be >= 1");
    }

    const auto& cb = config.circuit_breaker;
    if (cb.failure_threshold == 0) {
        errors.push_back("circuit_breaker.failure_threshold must be > 0");
    }
    if (cb.success_threshold == 0) {
        errors.push_back("circuit_breaker.success_threshold must be > 0");
    }
    if (cb.cooldown.count() <= 0) {
        errors.push_back("circuit_breaker.cooldown_ms must be > 0");
    }

    if (config.cache.enabled && (config.cache.num_shards == 0 || config.cache.max_entries == 0)) {
        errors.push_back("cache.num_shards and cache.max_entries must be > 0 when enabled");
    }

    if (config.session.max_history == 0) {
        errors.push_back("session.max_history must be > 0");
    }

    const auto& o = config.orchestrator;
    if (o.pipeline.max_query_length == 0) {
        errors.push_back("orchestrator.max_query_length must be > 0");
    }
    if (o.pipeline.request_timeout.count() <= 0) {
        errors.push_back("orchestrator.request_timeout_ms must be > 0");
    }
    if (o.intent.confidence_threshold < 0.0 || o.intent.confidence_threshold > 1.0) {
        errors.push_back(std::format("orchestrator.confidence_threshold must be 0-1, got {}",
            o.intent.confidence_threshold));
    }

    return errors;
}

} // namespace sqlrag
