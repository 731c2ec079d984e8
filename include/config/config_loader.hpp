#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace sqlrag {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * String values may reference the environment as ${VAR} or ${VAR:default}.
 * Missing sections and keys keep their defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        SqlRagConfig config;

        static LoadResult ok(SqlRagConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to sqlrag.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Replace ${VAR} / ${VAR:default} with environment values
     * @throws std::runtime_error on an unclosed reference
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

    /**
     * @brief Range checks; one message per violation
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const SqlRagConfig& config);

private:
    static SqlRagConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(SqlRagConfig config);

    static LoggingConfig extract_logging(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static LlmConfig extract_llm(const toml::table& root);
    static OllamaEmbeddingClient::Config extract_embedding(const toml::table& root);
    static ContextRetriever::Config extract_retrieval(const toml::table& root);
    static GenerationController::Config extract_generation(const toml::table& root);
    static ValidationConfig extract_validation(const toml::table& root);
    static ExecutionGuard::Config extract_execution(const toml::table& root);
    static CircuitBreaker::Config extract_circuit_breaker(const toml::table& root);
    static ResponseCache::Config extract_cache(const toml::table& root);
    static SessionStore::Config extract_session(const toml::table& root);
    static OrchestratorConfig extract_orchestrator(const toml::table& root);
    static std::vector<ExamplePayload> extract_examples(const toml::table& root);
    static std::vector<RulePayload> extract_rules(const toml::table& root);
};

} // namespace sqlrag
