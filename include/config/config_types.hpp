#pragma once

#include "analyzer/schema_cache.hpp"
#include "cache/response_cache.hpp"
#include "core/types.hpp"
#include "db/iconnection_pool.hpp"
#include "db/postgresql/pg_schema_provider.hpp"
#include "executor/circuit_breaker.hpp"
#include "executor/execution_guard.hpp"
#include "intent/intent_analyzer.hpp"
#include "llm/generation_controller.hpp"
#include "llm/ollama_client.hpp"
#include "llm/rate_limiter.hpp"
#include "orchestrator/orchestrator.hpp"
#include "rag/context_retriever.hpp"
#include "rag/ollama_embedding_client.hpp"
#include "session/session_store.hpp"
#include "validation/validator.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace sqlrag {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct DatabaseConfig {
    std::string connection_string;
    std::chrono::seconds connect_timeout{5};
    PoolConfig pool;
    PgSchemaProvider::Config schema;
};

struct LlmConfig {
    OllamaClient::Config client;
    RateLimiter::Config rate_limit;
};

struct ValidationConfig {
    Validator::Config validator;
    SchemaCache::Config schema_cache;
};

struct OrchestratorConfig {
    Orchestrator::Config pipeline;
    IntentAnalyzer::Config intent;
};

// ============================================================================
// SqlRagConfig - complete parsed configuration
// ============================================================================

struct SqlRagConfig {
    LoggingConfig logging;
    DatabaseConfig database;
    LlmConfig llm;
    OllamaEmbeddingClient::Config embedding;
    ContextRetriever::Config retrieval;
    GenerationController::Config generation;
    ValidationConfig validation;
    ExecutionGuard::Config execution;
    CircuitBreaker::Config circuit_breaker;
    ResponseCache::Config cache;
    SessionStore::Config session;
    OrchestratorConfig orchestrator;
    std::vector<ExamplePayload> examples;
    std::vector<RulePayload> rules;
};

} // namespace sqlrag
