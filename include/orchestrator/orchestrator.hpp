#pragma once

#include "analyzer/schema_cache.hpp"
#include "cache/response_cache.hpp"
#include "core/types.hpp"
#include "executor/execution_guard.hpp"
#include "intent/intent_analyzer.hpp"
#include "llm/generation_controller.hpp"
#include "rag/context_retriever.hpp"
#include "session/session_store.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace sqlrag {

/**
 * @brief End-to-end question -> answer pipeline
 *
 * input check -> response cache -> [retrieval I/O || intent] -> ambiguity
 * gate -> context assembly -> generation/validation -> guarded execution ->
 * answer -> cache write -> session turn.
 *
 * Every failure leaves as an ErrorResult with a stable kind and a trace id.
 * Collaborators are shared so a detached retrieval task can outlive a
 * request that gave up on it.
 */
class Orchestrator {
public:
    struct Config {
        size_t max_query_length = 1000;
        std::chrono::milliseconds request_timeout{90000};
        size_t history_window = 3;
    };

    struct Dependencies {
        std::shared_ptr<IntentAnalyzer> intent;
        std::shared_ptr<ContextRetriever> retriever;
        std::shared_ptr<GenerationController> generator;
        std::shared_ptr<ExecutionGuard> executor;
        std::shared_ptr<ResponseCache> cache;
        std::shared_ptr<SessionStore> sessions;
        std::shared_ptr<SchemaCache> schema;
    };

    Orchestrator(Dependencies deps, Config config);

    [[nodiscard]] Outcome process(const std::string& text, const std::string& session_id);

    struct Stats {
        uint64_t requests;
        uint64_t cache_hits;
        uint64_t clarifications;
        uint64_t errors;
    };
    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Outcome run(const std::string& text, const std::string& session_id,
                const std::string& trace_id);

    Outcome from_cache(Response cached, const std::string& text, const std::string& normalized,
                       const std::string& session_id, std::chrono::microseconds latency);

    ErrorResult error(ErrorKind kind, std::string message,
                      std::vector<std::string> suggestions, const std::string& trace_id);

    static std::vector<std::string> execution_suggestions(ErrorKind kind);

    Dependencies deps_;
    Config config_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> clarifications_{0};
    std::atomic<uint64_t> errors_{0};
};

} // namespace sqlrag
