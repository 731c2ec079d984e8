#include "analyzer/schema_cache.hpp"
#include "cache/response_cache.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_schema_provider.hpp"
#include "executor/circuit_breaker.hpp"
#include "executor/execution_guard.hpp"
#include "intent/intent_analyzer.hpp"
#include "llm/generation_controller.hpp"
#include "llm/ollama_client.hpp"
#include "llm/rate_limiter.hpp"
#include "orchestrator/orchestrator.hpp"
#include "rag/context_retriever.hpp"
#include "rag/in_memory_vector_store.hpp"
#include "rag/ollama_embedding_client.hpp"
#include "rag/schema_indexer.hpp"
#include "session/session_store.hpp"
#include "validation/validator.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <signal.h>

using namespace sqlrag;

namespace {

constexpr size_t kMaxPrintedRows = 20;
constexpr std::chrono::minutes kIndexingBudget{10};

std::atomic<bool> g_stop{false};

void signal_handler(int /*signal*/) {
    if (g_stop.exchange(true)) {
        std::_Exit(130);
    }
}

// No SA_RESTART, so a blocking read returns when the signal arrives
void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

std::string ms(std::chrono::microseconds us) {
    return std::format("{:.1f}ms", static_cast<double>(us.count()) / 1000.0);
}

void print_response(const Response& r) {
    std::cout << "\n" << r.answer << "\n\n";
    std::cout << "SQL: " << r.statement << "\n";

    const auto& exec = r.execution;
    if (!exec.column_names.empty()) {
        std::cout << "\n" << utils::join(exec.column_names, " | ") << "\n";
        const size_t shown = std::min(exec.rows.size(), kMaxPrintedRows);
        for (size_t i = 0; i < shown; ++i) {
            std::cout << utils::join(exec.rows[i], " | ") << "\n";
        }
        if (exec.rows.size() > shown) {
            std::cout << std::format("... {} more rows\n", exec.rows.size() - shown);
        }
    }

    for (const auto& w : r.warnings) {
        std::cout << "warning: " << w << "\n";
    }
    std::cout << std::format("\n[cache hit: {}, total {}, intent {}, retrieval {}, generation {}, execution {}]\n",
        r.cache_hit ? "yes" : "no", ms(r.latency),
        ms(r.timings.intent), ms(r.timings.retrieval), ms(r.timings.generation),
        ms(r.timings.execution));
}

void print_outcome(const Outcome& outcome) {
    if (const auto* response = std::get_if<Response>(&outcome)) {
        print_response(*response);
    } else if (const auto* clarification = std::get_if<ClarificationRequest>(&outcome)) {
        std::cout << std::format("\nI need a bit more detail (confidence {:.2f}):\n",
                                 clarification->confidence);
        for (const auto& q : clarification->questions) {
            std::cout << "  - " << q << "\n";
        }
    } else if (const auto* err = std::get_if<ErrorResult>(&outcome)) {
        std::cout << std::format("\nError ({}): {}\n", error_kind_to_string(err->kind), err->message);
        for (const auto& s : err->suggestions) {
            std::cout << "  - " << s << "\n";
        }
        std::cout << "trace id: " << err->trace_id << "\n";
    }
    std::cout << std::endl;
}

void print_history(const SessionStore& sessions, const std::string& session_id) {
    const auto turns = sessions.history(session_id);
    if (turns.empty()) {
        std::cout << "No questions yet.\n\n";
        return;
    }
    for (size_t i = 0; i < turns.size(); ++i) {
        const auto& t = turns[i];
        std::cout << std::format("{:>2}. {}\n    {}\n", i + 1, t.query.text, t.response.statement);
    }
    std::cout << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        install_signal_handlers();

        std::string config_file = "config/sqlrag.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/6] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        SqlRagConfig cfg;
        if (config_result.success) {
            cfg = std::move(config_result.config);
        } else {
            utils::log::warn(std::format("{} - using defaults", config_result.error_message));
        }
        utils::log::set_level(utils::log::parse_level(cfg.logging.level));

        utils::log::info(std::format("[2/6] Datastore pool: {}-{} connections",
            cfg.database.pool.min_connections, cfg.database.pool.max_connections));
        auto factory = std::make_shared<PgConnectionFactory>(
            cfg.database.connection_string, cfg.database.connect_timeout);
        auto pool = std::make_shared<GenericConnectionPool>("primary", cfg.database.pool, factory);

        auto provider = std::make_shared<PgSchemaProvider>(pool, cfg.database.schema);
        auto schema = std::make_shared<SchemaCache>(provider, cfg.validation.schema_cache);
        const auto snapshot = schema->snapshot();
        utils::log::info(std::format("[3/6] Schema: {} tables (version {})",
            snapshot->size(), schema->version()));

        auto embeddings = std::make_shared<OllamaEmbeddingClient>(cfg.embedding);
        auto store = std::make_shared<InMemoryVectorStore>();
        auto indexer = std::make_shared<SchemaIndexer>(embeddings, store);
        auto indexed = indexer->index(*snapshot, cfg.examples, cfg.rules,
                                      Deadline::after(kIndexingBudget));
        if (indexed.is_error()) {
            utils::log::warn(std::format("[4/6] Schema indexing failed ({}): {}; retrieval will be degraded",
                error_kind_to_string(indexed.error_kind()), indexed.error_message()));
        } else {
            utils::log::info(std::format("[4/6] Vector store: {} documents", indexed.value()));
        }

        auto limiter = std::make_shared<RateLimiter>(cfg.llm.rate_limit);
        auto llm = std::make_shared<OllamaClient>(cfg.llm.client, limiter);
        auto validator = std::make_shared<Validator>(schema, cfg.validation.validator);
        auto generator = std::make_shared<GenerationController>(
            llm, provider, validator, cfg.generation);
        utils::log::info(std::format("[5/6] Generation: model {} at {}",
            cfg.llm.client.model, cfg.llm.client.endpoint.base_url));

        auto breaker = std::make_shared<CircuitBreaker>("primary", cfg.circuit_breaker);
        breaker->set_on_state_change([](const StateChangeEvent& e) {
            utils::log::warn(std::format("Circuit '{}': {} -> {}", e.breaker_name,
                circuit_state_to_string(e.from), circuit_state_to_string(e.to)));
        });

        auto intent = std::make_shared<IntentAnalyzer>(cfg.orchestrator.intent, schema->table_names());

        // DDL seen by the schema cache: rebuild the vector index and the table vocabulary
        schema->set_on_change([indexer, intent, examples = cfg.examples, rules = cfg.rules](
                                  const SchemaChangeEvent& e) {
            std::vector<std::string> names;
            names.reserve(e.snapshot->size());
            for (const auto& [key, table] : *e.snapshot) {
                names.push_back(table->name);
            }
            intent->set_vocabulary(std::move(names));

            auto reindexed = indexer->index(*e.snapshot, examples, rules, Deadline::after(kIndexingBudget));
            if (reindexed.is_error()) {
                utils::log::warn(std::format("Re-indexing for schema {} failed ({}): {}; keeping the previous index",
                    e.to_version, error_kind_to_string(reindexed.error_kind()), reindexed.error_message()));
            }
        });

        Orchestrator::Dependencies deps{
            .intent = intent,
            .retriever = std::make_shared<ContextRetriever>(
                embeddings, store, std::make_shared<CharRatioTokenEstimator>(), cfg.retrieval),
            .generator = generator,
            .executor = std::make_shared<ExecutionGuard>(pool, breaker, cfg.execution),
            .cache = std::make_shared<ResponseCache>(cfg.cache),
            .sessions = std::make_shared<SessionStore>(cfg.session),
            .schema = schema,
        };
        auto sessions = deps.sessions;
        Orchestrator orchestrator(std::move(deps), cfg.orchestrator.pipeline);

        const std::string session_id = utils::generate_uuid();
        utils::log::info(std::format("[6/6] Ready (session {})", session_id));
        std::cout << "Ask a question about your data. :history shows this session, :quit exits.\n\n";

        std::string line;
        while (!g_stop.load()) {
            std::cout << "sqlrag> " << std::flush;
            if (!std::getline(std::cin, line)) {
                break;
            }
            const auto input = utils::trim(line);
            if (input.empty()) continue;
            if (input == ":quit" || input == ":exit") break;
            if (input == ":history") {
                print_history(*sessions, session_id);
                continue;
            }

            print_outcome(orchestrator.process(input, session_id));
            sessions->sweep_expired();
        }

        const auto stats = orchestrator.get_stats();
        utils::log::info(std::format("Shutting down: {} requests, {} cache hits, {} clarifications, {} errors",
            stats.requests, stats.cache_hits, stats.clarifications, stats.errors));
        pool->drain();
        return 0;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
