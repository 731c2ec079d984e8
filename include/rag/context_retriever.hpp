#pragma once

#include "core/deadline.hpp"
#include "core/types.hpp"
#include "rag/iembedding_service.hpp"
#include "rag/ivector_store.hpp"
#include "rag/token_estimator.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlrag {

/**
 * @brief Raw search output, before intent-aware assembly
 */
struct RetrievalCandidates {
    std::string query_text;
    std::vector<VectorHit> hits;       // mixed kinds, best first
    std::vector<VectorHit> examples;
    std::vector<VectorHit> rules;
    bool degraded = false;
};

/**
 * @brief Retrieves a ranked, token-bounded set of schema facts
 *
 * Split in two so the I/O half can run while the intent is still being
 * analyzed:
 *   fetch_candidates()  embed (LRU-cached) + vector searches; never fails,
 *                       degrades to an empty candidate set instead
 *   assemble()          threshold, relationship-aware table selection,
 *                       column/relationship attachment, examples and rules,
 *                       greedy fill under token_budget - prompt_overhead_tokens
 */
class ContextRetriever {
public:
    struct Config {
        size_t top_k_simple = 5;
        size_t top_k_default = 10;
        size_t top_k_complex = 15;
        double similarity_threshold = 0.35;
        size_t max_hops = 2;
        size_t max_tables = 5;
        size_t max_examples = 2;
        size_t max_rules = 3;
        size_t token_budget = 2000;
        size_t prompt_overhead_tokens = 400;
        size_t embedding_cache_size = 1000;
    };

    ContextRetriever(std::shared_ptr<IEmbeddingService> embeddings,
                     std::shared_ptr<IVectorStore> store,
                     std::shared_ptr<ITokenEstimator> estimator,
                     Config config);

    [[nodiscard]] RetrievalCandidates fetch_candidates(const std::string& text,
                                                       const std::vector<Turn>& history,
                                                       const Deadline& deadline);

    [[nodiscard]] RetrievalContext assemble(const RetrievalCandidates& candidates,
                                            const Query& query) const;

    [[nodiscard]] RetrievalContext retrieve(const Query& query,
                                            const std::vector<Turn>& history,
                                            const Deadline& deadline);

    [[nodiscard]] size_t choose_top_k(const std::string& text,
                                      const std::vector<Turn>& history) const;

    [[nodiscard]] size_t available_tokens() const {
        return config_.token_budget > config_.prompt_overhead_tokens
            ? config_.token_budget - config_.prompt_overhead_tokens : 0;
    }

    [[nodiscard]] const Config& config() const { return config_; }

    [[nodiscard]] uint64_t embedding_cache_hits() const {
        return embedding_cache_hits_.load(std::memory_order_relaxed);
    }

private:
    Result<Embedding> embed_cached(const std::string& key, const std::string& text,
                                   const Deadline& deadline);

    std::vector<std::string> select_tables(const std::vector<const VectorHit*>& tables,
                                           const std::vector<const VectorHit*>& relationships) const;

    std::shared_ptr<IEmbeddingService> embeddings_;
    std::shared_ptr<IVectorStore> store_;
    std::shared_ptr<ITokenEstimator> estimator_;
    Config config_;

    // Embedding LRU keyed by normalized text
    std::mutex cache_mutex_;
    std::list<std::pair<std::string, Embedding>> cache_list_;
    std::unordered_map<std::string, std::list<std::pair<std::string, Embedding>>::iterator> cache_map_;
    std::atomic<uint64_t> embedding_cache_hits_{0};
};

} // namespace sqlrag
