#pragma once

#include "rag/ivector_store.hpp"

#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace sqlrag {

/**
 * @brief Brute-force cosine-similarity index held in memory
 *
 * Suitable for schema-sized corpora (thousands of documents). Vectors
 * are normalized on insert so a search is one dot product per document.
 */
class InMemoryVectorStore : public IVectorStore {
public:
    Result<std::vector<VectorHit>> search(const Embedding& query, size_t top_k,
                                          std::optional<ContextKind> filter,
                                          const Deadline& deadline) override;

    Result<size_t> add(std::vector<VectorDocument> documents) override;

    void clear() override;

    size_t size() const override;

private:
    static bool normalize(Embedding& v);

    mutable std::shared_mutex mutex_;
    std::vector<VectorDocument> documents_;
    std::unordered_map<std::string, size_t> index_;   // id -> position
    size_t dimension_ = 0;
};

} // namespace sqlrag
