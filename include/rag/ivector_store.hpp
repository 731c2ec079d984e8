#pragma once

#include "core/deadline.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "rag/iembedding_service.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sqlrag {

struct VectorDocument {
    std::string id;
    std::string content;
    ContextPayload payload;
    Embedding embedding;

    [[nodiscard]] ContextKind kind() const {
        return static_cast<ContextKind>(payload.index());
    }
};

struct VectorHit {
    std::string id;
    std::string content;
    ContextPayload payload;
    double score = 0.0;     // cosine similarity, higher is closer

    [[nodiscard]] ContextKind kind() const {
        return static_cast<ContextKind>(payload.index());
    }
};

/**
 * @brief Similarity index over schema documents
 */
class IVectorStore {
public:
    virtual ~IVectorStore() = default;

    /**
     * @brief Nearest documents to the query vector, best first
     * @param filter restrict hits to one element kind
     */
    [[nodiscard]] virtual Result<std::vector<VectorHit>> search(
        const Embedding& query, size_t top_k,
        std::optional<ContextKind> filter, const Deadline& deadline) = 0;

    /**
     * @brief Insert or replace documents by id
     * @return number of documents stored
     */
    [[nodiscard]] virtual Result<size_t> add(std::vector<VectorDocument> documents) = 0;

    virtual void clear() = 0;

    [[nodiscard]] virtual size_t size() const = 0;
};

} // namespace sqlrag
