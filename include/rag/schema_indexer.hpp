#pragma once

#include "core/deadline.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "rag/iembedding_service.hpp"
#include "rag/ivector_store.hpp"

#include <memory>
#include <vector>

namespace sqlrag {

/**
 * @brief Turns a schema snapshot into embedded vector-store documents
 *
 * One document per table, per column and per foreign key, plus one per
 * configured example and rule. Document ids are stable ("table:orders",
 * "column:orders.total", ...) so re-indexing replaces rather than duplicates.
 */
class SchemaIndexer {
public:
    SchemaIndexer(std::shared_ptr<IEmbeddingService> embeddings,
                  std::shared_ptr<IVectorStore> store);

    /**
     * @brief Build, embed and store every document
     * @return number of documents stored; the first embedding failure aborts
     */
    [[nodiscard]] Result<size_t> index(const SchemaMap& schema,
                                       const std::vector<ExamplePayload>& examples,
                                       const std::vector<RulePayload>& rules,
                                       const Deadline& deadline);

    /**
     * @brief Documents without embeddings (exposed for inspection and tests)
     */
    [[nodiscard]] static std::vector<VectorDocument> build_documents(
        const SchemaMap& schema,
        const std::vector<ExamplePayload>& examples,
        const std::vector<RulePayload>& rules);

private:
    std::shared_ptr<IEmbeddingService> embeddings_;
    std::shared_ptr<IVectorStore> store_;
};

} // namespace sqlrag
