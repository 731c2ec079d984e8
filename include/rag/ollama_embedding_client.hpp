#pragma once

#include "llm/ollama_transport.hpp"
#include "rag/iembedding_service.hpp"

#include <string>

namespace sqlrag {

/**
 * @brief Embedding service backed by Ollama's /api/embeddings
 */
class OllamaEmbeddingClient : public IEmbeddingService {
public:
    struct Config {
        OllamaEndpoint endpoint;
        std::string model = "nomic-embed-text";
    };

    explicit OllamaEmbeddingClient(Config config);

    Result<Embedding> embed(const std::string& text, const Deadline& deadline) override;

private:
    Config config_;
};

} // namespace sqlrag
