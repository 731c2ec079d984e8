#include "rag/ollama_embedding_client.hpp"

#include <format>

namespace sqlrag {

OllamaEmbeddingClient::OllamaEmbeddingClient(Config config)
    : config_(std::move(config)) {}

Result<Embedding> OllamaEmbeddingClient::embed(const std::string& text, const Deadline& deadline) {
    const nlohmann::json body = {
        {"model", config_.model},
        {"prompt", text},
    };

    auto reply = ollama_post(config_.endpoint, "/api/embeddings", body, deadline);
    if (reply.is_error()) {
        return Result<Embedding>::error(reply.error_kind(), reply.error_message());
    }

    const auto& data = reply.value();
    if (!data.contains("embedding") || !data["embedding"].is_array() || data["embedding"].empty()) {
        return Result<Embedding>::error(ErrorKind::BACKEND_UNAVAILABLE,
            std::format("Embedding model '{}' returned no vector", config_.model));
    }

    Embedding vec;
    vec.reserve(data["embedding"].size());
    for (const auto& x : data["embedding"]) {
        if (!x.is_number()) {
            return Result<Embedding>::error(ErrorKind::BACKEND_UNAVAILABLE, "Embedding contains a non-number");
        }
        vec.push_back(x.get<float>());
    }
    return Result<Embedding>::ok(std::move(vec));
}

} // namespace sqlrag
