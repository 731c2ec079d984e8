#pragma once

#include "llm/igenerative_backend.hpp"
#include "llm/ollama_transport.hpp"
#include "llm/rate_limiter.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace sqlrag {

/**
 * @brief Generative backend speaking the Ollama /api/generate protocol
 *
 * Every call takes a rate-limiter token first (waiting up to the request
 * timeout), then posts a non-streaming completion request.
 */
class OllamaClient : public IGenerativeBackend {
public:
    struct Config {
        OllamaEndpoint endpoint;
        std::string model = "gemma:2b";
        double top_p = 0.9;
    };

    OllamaClient(Config config, std::shared_ptr<RateLimiter> limiter);

    Result<std::string> generate(const GenerationRequest& request,
                                 const Deadline& deadline) override;

    struct Stats {
        uint64_t requests;
        uint64_t failures;
        uint64_t rate_limited;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    Config config_;
    std::shared_ptr<RateLimiter> limiter_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> rate_limited_{0};
};

} // namespace sqlrag
