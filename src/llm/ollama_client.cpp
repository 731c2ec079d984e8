#include "llm/ollama_client.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlrag {

OllamaClient::OllamaClient(Config config, std::shared_ptr<RateLimiter> limiter)
    : config_(std::move(config)),
      limiter_(std::move(limiter)) {}

Result<std::string> OllamaClient::generate(const GenerationRequest& request,
                                           const Deadline& deadline) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    if (limiter_ && !limiter_->acquire(config_.endpoint.timeout, deadline)) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        failures_.fetch_add(1, std::memory_order_relaxed);
        if (deadline.expired()) {
            return Result<std::string>::error(ErrorKind::TIMEOUT, "Deadline reached waiting for a generation slot");
        }
        return Result<std::string>::error(ErrorKind::BACKEND_UNAVAILABLE, "Generation rate limit exceeded");
    }

    nlohmann::json options = {
        {"temperature", request.temperature},
        {"num_predict", request.max_tokens},
        {"top_p", config_.top_p},
    };
    if (!request.stop.empty()) {
        options["stop"] = request.stop;
    }

    const nlohmann::json body = {
        {"model", config_.model},
        {"prompt", request.prompt},
        {"stream", false},
        {"options", std::move(options)},
    };

    utils::Timer timer;
    auto reply = ollama_post(config_.endpoint, "/api/generate", body, deadline);
    if (reply.is_error()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("OllamaClient: {}", reply.error_message()));
        return Result<std::string>::error(reply.error_kind(), reply.error_message());
    }

    const auto& data = reply.value();
    std::string content;
    if (data.contains("response") && data["response"].is_string()) {
        content = data["response"].get<std::string>();
    }

    utils::log::debug(std::format("OllamaClient: {} chars from {} in {}ms (eval_count={})",
        content.size(), config_.model, timer.elapsed_ms().count(),
        data.value("eval_count", 0)));

    return Result<std::string>::ok(std::move(content));
}

OllamaClient::Stats OllamaClient::get_stats() const {
    return {
        .requests = requests_.load(std::memory_order_relaxed),
        .failures = failures_.load(std::memory_order_relaxed),
        .rate_limited = rate_limited_.load(std::memory_order_relaxed),
    };
}

} // namespace sqlrag
