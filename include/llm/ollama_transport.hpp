#pragma once

#include "core/deadline.hpp"
#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace sqlrag {

struct OllamaEndpoint {
    std::string base_url = "http://localhost:11434";
    std::chrono::milliseconds timeout{45000};
    uint32_t retry_attempts = 3;
    std::chrono::milliseconds backoff_base{1000};   // attempt n waits base * 2^n
};

/**
 * @brief POST a JSON body to an Ollama endpoint and parse the JSON reply
 *
 * Connection errors and 5xx replies are retried with exponential backoff.
 * A reply that does not arrive within the timeout is TIMEOUT and is not
 * retried. The per-attempt timeout and every backoff are clamped to the
 * deadline.
 */
[[nodiscard]] Result<nlohmann::json> ollama_post(const OllamaEndpoint& endpoint,
                                                 const std::string& path,
                                                 const nlohmann::json& body,
                                                 const Deadline& deadline);

} // namespace sqlrag
