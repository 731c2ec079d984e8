#include "llm/ollama_transport.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <algorithm>
#include <format>
#include <thread>

namespace sqlrag {

Result<nlohmann::json> ollama_post(const OllamaEndpoint& endpoint,
                                   const std::string& path,
                                   const nlohmann::json& body,
                                   const Deadline& deadline) {
    using JsonResult = Result<nlohmann::json>;

    const std::string payload = body.dump();
    std::string last_error = "no attempt made";
    const uint32_t attempts = std::max<uint32_t>(endpoint.retry_attempts, 1);

    for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
        if (deadline.expired()) {
            return JsonResult::error(ErrorKind::TIMEOUT,
                std::format("Deadline reached calling {}{}", endpoint.base_url, path));
        }

        const auto timeout = deadline.clamp(endpoint.timeout);
        httplib::Client cli(endpoint.base_url);
        cli.set_connection_timeout(timeout);
        cli.set_read_timeout(timeout);
        cli.set_write_timeout(timeout);

        const auto res = cli.Post(path, payload, "application/json");

        bool retryable = false;
        if (!res && res.error() == httplib::Error::Read) {
            // The server accepted the request but did not answer within the timeout
            return JsonResult::error(ErrorKind::TIMEOUT,
                std::format("{}{} did not respond within {}ms", endpoint.base_url, path,
                    timeout.count()));
        } else if (!res) {
            last_error = std::format("connection error: {}", httplib::to_string(res.error()));
            retryable = true;
        } else if (res->status >= 500) {
            last_error = std::format("HTTP {} - {}", res->status, res->body.substr(0, 200));
            retryable = true;
        } else if (res->status != 200) {
            return JsonResult::error(ErrorKind::BACKEND_UNAVAILABLE,
                std::format("{}{} returned HTTP {} - {}", endpoint.base_url, path,
                    res->status, res->body.substr(0, 200)));
        } else {
            try {
                return JsonResult::ok(nlohmann::json::parse(res->body));
            } catch (const nlohmann::json::parse_error& e) {
                return JsonResult::error(ErrorKind::BACKEND_UNAVAILABLE,
                    std::format("Malformed JSON from {}{}: {}", endpoint.base_url, path, e.what()));
            }
        }

        if (!retryable || attempt + 1 >= attempts) {
            break;
        }

        const auto backoff = endpoint.backoff_base * (1LL << attempt);
        if (!deadline.unbounded() && backoff >= deadline.remaining()) {
            return JsonResult::error(ErrorKind::TIMEOUT,
                std::format("Deadline reached retrying {}{}: {}", endpoint.base_url, path, last_error));
        }
        utils::log::warn(std::format("Ollama {}: attempt {} failed ({}), retrying in {}ms",
            path, attempt + 1, last_error, backoff.count()));
        std::this_thread::sleep_for(backoff);
    }

    if (deadline.expired()) {
        return JsonResult::error(ErrorKind::TIMEOUT,
            std::format("Deadline reached calling {}{}: {}", endpoint.base_url, path, last_error));
    }
    return JsonResult::error(ErrorKind::BACKEND_UNAVAILABLE,
        std::format("{}{} unavailable after {} attempt(s): {}",
            endpoint.base_url, path, attempts, last_error));
}

} // namespace sqlrag
