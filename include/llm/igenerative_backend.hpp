#pragma once

#include "core/deadline.hpp"
#include "core/error.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sqlrag {

struct GenerationRequest {
    std::string prompt;
    std::vector<std::string> stop;
    uint32_t max_tokens = 512;
    double temperature = 0.1;
};

/**
 * @brief Text-completion backend
 *
 * Returns the raw completion. Errors: TIMEOUT when the deadline passes,
 * BACKEND_UNAVAILABLE when the service cannot be reached after retries.
 */
class IGenerativeBackend {
public:
    virtual ~IGenerativeBackend() = default;

    [[nodiscard]] virtual Result<std::string> generate(const GenerationRequest& request,
                                                       const Deadline& deadline) = 0;
};

} // namespace sqlrag
