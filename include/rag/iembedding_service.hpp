#pragma once

#include "core/deadline.hpp"
#include "core/error.hpp"

#include <string>
#include <vector>

namespace sqlrag {

using Embedding = std::vector<float>;

/**
 * @brief Text embedding backend
 *
 * Implementations derive their request timeout from the deadline and
 * return TIMEOUT once it has passed.
 */
class IEmbeddingService {
public:
    virtual ~IEmbeddingService() = default;

    [[nodiscard]] virtual Result<Embedding> embed(const std::string& text,
                                                  const Deadline& deadline) = 0;
};

} // namespace sqlrag
