#pragma once

#include <cstddef>
#include <string_view>

namespace sqlrag {

/**
 * @brief Token count estimate for budget accounting
 */
class ITokenEstimator {
public:
    virtual ~ITokenEstimator() = default;

    [[nodiscard]] virtual size_t estimate(std::string_view text) const = 0;
};

/**
 * @brief ceil(chars / chars_per_token)
 */
class CharRatioTokenEstimator : public ITokenEstimator {
public:
    explicit CharRatioTokenEstimator(size_t chars_per_token = 4)
        : chars_per_token_(chars_per_token == 0 ? 1 : chars_per_token) {}

    [[nodiscard]] size_t estimate(std::string_view text) const override {
        return (text.size() + chars_per_token_ - 1) / chars_per_token_;
    }

private:
    size_t chars_per_token_;
};

} // namespace sqlrag
