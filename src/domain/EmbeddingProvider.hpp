/**
 * @file EmbeddingProvider.hpp
 * @brief Interface for text embedding backends.
 */

#pragma once
#include <string>
#include <vector>

namespace archmend::domain {

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /** @brief Embeds one text; returns an empty vector on failure. */
    virtual std::vector<float> embed(const std::string& text) = 0;

    /** @brief Embeds several texts, one vector per input (empty on failure). */
    virtual std::vector<std::vector<float>> embedBatch(const std::vector<std::string>& texts) {
        std::vector<std::vector<float>> result;
        result.reserve(texts.size());
        for (const auto& text : texts) {
            result.push_back(embed(text));
        }
        return result;
    }

    /** @brief Vector length produced by this provider, 0 when still unknown. */
    virtual size_t dimension() const = 0;

    virtual bool available() const = 0;
};

} // namespace archmend::domain
