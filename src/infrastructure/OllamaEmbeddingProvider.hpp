/**
 * @file OllamaEmbeddingProvider.hpp
 * @brief EmbeddingProvider backed by Ollama's /api/embeddings.
 */

#pragma once

#include <atomic>
#include <string>
#include "domain/EmbeddingProvider.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace archmend::infrastructure {

class OllamaEmbeddingProvider : public domain::EmbeddingProvider {
public:
    OllamaEmbeddingProvider(const std::string& host, int port, const std::string& model);

    /** @brief Checks that the server answers and lists the embedding model. */
    void initialize();

    std::vector<float> embed(const std::string& text) override;
    size_t dimension() const override { return m_dimension.load(); }
    bool available() const override { return m_available.load(); }

private:
    OllamaClient m_client;
    std::string m_model;
    std::atomic<size_t> m_dimension{0};
    std::atomic<bool> m_available{false};
};

} // namespace archmend::infrastructure
