#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include <iostream>

namespace archmend::infrastructure {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string& host, int port, const std::string& model)
    : m_client(host, port, 180), m_model(model) {}

void OllamaEmbeddingProvider::initialize() {
    auto models = m_client.getAvailableModels();
    bool found = false;
    for (const auto& name : models) {
        if (name.find(m_model) != std::string::npos) {
            found = true;
            break;
        }
    }
    m_available = found;
    if (!found) {
        std::cerr << "[OllamaEmbeddingProvider] Embedding model '" << m_model
                  << "' not available; retrieval disabled." << std::endl;
    }
}

std::vector<float> OllamaEmbeddingProvider::embed(const std::string& text) {
    if (!available() || text.empty()) return {};

    auto vec = m_client.getEmbedding(m_model, text);
    if (!vec.empty()) {
        size_t expected = 0;
        if (!m_dimension.compare_exchange_strong(expected, vec.size()) && expected != vec.size()) {
            std::cerr << "[OllamaEmbeddingProvider] Warning: embedding length " << vec.size()
                      << " differs from previously seen " << expected << std::endl;
        }
    }
    return vec;
}

} // namespace archmend::infrastructure
