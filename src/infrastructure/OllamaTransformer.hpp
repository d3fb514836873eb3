/**
 * @file OllamaTransformer.hpp
 * @brief Transformer implementation backed by a local Ollama server.
 */

#pragma once

#include <mutex>
#include <string>
#include "domain/Transformer.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace archmend::infrastructure {

/**
 * @class OllamaTransformer
 * @brief Sends the conversation to /api/chat in JSON mode with deterministic sampling.
 */
class OllamaTransformer : public domain::Transformer {
public:
    OllamaTransformer(const std::string& host, int port, const std::string& model, int requestTimeoutSeconds);

    /** @brief Picks the best installed model when none was configured. */
    void initialize() override;

    std::optional<std::string> generate(const std::vector<ChatMessage>& history) override;
    std::string getCurrentModel() const override;

private:
    void detectBestModel();

    OllamaClient m_client;
    mutable std::mutex m_modelMutex;
    std::string m_model;
};

} // namespace archmend::infrastructure
