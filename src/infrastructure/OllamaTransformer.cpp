/**
 * @file OllamaTransformer.cpp
 * @brief Implementation of the OllamaTransformer class.
 */

#include "infrastructure/OllamaTransformer.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace archmend::infrastructure {

namespace {
const char* kDefaultModel = "qwen2.5-coder";
}

OllamaTransformer::OllamaTransformer(const std::string& host, int port, const std::string& model, int requestTimeoutSeconds)
    : m_client(host, port, requestTimeoutSeconds), m_model(model) {}

void OllamaTransformer::initialize() {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    if (m_model.empty()) {
        detectBestModel();
    }
}

void OllamaTransformer::detectBestModel() {
    auto availableModels = m_client.getAvailableModels();
    if (availableModels.empty()) {
        m_model = kDefaultModel;
        std::cerr << "[OllamaTransformer] Failed to list models. Is Ollama running? Keeping default: " << m_model << std::endl;
        return;
    }

    // Priority Hierarchy
    const std::vector<std::string> priorities = {
        "qwen2.5-coder",
        "deepseek-coder",
        "codellama",
        "qwen2.5",
        "llama3",
        "mistral"
    };

    for (const auto& priority : priorities) {
        for (const auto& model : availableModels) {
            if (model.find(priority) != std::string::npos) {
                m_model = model;
                std::cout << "[OllamaTransformer] Auto-selected model: " << m_model << std::endl;
                return;
            }
        }
    }

    m_model = availableModels[0];
    std::cout << "[OllamaTransformer] Fallback model: " << m_model << std::endl;
}

std::optional<std::string> OllamaTransformer::generate(const std::vector<ChatMessage>& history) {
    json messagesJson = json::array();
    for (const auto& msg : history) {
        messagesJson.push_back({
            {"role", ChatMessage::RoleToString(msg.role)},
            {"content", msg.content}
        });
    }
    return m_client.chat(getCurrentModel(), messagesJson, true);
}

std::string OllamaTransformer::getCurrentModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model.empty() ? std::string(kDefaultModel) : m_model;
}

} // namespace archmend::infrastructure
