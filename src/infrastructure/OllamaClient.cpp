/**
 * @file OllamaClient.cpp
 * @brief Implementation of the Ollama REST client.
 */

#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace archmend::infrastructure {

using json = nlohmann::json;

namespace {

// Fixed sampling: identical prompts yield identical verdicts.
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;

constexpr int kEmbeddingTimeoutSeconds = 180;
constexpr int kProbeTimeoutSeconds = 5;

/**
 * POSTs a JSON body and returns the parsed reply, logging every failure under label.
 * Invalid UTF-8 in the body is sent as U+FFFD.
 */
std::optional<json> PostJson(httplib::Client& cli, const char* path, const json& request, const char* label) {
    auto res = cli.Post(path, request.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    if (!res) {
        std::cerr << "[OllamaClient] " << label << " connection failed: " << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] " << label << " HTTP " << res->status << ": " << res->body << std::endl;
        return std::nullopt;
    }
    try {
        return json::parse(res->body);
    } catch (const json::parse_error& e) {
        std::cerr << "[OllamaClient] " << label << " reply is not JSON: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace

OllamaClient::OllamaClient(const std::string& host, int port, int readTimeoutSeconds)
    : m_host(host), m_port(port), m_readTimeoutSeconds(readTimeoutSeconds) {}

std::optional<std::string> OllamaClient::chat(const std::string& model,
                                              const nlohmann::json& messages,
                                              bool forceJson) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_readTimeoutSeconds);

    json request = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };
    if (forceJson) {
        request["format"] = "json";
    }

    auto body = PostJson(cli, "/api/chat", request, "Chat");
    if (!body) return std::nullopt;

    const json& message = body->value("message", json::object());
    if (!message.contains("content") || !message["content"].is_string()) {
        std::cerr << "[OllamaClient] Chat reply without message content." << std::endl;
        return std::nullopt;
    }
    return message["content"].get<std::string>();
}

std::vector<float> OllamaClient::getEmbedding(const std::string& model, const std::string& text) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kEmbeddingTimeoutSeconds);

    auto body = PostJson(cli, "/api/embeddings", {{"model", model}, {"prompt", text}}, "Embedding");
    if (!body || !body->contains("embedding") || !(*body)["embedding"].is_array()) {
        return {};
    }
    try {
        return (*body)["embedding"].get<std::vector<float>>();
    } catch (const json::type_error& e) {
        std::cerr << "[OllamaClient] Embedding has non-numeric entries: " << e.what() << std::endl;
    }
    return {};
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kProbeTimeoutSeconds);
    cli.set_read_timeout(kProbeTimeoutSeconds);

    std::vector<std::string> models;
    auto res = cli.Get("/api/tags");
    if (!res || res->status != 200) {
        return models;
    }
    try {
        auto body = json::parse(res->body);
        for (const auto& item : body.value("models", json::array())) {
            if (item.contains("name") && item["name"].is_string()) {
                models.push_back(item["name"].get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Error parsing model list: " << e.what() << std::endl;
    }
    return models;
}

} // namespace archmend::infrastructure
