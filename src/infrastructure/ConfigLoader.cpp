/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace archmend::infrastructure {

namespace {

template <typename T>
void ReadKey(const json& section, const std::string& sectionName, const char* key, T& out) {
    if (!section.is_object() || !section.contains(key)) return;
    try {
        out = section.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument("Invalid value for '" + sectionName + "." + key + "': " + e.what());
    }
}

const json& Section(const json& root, const char* name) {
    static const json kEmpty = json::object();
    if (root.contains(name) && root.at(name).is_object()) {
        return root.at(name);
    }
    return kEmpty;
}

} // namespace

application::RefactorConfig ConfigLoader::Load(const std::string& path, bool required) {
    application::RefactorConfig config;

    if (!std::filesystem::exists(path)) {
        if (required) {
            throw std::invalid_argument("Configuration file not found: " + path);
        }
        std::cout << "[ConfigLoader] No " << path << " found, using defaults." << std::endl;
        config.validate();
        return config;
    }

    json root;
    try {
        std::ifstream f(path);
        root = json::parse(f);
    } catch (const std::exception& e) {
        throw std::invalid_argument("Error reading " + path + ": " + e.what());
    }
    if (!root.is_object()) {
        throw std::invalid_argument(path + " must contain a JSON object");
    }

    Apply(root, config);
    config.validate();
    std::cout << "[ConfigLoader] Loaded " << path << std::endl;
    return config;
}

void ConfigLoader::Apply(const json& root, application::RefactorConfig& config) {
    const json& chunk = Section(root, "chunk");
    ReadKey(chunk, "chunk", "maxLines", config.maxLines);
    ReadKey(chunk, "chunk", "maxChars", config.maxChars);
    ReadKey(chunk, "chunk", "overlap", config.lineOverlap);
    ReadKey(chunk, "chunk", "paragraphOverlap", config.paragraphOverlap);

    ReadKey(Section(root, "loop"), "loop", "maxAttempts", config.maxAttempts);

    const json& run = Section(root, "run");
    ReadKey(run, "run", "concurrency", config.concurrency);
    ReadKey(run, "run", "chunkConcurrency", config.chunkConcurrency);
    ReadKey(run, "run", "shutdownTimeoutSeconds", config.shutdownTimeoutSeconds);

    const json& cache = Section(root, "cache");
    ReadKey(cache, "cache", "enabled", config.cacheEnabled);
    ReadKey(cache, "cache", "directory", config.cacheDirectory);

    const json& merge = Section(root, "merge");
    ReadKey(merge, "merge", "removalList", config.removalList);
    ReadKey(merge, "merge", "domainKeywords", config.domainKeywords);

    const json& rag = Section(root, "rag");
    ReadKey(rag, "rag", "enabled", config.ragEnabled);
    ReadKey(rag, "rag", "maxResults", config.maxResults);
    ReadKey(rag, "rag", "relevanceThreshold", config.relevanceThreshold);
    ReadKey(rag, "rag", "queryChars", config.queryChars);
    ReadKey(rag, "rag", "queryPrefix", config.queryPrefix);
    ReadKey(rag, "rag", "referenceDirectory", config.referenceDirectory);
    ReadKey(rag, "rag", "indexProcessedCode", config.indexProcessedCode);

    const json& vectordb = Section(root, "vectordb");
    ReadKey(vectordb, "vectordb", "provider", config.vectorProvider);
    const json& remote = Section(vectordb, "remote");
    ReadKey(remote, "vectordb.remote", "url", config.remoteUrl);
    ReadKey(remote, "vectordb.remote", "apiKey", config.remoteApiKey);
    ReadKey(remote, "vectordb.remote", "namespace", config.remoteNamespace);

    const json& ollama = Section(root, "ollama");
    ReadKey(ollama, "ollama", "host", config.ollamaHost);
    ReadKey(ollama, "ollama", "port", config.ollamaPort);
    ReadKey(ollama, "ollama", "chatModel", config.chatModel);
    ReadKey(ollama, "ollama", "embeddingModel", config.embeddingModel);
    ReadKey(ollama, "ollama", "requestTimeoutSeconds", config.requestTimeoutSeconds);

    ReadKey(Section(root, "prompt"), "prompt", "basePolicy", config.basePolicy);
}

application::EvaluationSet ConfigLoader::LoadEvaluationSet(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::invalid_argument("Evaluation file not found: " + path);
    }
    json root;
    try {
        std::ifstream f(path);
        root = json::parse(f);
    } catch (const std::exception& e) {
        throw std::invalid_argument("Error reading " + path + ": " + e.what());
    }
    return ParseEvaluationSet(root);
}

application::EvaluationSet ConfigLoader::ParseEvaluationSet(const json& root) {
    if (!root.is_object()) {
        throw std::invalid_argument("Evaluation set must be a JSON object");
    }
    application::EvaluationSet set;
    try {
        for (const auto& item : root.value("queries", json::array())) {
            application::EvaluationQuery query;
            query.query = item.at("query").get<std::string>();
            query.expectedKeywords = item.value("keywords", std::vector<std::string>{});
            set.queries.push_back(std::move(query));
        }
        set.documentGroups = root.value("groups", std::map<std::string, std::vector<std::string>>{});
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid evaluation set: ") + e.what());
    }
    return set;
}

} // namespace archmend::infrastructure
