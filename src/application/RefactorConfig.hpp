/**
 * @file RefactorConfig.hpp
 * @brief Numeric knobs and rule lists driving a refactoring run.
 */

#pragma once

#include <string>
#include <vector>

namespace archmend::application {

/**
 * @struct RefactorConfig
 * @brief Whole-run configuration. Defaults match a stock local setup.
 */
struct RefactorConfig {
    // Chunking
    int maxLines = 300;
    int maxChars = 1000;
    int lineOverlap = 0;
    int paragraphOverlap = 200;

    // Validation loop
    int maxAttempts = 3;

    // Scheduling
    int concurrency = 4;
    int chunkConcurrency = 2;
    int shutdownTimeoutSeconds = 60;

    // Cache
    bool cacheEnabled = true;
    std::string cacheDirectory = "output/cache";

    // Merge rules
    std::vector<std::string> removalList = {"directDbCall"};
    std::vector<std::string> domainKeywords = {"stock", "price", "quantity"};

    // Retrieval
    bool ragEnabled = true;
    int maxResults = 5;
    float relevanceThreshold = 0.7f;
    int queryChars = 500;
    std::string queryPrefix = "Java code for DDD refactoring: ";
    std::string referenceDirectory;
    bool indexProcessedCode = false;

    // Vector store
    std::string vectorProvider = "inmemory";
    std::string remoteUrl;
    std::string remoteApiKey;
    std::string remoteNamespace;

    // Model server
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string chatModel;
    std::string embeddingModel = "nomic-embed-text";
    int requestTimeoutSeconds = 600;

    // Prompt; empty selects the built-in policy
    std::string basePolicy;

    /**
     * @brief Rejects inconsistent settings.
     * @throws std::invalid_argument describing the first problem found.
     */
    void validate() const;
};

} // namespace archmend::application
