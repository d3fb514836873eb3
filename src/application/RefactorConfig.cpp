/**
 * @file RefactorConfig.cpp
 * @brief Validation of RefactorConfig.
 */

#include "application/RefactorConfig.hpp"
#include <stdexcept>

namespace archmend::application {

void RefactorConfig::validate() const {
    if (lineOverlap < 0 || paragraphOverlap < 0) {
        throw std::invalid_argument("chunk overlap must not be negative");
    }
    if (maxLines <= lineOverlap) {
        throw std::invalid_argument("chunk.maxLines (" + std::to_string(maxLines) +
                                    ") must exceed chunk.overlap (" + std::to_string(lineOverlap) + ")");
    }
    if (maxChars <= paragraphOverlap) {
        throw std::invalid_argument("chunk.maxChars (" + std::to_string(maxChars) +
                                    ") must exceed chunk.paragraphOverlap (" + std::to_string(paragraphOverlap) + ")");
    }
    if (maxAttempts < 1) {
        throw std::invalid_argument("loop.maxAttempts must be at least 1");
    }
    if (concurrency < 1 || chunkConcurrency < 1) {
        throw std::invalid_argument("run.concurrency and run.chunkConcurrency must be at least 1");
    }
    if (shutdownTimeoutSeconds < 0) {
        throw std::invalid_argument("run.shutdownTimeoutSeconds must not be negative");
    }
    if (maxResults < 1) {
        throw std::invalid_argument("rag.maxResults must be at least 1");
    }
    if (relevanceThreshold < -1.0f || relevanceThreshold > 1.0f) {
        throw std::invalid_argument("rag.relevanceThreshold must lie in [-1, 1]");
    }
    if (queryChars < 1) {
        throw std::invalid_argument("rag.queryChars must be at least 1");
    }
    if (vectorProvider != "inmemory" && vectorProvider != "remote") {
        throw std::invalid_argument("vectordb.provider must be 'inmemory' or 'remote', got '" + vectorProvider + "'");
    }
    if (vectorProvider == "remote" && remoteUrl.empty()) {
        throw std::invalid_argument("vectordb.remote.url is required when vectordb.provider is 'remote'");
    }
    if (ollamaPort < 1 || ollamaPort > 65535) {
        throw std::invalid_argument("ollama.port out of range");
    }
}

} // namespace archmend::application
