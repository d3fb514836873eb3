/**
 * @file RagService.cpp
 * @brief Implementation of RagService.
 */

#include "application/RagService.hpp"
#include <iostream>

namespace archmend::application {

namespace {

std::string MetadataValue(const domain::Metadata& metadata, const char* key) {
    auto it = metadata.find(key);
    return it != metadata.end() ? it->second : std::string();
}

} // namespace

RagService::RagService(std::shared_ptr<domain::EmbeddingProvider> embeddings,
                       std::shared_ptr<domain::ReferenceIndex> index,
                       float relevanceThreshold)
    : m_embeddings(std::move(embeddings)), m_index(std::move(index)), m_threshold(relevanceThreshold) {}

bool RagService::isAvailable() const {
    return m_embeddings && m_index && m_embeddings->available() && m_index->available();
}

bool RagService::indexDocument(const std::string& id, const std::string& title, const std::string& content,
                               const domain::Metadata& extra) {
    if (!isAvailable()) return false;

    std::vector<float> vec = m_embeddings->embed(content);
    if (vec.empty()) {
        std::cerr << "[RagService] Embedding failed for " << id << std::endl;
        return false;
    }

    domain::Metadata metadata = extra;
    metadata["title"] = title;
    metadata["content"] = content;
    return m_index->upsert(id, vec, metadata);
}

size_t RagService::indexCodeSnippets(const std::vector<std::pair<std::string, std::string>>& snippets) {
    if (!isAvailable()) return 0;

    std::vector<std::string> texts;
    texts.reserve(snippets.size());
    for (const auto& snippet : snippets) {
        texts.push_back(snippet.second);
    }
    auto vectors = m_embeddings->embedBatch(texts);

    std::vector<domain::ReferenceSnippet> batch;
    for (size_t i = 0; i < snippets.size() && i < vectors.size(); ++i) {
        if (vectors[i].empty()) continue;
        domain::ReferenceSnippet snippet;
        snippet.id = "snippet_" + snippets[i].first;
        snippet.embedding = std::move(vectors[i]);
        snippet.metadata["title"] = snippets[i].first;
        snippet.metadata["content"] = snippets[i].second;
        snippet.metadata["tags"] = "processed_code";
        batch.push_back(std::move(snippet));
    }
    return m_index->bulkUpsert(batch);
}

bool RagService::deleteDocument(const std::string& id) {
    if (!isAvailable()) return false;
    return m_index->remove(id);
}

std::optional<RetrievedDocument> RagService::getDocument(const std::string& id) const {
    if (!isAvailable()) return std::nullopt;
    auto snippet = m_index->getById(id);
    if (!snippet) return std::nullopt;
    return RetrievedDocument{snippet->id, MetadataValue(snippet->metadata, "title"),
                             MetadataValue(snippet->metadata, "content"), 1.0f};
}

std::vector<RetrievedDocument> RagService::retrieve(const std::string& query, size_t topK) const {
    std::vector<RetrievedDocument> documents;
    if (!isAvailable() || topK == 0 || query.empty()) return documents;

    std::vector<float> vec = m_embeddings->embed(query);
    if (vec.empty()) {
        std::cerr << "[RagService] Query embedding failed; continuing without context." << std::endl;
        return documents;
    }

    for (const auto& hit : m_index->search(vec, topK)) {
        if (hit.score < m_threshold) continue;
        documents.push_back({hit.id, MetadataValue(hit.metadata, "title"),
                             MetadataValue(hit.metadata, "content"), hit.score});
    }
    return documents;
}

} // namespace archmend::application
