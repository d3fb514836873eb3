/**
 * @file RagService.hpp
 * @brief Embeds documents into a ReferenceIndex and retrieves them by similarity.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "domain/EmbeddingProvider.hpp"
#include "domain/ReferenceIndex.hpp"

namespace archmend::application {

/**
 * @struct RetrievedDocument
 * @brief A search hit with its title and content unpacked from metadata.
 */
struct RetrievedDocument {
    std::string id;
    std::string title;
    std::string content;
    float score = 0.0f;
};

/**
 * @class RagService
 * @brief Thin facade pairing an EmbeddingProvider with a ReferenceIndex.
 *
 * Every operation degrades to a no-op when either collaborator is missing
 * or unavailable.
 */
class RagService {
public:
    RagService(std::shared_ptr<domain::EmbeddingProvider> embeddings,
               std::shared_ptr<domain::ReferenceIndex> index,
               float relevanceThreshold);

    bool isAvailable() const;

    /**
     * @brief Embeds content and upserts it under id.
     * @param extra Additional metadata; "title" and "content" are always set.
     * @return false if the service is unavailable or the embedding failed.
     */
    bool indexDocument(const std::string& id, const std::string& title, const std::string& content,
                       const domain::Metadata& extra = {});

    /**
     * @brief Indexes processed code under "snippet_<id>".
     * @return Number of snippets stored.
     */
    size_t indexCodeSnippets(const std::vector<std::pair<std::string, std::string>>& snippets);

    bool deleteDocument(const std::string& id);

    std::optional<RetrievedDocument> getDocument(const std::string& id) const;

    /** @brief Up to topK documents scoring at least the relevance threshold, best first. */
    std::vector<RetrievedDocument> retrieve(const std::string& query, size_t topK) const;

    float relevanceThreshold() const { return m_threshold; }

private:
    std::shared_ptr<domain::EmbeddingProvider> m_embeddings;
    std::shared_ptr<domain::ReferenceIndex> m_index;
    float m_threshold;
};

} // namespace archmend::application
