/**
 * @file ContextAssembler.hpp
 * @brief Builds the reference-context block sent alongside each chunk.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/RagService.hpp"
#include "domain/Chunk.hpp"

namespace archmend::application {

/**
 * @struct RetrievalSettings
 * @brief How a chunk is turned into a retrieval query.
 */
struct RetrievalSettings {
    size_t topK = 5;
    size_t queryChars = 500;  ///< Leading characters of the chunk used as query.
    std::string queryPrefix = "Java code for DDD refactoring: ";
};

/**
 * @struct ContextBundle
 * @brief Retrieved documents in relevance order.
 */
struct ContextBundle {
    std::vector<RetrievedDocument> documents;

    /** @brief Renders "--- title ---" blocks; empty when nothing was retrieved. */
    std::string render() const;

    bool isEmpty() const { return documents.empty(); }
};

/**
 * @class ContextAssembler
 * @brief Queries the RagService for the snippets most similar to a chunk.
 *
 * Never fails: an unavailable service, a failed embedding or an empty
 * result all produce an empty context.
 */
class ContextAssembler {
public:
    ContextAssembler(std::shared_ptr<const RagService> rag, RetrievalSettings settings);

    ContextBundle gather(const domain::Chunk& chunk) const;

    /** @brief gather() rendered to text, using topK hits. */
    std::string assemble(const domain::Chunk& chunk, size_t topK) const;

private:
    std::string buildQuery(const domain::Chunk& chunk) const;

    std::shared_ptr<const RagService> m_rag;
    RetrievalSettings m_settings;
};

} // namespace archmend::application
