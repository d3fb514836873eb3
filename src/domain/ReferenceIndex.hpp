/**
 * @file ReferenceIndex.hpp
 * @brief Nearest-neighbour store for embedded reference snippets.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace archmend::domain {

/** @brief Free-form snippet metadata ("title", "content", "tags", ...). */
using Metadata = std::map<std::string, std::string>;

/**
 * @struct ReferenceSnippet
 * @brief An embedded snippet as stored in the index.
 */
struct ReferenceSnippet {
    std::string id;
    std::vector<float> embedding;
    Metadata metadata;
};

/**
 * @struct SearchHit
 * @brief One ranked search result. Score is cosine similarity in [-1, 1].
 */
struct SearchHit {
    std::string id;
    float score = 0.0f;
    Metadata metadata;
};

/**
 * @class ReferenceIndex
 * @brief Backend-agnostic contract shared by the in-memory and remote indexes.
 *
 * When available() is false every operation is a no-op returning an empty
 * or failure result; nothing here throws.
 */
class ReferenceIndex {
public:
    virtual ~ReferenceIndex() = default;

    /** @brief Optional initialization (e.g., reachability probe). */
    virtual void initialize() {}

    virtual bool available() const = 0;

    /** @brief Inserts or replaces a snippet. */
    virtual bool upsert(const std::string& id, const std::vector<float>& embedding, const Metadata& metadata) = 0;

    /** @brief Upserts several snippets; returns how many succeeded. */
    virtual size_t bulkUpsert(const std::vector<ReferenceSnippet>& snippets) {
        size_t stored = 0;
        for (const auto& snippet : snippets) {
            if (upsert(snippet.id, snippet.embedding, snippet.metadata)) ++stored;
        }
        return stored;
    }

    /**
     * @brief Returns at most topK hits, best first, ties in insertion order.
     */
    virtual std::vector<SearchHit> search(const std::vector<float>& queryEmbedding, size_t topK) const = 0;

    virtual std::optional<ReferenceSnippet> getById(const std::string& id) const = 0;

    virtual bool remove(const std::string& id) = 0;

    /** @brief Number of stored snippets, 0 when unavailable. */
    virtual size_t size() const = 0;
};

} // namespace archmend::domain
