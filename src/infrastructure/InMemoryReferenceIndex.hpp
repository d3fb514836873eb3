/**
 * @file InMemoryReferenceIndex.hpp
 * @brief Exact linear-scan ReferenceIndex held in process memory.
 */

#pragma once

#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "domain/ReferenceIndex.hpp"

namespace archmend::infrastructure {

/**
 * @class InMemoryReferenceIndex
 * @brief Thread-safe in-memory index.
 *
 * Searches take a shared lock, mutations an exclusive one. Replacing an
 * existing id keeps its original insertion position so ties stay stable.
 */
class InMemoryReferenceIndex : public domain::ReferenceIndex {
public:
    InMemoryReferenceIndex() = default;

    bool available() const override { return true; }
    bool upsert(const std::string& id, const std::vector<float>& embedding, const domain::Metadata& metadata) override;
    std::vector<domain::SearchHit> search(const std::vector<float>& queryEmbedding, size_t topK) const override;
    std::optional<domain::ReferenceSnippet> getById(const std::string& id) const override;
    bool remove(const std::string& id) override;
    size_t size() const override;

    /** @brief Drops every snippet. */
    void clear();

    /**
     * @brief Cosine similarity over the common prefix of both vectors.
     * @return 0 when either vector is empty or has zero norm.
     */
    static float CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

private:
    mutable std::shared_mutex m_mutex;
    std::vector<domain::ReferenceSnippet> m_entries;
    std::unordered_map<std::string, size_t> m_positions;
};

} // namespace archmend::infrastructure
