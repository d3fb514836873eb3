/**
 * @file InMemoryReferenceIndex.cpp
 * @brief Implementation of InMemoryReferenceIndex.
 */

#include "infrastructure/InMemoryReferenceIndex.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>

namespace archmend::infrastructure {

bool InMemoryReferenceIndex::upsert(const std::string& id, const std::vector<float>& embedding, const domain::Metadata& metadata) {
    if (id.empty() || embedding.empty()) {
        std::cerr << "[InMemoryReferenceIndex] Rejected snippet with empty id or embedding." << std::endl;
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_positions.find(id);
    if (it != m_positions.end()) {
        m_entries[it->second].embedding = embedding;
        m_entries[it->second].metadata = metadata;
        return true;
    }
    m_positions[id] = m_entries.size();
    m_entries.push_back({id, embedding, metadata});
    return true;
}

std::vector<domain::SearchHit> InMemoryReferenceIndex::search(const std::vector<float>& queryEmbedding, size_t topK) const {
    std::vector<domain::SearchHit> hits;
    if (queryEmbedding.empty() || topK == 0) {
        return hits;
    }

    size_t mismatched = 0;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        hits.reserve(m_entries.size());
        for (const auto& entry : m_entries) {
            if (entry.embedding.size() != queryEmbedding.size()) ++mismatched;
            hits.push_back({entry.id, CosineSimilarity(queryEmbedding, entry.embedding), entry.metadata});
        }
    }

    if (mismatched > 0) {
        std::cerr << "[InMemoryReferenceIndex] Warning: " << mismatched
                  << " snippet(s) have a dimension different from the query (" << queryEmbedding.size()
                  << "); scores were computed on the common prefix." << std::endl;
    }

    std::stable_sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });
    if (hits.size() > topK) hits.resize(topK);
    return hits;
}

std::optional<domain::ReferenceSnippet> InMemoryReferenceIndex::getById(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_positions.find(id);
    if (it == m_positions.end()) return std::nullopt;
    return m_entries[it->second];
}

bool InMemoryReferenceIndex::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_positions.find(id);
    if (it == m_positions.end()) return false;

    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(it->second));
    m_positions.clear();
    for (size_t i = 0; i < m_entries.size(); ++i) {
        m_positions[m_entries[i].id] = i;
    }
    return true;
}

size_t InMemoryReferenceIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
}

void InMemoryReferenceIndex::clear() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_entries.clear();
    m_positions.clear();
}

float InMemoryReferenceIndex::CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    size_t n = std::min(a.size(), b.size());
    if (n == 0) return 0.0f;
    double dot = 0, n1 = 0, n2 = 0;
    for (size_t i = 0; i < n; ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        n1 += static_cast<double>(a[i]) * a[i];
        n2 += static_cast<double>(b[i]) * b[i];
    }
    double norm = std::sqrt(n1) * std::sqrt(n2);
    return norm > 0 ? static_cast<float>(dot / norm) : 0.0f;
}

} // namespace archmend::infrastructure
