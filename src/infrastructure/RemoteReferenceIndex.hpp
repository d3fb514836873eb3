/**
 * @file RemoteReferenceIndex.hpp
 * @brief ReferenceIndex backed by a remote vector service over HTTP.
 */

#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/ReferenceIndex.hpp"

namespace archmend::infrastructure {

/**
 * @class RemoteReferenceIndex
 * @brief Client for a Pinecone-style REST vector index.
 *
 * Endpoints: /describe_index_stats, /query, /vectors/upsert, /vectors/fetch
 * and /vectors/delete. Authentication uses the "Api-Key" header. The index
 * is unavailable until initialize() succeeds; transport errors are logged
 * and reported as empty or failed results.
 */
class RemoteReferenceIndex : public domain::ReferenceIndex {
public:
    struct Settings {
        std::string baseUrl;       ///< e.g. "https://my-index-abc123.svc.us-east1.pinecone.io".
        std::string apiKey;
        std::string nameSpace;
        int timeoutSeconds = 30;
    };

    explicit RemoteReferenceIndex(Settings settings);

    /** @brief Probes /describe_index_stats and records availability. */
    void initialize() override;

    bool available() const override { return m_available.load(); }
    bool upsert(const std::string& id, const std::vector<float>& embedding, const domain::Metadata& metadata) override;
    size_t bulkUpsert(const std::vector<domain::ReferenceSnippet>& snippets) override;
    std::vector<domain::SearchHit> search(const std::vector<float>& queryEmbedding, size_t topK) const override;
    std::optional<domain::ReferenceSnippet> getById(const std::string& id) const override;
    bool remove(const std::string& id) override;
    size_t size() const override;

    /** @brief Vector count from a describe_index_stats reply; 0 for any unexpected shape. */
    static size_t StatsVectorCount(const nlohmann::json& stats, const std::string& nameSpace);

private:
    std::optional<nlohmann::json> post(const std::string& path, const nlohmann::json& body) const;
    std::optional<nlohmann::json> get(const std::string& path, const std::string& ids = "") const;

    Settings m_settings;
    std::atomic<bool> m_available{false};
};

} // namespace archmend::infrastructure
