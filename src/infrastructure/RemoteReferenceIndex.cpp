/**
 * @file RemoteReferenceIndex.cpp
 * @brief Implementation of RemoteReferenceIndex.
 */

#include "infrastructure/RemoteReferenceIndex.hpp"
#include <httplib.h>
#include <algorithm>
#include <iostream>

namespace archmend::infrastructure {

using json = nlohmann::json;

namespace {

json MetadataToJson(const domain::Metadata& metadata) {
    json j = json::object();
    for (const auto& [key, value] : metadata) {
        j[key] = value;
    }
    return j;
}

domain::Metadata MetadataFromJson(const json& j) {
    domain::Metadata metadata;
    if (!j.is_object()) return metadata;
    for (auto it = j.begin(); it != j.end(); ++it) {
        metadata[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
    return metadata;
}

json SnippetToJson(const std::string& id, const std::vector<float>& embedding, const domain::Metadata& metadata) {
    return {
        {"id", id},
        {"values", embedding},
        {"metadata", MetadataToJson(metadata)}
    };
}

} // namespace

size_t RemoteReferenceIndex::StatsVectorCount(const json& stats, const std::string& nameSpace) {
    try {
        if (!nameSpace.empty() && stats.contains("namespaces")) {
            const auto& namespaces = stats.at("namespaces");
            if (namespaces.contains(nameSpace)) {
                return namespaces.at(nameSpace).value("vectorCount", static_cast<size_t>(0));
            }
            return 0;
        }
        return stats.value("totalVectorCount", static_cast<size_t>(0));
    } catch (const json::exception& e) {
        std::cerr << "[RemoteReferenceIndex] Unexpected stats response: " << e.what() << std::endl;
    }
    return 0;
}

RemoteReferenceIndex::RemoteReferenceIndex(Settings settings)
    : m_settings(std::move(settings)) {}

void RemoteReferenceIndex::initialize() {
    auto stats = get("/describe_index_stats");
    m_available = stats.has_value();
    if (m_available) {
        std::cout << "[RemoteReferenceIndex] Connected to " << m_settings.baseUrl << std::endl;
    } else {
        std::cerr << "[RemoteReferenceIndex] Index unavailable at " << m_settings.baseUrl
                  << "; retrieval disabled." << std::endl;
    }
}

std::optional<json> RemoteReferenceIndex::post(const std::string& path, const json& body) const {
    httplib::Client cli(m_settings.baseUrl);
    cli.set_connection_timeout(m_settings.timeoutSeconds);
    cli.set_read_timeout(m_settings.timeoutSeconds);
    httplib::Headers headers = {{"Api-Key", m_settings.apiKey}, {"Accept", "application/json"}};

    auto res = cli.Post(path, headers, body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    if (res && res->status == 200) {
        try {
            return res->body.empty() ? json::object() : json::parse(res->body);
        } catch (const std::exception& e) {
            std::cerr << "[RemoteReferenceIndex] JSON Parse Error on " << path << ": " << e.what() << std::endl;
        }
    } else if (res) {
        std::cerr << "[RemoteReferenceIndex] HTTP Error " << res->status << " on " << path << ": " << res->body << std::endl;
    } else {
        std::cerr << "[RemoteReferenceIndex] Connection failed on " << path << ": "
                  << httplib::to_string(res.error()) << std::endl;
    }
    return std::nullopt;
}

std::optional<json> RemoteReferenceIndex::get(const std::string& path, const std::string& ids) const {
    httplib::Client cli(m_settings.baseUrl);
    cli.set_connection_timeout(m_settings.timeoutSeconds);
    cli.set_read_timeout(m_settings.timeoutSeconds);
    httplib::Headers headers = {{"Api-Key", m_settings.apiKey}, {"Accept", "application/json"}};

    httplib::Params params;
    if (!ids.empty()) params.emplace("ids", ids);
    if (!ids.empty() && !m_settings.nameSpace.empty()) params.emplace("namespace", m_settings.nameSpace);

    auto res = cli.Get(path, params, headers);
    if (res && res->status == 200) {
        try {
            return json::parse(res->body);
        } catch (const std::exception& e) {
            std::cerr << "[RemoteReferenceIndex] JSON Parse Error on " << path << ": " << e.what() << std::endl;
        }
    } else if (res) {
        std::cerr << "[RemoteReferenceIndex] HTTP Error " << res->status << " on " << path << std::endl;
    } else {
        std::cerr << "[RemoteReferenceIndex] Connection failed on " << path << ": "
                  << httplib::to_string(res.error()) << std::endl;
    }
    return std::nullopt;
}

bool RemoteReferenceIndex::upsert(const std::string& id, const std::vector<float>& embedding, const domain::Metadata& metadata) {
    if (!available() || id.empty() || embedding.empty()) return false;

    json body = {
        {"vectors", json::array({SnippetToJson(id, embedding, metadata)})},
        {"namespace", m_settings.nameSpace}
    };
    return post("/vectors/upsert", body).has_value();
}

size_t RemoteReferenceIndex::bulkUpsert(const std::vector<domain::ReferenceSnippet>& snippets) {
    if (!available() || snippets.empty()) return 0;

    json vectors = json::array();
    for (const auto& snippet : snippets) {
        if (snippet.id.empty() || snippet.embedding.empty()) continue;
        vectors.push_back(SnippetToJson(snippet.id, snippet.embedding, snippet.metadata));
    }
    if (vectors.empty()) return 0;

    json body = {{"vectors", vectors}, {"namespace", m_settings.nameSpace}};
    auto res = post("/vectors/upsert", body);
    if (!res) return 0;
    if (res->contains("upsertedCount") && (*res)["upsertedCount"].is_number()) {
        return (*res)["upsertedCount"].get<size_t>();
    }
    return vectors.size();
}

std::vector<domain::SearchHit> RemoteReferenceIndex::search(const std::vector<float>& queryEmbedding, size_t topK) const {
    std::vector<domain::SearchHit> hits;
    if (!available() || queryEmbedding.empty() || topK == 0) return hits;

    json body = {
        {"vector", queryEmbedding},
        {"topK", topK},
        {"namespace", m_settings.nameSpace},
        {"includeMetadata", true}
    };
    auto res = post("/query", body);
    if (!res || !res->contains("matches") || !(*res)["matches"].is_array()) return hits;

    try {
        for (const auto& match : (*res)["matches"]) {
            domain::SearchHit hit;
            hit.id = match.value("id", "");
            hit.score = match.value("score", 0.0f);
            if (match.contains("metadata")) hit.metadata = MetadataFromJson(match["metadata"]);
            hits.push_back(std::move(hit));
        }
    } catch (const std::exception& e) {
        std::cerr << "[RemoteReferenceIndex] Unexpected query response: " << e.what() << std::endl;
        hits.clear();
    }

    std::stable_sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });
    if (hits.size() > topK) hits.resize(topK);
    return hits;
}

std::optional<domain::ReferenceSnippet> RemoteReferenceIndex::getById(const std::string& id) const {
    if (!available() || id.empty()) return std::nullopt;

    auto res = get("/vectors/fetch", id);
    if (!res || !res->contains("vectors") || !(*res)["vectors"].contains(id)) return std::nullopt;

    try {
        const auto& entry = (*res)["vectors"][id];
        domain::ReferenceSnippet snippet;
        snippet.id = id;
        if (entry.contains("values")) snippet.embedding = entry["values"].get<std::vector<float>>();
        if (entry.contains("metadata")) snippet.metadata = MetadataFromJson(entry["metadata"]);
        return snippet;
    } catch (const std::exception& e) {
        std::cerr << "[RemoteReferenceIndex] Unexpected fetch response: " << e.what() << std::endl;
    }
    return std::nullopt;
}

bool RemoteReferenceIndex::remove(const std::string& id) {
    if (!available() || id.empty()) return false;
    json body = {{"ids", json::array({id})}, {"namespace", m_settings.nameSpace}};
    return post("/vectors/delete", body).has_value();
}

size_t RemoteReferenceIndex::size() const {
    if (!available()) return 0;
    auto stats = get("/describe_index_stats");
    if (!stats) return 0;
    return StatsVectorCount(*stats, m_settings.nameSpace);
}

} // namespace archmend::infrastructure
