/**
 * @file RagEvaluator.cpp
 * @brief Implementation of RagEvaluator.
 */

#include "application/RagEvaluator.hpp"
#include "application/Utf8.hpp"
#include "infrastructure/InMemoryReferenceIndex.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>

namespace archmend::application {

using json = nlohmann::json;

namespace {

constexpr size_t kExcerptBytes = 200;

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string FormatNow(const char* format) {
    std::tm tm = ToLocalTime(std::time(nullptr));
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), format, &tm);
    return buffer;
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string MetadataValue(const domain::Metadata& metadata, const char* key, const char* fallback) {
    auto it = metadata.find(key);
    return it != metadata.end() ? it->second : std::string(fallback);
}

long long ElapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

double Mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

} // namespace

RagEvaluator::RagEvaluator(std::shared_ptr<domain::EmbeddingProvider> embeddings,
                           std::shared_ptr<domain::ReferenceIndex> index,
                           std::shared_ptr<infrastructure::PersistenceService> persistence,
                           std::string outputDirectory,
                           size_t topK)
    : m_embeddings(std::move(embeddings)), m_index(std::move(index)), m_persistence(std::move(persistence)),
      m_outputDirectory(std::move(outputDirectory)), m_topK(topK) {}

bool RagEvaluator::isAvailable() const {
    return m_embeddings && m_index && m_embeddings->available() && m_index->available();
}

int RagEvaluator::CountKeywordHits(const std::string& content, const std::vector<std::string>& keywords) {
    std::string lowered = ToLower(content);
    int hits = 0;
    for (const auto& keyword : keywords) {
        if (!keyword.empty() && lowered.find(ToLower(keyword)) != std::string::npos) {
            ++hits;
        }
    }
    return hits;
}

QueryEvaluation RagEvaluator::evaluateQuery(const EvaluationQuery& query) const {
    QueryEvaluation result;
    result.query = query.query;
    result.expectedKeywords = query.expectedKeywords;

    auto start = std::chrono::steady_clock::now();
    std::vector<float> vec = m_embeddings->embed(query.query);
    result.embeddingMs = ElapsedMs(start);
    if (vec.empty()) {
        result.error = "embedding failed";
        result.totalMs = ElapsedMs(start);
        std::cerr << "[RagEvaluator] Embedding failed for query '" << query.query << "'" << std::endl;
        return result;
    }

    auto searchStart = std::chrono::steady_clock::now();
    auto hits = m_index->search(vec, m_topK);
    result.searchMs = ElapsedMs(searchStart);

    for (const auto& hit : hits) {
        EvaluatedHit evaluated;
        evaluated.id = hit.id;
        evaluated.score = hit.score;
        evaluated.title = MetadataValue(hit.metadata, "title", "Untitled");
        std::string content = MetadataValue(hit.metadata, "content", "");
        evaluated.excerpt = content.size() > kExcerptBytes ? Utf8Prefix(content, kExcerptBytes) + "..." : content;
        evaluated.keywordHits = CountKeywordHits(content, query.expectedKeywords);
        result.keywordHits += evaluated.keywordHits;
        result.hits.push_back(std::move(evaluated));
    }
    if (!result.hits.empty()) {
        result.topScore = result.hits.front().score;
    }
    result.totalMs = ElapsedMs(start);
    return result;
}

QueryReport RagEvaluator::evaluateWithQueries(const std::vector<EvaluationQuery>& queries) {
    QueryReport report;
    if (!isAvailable()) {
        std::cerr << "[RagEvaluator] Retrieval unavailable; query evaluation skipped." << std::endl;
        return report;
    }

    report.timestamp = FormatNow("%Y-%m-%dT%H:%M:%S");
    std::vector<double> relevance;
    std::vector<double> keywordHits;
    size_t queriesWithHits = 0;
    for (const auto& query : queries) {
        QueryEvaluation evaluation = evaluateQuery(query);
        relevance.push_back(evaluation.topScore);
        keywordHits.push_back(evaluation.keywordHits);
        if (evaluation.keywordHits > 0) ++queriesWithHits;
        report.queries.push_back(std::move(evaluation));
    }

    report.avgRelevanceScore = Mean(relevance);
    report.avgKeywordHits = Mean(keywordHits);
    report.keywordHitRate = queries.empty() ? 0.0 : static_cast<double>(queriesWithHits) / static_cast<double>(queries.size());

    std::cout << "[RagEvaluator] " << queries.size() << " queries, avg relevance " << report.avgRelevanceScore
              << ", avg keyword hits " << report.avgKeywordHits
              << ", keyword hit rate " << report.keywordHitRate << std::endl;

    report.reportPath = saveReport("rag_eval_", report.toJson());
    return report;
}

EmbeddingQualityReport RagEvaluator::evaluateEmbeddingQuality(const std::map<std::string, std::vector<std::string>>& documentGroups) {
    EmbeddingQualityReport report;
    if (!isAvailable()) {
        std::cerr << "[RagEvaluator] Retrieval unavailable; embedding evaluation skipped." << std::endl;
        return report;
    }

    report.timestamp = FormatNow("%Y-%m-%dT%H:%M:%S");
    report.embeddingDimension = m_embeddings->dimension();

    std::map<std::string, std::vector<std::vector<float>>> vectors;
    for (const auto& [name, ids] : documentGroups) {
        auto& groupVectors = vectors[name];
        for (const auto& id : ids) {
            auto snippet = m_index->getById(id);
            if (!snippet) {
                std::cerr << "[RagEvaluator] Document not found: " << id << std::endl;
                continue;
            }
            if (snippet->embedding.empty()) {
                std::cerr << "[RagEvaluator] No embedding stored for document: " << id << std::endl;
                continue;
            }
            groupVectors.push_back(snippet->embedding);
        }
    }

    std::vector<double> intraAverages;
    std::vector<double> interAverages;
    for (const auto& [name, ids] : documentGroups) {
        const auto& own = vectors[name];
        GroupEvaluation group;
        group.name = name;
        group.documentCount = ids.size();
        group.retrievedDocuments = own.size();

        std::vector<double> intra;
        for (size_t i = 0; i < own.size(); ++i) {
            for (size_t j = i + 1; j < own.size(); ++j) {
                intra.push_back(infrastructure::InMemoryReferenceIndex::CosineSimilarity(own[i], own[j]));
            }
        }
        std::vector<double> inter;
        for (const auto& [otherName, others] : vectors) {
            if (otherName == name) continue;
            for (const auto& a : own) {
                for (const auto& b : others) {
                    inter.push_back(infrastructure::InMemoryReferenceIndex::CosineSimilarity(a, b));
                }
            }
        }

        group.similarityPairs = intra.size();
        group.avgIntraGroupSimilarity = Mean(intra);
        group.avgInterGroupSimilarity = Mean(inter);
        intraAverages.push_back(group.avgIntraGroupSimilarity);
        interAverages.push_back(group.avgInterGroupSimilarity);
        report.groups.push_back(std::move(group));
    }

    report.avgIntraGroupSimilarity = Mean(intraAverages);
    report.avgInterGroupSimilarity = Mean(interAverages);

    std::cout << "[RagEvaluator] " << report.groups.size() << " groups, avg intra-group similarity "
              << report.avgIntraGroupSimilarity << ", avg inter-group similarity "
              << report.avgInterGroupSimilarity << std::endl;

    report.reportPath = saveReport("rag_embedding_eval_", report.toJson());
    return report;
}

std::string RagEvaluator::saveReport(const std::string& prefix, const json& report) const {
    if (m_outputDirectory.empty()) {
        std::cerr << "[RagEvaluator] No output directory configured; report not saved." << std::endl;
        return "";
    }
    std::string path = (std::filesystem::path(m_outputDirectory) / (prefix + FormatNow("%Y%m%d_%H%M%S") + ".json")).string();
    std::string content = report.dump(2, ' ', false, json::error_handler_t::replace);
    if (m_persistence) {
        m_persistence->saveTextAsync(path, content);
    } else if (!infrastructure::PersistenceService::WriteAtomically(path, content)) {
        return "";
    }
    std::cout << "[RagEvaluator] Report saved to " << path << std::endl;
    return path;
}

json QueryReport::toJson() const {
    json results = json::array();
    for (const auto& q : queries) {
        json hits = json::array();
        for (const auto& hit : q.hits) {
            hits.push_back({
                {"id", hit.id},
                {"title", hit.title},
                {"score", hit.score},
                {"content_excerpt", hit.excerpt},
                {"keyword_hits", hit.keywordHits}
            });
        }
        json entry = {
            {"query", q.query},
            {"expected_keywords", q.expectedKeywords},
            {"results_count", q.hits.size()},
            {"top_score", q.topScore},
            {"relevance_score", q.topScore},
            {"keyword_hits", q.keywordHits},
            {"embedding_time_ms", q.embeddingMs},
            {"search_time_ms", q.searchMs},
            {"total_time_ms", q.totalMs},
            {"results", hits}
        };
        if (!q.error.empty()) entry["error"] = q.error;
        results.push_back(std::move(entry));
    }
    return {
        {"timestamp", timestamp},
        {"total_queries", queries.size()},
        {"avg_relevance_score", avgRelevanceScore},
        {"avg_keyword_hits", avgKeywordHits},
        {"keyword_hit_rate", keywordHitRate},
        {"query_results", results}
    };
}

json EmbeddingQualityReport::toJson() const {
    json groupResults = json::array();
    for (const auto& g : groups) {
        groupResults.push_back({
            {"group_name", g.name},
            {"document_count", g.documentCount},
            {"retrieved_documents", g.retrievedDocuments},
            {"similarity_pairs", g.similarityPairs},
            {"avg_intra_group_similarity", g.avgIntraGroupSimilarity},
            {"avg_inter_group_similarity", g.avgInterGroupSimilarity}
        });
    }
    return {
        {"timestamp", timestamp},
        {"embedding_dimension", embeddingDimension},
        {"avg_intra_group_similarity", avgIntraGroupSimilarity},
        {"avg_inter_group_similarity", avgInterGroupSimilarity},
        {"group_results", groupResults}
    };
}

} // namespace archmend::application
