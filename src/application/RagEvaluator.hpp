/**
 * @file RagEvaluator.hpp
 * @brief Measures retrieval quality against a set of known queries and document groups.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/EmbeddingProvider.hpp"
#include "domain/ReferenceIndex.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace archmend::application {

/**
 * @struct EvaluationQuery
 * @brief A test query and the keywords its results are expected to mention.
 */
struct EvaluationQuery {
    std::string query;
    std::vector<std::string> expectedKeywords;
};

/**
 * @struct EvaluationSet
 * @brief Queries plus named groups of document ids that should embed close together.
 */
struct EvaluationSet {
    std::vector<EvaluationQuery> queries;
    std::map<std::string, std::vector<std::string>> documentGroups;
};

struct EvaluatedHit {
    std::string id;
    std::string title;
    std::string excerpt;  ///< First 200 bytes of the content, "..." when cut.
    float score = 0.0f;
    int keywordHits = 0;
};

/**
 * @struct QueryEvaluation
 * @brief Outcome of one query. The relevance score is the top hit's score.
 */
struct QueryEvaluation {
    std::string query;
    std::vector<std::string> expectedKeywords;
    std::vector<EvaluatedHit> hits;
    float topScore = 0.0f;
    int keywordHits = 0;  ///< Sum over hits of the expected keywords each one contains.
    long long embeddingMs = 0;
    long long searchMs = 0;
    long long totalMs = 0;
    std::string error;    ///< Non-empty when the query could not be evaluated.
};

struct QueryReport {
    std::string timestamp;
    std::vector<QueryEvaluation> queries;
    double avgRelevanceScore = 0.0;
    double avgKeywordHits = 0.0;
    double keywordHitRate = 0.0;  ///< Share of queries with at least one keyword hit.
    std::string reportPath;       ///< Where the JSON report was queued; empty if not saved.

    nlohmann::json toJson() const;
};

struct GroupEvaluation {
    std::string name;
    size_t documentCount = 0;
    size_t retrievedDocuments = 0;
    size_t similarityPairs = 0;
    double avgIntraGroupSimilarity = 0.0;
    double avgInterGroupSimilarity = 0.0;  ///< Against every retrieved document of the other groups.
};

struct EmbeddingQualityReport {
    std::string timestamp;
    size_t embeddingDimension = 0;
    std::vector<GroupEvaluation> groups;
    double avgIntraGroupSimilarity = 0.0;
    double avgInterGroupSimilarity = 0.0;
    std::string reportPath;

    nlohmann::json toJson() const;
};

/**
 * @class RagEvaluator
 * @brief Runs evaluation queries and similarity checks directly against the
 * embedding provider and the reference index, bypassing the relevance threshold.
 *
 * Query reports are written as rag_eval_<yyyyMMdd_HHmmss>.json and embedding
 * reports as rag_embedding_eval_<yyyyMMdd_HHmmss>.json under the output
 * directory. An unavailable backend yields empty, unsaved reports.
 */
class RagEvaluator {
public:
    RagEvaluator(std::shared_ptr<domain::EmbeddingProvider> embeddings,
                 std::shared_ptr<domain::ReferenceIndex> index,
                 std::shared_ptr<infrastructure::PersistenceService> persistence,
                 std::string outputDirectory,
                 size_t topK = 5);

    QueryReport evaluateWithQueries(const std::vector<EvaluationQuery>& queries);

    EmbeddingQualityReport evaluateEmbeddingQuality(const std::map<std::string, std::vector<std::string>>& documentGroups);

    /** @brief Counts the keywords, case-insensitively, that occur in content. */
    static int CountKeywordHits(const std::string& content, const std::vector<std::string>& keywords);

private:
    bool isAvailable() const;
    QueryEvaluation evaluateQuery(const EvaluationQuery& query) const;
    std::string saveReport(const std::string& prefix, const nlohmann::json& report) const;

    std::shared_ptr<domain::EmbeddingProvider> m_embeddings;
    std::shared_ptr<domain::ReferenceIndex> m_index;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    std::string m_outputDirectory;
    size_t m_topK;
};

} // namespace archmend::application
