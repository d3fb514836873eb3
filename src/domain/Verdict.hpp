/**
 * @file Verdict.hpp
 * @brief Verdict value objects produced by the validation pipeline.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>

namespace archmend::domain {

/**
 * @struct ModelVerdict
 * @brief The structured judgment returned by the generative model.
 */
struct ModelVerdict {
    bool violation = false;
    std::string reason;
    std::string fix;
};

/**
 * @enum AttemptOutcome
 * @brief Validation outcome of a single model exchange.
 */
enum class AttemptOutcome {
    Accepted,
    Rejected,    ///< Verdict was well formed but its fix did not parse.
    Malformed,   ///< Response was not a verdict object.
    Unavailable  ///< The model returned nothing.
};

/**
 * @struct GenerationAttempt
 * @brief Transient record of one exchange inside the loop.
 */
struct GenerationAttempt {
    std::string chunkId;
    int attemptNumber = 0;
    std::optional<std::string> rawOutput;
    std::optional<ModelVerdict> verdict;
    AttemptOutcome outcome = AttemptOutcome::Malformed;
    std::string feedback;
};

/**
 * @enum ChunkVerdictKind
 * @brief Distinguishes a validated verdict from the deterministic fallback.
 */
enum class ChunkVerdictKind {
    Accepted,
    ExhaustedFallback
};

/**
 * @struct ChunkVerdict
 * @brief Terminal result of the loop for one chunk.
 */
struct ChunkVerdict {
    int chunkIndex = 0;
    ChunkVerdictKind kind = ChunkVerdictKind::Accepted;
    bool violation = false;
    std::string reason;
    std::string fix;
    int attempts = 0;

    bool isFallback() const { return kind == ChunkVerdictKind::ExhaustedFallback; }

    bool operator==(const ChunkVerdict& other) const {
        return chunkIndex == other.chunkIndex && kind == other.kind && violation == other.violation &&
               reason == other.reason && fix == other.fix && attempts == other.attempts;
    }
    bool operator!=(const ChunkVerdict& other) const { return !(*this == other); }
};

/**
 * @struct FileVerdict
 * @brief Aggregated verdict for a whole SourceUnit, chunks kept in emission order.
 */
struct FileVerdict {
    std::string unitId;
    std::vector<ChunkVerdict> chunks;
    bool violation = false;
    std::string reason;
    std::string aggregatedFix;

    bool operator==(const FileVerdict& other) const {
        return unitId == other.unitId && chunks == other.chunks && violation == other.violation &&
               reason == other.reason && aggregatedFix == other.aggregatedFix;
    }
    bool operator!=(const FileVerdict& other) const { return !(*this == other); }
};

} // namespace archmend::domain
