/**
 * @file Orchestrator.hpp
 * @brief Drives chunking, validation, caching and merging across many units.
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/Chunker.hpp"
#include "application/ContextAssembler.hpp"
#include "application/RagService.hpp"
#include "application/ResultAggregator.hpp"
#include "application/StructuralMerger.hpp"
#include "application/ValidationLoop.hpp"
#include "application/WorkerPool.hpp"
#include "domain/MergeResult.hpp"
#include "domain/SourceUnit.hpp"
#include "domain/Verdict.hpp"
#include "infrastructure/ContentCache.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace archmend::application {

/**
 * @struct RunSettings
 * @brief Per-run knobs taken from the RefactorConfig.
 */
struct RunSettings {
    int maxLines = 300;
    int maxChars = 1000;
    int lineOverlap = 0;
    int paragraphOverlap = 200;
    int maxAttempts = 3;
    int chunkConcurrency = 2;
    size_t topK = 5;
    std::chrono::milliseconds shutdownTimeout{60000};
    std::string outputDirectory = "output";
    bool writeOutputs = true;
    bool indexProcessedCode = false;
};

enum class UnitStatus {
    Clean,       ///< No violation found.
    Refactored,  ///< Violation found, merged text produced.
    Failed,      ///< The unit's task raised; other units are unaffected.
    Abandoned    ///< Still running when the shutdown deadline expired.
};

const char* UnitStatusToString(UnitStatus status);

/**
 * @struct UnitOutcome
 * @brief What happened to one SourceUnit during runAll().
 */
struct UnitOutcome {
    std::string unitId;
    UnitStatus status = UnitStatus::Abandoned;
    bool cacheHit = false;
    std::optional<domain::MergeStatus> mergeStatus;
    std::string outputPath;
    std::string error;
    std::optional<domain::FileVerdict> verdict;
    std::string finalText;
};

/**
 * @class Orchestrator
 * @brief Bounded worker pool with one task per unit and per-unit failure isolation.
 *
 * Chunks of a unit are validated on a second pool so that unit tasks never
 * wait on their own threads.
 */
class Orchestrator {
public:
    Orchestrator(std::shared_ptr<domain::Transformer> transformer,
                 std::shared_ptr<const domain::StructuralParser> parser,
                 std::shared_ptr<const ContextAssembler> assembler,
                 std::shared_ptr<infrastructure::ContentCache> cache,
                 std::shared_ptr<infrastructure::PersistenceService> persistence,
                 std::shared_ptr<RagService> rag,
                 LoopPrompts prompts,
                 MergeStrategy strategy,
                 RunSettings settings);

    /**
     * @brief Processes every unit and waits up to the shutdown deadline.
     * @return One outcome per unit, in input order.
     */
    std::vector<UnitOutcome> runAll(const std::vector<domain::SourceUnit>& units, int concurrency);

    /** @brief "<outputDir>/<dir>/<stem>_Refactored<ext>" for a unit id. */
    static std::string OutputPathFor(const std::string& outputDirectory, const std::string& unitId);

    static void PrintSummary(const std::vector<UnitOutcome>& outcomes);

private:
    struct Pipeline;

    static UnitOutcome ProcessUnit(const std::shared_ptr<const Pipeline>& pipeline, WorkerPool& chunkPool,
                                   const domain::SourceUnit& unit);
    static domain::FileVerdict Validate(const std::shared_ptr<const Pipeline>& pipeline, WorkerPool& chunkPool,
                                        const domain::SourceUnit& unit);

    std::shared_ptr<Pipeline> m_pipeline;
};

} // namespace archmend::application
