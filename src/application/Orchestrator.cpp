/**
 * @file Orchestrator.cpp
 * @brief Implementation of the Orchestrator.
 */

#include "application/Orchestrator.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>

namespace fs = std::filesystem;

namespace archmend::application {

/** Collaborators shared by every task; outlives abandoned tasks. */
struct Orchestrator::Pipeline {
    std::shared_ptr<domain::Transformer> transformer;
    std::shared_ptr<const domain::StructuralParser> parser;
    std::shared_ptr<const ContextAssembler> assembler;
    std::shared_ptr<infrastructure::ContentCache> cache;
    std::shared_ptr<infrastructure::PersistenceService> persistence;
    std::shared_ptr<RagService> rag;
    Chunker chunker;
    ValidationLoop loop;
    ResultAggregator aggregator;
    StructuralMerger merger;
    RunSettings settings;

    Pipeline(std::shared_ptr<domain::Transformer> t,
             std::shared_ptr<const domain::StructuralParser> p,
             std::shared_ptr<const ContextAssembler> a,
             std::shared_ptr<infrastructure::ContentCache> c,
             std::shared_ptr<infrastructure::PersistenceService> ps,
             std::shared_ptr<RagService> r,
             LoopPrompts prompts,
             MergeStrategy strategy,
             RunSettings s)
        : transformer(t), parser(p), assembler(std::move(a)), cache(std::move(c)), persistence(std::move(ps)),
          rag(std::move(r)), loop(t, p, std::move(prompts)), merger(p, std::move(strategy)), settings(std::move(s)) {}
};

namespace {

struct OutcomeSlots {
    std::mutex mutex;
    std::vector<UnitOutcome> outcomes;
};

} // namespace

const char* UnitStatusToString(UnitStatus status) {
    switch (status) {
        case UnitStatus::Clean: return "Clean";
        case UnitStatus::Refactored: return "Refactored";
        case UnitStatus::Failed: return "Failed";
        case UnitStatus::Abandoned: return "Abandoned";
    }
    return "Failed";
}

Orchestrator::Orchestrator(std::shared_ptr<domain::Transformer> transformer,
                           std::shared_ptr<const domain::StructuralParser> parser,
                           std::shared_ptr<const ContextAssembler> assembler,
                           std::shared_ptr<infrastructure::ContentCache> cache,
                           std::shared_ptr<infrastructure::PersistenceService> persistence,
                           std::shared_ptr<RagService> rag,
                           LoopPrompts prompts,
                           MergeStrategy strategy,
                           RunSettings settings)
    : m_pipeline(std::make_shared<Pipeline>(std::move(transformer), std::move(parser), std::move(assembler),
                                            std::move(cache), std::move(persistence), std::move(rag),
                                            std::move(prompts), std::move(strategy), std::move(settings))) {}

std::vector<UnitOutcome> Orchestrator::runAll(const std::vector<domain::SourceUnit>& units, int concurrency) {
    const auto deadline = std::chrono::steady_clock::now() + m_pipeline->settings.shutdownTimeout;

    auto slots = std::make_shared<OutcomeSlots>();
    slots->outcomes.resize(units.size());
    for (size_t i = 0; i < units.size(); ++i) {
        slots->outcomes[i].unitId = units[i].id;
    }

    auto chunkPool = std::make_shared<WorkerPool>(static_cast<size_t>(std::max(1, m_pipeline->settings.chunkConcurrency)), "ChunkPool");
    WorkerPool unitPool(static_cast<size_t>(std::max(1, concurrency)), "UnitPool");

    std::cout << "[Orchestrator] Processing " << units.size() << " unit(s) with " << unitPool.size()
              << " worker(s)." << std::endl;

    for (size_t i = 0; i < units.size(); ++i) {
        unitPool.submit([pipeline = m_pipeline, chunkPool, slots, unit = units[i], i]() {
            UnitOutcome outcome;
            try {
                outcome = ProcessUnit(pipeline, *chunkPool, unit);
            } catch (const std::exception& e) {
                std::cerr << "[Orchestrator] " << unit.id << " failed: " << e.what() << std::endl;
                outcome = UnitOutcome{};
                outcome.unitId = unit.id;
                outcome.status = UnitStatus::Failed;
                outcome.error = e.what();
            }
            std::lock_guard<std::mutex> lock(slots->mutex);
            slots->outcomes[i] = std::move(outcome);
        });
    }

    bool completed = unitPool.shutdown(m_pipeline->settings.shutdownTimeout);
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    chunkPool->shutdown(std::max(std::chrono::milliseconds(0), remaining));
    if (!completed) {
        std::cerr << "[Orchestrator] Run completed with abandoned units." << std::endl;
    }

    if (m_pipeline->persistence) {
        m_pipeline->persistence->flush();
    }

    std::lock_guard<std::mutex> lock(slots->mutex);
    return slots->outcomes;
}

UnitOutcome Orchestrator::ProcessUnit(const std::shared_ptr<const Pipeline>& shared, WorkerPool& chunkPool,
                                      const domain::SourceUnit& unit) {
    const Pipeline& pipeline = *shared;
    UnitOutcome outcome;
    outcome.unitId = unit.id;

    std::optional<domain::FileVerdict> verdict;
    if (pipeline.cache) {
        verdict = pipeline.cache->get(unit.contentHash);
    }
    if (verdict) {
        outcome.cacheHit = true;
        verdict->unitId = unit.id;
        std::cout << "[Orchestrator] " << unit.id << ": cache hit." << std::endl;
    } else {
        verdict = Validate(shared, chunkPool, unit);
        if (pipeline.cache) {
            pipeline.cache->put(unit.contentHash, *verdict);
        }
    }

    if (!verdict->violation) {
        outcome.status = UnitStatus::Clean;
        outcome.finalText = unit.text;
    } else {
        domain::MergeResult merged = pipeline.merger.merge(unit, *verdict);
        outcome.status = UnitStatus::Refactored;
        outcome.mergeStatus = merged.status;
        outcome.finalText = std::move(merged.finalText);

        if (pipeline.settings.writeOutputs && pipeline.persistence) {
            outcome.outputPath = OutputPathFor(pipeline.settings.outputDirectory, unit.id);
            pipeline.persistence->saveTextAsync(outcome.outputPath, outcome.finalText);
        }
    }

    if (pipeline.settings.indexProcessedCode && pipeline.rag && pipeline.rag->isAvailable()) {
        std::vector<std::pair<std::string, std::string>> snippets = {{unit.id, unit.text}};
        if (verdict->violation) {
            snippets.emplace_back(unit.id + "_fix", verdict->aggregatedFix);
        }
        pipeline.rag->indexCodeSnippets(snippets);
    }

    std::cout << "[Orchestrator] " << unit.id << ": " << UnitStatusToString(outcome.status);
    if (outcome.mergeStatus) std::cout << " (" << domain::MergeStatusToString(*outcome.mergeStatus) << ")";
    std::cout << std::endl;

    outcome.verdict = std::move(verdict);
    return outcome;
}

domain::FileVerdict Orchestrator::Validate(const std::shared_ptr<const Pipeline>& shared, WorkerPool& chunkPool,
                                           const domain::SourceUnit& unit) {
    const Pipeline& pipeline = *shared;
    const RunSettings& s = pipeline.settings;
    ChunkMode mode = Chunker::ModeFor(unit.type);
    std::vector<domain::Chunk> chunks = mode == ChunkMode::ParagraphWindow
        ? pipeline.chunker.split(unit, s.maxChars, s.paragraphOverlap, mode)
        : pipeline.chunker.split(unit, s.maxLines, s.lineOverlap, mode);

    std::vector<std::future<domain::ChunkVerdict>> pending;
    pending.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        pending.push_back(chunkPool.submit([shared, chunk]() {
            std::string context = shared->assembler ? shared->assembler->assemble(chunk, shared->settings.topK) : "";
            return shared->loop.run(chunk, context, shared->settings.maxAttempts);
        }));
    }

    std::vector<domain::ChunkVerdict> verdicts;
    verdicts.reserve(pending.size());
    for (auto& future : pending) {
        verdicts.push_back(future.get());
    }
    return pipeline.aggregator.aggregate(unit, std::move(verdicts));
}

std::string Orchestrator::OutputPathFor(const std::string& outputDirectory, const std::string& unitId) {
    fs::path relative(unitId);
    std::string name = relative.stem().string() + "_Refactored" + relative.extension().string();
    return (fs::path(outputDirectory) / relative.parent_path() / name).string();
}

void Orchestrator::PrintSummary(const std::vector<UnitOutcome>& outcomes) {
    std::map<std::string, int> byStatus;
    std::map<std::string, int> byMerge;
    int cacheHits = 0;
    for (const auto& outcome : outcomes) {
        ++byStatus[UnitStatusToString(outcome.status)];
        if (outcome.mergeStatus) ++byMerge[domain::MergeStatusToString(*outcome.mergeStatus)];
        if (outcome.cacheHit) ++cacheHits;
    }

    std::cout << "[Orchestrator] Summary: " << outcomes.size() << " unit(s), " << cacheHits << " cache hit(s)" << std::endl;
    for (const auto& entry : byStatus) {
        std::cout << "  " << entry.first << ": " << entry.second << std::endl;
    }
    for (const auto& entry : byMerge) {
        std::cout << "  merge " << entry.first << ": " << entry.second << std::endl;
    }
    for (const auto& outcome : outcomes) {
        if (outcome.status == UnitStatus::Failed) {
            std::cout << "  failed " << outcome.unitId << ": " << outcome.error << std::endl;
        }
    }
}

} // namespace archmend::application
