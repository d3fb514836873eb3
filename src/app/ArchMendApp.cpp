/**
 * @file ArchMendApp.cpp
 * @brief Implementation of the ArchMendApp lifecycle.
 */

#include "app/ArchMendApp.hpp"
#include "application/RagEvaluator.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/InMemoryReferenceIndex.hpp"
#include "infrastructure/JavaStructureParser.hpp"
#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include "infrastructure/OllamaTransformer.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/RemoteReferenceIndex.hpp"
#include "infrastructure/SourceScanner.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace archmend::app {

ArchMendApp::ArchMendApp(LaunchOptions options)
    : m_options(std::move(options)) {}

int ArchMendApp::Run() {
    m_config = infrastructure::ConfigLoader::Load(m_options.configPath, m_options.configRequired);
    if (m_options.noCache) {
        m_config.cacheEnabled = false;
    }

    infrastructure::SourceScanner scanner(m_options.sourceDirectory);
    std::vector<domain::SourceUnit> units = scanner.scan();
    units.erase(std::remove_if(units.begin(), units.end(), [](const domain::SourceUnit& u) {
        return u.type != domain::ContentType::Java;
    }), units.end());
    std::cout << "[ArchMend] Found " << units.size() << " Java file(s) under " << m_options.sourceDirectory << std::endl;

    Init();
    IndexReferences();
    EvaluateRetrieval();

    auto outcomes = m_services.orchestrator->runAll(units, m_config.concurrency);
    application::Orchestrator::PrintSummary(outcomes);

    Shutdown();
    return 0;
}

void ArchMendApp::Init() {
    auto transformer = std::make_shared<infrastructure::OllamaTransformer>(
        m_config.ollamaHost, m_config.ollamaPort, m_config.chatModel, m_config.requestTimeoutSeconds);
    transformer->initialize();
    m_services.transformer = transformer;
    std::cout << "[ArchMend] Chat model: " << transformer->getCurrentModel() << std::endl;

    m_services.parser = std::make_shared<infrastructure::JavaStructureParser>();

    if (m_config.ragEnabled) {
        auto embeddings = std::make_shared<infrastructure::OllamaEmbeddingProvider>(
            m_config.ollamaHost, m_config.ollamaPort, m_config.embeddingModel);
        embeddings->initialize();
        m_services.embeddingProvider = embeddings;

        if (m_config.vectorProvider == "remote") {
            infrastructure::RemoteReferenceIndex::Settings settings;
            settings.baseUrl = m_config.remoteUrl;
            settings.apiKey = m_config.remoteApiKey;
            settings.nameSpace = m_config.remoteNamespace;
            m_services.referenceIndex = std::make_shared<infrastructure::RemoteReferenceIndex>(settings);
        } else {
            m_services.referenceIndex = std::make_shared<infrastructure::InMemoryReferenceIndex>();
        }
        m_services.referenceIndex->initialize();

        m_services.ragService = std::make_shared<application::RagService>(
            m_services.embeddingProvider, m_services.referenceIndex, m_config.relevanceThreshold);

        application::RetrievalSettings retrieval;
        retrieval.topK = static_cast<size_t>(m_config.maxResults);
        retrieval.queryChars = static_cast<size_t>(m_config.queryChars);
        retrieval.queryPrefix = m_config.queryPrefix;
        m_services.contextAssembler = std::make_shared<application::ContextAssembler>(m_services.ragService, retrieval);

        m_services.referenceLibrary = std::make_unique<application::ReferenceLibrary>(
            m_services.ragService, m_config.maxLines, m_config.maxChars, m_config.paragraphOverlap);

        if (!m_services.ragService->isAvailable()) {
            std::cerr << "[ArchMend] Retrieval unavailable; chunks are sent without reference context." << std::endl;
        }
    }

    m_services.contentCache = std::make_shared<infrastructure::ContentCache>(m_config.cacheDirectory, m_config.cacheEnabled);
    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();

    application::RunSettings run;
    run.maxLines = m_config.maxLines;
    run.maxChars = m_config.maxChars;
    run.lineOverlap = m_config.lineOverlap;
    run.paragraphOverlap = m_config.paragraphOverlap;
    run.maxAttempts = m_config.maxAttempts;
    run.chunkConcurrency = m_config.chunkConcurrency;
    run.topK = static_cast<size_t>(m_config.maxResults);
    run.shutdownTimeout = std::chrono::seconds(m_config.shutdownTimeoutSeconds);
    run.outputDirectory = m_options.outputDirectory;
    run.indexProcessedCode = m_config.indexProcessedCode;

    application::MergeStrategy strategy{m_config.removalList, m_config.domainKeywords};

    m_services.orchestrator = std::make_unique<application::Orchestrator>(
        m_services.transformer, m_services.parser, m_services.contextAssembler, m_services.contentCache,
        m_services.persistenceService, m_services.ragService,
        infrastructure::PromptCatalog::GetLoopPrompts(m_config.basePolicy), strategy, run);
}

void ArchMendApp::IndexReferences() {
    if (m_config.referenceDirectory.empty() || !m_services.referenceLibrary) {
        return;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(m_config.referenceDirectory, ec)) {
        std::cerr << "[ArchMend] Reference directory not found: " << m_config.referenceDirectory << std::endl;
        return;
    }

    infrastructure::SourceScanner scanner(m_config.referenceDirectory);
    auto result = m_services.referenceLibrary->indexUnits(scanner.scan());
    for (const auto& error : result.errors) {
        std::cerr << "[ArchMend] " << error << std::endl;
    }
}

void ArchMendApp::EvaluateRetrieval() {
    if (m_options.evaluationPath.empty()) {
        return;
    }
    application::EvaluationSet set = infrastructure::ConfigLoader::LoadEvaluationSet(m_options.evaluationPath);
    if (!m_services.ragService || !m_services.ragService->isAvailable()) {
        std::cerr << "[ArchMend] Retrieval unavailable; evaluation skipped." << std::endl;
        return;
    }

    std::string outputDirectory = (std::filesystem::path(m_options.outputDirectory) / "rag_eval").string();
    application::RagEvaluator evaluator(m_services.embeddingProvider, m_services.referenceIndex,
                                        m_services.persistenceService, outputDirectory,
                                        static_cast<size_t>(m_config.maxResults));
    if (!set.queries.empty()) {
        evaluator.evaluateWithQueries(set.queries);
    }
    if (!set.documentGroups.empty()) {
        evaluator.evaluateEmbeddingQuality(set.documentGroups);
    }
}

void ArchMendApp::Shutdown() {
    if (m_services.persistenceService) {
        m_services.persistenceService->flush();
        m_services.persistenceService->stop();
        if (m_services.persistenceService->failedWrites() > 0) {
            std::cerr << "[ArchMend] " << m_services.persistenceService->failedWrites()
                      << " output file(s) could not be written." << std::endl;
        }
    }
}

} // namespace archmend::app
