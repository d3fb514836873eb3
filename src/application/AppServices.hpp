/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ContextAssembler.hpp"
#include "application/Orchestrator.hpp"
#include "application/RagService.hpp"
#include "application/ReferenceLibrary.hpp"
#include "domain/EmbeddingProvider.hpp"
#include "domain/ReferenceIndex.hpp"
#include "domain/StructuralParser.hpp"
#include "domain/Transformer.hpp"
#include "infrastructure/ContentCache.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace archmend::application {

struct AppServices {
    std::shared_ptr<domain::Transformer> transformer;
    std::shared_ptr<domain::EmbeddingProvider> embeddingProvider;
    std::shared_ptr<domain::ReferenceIndex> referenceIndex;
    std::shared_ptr<const domain::StructuralParser> parser;
    std::shared_ptr<RagService> ragService;
    std::shared_ptr<const ContextAssembler> contextAssembler;
    std::unique_ptr<ReferenceLibrary> referenceLibrary;
    std::shared_ptr<infrastructure::ContentCache> contentCache;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::unique_ptr<Orchestrator> orchestrator;
};

} // namespace archmend::application
