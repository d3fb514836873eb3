/**
 * @file ReferenceLibrary.hpp
 * @brief Loads a directory of reference documents into the RagService.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/Chunker.hpp"
#include "application/RagService.hpp"
#include "domain/SourceUnit.hpp"

namespace archmend::application {

/**
 * @class ReferenceLibrary
 * @brief Chunks reference files and indexes each chunk as a document.
 *
 * Java sources are chunked structure-aware, Markdown and text files by
 * paragraph window.
 */
class ReferenceLibrary {
public:
    struct IndexingResult {
        int filesScanned = 0;
        int chunksIndexed = 0;
        std::vector<std::string> errors;
    };

    ReferenceLibrary(std::shared_ptr<RagService> rag, int maxLines, int maxChars, int paragraphOverlap);

    /** @brief Indexes every unit; units of unknown type are skipped. */
    IndexingResult indexUnits(const std::vector<domain::SourceUnit>& units);

    /** @brief Deterministic document id for the index-th chunk of a title. */
    static std::string DocumentId(const std::string& title, int index);

private:
    std::shared_ptr<RagService> m_rag;
    Chunker m_chunker;
    int m_maxLines;
    int m_maxChars;
    int m_paragraphOverlap;
};

} // namespace archmend::application
