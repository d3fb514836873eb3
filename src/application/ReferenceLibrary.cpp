/**
 * @file ReferenceLibrary.cpp
 * @brief Implementation of the ReferenceLibrary.
 */

#include "application/ReferenceLibrary.hpp"
#include "infrastructure/ContentHasher.hpp"
#include <iostream>
#include <stdexcept>

namespace archmend::application {

ReferenceLibrary::ReferenceLibrary(std::shared_ptr<RagService> rag, int maxLines, int maxChars, int paragraphOverlap)
    : m_rag(std::move(rag)), m_maxLines(maxLines), m_maxChars(maxChars), m_paragraphOverlap(paragraphOverlap) {}

std::string ReferenceLibrary::DocumentId(const std::string& title, int index) {
    return "doc_" + infrastructure::ContentHasher::Sha256Hex(title + std::to_string(index)).substr(0, 16);
}

ReferenceLibrary::IndexingResult ReferenceLibrary::indexUnits(const std::vector<domain::SourceUnit>& units) {
    IndexingResult result;
    if (!m_rag || !m_rag->isAvailable()) {
        std::cerr << "[ReferenceLibrary] Retrieval unavailable; reference documents not indexed." << std::endl;
        return result;
    }

    for (const auto& unit : units) {
        if (unit.type == domain::ContentType::Unknown) continue;
        ++result.filesScanned;

        ChunkMode mode = Chunker::ModeFor(unit.type);
        std::vector<domain::Chunk> chunks;
        try {
            chunks = mode == ChunkMode::ParagraphWindow
                ? m_chunker.split(unit, m_maxChars, m_paragraphOverlap, mode)
                : m_chunker.split(unit, m_maxLines, 0, mode);
        } catch (const std::invalid_argument& e) {
            result.errors.push_back(unit.id + ": " + e.what());
            continue;
        }

        const int total = static_cast<int>(chunks.size());
        for (const auto& chunk : chunks) {
            std::string title = unit.id + " (Chunk " + std::to_string(chunk.index) + " of " + std::to_string(total) + ")";
            domain::Metadata extra = {{"source", unit.id}, {"tags", "reference"}};
            if (m_rag->indexDocument(DocumentId(title, chunk.index), title, chunk.text, extra)) {
                ++result.chunksIndexed;
            } else {
                result.errors.push_back("Failed to index " + title);
            }
        }
    }

    std::cout << "[ReferenceLibrary] Indexed " << result.chunksIndexed << " chunk(s) from "
              << result.filesScanned << " file(s)." << std::endl;
    return result;
}

} // namespace archmend::application
