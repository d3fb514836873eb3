/**
 * @file Chunker.hpp
 * @brief Splits source units into ordered, bounded chunks.
 */

#pragma once

#include <vector>
#include "domain/Chunk.hpp"
#include "domain/SourceUnit.hpp"

namespace archmend::application {

/**
 * @enum ChunkMode
 * @brief Chunking strategy.
 */
enum class ChunkMode {
    LineWindow,      ///< maxSize lines per window, advancing by maxSize - overlap.
    StructureAware,  ///< Header, then declarations, then members, then line windows.
    ParagraphWindow  ///< Paragraphs accumulated up to maxSize characters.
};

/**
 * @class Chunker
 * @brief Stateless, deterministic splitter.
 *
 * Identical input and parameters always yield the identical chunk sequence.
 * Chunks that contain only whitespace are dropped; indexes are 1-based and
 * contiguous after dropping.
 */
class Chunker {
public:
    /**
     * @brief Splits a unit into chunks.
     * @throws std::invalid_argument if maxSize <= overlap, maxSize < 1 or overlap < 0.
     */
    std::vector<domain::Chunk> split(const domain::SourceUnit& unit, int maxSize, int overlap, ChunkMode mode) const;

    /** @brief Default strategy for a content type. */
    static ChunkMode ModeFor(domain::ContentType type);

private:
    struct LineRange {
        size_t begin;
        size_t end;
        const char* label;
    };

    static std::vector<LineRange> lineWindows(size_t begin, size_t end, size_t maxSize, size_t overlap, const char* label);
    static std::vector<LineRange> structureRanges(const std::vector<std::string>& lines, size_t maxSize);
    static std::vector<domain::Chunk> paragraphChunks(const domain::SourceUnit& unit, size_t maxSize, size_t overlap);
};

} // namespace archmend::application
