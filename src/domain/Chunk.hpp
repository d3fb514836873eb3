/**
 * @file Chunk.hpp
 * @brief A bounded, ordered slice of a SourceUnit.
 */

#pragma once
#include <string>

namespace archmend::domain {

/**
 * @struct Chunk
 * @brief Unit of independent generation and validation.
 */
struct Chunk {
    std::string unitId;   ///< Owning SourceUnit id.
    int index = 0;        ///< 1-based position in emission order.
    std::string text;
    std::string label;    ///< "header", "type-body", "type-header", "member", "window" or "paragraph".
    int firstLine = 0;    ///< 1-based, 0 when the chunk is not line-addressed.
    int lastLine = 0;

    /** @brief Stable identifier, e.g. "src/Foo.java#3". */
    std::string id() const { return unitId + "#" + std::to_string(index); }
};

} // namespace archmend::domain
