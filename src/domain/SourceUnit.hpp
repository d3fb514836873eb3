/**
 * @file SourceUnit.hpp
 * @brief Domain entity representing one source file read for processing.
 */

#pragma once
#include <string>

namespace archmend::domain {

/**
 * @enum ContentType
 * @brief Categorization of source files, drives the chunking strategy.
 */
enum class ContentType {
    Java,
    Markdown,
    PlainText,
    Unknown
};

/**
 * @struct SourceUnit
 * @brief Immutable snapshot of a file: key, full text and content hash.
 */
struct SourceUnit {
    std::string id;            ///< Path relative to the source root, used as key.
    std::string path;          ///< Absolute or working-directory path on disk.
    std::string text;          ///< Full file content.
    std::string contentHash;   ///< SHA-256 hex of the exact bytes of text.
    ContentType type = ContentType::Unknown;
};

} // namespace archmend::domain
