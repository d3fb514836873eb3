/**
 * @file SourceScanner.hpp
 * @brief Recursively reads source files into SourceUnits.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/SourceUnit.hpp"

namespace archmend::infrastructure {

/**
 * @class SourceScanner
 * @brief Infrastructure adapter that walks a directory tree.
 *
 * Only .java, .md and .txt files are returned. Units come back sorted by id
 * so that runs over the same tree are reproducible.
 */
class SourceScanner {
public:
    explicit SourceScanner(const std::string& rootPath);

    /**
     * @brief Scans the tree under the root.
     * @return Units with text and content hash filled in.
     * @throws std::invalid_argument if the root is not a directory.
     */
    std::vector<domain::SourceUnit> scan() const;

    /** @brief Reads a single file; the id is its path relative to the root. */
    domain::SourceUnit load(const std::string& filePath) const;

    static domain::ContentType ClassifyByExtension(const std::string& extension);

private:
    std::string m_rootPath;
};

} // namespace archmend::infrastructure
