/**
 * @file JavaStructureParser.hpp
 * @brief Declaration-level parser for Java-like source.
 */

#pragma once

#include "domain/StructuralParser.hpp"

namespace archmend::infrastructure {

/**
 * @class JavaStructureParser
 * @brief Brace-aware tokenizer and declaration parser.
 *
 * Recognises package/import headers, type declarations, their members and the
 * top-level statements of method bodies. It checks structure only: delimiters,
 * literal termination, declaration shape and statement termination. It is not
 * a type checker.
 */
class JavaStructureParser : public domain::StructuralParser {
public:
    domain::ParseOutcome parse(const std::string& text) const override;
};

} // namespace archmend::infrastructure
