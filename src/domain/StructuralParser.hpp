/**
 * @file StructuralParser.hpp
 * @brief Source-language parser used as acceptance oracle and merge substrate.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/SourceTree.hpp"

namespace archmend::domain {

/**
 * @struct ParseError
 * @brief Position and description of the first syntax error.
 */
struct ParseError {
    std::string message;
    int line = 0;
    int column = 0;

    std::string toString() const {
        return message + " at line " + std::to_string(line) + ", column " + std::to_string(column);
    }
};

/**
 * @struct ParseOutcome
 * @brief Either a ParsedUnit or a ParseError.
 */
struct ParseOutcome {
    std::optional<ParsedUnit> unit;
    ParseError error;

    explicit operator bool() const { return unit.has_value(); }
};

class StructuralParser {
public:
    virtual ~StructuralParser() = default;

    virtual ParseOutcome parse(const std::string& text) const = 0;

    /** @brief Convenience check used by the acceptance oracle. */
    bool accepts(const std::string& text) const { return parse(text).unit.has_value(); }
};

} // namespace archmend::domain
