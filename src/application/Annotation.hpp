/**
 * @file Annotation.hpp
 * @brief Helpers that embed arbitrary text in source as block comments.
 */

#pragma once

#include <string>

namespace archmend::application {

/** @brief Rewrites every comment terminator so text can sit inside a block comment. */
inline std::string EscapeCommentTerminators(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '*' && i + 1 < text.size() && text[i + 1] == '/') {
            out += "*\\/";
            ++i;
        } else {
            out += text[i];
        }
    }
    return out;
}

/** @brief Block comment holding a header line and the neutralised body. */
inline std::string BlockAnnotation(const std::string& header, const std::string& body) {
    return "/*\n" + header + "\n\n" + EscapeCommentTerminators(body) + "\n*/\n";
}

} // namespace archmend::application
