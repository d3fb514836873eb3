/**
 * @file Utf8.hpp
 * @brief Byte-limited slicing that never splits a UTF-8 sequence.
 */

#pragma once

#include <string>

namespace archmend::application {

inline bool IsUtf8Continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/** @brief At most maxBytes leading bytes, cut back to a code-point boundary. */
inline std::string Utf8Prefix(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    size_t end = maxBytes;
    while (end > 0 && IsUtf8Continuation(text[end])) {
        --end;
    }
    return text.substr(0, end);
}

/** @brief At most maxBytes trailing bytes, starting on a code-point boundary. */
inline std::string Utf8Suffix(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    size_t start = text.size() - maxBytes;
    while (start < text.size() && IsUtf8Continuation(text[start])) {
        ++start;
    }
    return text.substr(start);
}

} // namespace archmend::application
