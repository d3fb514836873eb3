/**
 * @file ContentHasher.hpp
 * @brief SHA-256 content addressing for source units and cache keys.
 */

#pragma once

#include <string>

namespace archmend::infrastructure {

class ContentHasher {
public:
    /** @brief Lower-case hex SHA-256 of the exact bytes of content. */
    static std::string Sha256Hex(const std::string& content);

    /** @brief True if value looks like a Sha256Hex result. */
    static bool IsDigest(const std::string& value);
};

} // namespace archmend::infrastructure
