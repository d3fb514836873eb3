/**
 * @file ContentHasher.cpp
 * @brief Implementation of ContentHasher on top of OpenSSL EVP.
 */

#include "infrastructure/ContentHasher.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace archmend::infrastructure {

std::string ContentHasher::Sha256Hex(const std::string& content) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(content.data(), content.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

bool ContentHasher::IsDigest(const std::string& value) {
    if (value.size() != 64) return false;
    for (char c : value) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) return false;
    }
    return true;
}

} // namespace archmend::infrastructure
