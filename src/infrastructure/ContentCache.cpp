/**
 * @file ContentCache.cpp
 * @brief Implementation of ContentCache.
 */

#include "infrastructure/ContentCache.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace archmend::infrastructure {

namespace {
constexpr int kFormatVersion = 1;
}

ContentCache::ContentCache(const std::string& directory, bool enabled)
    : m_directory(directory), m_enabled(enabled) {}

std::string ContentCache::entryPath(const std::string& contentHash) const {
    return (fs::path(m_directory) / (contentHash + ".json")).string();
}

std::optional<domain::FileVerdict> ContentCache::get(const std::string& contentHash) const {
    if (!m_enabled) return std::nullopt;
    if (!ContentHasher::IsDigest(contentHash)) {
        std::cerr << "[ContentCache] Ignoring malformed key: " << contentHash << std::endl;
        return std::nullopt;
    }

    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(contentHash);
        if (it != m_entries.end()) {
            return it->second;
        }
    }

    if (m_directory.empty()) return std::nullopt;
    fs::path p = entryPath(contentHash);
    std::error_code ec;
    if (!fs::exists(p, ec)) return std::nullopt;

    try {
        std::ifstream f(p);
        if (!f.is_open()) {
            std::cerr << "[ContentCache] Cannot open " << p << std::endl;
            return std::nullopt;
        }
        json j = json::parse(f);
        if (j.value("hash", "") != contentHash) {
            std::cerr << "[ContentCache] Entry " << p << " does not match its key; treating as miss." << std::endl;
            return std::nullopt;
        }
        domain::FileVerdict verdict = FromJson(j);

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_entries[contentHash] = verdict;
        return verdict;
    } catch (const std::exception& e) {
        std::cerr << "[ContentCache] Error reading " << p << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

void ContentCache::put(const std::string& contentHash, const domain::FileVerdict& verdict) {
    if (!m_enabled) return;
    if (!ContentHasher::IsDigest(contentHash)) {
        std::cerr << "[ContentCache] Refusing to store under malformed key: " << contentHash << std::endl;
        return;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_entries[contentHash] = verdict;
    }

    if (m_directory.empty()) return;

    // Entries are stored byte-exact; text that is not valid UTF-8 stays in memory only.
    std::string serialized;
    try {
        json j = ToJson(verdict);
        j["hash"] = contentHash;
        serialized = j.dump(4);
    } catch (const json::exception& e) {
        std::cerr << "[ContentCache] Failed to persist entry " << contentHash << ": " << e.what() << std::endl;
        return;
    }
    if (!PersistenceService::WriteAtomically(entryPath(contentHash), serialized)) {
        std::cerr << "[ContentCache] Failed to persist entry " << contentHash << std::endl;
    }
}

json ContentCache::ToJson(const domain::FileVerdict& verdict) {
    json chunks = json::array();
    for (const auto& chunk : verdict.chunks) {
        chunks.push_back({
            {"index", chunk.chunkIndex},
            {"kind", chunk.isFallback() ? "fallback" : "accepted"},
            {"violation", chunk.violation},
            {"reason", chunk.reason},
            {"fix", chunk.fix},
            {"attempts", chunk.attempts}
        });
    }
    return {
        {"version", kFormatVersion},
        {"unitId", verdict.unitId},
        {"violation", verdict.violation},
        {"reason", verdict.reason},
        {"aggregatedFix", verdict.aggregatedFix},
        {"chunks", chunks}
    };
}

domain::FileVerdict ContentCache::FromJson(const json& j) {
    if (j.value("version", 0) != kFormatVersion) {
        throw std::runtime_error("unsupported cache entry version");
    }

    domain::FileVerdict verdict;
    verdict.unitId = j.at("unitId").get<std::string>();
    verdict.violation = j.at("violation").get<bool>();
    verdict.reason = j.at("reason").get<std::string>();
    verdict.aggregatedFix = j.at("aggregatedFix").get<std::string>();
    for (const auto& item : j.at("chunks")) {
        domain::ChunkVerdict chunk;
        chunk.chunkIndex = item.at("index").get<int>();
        chunk.kind = item.at("kind").get<std::string>() == "fallback"
            ? domain::ChunkVerdictKind::ExhaustedFallback
            : domain::ChunkVerdictKind::Accepted;
        chunk.violation = item.at("violation").get<bool>();
        chunk.reason = item.at("reason").get<std::string>();
        chunk.fix = item.at("fix").get<std::string>();
        chunk.attempts = item.at("attempts").get<int>();
        verdict.chunks.push_back(std::move(chunk));
    }
    return verdict;
}

} // namespace archmend::infrastructure
