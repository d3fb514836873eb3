/**
 * @file ContentCache.hpp
 * @brief Content-addressed persistence for file-level verdicts.
 */

#pragma once
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/Verdict.hpp"

namespace archmend::infrastructure {

/**
 * @class ContentCache
 * @brief Stores one FileVerdict per SHA-256 content hash.
 *
 * Entries live in memory and, when a directory is configured, in
 * "<directory>/<hash>.json". Any read or write failure is logged and treated
 * as a miss; the cache never fails the caller.
 */
class ContentCache {
public:
    /**
     * @param directory Cache directory; empty keeps entries in memory only.
     * @param enabled When false every get misses and every put is ignored.
     */
    explicit ContentCache(const std::string& directory, bool enabled = true);

    /** @brief Retrieves the verdict stored for exactly this hash. */
    std::optional<domain::FileVerdict> get(const std::string& contentHash) const;

    /** @brief Stores or replaces the verdict for this hash. */
    void put(const std::string& contentHash, const domain::FileVerdict& verdict);

    bool isEnabled() const { return m_enabled; }

    static nlohmann::json ToJson(const domain::FileVerdict& verdict);
    static domain::FileVerdict FromJson(const nlohmann::json& j);

private:
    std::string entryPath(const std::string& contentHash) const;

    std::string m_directory;
    bool m_enabled;
    mutable std::shared_mutex m_mutex;
    mutable std::map<std::string, domain::FileVerdict> m_entries;
};

} // namespace archmend::infrastructure
