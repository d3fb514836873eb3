/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the run configuration (archmend.json).
 *
 * Keeps JSON parsing of settings in one place instead of scattering it
 * throughout the codebase.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "application/RagEvaluator.hpp"
#include "application/RefactorConfig.hpp"

namespace archmend::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads a configuration file over the built-in defaults and validates it.
     * @param path Path to the JSON file.
     * @param required When false, a missing file yields the defaults.
     * @throws std::invalid_argument on a missing required file, malformed JSON,
     *         a value of the wrong type, or settings rejected by validate().
     */
    static application::RefactorConfig Load(const std::string& path, bool required = false);

    /** @brief Applies the keys present in a parsed document over config. */
    static void Apply(const nlohmann::json& root, application::RefactorConfig& config);

    /**
     * @brief Reads a retrieval evaluation set:
     * {"queries": [{"query": "...", "keywords": ["..."]}], "groups": {"name": ["docId", ...]}}.
     * @throws std::invalid_argument on a missing file, malformed JSON or a value of the wrong type.
     */
    static application::EvaluationSet LoadEvaluationSet(const std::string& path);

    /** @brief Converts a parsed evaluation document. */
    static application::EvaluationSet ParseEvaluationSet(const nlohmann::json& root);
};

} // namespace archmend::infrastructure
