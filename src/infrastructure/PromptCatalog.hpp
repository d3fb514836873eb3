/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the refactoring agent's prompts.
 */

#pragma once

#include <string>
#include "application/ValidationLoop.hpp"

namespace archmend::infrastructure {

class PromptCatalog {
public:
    /** @brief Returns the system prompt for the refactoring agent. */
    static std::string GetSystemPrompt();

    /** @brief Returns the built-in base policy describing violations and the verdict format. */
    static std::string GetBasePolicy();

    /**
     * @brief Full prompt set for the validation loop.
     * @param basePolicyOverride Replaces the built-in policy when not empty.
     */
    static application::LoopPrompts GetLoopPrompts(const std::string& basePolicyOverride = "");
};

} // namespace archmend::infrastructure
