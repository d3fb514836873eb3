#include "infrastructure/PromptCatalog.hpp"

namespace archmend::infrastructure {

std::string PromptCatalog::GetSystemPrompt() {
    return "You are an advanced DDD refactoring agent. Follow instructions strictly.";
}

std::string PromptCatalog::GetBasePolicy() {
    return
        "You are an expert in Java, Spring Boot, Hexagonal Architecture, and advanced DDD frameworks.\n\n"
        "Your job:\n"
        "1) Read the provided Java CHUNK below.\n"
        "2) Identify any Hex/DDD violations:\n"
        "   - JPA Repositories containing domain logic,\n"
        "   - Domain objects (Aggregates) calling DB or HTTP,\n"
        "   - Saga logic in domain,\n"
        "   - concurrency anti-patterns, etc.\n"
        "3) If you find violations, set \"violation\": true; otherwise false.\n"
        "4) \"reason\": short explanation.\n"
        "5) \"suggestedFix\": the entire corrected Java code if violation=true, else \"\".\n\n"
        "**Output**:\n"
        "Exactly ONE JSON object:\n"
        "{\n"
        "  \"violation\": boolean,\n"
        "  \"reason\": \"...\",\n"
        "  \"suggestedFix\": \"...\"\n"
        "}\n\n"
        "No triple backticks or extraneous text. The \"suggestedFix\" must be a complete, parseable Java compilation unit.";
}

application::LoopPrompts PromptCatalog::GetLoopPrompts(const std::string& basePolicyOverride) {
    application::LoopPrompts prompts;
    prompts.systemPrompt = GetSystemPrompt();
    prompts.basePolicy = basePolicyOverride.empty() ? GetBasePolicy() : basePolicyOverride;
    prompts.unavailableFeedback =
        "The model returned no response. Produce exactly one well-formed verdict object.";
    prompts.malformedFeedback =
        "Your response wasn't a well-formed verdict. Return exactly one JSON object with "
        "violation, reason and suggestedFix.";
    prompts.unparseableFeedback =
        "Your suggestedFix is not valid Java ({error}). Return ASCII-only, comment-free Java that parses directly.";
    return prompts;
}

} // namespace archmend::infrastructure
