/**
 * @file ValidationLoop.hpp
 * @brief Bounded generate, validate, correct exchange with the model for one chunk.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Chunk.hpp"
#include "domain/StructuralParser.hpp"
#include "domain/Transformer.hpp"
#include "domain/Verdict.hpp"

namespace archmend::application {

/**
 * @struct LoopPrompts
 * @brief Instructions and corrective feedback sent to the model.
 */
struct LoopPrompts {
    std::string systemPrompt;
    std::string basePolicy;
    std::string unavailableFeedback;
    std::string malformedFeedback;
    std::string unparseableFeedback;  ///< "{error}" is replaced with the parse error.
};

/**
 * @class ValidationLoop
 * @brief State machine Drafting, AwaitingModel, Validating, then Accepted, Correcting or Exhausted.
 *
 * Each run() owns its conversation; runs for different chunks share nothing
 * but the stateless collaborators, so they may execute concurrently.
 */
class ValidationLoop {
public:
    enum class State {
        Drafting,
        AwaitingModel,
        Validating,
        Correcting,
        Accepted,
        Exhausted
    };

    ValidationLoop(std::shared_ptr<domain::Transformer> transformer,
                   std::shared_ptr<const domain::StructuralParser> parser,
                   LoopPrompts prompts);

    /**
     * @brief Drives the loop until a verdict is accepted or attempts run out.
     * @param chunk Chunk under review.
     * @param context Retrieved reference context, possibly empty.
     * @param maxAttempts Upper bound on Transformer calls.
     * @return An accepted verdict, or the deterministic fallback.
     */
    domain::ChunkVerdict run(const domain::Chunk& chunk, const std::string& context, int maxAttempts) const;

    /**
     * @brief Extracts the verdict object from a raw reply.
     * @param raw Model output, possibly wrapped in prose or code fences.
     * @param error Set to a short description when nullopt is returned.
     */
    static std::optional<domain::ModelVerdict> ParseVerdict(const std::string& raw, std::string& error);

    /** @brief Fix text used when the loop is exhausted for this chunk text. */
    static std::string FallbackFix(const std::string& chunkText);

    static const char* const kExhaustedReason;

private:
    std::string buildUserMessage(const domain::Chunk& chunk, const std::string& context) const;

    std::shared_ptr<domain::Transformer> m_transformer;
    std::shared_ptr<const domain::StructuralParser> m_parser;
    LoopPrompts m_prompts;
};

} // namespace archmend::application
