/**
 * @file ValidationLoop.cpp
 * @brief Implementation of the ValidationLoop state machine.
 */

#include "application/ValidationLoop.hpp"
#include "application/Annotation.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace archmend::application {

namespace {

using Role = domain::Transformer::ChatMessage::Role;

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

bool ReadOptionalString(const json& j, const char* key, std::string& out, std::string& error) {
    if (!j.contains(key) || j[key].is_null()) {
        out.clear();
        return true;
    }
    if (!j[key].is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

std::string Describe(domain::AttemptOutcome outcome) {
    switch (outcome) {
        case domain::AttemptOutcome::Accepted: return "accepted";
        case domain::AttemptOutcome::Rejected: return "fix does not parse";
        case domain::AttemptOutcome::Malformed: return "malformed verdict";
        case domain::AttemptOutcome::Unavailable: return "model unavailable";
    }
    return "unknown";
}

} // namespace

const char* const ValidationLoop::kExhaustedReason = "max attempts reached";

ValidationLoop::ValidationLoop(std::shared_ptr<domain::Transformer> transformer,
                               std::shared_ptr<const domain::StructuralParser> parser,
                               LoopPrompts prompts)
    : m_transformer(std::move(transformer)), m_parser(std::move(parser)), m_prompts(std::move(prompts)) {}

std::string ValidationLoop::buildUserMessage(const domain::Chunk& chunk, const std::string& context) const {
    return m_prompts.basePolicy
        + "\n\n//=== Domain Code Snippets ===\n" + context
        + "\n\n//=== Legacy Code Chunk ===\n" + chunk.text;
}

domain::ChunkVerdict ValidationLoop::run(const domain::Chunk& chunk, const std::string& context, int maxAttempts) const {
    std::vector<domain::Transformer::ChatMessage> history = {
        {Role::System, m_prompts.systemPrompt},
        {Role::User, buildUserMessage(chunk, context)}
    };

    State state = State::Drafting;
    int attempt = 0;
    domain::GenerationAttempt current;

    while (true) {
        switch (state) {
        case State::Drafting:
            if (attempt >= maxAttempts) {
                state = State::Exhausted;
                break;
            }
            ++attempt;
            current = domain::GenerationAttempt{};
            current.chunkId = chunk.id();
            current.attemptNumber = attempt;
            state = State::AwaitingModel;
            break;

        case State::AwaitingModel:
            try {
                current.rawOutput = m_transformer->generate(history);
            } catch (const std::exception& e) {
                std::cerr << "[ValidationLoop] Transformer error on " << chunk.id() << ": " << e.what() << std::endl;
                current.rawOutput.reset();
            }
            if (!current.rawOutput) {
                current.outcome = domain::AttemptOutcome::Unavailable;
                current.feedback = m_prompts.unavailableFeedback;
                state = State::Correcting;
            } else {
                state = State::Validating;
            }
            break;

        case State::Validating: {
            std::string error;
            current.verdict = ParseVerdict(*current.rawOutput, error);
            if (!current.verdict) {
                current.outcome = domain::AttemptOutcome::Malformed;
                current.feedback = m_prompts.malformedFeedback;
                state = State::Correcting;
                break;
            }
            if (!current.verdict->violation || IsBlank(current.verdict->fix)) {
                current.outcome = domain::AttemptOutcome::Accepted;
                state = State::Accepted;
                break;
            }
            auto parsed = m_parser->parse(current.verdict->fix);
            if (parsed) {
                current.outcome = domain::AttemptOutcome::Accepted;
                state = State::Accepted;
            } else {
                current.outcome = domain::AttemptOutcome::Rejected;
                current.feedback = m_prompts.unparseableFeedback;
                auto pos = current.feedback.find("{error}");
                if (pos != std::string::npos) {
                    current.feedback.replace(pos, 7, parsed.error.toString());
                }
                state = State::Correcting;
            }
            break;
        }

        case State::Correcting:
            std::cerr << "[ValidationLoop] " << chunk.id() << " attempt " << attempt << "/" << maxAttempts
                      << " rejected: " << Describe(current.outcome) << std::endl;
            if (current.rawOutput) {
                history.push_back({Role::Assistant, *current.rawOutput});
            }
            history.push_back({Role::User, current.feedback});
            state = State::Drafting;
            break;

        case State::Accepted: {
            domain::ChunkVerdict verdict;
            verdict.chunkIndex = chunk.index;
            verdict.kind = domain::ChunkVerdictKind::Accepted;
            verdict.violation = current.verdict->violation;
            verdict.reason = current.verdict->reason;
            verdict.fix = verdict.violation ? current.verdict->fix : "";
            verdict.attempts = attempt;
            return verdict;
        }

        case State::Exhausted: {
            std::cerr << "[ValidationLoop] " << chunk.id() << " exhausted after " << attempt
                      << " attempt(s); emitting fallback." << std::endl;
            domain::ChunkVerdict verdict;
            verdict.chunkIndex = chunk.index;
            verdict.kind = domain::ChunkVerdictKind::ExhaustedFallback;
            verdict.violation = true;
            verdict.reason = kExhaustedReason;
            verdict.fix = FallbackFix(chunk.text);
            verdict.attempts = attempt;
            return verdict;
        }
        }
    }
}

std::optional<domain::ModelVerdict> ValidationLoop::ParseVerdict(const std::string& raw, std::string& error) {
    size_t open = raw.find('{');
    size_t close = raw.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        error = "no JSON object in response";
        return std::nullopt;
    }

    json j;
    try {
        j = json::parse(raw.substr(open, close - open + 1));
    } catch (const json::parse_error& e) {
        error = std::string("invalid JSON: ") + e.what();
        return std::nullopt;
    }

    if (!j.is_object()) {
        error = "verdict is not an object";
        return std::nullopt;
    }
    if (!j.contains("violation") || !j["violation"].is_boolean()) {
        error = "missing boolean 'violation'";
        return std::nullopt;
    }

    domain::ModelVerdict verdict;
    verdict.violation = j["violation"].get<bool>();
    if (!ReadOptionalString(j, "reason", verdict.reason, error)) {
        return std::nullopt;
    }
    const char* fixKey = j.contains("suggestedFix") ? "suggestedFix" : "fix";
    if (!ReadOptionalString(j, fixKey, verdict.fix, error)) {
        return std::nullopt;
    }
    return verdict;
}

std::string ValidationLoop::FallbackFix(const std::string& chunkText) {
    return "// fallback refactor, snippet unparseable, needs manual attention\n/*\n"
        + EscapeCommentTerminators(chunkText) + "\n*/";
}

} // namespace archmend::application
