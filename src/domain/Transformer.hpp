/**
 * @file Transformer.hpp
 * @brief Interface for the external generative model.
 */

#pragma once
#include <string>
#include <optional>
#include <vector>

namespace archmend::domain {

/**
 * @class Transformer
 * @brief Abstract interface for services that turn a conversation into the next model reply.
 */
class Transformer {
public:
    virtual ~Transformer() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @struct ChatMessage
     * @brief Represents a single message in a chat conversation.
     */
    struct ChatMessage {
        enum class Role { System, User, Assistant };
        Role role;
        std::string content;

        static std::string RoleToString(Role r) {
            switch(r) {
                case Role::System: return "system";
                case Role::User: return "user";
                case Role::Assistant: return "assistant";
            }
            return "user";
        }
    };

    /**
     * @brief Sends the conversation history and returns the raw reply.
     * @param history Ordered conversation, system message first.
     * @return Reply text, or nullopt when the model is unreachable or timed out.
     */
    virtual std::optional<std::string> generate(const std::vector<ChatMessage>& history) = 0;

    /** @brief Name of the model answering requests. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace archmend::domain
