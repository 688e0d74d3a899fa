#include <codeloop/ai/ai.hpp>

namespace codeloop {

std::string role_to_string(MessageRole role) {
    switch (role) {
        case MessageRole::SYSTEM: return "system";
        case MessageRole::USER: return "user";
        case MessageRole::ASSISTANT: return "assistant";
        default: return "user";
    }
}

CompletionResult AIProvider::complete(const std::string& prompt, const CompletionOptions& opts) {
    std::vector<ConversationMessage> messages;
    messages.push_back(ConversationMessage::user(prompt));
    return chat(messages, opts);
}

} // namespace codeloop
