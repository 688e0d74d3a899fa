/*
 * codeloop - AI provider interface
 *
 * Message and completion types shared by every model backend, and the
 * abstract AIProvider the agent nodes talk to. Nodes receive the provider
 * by reference, so tests substitute a scripted fake.
 */
#ifndef codeloop_AI_AI_HPP
#define codeloop_AI_AI_HPP

#include <string>
#include <vector>
#include <stdexcept>

namespace codeloop {

enum class MessageRole {
    SYSTEM,
    USER,
    ASSISTANT
};

std::string role_to_string(MessageRole role);

struct ConversationMessage {
    MessageRole role;
    std::string content;

    ConversationMessage() : role(MessageRole::USER) {}
    ConversationMessage(MessageRole r, const std::string& c) : role(r), content(c) {}

    static ConversationMessage system(const std::string& c) { return ConversationMessage(MessageRole::SYSTEM, c); }
    static ConversationMessage user(const std::string& c) { return ConversationMessage(MessageRole::USER, c); }
    static ConversationMessage assistant(const std::string& c) { return ConversationMessage(MessageRole::ASSISTANT, c); }
};

struct CompletionOptions {
    std::string model;          // empty = provider default
    std::string system_prompt;  // prepended as a system message when set
    double temperature;         // < 0 = provider default
    int max_tokens;             // 0 = no limit sent

    CompletionOptions() : temperature(-1.0), max_tokens(0) {}
};

struct CompletionUsage {
    int input_tokens;
    int output_tokens;
    int total_tokens;

    CompletionUsage() : input_tokens(0), output_tokens(0), total_tokens(0) {}
};

struct CompletionResult {
    bool success;
    std::string content;
    std::string error;
    std::string model;
    std::string stop_reason;
    CompletionUsage usage;

    CompletionResult() : success(false) {}

    static CompletionResult ok(const std::string& content) {
        CompletionResult r;
        r.success = true;
        r.content = content;
        return r;
    }

    static CompletionResult fail(const std::string& err) {
        CompletionResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// Raised by agent nodes when a completion request fails. Not retried.
class ModelError : public std::runtime_error {
public:
    explicit ModelError(const std::string& what) : std::runtime_error(what) {}
};

class AIProvider {
public:
    virtual ~AIProvider() {}

    virtual std::string provider_id() const = 0;
    virtual std::string default_model() const = 0;
    virtual bool is_configured() const = 0;

    // Must be safe to call from several threads at once.
    virtual CompletionResult chat(
        const std::vector<ConversationMessage>& messages,
        const CompletionOptions& opts = CompletionOptions()
    ) = 0;

    // Single user prompt, with opts.system_prompt (if any) in front.
    CompletionResult complete(
        const std::string& prompt,
        const CompletionOptions& opts = CompletionOptions()
    );
};

} // namespace codeloop

#endif // codeloop_AI_AI_HPP
