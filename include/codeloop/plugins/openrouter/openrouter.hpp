/*
 * codeloop - OpenRouter AI provider
 * 
 * Uses the OpenAI-compatible API (https://openrouter.ai/api/v1/chat/completions).
 * 
 * Config:
 *   openrouter.api_key     - Your OpenRouter API key (OPENROUTER_API_KEY wins)
 *   openrouter.model       - Default model (OPENROUTER_MODEL wins)
 *   openrouter.api_url     - API base URL (optional, defaults to https://openrouter.ai/api/v1)
 *   openrouter.temperature - Sampling temperature (default 0.2)
 *   openrouter.timeout     - HTTP timeout in seconds (default 120)
 *   openrouter.referer     - HTTP-Referer attribution header
 *   openrouter.app_title   - X-Title attribution header
 */
#ifndef codeloop_PLUGINS_OPENROUTER_HPP
#define codeloop_PLUGINS_OPENROUTER_HPP

#include <codeloop/ai/ai.hpp>
#include <codeloop/core/http_client.hpp>
#include <codeloop/core/config.hpp>
#include <codeloop/core/json.hpp>

namespace codeloop {

class OpenRouterAI : public AIProvider {
public:
    static const char* const DEFAULT_MODEL;
    static const char* const DEFAULT_API_URL;

    OpenRouterAI();
    
    // Returns false when no API key is configured.
    bool init(const Config& cfg);
    bool is_initialized() const;
    
    // AIProvider interface
    std::string provider_id() const override;
    std::string default_model() const override;
    bool is_configured() const override;
    
    CompletionResult chat(
        const std::vector<ConversationMessage>& messages,
        const CompletionOptions& opts = CompletionOptions()
    ) override;

    // Request body for /chat/completions
    Json build_request(const std::vector<ConversationMessage>& messages,
                       const CompletionOptions& opts) const;

    // Interpret an HTTP status and body from /chat/completions
    static CompletionResult parse_response(long status_code, const std::string& body);

    const std::string& api_url() const { return api_url_; }
    double default_temperature() const { return default_temperature_; }

private:
    std::string api_key_;
    std::string default_model_;
    std::string api_url_;
    std::string referer_;
    std::string app_title_;
    double default_temperature_;
    bool initialized_;
    HttpClient http_;
};

} // namespace codeloop

#endif // codeloop_PLUGINS_OPENROUTER_HPP
