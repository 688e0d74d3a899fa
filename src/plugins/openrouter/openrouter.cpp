#include <codeloop/plugins/openrouter/openrouter.hpp>
#include <codeloop/core/logger.hpp>
#include <codeloop/core/utils.hpp>

namespace codeloop {

static int int_field(const Json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return 0;
    return it->get<int>();
}

const char* const OpenRouterAI::DEFAULT_MODEL = "arcee-ai/trinity-large-preview:free";
const char* const OpenRouterAI::DEFAULT_API_URL = "https://openrouter.ai/api/v1";

OpenRouterAI::OpenRouterAI()
    : api_key_()
    , default_model_(DEFAULT_MODEL)
    , api_url_(DEFAULT_API_URL)
    , referer_("http://localhost:8888")
    , app_title_("codeloop")
    , default_temperature_(0.2)
    , initialized_(false)
{}

bool OpenRouterAI::init(const Config& cfg) {
    api_key_ = trim(cfg.get_string("openrouter.api_key", ""));
    
    std::string model = trim(cfg.get_string("openrouter.model", ""));
    if (!model.empty()) {
        default_model_ = model;
    }
    
    std::string url = cfg.get_string("openrouter.api_url", "");
    if (!url.empty()) {
        api_url_ = url;
    }
    while (!api_url_.empty() && api_url_[api_url_.length() - 1] == '/') {
        api_url_ = api_url_.substr(0, api_url_.length() - 1);
    }

    referer_ = cfg.get_string("openrouter.referer", referer_);
    app_title_ = cfg.get_string("openrouter.app_title", app_title_);
    default_temperature_ = cfg.get_double("openrouter.temperature", default_temperature_);
    http_.set_timeout(static_cast<long>(cfg.get_int("openrouter.timeout", 120)));
    
    if (api_key_.empty()) {
        LOG_WARN("OpenRouter AI: No API key configured (set OPENROUTER_API_KEY or openrouter.api_key)");
        initialized_ = false;
        return false;
    }
    
    LOG_INFO("OpenRouter AI initialized with model: %s", default_model_.c_str());
    initialized_ = true;
    return true;
}

bool OpenRouterAI::is_initialized() const { return initialized_; }

std::string OpenRouterAI::provider_id() const { return "openrouter"; }

std::string OpenRouterAI::default_model() const { return default_model_; }

bool OpenRouterAI::is_configured() const { return !api_key_.empty(); }

Json OpenRouterAI::build_request(const std::vector<ConversationMessage>& messages,
                                 const CompletionOptions& opts) const {
    Json request = Json::object();
    request["model"] = opts.model.empty() ? default_model_ : opts.model;

    Json msgs = Json::array();
    if (!opts.system_prompt.empty()) {
        Json sys_msg = Json::object();
        sys_msg["role"] = "system";
        sys_msg["content"] = sanitize_utf8(opts.system_prompt);
        msgs.push_back(sys_msg);
    }
    for (size_t i = 0; i < messages.size(); ++i) {
        const ConversationMessage& msg = messages[i];
        // An explicit system prompt replaces system messages in the list
        if (msg.role == MessageRole::SYSTEM && !opts.system_prompt.empty()) {
            continue;
        }
        Json m = Json::object();
        m["role"] = role_to_string(msg.role);
        m["content"] = sanitize_utf8(msg.content);
        msgs.push_back(m);
    }
    request["messages"] = msgs;

    double temperature = opts.temperature >= 0.0 ? opts.temperature : default_temperature_;
    if (temperature >= 0.0) {
        request["temperature"] = temperature;
    }
    if (opts.max_tokens > 0) {
        request["max_tokens"] = static_cast<int64_t>(opts.max_tokens);
    }
    return request;
}

CompletionResult OpenRouterAI::parse_response(long status_code, const std::string& body) {
    Json resp;
    try {
        resp = Json::parse(sanitize_utf8(body));
    } catch (const std::exception& e) {
        if (status_code != 200) {
            return CompletionResult::fail("API error (HTTP " + std::to_string(status_code) + ")");
        }
        return CompletionResult::fail("Invalid JSON response: " + std::string(e.what()));
    }
    
    if (status_code != 200) {
        std::string error_msg = "API error";
        if (resp.is_object() && resp.contains("error") && resp["error"].is_object()) {
            const Json& err = resp["error"];
            std::string msg = err.contains("message") && err["message"].is_string()
                ? err["message"].get<std::string>() : std::string();
            std::string code_str;
            if (err.contains("code")) {
                const Json& code_field = err["code"];
                if (code_field.is_string()) {
                    code_str = code_field.get<std::string>();
                } else if (code_field.is_number()) {
                    code_str = std::to_string(code_field.get<int64_t>());
                }
            }
            if (!msg.empty()) {
                error_msg = code_str.empty() ? msg : (code_str + ": " + msg);
            }
        }
        return CompletionResult::fail(error_msg + " (HTTP " + std::to_string(status_code) + ")");
    }

    if (!resp.is_object()) {
        return CompletionResult::fail("Invalid JSON response: expected an object");
    }
    // OpenRouter reports some upstream failures inside a 200 body
    if (resp.contains("error") && resp["error"].is_object() && !resp.contains("choices")) {
        const Json& err = resp["error"];
        std::string msg = err.contains("message") && err["message"].is_string()
            ? err["message"].get<std::string>() : std::string("unknown");
        return CompletionResult::fail("API error: " + msg);
    }
    
    CompletionResult result;
    result.success = true;
    if (resp.contains("model") && resp["model"].is_string()) {
        result.model = resp["model"].get<std::string>();
    }
    
    if (resp.contains("choices") && resp["choices"].is_array() && !resp["choices"].empty()) {
        const Json& first_choice = resp["choices"][0];
        if (first_choice.contains("message") && first_choice["message"].is_object()) {
            const Json& message = first_choice["message"];
            if (message.contains("content") && message["content"].is_string()) {
                result.content = message["content"].get<std::string>();
            }
        }
        if (first_choice.contains("finish_reason") && first_choice["finish_reason"].is_string()) {
            result.stop_reason = first_choice["finish_reason"].get<std::string>();
        }
    }
    
    if (resp.contains("usage") && resp["usage"].is_object()) {
        const Json& usage = resp["usage"];
        result.usage.input_tokens = int_field(usage, "prompt_tokens");
        result.usage.output_tokens = int_field(usage, "completion_tokens");
        result.usage.total_tokens = int_field(usage, "total_tokens");
    }
    return result;
}

CompletionResult OpenRouterAI::chat(
    const std::vector<ConversationMessage>& messages,
    const CompletionOptions& opts
) {
    if (!initialized_) {
        return CompletionResult::fail("OpenRouter AI not initialized");
    }
    if (messages.empty()) {
        return CompletionResult::fail("No messages provided");
    }
    
    Json request = build_request(messages, opts);
    std::string endpoint = api_url_ + "/chat/completions";
    std::string request_body = request.dump(-1, ' ', false, Json::error_handler_t::replace);
    LOG_DEBUG("▶ Sending %zu message(s) to %s using %s (%zu bytes)",
              request["messages"].size(), endpoint.c_str(),
              request["model"].get<std::string>().c_str(), request_body.size());
    
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    headers["Authorization"] = "Bearer " + api_key_;
    if (!referer_.empty()) {
        headers["HTTP-Referer"] = referer_;
    }
    if (!app_title_.empty()) {
        headers["X-Title"] = app_title_;
    }
    
    HttpResponse response = http_.post_json(endpoint, request_body, headers);
    if (response.status_code == 0) {
        LOG_ERROR("HTTP request failed: %s", response.error.c_str());
        return CompletionResult::fail("HTTP request failed: " + response.error);
    }
    
    LOG_DEBUG("◀ Received response [HTTP %ld] (%zu bytes)",
              response.status_code, response.body.size());

    CompletionResult result = parse_response(response.status_code, response.body);
    if (!result.success) {
        auto retry = response.headers.find("retry-after");
        if (response.status_code == 429 && retry != response.headers.end()) {
            result.error += " (retry after " + retry->second + "s)";
        }
        LOG_ERROR("%s", result.error.c_str());
        return result;
    }
    
    LOG_DEBUG("◀ Model: %s, Stop reason: %s, Tokens in/out: %d/%d",
              result.model.c_str(), result.stop_reason.c_str(),
              result.usage.input_tokens, result.usage.output_tokens);
    LOG_DEBUG("◀ Content (%zu chars): %s%s",
              result.content.size(), truncate_safe(result.content, 500).c_str(),
              result.content.size() > 500 ? "..." : "");
    return result;
}

} // namespace codeloop
