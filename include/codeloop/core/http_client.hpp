/*
 * codeloop - HTTP client
 *
 * Thin libcurl wrapper. Each request uses its own easy handle, so one
 * HttpClient may be shared by threads that do not modify it.
 * curl_global_init() must have been called by the application.
 */
#ifndef codeloop_CORE_HTTP_CLIENT_HPP
#define codeloop_CORE_HTTP_CLIENT_HPP

#include <string>
#include <map>

namespace codeloop {

struct HttpResponse {
    long status_code;       // 0 when the transfer itself failed
    std::string body;
    std::string error;
    std::map<std::string, std::string> headers;

    HttpResponse() : status_code(0) {}
};

class HttpClient {
public:
    HttpClient();

    void set_timeout(long seconds) { timeout_secs_ = seconds; }
    void set_connect_timeout(long seconds) { connect_timeout_secs_ = seconds; }
    void set_user_agent(const std::string& ua) { user_agent_ = ua; }

    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers) const;

    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::map<std::string, std::string>& headers) const;

private:
    long timeout_secs_;
    long connect_timeout_secs_;
    std::string user_agent_;
};

} // namespace codeloop

#endif // codeloop_CORE_HTTP_CLIENT_HPP
