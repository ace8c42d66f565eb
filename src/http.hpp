#pragma once
#include <string>
#include <vector>
#include <utility>

namespace kairos {

// Initialize libcurl (call once at startup, before any thread issues requests).
void http_init();

// Cleanup libcurl (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 = transport failure
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;
};

// libcurl, one easy handle per request
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;
};

// HTTP POST with JSON body
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 30);

} // namespace kairos
