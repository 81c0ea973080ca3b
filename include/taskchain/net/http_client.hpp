#pragma once
#include <map>
#include <string>

namespace taskchain::net {

using Headers = std::map<std::string, std::string>;

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Blocking GET capability used by Executor::ping.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    // Throws HttpError on transport failure or a non-2xx status.
    virtual HttpResponse get(const std::string& url, const Headers& headers) = 0;
};

struct HttpClientConfig {
    long timeout_seconds = 30;          // 0 = no limit
    bool follow_redirects = true;
    std::string user_agent = "taskchain/1.0";
};

// libcurl easy-interface client.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const HttpClientConfig& cfg = {}) : m_cfg(cfg) {}
    HttpResponse get(const std::string& url, const Headers& headers) override;
private:
    HttpClientConfig m_cfg;
};

} // namespace taskchain::net
