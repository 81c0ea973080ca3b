#include <taskchain/net/http_client.hpp>
#include <taskchain/core/errors.hpp>
#include <curl/curl.h>
#include <string>

namespace taskchain::net {

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpResponse CurlHttpClient::get(const std::string& url, const Headers& headers) {
    CURL* curl = curl_easy_init();
    if (!curl) throw HttpError(url, 0, "curl-init-fail");
    HttpResponse response;
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_cfg.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, m_cfg.follow_redirects ? 1L : 0L);
    if (!m_cfg.user_agent.empty()) curl_easy_setopt(curl, CURLOPT_USERAGENT, m_cfg.user_agent.c_str());
    struct curl_slist* header_list = nullptr;
    for (auto &h : headers) {
        std::string line = h.first + ": " + h.second;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    if (header_list) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    auto res = curl_easy_perform(curl);
    long code = 0; curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        throw HttpError(url, 0, errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(res)));
    }
    response.status = code;
    if (code/100 != 2) throw HttpError(url, code, {});
    return response;
}

} // namespace taskchain::net
