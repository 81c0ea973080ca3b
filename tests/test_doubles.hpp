#pragma once
#include <taskchain/core/errors.hpp>
#include <taskchain/net/http_client.hpp>
#include <taskchain/notify/notifier.hpp>
#include <string>
#include <utility>
#include <vector>

namespace taskchain::testing {

struct RecordingNotifier : notify::Notifier {
    std::vector<std::pair<std::string,std::string>> sent;
    void send(const std::string& title, const std::string& body) override { sent.emplace_back(title, body); }
};

struct FakeHttpClient : net::HttpClient {
    struct Call { std::string url; net::Headers headers; };
    std::vector<Call> calls;
    long status = 200;
    std::string body = "pong";
    net::HttpResponse get(const std::string& url, const net::Headers& headers) override {
        calls.push_back({url, headers});
        if (status/100 != 2) throw HttpError(url, status, {});
        return {status, body};
    }
};

} // namespace taskchain::testing
