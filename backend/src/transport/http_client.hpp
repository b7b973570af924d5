#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;
using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    long status{0};
    std::string body;
};

// Blocking HTTP client owned by one provider instance.
// get() must be safe to call from several threads at once.
struct IHttpClient {
    virtual ~IHttpClient() = default;

    // Any HTTP status is returned to the caller; only network-level failures
    // (DNS, connect, TLS, timeout) throw std::runtime_error.
    virtual HttpResponse get(const std::string& url, const QueryParams& query,
                             const HttpHeaders& headers) = 0;
};

using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;

std::unique_ptr<IHttpClient> make_curl_http_client(
    std::chrono::milliseconds timeout = std::chrono::seconds(30));
