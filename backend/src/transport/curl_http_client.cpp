#include "http_client.hpp"

#include <curl/curl.h>

#include <array>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace {

// Helper for CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s) {
    size_t new_length = size * nmemb;
    s->append(static_cast<char*>(contents), new_length);
    return new_length;
}

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

struct EasyDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
struct CurlStrDeleter {
    void operator()(char* p) const { curl_free(p); }
};

// One share handle per client (DNS cache, TLS sessions);
// each request runs on its own easy handle so get() can be called concurrently.
class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(std::chrono::milliseconds timeout) : timeout_(timeout) {
        ensure_curl_global_init();
        share_ = curl_share_init();
        if (!share_) throw std::runtime_error("curl_share_init failed");
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlHttpClient::lock_cb);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlHttpClient::unlock_cb);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    }

    ~CurlHttpClient() override {
        if (share_) curl_share_cleanup(share_);
    }

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url, const QueryParams& query,
                     const HttpHeaders& headers) override {
        std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
        if (!curl) throw std::runtime_error("curl_easy_init failed");

        const std::string full_url = url + encode_query(curl.get(), query);

        curl_slist* raw_headers = nullptr;
        raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
        raw_headers = curl_slist_append(raw_headers, "User-Agent: md-ingest/1.0");
        for (const auto& [name, value] : headers) {
            raw_headers = curl_slist_append(raw_headers, (name + ": " + value).c_str());
        }
        std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_headers);

        HttpResponse response;
        curl_easy_setopt(curl.get(), CURLOPT_URL, full_url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_SHARE, share_);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throw std::runtime_error(std::string("curl: ") + curl_easy_strerror(res));
        }
        if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status) != CURLE_OK) {
            throw std::runtime_error("curl: no response code");
        }
        return response;
    }

private:
    static std::string encode_query(CURL* curl, const QueryParams& query) {
        std::string out;
        for (const auto& [key, value] : query) {
            std::unique_ptr<char, CurlStrDeleter> k(
                curl_easy_escape(curl, key.c_str(), static_cast<int>(key.size())));
            std::unique_ptr<char, CurlStrDeleter> v(
                curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size())));
            if (!k || !v) throw std::runtime_error("curl_easy_escape failed");
            out += out.empty() ? '?' : '&';
            out += k.get();
            out += '=';
            out += v.get();
        }
        return out;
    }

    static void lock_cb(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<CurlHttpClient*>(userptr)->locks_[static_cast<std::size_t>(data)].lock();
    }
    static void unlock_cb(CURL*, curl_lock_data data, void* userptr) {
        static_cast<CurlHttpClient*>(userptr)->locks_[static_cast<std::size_t>(data)].unlock();
    }

    std::chrono::milliseconds timeout_;
    CURLSH* share_{nullptr};
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks_;
};

} // namespace

std::unique_ptr<IHttpClient> make_curl_http_client(std::chrono::milliseconds timeout) {
    return std::make_unique<CurlHttpClient>(timeout);
}
