#include <ctxbroker/session/handshake_validator.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace ctxbroker::session {

namespace {

// cURL write callback
size_t writeCallback(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

class CurlHandle {
public:
    CurlHandle() : curl_(curl_easy_init()) {}
    ~CurlHandle() {
        if (curl_)
            curl_easy_cleanup(curl_);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return curl_; }
    explicit operator bool() const { return curl_ != nullptr; }

private:
    CURL* curl_;
};

class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() {
        if (list_)
            curl_slist_free_all(list_);
    }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const char* header) { list_ = curl_slist_append(list_, header); }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

CurlHandshakeClient::CurlHandshakeClient(CurlHandshakeClientConfig config)
    : config_(std::move(config)) {
    ensureCurlGlobalInit();
}

Result<HttpResponse> CurlHandshakeClient::postJson(const std::string& url,
                                                   const std::string& body,
                                                   std::chrono::milliseconds timeout) {
    CurlHandle curl;
    if (!curl) {
        return Error{ErrorCode::NetworkError, "Failed to initialize cURL"};
    }

    HttpResponse response;
    HeaderList headers;
    headers.append("Content-Type: application/json");
    headers.append("Accept: application/json");

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    // Whole-transfer deadline; curl aborts and closes the connection when it passes
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.userAgent.c_str());

    if (!config_.verifyTls) {
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return Error{ErrorCode::Timeout, std::string("HTTP request timed out: ") +
                                             curl_easy_strerror(res)};
    }
    if (res != CURLE_OK) {
        return Error{ErrorCode::NetworkError,
                     std::string("HTTP request failed: ") + curl_easy_strerror(res)};
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::debug("Handshake endpoint answered HTTP {}", response.status);
    return response;
}

} // namespace ctxbroker::session
