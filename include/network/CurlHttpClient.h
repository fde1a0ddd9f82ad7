#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace liqhunter {
namespace network {

class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient(const std::string& base_url, long timeout_ms);
    ~CurlHttpClient();

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

    // key=value&... with values percent-encoded
    std::string buildQueryString(const std::map<std::string, std::string>& params) const;

private:
    std::string base_url_;
    long timeout_ms_;
    CURL* curl_;
    std::mutex mutex_;

    HttpResponse performRequest(const std::string& url);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace network
} // namespace liqhunter
