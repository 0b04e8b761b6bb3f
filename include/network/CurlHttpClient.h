#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace rankfolio {
namespace network {

// Blocking libcurl client. One easy handle, serialised by a mutex.
class CurlHttpClient : public IHttpClient {
public:
    explicit CurlHttpClient(const std::string& user_agent = "Mozilla/5.0", long timeout_seconds = 30);
    ~CurlHttpClient();

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {},
        const std::map<std::string, std::string>& headers = {}
    ) override;

private:
    std::string user_agent_;
    long timeout_seconds_;
    CURL* curl_;
    std::mutex mutex_;

    HttpResponse performRequest(
        const std::string& url,
        const std::map<std::string, std::string>& headers
    );

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string buildQueryString(const std::map<std::string, std::string>& params);
};

} // namespace network
} // namespace rankfolio
