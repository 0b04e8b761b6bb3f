#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace rankfolio {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }

    // Throws nlohmann::json::parse_error on a non-JSON body.
    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// Plain GET transport. Implementations keep cookies between calls so a
// landing-page request can set the session for a later API call.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {},
        const std::map<std::string, std::string>& headers = {}
    ) = 0;
};

} // namespace network
} // namespace rankfolio
