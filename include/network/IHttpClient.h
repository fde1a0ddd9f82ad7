#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace liqhunter {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isBlocked() const { return status_code == 418; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// 공개 시세 조회만 필요 (인증/주문 없음)
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Throws std::runtime_error on transport failure or timeout.
    virtual HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) = 0;
};

} // namespace network
} // namespace liqhunter
