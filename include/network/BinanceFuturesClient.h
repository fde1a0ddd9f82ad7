#pragma once

#include <memory>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

#include "network/IHttpClient.h"
#include "network/IMarketDataSource.h"
#include "network/RateLimiter.h"

namespace liqhunter {
namespace network {

// Binance USD-M futures 공개 REST 어댑터
//   /fapi/v1/ticker/price, /fapi/v1/openInterest, /fapi/v1/depth
class BinanceFuturesClient : public IMarketDataSource {
public:
    static constexpr const char* kBaseUrl = "https://fapi.binance.com";

    // One rate_limiter token per HTTP request; 429/418 responses pause it.
    // A null limiter leaves requests unthrottled.
    BinanceFuturesClient(
        std::shared_ptr<IHttpClient> http_client,
        std::shared_ptr<RateLimiter> rate_limiter = nullptr
    );

    PriceSnapshot fetchPrice(const std::string& symbol) override;

    // OI (contracts) x mark_price => USD; long/short split estimated from the
    // top 100 depth levels. Two requests: /openInterest, /depth.
    OpenInterestSnapshot fetchOpenInterest(const std::string& symbol, Price mark_price) override;

    // bids/asks: [["price","qty"], ...]. Sum of price*qty per side.
    static std::pair<double, double> depthNotional(const nlohmann::json& depth);

private:
    nlohmann::json getJson(const std::string& endpoint, const std::map<std::string, std::string>& params);

    std::shared_ptr<IHttpClient> http_client_;
    std::shared_ptr<RateLimiter> rate_limiter_;
};

} // namespace network
} // namespace liqhunter
