#include "network/BinanceFuturesClient.h"
#include "liquidation/LevelDistributor.h"
#include "common/Logger.h"

#include <cmath>
#include <stdexcept>

namespace liqhunter {
namespace network {

namespace {
// Binance는 숫자를 문자열로 내려줌
double toDouble(const nlohmann::json& value) {
    if (value.is_string()) {
        return std::stod(value.get<std::string>());
    }
    return value.get<double>();
}
}

BinanceFuturesClient::BinanceFuturesClient(
    std::shared_ptr<IHttpClient> http_client,
    std::shared_ptr<RateLimiter> rate_limiter
)
    : http_client_(std::move(http_client))
    , rate_limiter_(std::move(rate_limiter))
{
    if (!http_client_) {
        throw std::invalid_argument("BinanceFuturesClient requires an HTTP client");
    }
}

nlohmann::json BinanceFuturesClient::getJson(
    const std::string& endpoint,
    const std::map<std::string, std::string>& params
) {
    if (rate_limiter_) {
        rate_limiter_->acquire();
    }
    auto response = http_client_->get(endpoint, params);

    if (response.isRateLimited() || response.isBlocked()) {
        if (rate_limiter_) {
            rate_limiter_->handleRateLimitError(response.status_code);
        }
    }
    if (!response.isSuccess()) {
        throw std::runtime_error(
            "Binance " + endpoint + " failed: HTTP " + std::to_string(response.status_code) + " " + response.body
        );
    }

    try {
        return response.json();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Binance " + endpoint + " returned malformed JSON: " + e.what());
    }
}

PriceSnapshot BinanceFuturesClient::fetchPrice(const std::string& symbol) {
    auto j = getJson("/fapi/v1/ticker/price", {{"symbol", symbol}});

    PriceSnapshot snapshot;
    snapshot.symbol = symbol;
    try {
        snapshot.price = toDouble(j.at("price"));
        snapshot.timestamp_ms = j.contains("time") ? j["time"].get<TimestampMs>() : nowMs();
    } catch (const std::exception& e) {
        throw std::runtime_error("unexpected ticker payload for " + symbol + ": " + e.what());
    }

    if (!std::isfinite(snapshot.price) || snapshot.price <= 0.0) {
        throw std::runtime_error("invalid price for " + symbol);
    }
    return snapshot;
}

std::pair<double, double> BinanceFuturesClient::depthNotional(const nlohmann::json& depth) {
    auto sumSide = [&depth](const char* key) {
        double total = 0.0;
        if (!depth.contains(key)) {
            return total;
        }
        for (const auto& level : depth[key]) {
            if (level.is_array() && level.size() >= 2) {
                total += toDouble(level[0]) * toDouble(level[1]);
            }
        }
        return total;
    };
    return {sumSide("bids"), sumSide("asks")};
}

OpenInterestSnapshot BinanceFuturesClient::fetchOpenInterest(const std::string& symbol, Price mark_price) {
    if (!std::isfinite(mark_price) || mark_price <= 0.0) {
        throw std::runtime_error("invalid mark price for " + symbol + " OI valuation");
    }
    auto oi_json = getJson("/fapi/v1/openInterest", {{"symbol", symbol}});

    double contracts = 0.0;
    TimestampMs oi_time = 0;
    try {
        contracts = toDouble(oi_json.at("openInterest"));
        oi_time = oi_json.contains("time") ? oi_json["time"].get<TimestampMs>() : nowMs();
    } catch (const std::exception& e) {
        throw std::runtime_error("unexpected openInterest payload for " + symbol + ": " + e.what());
    }

    OpenInterestSnapshot snapshot;
    snapshot.symbol = symbol;
    snapshot.total_oi = contracts * mark_price;
    snapshot.timestamp_ms = oi_time;

    // 호가 기반 롱/숏 추정 실패 시 분할 없이 반환 (분배기에서 50/50)
    try {
        auto depth = getJson("/fapi/v1/depth", {{"symbol", symbol}, {"limit", "100"}});
        const auto [bid_notional, ask_notional] = depthNotional(depth);
        const auto split = liquidation::LevelDistributor::splitByOrderBook(
            snapshot.total_oi, bid_notional, ask_notional
        );
        snapshot.long_oi = split.long_oi;
        snapshot.short_oi = split.short_oi;
    } catch (const std::exception& e) {
        LOG_WARN("[{}] depth 조회 실패, OI 분할 없음: {}", symbol, e.what());
    }

    return snapshot;
}

} // namespace network
} // namespace liqhunter
