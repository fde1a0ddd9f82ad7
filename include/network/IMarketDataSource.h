#pragma once

#include <string>

#include "common/Types.h"

namespace liqhunter {
namespace network {

// Upstream market data. Implementations bound every call by a timeout and
// throw std::runtime_error on failure; they never return a default value.
// Each outbound request takes one token from the shared RateLimiter first.
class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    virtual PriceSnapshot fetchPrice(const std::string& symbol) = 0;

    // total_oi in USD (contracts valued at mark_price). long_oi/short_oi may be
    // 0 when no split is known.
    virtual OpenInterestSnapshot fetchOpenInterest(const std::string& symbol, Price mark_price) = 0;
};

} // namespace network
} // namespace liqhunter
