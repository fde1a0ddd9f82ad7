#include "liquidation/LeverageCalculator.h"
#include "common/Config.h"

#include <cmath>
#include <string>

namespace liqhunter {
namespace liquidation {

Price LeverageCalculator::longLiquidationPrice(Price price, double leverage) {
    return price * (1.0 - 1.0 / leverage);
}

Price LeverageCalculator::shortLiquidationPrice(Price price, double leverage) {
    return price * (1.0 + 1.0 / leverage);
}

Price LeverageCalculator::liquidationPrice(Price price, double leverage, PositionSide side) {
    return side == PositionSide::LONG ? longLiquidationPrice(price, leverage)
                                      : shortLiquidationPrice(price, leverage);
}

void LeverageCalculator::validateTiers(const std::vector<double>& tiers) {
    if (tiers.empty()) {
        throw common::ConfigError("leverage tier table is empty");
    }
    for (double tier : tiers) {
        if (!std::isfinite(tier) || tier <= 1.0) {
            throw common::ConfigError("leverage tier must be > 1, got " + std::to_string(tier));
        }
    }
}

} // namespace liquidation
} // namespace liqhunter
