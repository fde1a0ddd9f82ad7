#pragma once

#include <vector>

#include "common/Types.h"

namespace liqhunter {
namespace liquidation {

// 레버리지 티어별 청산가 계산 (stateless)
//   long:  P * (1 - 1/L)
//   short: P * (1 + 1/L)
class LeverageCalculator {
public:
    static Price longLiquidationPrice(Price price, double leverage);
    static Price shortLiquidationPrice(Price price, double leverage);
    static Price liquidationPrice(Price price, double leverage, PositionSide side);

    // Throws common::ConfigError on an empty table or any tier <= 1.
    static void validateTiers(const std::vector<double>& tiers);
};

} // namespace liquidation
} // namespace liqhunter
